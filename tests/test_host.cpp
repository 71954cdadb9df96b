#include <gtest/gtest.h>
#include "core/StateManager.h"
#include "debug/Profiler.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

// Records lifecycle calls into a shared journal
class RecordingState : public State {
public:
  RecordingState(std::string name, std::vector<std::string> &journal)
      : m_Name(std::move(name)), m_Journal(journal) {}

  const char *GetName() const override { return m_Name.c_str(); }
  void Init(Application *) override { m_Journal.push_back("init " + m_Name); }
  void HandleInput(Application *) override {
    m_Journal.push_back("input " + m_Name);
  }
  void Update(Application *, float) override {
    m_Journal.push_back("update " + m_Name);
  }
  void Cleanup() override { m_Journal.push_back("cleanup " + m_Name); }

private:
  std::string m_Name;
  std::vector<std::string> &m_Journal;
};

} // namespace

// ============================================================================
// StateManager Tests
// ============================================================================

TEST(StateManagerTest, ChangesAreDeferred) {
  std::vector<std::string> journal;
  StateManager states(nullptr);

  states.PushState(std::make_unique<RecordingState>("a", journal));
  EXPECT_TRUE(states.Empty());
  EXPECT_EQ(states.PendingCount(), 1u);
  EXPECT_TRUE(journal.empty());

  EXPECT_EQ(states.ProcessStateChange(), 1u);
  EXPECT_EQ(states.Depth(), 1u);
  ASSERT_NE(states.Top(), nullptr);
  EXPECT_STREQ(states.Top()->GetName(), "a");
}

TEST(StateManagerTest, OnlyTopIsUpdated) {
  std::vector<std::string> journal;
  StateManager states(nullptr);
  states.PushState(std::make_unique<RecordingState>("game", journal));
  states.PushState(std::make_unique<RecordingState>("paused", journal));
  states.ProcessStateChange();
  journal.clear();

  states.Update(0.1f);
  EXPECT_EQ(journal, (std::vector<std::string>{"input paused",
                                               "update paused"}));

  states.PopState();
  states.ProcessStateChange();
  EXPECT_STREQ(states.Top()->GetName(), "game");
}

TEST(StateManagerTest, ChangeReplacesTop) {
  std::vector<std::string> journal;
  StateManager states(nullptr);
  states.PushState(std::make_unique<RecordingState>("game", journal));
  states.ProcessStateChange();

  states.ChangeState(std::make_unique<RecordingState>("result", journal));
  states.ProcessStateChange();
  EXPECT_EQ(states.Depth(), 1u);
  EXPECT_EQ(journal, (std::vector<std::string>{"init game", "cleanup game",
                                               "init result"}));
}

TEST(StateManagerTest, PopOnEmptyIsHarmless) {
  StateManager states(nullptr);
  states.PopState();
  EXPECT_EQ(states.ProcessStateChange(), 1u);
  EXPECT_TRUE(states.Empty());
  EXPECT_EQ(states.Top(), nullptr);
}

TEST(StateManagerTest, CleansUpOnDestruction) {
  std::vector<std::string> journal;
  {
    StateManager states(nullptr);
    states.PushState(std::make_unique<RecordingState>("a", journal));
    states.PushState(std::make_unique<RecordingState>("b", journal));
    states.ProcessStateChange();
  }
  ASSERT_GE(journal.size(), 2u);
  EXPECT_EQ(journal[journal.size() - 2], "cleanup b");
  EXPECT_EQ(journal.back(), "cleanup a");
}

// ============================================================================
// Profiler Tests
// ============================================================================

TEST(ProfilerTest, Aggregates) {
  Profiler &profiler = Profiler::Get();
  profiler.ClearResults();

  profiler.WriteProfile({"scope", 0, 2000, 0});
  profiler.WriteProfile({"scope", 0, 4000, 0});
  ProfileStats stats = profiler.GetStats("scope");
  EXPECT_EQ(stats.samples, 2u);
  EXPECT_FLOAT_EQ(stats.average, 3.0f);
  EXPECT_FLOAT_EQ(stats.max, 4.0f);

  EXPECT_EQ(profiler.GetStats("missing").samples, 0u);
  profiler.ClearResults();
}

TEST(ProfilerTest, HistoryIsBounded) {
  Profiler &profiler = Profiler::Get();
  profiler.ClearResults();

  for (size_t i = 0; i < Profiler::MAX_HISTORY + 20; ++i)
    profiler.WriteProfile({"busy", 0, 1000, 0});
  EXPECT_EQ(profiler.GetStats("busy").samples, Profiler::MAX_HISTORY);
  profiler.ClearResults();
}

TEST(ProfilerTest, ScopeTimerRecords) {
  Profiler &profiler = Profiler::Get();
  profiler.ClearResults();
  {
    ProfileTimer timer("timed");
  }
  EXPECT_EQ(profiler.GetStats("timed").samples, 1u);
  profiler.ClearResults();
}
