#include <gtest/gtest.h>
#include "core/ConfigLoader.h"
#include "input/OperatorScript.h"
#include <string>

// ============================================================================
// ConfigLoader Tests
// ============================================================================

TEST(ConfigLoaderTest, PartialSectionsKeepDefaults) {
  AppConfig app;
  WorldGenConfig world;
  SimConfig sim;

  const char *text = R"({
    "app": { "seed": 42, "episodes": 3 },
    "world": { "width": 20, "riverCount": [2, 2] },
    "simulation": { "difficulty": "Hard", "fireSources": 1 }
  })";
  ASSERT_TRUE(ConfigLoader::Parse(text, app, world, sim));

  EXPECT_EQ(app.seed, 42);
  EXPECT_EQ(app.episodes, 3);
  EXPECT_TRUE(app.scriptPath.empty());

  EXPECT_EQ(world.width, 20);
  EXPECT_EQ(world.height, 45);
  EXPECT_EQ(world.riverCount.min, 2);
  EXPECT_EQ(world.riverCount.max, 2);
  EXPECT_FLOAT_EQ(world.waterThreshold, -0.4f);

  EXPECT_EQ(sim.difficulty, Difficulty::Hard);
  EXPECT_EQ(sim.fireSources, 1);
  EXPECT_FLOAT_EQ(sim.spreadFactor, 0.39f);
  EXPECT_FLOAT_EQ(sim.maxAshTimer, 420.0f);
}

TEST(ConfigLoaderTest, CommentsAllowed) {
  AppConfig app;
  WorldGenConfig world;
  SimConfig sim;
  EXPECT_TRUE(ConfigLoader::Parse(R"({
    // Quick games
    "simulation": { "difficulty": "Easy" }
  })",
                                  app, world, sim));
  EXPECT_EQ(sim.difficulty, Difficulty::Easy);
}

TEST(ConfigLoaderTest, UnknownDifficultyFallsBackToNormal) {
  for (const char *name : {"normal", "Insane", ""}) {
    AppConfig app;
    WorldGenConfig world;
    SimConfig sim;
    sim.difficulty = Difficulty::Hard;

    nlohmann::json root = {{"simulation", {{"difficulty", name}}}};
    ASSERT_TRUE(ConfigLoader::Parse(root.dump(), app, world, sim)) << name;
    EXPECT_EQ(sim.difficulty, Difficulty::Normal) << name;
    EXPECT_FLOAT_EQ(GetSpreadDelay(sim.difficulty), 35.0f) << name;
  }
}

TEST(ConfigLoaderTest, RejectsNonPositiveFrameStep) {
  for (const char *step : {"0", "-0.5"}) {
    AppConfig app;
    WorldGenConfig world;
    SimConfig sim;
    std::string text = std::string(R"({ "app": { "frameDt": )") + step +
                       R"(, "seed": 9 } })";
    EXPECT_FALSE(ConfigLoader::Parse(text, app, world, sim)) << step;
    EXPECT_FLOAT_EQ(app.frameDt, 1.0f / 60.0f);
    EXPECT_EQ(app.seed, -1);
  }
}

TEST(ConfigLoaderTest, BadValueLeavesConfigUntouched) {
  AppConfig app;
  WorldGenConfig world;
  SimConfig sim;
  world.width = 33;

  EXPECT_FALSE(ConfigLoader::Parse(
      R"({ "world": { "height": 10, "width": "wide" } })", app, world, sim));
  EXPECT_EQ(world.width, 33);
  EXPECT_EQ(world.height, 45);

  EXPECT_FALSE(ConfigLoader::Parse(R"({ "world": { "riverCount": [1] } })",
                                   app, world, sim));
  EXPECT_EQ(world.riverCount.max, 3);
}

TEST(ConfigLoaderTest, RejectsEmptyWorld) {
  AppConfig app;
  WorldGenConfig world;
  SimConfig sim;
  EXPECT_FALSE(
      ConfigLoader::Parse(R"({ "world": { "width": 0 } })", app, world, sim));
  EXPECT_EQ(world.width, 80);
}

TEST(ConfigLoaderTest, RejectsMalformedDocuments) {
  AppConfig app;
  WorldGenConfig world;
  SimConfig sim;
  EXPECT_FALSE(ConfigLoader::Parse("{ not json", app, world, sim));
  EXPECT_FALSE(ConfigLoader::Parse("[1, 2, 3]", app, world, sim));
}

TEST(ConfigLoaderTest, MissingFile) {
  AppConfig app;
  WorldGenConfig world;
  SimConfig sim;
  EXPECT_FALSE(
      ConfigLoader::Load("does/not/exist.json", app, world, sim));
}

TEST(ConfigLoaderTest, ShippedConfigMatchesDefaults) {
  AppConfig app;
  WorldGenConfig world;
  SimConfig sim;
  ASSERT_TRUE(ConfigLoader::Load("config/firebreak.json", app, world, sim));

  nlohmann::json loaded = world;
  nlohmann::json defaults = WorldGenConfig();
  EXPECT_EQ(loaded, defaults);

  nlohmann::json loadedSim = sim;
  nlohmann::json defaultSim = SimConfig();
  EXPECT_EQ(loadedSim.dump(), defaultSim.dump());
}

// ============================================================================
// OperatorScript Tests
// ============================================================================

TEST(OperatorScriptTest, ParseAndPoll) {
  OperatorScript script;
  ASSERT_TRUE(script.Parse(R"([
    { "frame": 30, "action": "burn", "x": 4, "y": 7 },
    { "frame": 10, "action": "pause" },
    { "frame": 30, "action": "burn", "x": 5, "y": 7 },
    { "episode": 1, "frame": 30, "action": "restart" }
  ])"));
  EXPECT_EQ(script.Size(), 4u);

  auto due = script.Poll(0, 30);
  ASSERT_EQ(due.size(), 2u);
  EXPECT_EQ(due[0].action, CommandAction::Burn);
  EXPECT_EQ(due[0].x, 4);
  EXPECT_EQ(due[1].x, 5);
  EXPECT_EQ(due[1].y, 7);

  EXPECT_EQ(script.Poll(0, 10).size(), 1u);
  EXPECT_TRUE(script.Poll(0, 11).empty());

  auto later = script.Poll(1, 30);
  ASSERT_EQ(later.size(), 1u);
  EXPECT_EQ(later[0].action, CommandAction::Restart);
}

TEST(OperatorScriptTest, SkipsBadCommands) {
  OperatorScript script;
  ASSERT_TRUE(script.Parse(R"({ "commands": [
    { "frame": 1, "action": "teleport" },
    { "action": "burn", "x": 1, "y": 1 },
    { "frame": "soon", "action": "pause" },
    { "frame": 2, "action": "resume" }
  ] })"));
  EXPECT_EQ(script.Size(), 1u);
  EXPECT_EQ(script.Poll(0, 2).size(), 1u);
}

TEST(OperatorScriptTest, RejectsNonList) {
  OperatorScript script;
  EXPECT_FALSE(script.Parse(R"({ "frame": 1 })"));
  EXPECT_FALSE(script.Parse("not json"));
  EXPECT_TRUE(script.Empty());
}

TEST(OperatorScriptTest, ShippedScriptLoads) {
  OperatorScript script;
  ASSERT_TRUE(script.Load("config/operator_script.json"));
  EXPECT_FALSE(script.Empty());
}
