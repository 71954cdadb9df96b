#include "Profiler.h"
#include "Logger.h"
#include <algorithm>
#include <numeric>
#include <thread>
#include <utility>

static ProfileStats Summarize(const std::vector<float> &history) {
  ProfileStats stats;
  stats.samples = history.size();
  if (history.empty())
    return stats;
  stats.average = std::accumulate(history.begin(), history.end(), 0.0f) /
                  (float)history.size();
  stats.max = *std::max_element(history.begin(), history.end());
  return stats;
}

void Profiler::WriteProfile(const ProfileResult &result) {
  std::lock_guard<std::mutex> lock(m_Lock);

  float duration =
      (result.End - result.Start) * 0.001f; // Microseconds to Milliseconds

  auto &history = m_Results[result.Name];
  history.push_back(duration);
  if (history.size() > MAX_HISTORY)
    history.erase(history.begin());
}

ProfileStats Profiler::GetStats(const std::string &name) {
  std::lock_guard<std::mutex> lock(m_Lock);
  auto it = m_Results.find(name);
  if (it == m_Results.end())
    return {};
  return Summarize(it->second);
}

void Profiler::LogSummary() {
  std::vector<std::pair<std::string, ProfileStats>> rows;
  {
    std::lock_guard<std::mutex> lock(m_Lock);
    for (const auto &[name, history] : m_Results)
      if (!history.empty())
        rows.emplace_back(name, Summarize(history));
  }

  std::sort(rows.begin(), rows.end(), [](const auto &a, const auto &b) {
    return a.second.average > b.second.average;
  });
  for (const auto &[name, stats] : rows)
    LOG_INFO("Profile '{}': {:.3f} ms avg, {:.3f} ms max over {} samples",
             name, stats.average, stats.max, stats.samples);
}

void Profiler::ClearResults() {
  std::lock_guard<std::mutex> lock(m_Lock);
  m_Results.clear();
}

ProfileTimer::ProfileTimer(const char *name) : m_Name(name), m_Stopped(false) {
  m_StartTimepoint = std::chrono::steady_clock::now();
}

ProfileTimer::~ProfileTimer() {
  if (!m_Stopped)
    Stop();
}

void ProfileTimer::Stop() {
  auto endTimepoint = std::chrono::steady_clock::now();

  long long start =
      std::chrono::time_point_cast<std::chrono::microseconds>(m_StartTimepoint)
          .time_since_epoch()
          .count();
  long long end =
      std::chrono::time_point_cast<std::chrono::microseconds>(endTimepoint)
          .time_since_epoch()
          .count();

  uint32_t threadID =
      (uint32_t)std::hash<std::thread::id>{}(std::this_thread::get_id());
  Profiler::Get().WriteProfile({m_Name, start, end, threadID});

  m_Stopped = true;
}
