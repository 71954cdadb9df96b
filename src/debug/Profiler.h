#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct ProfileResult {
  std::string Name;
  long long Start; // Microseconds
  long long End;
  uint32_t ThreadID;
};

// Aggregate over a scope's retained samples, in milliseconds
struct ProfileStats {
  float average = 0.0f;
  float max = 0.0f;
  size_t samples = 0;
};

class Profiler {
public:
  static constexpr size_t MAX_HISTORY = 100;

  Profiler(const Profiler &) = delete;
  Profiler(Profiler &&) = delete;

  static Profiler &Get() {
    static Profiler instance;
    return instance;
  }

  void WriteProfile(const ProfileResult &result);

  ProfileStats GetStats(const std::string &name);
  // Logs every scope, slowest average first
  void LogSummary();
  void ClearResults();

private:
  Profiler() = default;
  ~Profiler() = default;

  std::mutex m_Lock;
  std::unordered_map<std::string, std::vector<float>>
      m_Results; // Name -> History (ms), oldest first
};

class ProfileTimer {
public:
  explicit ProfileTimer(const char *name);
  ~ProfileTimer();

  void Stop();

private:
  const char *m_Name;
  std::chrono::time_point<std::chrono::steady_clock> m_StartTimepoint;
  bool m_Stopped;
};

#ifndef FIREBREAK_NO_PROFILING
#define PROFILE_SCOPE(name) ProfileTimer timer##__LINE__(name)
#else
#define PROFILE_SCOPE(name)
#endif
