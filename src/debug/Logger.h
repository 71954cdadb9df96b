#pragma once

#include <memory>

// This ignores all warnings raised inside External headers
#pragma warning(push, 0)
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#pragma warning(pop)

class Logger {
public:
  // Safe to call more than once; later calls are ignored.
  static void Init();

  inline static std::shared_ptr<spdlog::logger> &GetMainLogger() {
    return s_MainLogger;
  }
  inline static std::shared_ptr<spdlog::logger> &GetWorldLogger() {
    return s_WorldLogger;
  }
  inline static std::shared_ptr<spdlog::logger> &GetFireLogger() {
    return s_FireLogger;
  }
  inline static std::shared_ptr<spdlog::logger> &GetConfigLogger() {
    return s_ConfigLogger;
  }

private:
  static std::shared_ptr<spdlog::logger> s_MainLogger;
  static std::shared_ptr<spdlog::logger> s_WorldLogger;
  static std::shared_ptr<spdlog::logger> s_FireLogger;
  static std::shared_ptr<spdlog::logger> s_ConfigLogger;
};

// Main Logger Macros
#define LOG_TRACE(...) ::Logger::GetMainLogger()->trace(__VA_ARGS__)
#define LOG_INFO(...) ::Logger::GetMainLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ::Logger::GetMainLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::Logger::GetMainLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::Logger::GetMainLogger()->critical(__VA_ARGS__)

// World Logger Macros
#define LOG_WORLD_TRACE(...) ::Logger::GetWorldLogger()->trace(__VA_ARGS__)
#define LOG_WORLD_INFO(...) ::Logger::GetWorldLogger()->info(__VA_ARGS__)
#define LOG_WORLD_WARN(...) ::Logger::GetWorldLogger()->warn(__VA_ARGS__)
#define LOG_WORLD_ERROR(...) ::Logger::GetWorldLogger()->error(__VA_ARGS__)
#define LOG_WORLD_CRITICAL(...)                                                \
  ::Logger::GetWorldLogger()->critical(__VA_ARGS__)

// Fire Logger Macros
#define LOG_FIRE_TRACE(...) ::Logger::GetFireLogger()->trace(__VA_ARGS__)
#define LOG_FIRE_INFO(...) ::Logger::GetFireLogger()->info(__VA_ARGS__)
#define LOG_FIRE_WARN(...) ::Logger::GetFireLogger()->warn(__VA_ARGS__)
#define LOG_FIRE_ERROR(...) ::Logger::GetFireLogger()->error(__VA_ARGS__)
#define LOG_FIRE_CRITICAL(...) ::Logger::GetFireLogger()->critical(__VA_ARGS__)

// Config Logger Macros
#define LOG_CONFIG_TRACE(...) ::Logger::GetConfigLogger()->trace(__VA_ARGS__)
#define LOG_CONFIG_INFO(...) ::Logger::GetConfigLogger()->info(__VA_ARGS__)
#define LOG_CONFIG_WARN(...) ::Logger::GetConfigLogger()->warn(__VA_ARGS__)
#define LOG_CONFIG_ERROR(...) ::Logger::GetConfigLogger()->error(__VA_ARGS__)
#define LOG_CONFIG_CRITICAL(...)                                               \
  ::Logger::GetConfigLogger()->critical(__VA_ARGS__)
