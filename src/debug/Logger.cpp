#include "Logger.h"
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

std::shared_ptr<spdlog::logger> Logger::s_MainLogger;
std::shared_ptr<spdlog::logger> Logger::s_WorldLogger;
std::shared_ptr<spdlog::logger> Logger::s_FireLogger;
std::shared_ptr<spdlog::logger> Logger::s_ConfigLogger;

static std::shared_ptr<spdlog::logger>
MakeLogger(const std::string &name, const std::vector<spdlog::sink_ptr> &sinks,
           spdlog::level::level_enum flushLevel) {
  auto logger =
      std::make_shared<spdlog::logger>(name, begin(sinks), end(sinks));
  spdlog::register_logger(logger);
  logger->set_level(spdlog::level::info);
  logger->flush_on(flushLevel);
  return logger;
}

void Logger::Init() {
  if (s_MainLogger)
    return;

  if (!std::filesystem::exists("logs")) {
    std::filesystem::create_directory("logs");
  }

  std::vector<spdlog::sink_ptr> logSinks;
  logSinks.emplace_back(
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  logSinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "logs/Firebreak.log", true));

  logSinks[0]->set_pattern("%^[%T] [%n] :%$ %v");
  logSinks[1]->set_pattern("[%T] [%l] [%n] : %v");

  s_MainLogger = MakeLogger("MAIN", logSinks, spdlog::level::trace);
  s_WorldLogger = MakeLogger("WORLD", logSinks, spdlog::level::info);
  s_FireLogger = MakeLogger("FIRE", logSinks, spdlog::level::info);
  s_ConfigLogger = MakeLogger("CONFIG", logSinks, spdlog::level::info);
}
