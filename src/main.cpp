#include "core/Application.h"
#include "core/ConfigLoader.h"
#include "debug/Logger.h"
#include "debug/Profiler.h"
#include <exception>
#include <string>

// Usage: firebreak [config.json] [script.json]
int main(int argc, char **argv) {
  Logger::Init();

  AppConfig appConfig;
  WorldGenConfig genConfig;
  SimConfig simConfig;

  std::string configPath = argc > 1 ? argv[1] : "config/firebreak.json";
  if (!ConfigLoader::Load(configPath, appConfig, genConfig, simConfig))
    LOG_WARN("Using default configuration");
  if (argc > 2)
    appConfig.scriptPath = argv[2];

  try {
    Application app(appConfig, genConfig, simConfig);
    app.Run();
  } catch (const std::exception &e) {
    LOG_CRITICAL("Fatal: {}", e.what());
    return 1;
  }

  Profiler::Get().LogSummary();
  return 0;
}
