#include "ConfigLoader.h"
#include "../debug/Logger.h"
#include <fstream>

bool ConfigLoader::Load(const std::string &path, AppConfig &app,
                        WorldGenConfig &world, SimConfig &sim) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_CONFIG_ERROR("Failed to open config: {}", path);
    return false;
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(file, nullptr, true, true);
  } catch (const nlohmann::json::exception &e) {
    LOG_CONFIG_ERROR("JSON Parse Error in {}: {}", path, e.what());
    return false;
  }

  if (!Apply(root, app, world, sim))
    return false;
  LOG_CONFIG_INFO("Loaded config from {}", path);
  return true;
}

bool ConfigLoader::Parse(const std::string &text, AppConfig &app,
                         WorldGenConfig &world, SimConfig &sim) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text, nullptr, true, true);
  } catch (const nlohmann::json::exception &e) {
    LOG_CONFIG_ERROR("JSON Parse Error: {}", e.what());
    return false;
  }
  return Apply(root, app, world, sim);
}

bool ConfigLoader::Apply(const nlohmann::json &root, AppConfig &app,
                         WorldGenConfig &world, SimConfig &sim) {
  if (!root.is_object()) {
    LOG_CONFIG_ERROR("Config root must be an object");
    return false;
  }

  // Parse into copies so a bad value leaves the caller's config intact
  AppConfig appOut = app;
  WorldGenConfig worldOut = world;
  SimConfig simOut = sim;
  try {
    if (root.contains("app"))
      root.at("app").get_to(appOut);
    if (root.contains("world"))
      root.at("world").get_to(worldOut);
    if (root.contains("simulation"))
      root.at("simulation").get_to(simOut);
  } catch (const nlohmann::json::exception &e) {
    LOG_CONFIG_ERROR("Invalid config value: {}", e.what());
    return false;
  }

  if (worldOut.width <= 0 || worldOut.height <= 0) {
    LOG_CONFIG_ERROR("World size must be positive, got {}x{}", worldOut.width,
                     worldOut.height);
    return false;
  }

  if (appOut.frameDt <= 0.0f) {
    LOG_CONFIG_ERROR("Frame step must be positive, got {}", appOut.frameDt);
    return false;
  }

  app = appOut;
  world = worldOut;
  sim = simOut;
  return true;
}
