#pragma once

#include "../sim/SimConfig.h"
#include "../world/WorldGenConfig.h"
#include "AppConfig.h"
#include <nlohmann/json.hpp>
#include <string>

// Reads the "app", "world" and "simulation" sections of a config document.
// Absent sections and keys leave the passed-in values untouched.
class ConfigLoader {
public:
  static bool Load(const std::string &path, AppConfig &app,
                   WorldGenConfig &world, SimConfig &sim);
  static bool Parse(const std::string &text, AppConfig &app,
                    WorldGenConfig &world, SimConfig &sim);

private:
  static bool Apply(const nlohmann::json &root, AppConfig &app,
                    WorldGenConfig &world, SimConfig &sim);
};
