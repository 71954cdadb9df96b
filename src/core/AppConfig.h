#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

struct AppConfig {
  int seed = -1;                  // Negative: random seed per episode
  int episodes = 1;
  float frameDt = 1.0f / 60.0f;   // Seconds per host update
  uint64_t maxFrames = 60 * 60 * 30; // Hard stop, 30 simulated minutes
  std::string scriptPath;         // Operator commands, empty for none
};

inline void to_json(json &j, const AppConfig &c) {
  j = json{{"seed", c.seed},
           {"episodes", c.episodes},
           {"frameDt", c.frameDt},
           {"maxFrames", c.maxFrames},
           {"script", c.scriptPath}};
}

inline void from_json(const json &j, AppConfig &c) {
  c.seed = j.value("seed", c.seed);
  c.episodes = j.value("episodes", c.episodes);
  c.frameDt = j.value("frameDt", c.frameDt);
  c.maxFrames = j.value("maxFrames", c.maxFrames);
  c.scriptPath = j.value("script", c.scriptPath);
}
