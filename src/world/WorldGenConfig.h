#pragma once
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Inclusive integer range used for feature counts and sizes
struct IntRange {
  int min;
  int max;
};

struct WorldGenConfig {
  int width = 80;  // 1280 / 16
  int height = 45; // 720 / 16

  // Noise composite
  float broadFrequency = 3.0f;
  int broadOctaves = 4;
  float detailFrequency = 10.0f;
  float elevationFrequency = 1.0f;
  float elevationOffset = 50.0f;
  float broadWeight = 0.85f;
  float detailWeight = 0.15f;
  float elevationWeight = 0.3f;
  float contrast = 1.2f; // Applied before tanh
  float jitter = 0.05f;  // Max per-cell coordinate offset (normalized)

  // Classification thresholds, ascending
  float waterThreshold = -0.4f;
  float fieldThreshold = -0.15f;
  float grasslandThreshold = 0.05f;
  float lightForestThreshold = 0.25f;

  // Features
  bool enableRivers = true;
  IntRange riverCount{1, 3};
  IntRange riverLength{30, 80};
  float riverTurnChance = 0.3f;
  float riverSplash = 0.6f;

  bool enableLakes = true;
  IntRange lakeCount{1, 3};
  IntRange lakeRadius{4, 8};

  bool enableHouses = true;
  IntRange houseClusterCount{3, 7};
  IntRange housesPerCluster{2, 6};
  int houseSpread = 3;

  bool enableClearings = true;
  IntRange clearingCount{5, 10};
  IntRange clearingSize{2, 5};
  float clearingDensity = 0.6f;

  int siteAttempts = 50;

  // Decorative props
  float treeDensity = 0.75f;
};

inline void to_json(json &j, const IntRange &r) { j = json{r.min, r.max}; }

inline void from_json(const json &j, IntRange &r) {
  j.at(0).get_to(r.min);
  j.at(1).get_to(r.max);
}

inline void to_json(json &j, const WorldGenConfig &c) {
  j = json{{"width", c.width},
           {"height", c.height},
           {"broadFrequency", c.broadFrequency},
           {"broadOctaves", c.broadOctaves},
           {"detailFrequency", c.detailFrequency},
           {"elevationFrequency", c.elevationFrequency},
           {"elevationOffset", c.elevationOffset},
           {"broadWeight", c.broadWeight},
           {"detailWeight", c.detailWeight},
           {"elevationWeight", c.elevationWeight},
           {"contrast", c.contrast},
           {"jitter", c.jitter},
           {"waterThreshold", c.waterThreshold},
           {"fieldThreshold", c.fieldThreshold},
           {"grasslandThreshold", c.grasslandThreshold},
           {"lightForestThreshold", c.lightForestThreshold},
           {"enableRivers", c.enableRivers},
           {"riverCount", c.riverCount},
           {"riverLength", c.riverLength},
           {"riverTurnChance", c.riverTurnChance},
           {"riverSplash", c.riverSplash},
           {"enableLakes", c.enableLakes},
           {"lakeCount", c.lakeCount},
           {"lakeRadius", c.lakeRadius},
           {"enableHouses", c.enableHouses},
           {"houseClusterCount", c.houseClusterCount},
           {"housesPerCluster", c.housesPerCluster},
           {"houseSpread", c.houseSpread},
           {"enableClearings", c.enableClearings},
           {"clearingCount", c.clearingCount},
           {"clearingSize", c.clearingSize},
           {"clearingDensity", c.clearingDensity},
           {"siteAttempts", c.siteAttempts},
           {"treeDensity", c.treeDensity}};
}

// Missing keys keep their defaults
inline void from_json(const json &j, WorldGenConfig &c) {
  c.width = j.value("width", c.width);
  c.height = j.value("height", c.height);
  c.broadFrequency = j.value("broadFrequency", c.broadFrequency);
  c.broadOctaves = j.value("broadOctaves", c.broadOctaves);
  c.detailFrequency = j.value("detailFrequency", c.detailFrequency);
  c.elevationFrequency = j.value("elevationFrequency", c.elevationFrequency);
  c.elevationOffset = j.value("elevationOffset", c.elevationOffset);
  c.broadWeight = j.value("broadWeight", c.broadWeight);
  c.detailWeight = j.value("detailWeight", c.detailWeight);
  c.elevationWeight = j.value("elevationWeight", c.elevationWeight);
  c.contrast = j.value("contrast", c.contrast);
  c.jitter = j.value("jitter", c.jitter);
  c.waterThreshold = j.value("waterThreshold", c.waterThreshold);
  c.fieldThreshold = j.value("fieldThreshold", c.fieldThreshold);
  c.grasslandThreshold = j.value("grasslandThreshold", c.grasslandThreshold);
  c.lightForestThreshold =
      j.value("lightForestThreshold", c.lightForestThreshold);
  c.enableRivers = j.value("enableRivers", c.enableRivers);
  c.riverCount = j.value("riverCount", c.riverCount);
  c.riverLength = j.value("riverLength", c.riverLength);
  c.riverTurnChance = j.value("riverTurnChance", c.riverTurnChance);
  c.riverSplash = j.value("riverSplash", c.riverSplash);
  c.enableLakes = j.value("enableLakes", c.enableLakes);
  c.lakeCount = j.value("lakeCount", c.lakeCount);
  c.lakeRadius = j.value("lakeRadius", c.lakeRadius);
  c.enableHouses = j.value("enableHouses", c.enableHouses);
  c.houseClusterCount = j.value("houseClusterCount", c.houseClusterCount);
  c.housesPerCluster = j.value("housesPerCluster", c.housesPerCluster);
  c.houseSpread = j.value("houseSpread", c.houseSpread);
  c.enableClearings = j.value("enableClearings", c.enableClearings);
  c.clearingCount = j.value("clearingCount", c.clearingCount);
  c.clearingSize = j.value("clearingSize", c.clearingSize);
  c.clearingDensity = j.value("clearingDensity", c.clearingDensity);
  c.siteAttempts = j.value("siteAttempts", c.siteAttempts);
  c.treeDensity = j.value("treeDensity", c.treeDensity);
}
