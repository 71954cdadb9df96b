#pragma once
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

enum class Difficulty { Easy, Normal, Hard };

// Unknown strings map to the first entry
NLOHMANN_JSON_SERIALIZE_ENUM(Difficulty, {{Difficulty::Normal, "Normal"},
                                          {Difficulty::Easy, "Easy"},
                                          {Difficulty::Hard, "Hard"}})

inline const char *GetDifficultyName(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Easy:
    return "Easy";
  case Difficulty::Hard:
    return "Hard";
  case Difficulty::Normal:
  default:
    return "Normal";
  }
}

// Frame units accumulated between two spread evaluations
inline float GetSpreadDelay(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Easy:
    return 55.0f;
  case Difficulty::Hard:
    return 20.0f;
  case Difficulty::Normal:
  default:
    return 35.0f;
  }
}

// Balance constants. The defaults are tuned; treat changes as re-balancing.
struct SimConfig {
  Difficulty difficulty = Difficulty::Normal;

  float spreadFactor = 0.39f;      // Ignition chance = flammability * this
  float maxAshTimer = 420.0f;      // Frame units a cell burns before ash
  int controlledBurnBudgetMin = 10;
  int controlledBurnBudgetMax = 20;
  float controlledBurnFactor = 0.4f;   // Per-neighbor chance multiplier
  float controlledBurnOutRate = 0.2f;  // Per frame unit
  float defeatFraction = 0.15f;        // Of total-burnable
  int fireSources = 2;
  int fireStartAttempts = 100;
};

inline void to_json(json &j, const SimConfig &c) {
  j = json{{"difficulty", c.difficulty},
           {"spreadFactor", c.spreadFactor},
           {"maxAshTimer", c.maxAshTimer},
           {"controlledBurnBudgetMin", c.controlledBurnBudgetMin},
           {"controlledBurnBudgetMax", c.controlledBurnBudgetMax},
           {"controlledBurnFactor", c.controlledBurnFactor},
           {"controlledBurnOutRate", c.controlledBurnOutRate},
           {"defeatFraction", c.defeatFraction},
           {"fireSources", c.fireSources},
           {"fireStartAttempts", c.fireStartAttempts}};
}

// Missing keys keep their defaults
inline void from_json(const json &j, SimConfig &c) {
  c.difficulty = j.value("difficulty", c.difficulty);
  c.spreadFactor = j.value("spreadFactor", c.spreadFactor);
  c.maxAshTimer = j.value("maxAshTimer", c.maxAshTimer);
  c.controlledBurnBudgetMin =
      j.value("controlledBurnBudgetMin", c.controlledBurnBudgetMin);
  c.controlledBurnBudgetMax =
      j.value("controlledBurnBudgetMax", c.controlledBurnBudgetMax);
  c.controlledBurnFactor =
      j.value("controlledBurnFactor", c.controlledBurnFactor);
  c.controlledBurnOutRate =
      j.value("controlledBurnOutRate", c.controlledBurnOutRate);
  c.defeatFraction = j.value("defeatFraction", c.defeatFraction);
  c.fireSources = j.value("fireSources", c.fireSources);
  c.fireStartAttempts = j.value("fireStartAttempts", c.fireStartAttempts);
}
