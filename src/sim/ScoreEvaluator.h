#pragma once

#include "../world/WorldGrid.h"

struct GameStats {
  int housesSaved = 0;
  int housesTotal = 0;
  float forestSaved = 0.0f; // Percent of total-burnable still standing
  int score = 0;
  int fireCells = 0;
  int controlledBurnsUsed = 0;
};

class ScoreEvaluator {
public:
  static GameStats Evaluate(const WorldGrid &grid, int totalBurnable,
                            int housesTotal, int controlledBurnsUsed);
};
