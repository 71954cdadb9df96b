#include "ScoreEvaluator.h"

GameStats ScoreEvaluator::Evaluate(const WorldGrid &grid, int totalBurnable,
                                   int housesTotal, int controlledBurnsUsed) {
  GameStats stats;
  stats.housesTotal = housesTotal;
  stats.controlledBurnsUsed = controlledBurnsUsed;

  int standing = 0;
  grid.ForEachCell([&](int, int, CellType type) {
    if (type == HOUSE)
      ++stats.housesSaved;
    else if (type == FIRE)
      ++stats.fireCells;
    if (IsIgnitable(type))
      ++standing;
  });

  if (totalBurnable > 0)
    stats.forestSaved = (float)standing / (float)totalBurnable * 100.0f;

  stats.score = (int)(stats.housesSaved * 100 + stats.forestSaved * 10);
  return stats;
}
