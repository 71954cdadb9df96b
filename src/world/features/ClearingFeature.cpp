#include "ClearingFeature.h"
#include "../../utils/MathUtils.h"

int ClearingFeature::Carve(WorldGrid &grid, const WorldGenConfig &config,
                           std::mt19937 &rng) {
  int attempts = MathUtils::RandomInt(rng, config.clearingCount.min,
                                      config.clearingCount.max);
  int carved = 0;

  // One try per attempt; a miss just means fewer clearings
  for (int i = 0; i < attempts; ++i) {
    glm::ivec2 center = RandomSite(grid, 3, rng);
    if (grid.Get(center.x, center.y) != FOREST_DENSE)
      continue;

    int half = MathUtils::RandomInt(rng, config.clearingSize.min,
                                    config.clearingSize.max) /
               2;
    for (int dy = -half; dy <= half; ++dy) {
      for (int dx = -half; dx <= half; ++dx) {
        int x = center.x + dx;
        int y = center.y + dy;
        if (!grid.InBounds(x, y) ||
            !MathUtils::Chance(rng, config.clearingDensity))
          continue;
        // Water and houses were carved earlier and stay put
        CellType existing = grid.Get(x, y);
        if (existing != WATER && existing != HOUSE)
          grid.Set(x, y, GRASSLAND);
      }
    }
    ++carved;
  }
  return carved;
}
