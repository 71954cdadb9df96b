#include "LakeFeature.h"
#include "../../debug/Logger.h"
#include "../../utils/MathUtils.h"
#include <cmath>

int LakeFeature::Carve(WorldGrid &grid, const WorldGenConfig &config,
                       std::mt19937 &rng) {
  int requested =
      MathUtils::RandomInt(rng, config.lakeCount.min, config.lakeCount.max);
  int carved = 0;

  for (int i = 0; i < requested; ++i) {
    bool placed = false;
    for (int attempt = 0; attempt < config.siteAttempts; ++attempt) {
      glm::ivec2 center = RandomSite(grid, 5, rng);
      if (grid.Get(center.x, center.y) == WATER)
        continue;

      int radius = MathUtils::RandomInt(rng, config.lakeRadius.min,
                                        config.lakeRadius.max);
      Flood(grid, center, radius, rng);
      placed = true;
      break;
    }

    if (placed)
      ++carved;
    else
      LOG_WORLD_WARN("No dry site for lake {} after {} attempts, skipping",
                     i + 1, config.siteAttempts);
  }
  return carved;
}

void LakeFeature::Flood(WorldGrid &grid, glm::ivec2 center, int radius,
                        std::mt19937 &rng) {
  for (int dy = -radius; dy <= radius; ++dy) {
    for (int dx = -radius; dx <= radius; ++dx) {
      float dist = std::sqrt((float)(dx * dx + dy * dy));
      if (dist > radius + MathUtils::SampleUniform(rng, -1.0f, 1.0f))
        continue;

      int lx = center.x + dx;
      int ly = center.y + dy;
      if (grid.InBounds(lx, ly) && grid.Get(lx, ly) != HOUSE)
        grid.Set(lx, ly, WATER);
    }
  }
}
