#include "HouseFeature.h"
#include "../../debug/Logger.h"
#include "../../utils/MathUtils.h"

int HouseFeature::Carve(WorldGrid &grid, const WorldGenConfig &config,
                        std::mt19937 &rng) {
  int requested = MathUtils::RandomInt(rng, config.houseClusterCount.min,
                                       config.houseClusterCount.max);
  int carved = 0;
  int houses = 0;

  for (int i = 0; i < requested; ++i) {
    bool placed = false;
    for (int attempt = 0; attempt < config.siteAttempts; ++attempt) {
      glm::ivec2 center = RandomSite(grid, 5, rng);
      CellType ground = grid.Get(center.x, center.y);
      if (ground != GRASSLAND && ground != FIELD)
        continue;

      houses += BuildCluster(grid, config, center, rng);
      placed = true;
      break;
    }

    if (placed)
      ++carved;
    else
      LOG_WORLD_WARN("No open ground for house cluster {} after {} attempts, "
                     "skipping",
                     i + 1, config.siteAttempts);
  }

  LOG_WORLD_TRACE("Built {} houses in {} clusters", houses, carved);
  return carved;
}

int HouseFeature::BuildCluster(WorldGrid &grid, const WorldGenConfig &config,
                               glm::ivec2 center, std::mt19937 &rng) {
  int built = 0;
  int count = MathUtils::RandomInt(rng, config.housesPerCluster.min,
                                   config.housesPerCluster.max);
  for (int i = 0; i < count; ++i) {
    int hx = center.x +
             MathUtils::RandomInt(rng, -config.houseSpread, config.houseSpread);
    int hy = center.y +
             MathUtils::RandomInt(rng, -config.houseSpread, config.houseSpread);
    if (!grid.InBounds(hx, hy))
      continue;

    CellType existing = grid.Get(hx, hy);
    if (existing == WATER || existing == HOUSE)
      continue;

    grid.Set(hx, hy, HOUSE);
    ++built;
  }
  return built;
}
