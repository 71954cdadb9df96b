#include "TerrainFeature.h"
#include "../utils/MathUtils.h"

glm::ivec2 TerrainFeature::RandomSite(const WorldGrid &grid, int margin,
                                      std::mt19937 &rng) {
  int mx = std::min(margin, (grid.Width() - 1) / 2);
  int my = std::min(margin, (grid.Height() - 1) / 2);
  int x = MathUtils::RandomInt(rng, mx,
                               std::min(grid.Width() - mx, grid.Width() - 1));
  int y = MathUtils::RandomInt(
      rng, my, std::min(grid.Height() - my, grid.Height() - 1));
  return {x, y};
}
