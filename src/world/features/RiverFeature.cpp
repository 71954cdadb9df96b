#include "RiverFeature.h"
#include "../../utils/MathUtils.h"
#include <cstdlib>

int RiverFeature::Carve(WorldGrid &grid, const WorldGenConfig &config,
                        std::mt19937 &rng) {
  int count =
      MathUtils::RandomInt(rng, config.riverCount.min, config.riverCount.max);
  for (int i = 0; i < count; ++i)
    CarveRiver(grid, config, rng);
  return count;
}

void RiverFeature::CarveRiver(WorldGrid &grid, const WorldGenConfig &config,
                              std::mt19937 &rng) {
  const int w = grid.Width();
  const int h = grid.Height();

  // Horizontal rivers enter from the left edge, vertical ones from the top
  bool horizontal = MathUtils::RandomInt(rng, 0, 1) == 1;
  glm::ivec2 pos;
  if (horizontal)
    pos = {0, MathUtils::RandomInt(rng, h / 4, 3 * h / 4)};
  else
    pos = {MathUtils::RandomInt(rng, w / 4, 3 * w / 4), 0};

  int drift = 1;
  int length =
      MathUtils::RandomInt(rng, config.riverLength.min, config.riverLength.max);

  for (int step = 0; step < length; ++step) {
    grid.Set(pos.x, pos.y, WATER);

    // Splash: closer neighbors are more likely to flood
    for (const auto &offset : NEIGHBOR_OFFSETS) {
      float prob = config.riverSplash /
                   (std::abs(offset[0]) + std::abs(offset[1]) + 0.5f);
      if (MathUtils::Chance(rng, prob)) {
        int nx = pos.x + offset[0];
        int ny = pos.y + offset[1];
        if (grid.InBounds(nx, ny))
          grid.Set(nx, ny, WATER);
      }
    }

    if (MathUtils::Chance(rng, config.riverTurnChance))
      drift = MathUtils::RandomInt(rng, -1, 1);

    if (horizontal) {
      pos.x += 1;
      pos.y += drift;
    } else {
      pos.y += 1;
      pos.x += drift;
    }
    pos = glm::clamp(pos, glm::ivec2(0), glm::ivec2(w - 1, h - 1));
  }
}
