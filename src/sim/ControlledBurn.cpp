#include "ControlledBurn.h"
#include "../utils/MathUtils.h"
#include <queue>

ControlledBurn::ControlledBurn(const SimConfig &config) : config(config) {}

int ControlledBurn::Trigger(WorldGrid &grid, int x, int y,
                            std::mt19937 &rng) const {
  if (!grid.InBounds(x, y) || !IsEligible(grid.Get(x, y)))
    return 0;

  grid.Set(x, y, CONTROLLED_BURN);
  int converted = 1;

  int budget = MathUtils::RandomInt(rng, config.controlledBurnBudgetMin,
                                    config.controlledBurnBudgetMax);
  std::queue<glm::ivec2> frontier;
  frontier.push({x, y});

  while (!frontier.empty() && budget > 0) {
    glm::ivec2 cell = frontier.front();
    frontier.pop();

    for (const auto &offset : NEIGHBOR_OFFSETS) {
      if (budget <= 0)
        break;
      int nx = cell.x + offset[0];
      int ny = cell.y + offset[1];
      if (!grid.InBounds(nx, ny))
        continue;

      CellType type = grid.Get(nx, ny);
      if (!IsEligible(type))
        continue;
      if (!MathUtils::Chance(rng,
                             GetFlammability(type) * config.controlledBurnFactor))
        continue;

      grid.Set(nx, ny, CONTROLLED_BURN);
      frontier.push({nx, ny});
      --budget;
      ++converted;
    }
  }
  return converted;
}
