#include "FireSpread.h"
#include "../debug/Logger.h"
#include "../utils/MathUtils.h"
#include <algorithm>
#include <cassert>

FireSpread::FireSpread(const SimConfig &config) : config(config) {}

std::vector<int> FireSpread::CollectIgnitions(const WorldGrid &grid,
                                              uint32_t tickSeed,
                                              ScanOrder order) const {
  std::vector<int> pending;
  const int count = grid.CellCount();

  auto visit = [&](int source) {
    glm::ivec2 pos = grid.Coord(source);
    if (grid.Get(pos.x, pos.y) != FIRE)
      return;

    grid.ForEachNeighbor(pos.x, pos.y, [&](int nx, int ny, CellType type) {
      if (!IsIgnitable(type))
        return;
      int target = grid.Index(nx, ny);
      float roll = MathUtils::HashUnit(tickSeed, (uint32_t)source,
                                       (uint32_t)target);
      if (roll < GetFlammability(type) * config.spreadFactor)
        pending.push_back(target);
    });
  };

  if (order == ScanOrder::Forward) {
    for (int i = 0; i < count; ++i)
      visit(i);
  } else {
    for (int i = count - 1; i >= 0; --i)
      visit(i);
  }

  std::sort(pending.begin(), pending.end());
  pending.erase(std::unique(pending.begin(), pending.end()), pending.end());
  return pending;
}

int FireSpread::Spread(WorldGrid &grid, uint32_t tickSeed) const {
  std::vector<int> pending = CollectIgnitions(grid, tickSeed);
  for (int index : pending) {
    glm::ivec2 pos = grid.Coord(index);
    grid.Ignite(pos.x, pos.y);
  }
  if (!pending.empty())
    LOG_FIRE_TRACE("{} cells caught fire", pending.size());
  return (int)pending.size();
}

int FireSpread::AgeFire(WorldGrid &grid, float frames,
                        std::mt19937 &rng) const {
  int burntOut = 0;
  for (int y = 0; y < grid.Height(); ++y) {
    for (int x = 0; x < grid.Width(); ++x) {
      if (grid.Get(x, y) != FIRE)
        continue;
      grid.AgeFire(x, y, frames);
      if (grid.GetAshAge(x, y) >= config.maxAshTimer) {
        grid.BurnOut(x, y, (uint8_t)MathUtils::RandomInt(rng, 50, 70));
        ++burntOut;
      }
    }
  }
  return burntOut;
}

int FireSpread::BurnOutControlled(WorldGrid &grid, float frames,
                                  std::mt19937 &rng) const {
  float chance = config.controlledBurnOutRate * frames;
  int burntOut = 0;
  for (int y = 0; y < grid.Height(); ++y) {
    for (int x = 0; x < grid.Width(); ++x) {
      if (grid.Get(x, y) == CONTROLLED_BURN && MathUtils::Chance(rng, chance)) {
        grid.BurnOut(x, y, (uint8_t)MathUtils::RandomInt(rng, 50, 70));
        ++burntOut;
      }
    }
  }
  return burntOut;
}

bool FireSpread::IsDefeat(const WorldGrid &grid, int totalBurnable) const {
  return grid.CountIgnitable() < totalBurnable * config.defeatFraction;
}

bool FireSpread::HasFire(const WorldGrid &grid) {
  const auto &cells = grid.GetCells();
  return std::find(cells.begin(), cells.end(), FIRE) != cells.end();
}

bool FireSpread::IsContained(const WorldGrid &grid) {
  for (int y = 0; y < grid.Height(); ++y) {
    for (int x = 0; x < grid.Width(); ++x) {
      if (grid.Get(x, y) != FIRE)
        continue;
      bool canSpread = false;
      grid.ForEachNeighbor(x, y, [&](int, int, CellType type) {
        if (IsIgnitable(type) && GetFlammability(type) > 0.0f)
          canSpread = true;
      });
      if (canSpread)
        return false;
    }
  }
  return true;
}

int FireSpread::CountInvariantViolations(const WorldGrid &grid) const {
  int violations = 0;
  grid.ForEachCell([&](int x, int y, CellType type) {
    float age = grid.GetAshAge(x, y);
    bool broken = age < 0.0f || (type != FIRE && age != 0.0f) ||
                  (type == FIRE && age >= config.maxAshTimer);
    if (broken) {
      LOG_FIRE_ERROR("Cell ({}, {}) is {} with ash age {}", x, y,
                     GetCellName(type), age);
      ++violations;
    }
  });
  return violations;
}

void FireSpread::CheckInvariants(const WorldGrid &grid) const {
#ifdef FIREBREAK_DEBUG
  int violations = CountInvariantViolations(grid);
  assert(violations == 0 && "ash age invariant broken");
  (void)violations;
#else
  (void)grid;
#endif
}
