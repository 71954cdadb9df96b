#pragma once

#include "../world/WorldGrid.h"
#include "SimConfig.h"
#include <random>

// Operator counter-burn: a budgeted breadth-first burn that spreads through
// flammable ground and leaves a randomly shaped firebreak.
class ControlledBurn {
public:
  explicit ControlledBurn(const SimConfig &config);

  // Houses are never sacrificed; everything else that can still burn can be
  // lit or reached.
  static bool IsEligible(CellType type) {
    return IsIgnitable(type) && type != HOUSE;
  }

  // Returns the number of cells converted. 0 means the target was out of
  // the grid or not eligible and nothing changed.
  int Trigger(WorldGrid &grid, int x, int y, std::mt19937 &rng) const;

private:
  SimConfig config;
};
