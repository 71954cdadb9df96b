#pragma once

#include "../world/WorldGrid.h"
#include "SimConfig.h"
#include <cstdint>
#include <random>
#include <vector>

// Order in which fire cells are visited while collecting ignitions. The
// result does not depend on it; the option exists so that can be checked.
enum class ScanOrder { Forward, Reverse };

// The fire cellular automaton. Stateless apart from its config; the grid and
// RNG are passed in by the owner.
class FireSpread {
public:
  explicit FireSpread(const SimConfig &config);

  // Cell indices that catch fire this tick, evaluated against `grid` as it
  // is. Each (burning cell, neighbor) pair gets one roll derived from
  // `tickSeed`, so the set is the same for any scan order. Sorted, unique.
  std::vector<int> CollectIgnitions(const WorldGrid &grid, uint32_t tickSeed,
                                    ScanOrder order = ScanOrder::Forward) const;

  // Collects then commits. Returns the number of newly burning cells.
  int Spread(WorldGrid &grid, uint32_t tickSeed) const;

  // Adds `frames` to every burning cell; cells reaching the ash timer burn
  // out. Returns the number of cells that turned to ash.
  int AgeFire(WorldGrid &grid, float frames, std::mt19937 &rng) const;

  // Each counter-burn cell burns out with a per-frame-unit chance.
  int BurnOutControlled(WorldGrid &grid, float frames,
                        std::mt19937 &rng) const;

  bool IsDefeat(const WorldGrid &grid, int totalBurnable) const;

  static bool HasFire(const WorldGrid &grid);
  // No burning cell has an ignitable neighbor left
  static bool IsContained(const WorldGrid &grid);

  // Cells breaking the ash-age invariants: a negative age, a non-burning
  // cell with an age, or a burning cell left at or past the ash timer.
  int CountInvariantViolations(const WorldGrid &grid) const;

  // Debug builds only: aborts on a broken grid invariant
  void CheckInvariants(const WorldGrid &grid) const;

private:
  SimConfig config;
};
