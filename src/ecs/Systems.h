#ifndef SYSTEMS_H
#define SYSTEMS_H

#include "../world/WorldGrid.h"
#include <entt/entt.hpp>
#include <random>

// Frame indices for tree sprites
constexpr int TREE_FRAME_BURNING_FIRST = 1;
constexpr int TREE_FRAME_BURNING_LAST = 3;
constexpr int TREE_FRAME_BURNT = 4;
constexpr float TREE_FRAME_DURATION = 20.0f; // Frame units

class PropPlacementSystem {
public:
  // Clears the registry and spawns props for the current classification
  static void Place(entt::registry &registry, const WorldGrid &grid,
                    float treeDensity, std::mt19937 &rng);
};

class PropAnimationSystem {
public:
  // Syncs prop visuals with the cell beneath; `frames` drives animation
  static void Update(entt::registry &registry, const WorldGrid &grid,
                     float frames);
};

#endif
