#ifndef TERRAIN_FEATURE_H
#define TERRAIN_FEATURE_H

#include "WorldGenConfig.h"
#include "WorldGrid.h"
#include <algorithm>
#include <glm/glm.hpp>
#include <random>

// A carving pass run by TerrainGenerator after noise classification.
class TerrainFeature {
public:
  virtual ~TerrainFeature() {}
  virtual const char *GetName() const = 0;
  // Returns the number of feature instances actually carved
  virtual int Carve(WorldGrid &grid, const WorldGenConfig &config,
                    std::mt19937 &rng) = 0;

protected:
  // Random cell at least `margin` cells from the low edges and at most
  // `margin` from the high ones, shrunk to fit small grids.
  static glm::ivec2 RandomSite(const WorldGrid &grid, int margin,
                               std::mt19937 &rng);
};

#endif
