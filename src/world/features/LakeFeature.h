#ifndef LAKE_FEATURE_H
#define LAKE_FEATURE_H

#include "../TerrainFeature.h"

// Roughly circular lakes with a jittered shoreline. Houses are never flooded.
class LakeFeature : public TerrainFeature {
public:
  const char *GetName() const override { return "lake"; }
  int Carve(WorldGrid &grid, const WorldGenConfig &config,
            std::mt19937 &rng) override;

private:
  void Flood(WorldGrid &grid, glm::ivec2 center, int radius,
             std::mt19937 &rng);
};

#endif
