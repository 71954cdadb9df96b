#ifndef RIVER_FEATURE_H
#define RIVER_FEATURE_H

#include "../TerrainFeature.h"

// Biased random walks from the left or top edge, widened by a stochastic
// splash into the 8-neighborhood.
class RiverFeature : public TerrainFeature {
public:
  const char *GetName() const override { return "river"; }
  int Carve(WorldGrid &grid, const WorldGenConfig &config,
            std::mt19937 &rng) override;

private:
  void CarveRiver(WorldGrid &grid, const WorldGenConfig &config,
                  std::mt19937 &rng);
};

#endif
