#ifndef CLEARING_FEATURE_H
#define CLEARING_FEATURE_H

#include "../TerrainFeature.h"

// Ragged grassland patches punched into dense forest.
class ClearingFeature : public TerrainFeature {
public:
  const char *GetName() const override { return "clearing"; }
  int Carve(WorldGrid &grid, const WorldGenConfig &config,
            std::mt19937 &rng) override;
};

#endif
