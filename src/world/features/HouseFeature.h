#ifndef HOUSE_FEATURE_H
#define HOUSE_FEATURE_H

#include "../TerrainFeature.h"

// Small villages anchored on open ground (grassland or field).
class HouseFeature : public TerrainFeature {
public:
  const char *GetName() const override { return "house cluster"; }
  int Carve(WorldGrid &grid, const WorldGenConfig &config,
            std::mt19937 &rng) override;

private:
  int BuildCluster(WorldGrid &grid, const WorldGenConfig &config,
                   glm::ivec2 center, std::mt19937 &rng);
};

#endif
