#ifndef TERRAIN_GENERATOR_H
#define TERRAIN_GENERATOR_H

#include "Cell.h"
#include "TerrainFeature.h"
#include "WorldGenConfig.h"
#include "WorldGrid.h"
#include "gen/NoiseManager.h"
#include <memory>
#include <random>
#include <vector>

// Builds a classified island: noise classification first, then the carving
// passes in order (rivers, lakes, houses, clearings). Output depends only on
// the seed and the config.
class TerrainGenerator {
public:
  explicit TerrainGenerator(const WorldGenConfig &config);

  WorldGrid Generate(int seed);

  // Maps a composite terrain value onto the threshold ladder
  CellType Classify(float value) const;

  const WorldGenConfig &GetConfig() const { return config; }

private:
  void ClassifyTerrain(WorldGrid &grid, int seed, std::mt19937 &rng) const;

  WorldGenConfig config;
  NoiseManager noise;
  std::vector<std::unique_ptr<TerrainFeature>> features;
};

#endif
