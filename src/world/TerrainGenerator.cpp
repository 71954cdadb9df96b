#include "TerrainGenerator.h"
#include "../debug/Logger.h"
#include "../debug/Profiler.h"
#include "../utils/MathUtils.h"
#include "features/ClearingFeature.h"
#include "features/HouseFeature.h"
#include "features/LakeFeature.h"
#include "features/RiverFeature.h"

TerrainGenerator::TerrainGenerator(const WorldGenConfig &config)
    : config(config), noise(config) {
  // Water first so houses never land in it, clearings last
  if (config.enableRivers)
    features.push_back(std::make_unique<RiverFeature>());
  if (config.enableLakes)
    features.push_back(std::make_unique<LakeFeature>());
  if (config.enableHouses)
    features.push_back(std::make_unique<HouseFeature>());
  if (config.enableClearings)
    features.push_back(std::make_unique<ClearingFeature>());
}

WorldGrid TerrainGenerator::Generate(int seed) {
  PROFILE_SCOPE("TerrainGenerator::Generate");

  std::mt19937 rng((uint32_t)seed);
  WorldGrid grid(config.width, config.height);

  ClassifyTerrain(grid, seed, rng);

  for (auto &feature : features) {
    int carved = feature->Carve(grid, config, rng);
    LOG_WORLD_TRACE("Carved {} x {}", carved, feature->GetName());
  }

  LOG_WORLD_INFO("Generated {}x{} island (seed {}): {} water, {} houses, {} "
                 "dense forest, {} light forest, {} grassland, {} field",
                 grid.Width(), grid.Height(), seed, grid.Count(WATER),
                 grid.Count(HOUSE), grid.Count(FOREST_DENSE),
                 grid.Count(FOREST_LIGHT), grid.Count(GRASSLAND),
                 grid.Count(FIELD));
  return grid;
}

CellType TerrainGenerator::Classify(float value) const {
  if (value < config.waterThreshold)
    return WATER;
  if (value < config.fieldThreshold)
    return FIELD;
  if (value < config.grasslandThreshold)
    return GRASSLAND;
  if (value < config.lightForestThreshold)
    return FOREST_LIGHT;
  return FOREST_DENSE;
}

void TerrainGenerator::ClassifyTerrain(WorldGrid &grid, int seed,
                                       std::mt19937 &rng) const {
  const int w = grid.Width();
  const int h = grid.Height();

  // Jitter is drawn up front for every cell, before any sampling
  std::vector<glm::vec2> jitter(grid.CellCount());
  for (auto &j : jitter) {
    j.x = MathUtils::SampleUniform(rng, 0.0f, config.jitter);
    j.y = MathUtils::SampleUniform(rng, 0.0f, config.jitter);
  }

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const glm::vec2 &j = jitter[grid.Index(x, y)];
      float nx = (float)x / (float)w + j.x;
      float ny = (float)y / (float)h + j.y;
      grid.Set(x, y, Classify(noise.GetTerrainValue(nx, ny, seed)));
    }
  }
}
