#include <gtest/gtest.h>
#include "world/Cell.h"
#include "world/TerrainGenerator.h"
#include "world/WorldGrid.h"
#include "world/features/ClearingFeature.h"
#include "world/features/HouseFeature.h"
#include "world/features/LakeFeature.h"
#include "world/features/RiverFeature.h"
#include <stdexcept>

// ============================================================================
// Cell Tests
// ============================================================================

TEST(CellTest, Flammability) {
  EXPECT_FLOAT_EQ(GetFlammability(FOREST_DENSE), 0.8f);
  EXPECT_FLOAT_EQ(GetFlammability(FOREST_LIGHT), 0.6f);
  EXPECT_FLOAT_EQ(GetFlammability(GRASSLAND), 0.4f);
  EXPECT_FLOAT_EQ(GetFlammability(FIELD), 0.3f);
  EXPECT_FLOAT_EQ(GetFlammability(HOUSE), 0.9f);
  EXPECT_FLOAT_EQ(GetFlammability(WATER), 0.0f);
  EXPECT_FLOAT_EQ(GetFlammability(BURNT), 0.0f);
  EXPECT_FLOAT_EQ(GetFlammability(FIRE), 1.0f);
  EXPECT_FLOAT_EQ(GetFlammability(CONTROLLED_BURN), 1.0f);
}

TEST(CellTest, Ignitable) {
  EXPECT_TRUE(IsIgnitable(FOREST_DENSE));
  EXPECT_TRUE(IsIgnitable(FIELD));
  EXPECT_TRUE(IsIgnitable(HOUSE));
  EXPECT_FALSE(IsIgnitable(WATER));
  EXPECT_FALSE(IsIgnitable(BURNT));
  EXPECT_FALSE(IsIgnitable(FIRE));
  EXPECT_FALSE(IsIgnitable(CONTROLLED_BURN));
}

// ============================================================================
// WorldGrid Tests
// ============================================================================

TEST(WorldGridTest, RejectsEmptyDimensions) {
  EXPECT_THROW(WorldGrid(0, 10), std::invalid_argument);
  EXPECT_THROW(WorldGrid(10, -1), std::invalid_argument);
}

TEST(WorldGridTest, Bounds) {
  WorldGrid grid(8, 4);
  EXPECT_EQ(grid.CellCount(), 32);
  EXPECT_TRUE(grid.InBounds(0, 0));
  EXPECT_TRUE(grid.InBounds(7, 3));
  EXPECT_FALSE(grid.InBounds(8, 0));
  EXPECT_FALSE(grid.InBounds(0, 4));
  EXPECT_FALSE(grid.InBounds(-1, 2));

  glm::ivec2 pos = grid.Coord(grid.Index(5, 2));
  EXPECT_EQ(pos.x, 5);
  EXPECT_EQ(pos.y, 2);
}

TEST(WorldGridTest, FireLifecycle) {
  WorldGrid grid(4, 4, FIELD);
  grid.Ignite(1, 1);
  EXPECT_EQ(grid.Get(1, 1), FIRE);
  EXPECT_FLOAT_EQ(grid.GetAshAge(1, 1), 0.0f);

  grid.AgeFire(1, 1, 12.5f);
  EXPECT_FLOAT_EQ(grid.GetAshAge(1, 1), 12.5f);

  // Re-writing a burning cell keeps its age
  grid.Set(1, 1, FIRE);
  EXPECT_FLOAT_EQ(grid.GetAshAge(1, 1), 12.5f);

  grid.BurnOut(1, 1, 60);
  EXPECT_EQ(grid.Get(1, 1), BURNT);
  EXPECT_FLOAT_EQ(grid.GetAshAge(1, 1), 0.0f);
  EXPECT_EQ(grid.GetAshShade(1, 1), 60);
}

TEST(WorldGridTest, NeighborsStayInGrid) {
  WorldGrid grid(3, 3);
  int corner = 0;
  grid.ForEachNeighbor(0, 0, [&](int, int, CellType) { ++corner; });
  EXPECT_EQ(corner, 3);

  int center = 0;
  grid.ForEachNeighbor(1, 1, [&](int, int, CellType) { ++center; });
  EXPECT_EQ(center, 8);
}

TEST(WorldGridTest, Counts) {
  WorldGrid grid(5, 5, GRASSLAND);
  grid.Set(0, 0, WATER);
  grid.Set(1, 0, HOUSE);
  grid.Ignite(2, 0);
  grid.BurnOut(3, 0, 55);

  EXPECT_EQ(grid.Count(WATER), 1);
  EXPECT_EQ(grid.Count(HOUSE), 1);
  EXPECT_EQ(grid.Count(GRASSLAND), 21);
  EXPECT_EQ(grid.CountIgnitable(), 22);
}

TEST(WorldGridTest, AsciiDump) {
  WorldGrid grid(3, 2, FOREST_DENSE);
  grid.Set(1, 0, WATER);
  grid.Set(2, 1, HOUSE);
  grid.Ignite(0, 1);
  EXPECT_EQ(grid.ToAscii(), "T~T\n*TH\n");
}

// ============================================================================
// TerrainGenerator Tests
// ============================================================================

TEST(TerrainGeneratorTest, ClassifyThresholds) {
  WorldGenConfig config;
  TerrainGenerator generator(config);

  EXPECT_EQ(generator.Classify(-0.9f), WATER);
  EXPECT_EQ(generator.Classify(-0.4f), FIELD);
  EXPECT_EQ(generator.Classify(-0.2f), FIELD);
  EXPECT_EQ(generator.Classify(-0.15f), GRASSLAND);
  EXPECT_EQ(generator.Classify(0.0f), GRASSLAND);
  EXPECT_EQ(generator.Classify(0.05f), FOREST_LIGHT);
  EXPECT_EQ(generator.Classify(0.2f), FOREST_LIGHT);
  EXPECT_EQ(generator.Classify(0.25f), FOREST_DENSE);
  EXPECT_EQ(generator.Classify(0.9f), FOREST_DENSE);
}

TEST(TerrainGeneratorTest, Dimensions) {
  WorldGenConfig config;
  config.width = 32;
  config.height = 20;
  TerrainGenerator generator(config);

  WorldGrid grid = generator.Generate(5);
  EXPECT_EQ(grid.Width(), 32);
  EXPECT_EQ(grid.Height(), 20);
}

TEST(TerrainGeneratorTest, SameSeedSameIsland) {
  WorldGenConfig config;
  TerrainGenerator first(config);
  TerrainGenerator second(config);

  WorldGrid a = first.Generate(42);
  WorldGrid b = second.Generate(42);
  EXPECT_EQ(a.GetCells(), b.GetCells());

  // And again from the same instance
  WorldGrid c = first.Generate(42);
  EXPECT_EQ(a.GetCells(), c.GetCells());
}

TEST(TerrainGeneratorTest, DifferentSeedsDiffer) {
  WorldGenConfig config;
  TerrainGenerator generator(config);

  WorldGrid a = generator.Generate(1);
  WorldGrid b = generator.Generate(2);
  EXPECT_NE(a.GetCells(), b.GetCells());
}

TEST(TerrainGeneratorTest, OnlyTerrainClasses) {
  WorldGenConfig config;
  TerrainGenerator generator(config);

  WorldGrid grid = generator.Generate(77);
  grid.ForEachCell([](int, int, CellType type) {
    EXPECT_NE(type, FIRE);
    EXPECT_NE(type, BURNT);
    EXPECT_NE(type, CONTROLLED_BURN);
  });
}

TEST(TerrainGeneratorTest, RiversCarveWater) {
  WorldGenConfig config;
  config.waterThreshold = -2.0f; // Noise alone never makes water
  config.enableLakes = false;
  config.enableHouses = false;
  config.enableClearings = false;
  TerrainGenerator generator(config);

  WorldGrid grid = generator.Generate(9);
  EXPECT_GE(grid.Count(WATER), config.riverLength.min);
}

// ============================================================================
// Feature Tests
// ============================================================================

TEST(FeatureTest, RiverStaysInGrid) {
  WorldGenConfig config;
  config.riverLength = {200, 200};
  WorldGrid grid(20, 12, GRASSLAND);
  std::mt19937 rng(3);

  RiverFeature river;
  int count = river.Carve(grid, config, rng);
  EXPECT_GE(count, config.riverCount.min);
  EXPECT_LE(count, config.riverCount.max);
  EXPECT_GT(grid.Count(WATER), 0);
}

TEST(FeatureTest, HousesAvoidWater) {
  WorldGenConfig config;
  WorldGrid grid(30, 30, FIELD);
  for (int y = 0; y < 30; ++y)
    for (int x = 12; x < 18; ++x)
      grid.Set(x, y, WATER);
  const int water = grid.Count(WATER);

  int built = 0;
  for (uint32_t seed = 0; seed < 20; ++seed) {
    WorldGrid copy = grid;
    std::mt19937 rng(seed);
    HouseFeature houses;
    houses.Carve(copy, config, rng);
    EXPECT_EQ(copy.Count(WATER), water);
    built += copy.Count(HOUSE);
  }
  EXPECT_GT(built, 0);
}

TEST(FeatureTest, HousesNeedOpenGround) {
  WorldGenConfig config;
  WorldGrid grid(30, 30, FOREST_DENSE);
  std::mt19937 rng(11);

  HouseFeature houses;
  EXPECT_EQ(houses.Carve(grid, config, rng), 0);
  EXPECT_EQ(grid.Count(HOUSE), 0);
}

TEST(FeatureTest, LakesNeverFloodHouses) {
  WorldGenConfig config;
  WorldGrid grid(30, 30, FOREST_DENSE);
  for (int y = 0; y < 30; y += 2)
    for (int x = 0; x < 30; x += 2)
      grid.Set(x, y, HOUSE);
  const int houses = grid.Count(HOUSE);

  std::mt19937 rng(21);
  LakeFeature lakes;
  int carved = lakes.Carve(grid, config, rng);
  EXPECT_GE(carved, config.lakeCount.min);
  EXPECT_EQ(grid.Count(HOUSE), houses);
  EXPECT_GT(grid.Count(WATER), 0);
}

TEST(FeatureTest, LakesSkipWhenAllWater) {
  WorldGenConfig config;
  WorldGrid grid(20, 20, WATER);
  std::mt19937 rng(2);

  LakeFeature lakes;
  EXPECT_EQ(lakes.Carve(grid, config, rng), 0);
}

TEST(FeatureTest, ClearingsKeepWaterAndHouses) {
  WorldGenConfig config;
  config.clearingCount = {10, 10};
  WorldGrid grid(16, 16, FOREST_DENSE);
  for (int i = 0; i < 16; ++i) {
    grid.Set(i, 8, WATER);
    grid.Set(8, i, HOUSE);
  }
  const int water = grid.Count(WATER);
  const int houses = grid.Count(HOUSE);

  std::mt19937 rng(4);
  ClearingFeature clearings;
  clearings.Carve(grid, config, rng);

  EXPECT_EQ(grid.Count(WATER), water);
  EXPECT_EQ(grid.Count(HOUSE), houses);
  EXPECT_GT(grid.Count(GRASSLAND), 0);
}
