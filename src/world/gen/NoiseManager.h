#pragma once

#include "../WorldGenConfig.h"
#include <FastNoise/FastNoise.h>

// Wrapper for FastNoise2 holding the three terrain noise layers.
// Sampling is a pure function of (coordinate, seed).
class NoiseManager {
public:
  explicit NoiseManager(const WorldGenConfig &config);
  ~NoiseManager() = default;

  // Prevent copying/moving to avoid SmartNode reference issues
  NoiseManager(const NoiseManager &) = delete;
  NoiseManager &operator=(const NoiseManager &) = delete;
  NoiseManager(NoiseManager &&) = delete;
  NoiseManager &operator=(NoiseManager &&) = delete;

  void Initialize();

  // nx, ny are normalized grid coordinates (cell / grid size)
  float GetBroad(float nx, float ny, int seed) const;
  float GetDetail(float nx, float ny, int seed) const;
  float GetElevation(float nx, float ny, int seed) const;

  // Weighted, tanh-compressed composite used for classification, in (-1, 1)
  float GetTerrainValue(float nx, float ny, int seed) const;

private:
  WorldGenConfig config;

  FastNoise::SmartNode<> broadNode;     // Continental shape
  FastNoise::SmartNode<> detailNode;    // Fine variation
  FastNoise::SmartNode<> elevationNode; // Very low frequency bias
};
