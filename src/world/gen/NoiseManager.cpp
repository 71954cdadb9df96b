#include "NoiseManager.h"
#include <cmath>

NoiseManager::NoiseManager(const WorldGenConfig &config) : config(config) {
  Initialize();
}

void NoiseManager::Initialize() {
  // 1. Broad: multi-octave fractal for the island silhouette
  auto broad = FastNoise::New<FastNoise::Perlin>();
  auto broadFractal = FastNoise::New<FastNoise::FractalFBm>();
  broadFractal->SetSource(broad);
  broadFractal->SetOctaveCount(config.broadOctaves);
  broadFractal->SetGain(0.5f);
  broadFractal->SetLacunarity(2.0f);
  broadNode = broadFractal;

  // 2. Detail: single octave, breaks up the broad bands
  detailNode = FastNoise::New<FastNoise::Perlin>();

  // 3. Elevation: two octaves at island scale
  auto elevation = FastNoise::New<FastNoise::Perlin>();
  auto elevationFractal = FastNoise::New<FastNoise::FractalFBm>();
  elevationFractal->SetSource(elevation);
  elevationFractal->SetOctaveCount(2);
  elevationFractal->SetGain(0.5f);
  elevationFractal->SetLacunarity(2.0f);
  elevationNode = elevationFractal;
}

float NoiseManager::GetBroad(float nx, float ny, int seed) const {
  return broadNode->GenSingle2D(nx * config.broadFrequency,
                                ny * config.broadFrequency, seed);
}

float NoiseManager::GetDetail(float nx, float ny, int seed) const {
  return detailNode->GenSingle2D(nx * config.detailFrequency,
                                 ny * config.detailFrequency, seed + 1);
}

float NoiseManager::GetElevation(float nx, float ny, int seed) const {
  return elevationNode->GenSingle2D(
      nx * config.elevationFrequency + config.elevationOffset,
      ny * config.elevationFrequency + config.elevationOffset, seed + 2);
}

float NoiseManager::GetTerrainValue(float nx, float ny, int seed) const {
  float combined = GetBroad(nx, ny, seed) * config.broadWeight +
                   GetDetail(nx, ny, seed) * config.detailWeight;
  float value = combined + config.elevationWeight * GetElevation(nx, ny, seed);
  return std::tanh(value * config.contrast);
}
