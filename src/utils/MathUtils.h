#pragma once
#include <cstdint>
#include <random>

class MathUtils {
public:
  // Inclusive on both ends
  static int RandomInt(std::mt19937 &rng, int min, int max) {
    if (min >= max)
      return min;
    std::uniform_int_distribution<int> dist(min, max);
    return dist(rng);
  }

  static float SampleUniform(std::mt19937 &rng, float min, float max) {
    if (min >= max)
      return min;
    std::uniform_real_distribution<float> dist(min, max);
    return dist(rng);
  }

  // Bernoulli trial, probabilities outside [0,1] saturate
  static bool Chance(std::mt19937 &rng, float probability) {
    if (probability <= 0.0f)
      return false;
    if (probability >= 1.0f)
      return true;
    return SampleUniform(rng, 0.0f, 1.0f) < probability;
  }

  // Stateless [0,1) value keyed on (seed, a, b). Same inputs give the same
  // value no matter when or in which order they are asked for.
  static float HashUnit(uint32_t seed, uint32_t a, uint32_t b) {
    uint32_t h = seed * 83492791u ^ a * 73856093u ^ b * 19349663u;
    // murmur3 finalizer
    h ^= h >> 16;
    h *= 0x85ebca6bu;
    h ^= h >> 13;
    h *= 0xc2b2ae35u;
    h ^= h >> 16;
    return (float)(h >> 8) * (1.0f / 16777216.0f);
  }
};
