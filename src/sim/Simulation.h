#pragma once

#include "../world/TerrainGenerator.h"
#include "../world/WorldGenConfig.h"
#include "../world/WorldGrid.h"
#include "ControlledBurn.h"
#include "FireSpread.h"
#include "ScoreEvaluator.h"
#include "SimConfig.h"
#include "SimulationClock.h"
#include <entt/entt.hpp>
#include <memory>
#include <random>

// Owns everything that makes up one episode: the grid, the clock, the RNG
// stream, the prop layer and the outcome. Single writer; the host calls
// Tick() once per frame and Trigger() for operator input.
class Simulation {
public:
  Simulation(const WorldGenConfig &genConfig, const SimConfig &simConfig);

  // New island for `seed`. Fires are not lit until Setup().
  void Generate(int seed);
  // Installs a prebuilt grid in place of a generated one
  void LoadGrid(WorldGrid grid, int seed);
  // Captures start totals and lights the initial fires
  void Setup();
  // Generate + Setup, replacing all previous state
  void Restart(int seed);

  void Tick(float dt);

  // Starts a counter-burn at (x, y). Returns false if nothing happened.
  bool Trigger(int x, int y);

  void SetPaused(bool paused) { m_Paused = paused; }
  bool IsPaused() const { return m_Paused; }

  void SetDifficulty(Difficulty difficulty);
  Difficulty GetDifficulty() const { return m_Config.difficulty; }

  bool IsVictory() const { return m_Victory; }
  bool IsDefeat() const { return m_Defeat; }
  bool IsGameOver() const { return m_Victory || m_Defeat; }
  bool IsContained() const;

  const GameStats &Stats() const { return m_Stats; }
  int GetTotalBurnable() const { return m_TotalBurnable; }
  int GetSeed() const { return m_Seed; }

  bool HasGrid() const { return m_Grid != nullptr; }
  const WorldGrid &Grid() const { return *m_Grid; }
  const entt::registry &Props() const { return m_Props; }
  const SimulationClock &Clock() const { return m_Clock; }

private:
  void ResetEpisode(int seed);
  int IgniteSources();
  bool IgniteSource();
  void RefreshStats();

  WorldGenConfig m_GenConfig;
  SimConfig m_Config;
  std::unique_ptr<TerrainGenerator> m_Generator;
  FireSpread m_FireSpread;
  ControlledBurn m_ControlledBurn;
  SimulationClock m_Clock;

  std::unique_ptr<WorldGrid> m_Grid;
  entt::registry m_Props;
  std::mt19937 m_Rng;
  int m_Seed = 0;

  bool m_Paused = false;
  bool m_Victory = false;
  bool m_Defeat = false;

  int m_TotalBurnable = 0;
  int m_HousesTotal = 0;
  int m_ControlledBurnsUsed = 0;
  GameStats m_Stats;
};
