#include "Simulation.h"
#include "../debug/Logger.h"
#include "../debug/Profiler.h"
#include "../ecs/Systems.h"
#include "../utils/MathUtils.h"

Simulation::Simulation(const WorldGenConfig &genConfig,
                       const SimConfig &simConfig)
    : m_GenConfig(genConfig), m_Config(simConfig),
      m_Generator(std::make_unique<TerrainGenerator>(genConfig)),
      m_FireSpread(simConfig), m_ControlledBurn(simConfig),
      m_Clock(simConfig.difficulty) {}

void Simulation::Generate(int seed) {
  m_Grid = std::make_unique<WorldGrid>(m_Generator->Generate(seed));
  ResetEpisode(seed);
}

void Simulation::LoadGrid(WorldGrid grid, int seed) {
  m_Grid = std::make_unique<WorldGrid>(std::move(grid));
  ResetEpisode(seed);
}

void Simulation::ResetEpisode(int seed) {
  m_Seed = seed;
  // Separate stream from terrain generation, same seed
  m_Rng.seed((uint32_t)seed ^ 0x9e3779b9u);

  m_Paused = false;
  m_Victory = false;
  m_Defeat = false;
  m_TotalBurnable = 0;
  m_HousesTotal = m_Grid->Count(HOUSE);
  m_ControlledBurnsUsed = 0;
  m_Clock.Reset();

  PropPlacementSystem::Place(m_Props, *m_Grid, m_GenConfig.treeDensity, m_Rng);
  RefreshStats();
}

void Simulation::Setup() {
  if (!m_Grid) {
    LOG_ERROR("Setup called before a world was generated");
    return;
  }

  m_TotalBurnable = m_Grid->CellCount() - m_Grid->Count(WATER);
  m_Clock.SetDifficulty(m_Config.difficulty);
  m_Clock.Reset();

  int lit = IgniteSources();
  RefreshStats();
  LOG_INFO("Episode {} ready on {}: {} burnable cells, {} houses, {} fire "
           "sources",
           m_Seed, GetDifficultyName(m_Config.difficulty), m_TotalBurnable,
           m_HousesTotal, lit);
}

void Simulation::Restart(int seed) {
  Generate(seed);
  Setup();
}

void Simulation::SetDifficulty(Difficulty difficulty) {
  m_Config.difficulty = difficulty;
  m_Clock.SetDifficulty(difficulty);
}

int Simulation::IgniteSources() {
  int lit = 0;
  for (int i = 0; i < m_Config.fireSources; ++i) {
    if (IgniteSource())
      ++lit;
    else
      LOG_FIRE_WARN("Could not find a start location for fire source {} "
                    "after {} attempts",
                    i + 1, m_Config.fireStartAttempts);
  }
  return lit;
}

bool Simulation::IgniteSource() {
  WorldGrid &grid = *m_Grid;
  const int w = grid.Width();
  const int h = grid.Height();

  for (int attempt = 0; attempt < m_Config.fireStartAttempts; ++attempt) {
    int sx, sy;
    switch (MathUtils::RandomInt(m_Rng, 0, 3)) {
    case 0: // Top
      sx = MathUtils::RandomInt(m_Rng, 0, w - 1);
      sy = 0;
      break;
    case 1: // Right
      sx = w - 1;
      sy = MathUtils::RandomInt(m_Rng, 0, h - 1);
      break;
    case 2: // Bottom
      sx = MathUtils::RandomInt(m_Rng, 0, w - 1);
      sy = h - 1;
      break;
    default: // Left
      sx = 0;
      sy = MathUtils::RandomInt(m_Rng, 0, h - 1);
      break;
    }

    CellType start = grid.Get(sx, sy);
    if (GetFlammability(start) <= 0.0f || start == FIRE)
      continue;

    grid.Ignite(sx, sy);

    // Small splash so the fire does not start from a single cell
    int splash = MathUtils::RandomInt(m_Rng, 1, 3);
    for (int i = 0; i < splash; ++i) {
      int fx = glm::clamp(sx + MathUtils::RandomInt(m_Rng, -1, 1), 0, w - 1);
      int fy = glm::clamp(sy + MathUtils::RandomInt(m_Rng, -1, 1), 0, h - 1);
      CellType type = grid.Get(fx, fy);
      if (IsIgnitable(type) && GetFlammability(type) > 0.0f)
        grid.Ignite(fx, fy);
    }

    LOG_FIRE_INFO("Fire started at ({}, {})", sx, sy);
    return true;
  }
  return false;
}

void Simulation::Tick(float dt) {
  if (!m_Grid || m_Paused)
    return;

  if (IsGameOver()) {
    RefreshStats();
    return;
  }

  PROFILE_SCOPE("Simulation::Tick");

  bool spreadDue = false;
  float frames = m_Clock.Advance(dt, spreadDue);

  m_FireSpread.AgeFire(*m_Grid, frames, m_Rng);

  if (spreadDue) {
    m_FireSpread.Spread(*m_Grid, (uint32_t)m_Rng());
    if (m_FireSpread.IsDefeat(*m_Grid, m_TotalBurnable)) {
      m_Defeat = true;
      LOG_FIRE_INFO("Defeat: less than {:.0f}% of the island is left",
                    m_Config.defeatFraction * 100.0f);
    }
  }

  m_FireSpread.BurnOutControlled(*m_Grid, frames, m_Rng);

  if (!m_Defeat && !FireSpread::HasFire(*m_Grid)) {
    m_Victory = true;
    LOG_FIRE_INFO("Victory: the fire is out");
  }

  m_FireSpread.CheckInvariants(*m_Grid);
  RefreshStats();
  PropAnimationSystem::Update(m_Props, *m_Grid, frames);
}

bool Simulation::Trigger(int x, int y) {
  if (!m_Grid || m_Paused || IsGameOver())
    return false;

  int converted = m_ControlledBurn.Trigger(*m_Grid, x, y, m_Rng);
  if (converted == 0) {
    LOG_FIRE_TRACE("Ignored counter-burn at ({}, {})", x, y);
    return false;
  }

  ++m_ControlledBurnsUsed;
  LOG_FIRE_INFO("Counter-burn #{} at ({}, {}) took {} cells",
                m_ControlledBurnsUsed, x, y, converted);
  RefreshStats();
  return true;
}

bool Simulation::IsContained() const {
  return m_Grid && FireSpread::IsContained(*m_Grid);
}

void Simulation::RefreshStats() {
  m_Stats = ScoreEvaluator::Evaluate(*m_Grid, m_TotalBurnable, m_HousesTotal,
                                     m_ControlledBurnsUsed);
}
