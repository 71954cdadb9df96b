#include "ResultState.h"
#include "../core/Application.h"
#include "../debug/Logger.h"

void ResultState::Init(Application *app) {
  const Simulation &sim = app->GetSimulation();
  const GameStats &stats = sim.Stats();

  LOG_INFO("Episode {} (seed {}) ended in {} after {} frames",
           app->GetEpisode() + 1, sim.GetSeed(),
           sim.IsVictory() ? "VICTORY" : "DEFEAT", app->GetEpisodeFrame());
  LOG_INFO("Houses saved: {}/{}  Forest saved: {:.1f}%  Counter-burns: {}  "
           "Score: {}",
           stats.housesSaved, stats.housesTotal, stats.forestSaved,
           stats.controlledBurnsUsed, stats.score);
  LOG_WORLD_INFO("Final map:\n{}", sim.Grid().ToAscii());
}

void ResultState::Update(Application *app, float dt) {
  if (app->HasMoreEpisodes())
    app->StartNextEpisode();
  else
    app->Quit();
}
