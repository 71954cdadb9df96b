#include "GameState.h"
#include "../core/Application.h"
#include "../debug/Logger.h"
#include "PausedState.h"
#include "ResultState.h"
#include <memory>

void GameState::Init(Application *app) {
  LOG_INFO("Entering Game State (episode {})", app->GetEpisode() + 1);
  m_Finished = false;
}

void GameState::HandleInput(Application *app) {
  Simulation &sim = app->GetSimulation();

  for (const auto &command :
       app->GetScript().Poll(app->GetEpisode(), app->GetEpisodeFrame())) {
    switch (command.action) {
    case CommandAction::Burn:
      sim.Trigger(command.x, command.y);
      break;
    case CommandAction::Pause:
      app->PushState(std::make_unique<PausedState>());
      break;
    case CommandAction::Restart:
      LOG_INFO("Restarting episode {}", app->GetEpisode() + 1);
      app->RestartEpisode();
      break;
    case CommandAction::Resume:
      LOG_TRACE("Resume ignored, game is not paused");
      break;
    default:
      break;
    }
  }
}

void GameState::Update(Application *app, float dt) {
  if (m_Finished)
    return;

  Simulation &sim = app->GetSimulation();
  sim.Tick(dt);

  if (sim.IsGameOver()) {
    m_Finished = true;
    app->ChangeState(std::make_unique<ResultState>());
  }
}

void GameState::Cleanup() {}
