#include "PausedState.h"
#include "../core/Application.h"
#include "../debug/Logger.h"

void PausedState::Init(Application *app) {
  m_App = app;
  app->GetSimulation().SetPaused(true);
  LOG_INFO("Paused at frame {}", app->GetEpisodeFrame());
}

void PausedState::HandleInput(Application *app) {
  for (const auto &command :
       app->GetScript().Poll(app->GetEpisode(), app->GetEpisodeFrame())) {
    if (command.action == CommandAction::Resume) {
      app->PopState();
      return;
    }
    LOG_TRACE("Dropped command at frame {} while paused",
              app->GetEpisodeFrame());
  }
}

void PausedState::Cleanup() {
  if (m_App) {
    m_App->GetSimulation().SetPaused(false);
    LOG_INFO("Resumed at frame {}", m_App->GetEpisodeFrame());
  }
}
