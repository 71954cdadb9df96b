#include "Application.h"
#include "../debug/Logger.h"
#include "../debug/Profiler.h"
#include "../states/GameState.h"
#include "StateManager.h"

Application::Application(const AppConfig &config,
                         const WorldGenConfig &genConfig,
                         const SimConfig &simConfig)
    : m_Config(config),
      m_Simulation(std::make_unique<Simulation>(genConfig, simConfig)),
      m_SeedRng(std::random_device{}()) {
  if (!m_Config.scriptPath.empty() && !m_Script.Load(m_Config.scriptPath))
    LOG_WARN("Running without operator input");

  m_StateManager = std::make_unique<StateManager>(this);

  m_Simulation->Restart(PickSeed());
  m_StateManager->PushState(std::make_unique<GameState>());
}

Application::~Application() = default;

void Application::Run() {
  LOG_INFO("Running {} episode(s) at {:.4f}s per frame, {} frames max",
           m_Config.episodes, m_Config.frameDt, m_Config.maxFrames);

  while (m_Running && m_Frame < m_Config.maxFrames) {
    Step();
  }

  if (m_Running)
    LOG_WARN("Frame limit reached after {} frames", m_Frame);
}

void Application::Step() {
  PROFILE_SCOPE("Main Loop");

  // Process State Changes
  m_StateManager->ProcessStateChange();
  if (m_StateManager->Empty()) {
    Quit();
    return;
  }

  m_StateManager->Update(m_Config.frameDt);

  ++m_Frame;
  ++m_EpisodeFrame;
}

void Application::Quit() { m_Running = false; }

void Application::PushState(std::unique_ptr<State> state) {
  m_StateManager->PushState(std::move(state));
}

void Application::PopState() { m_StateManager->PopState(); }

void Application::ChangeState(std::unique_ptr<State> state) {
  m_StateManager->ChangeState(std::move(state));
}

void Application::StartNextEpisode() {
  ++m_Episode;
  m_EpisodeFrame = 0;
  m_Simulation->Restart(PickSeed());
  ChangeState(std::make_unique<GameState>());
}

void Application::RestartEpisode() {
  // Frame counter keeps running so scripted commands are not replayed
  m_Simulation->Restart(PickSeed());
}

int Application::PickSeed() {
  if (m_Config.seed >= 0)
    return m_Config.seed + m_Episode;
  std::uniform_int_distribution<int> dist(0, 1000);
  return dist(m_SeedRng);
}
