#pragma once

#include "../input/OperatorScript.h"
#include "../sim/SimConfig.h"
#include "../sim/Simulation.h"
#include "../world/WorldGenConfig.h"
#include "AppConfig.h"
#include "StateManager.h"
#include <cstdint>
#include <memory>
#include <random>

// Headless host: fixed-step loop driving the state stack, which drives the
// simulation. Stands where a windowed front end would.
class Application {
public:
  Application(const AppConfig &config, const WorldGenConfig &genConfig,
              const SimConfig &simConfig);
  ~Application();

  void Run();
  // Runs a single loop iteration; Run() is a loop over this
  void Step();
  void Quit();
  bool IsRunning() const { return m_Running; }

  // State Management
  void PushState(std::unique_ptr<State> state);
  void PopState();
  void ChangeState(std::unique_ptr<State> state);

  // Episodes
  void StartNextEpisode();
  void RestartEpisode();
  bool HasMoreEpisodes() const { return m_Episode + 1 < m_Config.episodes; }
  int GetEpisode() const { return m_Episode; }
  uint64_t GetEpisodeFrame() const { return m_EpisodeFrame; }
  uint64_t GetFrame() const { return m_Frame; }

  Simulation &GetSimulation() { return *m_Simulation; }
  OperatorScript &GetScript() { return m_Script; }
  const AppConfig &GetConfig() const { return m_Config; }

private:
  int PickSeed();

  AppConfig m_Config;
  std::unique_ptr<Simulation> m_Simulation;
  OperatorScript m_Script;
  std::unique_ptr<StateManager> m_StateManager;
  std::mt19937 m_SeedRng;

  int m_Episode = 0;
  uint64_t m_Frame = 0;
  uint64_t m_EpisodeFrame = 0;
  bool m_Running = true;
};
