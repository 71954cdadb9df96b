#pragma once

#include "SimConfig.h"
#include <cstdint>

// Real time is measured in 60 Hz frame units so that tuned constants keep
// their meaning at any frame rate.
constexpr float FRAMES_PER_SECOND = 60.0f;

class SimulationClock {
public:
  explicit SimulationClock(Difficulty difficulty = Difficulty::Normal);

  void SetDifficulty(Difficulty difficulty);
  void Reset();

  // Advances by dt seconds. Returns the elapsed frame units and sets
  // `spreadDue` when the spread gate opened on this update.
  float Advance(float dt, bool &spreadDue);

  float GetSpreadDelay() const { return m_SpreadDelay; }
  float GetAccumulator() const { return m_Accumulator; }
  uint64_t GetUpdateCount() const { return m_Updates; }
  uint64_t GetSpreadTickCount() const { return m_SpreadTicks; }

private:
  float m_SpreadDelay;
  float m_Accumulator = 0.0f;
  uint64_t m_Updates = 0;
  uint64_t m_SpreadTicks = 0;
};
