#include "SimulationClock.h"

SimulationClock::SimulationClock(Difficulty difficulty)
    : m_SpreadDelay(::GetSpreadDelay(difficulty)) {}

void SimulationClock::SetDifficulty(Difficulty difficulty) {
  m_SpreadDelay = ::GetSpreadDelay(difficulty);
}

void SimulationClock::Reset() {
  m_Accumulator = 0.0f;
  m_Updates = 0;
  m_SpreadTicks = 0;
}

float SimulationClock::Advance(float dt, bool &spreadDue) {
  float frames = dt * FRAMES_PER_SECOND;
  ++m_Updates;

  m_Accumulator += frames;
  spreadDue = m_Accumulator >= m_SpreadDelay;
  if (spreadDue) {
    m_Accumulator = 0.0f;
    ++m_SpreadTicks;
  }
  return frames;
}
