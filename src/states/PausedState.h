#pragma once

#include "../core/State.h"

// Freezes the simulation until a resume command arrives. Operator burns
// issued while paused are dropped.
class PausedState : public State {
public:
  const char *GetName() const override { return "PausedState"; }

  void Init(Application *app) override;
  void HandleInput(Application *app) override;
  void Update(Application *app, float dt) override {}
  void Cleanup() override;

private:
  Application *m_App = nullptr;
};
