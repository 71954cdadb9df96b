#pragma once

#include "../core/State.h"

// Active episode: dispatches due operator commands, then ticks the
// simulation until it reaches an outcome.
class GameState : public State {
public:
  const char *GetName() const override { return "GameState"; }

  void Init(Application *app) override;
  void HandleInput(Application *app) override;
  void Update(Application *app, float dt) override;
  void Cleanup() override;

private:
  bool m_Finished = false;
};
