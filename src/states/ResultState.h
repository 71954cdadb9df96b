#pragma once

#include "../core/State.h"

// Reports the finished episode, then starts the next one or quits.
class ResultState : public State {
public:
  const char *GetName() const override { return "ResultState"; }

  void Init(Application *app) override;
  void HandleInput(Application *app) override {}
  void Update(Application *app, float dt) override;
  void Cleanup() override {}
};
