#pragma once

class Application;

// One layer of the host's state stack. Only the top state receives input
// and updates; states below it stay suspended until it is popped.
class State {
public:
  virtual ~State() = default;

  virtual const char *GetName() const = 0;

  virtual void Init(Application *app) = 0;
  virtual void HandleInput(Application *app) = 0;
  virtual void Update(Application *app, float dt) = 0;
  virtual void Cleanup() = 0;
};
