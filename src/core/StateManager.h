#pragma once

#include "State.h"
#include <memory>
#include <stack>
#include <vector>

class Application;

// Stack of host states. Changes are queued and applied by
// ProcessStateChange() so a state can replace itself mid-update.
class StateManager {
public:
  explicit StateManager(Application *app);
  ~StateManager();

  void PushState(std::unique_ptr<State> state);
  void PopState();
  void ChangeState(std::unique_ptr<State> state);

  void Update(float dt);
  // Returns the number of queued changes applied
  size_t ProcessStateChange();

  bool Empty() const { return m_States.empty(); }
  size_t Depth() const { return m_States.size(); }
  size_t PendingCount() const { return m_PendingQueue.size(); }
  // nullptr when the stack is empty
  State *Top() const { return m_States.empty() ? nullptr : m_States.top().get(); }

private:
  void Leave();
  void Enter(std::unique_ptr<State> state);

  Application *m_App;
  std::stack<std::unique_ptr<State>> m_States;

  enum class ActionType { Push, Pop, Change };

  struct PendingChange {
    ActionType type;
    std::unique_ptr<State> state;
  };

  std::vector<PendingChange> m_PendingQueue;
};
