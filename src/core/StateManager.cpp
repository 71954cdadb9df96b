#include "StateManager.h"
#include "../debug/Logger.h"
#include "Application.h"

StateManager::StateManager(Application *app) : m_App(app) {}

StateManager::~StateManager() {
  while (!m_States.empty())
    Leave();
}

void StateManager::PushState(std::unique_ptr<State> state) {
  m_PendingQueue.push_back({ActionType::Push, std::move(state)});
}

void StateManager::PopState() {
  m_PendingQueue.push_back({ActionType::Pop, nullptr});
}

void StateManager::ChangeState(std::unique_ptr<State> state) {
  m_PendingQueue.push_back({ActionType::Change, std::move(state)});
}

size_t StateManager::ProcessStateChange() {
  // Init() may queue further changes; they run on the next call
  std::vector<PendingChange> queue = std::move(m_PendingQueue);
  m_PendingQueue.clear();

  for (auto &change : queue) {
    switch (change.type) {
    case ActionType::Push:
      Enter(std::move(change.state));
      break;
    case ActionType::Pop:
      if (m_States.empty())
        LOG_WARN("Pop requested on an empty state stack");
      else
        Leave();
      break;
    case ActionType::Change:
      if (!m_States.empty())
        Leave();
      Enter(std::move(change.state));
      break;
    }
  }
  return queue.size();
}

void StateManager::Update(float dt) {
  if (State *top = Top()) {
    top->HandleInput(m_App);
    top->Update(m_App, dt);
  }
}

void StateManager::Leave() {
  LOG_TRACE("Leaving {} (depth {})", m_States.top()->GetName(),
            m_States.size());
  m_States.top()->Cleanup();
  m_States.pop();
}

void StateManager::Enter(std::unique_ptr<State> state) {
  if (!state) {
    LOG_ERROR("Ignoring null state");
    return;
  }
  state->Init(m_App);
  m_States.push(std::move(state));
  LOG_TRACE("Entered {} (depth {})", m_States.top()->GetName(),
            m_States.size());
}
