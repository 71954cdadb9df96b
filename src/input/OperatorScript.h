#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class CommandAction { Invalid, Burn, Pause, Resume, Restart };

NLOHMANN_JSON_SERIALIZE_ENUM(CommandAction,
                             {{CommandAction::Invalid, nullptr},
                              {CommandAction::Burn, "burn"},
                              {CommandAction::Pause, "pause"},
                              {CommandAction::Resume, "resume"},
                              {CommandAction::Restart, "restart"}})

// One scripted operator input, due on `frame` of episode `episode`
struct OperatorCommand {
  int episode = 0;
  uint64_t frame = 0;
  CommandAction action = CommandAction::Invalid;
  int x = 0;
  int y = 0;
};

// Replayable stand-in for interactive input. Grid picking is done by
// whoever writes the script; coordinates are cells.
class OperatorScript {
public:
  bool Load(const std::string &path);
  bool Parse(const std::string &text);

  void Add(const OperatorCommand &command);
  std::vector<OperatorCommand> Poll(int episode, uint64_t frame) const;

  size_t Size() const { return m_Commands.size(); }
  bool Empty() const { return m_Commands.empty(); }

private:
  bool Read(const nlohmann::json &root);

  std::vector<OperatorCommand> m_Commands;
};
