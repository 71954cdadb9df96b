#include "OperatorScript.h"
#include "../debug/Logger.h"
#include <algorithm>
#include <fstream>

using json = nlohmann::json;

bool OperatorScript::Load(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_CONFIG_ERROR("Failed to open operator script: {}", path);
    return false;
  }

  json root;
  try {
    root = json::parse(file, nullptr, true, true);
  } catch (const json::parse_error &e) {
    LOG_CONFIG_ERROR("Failed to parse operator script {}: {}", path, e.what());
    return false;
  }

  if (!Read(root))
    return false;
  LOG_CONFIG_INFO("Loaded {} operator commands from {}", m_Commands.size(),
                  path);
  return true;
}

bool OperatorScript::Parse(const std::string &text) {
  json root;
  try {
    root = json::parse(text, nullptr, true, true);
  } catch (const json::parse_error &e) {
    LOG_CONFIG_ERROR("Failed to parse operator script: {}", e.what());
    return false;
  }
  return Read(root);
}

bool OperatorScript::Read(const json &root) {
  const json *list = &root;
  if (root.is_object() && root.contains("commands"))
    list = &root["commands"];
  if (!list->is_array()) {
    LOG_CONFIG_ERROR("Operator script must be an array of commands");
    return false;
  }

  m_Commands.clear();
  for (const auto &item : *list) {
    try {
      OperatorCommand command;
      command.episode = item.value("episode", 0);
      command.frame = item.at("frame").get<uint64_t>();
      command.action = item.at("action").get<CommandAction>();
      command.x = item.value("x", 0);
      command.y = item.value("y", 0);

      if (command.action == CommandAction::Invalid) {
        LOG_CONFIG_WARN("Skipping command with unknown action: {}",
                        item.dump());
        continue;
      }
      Add(command);
    } catch (const json::exception &e) {
      LOG_CONFIG_WARN("Skipping malformed command {}: {}", item.dump(),
                      e.what());
    }
  }
  return true;
}

void OperatorScript::Add(const OperatorCommand &command) {
  // Keep frame order; equal frames keep insertion order
  auto it = std::upper_bound(m_Commands.begin(), m_Commands.end(), command,
                             [](const OperatorCommand &a,
                                const OperatorCommand &b) {
                               if (a.episode != b.episode)
                                 return a.episode < b.episode;
                               return a.frame < b.frame;
                             });
  m_Commands.insert(it, command);
}

std::vector<OperatorCommand> OperatorScript::Poll(int episode,
                                                  uint64_t frame) const {
  std::vector<OperatorCommand> due;
  for (const auto &command : m_Commands) {
    if (command.episode == episode && command.frame == frame)
      due.push_back(command);
  }
  return due;
}
