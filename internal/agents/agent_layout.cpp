#include "agent_layout.hpp"

#include "internal/util/errors.hpp"

namespace reactor::agents {

void ValidateAgentId(const std::string& agent_id) {
  if (agent_id.empty()) {
    throw util::InvalidArgument("agent id must not be empty");
  }
  for (char c : agent_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("agent id contains invalid character: " + agent_id);
    }
  }
  if (agent_id == "." || agent_id == "..") {
    throw util::InvalidArgument("agent id must not be a relative path component");
  }
}

AgentLayout::AgentLayout(std::filesystem::path root) : root_(std::move(root)) {
}

std::filesystem::path AgentLayout::AgentDir(const std::string& agent_id) const {
  ValidateAgentId(agent_id);
  return root_ / "agents" / agent_id.substr(0, 2) / agent_id;
}

std::filesystem::path AgentLayout::StatePath(const std::string& agent_id) const {
  return AgentDir(agent_id) / "state.jsonl";
}

std::filesystem::path AgentLayout::WorkspacePath(const std::string& agent_id) const {
  ValidateAgentId(agent_id);
  return root_ / "workspaces" / (agent_id + ".db");
}

std::filesystem::path AgentLayout::EnsureAgentDir(const std::string& agent_id) const {
  auto dir = AgentDir(agent_id);
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace reactor::agents
