#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "internal/agents/agent_layout.hpp"
#include "reactor/v1.hpp"

namespace reactor::agents {

/*
  Per-agent state as an append-only JSON lines file. Every Save()
  appends the whole state as one line; Load() returns the newest line
  that parses, so a torn final append falls back to the state before it.
  Older lines stay as history.
*/
class AgentStateStore {
 public:
  explicit AgentStateStore(AgentLayout layout);

  std::optional<reactor::v1::AgentState> Load(const std::string& agent_id) const;

  // Stamps last_updated. Throws util::PersistenceError when the line cannot be written.
  void Save(reactor::v1::AgentState& state);

  bool Exists(const std::string& agent_id) const;

  const AgentLayout& Layout() const {
    return layout_;
  }

 private:
  AgentLayout        layout_;
  mutable std::mutex mutex_;
};

} // namespace reactor::agents
