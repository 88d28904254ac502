#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/agent_repository.hpp"
#include "reactor/v1.hpp"

namespace reactor::agents {

/*
  Directory of every agent the swarm has ever seen, backed by the
  swarm store. Entries are never deleted, only orphaned.
*/
class SwarmRegistry {
 public:
  explicit SwarmRegistry(std::shared_ptr<db::AgentRepository> repository);

  // Writes the entry as ACTIVE. Returns it as stored.
  reactor::v1::AgentEntry Upsert(const reactor::v1::AgentEntry& entry);

  // False when the agent is unknown.
  bool MarkOrphaned(const std::string& agent_id);

  std::optional<reactor::v1::AgentEntry> Get(const std::string& agent_id) const;

  // Ordered by agent id. Every status when unset.
  std::vector<reactor::v1::AgentEntry> List(std::optional<reactor::v1::AgentStatus> status = std::nullopt) const;

 private:
  std::shared_ptr<db::AgentRepository> repository_;
};

reactor::v1::AgentEntry EntryFromIdentity(const std::string& agent_id, const reactor::v1::AgentIdentity& identity);

} // namespace reactor::agents
