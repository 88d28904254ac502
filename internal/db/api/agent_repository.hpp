#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/agent_record.hpp"

namespace reactor::db {

/*
  Swarm directory. Agents are never hard-deleted; a vanished unit
  is marked orphaned and may come back later.
*/
class AgentRepository {
 public:
  virtual ~AgentRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Insert or replace by agent_id. created_at_ms of an existing row is kept.
  virtual Result UpsertAgent(Transaction&, const model::AgentRecord& record) = 0;

  virtual Result UpdateAgentStatus(Transaction&, const std::string& agent_id, const std::string& status, uint64_t updated_at_ms) = 0;

  virtual std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string& agent_id) = 0;

  // Ordered by agent_id. Every status when status is unset.
  virtual std::vector<model::AgentRecord> ListAgents(Transaction&, const std::optional<std::string>& status) = 0;
};

} // namespace reactor::db
