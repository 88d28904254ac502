#include "swarm_registry.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reactor::agents {

using reactor::v1::AgentEntry;
using reactor::v1::AgentStatus;

namespace {

std::string StatusName(AgentStatus status) {
  switch (status) {
    case reactor::v1::AGENT_STATUS_ORPHANED:
      return db::model::kAgentStatusOrphaned;
    default:
      return db::model::kAgentStatusActive;
  }
}

AgentStatus StatusFromName(const std::string& name) {
  if (name == db::model::kAgentStatusOrphaned) return reactor::v1::AGENT_STATUS_ORPHANED;
  if (name == db::model::kAgentStatusActive) return reactor::v1::AGENT_STATUS_ACTIVE;
  throw util::PersistenceError("unknown agent status: " + name);
}

db::model::AgentRecord ToRecord(const AgentEntry& entry) {
  const auto& identity = entry.identity();

  db::model::AgentRecord record;
  record.agent_id      = entry.agent_id();
  record.node_type     = identity.node_type();
  record.name          = identity.name();
  record.full_name     = identity.full_name();
  record.file_path     = identity.file_path();
  record.parent_id     = identity.parent_id();
  record.start_line    = identity.range().start_line();
  record.end_line      = identity.range().end_line();
  record.start_byte    = identity.range().start_byte();
  record.end_byte      = identity.range().end_byte();
  record.status        = StatusName(entry.status());
  record.created_at_ms = util::MillisFromTimestamp(entry.created_at());
  record.updated_at_ms = util::MillisFromTimestamp(entry.updated_at());
  return record;
}

AgentEntry FromRecord(const db::model::AgentRecord& record) {
  AgentEntry entry;
  entry.set_agent_id(record.agent_id);
  entry.set_status(StatusFromName(record.status));

  auto* identity = entry.mutable_identity();
  identity->set_node_type(record.node_type);
  identity->set_name(record.name);
  identity->set_full_name(record.full_name);
  identity->set_file_path(record.file_path);
  identity->set_parent_id(record.parent_id);

  // all-zero columns mean the unit was discovered without a range
  if (record.start_line != 0 || record.end_line != 0 || record.start_byte != 0 || record.end_byte != 0) {
    auto* range = identity->mutable_range();
    range->set_start_line(record.start_line);
    range->set_end_line(record.end_line);
    range->set_start_byte(record.start_byte);
    range->set_end_byte(record.end_byte);
  }

  *entry.mutable_created_at() = util::TimestampFromMillis(record.created_at_ms);
  *entry.mutable_updated_at() = util::TimestampFromMillis(record.updated_at_ms);
  return entry;
}

} // namespace

AgentEntry EntryFromIdentity(const std::string& agent_id, const reactor::v1::AgentIdentity& identity) {
  AgentEntry entry;
  entry.set_agent_id(agent_id);
  *entry.mutable_identity() = identity;
  entry.set_status(reactor::v1::AGENT_STATUS_ACTIVE);
  return entry;
}

SwarmRegistry::SwarmRegistry(std::shared_ptr<db::AgentRepository> repository) : repository_(std::move(repository)) {
}

AgentEntry SwarmRegistry::Upsert(const AgentEntry& entry) {
  if (entry.agent_id().empty()) {
    throw util::InvalidArgument("upsert agent: agent_id is empty");
  }

  const auto now = util::NowMillis();

  auto record          = ToRecord(entry);
  record.status        = db::model::kAgentStatusActive;
  record.created_at_ms = now;
  record.updated_at_ms = now;

  auto tx = repository_->Begin();
  if (auto r = repository_->UpsertAgent(*tx, record); !r) {
    throw util::PersistenceError("upsert agent " + entry.agent_id() + ": " + r.Describe());
  }
  auto stored = repository_->GetAgent(*tx, entry.agent_id());
  tx->Commit();

  if (!stored) {
    throw util::PersistenceError("upsert agent " + entry.agent_id() + ": row missing after write");
  }
  return FromRecord(*stored);
}

bool SwarmRegistry::MarkOrphaned(const std::string& agent_id) {
  auto tx = repository_->Begin();
  auto r  = repository_->UpdateAgentStatus(*tx, agent_id, db::model::kAgentStatusOrphaned, util::NowMillis());
  if (r.code == db::ErrorCode::NotFound) return false;
  if (!r) {
    throw util::PersistenceError("orphan agent " + agent_id + ": " + r.Describe());
  }
  tx->Commit();
  return true;
}

std::optional<AgentEntry> SwarmRegistry::Get(const std::string& agent_id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetAgent(*tx, agent_id);
  if (!record) return std::nullopt;
  return FromRecord(*record);
}

std::vector<AgentEntry> SwarmRegistry::List(std::optional<AgentStatus> status) const {
  std::optional<std::string> filter;
  if (status) filter = StatusName(*status);

  auto tx = repository_->Begin();

  std::vector<AgentEntry> out;
  for (const auto& record : repository_->ListAgents(*tx, filter)) out.push_back(FromRecord(record));
  return out;
}

} // namespace reactor::agents
