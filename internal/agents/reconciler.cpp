#include "reconciler.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <map>
#include <set>

#include "internal/agents/agent_state_store.hpp"
#include "internal/agents/swarm_registry.hpp"
#include "internal/events/event_builders.hpp"
#include "internal/events/event_log.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/subscriptions/subscription_registry.hpp"
#include "internal/util/errors.hpp"

namespace reactor::agents {

using observability::StringField;
using observability::UIntField;
using reactor::v1::AgentEntry;
using reactor::v1::DiscoveredUnit;

namespace {

// An absent range and an all-zero range are the same identity.
bool SameIdentity(reactor::v1::AgentIdentity a, reactor::v1::AgentIdentity b) {
  a.mutable_range();
  b.mutable_range();
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace

reactor::v1::AgentState InitialState(const DiscoveredUnit& unit) {
  reactor::v1::AgentState state;
  state.set_agent_id(unit.id());
  *state.mutable_identity() = unit.identity();
  if (!unit.identity().parent_id().empty()) {
    (*state.mutable_connections())["parent"] = unit.identity().parent_id();
  }
  return state;
}

Reconciler::Reconciler(std::shared_ptr<SwarmRegistry> swarm, std::shared_ptr<AgentStateStore> states,
                       std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions, std::shared_ptr<events::EventLog> log, std::string swarm_id)
    : swarm_(std::move(swarm)), states_(std::move(states)), subscriptions_(std::move(subscriptions)), log_(std::move(log)), swarm_id_(std::move(swarm_id)) {
}

void Reconciler::EnsureState(const DiscoveredUnit& unit, bool keep_history) {
  auto existing = keep_history ? states_->Load(unit.id()) : std::nullopt;
  if (!existing) {
    auto state = InitialState(unit);
    states_->Save(state);
    return;
  }
  if (SameIdentity(existing->identity(), unit.identity())) return;

  *existing->mutable_identity() = unit.identity();
  states_->Save(*existing);
}

ReconcileSummary Reconciler::Reconcile(const std::vector<DiscoveredUnit>& units) {
  ReconcileSummary summary;

  std::map<std::string, AgentEntry> known;
  for (auto& entry : swarm_->List()) known.emplace(entry.agent_id(), std::move(entry));

  std::set<std::string> seen;
  std::set<std::string> changed_paths;

  for (const auto& unit : units) {
    ValidateAgentId(unit.id());
    if (!seen.insert(unit.id()).second) {
      throw util::InvalidArgument("reconcile: duplicate unit id " + unit.id());
    }

    auto it = known.find(unit.id());
    if (it == known.end()) {
      states_->Layout().EnsureAgentDir(unit.id());
      EnsureState(unit, false);
      subscriptions_->RegisterDefaults(unit.id(), unit.identity().file_path());
      swarm_->Upsert(EntryFromIdentity(unit.id(), unit.identity()));
      ++summary.created;
      continue;
    }

    const auto& entry = it->second;
    if (entry.status() == reactor::v1::AGENT_STATUS_ORPHANED) {
      states_->Layout().EnsureAgentDir(unit.id());
      EnsureState(unit, true);
      subscriptions_->RegisterDefaults(unit.id(), unit.identity().file_path());
      swarm_->Upsert(EntryFromIdentity(unit.id(), unit.identity()));
      ++summary.restored;
      continue;
    }

    if (!SameIdentity(entry.identity(), unit.identity())) {
      EnsureState(unit, true);
      subscriptions_->RegisterDefaults(unit.id(), unit.identity().file_path());
      swarm_->Upsert(EntryFromIdentity(unit.id(), unit.identity()));
      if (!unit.identity().file_path().empty()) changed_paths.insert(unit.identity().file_path());
      ++summary.updated;
      continue;
    }

    if (!states_->Exists(unit.id())) {
      REACTOR_LOG_WARN("agent state missing; recreating", {StringField("agent_id", unit.id())});
      EnsureState(unit, false);
    }
    ++summary.unchanged;
  }

  for (const auto& [agent_id, entry] : known) {
    if (entry.status() != reactor::v1::AGENT_STATUS_ACTIVE || seen.count(agent_id)) continue;

    swarm_->MarkOrphaned(agent_id);
    subscriptions_->UnregisterAll(agent_id);
    ++summary.orphaned;
  }

  for (const auto& path : changed_paths) {
    auto event = events::ContentChangedEvent(path);
    event.set_graph_id(swarm_id_);
    log_->Append(std::move(event));
  }

  summary.total = seen.size();

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordReconciled("created", summary.created);
  metrics.RecordReconciled("restored", summary.restored);
  metrics.RecordReconciled("updated", summary.updated);
  metrics.RecordReconciled("orphaned", summary.orphaned);

  REACTOR_LOG_INFO("swarm reconciled", {UIntField("created", summary.created), UIntField("restored", summary.restored),
                                        UIntField("updated", summary.updated), UIntField("orphaned", summary.orphaned),
                                        UIntField("unchanged", summary.unchanged), UIntField("total", summary.total)});
  return summary;
}

} // namespace reactor::agents
