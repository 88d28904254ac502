#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_map>

#include "memory_tx.hpp"

namespace reactor::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_event_id++;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, const model::EventFilter& f) {
  const auto& s = TX(t).View();

  auto it = std::lower_bound(s.events.begin(), s.events.end(), f.from_id, [](const model::EventRecord& e, uint64_t id) { return e.id < id; });

  std::vector<model::EventRecord> out;
  for (; it != s.events.end() && out.size() < f.limit; ++it) {
    const auto& e = *it;
    if (f.upper_id != 0 && e.id > f.upper_id) break;
    if (f.graph_id && e.graph_id != *f.graph_id) continue;
    if (!f.event_types.empty() && std::find(f.event_types.begin(), f.event_types.end(), e.event_type) == f.event_types.end()) continue;
    if (f.since_ms && e.created_at_ms < *f.since_ms) continue;
    if (f.until_ms && e.created_at_ms > *f.until_ms) continue;
    out.push_back(e);
  }
  return out;
}

uint64_t MemoryRepository::MaxEventId(Transaction& t) {
  const auto& s = TX(t).View();
  return s.events.empty() ? 0 : s.events.back().id;
}

uint64_t MemoryRepository::CountEvents(Transaction& t, const std::optional<std::string>& graph_id) {
  const auto& s = TX(t).View();
  if (!graph_id) return s.events.size();
  return static_cast<uint64_t>(std::count_if(s.events.begin(), s.events.end(), [&](const model::EventRecord& e) { return e.graph_id == *graph_id; }));
}

std::vector<model::GraphSummaryRecord> MemoryRepository::ListGraphs(Transaction& t, uint64_t limit, std::optional<uint64_t> since_ms) {
  const auto& s = TX(t).View();

  std::unordered_map<std::string, model::GraphSummaryRecord> by_graph;
  for (const auto& e : s.events) {
    auto [it, inserted] = by_graph.try_emplace(e.graph_id);
    auto& g             = it->second;
    if (inserted) {
      g.graph_id       = e.graph_id;
      g.first_event_ms = e.created_at_ms;
      g.last_event_ms  = e.created_at_ms;
    }
    g.first_event_ms = std::min(g.first_event_ms, e.created_at_ms);
    g.last_event_ms  = std::max(g.last_event_ms, e.created_at_ms);
    g.event_count++;
  }

  std::vector<model::GraphSummaryRecord> out;
  for (auto& [_, g] : by_graph) {
    if (since_ms && g.last_event_ms < *since_ms) continue;
    out.push_back(std::move(g));
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.last_event_ms != b.last_event_ms) return a.last_event_ms > b.last_event_ms;
    return a.graph_id < b.graph_id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSubscription(Transaction& t, model::SubscriptionRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_subscription_id++;
  s.subscriptions[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSubscription(Transaction& t, uint64_t id) {
  auto& s = TX(t).Mutable();
  if (s.subscriptions.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "subscription " + std::to_string(id));
  return Result::Ok();
}

Result MemoryRepository::DeleteAgentSubscriptions(Transaction& t, const std::string& agent_id, bool defaults_only, uint64_t& removed) {
  auto& s = TX(t).Mutable();
  removed = 0;
  for (auto it = s.subscriptions.begin(); it != s.subscriptions.end();) {
    if (it->second.agent_id == agent_id && (!defaults_only || it->second.is_default)) {
      it = s.subscriptions.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

std::optional<model::SubscriptionRecord> MemoryRepository::GetSubscription(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.subscriptions.find(id);
  if (it == s.subscriptions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SubscriptionRecord> MemoryRepository::ListSubscriptions(Transaction& t, const std::optional<std::string>& agent_id) {
  std::vector<model::SubscriptionRecord> out;
  for (const auto& [_, r] : TX(t).View().subscriptions)
    if (!agent_id || r.agent_id == *agent_id) out.push_back(r);
  return out;
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.agents.find(r.agent_id);
  if (it == s.agents.end()) {
    s.agents.emplace(r.agent_id, r);
    return Result::Ok();
  }
  const auto created = it->second.created_at_ms;
  it->second         = r;
  it->second.created_at_ms = created;
  return Result::Ok();
}

Result MemoryRepository::UpdateAgentStatus(Transaction& t, const std::string& agent_id, const std::string& status, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.agents.find(agent_id);
  if (it == s.agents.end()) return Result::Err(ErrorCode::NotFound, "agent " + agent_id);
  it->second.status        = status;
  it->second.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

std::optional<model::AgentRecord> MemoryRepository::GetAgent(Transaction& t, const std::string& agent_id) {
  const auto& s  = TX(t).View();
  auto        it = s.agents.find(agent_id);
  if (it == s.agents.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AgentRecord> MemoryRepository::ListAgents(Transaction& t, const std::optional<std::string>& status) {
  std::vector<model::AgentRecord> out;
  for (const auto& [_, r] : TX(t).View().agents)
    if (!status || r.status == *status) out.push_back(r);
  return out;
}

} // namespace reactor::db::memory
