#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/agent_repository.hpp"
#include "internal/db/api/event_repository.hpp"
#include "internal/db/api/subscription_repository.hpp"

namespace reactor::db::memory {

class MemoryTransaction;

/*
  In-process backend for all three stores. The composition root
  creates one instance per store; tests use it directly.
*/
class MemoryRepository final : public db::EventRepository, public db::SubscriptionRepository, public db::AgentRepository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, const model::EventFilter&) override;
  uint64_t MaxEventId(Transaction&) override;
  uint64_t CountEvents(Transaction&, const std::optional<std::string>& graph_id) override;
  std::vector<model::GraphSummaryRecord> ListGraphs(Transaction&, uint64_t limit, std::optional<uint64_t> since_ms) override;

  Result InsertSubscription(Transaction&, model::SubscriptionRecord&) override;
  Result DeleteSubscription(Transaction&, uint64_t id) override;
  Result DeleteAgentSubscriptions(Transaction&, const std::string& agent_id, bool defaults_only, uint64_t& removed) override;
  std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, uint64_t id) override;
  std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&, const std::optional<std::string>& agent_id) override;

  Result UpsertAgent(Transaction&, const model::AgentRecord&) override;
  Result UpdateAgentStatus(Transaction&, const std::string& agent_id, const std::string& status, uint64_t updated_at_ms) override;
  std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string& agent_id) override;
  std::vector<model::AgentRecord> ListAgents(Transaction&, const std::optional<std::string>& status) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::vector<model::EventRecord> events; // ascending id
    uint64_t next_event_id = 1;

    std::map<uint64_t, model::SubscriptionRecord> subscriptions;
    uint64_t next_subscription_id = 1;

    std::map<std::string, model::AgentRecord> agents;
  };

  std::mutex tx_mutex_; // held by the open transaction
  State committed_;
};

}
