#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/subscription_record.hpp"

namespace reactor::db {

class SubscriptionRepository {
 public:
  virtual ~SubscriptionRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Assigns record.id on success.
  virtual Result InsertSubscription(Transaction&, model::SubscriptionRecord& record) = 0;

  // NotFound when no row has this id.
  virtual Result DeleteSubscription(Transaction&, uint64_t id) = 0;

  // Removes the agent's subscriptions, only its defaults when defaults_only is set.
  virtual Result DeleteAgentSubscriptions(Transaction&, const std::string& agent_id, bool defaults_only, uint64_t& removed) = 0;

  virtual std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, uint64_t id) = 0;

  // Ascending id. All agents when agent_id is unset.
  virtual std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&, const std::optional<std::string>& agent_id) = 0;
};

} // namespace reactor::db
