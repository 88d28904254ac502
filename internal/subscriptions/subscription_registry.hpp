#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/subscription_repository.hpp"
#include "reactor/v1.hpp"

namespace reactor::subscriptions {

/*
  Durable store of subscription patterns per agent, and the
  matcher the event log routes through.

  Matching reads an in-memory copy of every subscription, loaded on
  first use and dropped by every write made through this registry.
  The registry must be the only writer of its repository. Writers
  release their transaction before dropping the copy.
*/
class SubscriptionRegistry {
 public:
  explicit SubscriptionRegistry(std::shared_ptr<db::SubscriptionRepository> repository);

  // Throws util::InvalidArgument for an empty agent id or an all-absent pattern.
  reactor::v1::Subscription Register(const std::string& agent_id, const reactor::v1::SubscriptionPattern& pattern, bool is_default = false);

  /*
    Ensures exactly the two default subscriptions for the agent:
      { to_agent = agent_id }
      { event_types = [ContentChanged], path_glob = file_path }
    Returns the existing rows untouched when they already match,
    otherwise replaces the agent's defaults (the file moved).
  */
  std::vector<reactor::v1::Subscription> RegisterDefaults(const std::string& agent_id, const std::string& file_path);

  bool     Unregister(uint64_t subscription_id);
  uint64_t UnregisterAll(const std::string& agent_id);

  std::vector<reactor::v1::Subscription>   GetSubscriptions(const std::string& agent_id) const;
  std::optional<reactor::v1::Subscription> GetSubscription(uint64_t subscription_id) const;

  // Agents in order of their first matching subscription (ascending id), each once.
  std::vector<std::string> GetMatchingAgents(const reactor::v1::Event& event) const;

  static reactor::v1::SubscriptionPattern DirectMessagePattern(const std::string& agent_id);
  static reactor::v1::SubscriptionPattern FileChangePattern(const std::string& file_path);

 private:
  using Snapshot = std::vector<reactor::v1::Subscription>;

  std::shared_ptr<const Snapshot> LoadSnapshot() const;
  void                            Invalidate();

  std::shared_ptr<db::SubscriptionRepository> repository_;

  std::mutex                              write_mutex_;
  mutable std::mutex                      cache_mutex_;
  mutable std::shared_ptr<const Snapshot> cache_;
};

} // namespace reactor::subscriptions
