#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "reactor/v1.hpp"

namespace reactor::events {
class EventLog;
}

namespace reactor::subscriptions {
class SubscriptionRegistry;
}

namespace reactor::agents {

class AgentStateStore;
class SwarmRegistry;

struct ReconcileSummary {
  uint64_t created   = 0;
  uint64_t restored  = 0;
  uint64_t updated   = 0;
  uint64_t orphaned  = 0;
  uint64_t unchanged = 0;
  uint64_t total     = 0;
};

/*
  Aligns the swarm with the units discovery reports.

    new unit               -> state file, default subscriptions, ACTIVE row
    orphan rediscovered    -> same, keeping its saved history
    active unit gone       -> ORPHANED, subscriptions removed
    identity changed       -> row, state and defaults refreshed; one
                              ContentChanged per changed file is appended
                              through the event log

  Running it twice with the same units writes nothing the second time.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<SwarmRegistry> swarm, std::shared_ptr<AgentStateStore> states,
             std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions, std::shared_ptr<events::EventLog> log, std::string swarm_id);

  // Throws util::InvalidArgument on a duplicate or invalid unit id.
  ReconcileSummary Reconcile(const std::vector<reactor::v1::DiscoveredUnit>& units);

 private:
  void EnsureState(const reactor::v1::DiscoveredUnit& unit, bool keep_history);

  std::shared_ptr<SwarmRegistry>                       swarm_;
  std::shared_ptr<AgentStateStore>                     states_;
  std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions_;
  std::shared_ptr<events::EventLog>                    log_;
  std::string                                          swarm_id_;
};

reactor::v1::AgentState InitialState(const reactor::v1::DiscoveredUnit& unit);

} // namespace reactor::agents
