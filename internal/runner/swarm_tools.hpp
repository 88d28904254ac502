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
class SwarmRegistry;
}

namespace reactor::runner {

/*
  What an agent can do to the rest of the swarm during one turn.

  Bound to the agent and the turn: every emitted event carries the
  agent as from_agent and the turn's correlation id, so anything it
  triggers is gated as part of the same cascade. Subscribe and
  Unsubscribe also update the AgentState the runner saves at the
  end of the turn.
*/
class SwarmTools {
 public:
  SwarmTools(std::string agent_id, std::string correlation_id, std::string graph_id, reactor::v1::AgentState* state,
             std::shared_ptr<events::EventLog> log, std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions,
             std::shared_ptr<agents::SwarmRegistry> swarm);

  uint64_t Emit(reactor::v1::Event event);

  uint64_t SendMessage(const std::string& to_agent, const std::string& content, const std::vector<std::string>& tags = {});

  /*
    target is one of
      children       agents whose parent is this agent
      siblings       agents sharing this agent's parent
      file:<path>    agents whose file path equals or ends with <path>
    Only active agents, never the sender. Returns the recipients.
  */
  std::vector<std::string> Broadcast(const std::string& target, const std::string& content);

  reactor::v1::Subscription Subscribe(const reactor::v1::SubscriptionPattern& pattern);

  // False when the subscription does not exist. Throws util::InvalidArgument for another agent's or a default one.
  bool Unsubscribe(uint64_t subscription_id);

  // Active agents; every node type when node_type is empty.
  std::vector<reactor::v1::AgentEntry> QueryAgents(const std::string& node_type = {}) const;

  const std::string& AgentId() const {
    return agent_id_;
  }

  const std::string& CorrelationId() const {
    return correlation_id_;
  }

 private:
  std::vector<std::string> ResolveTargets(const std::string& target) const;

  std::string              agent_id_;
  std::string              correlation_id_;
  std::string              graph_id_;
  reactor::v1::AgentState* state_;

  std::shared_ptr<events::EventLog>                    log_;
  std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions_;
  std::shared_ptr<agents::SwarmRegistry>               swarm_;
};

} // namespace reactor::runner
