#include "swarm_tools.hpp"

#include <algorithm>

#include "internal/agents/swarm_registry.hpp"
#include "internal/events/event_builders.hpp"
#include "internal/events/event_log.hpp"
#include "internal/subscriptions/subscription_registry.hpp"
#include "internal/util/errors.hpp"

namespace reactor::runner {

namespace {

constexpr std::string_view kFilePrefix = "file:";

bool PathMatches(const std::string& file_path, const std::string& wanted) {
  if (file_path.empty() || wanted.empty()) return false;
  if (file_path == wanted) return true;
  if (file_path.size() <= wanted.size()) return false;
  return file_path.compare(file_path.size() - wanted.size(), wanted.size(), wanted) == 0 && file_path[file_path.size() - wanted.size() - 1] == '/';
}

} // namespace

SwarmTools::SwarmTools(std::string agent_id, std::string correlation_id, std::string graph_id, reactor::v1::AgentState* state,
                       std::shared_ptr<events::EventLog> log, std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions,
                       std::shared_ptr<agents::SwarmRegistry> swarm)
    : agent_id_(std::move(agent_id)),
      correlation_id_(std::move(correlation_id)),
      graph_id_(std::move(graph_id)),
      state_(state),
      log_(std::move(log)),
      subscriptions_(std::move(subscriptions)),
      swarm_(std::move(swarm)) {
}

uint64_t SwarmTools::Emit(reactor::v1::Event event) {
  event.set_from_agent(agent_id_);
  event.set_correlation_id(correlation_id_);
  if (event.graph_id().empty()) event.set_graph_id(graph_id_);
  return log_->Append(std::move(event));
}

uint64_t SwarmTools::SendMessage(const std::string& to_agent, const std::string& content, const std::vector<std::string>& tags) {
  if (to_agent.empty()) {
    throw util::InvalidArgument("send message: recipient is empty");
  }
  return Emit(events::AgentMessageEvent(agent_id_, to_agent, content, tags));
}

std::vector<std::string> SwarmTools::Broadcast(const std::string& target, const std::string& content) {
  auto recipients = ResolveTargets(target);
  for (const auto& to_agent : recipients) SendMessage(to_agent, content);
  return recipients;
}

std::vector<std::string> SwarmTools::ResolveTargets(const std::string& target) const {
  const auto active = QueryAgents();

  std::string parent_id;
  if (state_ != nullptr) parent_id = state_->identity().parent_id();

  std::vector<std::string> out;
  if (target == "children") {
    for (const auto& entry : active) {
      if (entry.identity().parent_id() == agent_id_ && entry.agent_id() != agent_id_) out.push_back(entry.agent_id());
    }
    return out;
  }

  if (target == "siblings") {
    if (parent_id.empty()) {
      throw util::InvalidState("broadcast siblings: " + agent_id_ + " has no parent");
    }
    for (const auto& entry : active) {
      if (entry.identity().parent_id() == parent_id && entry.agent_id() != agent_id_) out.push_back(entry.agent_id());
    }
    return out;
  }

  if (target.rfind(kFilePrefix, 0) == 0) {
    const auto path = target.substr(kFilePrefix.size());
    if (path.empty()) {
      throw util::InvalidArgument("broadcast: empty file target");
    }
    for (const auto& entry : active) {
      if (entry.agent_id() != agent_id_ && PathMatches(entry.identity().file_path(), path)) out.push_back(entry.agent_id());
    }
    return out;
  }

  throw util::InvalidArgument("broadcast: unknown target '" + target + "'");
}

reactor::v1::Subscription SwarmTools::Subscribe(const reactor::v1::SubscriptionPattern& pattern) {
  auto subscription = subscriptions_->Register(agent_id_, pattern, false);

  if (state_ != nullptr) {
    auto* custom = state_->add_custom_subscriptions();
    custom->set_subscription_id(subscription.id());
    *custom->mutable_pattern() = subscription.pattern();
  }
  return subscription;
}

bool SwarmTools::Unsubscribe(uint64_t subscription_id) {
  auto existing = subscriptions_->GetSubscription(subscription_id);
  if (!existing) return false;

  if (existing->agent_id() != agent_id_) {
    throw util::InvalidArgument("unsubscribe: subscription " + std::to_string(subscription_id) + " belongs to another agent");
  }
  if (existing->is_default()) {
    throw util::InvalidArgument("unsubscribe: subscription " + std::to_string(subscription_id) + " is a default subscription");
  }

  const bool removed = subscriptions_->Unregister(subscription_id);

  if (state_ != nullptr) {
    auto* custom = state_->mutable_custom_subscriptions();
    custom->erase(std::remove_if(custom->begin(), custom->end(),
                                 [&](const reactor::v1::CustomSubscription& c) { return c.subscription_id() == subscription_id; }),
                  custom->end());
  }
  return removed;
}

std::vector<reactor::v1::AgentEntry> SwarmTools::QueryAgents(const std::string& node_type) const {
  auto active = swarm_->List(reactor::v1::AGENT_STATUS_ACTIVE);
  if (node_type.empty()) return active;

  std::vector<reactor::v1::AgentEntry> out;
  for (auto& entry : active) {
    if (entry.identity().node_type() == node_type) out.push_back(std::move(entry));
  }
  return out;
}

} // namespace reactor::runner
