#include "cascade_guard.hpp"

namespace reactor::runner {

std::string CorrelationFor(const reactor::v1::Event& event) {
  if (!event.correlation_id().empty()) return event.correlation_id();
  return "evt-" + std::to_string(event.id());
}

CascadeGuard::CascadeGuard(CascadeLimits limits) : limits_(limits) {
}

Admission CascadeGuard::Admit(const std::string& agent_id, const reactor::v1::Event& event, SteadyClock::time_point now) {
  Admission admission;
  admission.correlation_id = CorrelationFor(event);
  admission.chained        = !event.correlation_id().empty();

  DepthEntry* entry = nullptr;
  if (admission.chained) {
    entry           = &depth_[admission.correlation_id];
    admission.depth = entry->live;
    if (entry->live >= limits_.max_depth) {
      if (entry->live == 0) depth_.erase(admission.correlation_id);
      admission.outcome = reactor::v1::TRIGGER_OUTCOME_SKIPPED_DEPTH;
      return admission;
    }
  }

  if (limits_.cooldown.count() > 0) {
    auto it = last_accept_.find(agent_id);
    if (it != last_accept_.end() && now - it->second < limits_.cooldown) {
      if (entry != nullptr && entry->live == 0) depth_.erase(admission.correlation_id);
      admission.outcome = reactor::v1::TRIGGER_OUTCOME_SKIPPED_COOLDOWN;
      return admission;
    }
  }

  last_accept_[agent_id] = now;
  if (entry != nullptr) {
    ++entry->live;
    entry->touched = now;
    admission.depth = entry->live;
  }
  admission.outcome = reactor::v1::TRIGGER_OUTCOME_ACCEPTED;
  return admission;
}

void CascadeGuard::Release(const std::string& correlation_id, SteadyClock::time_point now) {
  auto it = depth_.find(correlation_id);
  if (it == depth_.end()) return;

  if (it->second.live > 0) --it->second.live;
  it->second.touched = now;
  if (it->second.live == 0) depth_.erase(it);
}

std::size_t CascadeGuard::EvictStale(SteadyClock::time_point now) {
  std::size_t evicted = 0;

  for (auto it = depth_.begin(); it != depth_.end();) {
    if (now - it->second.touched >= limits_.ttl) {
      it = depth_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }

  for (auto it = last_accept_.begin(); it != last_accept_.end();) {
    if (now - it->second >= limits_.cooldown) {
      it = last_accept_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}

uint32_t CascadeGuard::Depth(const std::string& correlation_id) const {
  auto it = depth_.find(correlation_id);
  return it == depth_.end() ? 0 : it->second.live;
}

} // namespace reactor::runner
