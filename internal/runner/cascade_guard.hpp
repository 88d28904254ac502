#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "reactor/v1.hpp"

namespace reactor::runner {

using SteadyClock = std::chrono::steady_clock;

struct CascadeLimits {
  uint32_t                  max_depth = 5;
  std::chrono::milliseconds cooldown{1000};
  std::chrono::milliseconds ttl{300000};
};

struct Admission {
  reactor::v1::TriggerOutcome outcome = reactor::v1::TRIGGER_OUTCOME_UNSPECIFIED;
  std::string                 correlation_id;
  uint32_t                    depth   = 0;
  bool                        chained = false;

  bool Accepted() const {
    return outcome == reactor::v1::TRIGGER_OUTCOME_ACCEPTED;
  }
};

/*
  Depth and cooldown gates.

  A trigger whose event has no correlation id is a root: it gets
  "evt-<event id>" and is never depth-gated. A chained trigger is
  skipped when its correlation already has max_depth live turns;
  otherwise the count goes up until Release().

  The cooldown is per agent and measured from the last accepted
  trigger. Skips do not move it.

  Not synchronised. The runner only touches it from its dispatch
  thread.
*/
class CascadeGuard {
 public:
  explicit CascadeGuard(CascadeLimits limits);

  Admission Admit(const std::string& agent_id, const reactor::v1::Event& event, SteadyClock::time_point now);

  void Release(const std::string& correlation_id, SteadyClock::time_point now);

  // Drops depth entries not accepted into or released for ttl, and expired cooldowns.
  std::size_t EvictStale(SteadyClock::time_point now);

  uint32_t    Depth(const std::string& correlation_id) const;
  std::size_t TrackedCorrelations() const {
    return depth_.size();
  }

 private:
  struct DepthEntry {
    uint32_t                live = 0;
    SteadyClock::time_point touched;
  };

  CascadeLimits                                            limits_;
  std::unordered_map<std::string, DepthEntry>              depth_;
  std::unordered_map<std::string, SteadyClock::time_point> last_accept_;
};

std::string CorrelationFor(const reactor::v1::Event& event);

} // namespace reactor::runner
