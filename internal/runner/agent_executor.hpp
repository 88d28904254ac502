#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "reactor/v1.hpp"

namespace reactor::runner {

class SwarmTools;

struct TurnResult {
  std::vector<std::string> changed_artifacts;
  std::string              summary;
  std::string              response;
};

/*
  Everything one turn may look at. The tools and the cancellation
  flag are owned by the runner and outlive the RunTurn call.
*/
struct ExecutionContext {
  std::string                         agent_id;
  reactor::v1::AgentIdentity          identity;
  reactor::v1::Event                  trigger;
  std::string                         correlation_id;
  uint32_t                            depth = 0;
  std::vector<reactor::v1::ChatEntry> history;

  SwarmTools*              tools     = nullptr;
  const std::atomic<bool>* cancelled = nullptr;

  bool Cancelled() const {
    return cancelled != nullptr && cancelled->load();
  }
};

/*
  The reasoning step of a turn. Implementations report failure by
  throwing (util::TurnFailed or any std::exception) and should poll
  ctx.Cancelled() during long work.
*/
class AgentExecutor {
 public:
  virtual ~AgentExecutor() = default;

  virtual TurnResult RunTurn(ExecutionContext& ctx) = 0;
};

} // namespace reactor::runner
