#pragma once

#include "internal/runner/agent_executor.hpp"

namespace reactor::runner {

/*
  Executor that only records what it was asked to do. Used by the
  standalone binary until a reasoning backend is attached.
*/
class LoggingExecutor : public AgentExecutor {
 public:
  TurnResult RunTurn(ExecutionContext& ctx) override;
};

} // namespace reactor::runner
