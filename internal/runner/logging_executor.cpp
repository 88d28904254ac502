#include "logging_executor.hpp"

#include "internal/events/event_codec.hpp"
#include "internal/observability/logging.hpp"

namespace reactor::runner {

using observability::StringField;
using observability::UIntField;

TurnResult LoggingExecutor::RunTurn(ExecutionContext& ctx) {
  const auto description = events::Describe(ctx.trigger, 200);

  REACTOR_LOG_INFO("agent turn", {StringField("agent_id", ctx.agent_id), StringField("node_type", ctx.identity.node_type()),
                                  StringField("trigger", description), StringField("correlation_id", ctx.correlation_id),
                                  UIntField("depth", ctx.depth), UIntField("history", ctx.history.size())});

  TurnResult result;
  result.summary = "observed " + description;
  return result;
}

} // namespace reactor::runner
