#include "agent_runner.hpp"

#include <algorithm>

#include "internal/agents/agent_state_store.hpp"
#include "internal/events/event_builders.hpp"
#include "internal/events/event_codec.hpp"
#include "internal/events/event_log.hpp"
#include "internal/observability/event_observer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runner/swarm_tools.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reactor::runner {

using observability::DurationField;
using observability::IntField;
using observability::StringField;
using observability::UIntField;
using reactor::v1::TriggerOutcome;

namespace {

CascadeLimits LimitsFrom(const RunnerOptions& options) {
  CascadeLimits limits;
  limits.max_depth = options.max_trigger_depth;
  limits.cooldown  = options.trigger_cooldown;
  limits.ttl       = options.cascade_ttl;
  return limits;
}

void AddHistory(reactor::v1::AgentState& state, const std::string& role, std::string content, uint64_t event_id, uint32_t limit) {
  auto* entry = state.add_chat_history();
  entry->set_role(role);
  entry->set_content(std::move(content));
  entry->set_event_id(event_id);
  *entry->mutable_at() = util::NowTimestamp();

  auto* history = state.mutable_chat_history();
  if (static_cast<uint32_t>(history->size()) > limit) {
    history->DeleteSubrange(0, history->size() - static_cast<int>(limit));
  }
}

std::vector<reactor::v1::ChatEntry> RecentHistory(const reactor::v1::AgentState& state, uint32_t limit) {
  const auto& history = state.chat_history();
  const int   start   = std::max(0, history.size() - static_cast<int>(limit));
  return std::vector<reactor::v1::ChatEntry>(history.begin() + start, history.end());
}

} // namespace

AgentRunner::AgentRunner(std::shared_ptr<events::EventLog> log, std::shared_ptr<agents::AgentStateStore> states,
                         std::shared_ptr<agents::SwarmRegistry> swarm, std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions,
                         std::shared_ptr<AgentExecutor> executor, std::shared_ptr<observability::EventObserver> observer, RunnerOptions options)
    : log_(std::move(log)),
      states_(std::move(states)),
      swarm_(std::move(swarm)),
      subscriptions_(std::move(subscriptions)),
      executor_(std::move(executor)),
      observer_(std::move(observer)),
      options_(options),
      guard_(LimitsFrom(options)) {
  if (options_.max_concurrency == 0) options_.max_concurrency = 1;
}

AgentRunner::~AgentRunner() {
  {
    // the trigger channel belongs to the log too; a runner that never ran leaves it open
    std::lock_guard lock(lifecycle_mutex_);
    if (!started_) return;
  }
  Stop();
}

void AgentRunner::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (started_ || stopped_) {
    throw util::InvalidState("agent runner already started or stopped");
  }
  started_         = true;
  dispatch_thread_ = std::thread(&AgentRunner::RunForever, this);
}

void AgentRunner::StartWorkers() {
  std::lock_guard lock(lifecycle_mutex_);
  if (stopped_ || !workers_.empty()) return;

  started_ = true;
  for (uint32_t i = 0; i < options_.max_concurrency; ++i) {
    workers_.emplace_back(&AgentRunner::WorkerLoop, this);
  }
  REACTOR_LOG_INFO("agent runner started", {UIntField("workers", options_.max_concurrency), UIntField("max_trigger_depth", options_.max_trigger_depth),
                                            IntField("trigger_cooldown_ms", options_.trigger_cooldown.count())});
}

void AgentRunner::RunForever() {
  StartWorkers();

  auto& channel = log_->Triggers();
  while (auto item = channel.Pop()) {
    if (auto* task = std::get_if<events::ChannelTask>(&*item)) {
      try {
        (*task)();
      } catch (const std::exception& e) {
        REACTOR_LOG_ERROR("runner bookkeeping task failed", {StringField("error", e.what())});
      }
    } else {
      Dispatch(std::move(std::get<events::Trigger>(*item)));
    }
    ++activity_;
    channel.TaskDone();
  }
}

void AgentRunner::Dispatch(events::Trigger trigger) {
  ++received_;
  REACTOR_LOG_DEBUG("trigger received", {StringField("agent_id", trigger.agent_id), UIntField("event_id", trigger.event_id),
                                         StringField("event_type", events::EventTypeName(trigger.event))});

  if (cancelled_) {
    ++cancelled_turns_;
    PublishDecision(trigger, reactor::v1::TRIGGER_OUTCOME_CANCELLED, 0, CorrelationFor(trigger.event), "runner stopping");
    return;
  }

  observability::Metrics::Instance().SetTriggerBacklog(static_cast<std::int64_t>(log_->Triggers().Pending()));

  const auto now = SteadyClock::now();
  guard_.EvictStale(now);

  auto admission = guard_.Admit(trigger.agent_id, trigger.event, now);
  switch (admission.outcome) {
    case reactor::v1::TRIGGER_OUTCOME_SKIPPED_DEPTH: {
      ++skipped_depth_;
      const auto detail = "cascade depth " + std::to_string(admission.depth) + " reached limit " + std::to_string(options_.max_trigger_depth);
      REACTOR_LOG_WARN("trigger skipped", {StringField("agent_id", trigger.agent_id), UIntField("event_id", trigger.event_id),
                                           StringField("correlation_id", admission.correlation_id), StringField("reason", detail)});
      PublishDecision(trigger, admission.outcome, admission.depth, admission.correlation_id, detail);
      return;
    }
    case reactor::v1::TRIGGER_OUTCOME_SKIPPED_COOLDOWN:
      ++skipped_cooldown_;
      PublishDecision(trigger, admission.outcome, admission.depth, admission.correlation_id, "agent in cooldown");
      return;
    default:
      break;
  }

  ++accepted_;
  PublishDecision(trigger, admission.outcome, admission.depth, admission.correlation_id, {});

  TurnTask task;
  task.correlation_id = admission.correlation_id;
  task.depth          = admission.depth;
  task.chained        = admission.chained;
  task.accepted_at    = now;
  task.trigger        = std::move(trigger);

  ++outstanding_turns_;
  turns_.Enqueue(std::move(task));
}

void AgentRunner::WorkerLoop() {
  while (auto task = turns_.Dequeue()) {
    if (cancelled_) {
      FinishTurn(*task, reactor::v1::TRIGGER_OUTCOME_CANCELLED, "runner stopping");
      continue;
    }
    ExecuteTurn(*task);
  }
}

void AgentRunner::ExecuteTurn(TurnTask& task) {
  const auto& agent_id = task.trigger.agent_id;

  observability::SpanScope span("AgentRunner.Turn");
  span.SetAttribute("agent.id", agent_id);
  span.SetAttribute("trigger.event_id", static_cast<std::int64_t>(task.trigger.event_id));
  span.SetAttribute("cascade.depth", static_cast<std::int64_t>(task.depth));
  span.SetAttribute("cascade.correlation_id", task.correlation_id);

  observability::Metrics::Instance().SetActiveTurns(++active_turns_);

  auto finish = [&](TriggerOutcome outcome, const std::string& detail) {
    observability::Metrics::Instance().SetActiveTurns(--active_turns_);
    FinishTurn(task, outcome, detail);
  };

  std::optional<reactor::v1::AgentState> state;
  try {
    state = states_->Load(agent_id);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    AppendGuarded(events::AgentErrorEvent(agent_id, std::string("load agent state: ") + e.what()), task);
    finish(reactor::v1::TRIGGER_OUTCOME_FAILED, e.what());
    return;
  }
  if (!state) {
    AppendGuarded(events::AgentErrorEvent(agent_id, "agent state not found"), task);
    finish(reactor::v1::TRIGGER_OUTCOME_FAILED, "agent state not found");
    return;
  }

  AppendGuarded(events::AgentStartEvent(agent_id, state->identity().node_type()), task);

  SwarmTools tools(agent_id, task.correlation_id, task.trigger.event.graph_id(), &*state, log_, subscriptions_, swarm_);

  ExecutionContext ctx;
  ctx.agent_id       = agent_id;
  ctx.identity       = state->identity();
  ctx.trigger        = task.trigger.event;
  ctx.correlation_id = task.correlation_id;
  ctx.depth          = task.depth;
  ctx.history        = RecentHistory(*state, options_.chat_history_limit);
  ctx.tools          = &tools;
  ctx.cancelled      = &cancelled_;

  const auto limit = options_.truncation_limit;

  std::optional<TurnResult> result;
  std::string               error;
  try {
    result = executor_->RunTurn(ctx);
  } catch (const std::exception& e) {
    error = e.what();
    if (error.empty()) error = "turn failed";
  }

  state->set_last_event_id(task.trigger.event_id);
  state->set_turn_count(state->turn_count() + 1);
  AddHistory(*state, "user", events::Describe(task.trigger.event, limit), task.trigger.event_id, options_.chat_history_limit);

  if (result) {
    const auto& reply = result->response.empty() ? result->summary : result->response;
    AddHistory(*state, "assistant", events::Truncate(reply, limit), task.trigger.event_id, options_.chat_history_limit);
    state->clear_last_error();
  } else {
    AddHistory(*state, "error", events::Truncate(error, limit), task.trigger.event_id, options_.chat_history_limit);
    state->set_last_error(error);
  }

  try {
    states_->Save(*state);
  } catch (const std::exception& e) {
    REACTOR_LOG_ERROR("agent state save failed", {StringField("agent_id", agent_id), StringField("error", e.what())});
    if (result) {
      result.reset();
      error = std::string("save agent state: ") + e.what();
    }
  }

  if (result) {
    AppendGuarded(events::AgentCompleteEvent(agent_id, events::Truncate(result->summary, limit), events::Truncate(result->response, limit),
                                             result->changed_artifacts),
                  task);
    finish(reactor::v1::TRIGGER_OUTCOME_COMPLETED, result->summary);
    return;
  }

  span.RecordException(error);
  REACTOR_LOG_WARN("agent turn failed", {StringField("agent_id", agent_id), UIntField("event_id", task.trigger.event_id), StringField("error", error)});
  AppendGuarded(events::AgentErrorEvent(agent_id, events::Truncate(error, limit)), task);
  finish(ctx.Cancelled() ? reactor::v1::TRIGGER_OUTCOME_CANCELLED : reactor::v1::TRIGGER_OUTCOME_FAILED, error);
}

void AgentRunner::FinishTurn(const TurnTask& task, TriggerOutcome outcome, const std::string& detail) {
  switch (outcome) {
    case reactor::v1::TRIGGER_OUTCOME_COMPLETED:
      ++completed_;
      break;
    case reactor::v1::TRIGGER_OUTCOME_CANCELLED:
      ++cancelled_turns_;
      break;
    default:
      ++failed_;
      break;
  }

  const auto elapsed = SteadyClock::now() - task.accepted_at;
  observability::Metrics::Instance().ObserveTurnDurationMs(reactor::v1::TriggerOutcome_Name(outcome),
                                                          std::chrono::duration<double, std::milli>(elapsed).count());
  REACTOR_LOG_DEBUG("turn finished", {StringField("agent_id", task.trigger.agent_id), StringField("outcome", reactor::v1::TriggerOutcome_Name(outcome)),
                                      UIntField("depth", task.depth), DurationField("elapsed", elapsed)});
  PublishDecision(task.trigger, outcome, task.depth, task.correlation_id, detail);

  if (task.chained) {
    const auto correlation_id = task.correlation_id;
    try {
      log_->Triggers().Post([this, correlation_id] { guard_.Release(correlation_id, SteadyClock::now()); });
    } catch (const util::ChannelClosed&) {
      // Stopped: the dispatch loop and its depth table are gone.
    }
  }

  --outstanding_turns_;
  ++activity_;
}

void AgentRunner::AppendGuarded(reactor::v1::Event event, const TurnTask& task) {
  event.set_correlation_id(task.correlation_id);
  if (event.graph_id().empty()) event.set_graph_id(task.trigger.event.graph_id());

  try {
    log_->Append(std::move(event));
  } catch (const std::exception& e) {
    REACTOR_LOG_ERROR("runner event append failed", {StringField("agent_id", task.trigger.agent_id), StringField("error", e.what())});
  }
}

void AgentRunner::PublishDecision(const events::Trigger& trigger, TriggerOutcome outcome, uint32_t depth, const std::string& correlation_id,
                                  const std::string& detail) {
  observability::Metrics::Instance().RecordTriggerOutcome(reactor::v1::TriggerOutcome_Name(outcome));
  if (!observer_) return;

  auto event = events::TriggerDecisionEvent(trigger.agent_id, trigger.event_id, outcome, depth, correlation_id, detail);
  event.set_graph_id(trigger.event.graph_id());
  *event.mutable_created_at() = util::NowTimestamp();

  try {
    observer_->Publish(event);
  } catch (const std::exception& e) {
    REACTOR_LOG_WARN("trigger decision publish failed", {StringField("agent_id", trigger.agent_id), StringField("error", e.what())});
  }
}

void AgentRunner::Stop() {
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (stopped_) return;
    stopped_ = true;
  }

  cancelled_ = true;
  log_->Triggers().Close();

  if (dispatch_thread_.joinable()) dispatch_thread_.join();

  for (auto& task : turns_.Drain()) FinishTurn(task, reactor::v1::TRIGGER_OUTCOME_CANCELLED, "runner stopped");
  turns_.Shutdown();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }

  observability::Metrics::Instance().SetActiveTurns(0);

  const auto stats = Stats();
  REACTOR_LOG_INFO("agent runner stopped", {UIntField("received", stats.received), UIntField("completed", stats.completed),
                                            UIntField("failed", stats.failed), UIntField("cancelled", stats.cancelled)});
}

RunnerStats AgentRunner::Stats() const {
  RunnerStats stats;
  stats.received         = received_;
  stats.accepted         = accepted_;
  stats.skipped_depth    = skipped_depth_;
  stats.skipped_cooldown = skipped_cooldown_;
  stats.completed        = completed_;
  stats.failed           = failed_;
  stats.cancelled        = cancelled_turns_;
  return stats;
}

bool AgentRunner::WaitForIdle(std::chrono::milliseconds timeout) {
  const auto deadline = SteadyClock::now() + timeout;
  auto&      channel  = log_->Triggers();

  for (;;) {
    const auto before  = activity_.load();
    const bool idle    = channel.Pending() == 0 && outstanding_turns_ == 0;
    const bool settled = before == activity_.load();
    if (idle && settled) return true;

    if (SteadyClock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

} // namespace reactor::runner
