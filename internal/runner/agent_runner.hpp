#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/runner/agent_executor.hpp"
#include "internal/runner/cascade_guard.hpp"
#include "internal/runner/turn_queue.hpp"

namespace reactor::events {
class EventLog;
}

namespace reactor::subscriptions {
class SubscriptionRegistry;
}

namespace reactor::agents {
class AgentStateStore;
class SwarmRegistry;
}

namespace reactor::observability {
class EventObserver;
}

namespace reactor::runner {

struct RunnerOptions {
  uint32_t                  max_concurrency   = 4;
  uint32_t                  max_trigger_depth = 5;
  std::chrono::milliseconds trigger_cooldown{1000};
  std::chrono::milliseconds cascade_ttl{300000};
  uint32_t                  chat_history_limit = 10;
  uint32_t                  truncation_limit   = 1024;
};

struct RunnerStats {
  uint64_t received         = 0;
  uint64_t accepted         = 0;
  uint64_t skipped_depth    = 0;
  uint64_t skipped_cooldown = 0;
  uint64_t completed        = 0;
  uint64_t failed           = 0;
  uint64_t cancelled        = 0;
};

/*
  Consumes the event log's trigger channel.

  One dispatch thread pops triggers, gates them through the
  CascadeGuard and queues admitted turns for a fixed pool of
  max_concurrency workers; it never waits for a turn. A finished
  turn posts its depth release back onto the trigger channel, so
  every guard mutation happens on the dispatch thread, after the
  triggers that turn caused.

  Each gate decision and turn outcome is published to the observer
  as a TriggerDecision event. Those are not appended to the log.

  Turn failures become AgentError events; nothing a turn does can
  stop the dispatch loop.
*/
class AgentRunner {
 public:
  AgentRunner(std::shared_ptr<events::EventLog> log, std::shared_ptr<agents::AgentStateStore> states,
              std::shared_ptr<agents::SwarmRegistry> swarm, std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions,
              std::shared_ptr<AgentExecutor> executor, std::shared_ptr<observability::EventObserver> observer, RunnerOptions options);
  ~AgentRunner();

  AgentRunner(const AgentRunner&)            = delete;
  AgentRunner& operator=(const AgentRunner&) = delete;

  // Runs the dispatch loop on a background thread.
  void Start();

  // Runs the dispatch loop on the calling thread until Stop().
  void RunForever();

  /*
    Closes the trigger channel, flags in-flight turns as cancelled,
    cancels queued turns that have not started and joins every
    thread. Idempotent.
  */
  void Stop();

  RunnerStats Stats() const;

  // True once no trigger, release or turn is outstanding. False on timeout.
  bool WaitForIdle(std::chrono::milliseconds timeout);

  const RunnerOptions& Options() const {
    return options_;
  }

 private:
  void StartWorkers();
  void WorkerLoop();
  void Dispatch(events::Trigger trigger);
  void ExecuteTurn(TurnTask& task);
  void FinishTurn(const TurnTask& task, reactor::v1::TriggerOutcome outcome, const std::string& detail);
  void AppendGuarded(reactor::v1::Event event, const TurnTask& task);
  void PublishDecision(const events::Trigger& trigger, reactor::v1::TriggerOutcome outcome, uint32_t depth, const std::string& correlation_id,
                       const std::string& detail);

  std::shared_ptr<events::EventLog>                    log_;
  std::shared_ptr<agents::AgentStateStore>             states_;
  std::shared_ptr<agents::SwarmRegistry>               swarm_;
  std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions_;
  std::shared_ptr<AgentExecutor>                       executor_;
  std::shared_ptr<observability::EventObserver>        observer_;
  RunnerOptions                                        options_;

  CascadeGuard guard_;
  TurnQueue    turns_;

  std::mutex               lifecycle_mutex_;
  std::thread              dispatch_thread_;
  std::vector<std::thread> workers_;
  bool                     started_ = false;
  bool                     stopped_ = false;

  std::atomic<bool>     cancelled_{false};
  std::atomic<uint64_t> outstanding_turns_{0};
  std::atomic<int64_t>  active_turns_{0};
  std::atomic<uint64_t> activity_{0};

  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> skipped_depth_{0};
  std::atomic<uint64_t> skipped_cooldown_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> cancelled_turns_{0};
};

} // namespace reactor::runner
