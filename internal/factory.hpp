#pragma once

#include <memory>
#include <optional>

#include "config/config.pb.h"

#include "internal/agents/agent_state_store.hpp"
#include "internal/agents/discovery_source.hpp"
#include "internal/agents/reconciler.hpp"
#include "internal/agents/swarm_registry.hpp"
#include "internal/events/event_log.hpp"
#include "internal/observability/event_observer.hpp"
#include "internal/runner/agent_runner.hpp"
#include "internal/subscriptions/subscription_registry.hpp"

namespace reactor::factory {

/*
  Runtime

  Owns all long-lived components of one reactor. Everything here
  lives until Shutdown().
*/
struct Runtime {
  std::shared_ptr<db::EventRepository>        event_repository;
  std::shared_ptr<db::SubscriptionRepository> subscription_repository;
  std::shared_ptr<db::AgentRepository>        agent_repository;

  std::shared_ptr<subscriptions::SubscriptionRegistry> subscriptions;
  std::shared_ptr<events::EventLog>                    log;
  std::shared_ptr<agents::AgentStateStore>             states;
  std::shared_ptr<agents::SwarmRegistry>               swarm;
  std::shared_ptr<agents::Reconciler>                  reconciler;
  std::shared_ptr<runner::AgentRunner>                 runner;

  /*
    Starts the runner, then reconciles the swarm against discovery
    (skipped when discovery is null).

    The order is fixed: reconciliation appends ContentChanged events, and
    an append blocks while the trigger channel is full, which it stays
    until the runner's dispatch loop consumes it.
  */
  std::optional<agents::ReconcileSummary> Start(agents::DiscoverySource* discovery);

  // Stops the runner, then closes the log. Idempotent.
  void Shutdown();
};

// Runner limits with unset or zero fields replaced by their defaults.
runner::RunnerOptions ResolveRunnerOptions(const reactor::runtime::config::RunnerConfig& config);

/*
  Build

  Composition root. The only place that knows concrete storage
  types. Opens (and migrates) the stores under storage.root, which
  defaults to ".reactor".
*/
// ManifestDiscovery for discovery.manifest_path, or null when none is configured.
std::shared_ptr<agents::DiscoverySource> MakeDiscovery(const reactor::runtime::config::RuntimeConfig& config);

Runtime Build(const reactor::runtime::config::RuntimeConfig& config, std::shared_ptr<runner::AgentExecutor> executor,
              std::shared_ptr<observability::EventObserver> observer = nullptr);

} // namespace reactor::factory
