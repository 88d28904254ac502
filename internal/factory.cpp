#include "factory.hpp"

#include <filesystem>
#include <string>

#include "internal/agents/manifest_discovery.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/events/trigger_channel.hpp"
#include "internal/observability/logging.hpp"

namespace reactor::factory {

using observability::StringField;
using observability::UIntField;

namespace {

constexpr const char* kDefaultRoot      = ".reactor";
constexpr const char* kDefaultSwarmId   = "swarm";
constexpr uint32_t    kDefaultQueueSize = 1024;

std::filesystem::path StorageRoot(const reactor::runtime::config::RuntimeConfig& config) {
  const auto& root = config.storage().root();
  return root.empty() ? std::filesystem::path(kDefaultRoot) : std::filesystem::path(root);
}

void BuildRepositories(const reactor::runtime::config::RuntimeConfig& config, const std::filesystem::path& root, Runtime& rt) {
  const auto& storage = config.storage();

  if (storage.has_memory()) {
    rt.event_repository        = std::make_shared<db::memory::MemoryRepository>();
    rt.subscription_repository = std::make_shared<db::memory::MemoryRepository>();
    rt.agent_repository        = std::make_shared<db::memory::MemoryRepository>();
    REACTOR_LOG_INFO("storage opened", {StringField("backend", "memory")});
    return;
  }

  db::sqlite::SqliteOptions options;
  if (storage.has_sqlite()) {
    options.synchronous_full = storage.sqlite().synchronous_full();
    if (storage.sqlite().busy_timeout_ms() != 0) options.busy_timeout_ms = static_cast<int>(storage.sqlite().busy_timeout_ms());
  }

  auto events_db        = std::make_shared<db::sqlite::SqliteDB>((root / "events.db").string(), options);
  auto subscriptions_db = std::make_shared<db::sqlite::SqliteDB>((root / "subscriptions.db").string(), options);
  auto swarm_db         = std::make_shared<db::sqlite::SqliteDB>((root / "swarm.db").string(), options);

  db::sqlite::MigrateEventStore(events_db);
  db::sqlite::MigrateSubscriptionStore(subscriptions_db);
  db::sqlite::MigrateSwarmStore(swarm_db);

  rt.event_repository        = std::make_shared<db::sqlite::SqliteEventRepository>(std::move(events_db));
  rt.subscription_repository = std::make_shared<db::sqlite::SqliteSubscriptionRepository>(std::move(subscriptions_db));
  rt.agent_repository        = std::make_shared<db::sqlite::SqliteAgentRepository>(std::move(swarm_db));
  REACTOR_LOG_INFO("storage opened", {StringField("backend", "sqlite"), StringField("root", root.string())});
}

} // namespace

runner::RunnerOptions ResolveRunnerOptions(const reactor::runtime::config::RunnerConfig& config) {
  runner::RunnerOptions options;
  if (config.max_concurrency() != 0) options.max_concurrency = config.max_concurrency();
  if (config.has_max_trigger_depth()) options.max_trigger_depth = config.max_trigger_depth();
  if (config.has_trigger_cooldown_ms()) options.trigger_cooldown = std::chrono::milliseconds(config.trigger_cooldown_ms());
  if (config.cascade_ttl_ms() != 0) options.cascade_ttl = std::chrono::milliseconds(config.cascade_ttl_ms());
  if (config.chat_history_limit() != 0) options.chat_history_limit = config.chat_history_limit();
  if (config.truncation_limit() != 0) options.truncation_limit = config.truncation_limit();
  return options;
}

Runtime Build(const reactor::runtime::config::RuntimeConfig& config, std::shared_ptr<runner::AgentExecutor> executor,
              std::shared_ptr<observability::EventObserver> observer) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  const auto root = StorageRoot(config);
  std::filesystem::create_directories(root);
  BuildRepositories(config, root, rt);

  // ------------------------------------------------------------------
  // Event log and routing
  // ------------------------------------------------------------------
  const auto& runner_config  = config.runner();
  const auto  queue_capacity = runner_config.trigger_queue_capacity() != 0 ? runner_config.trigger_queue_capacity() : kDefaultQueueSize;
  const auto  swarm_id       = runner_config.swarm_id().empty() ? std::string(kDefaultSwarmId) : runner_config.swarm_id();

  auto triggers    = std::make_shared<events::TriggerChannel>(queue_capacity);
  rt.subscriptions = std::make_shared<subscriptions::SubscriptionRegistry>(rt.subscription_repository);
  rt.log           = std::make_shared<events::EventLog>(rt.event_repository, rt.subscriptions, std::move(triggers), observer);

  // ------------------------------------------------------------------
  // Swarm
  // ------------------------------------------------------------------
  rt.states     = std::make_shared<agents::AgentStateStore>(agents::AgentLayout(root));
  rt.swarm      = std::make_shared<agents::SwarmRegistry>(rt.agent_repository);
  rt.reconciler = std::make_shared<agents::Reconciler>(rt.swarm, rt.states, rt.subscriptions, rt.log, swarm_id);

  // ------------------------------------------------------------------
  // Runner
  // ------------------------------------------------------------------
  const auto options = ResolveRunnerOptions(runner_config);
  rt.runner = std::make_shared<runner::AgentRunner>(rt.log, rt.states, rt.swarm, rt.subscriptions, std::move(executor), std::move(observer), options);

  REACTOR_LOG_INFO("runtime built", {StringField("swarm_id", swarm_id), UIntField("last_event_id", rt.log->LastEventId()),
                                     UIntField("trigger_queue_capacity", queue_capacity)});
  return rt;
}

std::shared_ptr<agents::DiscoverySource> MakeDiscovery(const reactor::runtime::config::RuntimeConfig& config) {
  const auto& path = config.discovery().manifest_path();
  if (path.empty()) return nullptr;
  return std::make_shared<agents::ManifestDiscovery>(path);
}

std::optional<agents::ReconcileSummary> Runtime::Start(agents::DiscoverySource* discovery) {
  runner->Start();
  if (discovery == nullptr) {
    REACTOR_LOG_WARN("no discovery source configured; keeping the stored swarm as is");
    return std::nullopt;
  }
  return reconciler->Reconcile(discovery->Discover());
}

void Runtime::Shutdown() {
  if (runner) runner->Stop();
  if (log) log->Close();
}

} // namespace reactor::factory
