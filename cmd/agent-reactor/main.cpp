#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/event_broadcaster.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runner/logging_executor.hpp"

using reactor::observability::StringField;
using reactor::observability::UIntField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: agent-reactor <config.yaml> OR agent-reactor --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = reactor::config::ConfigLoader::LoadFromYaml(config_path);

    reactor::observability::InitializeTracing(config);
    reactor::observability::InitializeMetrics(config);
    reactor::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Observer bus, then the runtime that publishes to it
    // ------------------------------------------------------------
    const auto capacity    = config.observer().stream_capacity() != 0 ? config.observer().stream_capacity() : 256;
    auto       broadcaster = std::make_shared<reactor::observability::EventBroadcaster>(capacity);
    broadcaster->Open();

    auto runtime = reactor::factory::Build(config, std::make_shared<reactor::runner::LoggingExecutor>(), broadcaster);

    // Register signal handlers before starting the runner to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto discovery = reactor::factory::MakeDiscovery(config);
    auto reconciled = runtime.Start(discovery.get());
    REACTOR_LOG_INFO("agent reactor started", {StringField("config", config_path), UIntField("last_event_id", runtime.log->LastEventId()),
                                               UIntField("agents", reconciled ? reconciled->total : runtime.swarm->List().size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    REACTOR_LOG_INFO("Shutting down agent reactor");

    runtime.Shutdown();
    broadcaster->Close();

    reactor::observability::ShutdownLogging();
    reactor::observability::ShutdownMetrics();
    reactor::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    REACTOR_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    reactor::observability::ShutdownLogging();
    reactor::observability::ShutdownMetrics();
    reactor::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
