#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace reactor::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

opentelemetry::nostd::string_view View(std::string_view value) {
  return opentelemetry::nostd::string_view(value.data(), value.size());
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> events_appended;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> trigger_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      turn_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reconciled_agents;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   active_turns_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   trigger_backlog_gauge;

  std::atomic<std::int64_t> active_turns{0};
  std::atomic<std::int64_t> trigger_backlog{0};
};

bool InitializeMetrics(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto res   = resource::Resource::Create({{"service.name", config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const reactor::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return InitializeMetrics(ToOtlpConfig(config));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("agent-reactor", "0.1.0");

  impl_->events_appended    = impl_->meter->CreateUInt64Counter("reactor.events.appended", "1", "Events appended to the log");
  impl_->trigger_outcomes   = impl_->meter->CreateUInt64Counter("reactor.triggers", "1", "Trigger gate and turn outcomes");
  impl_->turn_duration_ms   = impl_->meter->CreateDoubleHistogram("reactor.turn.duration_ms", "ms", "Agent turn duration in milliseconds");
  impl_->reconciled_agents  = impl_->meter->CreateUInt64Counter("reactor.swarm.reconciled", "1", "Agents touched by reconciliation, by change");

  impl_->active_turns_gauge = impl_->meter->CreateInt64ObservableGauge("reactor.turns.active", "Turns currently executing", "1");
  impl_->active_turns_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->active_turns.load());
      },
      impl_.get());

  impl_->trigger_backlog_gauge = impl_->meter->CreateInt64ObservableGauge("reactor.triggers.pending", "Triggers waiting for dispatch", "1");
  impl_->trigger_backlog_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->trigger_backlog.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordEventAppended(std::string_view event_type, bool success) {
  if (!impl_ || !impl_->events_appended) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"event_type", View(event_type)}, {"success", success}};
  AddWithAttributes(impl_->events_appended, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTriggerOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->trigger_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", View(outcome)}};
  AddWithAttributes(impl_->trigger_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveTurnDurationMs(std::string_view outcome, double duration_ms) {
  if (!impl_ || !impl_->turn_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", View(outcome)}};
  RecordWithAttributes(impl_->turn_duration_ms, duration_ms, attributes);
}

void Metrics::RecordReconciled(std::string_view change, std::uint64_t count) {
  if (!impl_ || !impl_->reconciled_agents || count == 0) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"change", View(change)}};
  AddWithAttributes(impl_->reconciled_agents, count, attributes);
}

void Metrics::SetActiveTurns(std::int64_t active) {
  if (impl_) {
    impl_->active_turns.store(active);
  }
}

void Metrics::SetTriggerBacklog(std::int64_t pending) {
  if (impl_) {
    impl_->trigger_backlog.store(pending);
  }
}

} // namespace reactor::observability

#endif
