#include "internal/observability/spans.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace reactor::observability {

OtlpConfig ToOtlpConfig(const reactor::runtime::config::RuntimeConfig& config) {
  const auto& section = config.observability();

  OtlpConfig otlp;
  if (!section.service_name().empty()) otlp.service_name = section.service_name();
  otlp.endpoint = section.otlp_endpoint();
  if (section.transport() == reactor::runtime::config::OTLP_TRANSPORT_HTTP) otlp.transport = OtlpTransport::kHttpProtobuf;
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) return config.endpoint;

  const bool traces = signal == OtlpSignal::kTraces;
  for (const char* var : {traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(var); value != nullptr && *value != '\0') return value;
  }

  if (config.transport == OtlpTransport::kGrpc) return "localhost:4317";
  return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace reactor::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

namespace reactor::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_tracer_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kTraces);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::string_view View(std::string_view value) {
  return opentelemetry::nostd::string_view(value.data(), value.size());
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(config), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create({{"service.name", config.service_name}}));

  g_tracer_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracer_provider));
  g_tracer = g_tracer_provider->GetTracer("agent-reactor", "0.1.0");
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const reactor::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }
  return InitializeTracing(ToOtlpConfig(config));
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (!g_tracer_provider) return;
  g_tracer_provider->ForceFlush();
  g_tracer_provider->Shutdown();
  g_tracer_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) return;
  impl_->span  = g_tracer->StartSpan(View(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_->span) impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_->span) impl_->span->SetAttribute(View(key), View(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_->span) impl_->span->SetAttribute(View(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", View(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, View(description));
}

} // namespace reactor::observability

#endif
