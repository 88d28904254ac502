#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace reactor::runtime::config {
class RuntimeConfig;
}

namespace reactor::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"agent-reactor"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ToOtlpConfig(const reactor::runtime::config::RuntimeConfig& config);

/*
  Collector endpoint for one signal. The configured endpoint wins, then
  OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the local collector default for the transport.
*/
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const reactor::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const reactor::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the current scope: an event append or an agent turn.
// Inert when tracing is off.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Marks the span failed and attaches the message as an exception event.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments. Every call is a no-op until
  InitializeMetrics() installs a provider, and always without
  ENABLE_OTEL.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordEventAppended(std::string_view event_type, bool success);
  void RecordTriggerOutcome(std::string_view outcome);
  void ObserveTurnDurationMs(std::string_view outcome, double duration_ms);
  void RecordReconciled(std::string_view change, std::uint64_t count);
  void SetActiveTurns(std::int64_t active);
  void SetTriggerBacklog(std::int64_t pending);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const reactor::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const reactor::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordEventAppended(std::string_view, bool) {
}

inline void Metrics::RecordTriggerOutcome(std::string_view) {
}

inline void Metrics::ObserveTurnDurationMs(std::string_view, double) {
}

inline void Metrics::RecordReconciled(std::string_view, std::uint64_t) {
}

inline void Metrics::SetActiveTurns(std::int64_t) {
}

inline void Metrics::SetTriggerBacklog(std::int64_t) {
}
#endif

} // namespace reactor::observability
