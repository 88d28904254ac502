#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/observability/spans.hpp"

namespace {

using reactor::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "agent_reactor_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(storage:
  root: "/tmp/reactor"
  sqlite:
    synchronous_full: true
    busy_timeout_ms: 750
runner:
  max_concurrency: 8
  max_trigger_depth: 3
  trigger_cooldown_ms: 250
  swarm_id: "demo"
observer:
  stream_capacity: 16
logging:
  level: "debug"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().root() == "/tmp/reactor");
  assert(config.storage().has_sqlite());
  assert(config.storage().sqlite().synchronous_full());
  assert(config.storage().sqlite().busy_timeout_ms() == 750);
  assert(config.runner().max_concurrency() == 8);
  assert(config.runner().has_max_trigger_depth());
  assert(config.runner().max_trigger_depth() == 3);
  assert(config.runner().trigger_cooldown_ms() == 250);
  assert(config.runner().swarm_id() == "demo");
  assert(config.observer().stream_capacity() == 16);
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromYamlString(R"(storage:
  root: "C:\\reactor\\\"quoted\"\\state"
)");
  assert(config.storage().root() == "C:\\reactor\\\"quoted\"\\state");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(runner:
  swarm_id: "123"
)");
  assert(config.runner().swarm_id() == "123");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(runner:
  max_concurrency: 2
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOutOfRangeLimitsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("runner:\n  max_concurrency: 5000\n");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentGivesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.runner().has_max_trigger_depth());

  auto options = reactor::factory::ResolveRunnerOptions(config.runner());
  assert(options.max_concurrency == 4);
  assert(options.max_trigger_depth == 5);
  assert(options.trigger_cooldown.count() == 1000);
  assert(options.cascade_ttl.count() == 300000);
  assert(options.chat_history_limit == 10);
  assert(options.truncation_limit == 1024);
}

void TestExplicitZeroDepthAndCooldownAreKept() {
  auto config  = ConfigLoader::LoadFromYamlString("runner:\n  max_trigger_depth: 0\n  trigger_cooldown_ms: 0\n");
  auto options = reactor::factory::ResolveRunnerOptions(config.runner());
  assert(options.max_trigger_depth == 0);
  assert(options.trigger_cooldown.count() == 0);
}

void TestUnknownLogLevelIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("logging:\n  level: \"loud\"\n");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  auto config = ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n");
  assert(config.logging().level() == "warn");
}

void TestOtlpEndpointResolution() {
  using reactor::observability::OtlpSignal;
  using reactor::observability::OtlpTransport;

  auto config = ConfigLoader::LoadFromYamlString(
      "observability:\n  tracing_enabled: true\n  transport: OTLP_TRANSPORT_HTTP\n  service_name: \"swarm-a\"\n");
  auto otlp = reactor::observability::ToOtlpConfig(config);
  assert(otlp.service_name == "swarm-a");
  assert(otlp.transport == OtlpTransport::kHttpProtobuf);

  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  assert(ResolveOtlpEndpoint(otlp, OtlpSignal::kTraces) == "http://localhost:4318/v1/traces");
  assert(ResolveOtlpEndpoint(otlp, OtlpSignal::kMetrics) == "http://localhost:4318/v1/metrics");

  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  ::setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "http://metrics:4318/v1/metrics", 1);
  assert(ResolveOtlpEndpoint(otlp, OtlpSignal::kTraces) == "http://collector:4318");
  assert(ResolveOtlpEndpoint(otlp, OtlpSignal::kMetrics) == "http://metrics:4318/v1/metrics");

  otlp.endpoint = "http://pinned:4318";
  assert(ResolveOtlpEndpoint(otlp, OtlpSignal::kMetrics) == "http://pinned:4318");

  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeLimitsAreRejected();
  TestEmptyDocumentGivesDefaults();
  TestExplicitZeroDepthAndCooldownAreKept();
  TestUnknownLogLevelIsRejected();
  TestOtlpEndpointResolution();

  std::cout << "agent_reactor_unit_config_loader: pass\n";
  return 0;
}
