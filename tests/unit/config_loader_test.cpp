#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using semconv::config::ConfigLoader;
using semconv::config::ValidateConfig;
using semconv::runtime::config::OTLP_TRANSPORT_HTTP;
using semconv::util::ConfigError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "semconv_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

constexpr const char* kFullConfig = R"(server:
  bind_address: "127.0.0.1:4317"
logging:
  level: debug
  include_trace_context: true
observability:
  tracing_enabled: false
  metrics_enabled: true
  transport: OTLP_TRANSPORT_HTTP
  otlp_endpoint: "http://collector:4318"
  collection_interval_ms: 500
catalog:
  paths:
    - /etc/semconv/model
    - ./extra.yaml
  schema_url: https://opentelemetry.io/schemas/1.24.0
resource:
  groups: [service, telemetry.sdk]
  ignore: [service.instance.id]
metrics:
  - match: ^http\..*
    groups: [attributes.http.server]
  - match: ^db\.
    groups: [attributes.db]
    ignore: [db.statement]
report_unmatched: true
one_shot: true
)";

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full", kFullConfig);
  const auto config    = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.server().bind_address() == "127.0.0.1:4317");
  assert(config.logging().level() == "debug");
  assert(config.logging().include_trace_context());
  assert(config.observability().metrics_enabled());
  assert(config.observability().transport() == OTLP_TRANSPORT_HTTP);
  assert(config.observability().collection_interval_ms() == 500);
  assert(config.catalog().paths_size() == 2);
  assert(config.catalog().schema_url() == "https://opentelemetry.io/schemas/1.24.0");
  assert(config.resource().groups_size() == 2);
  assert(config.resource().ignore(0) == "service.instance.id");
  assert(config.metrics_size() == 2);
  assert(config.metrics(0).match() == "^http\\..*");
  assert(config.metrics(1).ignore(0) == "db.statement");
  assert(config.report_unmatched());
  assert(config.one_shot());

  ValidateConfig(config);
}

void TestQuotedNumbersStayStrings() {
  const auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:4317"
catalog:
  paths: ["1.0"]
  schema_url: "1.24"
)");

  assert(config.catalog().paths(0) == "1.0");
  assert(config.catalog().schema_url() == "1.24");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:4317"
unknown_field: 123
)");
  } catch (const ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "semconv_no_such_config.yaml").string());
  } catch (const ConfigError&) {
    threw = true;
  }
  assert(threw);
}

void ExpectInvalid(const std::string& yaml, const std::string& needle) {
  const auto config = ConfigLoader::LoadFromString(yaml);

  bool threw = false;
  try {
    ValidateConfig(config);
  } catch (const ConfigError& e) {
    threw = std::string(e.what()).find(needle) != std::string::npos;
  }
  assert(threw);
}

void TestValidationCatchesStructuralProblems() {
  ExpectInvalid(R"(catalog:
  paths: [model]
)",
                "bind_address");

  ExpectInvalid(R"(server:
  bind_address: "0.0.0.0:4317"
)",
                "catalog.paths");

  ExpectInvalid(R"(server:
  bind_address: "0.0.0.0:4317"
catalog:
  paths: [model]
metrics:
  - groups: [attributes.http.server]
)",
                "metrics[0].match");
}

void TestSelfTelemetryNeedsItsOwnCollector() {
  ExpectInvalid(R"(server:
  bind_address: "0.0.0.0:4317"
catalog:
  paths: [model]
observability:
  tracing_enabled: true
)",
                "observability.otlp_endpoint must be set");

  ExpectInvalid(R"(server:
  bind_address: "0.0.0.0:4317"
catalog:
  paths: [model]
observability:
  metrics_enabled: true
  otlp_endpoint: "0.0.0.0:4317"
)",
                "bind_address");

  const auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:4317"
catalog:
  paths: [model]
observability:
  tracing_enabled: true
  otlp_endpoint: "collector:4317"
)");
  ValidateConfig(config);

  const auto disabled = ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:4317"
catalog:
  paths: [model]
)");
  ValidateConfig(disabled);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigError();
  TestValidationCatchesStructuralProblems();
  TestSelfTelemetryNeedsItsOwnCollector();

  std::cout << "semconv_unit_config_loader: pass\n";
  return 0;
}
