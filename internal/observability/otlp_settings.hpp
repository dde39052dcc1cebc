#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace semconv::observability {

/*
  Where the checker's own spans and metrics go. Shared by the tracing and
  metrics pipelines, which differ only in the signal-specific env var and
  the OTLP/HTTP path.
*/
struct OtlpSettings {
  std::string service_name;
  std::string endpoint;
  bool        http{false};
};

// Precedence: OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, OTEL_EXPORTER_OTLP_ENDPOINT, config.
// ValidateConfig guarantees the config endpoint when a pipeline is enabled.
inline OtlpSettings ResolveOtlpSettings(const semconv::runtime::config::ObservabilityConfig& config,
                                        const char*                                          signal_env,
                                        const char*                                          http_path) {
  OtlpSettings settings;
  settings.service_name = config.service_name().empty() ? "semconv-checker" : config.service_name();
  settings.http         = config.transport() == semconv::runtime::config::OTLP_TRANSPORT_HTTP;

  if (const char* endpoint = std::getenv(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = config.otlp_endpoint();
  }

  // a bare collector base URL gets the signal path appended for OTLP/HTTP
  if (settings.http && settings.endpoint.find("/v1/") == std::string::npos) {
    while (!settings.endpoint.empty() && settings.endpoint.back() == '/') {
      settings.endpoint.pop_back();
    }
    settings.endpoint += http_path;
  }
  return settings;
}

inline opentelemetry::sdk::resource::Resource BuildResource(const OtlpSettings& settings) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", settings.service_name}};
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace semconv::observability

#endif
