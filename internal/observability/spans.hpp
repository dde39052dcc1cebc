#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace semconv::runtime::config {
class RuntimeConfig;
}

namespace semconv::observability {

/*
  Self-telemetry of the checker: one span per export call plus request,
  latency and violation instruments. Exported over OTLP when built with
  ENABLE_OTEL; every call below is an inline no-op otherwise.

  Endpoint and transport come from RuntimeConfig.observability, see
  otlp_settings.hpp.
*/

bool InitializeTracing(const semconv::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const semconv::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Starts a span and makes it active until destruction.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  // Marks the span as failed.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // accepted is false for rejected and failed calls alike.
  void RecordRequest(std::string_view route, bool accepted);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // Missing required attributes found on matched metrics.
  void RecordViolations(std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const semconv::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const semconv::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordViolations(std::int64_t) {
}
#endif

} // namespace semconv::observability
