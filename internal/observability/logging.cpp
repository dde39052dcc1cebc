#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace semconv::observability {
namespace {

constexpr const char* kLoggerName     = "semconv-checker";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Env var wins over the config value, which wins over the fallback.
std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool Flag(const char* env_name, bool configured) {
  if (const char* value = std::getenv(env_name)) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off, which would silence every finding
  if (level == spdlog::level::off && name != "off") {
    throw util::ConfigError("unknown log level: " + name);
  }
  return level;
}

void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    line += field.value;
  }
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& line, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    line.push_back(kHex[(data[i] >> 4) & 0x0F]);
    line.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  line += " trace_id=";
  AppendHex(line, trace_bytes, sizeof(trace_bytes));
  line += " span_id=";
  AppendHex(line, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField ListField(std::string_view key, const std::vector<std::string>& values) {
  std::string rendered = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      rendered.push_back(' ');
    }
    rendered += values[i];
  }
  rendered.push_back(']');
  return {std::string(key), std::move(rendered)};
}

void InitializeLogging(const semconv::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(Setting("SEMCONV_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = Setting("SEMCONV_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = Flag("SEMCONV_LOG_INCLUDE_TRACE_CONTEXT", config.logging().include_trace_context());
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) {
    return;
  }

  std::string line(message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace semconv::observability
