#pragma once

#include <stdexcept>
#include <string>

namespace semconv::util {

/*
  Central error types.

  Configuration errors are fatal at startup. The rest get translated to
  gRPC status codes by the transport adapter.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownGroup : public ConfigError {
 public:
  explicit UnknownGroup(const std::string& group) : ConfigError("unknown semantic convention group: " + group) {
  }
};

class InvalidPattern : public ConfigError {
 public:
  InvalidPattern(const std::string& pattern, const std::string& reason)
      : ConfigError("invalid metric match pattern '" + pattern + "': " + reason) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace semconv::util
