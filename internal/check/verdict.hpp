#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "semconv/checker/v1.hpp"

namespace semconv::check {

inline constexpr int kExitClean     = 0;
inline constexpr int kExitViolation = 100;

/*
  Outcome of one export call.

  violation_count is the number of missing required attributes on matched
  metrics. Resource-level findings are advisory and never counted.
  implicated_scopes gets the scope name once per matching rule.
*/
struct Verdict {
  std::int64_t             violation_count{0};
  std::vector<std::string> implicated_scopes;

  bool Clean() const {
    return violation_count == 0;
  }
};

Verdict Merge(Verdict into, const Verdict& from);

// One-shot mode: kExitViolation when anything is missing, kExitClean otherwise.
int ExitCode(const Verdict& verdict);

struct ExportReply {
  semconv::checker::v1::ExportMetricsServiceResponse response;
  ::grpc::Status                                     status;
};

/*
  Service mode response shaping.

  Clean verdict: empty response, OK.
  Otherwise: partial_success{rejected_data_points, "missing attributes"} and
  FAILED_PRECONDITION naming the implicated scopes.
*/
ExportReply RenderReply(const Verdict& verdict);

} // namespace semconv::check
