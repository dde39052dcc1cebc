#include "internal/check/verdict.hpp"

#include <utility>

namespace semconv::check {

namespace {

constexpr const char* kMissingAttributes = "missing attributes";

std::string ScopeList(const std::vector<std::string>& scopes) {
  std::string out = "[";
  for (std::size_t i = 0; i < scopes.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out += scopes[i];
  }
  out.push_back(']');
  return out;
}

} // namespace

Verdict Merge(Verdict into, const Verdict& from) {
  into.violation_count += from.violation_count;
  into.implicated_scopes.insert(into.implicated_scopes.end(), from.implicated_scopes.begin(), from.implicated_scopes.end());
  return into;
}

int ExitCode(const Verdict& verdict) {
  return verdict.violation_count > 0 ? kExitViolation : kExitClean;
}

ExportReply RenderReply(const Verdict& verdict) {
  ExportReply reply;
  if (verdict.violation_count <= 0) {
    reply.status = ::grpc::Status::OK;
    return reply;
  }

  auto* partial = reply.response.mutable_partial_success();
  partial->set_rejected_data_points(verdict.violation_count);
  partial->set_error_message(kMissingAttributes);

  reply.status = ::grpc::Status(::grpc::StatusCode::FAILED_PRECONDITION,
                                std::string(kMissingAttributes) + ": " + ScopeList(verdict.implicated_scopes));
  return reply;
}

} // namespace semconv::check
