#include "compliance_service.hpp"

#include <chrono>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/one_shot_gate.hpp"

namespace semconv::service {

using namespace semconv::checker::v1;
using semconv::observability::IntField;
using semconv::observability::StringField;

namespace {

constexpr const char* kRoute = "MetricsService.Export";

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

ComplianceService::ComplianceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

check::ExportReply ComplianceService::Export(const ExportMetricsServiceRequest* req, const check::ComplianceChecker::CancelCheck& cancelled) {
  semconv::observability::SpanScope span(kRoute);
  const auto                        started_at = std::chrono::steady_clock::now();

  try {
    const auto verdict = ctx_.checker->Check(req, cancelled);

    span.SetAttribute("semconv.violations", static_cast<std::int64_t>(verdict.violation_count));
    if (req != nullptr) {
      span.SetAttribute("semconv.resources", static_cast<std::int64_t>(req->resource_metrics_size()));
    }

    if (ctx_.one_shot) {
      if (ctx_.one_shot->Offer(verdict)) {
        SEMCONV_LOG_INFO("one-shot verdict recorded", {IntField("violations", verdict.violation_count)});
      } else {
        SEMCONV_LOG_DEBUG("one-shot verdict already recorded, ignoring call", {IntField("violations", verdict.violation_count)});
      }
    }

    auto& metrics = semconv::observability::Metrics::Instance();
    metrics.RecordRequest(kRoute, verdict.Clean());
    metrics.RecordViolations(verdict.violation_count);
    metrics.ObserveRequestLatencyMs(kRoute, ElapsedMs(started_at));

    return check::RenderReply(verdict);
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SEMCONV_LOG_ERROR("RPC failed", {StringField("route", kRoute), StringField("error", ex.what())});
    semconv::observability::Metrics::Instance().RecordRequest(kRoute, false);
    semconv::observability::Metrics::Instance().ObserveRequestLatencyMs(kRoute, ElapsedMs(started_at));
    throw;
  }
}

} // namespace semconv::service
