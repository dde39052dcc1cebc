#include "internal/check/compliance_checker.hpp"

#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace semconv::check {

using namespace semconv::checker::v1;
using semconv::observability::IntField;
using semconv::observability::ListField;
using semconv::observability::StringField;

namespace {

void ThrowIfCancelled(const ComplianceChecker::CancelCheck& cancelled) {
  if (cancelled && cancelled()) {
    throw util::Cancelled("export call cancelled during compliance check");
  }
}

void LogResourceFindings(const ComparisonResult& result, const std::string& version) {
  if (!result.missing.empty()) {
    SEMCONV_LOG_WARN("missing attributes",
                     {StringField("section", "resource"), StringField("version", version), ListField("missing", result.missing)});
  }
  if (!result.extra.empty()) {
    SEMCONV_LOG_INFO("extra attributes",
                     {StringField("section", "resource"), StringField("version", version), ListField("extra", result.extra)});
  }
}

void LogMetricFindings(const ComparisonResult& result, const std::string& scope_name, const std::string& metric_name, const std::string& match) {
  if (!result.missing.empty()) {
    SEMCONV_LOG_WARN("missing attributes",
                     {StringField("section", "metric"),
                      StringField("scope.name", scope_name),
                      StringField("name", metric_name),
                      StringField("match", match),
                      ListField("missing", result.missing)});
  }
  if (!result.extra.empty()) {
    SEMCONV_LOG_INFO("extra attributes",
                     {StringField("section", "metric"),
                      StringField("scope.name", scope_name),
                      StringField("name", metric_name),
                      StringField("match", match),
                      ListField("extra", result.extra)});
  }
}

ComparisonResult CompareDataPoints(const MatchRule& rule, const google::protobuf::RepeatedPtrField<NumberDataPoint>& points) {
  std::vector<ComparisonResult> per_point;
  per_point.reserve(points.size());
  for (const auto& point : points) {
    per_point.push_back(Compare(rule.required, KeysOf(point.attributes()), rule.ignore));
  }
  return Concatenate(per_point);
}

} // namespace

ClassifiedMetric ClassifyMetric(const Metric& metric) {
  // No default: a new data case in the protocol must be classified here.
  switch (metric.data_case()) {
    case Metric::kGauge:
      return {MetricShape::kNumber, "gauge", &metric.gauge().data_points()};
    case Metric::kSum:
      return {MetricShape::kNumber, "sum", &metric.sum().data_points()};
    case Metric::kHistogram:
      return {MetricShape::kUnsupported, "histogram", nullptr};
    case Metric::kExponentialHistogram:
      return {MetricShape::kUnsupported, "exponential_histogram", nullptr};
    case Metric::kSummary:
      return {MetricShape::kUnsupported, "summary", nullptr};
    case Metric::DATA_NOT_SET:
      return {MetricShape::kAbsent, "", nullptr};
  }
  return {MetricShape::kAbsent, "", nullptr};
}

ComplianceChecker::ComplianceChecker(std::shared_ptr<const MatchTable>     table,
                                     std::shared_ptr<const ResourceSchema> resource,
                                     bool                                  report_unmatched)
    : table_(std::move(table)), resource_(std::move(resource)), report_unmatched_(report_unmatched) {
}

Verdict ComplianceChecker::Check(const ExportMetricsServiceRequest* request, const CancelCheck& cancelled) const {
  Verdict verdict;
  if (request == nullptr) {
    return verdict;
  }

  for (const auto& resource : request->resource_metrics()) {
    verdict = Merge(std::move(verdict), CheckResource(resource, cancelled));
  }
  return verdict;
}

Verdict ComplianceChecker::CheckResource(const ResourceMetrics& resource, const CancelCheck& cancelled) const {
  ThrowIfCancelled(cancelled);

  if (resource.schema_url() != resource_->expected_version) {
    SEMCONV_LOG_INFO("incorrect resource version",
                     {StringField("section", "resource"),
                      StringField("version", resource.schema_url()),
                      StringField("expected", resource_->expected_version)});
  }

  // advisory only: logged, never counted
  if (resource.has_resource()) {
    const auto observed = KeysOf(resource.resource().attributes());
    LogResourceFindings(Compare(resource_->required, &observed, resource_->ignore), resource.schema_url());
  } else {
    LogResourceFindings(Compare(resource_->required, nullptr, resource_->ignore), resource.schema_url());
  }

  Verdict verdict;
  for (const auto& scope : resource.scope_metrics()) {
    ThrowIfCancelled(cancelled);
    verdict = Merge(std::move(verdict), CheckScope(scope));
  }
  return verdict;
}

Verdict ComplianceChecker::CheckScope(const ScopeMetrics& scope) const {
  const auto& scope_name = scope.scope().name();

  if (scope.schema_url() != resource_->expected_version) {
    SEMCONV_LOG_INFO("incorrect scope version",
                     {StringField("section", "metric"),
                      StringField("scope.name", scope_name),
                      StringField("schemaUrl", scope.schema_url()),
                      StringField("expected", resource_->expected_version)});
  }

  Verdict verdict;
  for (const auto& metric : scope.metrics()) {
    verdict = Merge(std::move(verdict), CheckMetric(metric, scope_name));
  }
  return verdict;
}

Verdict ComplianceChecker::CheckMetric(const Metric& metric, const std::string& scope_name) const {
  Verdict verdict;

  const auto classified = ClassifyMetric(metric);
  switch (classified.shape) {
    case MetricShape::kAbsent:
      return verdict;
    case MetricShape::kUnsupported:
      SEMCONV_LOG_WARN("unsupported metric type",
                       {StringField("section", "metric"),
                        StringField("scope.name", scope_name),
                        StringField("name", metric.name()),
                        StringField("type", classified.type_name)});
      return verdict;
    case MetricShape::kNumber:
      break;
  }

  const auto matching = table_->Matching(metric.name());
  for (const auto* rule : matching) {
    const auto result = CompareDataPoints(*rule, *classified.points);
    LogMetricFindings(result, scope_name, metric.name(), rule->match);

    verdict.violation_count += static_cast<std::int64_t>(result.missing.size());
    verdict.implicated_scopes.push_back(scope_name);
  }

  if (matching.empty() && report_unmatched_) {
    SEMCONV_LOG_INFO("unmatched metric",
                     {StringField("section", "metric"),
                      StringField("scope.name", scope_name),
                      StringField("name", metric.name()),
                      IntField("data_points", classified.points->size())});
  }

  return verdict;
}

} // namespace semconv::check
