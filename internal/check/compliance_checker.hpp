#pragma once

#include <functional>
#include <memory>
#include <string>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/check/comparator.hpp"
#include "internal/check/match_table.hpp"
#include "internal/check/verdict.hpp"
#include "semconv/checker/v1.hpp"

namespace semconv::check {

enum class MetricShape {
  kNumber,      // gauge or sum: checked
  kUnsupported, // histogram, exponential histogram, summary: warned and skipped
  kAbsent,      // no data at all: ignored silently
};

struct ClassifiedMetric {
  MetricShape                                                                     shape{MetricShape::kAbsent};
  const char*                                                                     type_name{""};
  const google::protobuf::RepeatedPtrField<semconv::checker::v1::NumberDataPoint>* points{nullptr};
};

ClassifiedMetric ClassifyMetric(const semconv::checker::v1::Metric& metric);

/*
  ComplianceChecker

  Walks one export request (resources -> scopes -> metrics -> data points)
  and folds the per-metric results into a Verdict.

  Holds only read-only schema data, so a single instance serves any number
  of concurrent calls.
*/
class ComplianceChecker {
 public:
  // Returns true when the caller has given up on the call.
  using CancelCheck = std::function<bool()>;

  ComplianceChecker(std::shared_ptr<const MatchTable> table, std::shared_ptr<const ResourceSchema> resource, bool report_unmatched);

  // A null request yields a clean verdict. Throws util::Cancelled when the
  // cancellation check fires at a resource or scope boundary.
  Verdict Check(const semconv::checker::v1::ExportMetricsServiceRequest* request, const CancelCheck& cancelled = {}) const;

  Verdict CheckResource(const semconv::checker::v1::ResourceMetrics& resource, const CancelCheck& cancelled = {}) const;

 private:
  Verdict CheckScope(const semconv::checker::v1::ScopeMetrics& scope) const;
  Verdict CheckMetric(const semconv::checker::v1::Metric& metric, const std::string& scope_name) const;

  std::shared_ptr<const MatchTable>     table_;
  std::shared_ptr<const ResourceSchema> resource_;
  bool                                  report_unmatched_;
};

} // namespace semconv::check
