#pragma once

#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "config/config.pb.h"
#include "internal/catalog/catalog.hpp"
#include "internal/check/attribute_set.hpp"

namespace semconv::check {

struct MatchRule {
  std::string                     match;
  std::shared_ptr<const re2::RE2> pattern;
  AttributeSet                    required;
  IgnoreSet                       ignore;

  // Unanchored search: "http" matches "http.server.duration".
  bool Matches(const std::string& metric_name) const {
    return re2::RE2::PartialMatch(metric_name, *pattern);
  }
};

struct ResourceSchema {
  AttributeSet required;
  IgnoreSet    ignore;
  std::string  expected_version;
};

/*
  MatchTable

  Ordered metric rules compiled once at startup. Every rule whose pattern
  matches a metric name applies; declaration order only affects log order.

  Immutable after Build(), safe for concurrent readers.
*/
class MatchTable {
 public:
  MatchTable() = default;
  explicit MatchTable(std::vector<MatchRule> rules);

  // Throws util::InvalidPattern or util::UnknownGroup.
  static MatchTable Build(const google::protobuf::RepeatedPtrField<semconv::runtime::config::MetricRule>& rules,
                          const catalog::Catalog&                                                    catalog);

  std::vector<const MatchRule*> Matching(const std::string& metric_name) const;

  const std::vector<MatchRule>& rules() const {
    return rules_;
  }

 private:
  std::vector<MatchRule> rules_;
};

// Throws util::UnknownGroup.
ResourceSchema BuildResourceSchema(const semconv::runtime::config::ResourceRule& rule, const catalog::Catalog& catalog);

} // namespace semconv::check
