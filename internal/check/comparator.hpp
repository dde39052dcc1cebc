#pragma once

#include <string>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/check/attribute_set.hpp"
#include "semconv/checker/v1.hpp"

namespace semconv::check {

/*
  Result of checking one entity (a resource, one data point, or the data
  points of one metric against one rule joined by Concatenate).

  missing follows the order of the required set, extra the first-seen order
  of the observed set. After ignore filtering the two never share a key.
*/
struct ComparisonResult {
  std::vector<std::string> missing;
  std::vector<std::string> extra;

  bool empty() const {
    return missing.empty() && extra.empty();
  }
};

/*
  missing = required - observed, extra = observed - required, then every key
  in ignore is dropped from both. A null observed set counts as empty.
*/
ComparisonResult Compare(const AttributeSet& required, const AttributeSet* observed, const IgnoreSet& ignore);

inline ComparisonResult Compare(const AttributeSet& required, const AttributeSet& observed, const IgnoreSet& ignore) {
  return Compare(required, &observed, ignore);
}

// Appends several results in order. A key missing from n points appears n
// times, so every missing entry counts as one rejected data point attribute.
ComparisonResult Concatenate(const std::vector<ComparisonResult>& results);

AttributeSet KeysOf(const google::protobuf::RepeatedPtrField<semconv::checker::v1::KeyValue>& attributes);

} // namespace semconv::check
