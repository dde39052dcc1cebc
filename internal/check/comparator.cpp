#include "internal/check/comparator.hpp"

namespace semconv::check {

ComparisonResult Compare(const AttributeSet& required, const AttributeSet* observed, const IgnoreSet& ignore) {
  ComparisonResult result;

  for (const auto& key : required) {
    if (ignore.count(key) != 0) {
      continue;
    }
    if (observed == nullptr || !observed->Contains(key)) {
      result.missing.push_back(key);
    }
  }

  if (observed == nullptr) {
    return result;
  }

  for (const auto& key : *observed) {
    if (ignore.count(key) != 0 || required.Contains(key)) {
      continue;
    }
    result.extra.push_back(key);
  }

  return result;
}

ComparisonResult Concatenate(const std::vector<ComparisonResult>& results) {
  ComparisonResult joined;
  for (const auto& result : results) {
    joined.missing.insert(joined.missing.end(), result.missing.begin(), result.missing.end());
    joined.extra.insert(joined.extra.end(), result.extra.begin(), result.extra.end());
  }
  return joined;
}

AttributeSet KeysOf(const google::protobuf::RepeatedPtrField<semconv::checker::v1::KeyValue>& attributes) {
  AttributeSet keys;
  for (const auto& attribute : attributes) {
    keys.Insert(attribute.key());
  }
  return keys;
}

} // namespace semconv::check
