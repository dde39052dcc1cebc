#include "internal/check/attribute_set.hpp"

namespace semconv::check {

AttributeSet::AttributeSet(std::initializer_list<std::string> keys) {
  for (const auto& key : keys) {
    Insert(key);
  }
}

bool AttributeSet::Insert(const std::string& key) {
  if (!index_.insert(key).second) {
    return false;
  }
  ordered_.push_back(key);
  return true;
}

void AttributeSet::Merge(const AttributeSet& other) {
  for (const auto& key : other.ordered_) {
    Insert(key);
  }
}

bool AttributeSet::Contains(const std::string& key) const {
  return index_.find(key) != index_.end();
}

} // namespace semconv::check
