#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace semconv::check {

/*
  AttributeSet

  Set of attribute keys. Values never take part in a comparison.
  Iteration follows first-insertion order so comparison output is stable.
*/
class AttributeSet {
 public:
  using const_iterator = std::vector<std::string>::const_iterator;

  AttributeSet() = default;
  AttributeSet(std::initializer_list<std::string> keys);

  // Returns false when the key was already present.
  bool Insert(const std::string& key);
  void Merge(const AttributeSet& other);

  bool Contains(const std::string& key) const;

  std::size_t size() const {
    return ordered_.size();
  }
  bool empty() const {
    return ordered_.empty();
  }

  const std::vector<std::string>& keys() const {
    return ordered_;
  }

  const_iterator begin() const {
    return ordered_.begin();
  }
  const_iterator end() const {
    return ordered_.end();
  }

 private:
  std::vector<std::string>        ordered_;
  std::unordered_set<std::string> index_;
};

using IgnoreSet = std::unordered_set<std::string>;

} // namespace semconv::check
