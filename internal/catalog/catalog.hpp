#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/check/attribute_set.hpp"
#include "internal/util/errors.hpp"

namespace semconv::catalog {

/*
  Catalog

  Semantic convention groups by id, plus the one schema URL that resources
  and scopes are expected to declare.

  Registry YAML format:

    groups:
      - id: attributes.http.server
        prefix: http
        extends: attributes.http.common
        attributes:
          - id: route          # -> http.route
          - ref: server.port   # fully qualified

  Read-only after construction.
*/
class Catalog {
 public:
  Catalog(std::string schema_url, std::unordered_map<std::string, check::AttributeSet> groups);

  // Each path is a registry file or a directory scanned for *.yaml / *.yml.
  static Catalog LoadFromYaml(const std::vector<std::string>& paths, std::string schema_url);
  static Catalog LoadFromString(const std::string& yaml, std::string schema_url);

  const std::string& Version() const {
    return schema_url_;
  }

  bool Has(const std::string& group) const;

  // Throws util::UnknownGroup.
  const check::AttributeSet& Group(const std::string& group) const;

  // Union of the named groups in the order given.
  template <typename Names>
  check::AttributeSet Attributes(const Names& groups) const {
    check::AttributeSet merged;
    for (const auto& name : groups) {
      merged.Merge(Group(name));
    }
    return merged;
  }

  std::size_t size() const {
    return groups_.size();
  }

 private:
  std::string                                          schema_url_;
  std::unordered_map<std::string, check::AttributeSet> groups_;
};

} // namespace semconv::catalog
