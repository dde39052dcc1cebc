#include "internal/check/match_table.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace semconv::check {

namespace {

template <typename Keys>
IgnoreSet ToIgnoreSet(const Keys& keys) {
  return IgnoreSet(keys.begin(), keys.end());
}

std::shared_ptr<const re2::RE2> CompilePattern(const std::string& match) {
  re2::RE2::Options options;
  options.set_log_errors(false);

  std::shared_ptr<const re2::RE2> pattern = std::make_shared<re2::RE2>(match, options);
  if (!pattern->ok()) {
    throw util::InvalidPattern(match, pattern->error());
  }
  return pattern;
}

} // namespace

MatchTable::MatchTable(std::vector<MatchRule> rules) : rules_(std::move(rules)) {
}

MatchTable MatchTable::Build(const google::protobuf::RepeatedPtrField<semconv::runtime::config::MetricRule>& rules,
                             const catalog::Catalog&                                                    catalog) {
  std::vector<MatchRule> compiled;
  compiled.reserve(rules.size());

  for (const auto& rule : rules) {
    MatchRule entry;
    entry.match    = rule.match();
    entry.pattern  = CompilePattern(rule.match());
    entry.required = catalog.Attributes(rule.groups());
    entry.ignore   = ToIgnoreSet(rule.ignore());
    compiled.push_back(std::move(entry));
  }

  return MatchTable(std::move(compiled));
}

std::vector<const MatchRule*> MatchTable::Matching(const std::string& metric_name) const {
  std::vector<const MatchRule*> matched;
  for (const auto& rule : rules_) {
    if (rule.Matches(metric_name)) {
      matched.push_back(&rule);
    }
  }
  return matched;
}

ResourceSchema BuildResourceSchema(const semconv::runtime::config::ResourceRule& rule, const catalog::Catalog& catalog) {
  ResourceSchema schema;
  schema.required         = catalog.Attributes(rule.groups());
  schema.ignore           = ToIgnoreSet(rule.ignore());
  schema.expected_version = catalog.Version();
  return schema;
}

} // namespace semconv::check
