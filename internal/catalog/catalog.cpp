#include "internal/catalog/catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace semconv::catalog {

using semconv::check::AttributeSet;
using semconv::util::ConfigError;
using semconv::util::UnknownGroup;

namespace {

struct RawGroup {
  std::string              source;
  std::string              extends;
  std::vector<std::string> attributes;
};

using RawGroups = std::unordered_map<std::string, RawGroup>;

std::string ScalarOr(const YAML::Node& node, const char* key) {
  const auto value = node[key];
  if (!value || value.IsNull()) {
    return {};
  }
  if (!value.IsScalar()) {
    throw ConfigError(std::string("registry field '") + key + "' must be a scalar");
  }
  return value.Scalar();
}

void ParseDocument(const YAML::Node& document, const std::string& source, RawGroups& out) {
  if (!document || document.IsNull()) {
    return;
  }
  const auto groups = document["groups"];
  if (!groups) {
    return;
  }
  if (!groups.IsSequence()) {
    throw ConfigError(source + ": 'groups' must be a sequence");
  }

  for (const auto& node : groups) {
    const auto id = ScalarOr(node, "id");
    if (id.empty()) {
      throw ConfigError(source + ": group without id");
    }

    RawGroup group;
    group.source  = source;
    group.extends = ScalarOr(node, "extends");

    const auto prefix     = ScalarOr(node, "prefix");
    const auto attributes = node["attributes"];
    if (attributes && attributes.IsSequence()) {
      for (const auto& attribute : attributes) {
        const auto ref = ScalarOr(attribute, "ref");
        if (!ref.empty()) {
          group.attributes.push_back(ref);
          continue;
        }
        const auto attr_id = ScalarOr(attribute, "id");
        if (attr_id.empty()) {
          throw ConfigError(source + ": attribute in group '" + id + "' has neither id nor ref");
        }
        group.attributes.push_back(prefix.empty() ? attr_id : prefix + "." + attr_id);
      }
    }

    auto [it, inserted] = out.emplace(id, std::move(group));
    if (!inserted) {
      throw ConfigError("duplicate group '" + id + "' in " + source + " (first defined in " + it->second.source + ")");
    }
  }
}

void ParseFile(const std::filesystem::path& path, RawGroups& out) {
  std::vector<YAML::Node> documents;
  try {
    documents = YAML::LoadAllFromFile(path.string());
    for (const auto& document : documents) {
      ParseDocument(document, path.string(), out);
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError("Failed to load registry file " + path.string() + ": " + e.what());
  }
}

bool IsRegistryFile(const std::filesystem::path& path) {
  const auto ext = path.extension().string();
  return ext == ".yaml" || ext == ".yml";
}

// chain holds the groups currently being resolved, outermost first
const AttributeSet& Resolve(const std::string&                              id,
                            const RawGroups&                                raw,
                            std::unordered_map<std::string, AttributeSet>& resolved,
                            std::vector<std::string>&                       chain) {
  if (auto done = resolved.find(id); done != resolved.end()) {
    return done->second;
  }

  const auto it = raw.find(id);
  if (it == raw.end()) {
    throw UnknownGroup(id);
  }
  if (const auto seen = std::find(chain.begin(), chain.end(), id); seen != chain.end()) {
    if (seen + 1 == chain.end()) {
      throw ConfigError("group '" + id + "' extends itself");
    }
    std::string cycle;
    for (auto step = seen; step != chain.end(); ++step) {
      cycle += *step + " -> ";
    }
    throw ConfigError("extends cycle through group '" + id + "': " + cycle + id);
  }
  chain.push_back(id);

  AttributeSet attributes;
  if (!it->second.extends.empty()) {
    if (raw.find(it->second.extends) == raw.end()) {
      throw ConfigError("group '" + id + "' extends unknown group '" + it->second.extends + "'");
    }
    attributes.Merge(Resolve(it->second.extends, raw, resolved, chain));
  }
  for (const auto& key : it->second.attributes) {
    attributes.Insert(key);
  }

  chain.pop_back();
  return resolved.emplace(id, std::move(attributes)).first->second;
}

std::unordered_map<std::string, AttributeSet> ResolveAll(const RawGroups& raw) {
  std::unordered_map<std::string, AttributeSet> resolved;
  std::vector<std::string>                      chain;
  for (const auto& [id, group] : raw) {
    Resolve(id, raw, resolved, chain);
  }
  return resolved;
}

} // namespace

Catalog::Catalog(std::string schema_url, std::unordered_map<std::string, AttributeSet> groups)
    : schema_url_(std::move(schema_url)), groups_(std::move(groups)) {
}

Catalog Catalog::LoadFromYaml(const std::vector<std::string>& paths, std::string schema_url) {
  RawGroups raw;

  for (const auto& entry : paths) {
    const std::filesystem::path path(entry);
    std::error_code             ec;

    if (std::filesystem::is_directory(path, ec)) {
      std::vector<std::filesystem::path> files;
      try {
        for (const auto& item : std::filesystem::recursive_directory_iterator(path)) {
          if (item.is_regular_file() && IsRegistryFile(item.path())) {
            files.push_back(item.path());
          }
        }
      } catch (const std::filesystem::filesystem_error& e) {
        throw ConfigError("Failed to scan registry directory " + entry + ": " + e.what());
      }
      std::sort(files.begin(), files.end());
      for (const auto& file : files) {
        ParseFile(file, raw);
      }
      continue;
    }

    if (!std::filesystem::is_regular_file(path, ec)) {
      throw ConfigError("registry path does not exist: " + entry);
    }
    ParseFile(path, raw);
  }

  return Catalog(std::move(schema_url), ResolveAll(raw));
}

Catalog Catalog::LoadFromString(const std::string& yaml, std::string schema_url) {
  RawGroups raw;
  try {
    for (const auto& document : YAML::LoadAll(yaml)) {
      ParseDocument(document, "<inline>", raw);
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("Failed to parse registry: ") + e.what());
  }
  return Catalog(std::move(schema_url), ResolveAll(raw));
}

bool Catalog::Has(const std::string& group) const {
  return groups_.find(group) != groups_.end();
}

const AttributeSet& Catalog::Group(const std::string& group) const {
  const auto it = groups_.find(group);
  if (it == groups_.end()) {
    throw UnknownGroup(group);
  }
  return it->second;
}

} // namespace semconv::catalog
