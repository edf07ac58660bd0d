// tshl/config/highlight_config.cpp - Configuration loading
//
#include "tshl/config/highlight_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>

namespace tshl
{

namespace
{

namespace fs = std::filesystem;

fs::path resolve_path(const std::string & raw, const fs::path & root)
{
  if (raw.size() >= 2 && raw[0] == '~' && raw[1] == '/') {
    if (const char * home = std::getenv("HOME")) {
      return fs::path(home) / raw.substr(2);
    }
  }
  fs::path p(raw);
  if (p.is_absolute()) {
    return p;
  }
  return root / p;
}

/// Read a scalar or a list of scalars into `out`
bool read_string_list(const YAML::Node & node, std::vector<std::string> & out)
{
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return true;
  }
  if (!node.IsSequence()) {
    return false;
  }
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

/// Parse a single language entry
std::optional<LanguageConfig> parse_language(
  const std::string & name, const YAML::Node & node, const fs::path & root, std::string & error)
{
  if (!node.IsMap()) {
    error = "language '" + name + "' must be a map";
    return std::nullopt;
  }

  LanguageConfig lang;
  lang.name = name;
  lang.grammar = node["grammar"] ? node["grammar"].as<std::string>() : name;

  if (!node["rules"]) {
    error = "language '" + name + "' has no 'rules' entry";
    return std::nullopt;
  }
  lang.rules = resolve_path(node["rules"].as<std::string>(), root);

  if (node["overrides"]) {
    std::vector<std::string> raw;
    if (!read_string_list(node["overrides"], raw)) {
      error = "languages." + name + ".overrides must be a list";
      return std::nullopt;
    }
    for (const auto & r : raw) {
      lang.overrides.push_back(resolve_path(r, root));
    }
  }

  if (node["extensions"]) {
    if (!read_string_list(node["extensions"], lang.extensions)) {
      error = "languages." + name + ".extensions must be a list";
      return std::nullopt;
    }
    for (auto & ext : lang.extensions) {
      if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
      }
    }
  }

  return lang;
}

ConfigLoadResult from_yaml(const YAML::Node & root, const fs::path & config_root)
{
  HighlightConfig config;
  config.config_root = config_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["languages"]) {
    const auto & langs = root["languages"];
    if (!langs.IsMap()) {
      return ConfigLoadResult::fail("languages must be a map");
    }
    for (const auto & entry : langs) {
      const std::string name = entry.first.as<std::string>();
      std::string lang_error;
      auto lang = parse_language(name, entry.second, config_root, lang_error);
      if (!lang) {
        return ConfigLoadResult::fail("invalid language: " + lang_error);
      }
      config.languages.push_back(std::move(*lang));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

const LanguageConfig * HighlightConfig::find_language(std::string_view name) const noexcept
{
  const auto it = std::find_if(languages.begin(), languages.end(), [name](const auto & l) {
    return l.name == name;
  });
  return it != languages.end() ? &*it : nullptr;
}

const LanguageConfig * HighlightConfig::language_for_path(const fs::path & path) const
{
  const std::string ext = path.extension().string();
  if (ext.empty()) {
    return nullptr;
  }
  for (const auto & lang : languages) {
    if (std::find(lang.extensions.begin(), lang.extensions.end(), ext) != lang.extensions.end()) {
      return &lang;
    }
  }
  return nullptr;
}

ConfigLoadResult parse_highlight_config(const std::string & yaml_text, const fs::path & config_root)
{
  try {
    return from_yaml(YAML::Load(yaml_text), config_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_highlight_config(const fs::path & config_path)
{
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return from_yaml(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

}  // namespace tshl
