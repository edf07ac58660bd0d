// tshl/config/highlight_config.hpp - Highlighter configuration (tshl.yaml)
//
// Maps language names to their tree-sitter grammar, rule files and the file
// extensions they apply to.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tshl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Settings for one language.
 */
struct LanguageConfig
{
  std::string name;

  /// Grammar name known to the tool (defaults to the language name)
  std::string grammar;

  /// Base rule file
  std::filesystem::path rules;

  /// Override rule files, applied in order after the base file
  std::vector<std::filesystem::path> overrides;

  /// File extensions including the dot, e.g. ".py"
  std::vector<std::string> extensions;
};

/**
 * Complete configuration (tshl.yaml).
 */
struct HighlightConfig
{
  std::vector<LanguageConfig> languages;

  /// Directory containing tshl.yaml (for resolving relative paths)
  std::filesystem::path config_root;

  [[nodiscard]] const LanguageConfig * find_language(std::string_view name) const noexcept;

  /// Language whose extensions include the extension of `path`
  [[nodiscard]] const LanguageConfig * language_for_path(
    const std::filesystem::path & path) const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  HighlightConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(HighlightConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration file.
 *
 * Relative rule paths are resolved against the file's directory.
 */
[[nodiscard]] ConfigLoadResult load_highlight_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative paths are resolved against `config_root`.
 */
[[nodiscard]] ConfigLoadResult parse_highlight_config(
  const std::string & yaml_text, const std::filesystem::path & config_root);

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_config_file_name = "tshl.yaml";

}  // namespace tshl
