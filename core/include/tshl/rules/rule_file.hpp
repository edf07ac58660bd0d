// tshl/rules/rule_file.hpp - Indentation-nested rule files
//
// A rule file lists descriptors one per line. Indentation nests a line under
// the closest preceding line with less indentation; a second token on a line
// is the label of the rule formed by that line and all its enclosing lines:
//
//   # Docstrings and class names
//   class_definition
//       class                   Class
//       name:identifier         ClassName
//       block
//           expression_statement
//               string          DocString
//
// '#' starts a comment (a whole line or any trailing token). Blank lines are
// ignored. A trailing '+' marks a repeatable descriptor (`attribute+`).
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tshl/basic/diagnostic.hpp"
#include "tshl/basic/source_manager.hpp"
#include "tshl/match/rule.hpp"

namespace tshl
{

/**
 * Parse a registered rule file.
 *
 * Errors and warnings are added to `diags`.
 *
 * @return the rules in file order, or std::nullopt if the file has errors
 */
[[nodiscard]] std::optional<std::vector<Rule>> parse_rule_file(
  const SourceRegistry & sources, FileId file, DiagnosticBag & diags);

/**
 * Register `text` under `virtual_path` and parse it.
 */
[[nodiscard]] std::optional<std::vector<Rule>> parse_rule_text(
  SourceRegistry & sources, const std::filesystem::path & virtual_path, std::string text,
  DiagnosticBag & diags);

/**
 * Apply an override rule set on top of `base`.
 *
 * Rules are keyed by their full descriptor sequence. An override whose key
 * already exists replaces that rule's label in place; other overrides are
 * appended in order.
 */
void merge_rules(std::vector<Rule> & base, std::vector<Rule> overrides);

/**
 * Read, parse and merge a base rule file followed by optional override files.
 *
 * @return the merged rules, or std::nullopt if any file was unreadable or
 *         had errors
 */
[[nodiscard]] std::optional<std::vector<Rule>> load_rule_files(
  SourceRegistry & sources, const std::filesystem::path & base_path,
  const std::vector<std::filesystem::path> & override_paths, DiagnosticBag & diags);

/**
 * Default file extension for rule files.
 */
inline constexpr const char * k_rule_file_extension = ".rules";

}  // namespace tshl
