// tshl/match/rule.hpp - Ancestor-chain highlight rules
#pragma once

#include <string>
#include <vector>

#include "tshl/basic/source_manager.hpp"
#include "tshl/match/choice_key.hpp"

namespace tshl
{

/**
 * One highlight rule: an ancestor chain, outermost first, whose last
 * descriptor is the node that receives the label.
 */
struct Rule
{
  std::vector<NodeDescriptor> path;
  std::string label;

  /// Where the rule was written (invalid for rules built in code)
  SourceRange origin;

  Rule() = default;
  Rule(std::vector<NodeDescriptor> p, std::string l, SourceRange o = {})
  : path(std::move(p)), label(std::move(l)), origin(o)
  {
  }

  /// Path spelled as in a flat rule table: "class_definition.name:identifier"
  [[nodiscard]] std::string path_string() const;
};

/**
 * Convenience constructor for rules written in code.
 *
 * Each element is a descriptor token as accepted by NodeDescriptor::parse().
 */
[[nodiscard]] Rule make_rule(const std::vector<std::string> & path, std::string label);

}  // namespace tshl
