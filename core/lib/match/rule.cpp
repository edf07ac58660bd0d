// tshl/match/rule.cpp
#include "tshl/match/rule.hpp"

namespace tshl
{

std::string Rule::path_string() const
{
  std::string out;
  for (const auto & d : path) {
    if (!out.empty()) {
      out += '.';
    }
    out += d.to_string();
  }
  return out;
}

Rule make_rule(const std::vector<std::string> & path, std::string label)
{
  Rule rule;
  rule.label = std::move(label);
  rule.path.reserve(path.size());
  for (const auto & token : path) {
    if (auto desc = NodeDescriptor::parse(token)) {
      rule.path.push_back(std::move(*desc));
    } else {
      // Keep the empty descriptor so the builder reports it.
      rule.path.push_back(NodeDescriptor{});
    }
  }
  return rule;
}

}  // namespace tshl
