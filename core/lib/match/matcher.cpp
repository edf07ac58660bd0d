// tshl/match/matcher.cpp - Longest-match label resolution
#include "tshl/match/matcher.hpp"

namespace tshl
{

const std::string * resolve_label(
  const MatchTree & tree, gsl::span<const ChoiceKeyView> chain) noexcept
{
  if (chain.empty()) {
    return nullptr;
  }

  size_t i = chain.size() - 1;
  const MatchNode * current = tree.root().find_preferred(chain[i]);
  if (current == nullptr) {
    return nullptr;
  }

  // Deeper matches are more specific, so each label found overwrites `best`.
  const std::string * best = current->label();
  while (i > 0) {
    --i;
    current = current->find_preferred(chain[i]);
    if (current == nullptr) {
      break;
    }
    if (const std::string * label = current->label()) {
      best = label;
    }
  }
  return best;
}

}  // namespace tshl
