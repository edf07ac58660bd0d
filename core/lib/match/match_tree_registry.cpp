// tshl/match/match_tree_registry.cpp
#include "tshl/match/match_tree_registry.hpp"

#include <utility>

namespace tshl
{

BuildResult MatchTreeRegistry::rebuild(const std::string & language, gsl::span<const Rule> rules)
{
  // Compile outside the lock; only the swap is serialized.
  BuildResult result = build_match_tree(rules);
  if (result.success) {
    publish(language, result.tree);
  }
  return result;
}

void MatchTreeRegistry::publish(const std::string & language, std::shared_ptr<const MatchTree> tree)
{
  if (!tree) {
    return;
  }
  const std::lock_guard<std::mutex> lock(mutex_);
  trees_[language] = std::move(tree);
}

std::shared_ptr<const MatchTree> MatchTreeRegistry::get(std::string_view language) const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = trees_.find(language);
  if (it == trees_.end()) {
    return nullptr;
  }
  return it->second;
}

bool MatchTreeRegistry::remove(std::string_view language)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = trees_.find(language);
  if (it == trees_.end()) {
    return false;
  }
  trees_.erase(it);
  return true;
}

std::vector<std::string> MatchTreeRegistry::languages() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(trees_.size());
  for (const auto & entry : trees_) {
    names.push_back(entry.first);
  }
  return names;
}

}  // namespace tshl
