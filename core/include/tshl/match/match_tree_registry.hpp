// tshl/match/match_tree_registry.hpp - Published match trees, one per language
#pragma once

#include <gsl/span>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "tshl/match/match_tree.hpp"

namespace tshl
{

/**
 * Owns the active match tree of each language.
 *
 * Trees are never modified once published. A rebuild compiles a complete new
 * tree and swaps the shared pointer; a highlight run that obtained the old
 * pointer through get() keeps using it until it finishes. A failed rebuild
 * leaves the previous tree in place.
 */
class MatchTreeRegistry
{
public:
  MatchTreeRegistry() = default;

  MatchTreeRegistry(const MatchTreeRegistry &) = delete;
  MatchTreeRegistry & operator=(const MatchTreeRegistry &) = delete;

  /**
   * Compile `rules` and publish the result for `language`.
   *
   * @return the build result; on failure nothing is published
   */
  BuildResult rebuild(const std::string & language, gsl::span<const Rule> rules);

  /// Publish an already compiled tree.
  void publish(const std::string & language, std::shared_ptr<const MatchTree> tree);

  /// Current tree for `language`, or nullptr if none has been published
  [[nodiscard]] std::shared_ptr<const MatchTree> get(std::string_view language) const;

  /// Drop the tree for `language`. Returns false if there was none.
  bool remove(std::string_view language);

  [[nodiscard]] std::vector<std::string> languages() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<const MatchTree>, std::less<>> trees_;
};

}  // namespace tshl
