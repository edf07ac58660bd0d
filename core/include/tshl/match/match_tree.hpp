// tshl/match/match_tree.hpp - Compiled rule trie and its builder
//
// Rules are stored innermost-first: the root maps the descriptor of the node
// being highlighted, each deeper level maps the next enclosing ancestor, and
// a label sits on the node reached by a rule's outermost ancestor.
//
#pragma once

#include <gsl/span>

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "tshl/basic/diagnostic.hpp"
#include "tshl/match/choice_key.hpp"
#include "tshl/match/rule.hpp"

namespace tshl
{

class MatchTreeBuilder;

// ============================================================================
// MatchNode
// ============================================================================

class MatchNode
{
public:
  using ChoiceMap = std::map<ChoiceKey, std::unique_ptr<MatchNode>, ChoiceKeyLess>;

  MatchNode() = default;
  MatchNode(const MatchNode &) = delete;
  MatchNode & operator=(const MatchNode &) = delete;

  /// Label of the rule ending exactly here, nullptr when none does
  [[nodiscard]] const std::string * label() const noexcept
  {
    return label_ ? &*label_ : nullptr;
  }

  /**
   * Child reached by an exact key.
   *
   * A node created from a repeatable descriptor answers its own key with
   * itself, so a run of identical ancestors is consumed without moving.
   */
  [[nodiscard]] const MatchNode * find(ChoiceKeyView key) const noexcept;

  /**
   * Child for a parse-tree node with the given field and type name.
   *
   * The field-qualified key is tried first; the bare name is used only when
   * the node has no field or the qualified key is absent.
   */
  [[nodiscard]] const MatchNode * find_preferred(ChoiceKeyView key) const noexcept;

  [[nodiscard]] const ChoiceMap & choices() const noexcept { return choices_; }
  [[nodiscard]] const std::optional<ChoiceKey> & repeat_key() const noexcept
  {
    return repeat_key_;
  }

private:
  friend class MatchTreeBuilder;

  std::optional<std::string> label_;
  ChoiceMap choices_;
  std::optional<ChoiceKey> repeat_key_;
};

// ============================================================================
// MatchTree
// ============================================================================

/**
 * Immutable compiled form of a rule list. Rebuilding produces a new tree;
 * a published tree can be read from any number of threads.
 */
class MatchTree
{
public:
  /// An empty tree that matches nothing
  MatchTree();

  MatchTree(MatchTree &&) noexcept = default;
  MatchTree & operator=(MatchTree &&) noexcept = default;
  MatchTree(const MatchTree &) = delete;
  MatchTree & operator=(const MatchTree &) = delete;

  [[nodiscard]] const MatchNode & root() const noexcept { return *root_; }

  /// Number of match nodes, excluding the root
  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

  /// Number of nodes that carry a label
  [[nodiscard]] size_t label_count() const noexcept { return label_count_; }

  [[nodiscard]] bool empty() const noexcept { return root_->choices().empty(); }

private:
  friend class MatchTreeBuilder;

  std::unique_ptr<MatchNode> root_;
  size_t node_count_ = 0;
  size_t label_count_ = 0;
};

// ============================================================================
// Building
// ============================================================================

struct BuildResult
{
  /// The compiled tree (only set if success == true)
  std::shared_ptr<const MatchTree> tree;

  bool success = false;

  DiagnosticBag diagnostics;
};

/**
 * Inserts rules one by one. Inserting a path that already exists replaces
 * the label at the node it reaches (last write wins).
 *
 * Every rule is validated as it is added. Once any rule has been rejected the
 * batch is spoiled: later rules are still checked and reported, but finish()
 * returns a failed result without a tree.
 */
class MatchTreeBuilder
{
public:
  MatchTreeBuilder();

  /// Validate and insert the next rule of the batch.
  void add(const Rule & rule);

  /// True once any added rule was rejected
  [[nodiscard]] bool failed() const noexcept { return failed_; }

  /// Hand over the finished tree (or the failure); the builder starts over.
  [[nodiscard]] BuildResult finish();

private:
  static bool validate(const Rule & rule, size_t index, DiagnosticBag & diags);
  void insert(const Rule & rule);

  MatchTree tree_;
  DiagnosticBag diagnostics_;
  size_t next_index_ = 0;
  bool failed_ = false;
};

/**
 * Compile a rule list into a match tree.
 *
 * All rules are validated first; if any is invalid no tree is produced and
 * every problem is reported in the result's diagnostics.
 */
[[nodiscard]] BuildResult build_match_tree(gsl::span<const Rule> rules);

/// Print an indented listing of the tree (keys sorted, labels after "->").
void dump_match_tree(const MatchTree & tree, std::ostream & os);

}  // namespace tshl
