// tshl/match/matcher.hpp - Evaluate a match tree against a parse tree
//
// The matcher is generic over the parse-tree node type. A node type `Node`
// must be a cheap value handle providing:
//
//   bool             is_null() const;
//   std::string_view kind() const;                      // node type name
//   std::string_view field_name() const;                // "" when none
//   std::string_view field_name_for_child(uint32_t) const;
//   uint32_t         child_count() const;
//   Node             child(uint32_t) const;
//   Node             parent() const;                    // null at the root
//   TextSpan         span() const;
//
// The returned string views must stay valid for as long as the tree does.
//
#pragma once

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tshl/match/choice_key.hpp"
#include "tshl/match/highlight_instruction.hpp"
#include "tshl/match/match_tree.hpp"

namespace tshl
{

/**
 * Resolve the label for the last node of `chain`.
 *
 * `chain` holds the keys of the node and all of its ancestors, root first.
 * The node's own key selects the entry under the match-tree root; each
 * further ancestor that matches descends one level and any label found there
 * replaces the previous one, so the longest matching rule wins. At every
 * level the field-qualified key is preferred over the bare name.
 *
 * @return the winning label, or nullptr if the node gets none
 */
[[nodiscard]] const std::string * resolve_label(
  const MatchTree & tree, gsl::span<const ChoiceKeyView> chain) noexcept;

/**
 * Produce highlight instructions for every node under `root`, in pre-order.
 *
 * `root` is treated as the top of the tree: its own field is ignored and no
 * ancestors above it are consulted. Every node is visited, whether or not
 * its parent matched.
 */
template <typename Node>
[[nodiscard]] std::vector<HighlightInstruction> highlight(
  const MatchTree & tree, const Node & root)
{
  std::vector<HighlightInstruction> out;
  if (root.is_null() || tree.empty()) {
    return out;
  }

  struct Frame
  {
    Node node;
    uint32_t next_child;
  };

  std::vector<Frame> stack;
  std::vector<ChoiceKeyView> chain;

  auto visit = [&](const Node & node, std::string_view field) {
    chain.push_back(ChoiceKeyView{field, node.kind()});
    if (const std::string * label = resolve_label(tree, chain)) {
      out.push_back(HighlightInstruction{node.span(), *label});
    }
    stack.push_back(Frame{node, 0});
  };

  visit(root, {});
  while (!stack.empty()) {
    Frame & top = stack.back();
    if (top.next_child < top.node.child_count()) {
      const uint32_t index = top.next_child++;
      const Node child = top.node.child(index);
      const std::string_view field = top.node.field_name_for_child(index);
      visit(child, field);
    } else {
      stack.pop_back();
      chain.pop_back();
    }
  }

  return out;
}

/**
 * Label for a single node, found by climbing its parent links.
 *
 * Applies the same policy as highlight(): for any node of a tree, classify()
 * returns the label highlight() emits for it.
 */
template <typename Node>
[[nodiscard]] std::optional<std::string> classify(const MatchTree & tree, const Node & node)
{
  if (node.is_null()) {
    return std::nullopt;
  }

  const MatchNode * current =
    tree.root().find_preferred(ChoiceKeyView{node.parent().is_null() ? std::string_view{}
                                                                     : node.field_name(),
                                             node.kind()});
  if (current == nullptr) {
    return std::nullopt;
  }

  const std::string * best = current->label();
  for (Node cursor = node.parent(); !cursor.is_null(); cursor = cursor.parent()) {
    const std::string_view field =
      cursor.parent().is_null() ? std::string_view{} : cursor.field_name();
    current = current->find_preferred(ChoiceKeyView{field, cursor.kind()});
    if (current == nullptr) {
      break;
    }
    if (const std::string * label = current->label()) {
      best = label;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

}  // namespace tshl
