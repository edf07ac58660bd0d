// tshl/match/match_tree.cpp - Match tree construction
#include "tshl/match/match_tree.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <string>
#include <utility>

namespace tshl
{

// ============================================================================
// MatchNode
// ============================================================================

const MatchNode * MatchNode::find(ChoiceKeyView key) const noexcept
{
  if (repeat_key_ && repeat_key_->view() == key) {
    return this;
  }
  const auto it = choices_.find(key);
  return it != choices_.end() ? it->second.get() : nullptr;
}

const MatchNode * MatchNode::find_preferred(ChoiceKeyView key) const noexcept
{
  if (key.is_qualified()) {
    if (const MatchNode * qualified = find(key)) {
      return qualified;
    }
  }
  return find(key.unqualified());
}

// ============================================================================
// MatchTree
// ============================================================================

MatchTree::MatchTree() : root_(std::make_unique<MatchNode>()) {}

// ============================================================================
// MatchTreeBuilder
// ============================================================================

MatchTreeBuilder::MatchTreeBuilder() = default;

bool MatchTreeBuilder::validate(const Rule & rule, size_t index, DiagnosticBag & diags)
{
  bool ok = true;

  if (rule.path.empty()) {
    diags
      .report_error(
        rule.origin, fmt::format("rule #{} has no node descriptors", index + 1),
        "empty rule")
      .with_code("E001");
    ok = false;
  }

  if (rule.label.empty()) {
    diags
      .report_error(
        rule.origin,
        fmt::format("rule #{} ({}) has an empty label", index + 1, rule.path_string()),
        "missing label")
      .with_code("E002");
    ok = false;
  }

  for (size_t i = 0; i < rule.path.size(); ++i) {
    if (rule.path[i].name.empty()) {
      diags
        .report_error(
          rule.origin,
          fmt::format("rule #{}: descriptor {} has an empty node name", index + 1, i + 1),
          "invalid descriptor")
        .with_code("E003");
      ok = false;
    }
  }

  return ok;
}

void MatchTreeBuilder::add(const Rule & rule)
{
  if (!validate(rule, next_index_++, diagnostics_)) {
    failed_ = true;
  }
  if (!failed_) {
    insert(rule);
  }
}

void MatchTreeBuilder::insert(const Rule & rule)
{
  MatchNode * node = tree_.root_.get();
  for (auto it = rule.path.rbegin(); it != rule.path.rend(); ++it) {
    ChoiceKey key = it->key();

    // A repeat node answers its own key with itself.
    if (!(node->repeat_key_ && *node->repeat_key_ == key)) {
      auto & slot = node->choices_[key];
      if (!slot) {
        slot = std::make_unique<MatchNode>();
        ++tree_.node_count_;
      }
      node = slot.get();
    }

    if (it->repeat) {
      node->repeat_key_ = std::move(key);
    }
  }

  if (!node->label_) {
    ++tree_.label_count_;
  }
  node->label_ = rule.label;
}

BuildResult MatchTreeBuilder::finish()
{
  BuildResult result;
  result.diagnostics = std::move(diagnostics_);
  if (!failed_) {
    result.tree = std::make_shared<const MatchTree>(std::move(tree_));
    result.success = true;
  }

  tree_ = MatchTree();
  diagnostics_ = DiagnosticBag();
  next_index_ = 0;
  failed_ = false;
  return result;
}

BuildResult build_match_tree(gsl::span<const Rule> rules)
{
  MatchTreeBuilder builder;
  for (const Rule & rule : rules) {
    builder.add(rule);
  }
  return builder.finish();
}

// ============================================================================
// Dump
// ============================================================================

namespace
{

void dump_node(const MatchNode & node, std::ostream & os, int depth)
{
  for (const auto & [key, child] : node.choices()) {
    const bool repeats = child->repeat_key() && *child->repeat_key() == key;
    fmt::print(os, "{:{}}{}{}", "", depth * 4, key.to_string(), repeats ? "+" : "");
    if (const std::string * label = child->label()) {
      fmt::print(os, " -> {}", *label);
    }
    fmt::print(os, "\n");
    dump_node(*child, os, depth + 1);
  }
}

}  // namespace

void dump_match_tree(const MatchTree & tree, std::ostream & os)
{
  dump_node(tree.root(), os, 0);
}

}  // namespace tshl
