// tshl/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
//
// ts_ll::Node satisfies the node requirements of tshl/match/matcher.hpp, so a
// tree-sitter tree can be highlighted directly.
//
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>

#include "tshl/match/highlight_instruction.hpp"

namespace tshl::ts_ll
{

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool is_named() const noexcept { return ts_node_is_named(node_); }
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  /// Field this node occupies in its parent, "" when none
  [[nodiscard]] std::string_view field_name() const noexcept;

  [[nodiscard]] std::string_view field_name_for_child(uint32_t i) const noexcept
  {
    const char * f = ts_node_field_name_for_child(node_, i);
    return f ? std::string_view(f) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  [[nodiscard]] TextSpan span() const noexcept
  {
    const TSPoint s = ts_node_start_point(node_);
    const TSPoint e = ts_node_end_point(node_);
    return TextSpan{start_byte(), end_byte(), {s.row, s.column}, {e.row, e.column}};
  }

  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }

  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }

  [[nodiscard]] Node parent() const noexcept { return Node(ts_node_parent(node_)); }

  /// Smallest node (named or not) spanning the given point
  [[nodiscard]] Node descendant_at(TextPoint point) const noexcept
  {
    const TSPoint p{point.row, point.column};
    return Node(ts_node_descendant_for_point_range(node_, p, p));
  }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

class Parser
{
public:
  /// A parser whose language was rejected cannot parse; check ok().
  explicit Parser(const TSLanguage * language);
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  /// False when the language could not be set (ABI version mismatch)
  [[nodiscard]] bool ok() const noexcept { return language_set_; }

  /// Parse UTF-8 source. Returns a null tree on failure.
  [[nodiscard]] Tree parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
  bool language_set_ = false;
};

}  // namespace tshl::ts_ll
