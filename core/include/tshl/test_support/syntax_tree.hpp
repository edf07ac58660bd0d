// tshl/test_support/syntax_tree.hpp - hand-built parse trees for unit tests
//
// SyntaxTree lets tests describe a parse tree node by node (type name, field,
// byte span) over a source string, without a tree-sitter grammar. Its Node
// handle satisfies the node requirements of tshl/match/matcher.hpp.
//
#pragma once

#include <cstdint>
#include <deque>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tshl/basic/source_manager.hpp"
#include "tshl/match/highlight_instruction.hpp"

namespace tshl::test_support
{

class SyntaxTree
{
  struct Data
  {
    std::string kind;
    std::string field;
    int32_t parent = -1;
    std::vector<int32_t> children;
    TextSpan span;
  };

public:
  class Node
  {
  public:
    Node() = default;

    [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr || index_ < 0; }
    [[nodiscard]] std::string_view kind() const { return data().kind; }
    [[nodiscard]] std::string_view field_name() const { return data().field; }

    [[nodiscard]] std::string_view field_name_for_child(uint32_t i) const
    {
      return tree_->data_[static_cast<size_t>(data().children.at(i))].field;
    }

    [[nodiscard]] uint32_t child_count() const
    {
      return static_cast<uint32_t>(data().children.size());
    }
    [[nodiscard]] Node child(uint32_t i) const { return Node(tree_, data().children.at(i)); }
    [[nodiscard]] Node parent() const { return Node(tree_, data().parent); }
    [[nodiscard]] TextSpan span() const { return data().span; }

    [[nodiscard]] bool operator==(const Node & other) const noexcept
    {
      return tree_ == other.tree_ && index_ == other.index_;
    }

  private:
    friend class SyntaxTree;

    Node(const SyntaxTree * tree, int32_t index) : tree_(tree), index_(index) {}

    [[nodiscard]] const Data & data() const { return tree_->data_.at(static_cast<size_t>(index_)); }

    const SyntaxTree * tree_ = nullptr;
    int32_t index_ = -1;
  };

  explicit SyntaxTree(std::string source = {})
  : source_("<test>", std::move(source))
  {
  }

  // Nodes hand out views of their strings; the tree must stay put.
  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree & operator=(const SyntaxTree &) = delete;

  [[nodiscard]] std::string_view source() const noexcept { return source_.content(); }

  Node add_root(std::string kind, uint32_t start, uint32_t end)
  {
    if (!data_.empty()) {
      throw std::logic_error("SyntaxTree already has a root");
    }
    return append(std::move(kind), {}, -1, start, end);
  }

  /// Root spanning the whole source
  Node add_root(std::string kind)
  {
    return add_root(std::move(kind), 0, static_cast<uint32_t>(source_.content().size()));
  }

  Node add_child(Node parent, std::string kind, uint32_t start, uint32_t end, std::string field = {})
  {
    if (parent.tree_ != this || parent.is_null()) {
      throw std::logic_error("parent does not belong to this SyntaxTree");
    }
    return append(std::move(kind), std::move(field), parent.index_, start, end);
  }

  /// Child spanning the `occurrence`-th appearance of `text` in the source
  Node add_child_over(
    Node parent, std::string kind, std::string_view text, std::string field = {},
    size_t occurrence = 0)
  {
    const auto [start, end] = locate(text, occurrence);
    return add_child(parent, std::move(kind), start, end, std::move(field));
  }

  [[nodiscard]] std::pair<uint32_t, uint32_t> locate(std::string_view text, size_t occurrence = 0) const
  {
    const std::string_view src = source_.content();
    size_t pos = src.find(text);
    for (size_t i = 0; i < occurrence && pos != std::string_view::npos; ++i) {
      pos = src.find(text, pos + 1);
    }
    if (pos == std::string_view::npos) {
      throw std::logic_error("text not found in SyntaxTree source: " + std::string(text));
    }
    return {static_cast<uint32_t>(pos), static_cast<uint32_t>(pos + text.size())};
  }

  [[nodiscard]] Node root() const { return data_.empty() ? Node() : Node(this, 0); }

  [[nodiscard]] size_t size() const noexcept { return data_.size(); }

private:
  Node append(std::string kind, std::string field, int32_t parent, uint32_t start, uint32_t end)
  {
    const auto index = static_cast<int32_t>(data_.size());
    Data d;
    d.kind = std::move(kind);
    d.field = std::move(field);
    d.parent = parent;
    d.span = TextSpan{start, end, to_point(start), to_point(end)};
    data_.push_back(std::move(d));
    if (parent >= 0) {
      data_[static_cast<size_t>(parent)].children.push_back(index);
    }
    return Node(this, index);
  }

  [[nodiscard]] TextPoint to_point(uint32_t offset) const
  {
    const LineColumn lc = source_.get_line_column(offset);
    return TextPoint{lc.line - 1, lc.column - 1};
  }

  SourceFile source_;
  std::deque<Data> data_;
};

}  // namespace tshl::test_support
