// tshl/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "tshl/syntax/ts_ll.hpp"

namespace tshl::ts_ll
{

std::string_view Node::field_name() const noexcept
{
  const TSNode p = ts_node_parent(node_);
  if (ts_node_is_null(p)) {
    return {};
  }
  const uint32_t n = ts_node_child_count(p);
  for (uint32_t i = 0; i < n; ++i) {
    if (ts_node_eq(ts_node_child(p, i), node_)) {
      const char * f = ts_node_field_name_for_child(p, i);
      return f ? std::string_view(f) : std::string_view();
    }
  }
  return {};
}

Parser::Parser(const TSLanguage * language) : parser_(ts_parser_new())
{
  if (parser_ != nullptr && language != nullptr) {
    language_set_ = ts_parser_set_language(parser_, language);
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

Tree Parser::parse_string(std::string_view source) const
{
  if (!language_set_) {
    return Tree();
  }
  // Tree-sitter consumes bytes; grammars expect UTF-8.
  return Tree(ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

}  // namespace tshl::ts_ll
