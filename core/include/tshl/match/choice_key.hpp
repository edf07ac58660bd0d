// tshl/match/choice_key.hpp - Node descriptors and the keys used to index match nodes
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace tshl
{

// ============================================================================
// ChoiceKeyView - Non-owning (field, name) pair
// ============================================================================

/**
 * Lookup form of a choice key. An empty field means "unqualified".
 *
 * The matcher builds these straight from parse-tree node type and field
 * strings, so lookups never allocate.
 */
struct ChoiceKeyView
{
  std::string_view field;
  std::string_view name;

  [[nodiscard]] bool is_qualified() const noexcept { return !field.empty(); }
  [[nodiscard]] ChoiceKeyView unqualified() const noexcept { return {{}, name}; }
};

// ============================================================================
// ChoiceKey - Owning key stored in a MatchNode
// ============================================================================

class ChoiceKey
{
public:
  ChoiceKey() = default;
  explicit ChoiceKey(std::string name) : name_(std::move(name)) {}
  ChoiceKey(std::string field, std::string name) : field_(std::move(field)), name_(std::move(name))
  {
  }
  explicit ChoiceKey(ChoiceKeyView view) : field_(view.field), name_(view.name) {}

  [[nodiscard]] const std::string & field() const noexcept { return field_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] bool is_qualified() const noexcept { return !field_.empty(); }

  [[nodiscard]] ChoiceKeyView view() const noexcept { return {field_, name_}; }

  /// "field:name" or "name"
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const ChoiceKey & other) const noexcept
  {
    return field_ == other.field_ && name_ == other.name_;
  }
  [[nodiscard]] bool operator!=(const ChoiceKey & other) const noexcept
  {
    return !(*this == other);
  }

private:
  std::string field_;
  std::string name_;
};

[[nodiscard]] inline bool operator==(ChoiceKeyView a, ChoiceKeyView b) noexcept
{
  return a.field == b.field && a.name == b.name;
}

/// Transparent ordering so maps keyed by ChoiceKey can be probed with a view.
struct ChoiceKeyLess
{
  using is_transparent = void;

  [[nodiscard]] static ChoiceKeyView as_view(const ChoiceKey & k) noexcept { return k.view(); }
  [[nodiscard]] static ChoiceKeyView as_view(ChoiceKeyView k) noexcept { return k; }

  template <typename A, typename B>
  [[nodiscard]] bool operator()(const A & a, const B & b) const noexcept
  {
    const ChoiceKeyView va = as_view(a);
    const ChoiceKeyView vb = as_view(b);
    return std::tie(va.field, va.name) < std::tie(vb.field, vb.name);
  }
};

// ============================================================================
// NodeDescriptor - One element of a rule's ancestor chain
// ============================================================================

/**
 * A parse-tree node shape: a node type name plus an optional field qualifier.
 *
 * A repeatable descriptor matches a run of one or more consecutive ancestors
 * that share its key (e.g. nested `attribute` nodes of `a.b.c()`).
 */
struct NodeDescriptor
{
  std::string name;
  std::optional<std::string> field;
  bool repeat = false;

  [[nodiscard]] ChoiceKey key() const
  {
    return field ? ChoiceKey(*field, name) : ChoiceKey(name);
  }

  /// Rule-file spelling: "[field:]name[+]"
  [[nodiscard]] std::string to_string() const;

  /**
   * Parse a rule-file descriptor token.
   *
   * The token is split at the first ':' only when both sides are non-empty
   * and the left side is an identifier, so punctuation node types such as
   * ":" or "::" stay intact. A trailing '+' marks repetition only when it
   * follows a name character, so "+" and "operator:+" name the '+' token.
   */
  [[nodiscard]] static std::optional<NodeDescriptor> parse(std::string_view token);

  [[nodiscard]] bool operator==(const NodeDescriptor & other) const noexcept
  {
    return name == other.name && field == other.field && repeat == other.repeat;
  }
  [[nodiscard]] bool operator!=(const NodeDescriptor & other) const noexcept
  {
    return !(*this == other);
  }

  /// Orders descriptors so whole paths can key a map
  [[nodiscard]] bool operator<(const NodeDescriptor & other) const noexcept
  {
    return std::tie(name, field, repeat) < std::tie(other.name, other.field, other.repeat);
  }
};

/// True for [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] bool is_identifier(std::string_view s) noexcept;

}  // namespace tshl
