// tshl/match/choice_key.cpp - Descriptor parsing and formatting
#include "tshl/match/choice_key.hpp"

#include <cctype>

namespace tshl
{

namespace
{

bool is_name_char(char c) noexcept
{
  const auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || uc == '_';
}

}  // namespace

bool is_identifier(std::string_view s) noexcept
{
  if (s.empty()) {
    return false;
  }
  const auto head = static_cast<unsigned char>(s.front());
  if (!std::isalpha(head) && head != '_') {
    return false;
  }
  for (const char c : s.substr(1)) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && uc != '_') {
      return false;
    }
  }
  return true;
}

std::string ChoiceKey::to_string() const
{
  if (field_.empty()) {
    return name_;
  }
  return field_ + ":" + name_;
}

std::string NodeDescriptor::to_string() const
{
  std::string out;
  if (field) {
    out += *field;
    out += ':';
  }
  out += name;
  if (repeat) {
    out += '+';
  }
  return out;
}

std::optional<NodeDescriptor> NodeDescriptor::parse(std::string_view token)
{
  if (token.empty()) {
    return std::nullopt;
  }

  NodeDescriptor desc;
  if (token.size() > 1 && token.back() == '+' && is_name_char(token[token.size() - 2])) {
    desc.repeat = true;
    token.remove_suffix(1);
  }

  const auto colon = token.find(':');
  if (colon != std::string_view::npos && colon > 0 && colon + 1 < token.size()) {
    const std::string_view field = token.substr(0, colon);
    if (is_identifier(field)) {
      desc.field = std::string(field);
      token.remove_prefix(colon + 1);
    }
  }

  desc.name = std::string(token);
  return desc;
}

}  // namespace tshl
