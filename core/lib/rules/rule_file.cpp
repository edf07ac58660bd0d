// tshl/rules/rule_file.cpp - Rule file parsing and override merging
#include "tshl/rules/rule_file.hpp"

#include <fmt/core.h>

#include <cctype>
#include <map>
#include <utility>

#include "tshl/match/choice_key.hpp"

namespace tshl
{

namespace
{

/// Rules are identified by their descriptor sequence, not by its spelling
using PathIndex = std::map<std::vector<NodeDescriptor>, size_t>;

struct Token
{
  std::string_view text;
  uint32_t column = 0;  // byte offset within the line
};

/// An open line on the indentation stack
struct OpenEntry
{
  uint32_t indent = 0;
  NodeDescriptor descriptor;
  SourceRange range;
  bool labelled = false;
  bool has_children = false;
};

bool is_label(std::string_view s) noexcept
{
  if (s.empty()) {
    return false;
  }
  const auto head = static_cast<unsigned char>(s.front());
  if (!std::isalpha(head) && head != '_') {
    return false;
  }
  for (const char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && uc != '_' && uc != '.' && uc != '-') {
      return false;
    }
  }
  return true;
}

std::vector<Token> split_tokens(std::string_view line, uint32_t start)
{
  std::vector<Token> tokens;
  uint32_t i = start;
  const auto n = static_cast<uint32_t>(line.size());
  while (i < n) {
    while (i < n && std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    if (i >= n || line[i] == '#') {
      break;
    }
    const uint32_t begin = i;
    while (i < n && !std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    tokens.push_back(Token{line.substr(begin, i - begin), begin});
  }
  return tokens;
}

class RuleFileParser
{
public:
  RuleFileParser(const SourceFile & source, FileId file, DiagnosticBag & diags)
  : source_(source), file_(file), diags_(diags)
  {
  }

  std::vector<Rule> run()
  {
    for (uint32_t line_index = 0; line_index < source_.line_count(); ++line_index) {
      parse_line(line_index);
    }
    while (!stack_.empty()) {
      close_top();
    }
    return std::move(rules_);
  }

  [[nodiscard]] bool failed() const noexcept { return failed_; }

private:
  SourceRange range_at(uint32_t line_offset, uint32_t column, size_t length) const
  {
    const uint32_t begin = line_offset + column;
    return SourceRange(file_, begin, begin + static_cast<uint32_t>(length));
  }

  void parse_line(uint32_t line_index)
  {
    std::string_view line = source_.get_line(line_index);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    const uint32_t line_offset = source_.get_line_offset(line_index);

    uint32_t indent = 0;
    while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) {
      if (line[indent] == '\t') {
        diags_
          .report_error(
            range_at(line_offset, indent, 1), "tab character in indentation", "use spaces")
          .with_code("E102");
        failed_ = true;
        return;
      }
      ++indent;
    }

    const std::vector<Token> tokens = split_tokens(line, indent);
    if (tokens.empty()) {
      return;
    }

    if (tokens.size() > 2) {
      const Token & extra = tokens[2];
      diags_
        .report_error(
          range_at(line_offset, extra.column, extra.text.size()),
          fmt::format("unexpected token '{}'", extra.text), "expected end of line")
        .with_code("E103")
        .with_help("a rule line is a descriptor optionally followed by one label");
      failed_ = true;
      return;
    }

    std::optional<NodeDescriptor> descriptor = NodeDescriptor::parse(tokens[0].text);
    if (!descriptor) {
      return;
    }

    std::optional<std::string> label;
    if (tokens.size() == 2) {
      const Token & label_token = tokens[1];
      if (!is_label(label_token.text)) {
        diags_
          .report_error(
            range_at(line_offset, label_token.column, label_token.text.size()),
            fmt::format("invalid label '{}'", label_token.text), "not a highlight group name")
          .with_code("E104");
        failed_ = true;
        return;
      }
      label = std::string(label_token.text);
    }

    // Close every entry that is not an ancestor of this line.
    std::optional<uint32_t> closed_indent;
    while (!stack_.empty() && stack_.back().indent >= indent) {
      closed_indent = stack_.back().indent;
      close_top();
    }

    const Token & last = tokens.back();
    const SourceRange line_range =
      range_at(line_offset, indent, last.column + last.text.size() - indent);

    if (stack_.empty()) {
      if (indent != 0) {
        diags_
          .report_error(
            range_at(line_offset, indent, tokens[0].text.size()),
            "indented line has no enclosing descriptor", "unexpected indentation")
          .with_code("E105");
        failed_ = true;
      }
    } else if (closed_indent && *closed_indent != indent) {
      diags_
        .report_error(
          range_at(line_offset, indent, tokens[0].text.size()), "inconsistent dedent",
          "does not match any enclosing indentation level")
        .with_code("E101")
        .with_help("align the line with an enclosing block");
      failed_ = true;
    }

    if (!stack_.empty()) {
      stack_.back().has_children = true;
    }
    stack_.push_back(OpenEntry{indent, std::move(*descriptor), line_range, label.has_value()});

    if (label) {
      add_rule(std::move(*label), line_range);
    }
  }

  void add_rule(std::string label, SourceRange range)
  {
    Rule rule;
    rule.path.reserve(stack_.size());
    for (const auto & entry : stack_) {
      rule.path.push_back(entry.descriptor);
    }
    rule.label = std::move(label);
    rule.origin = range;

    if (const auto it = index_.find(rule.path); it != index_.end()) {
      Rule & previous = rules_[it->second];
      diags_
        .report_warning(
          range, fmt::format("duplicate rule '{}'", rule.path_string()), "this label wins")
        .with_code("W202")
        .with_secondary_label(previous.origin, "previously defined here");
      previous.label = std::move(rule.label);
      previous.origin = rule.origin;
      return;
    }
    index_.emplace(rule.path, rules_.size());
    rules_.push_back(std::move(rule));
  }

  void close_top()
  {
    const OpenEntry & entry = stack_.back();
    if (!entry.labelled && !entry.has_children) {
      diags_
        .report_warning(
          entry.range, fmt::format("'{}' has no label", entry.descriptor.to_string()),
          "no rule ends here")
        .with_code("W201");
    }
    stack_.pop_back();
  }

  const SourceFile & source_;
  FileId file_;
  DiagnosticBag & diags_;

  std::vector<OpenEntry> stack_;
  std::vector<Rule> rules_;
  PathIndex index_;
  bool failed_ = false;
};

}  // namespace

std::optional<std::vector<Rule>> parse_rule_file(
  const SourceRegistry & sources, FileId file, DiagnosticBag & diags)
{
  const SourceFile * source = sources.get_file(file);
  if (source == nullptr) {
    diags.report_error({}, "unknown rule file").with_code("E106");
    return std::nullopt;
  }

  RuleFileParser parser(*source, file, diags);
  std::vector<Rule> rules = parser.run();
  if (parser.failed()) {
    return std::nullopt;
  }
  return rules;
}

std::optional<std::vector<Rule>> parse_rule_text(
  SourceRegistry & sources, const std::filesystem::path & virtual_path, std::string text,
  DiagnosticBag & diags)
{
  const FileId file = sources.register_file(virtual_path, text);
  // Re-registering a path keeps the old id; make sure it sees the new text.
  sources.update_content(file, std::move(text));
  return parse_rule_file(sources, file, diags);
}

void merge_rules(std::vector<Rule> & base, std::vector<Rule> overrides)
{
  PathIndex index;
  for (size_t i = 0; i < base.size(); ++i) {
    index[base[i].path] = i;
  }

  for (Rule & rule : overrides) {
    if (const auto it = index.find(rule.path); it != index.end()) {
      base[it->second].label = std::move(rule.label);
      base[it->second].origin = rule.origin;
      continue;
    }
    index.emplace(rule.path, base.size());
    base.push_back(std::move(rule));
  }
}

std::optional<std::vector<Rule>> load_rule_files(
  SourceRegistry & sources, const std::filesystem::path & base_path,
  const std::vector<std::filesystem::path> & override_paths, DiagnosticBag & diags)
{
  auto load_one = [&](const std::filesystem::path & path) -> std::optional<std::vector<Rule>> {
    const std::optional<FileId> file = sources.load_file(path);
    if (!file) {
      diags.report_error({}, fmt::format("cannot read rule file '{}'", path.string()))
        .with_code("E106");
      return std::nullopt;
    }
    return parse_rule_file(sources, *file, diags);
  };

  std::optional<std::vector<Rule>> rules = load_one(base_path);
  bool ok = rules.has_value();

  for (const auto & path : override_paths) {
    std::optional<std::vector<Rule>> overrides = load_one(path);
    if (!overrides) {
      ok = false;
      continue;
    }
    if (rules) {
      merge_rules(*rules, std::move(*overrides));
    }
  }

  if (!ok) {
    return std::nullopt;
  }
  return rules;
}

}  // namespace tshl
