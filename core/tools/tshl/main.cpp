// tshl - Tree-sitter highlighter command line interface
//
// Usage:
//   tshl highlight <file> [--rules <r>] [--override <o>]... [--config <c>] [--format f]
//   tshl query <file> <line>:<col> [--rules <r>] [--override <o>]... [--config <c>]
//   tshl check <rules> [--override <o>]...
//   tshl dump <rules> [--override <o>]...
//
#include <tree_sitter/api.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "tshl/basic/diagnostic_printer.hpp"
#include "tshl/basic/source_manager.hpp"
#include "tshl/config/highlight_config.hpp"
#include "tshl/match/match_tree.hpp"
#include "tshl/match/match_tree_registry.hpp"
#include "tshl/match/matcher.hpp"
#include "tshl/output/highlight_output.hpp"
#include "tshl/rules/rule_file.hpp"
#include "tshl/syntax/ts_ll.hpp"

extern "C" const TSLanguage * tree_sitter_python();

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "tshl - tree-sitter highlighter v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  highlight <file>            Print highlight spans for a source file\n"
            << "  query <file> <line:col>     Print the label of the node at a position\n"
            << "  check <rules>               Load and compile rule files\n"
            << "  dump <rules>                Print the compiled match tree\n\n"
            << "Options:\n"
            << "  -r, --rules <path>          Base rule file\n"
            << "  -O, --override <path>       Override rule file (repeatable)\n"
            << "  -c, --config <path>         Configuration file (tshl.yaml)\n"
            << "  -l, --language <name>       Language entry from the configuration\n"
            << "  -f, --format <fmt>          Output: text (default), json, props\n"
            << "  -v, --verbose               Verbose output\n"
            << "  -h, --help                  Show this help message\n";
}

void print_diagnostics(const tshl::DiagnosticBag & diags, const tshl::SourceRegistry & sources)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  tshl::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diags, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string rules_path;
  std::vector<std::string> override_paths;
  std::string config_path;
  std::string language;
  std::string format = "text";
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if ((arg == "-r" || arg == "--rules") && i + 1 < argc) {
      args.rules_path = argv[++i];
    } else if ((arg == "-O" || arg == "--override") && i + 1 < argc) {
      args.override_paths.emplace_back(argv[++i]);
    } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if ((arg == "-l" || arg == "--language") && i + 1 < argc) {
      args.language = argv[++i];
    } else if ((arg == "-f" || arg == "--format") && i + 1 < argc) {
      args.format = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.positional.push_back(arg);
    } else {
      std::cerr << "warning: ignoring unknown option '" << arg << "'\n";
    }
  }

  return args;
}

// ============================================================================
// Setup shared by the commands
// ============================================================================

const TSLanguage * grammar_by_name(const std::string & name)
{
  if (name == "python") {
    return tree_sitter_python();
  }
  return nullptr;
}

struct LanguageSetup
{
  std::string language;
  std::string grammar;
  fs::path rules;
  std::vector<fs::path> overrides;
};

/// Work out which rule files and grammar apply to `source_path`.
std::optional<LanguageSetup> resolve_language(const CommandArgs & args, const fs::path & source_path)
{
  LanguageSetup setup;
  setup.language = args.language.empty() ? "python" : args.language;
  setup.grammar = setup.language;

  if (!args.config_path.empty()) {
    const auto config_result = tshl::load_highlight_config(args.config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return std::nullopt;
    }

    const tshl::HighlightConfig & config = config_result.config;
    const tshl::LanguageConfig * lang = args.language.empty()
                                          ? config.language_for_path(source_path)
                                          : config.find_language(args.language);
    if (lang == nullptr) {
      std::cerr << "error: no language configured for " << source_path.string() << "\n";
      return std::nullopt;
    }
    setup.language = lang->name;
    setup.grammar = lang->grammar;
    setup.rules = lang->rules;
    setup.overrides = lang->overrides;
  }

  if (!args.rules_path.empty()) {
    setup.rules = args.rules_path;
  }
  for (const auto & o : args.override_paths) {
    setup.overrides.emplace_back(o);
  }

  if (setup.rules.empty()) {
    std::cerr << "error: no rule file given (use --rules or --config)\n";
    return std::nullopt;
  }
  return setup;
}

/// Load rule files and publish the compiled tree. Prints diagnostics.
std::shared_ptr<const tshl::MatchTree> compile_rules(
  tshl::MatchTreeRegistry & registry, const std::string & language, const fs::path & rules,
  const std::vector<fs::path> & overrides, bool verbose)
{
  tshl::SourceRegistry sources;
  tshl::DiagnosticBag diags;

  const auto loaded = tshl::load_rule_files(sources, rules, overrides, diags);
  if (!loaded) {
    print_diagnostics(diags, sources);
    return nullptr;
  }

  tshl::BuildResult build = registry.rebuild(language, *loaded);
  diags.merge(std::move(build.diagnostics));
  if (!diags.empty()) {
    print_diagnostics(diags, sources);
  }
  if (!build.success) {
    return nullptr;
  }

  if (verbose) {
    std::cerr << "Loaded " << loaded->size() << " rules from " << rules.string() << " ("
              << overrides.size() << " override files), " << build.tree->node_count()
              << " match nodes\n";
  }
  return registry.get(language);
}

std::optional<std::string> read_file(const fs::path & path)
{
  tshl::SourceRegistry sources;
  const auto id = sources.load_file(path);
  if (!id) {
    return std::nullopt;
  }
  return std::string(sources.get_file(*id)->content());
}

// ============================================================================
// Commands
// ============================================================================

int cmd_highlight(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: highlight requires a source file\n";
    return 1;
  }
  if (args.format != "text" && args.format != "json" && args.format != "props") {
    std::cerr << "error: unknown format '" << args.format << "'\n";
    return 1;
  }

  const fs::path source_path = args.positional[0];
  const auto setup = resolve_language(args, source_path);
  if (!setup) {
    return 1;
  }

  const TSLanguage * grammar = grammar_by_name(setup->grammar);
  if (grammar == nullptr) {
    std::cerr << "error: unknown grammar '" << setup->grammar << "'\n";
    return 1;
  }

  tshl::MatchTreeRegistry registry;
  const auto tree =
    compile_rules(registry, setup->language, setup->rules, setup->overrides, args.verbose);
  if (!tree) {
    return 1;
  }

  const auto source = read_file(source_path);
  if (!source) {
    std::cerr << "error: file not found: " << source_path.string() << "\n";
    return 1;
  }

  tshl::ts_ll::Parser parser(grammar);
  if (!parser.ok()) {
    std::cerr << "error: grammar '" << setup->grammar << "' is incompatible with tree-sitter\n";
    return 1;
  }
  const tshl::ts_ll::Tree parse_tree = parser.parse_string(*source);
  if (parse_tree.is_null()) {
    std::cerr << "error: failed to parse " << source_path.string() << "\n";
    return 1;
  }

  const auto start = std::chrono::steady_clock::now();
  const auto instructions = tshl::highlight(*tree, parse_tree.root_node());
  const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);

  if (args.format == "json") {
    std::cout << tshl::to_json(instructions).dump(2) << "\n";
  } else if (args.format == "props") {
    std::cout << tshl::to_json(tshl::group_by_label(instructions)).dump(2) << "\n";
  } else {
    tshl::write_text(instructions, std::cout);
  }

  if (args.verbose) {
    std::cerr << "Produced " << instructions.size() << " highlight spans in " << elapsed.count()
              << "s\n";
  }
  return 0;
}

int cmd_query(const CommandArgs & args)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: query requires a source file and a <line>:<col> position\n";
    return 1;
  }

  const fs::path source_path = args.positional[0];
  const std::string & position = args.positional[1];
  const auto colon = position.find(':');
  unsigned long line = 0;
  unsigned long column = 0;
  try {
    if (colon == std::string::npos) {
      throw std::invalid_argument(position);
    }
    line = std::stoul(position.substr(0, colon));
    column = std::stoul(position.substr(colon + 1));
  } catch (const std::exception &) {
    std::cerr << "error: invalid position '" << position << "' (expected <line>:<col>)\n";
    return 1;
  }
  if (line == 0 || column == 0) {
    std::cerr << "error: positions are 1-based\n";
    return 1;
  }

  const auto setup = resolve_language(args, source_path);
  if (!setup) {
    return 1;
  }
  const TSLanguage * grammar = grammar_by_name(setup->grammar);
  if (grammar == nullptr) {
    std::cerr << "error: unknown grammar '" << setup->grammar << "'\n";
    return 1;
  }

  tshl::MatchTreeRegistry registry;
  const auto tree =
    compile_rules(registry, setup->language, setup->rules, setup->overrides, args.verbose);
  if (!tree) {
    return 1;
  }

  const auto source = read_file(source_path);
  if (!source) {
    std::cerr << "error: file not found: " << source_path.string() << "\n";
    return 1;
  }

  tshl::ts_ll::Parser parser(grammar);
  const tshl::ts_ll::Tree parse_tree = parser.parse_string(*source);
  if (parse_tree.is_null()) {
    std::cerr << "error: failed to parse " << source_path.string() << "\n";
    return 1;
  }

  const tshl::TextPoint point{
    static_cast<uint32_t>(line - 1), static_cast<uint32_t>(column - 1)};
  for (auto node = parse_tree.root_node().descendant_at(point); !node.is_null();
       node = node.parent()) {
    const auto label = tshl::classify(*tree, node);
    const std::string_view field = node.field_name();
    std::cout << (field.empty() ? "" : std::string(field) + ":") << node.kind() << " "
              << (label ? *label : "-") << "\n";
  }
  return 0;
}

int cmd_check(const CommandArgs & args, bool dump)
{
  if (args.positional.empty()) {
    std::cerr << "error: " << args.command << " requires a rule file\n";
    return 1;
  }

  std::vector<fs::path> overrides(args.override_paths.begin(), args.override_paths.end());
  tshl::MatchTreeRegistry registry;
  const auto tree = compile_rules(registry, "rules", args.positional[0], overrides, args.verbose);
  if (!tree) {
    return 1;
  }

  if (dump) {
    tshl::dump_match_tree(*tree, std::cout);
  } else {
    std::cerr << "ok: " << tree->label_count() << " labelled paths, " << tree->node_count()
              << " match nodes\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "highlight") {
    return cmd_highlight(args);
  }
  if (args.command == "query") {
    return cmd_query(args);
  }
  if (args.command == "check") {
    return cmd_check(args, /*dump*/ false);
  }
  if (args.command == "dump") {
    return cmd_check(args, /*dump*/ true);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n\n";
  print_usage(argv[0]);
  return 1;
}
