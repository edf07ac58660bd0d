// test_python_highlight.cpp - Bundled Python rules against the real grammar
//
#include <gtest/gtest.h>

#include <tree_sitter/api.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "tshl/basic/diagnostic.hpp"
#include "tshl/basic/source_manager.hpp"
#include "tshl/match/match_tree.hpp"
#include "tshl/match/matcher.hpp"
#include "tshl/rules/rule_file.hpp"
#include "tshl/syntax/ts_ll.hpp"

extern "C" const TSLanguage * tree_sitter_python();

namespace
{

using TextAndLabel = std::pair<std::string, std::string>;

class PythonHighlightTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    tshl::SourceRegistry sources;
    tshl::DiagnosticBag diags;
    const auto rules = tshl::load_rule_files(
      sources, std::string(TSHL_DATA_DIR) + "/python.rules", {}, diags);
    ASSERT_TRUE(rules.has_value());
    ASSERT_FALSE(diags.has_errors());
    EXPECT_FALSE(diags.has_warnings());

    auto result = tshl::build_match_tree(*rules);
    ASSERT_TRUE(result.success);
    tree_ = result.tree;
  }

  std::set<TextAndLabel> highlight(const std::string & source)
  {
    tshl::ts_ll::Parser parser(tree_sitter_python());
    EXPECT_TRUE(parser.ok());
    const tshl::ts_ll::Tree tree = parser.parse_string(source);
    EXPECT_FALSE(tree.is_null());

    std::set<TextAndLabel> out;
    for (const auto & inst : tshl::highlight(*tree_, tree.root_node())) {
      const auto & s = inst.span;
      out.emplace(source.substr(s.start_byte, s.end_byte - s.start_byte), inst.label);
    }
    return out;
  }

  std::shared_ptr<const tshl::MatchTree> tree_;
};

void collect_preorder(tshl::ts_ll::Node node, std::vector<tshl::ts_ll::Node> & out)
{
  out.push_back(node);
  for (uint32_t i = 0; i < node.child_count(); ++i) {
    collect_preorder(node.child(i), out);
  }
}

}  // namespace

TEST_F(PythonHighlightTest, ClassWithDocstringAndMethod)
{
  const std::string src =
    "class Foo:\n"
    "    \"\"\"Doc.\"\"\"\n"
    "\n"
    "    def bar(self, x):\n"
    "        return x\n";

  const auto out = highlight(src);

  EXPECT_EQ(out.count({"class", "Class"}), 1u);
  EXPECT_EQ(out.count({"Foo", "ClassName"}), 1u);
  EXPECT_EQ(out.count({"\"\"\"Doc.\"\"\"", "DocString"}), 1u);
  EXPECT_EQ(out.count({"def", "Method"}), 1u);
  EXPECT_EQ(out.count({"bar", "MethodName"}), 1u);
  EXPECT_EQ(out.count({"self", "Parameter"}), 1u);
  EXPECT_EQ(out.count({"x", "Parameter"}), 1u);
  EXPECT_EQ(out.count({"return", "Return"}), 1u);
  EXPECT_EQ(out.count({"x", "Identifier"}), 1u);
}

TEST_F(PythonHighlightTest, ModuleDocstringAndPlainString)
{
  const std::string src =
    "\"\"\"Module.\"\"\"\n"
    "x = 'text'\n";

  const auto out = highlight(src);

  EXPECT_EQ(out.count({"\"\"\"Module.\"\"\"", "DocString"}), 1u);
  EXPECT_EQ(out.count({"'text'", "String"}), 1u);
  EXPECT_EQ(out.count({"x", "Identifier"}), 1u);
}

TEST_F(PythonHighlightTest, FunctionsAndCalls)
{
  const std::string src =
    "def run(n):\n"
    "    print(n)\n"
    "    os.path.join(n)\n";

  const auto out = highlight(src);

  EXPECT_EQ(out.count({"def", "Function"}), 1u);
  EXPECT_EQ(out.count({"run", "FunctionName"}), 1u);
  EXPECT_EQ(out.count({"print", "CalledFunction"}), 1u);
  EXPECT_EQ(out.count({"join", "CalledMethod"}), 1u);
  EXPECT_EQ(out.count({"n", "Argument"}), 1u);
}

TEST_F(PythonHighlightTest, Imports)
{
  const std::string src =
    "import os\n"
    "from a import b as c\n";

  const auto out = highlight(src);

  EXPECT_EQ(out.count({"import", "Import"}), 1u);
  EXPECT_EQ(out.count({"os", "ImportedName"}), 1u);
  EXPECT_EQ(out.count({"from", "Import"}), 1u);
  EXPECT_EQ(out.count({"as", "Import"}), 1u);
  EXPECT_EQ(out.count({"c", "ImportedAliasedName"}), 1u);
}

TEST_F(PythonHighlightTest, ClassifyMatchesHighlightOnEveryNode)
{
  const std::string src =
    "class A(B):\n"
    "    \"\"\"Doc.\"\"\"\n"
    "    def f(self, y: int) -> None:\n"
    "        return g(y).h(1.5, True)\n";

  tshl::ts_ll::Parser parser(tree_sitter_python());
  const tshl::ts_ll::Tree tree = parser.parse_string(src);
  ASSERT_FALSE(tree.is_null());

  std::vector<tshl::ts_ll::Node> nodes;
  collect_preorder(tree.root_node(), nodes);

  std::vector<std::string> classified;
  for (const auto & node : nodes) {
    if (const std::optional<std::string> label = tshl::classify(*tree_, node)) {
      classified.push_back(*label);
    }
  }

  std::vector<std::string> highlighted;
  for (const auto & inst : tshl::highlight(*tree_, tree.root_node())) {
    highlighted.push_back(inst.label);
  }

  EXPECT_FALSE(highlighted.empty());
  EXPECT_EQ(classified, highlighted);
}
