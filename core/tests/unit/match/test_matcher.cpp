// test_matcher.cpp - Highlighting hand-built parse trees with a match tree
//
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tshl/match/match_tree.hpp"
#include "tshl/match/matcher.hpp"
#include "tshl/match/rule.hpp"
#include "tshl/test_support/syntax_tree.hpp"

using tshl::HighlightInstruction;
using tshl::make_rule;
using tshl::MatchTree;
using tshl::Rule;
using tshl::TextSpan;
using tshl::test_support::SyntaxTree;

namespace
{

std::shared_ptr<const MatchTree> compile(const std::vector<Rule> & rules)
{
  auto result = tshl::build_match_tree(rules);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  return result.tree;
}

std::vector<std::string> labels_of(const std::vector<HighlightInstruction> & out)
{
  std::vector<std::string> labels;
  for (const auto & inst : out) {
    labels.push_back(inst.label);
  }
  return labels;
}

/// module > class_definition over "class Foo:\n    \"\"\"Doc.\"\"\"\n"
struct ClassWithDocstring
{
  SyntaxTree tree{"class Foo:\n    \"\"\"Doc.\"\"\"\n"};
  SyntaxTree::Node module, class_def, class_kw, name, colon, block, stmt, string;

  ClassWithDocstring()
  {
    module = tree.add_root("module");
    class_def = tree.add_child(module, "class_definition", 0, 25);
    class_kw = tree.add_child(class_def, "class", 0, 5);
    name = tree.add_child(class_def, "identifier", 6, 9, "name");
    colon = tree.add_child(class_def, ":", 9, 10);
    block = tree.add_child(class_def, "block", 15, 25, "body");
    stmt = tree.add_child(block, "expression_statement", 15, 25);
    string = tree.add_child(stmt, "string", 15, 25);
    tree.add_child(string, "string_start", 15, 18);
    tree.add_child(string, "string_content", 18, 22);
    tree.add_child(string, "string_end", 22, 25);
  }
};

}  // namespace

// =============================================================================
// Worked examples
// =============================================================================

TEST(MatcherTest, ClassDefinitionWithDocstring)
{
  const auto tree = compile({
    make_rule({"class_definition", "class"}, "Class"),
    make_rule({"class_definition", "name:identifier"}, "ClassName"),
    make_rule({"class_definition", "block", "expression_statement", "string"}, "DocString"),
  });

  ClassWithDocstring src;
  const auto out = tshl::highlight(*tree, src.tree.root());

  ASSERT_EQ(out.size(), 3u);

  EXPECT_EQ(out[0].label, "Class");
  EXPECT_EQ(out[0].span, (TextSpan{0, 5, {0, 0}, {0, 5}}));

  EXPECT_EQ(out[1].label, "ClassName");
  EXPECT_EQ(out[1].span, (TextSpan{6, 9, {0, 6}, {0, 9}}));

  // The block sits in the "body" field; the bare "block" key still matches.
  EXPECT_EQ(out[2].label, "DocString");
  EXPECT_EQ(out[2].span, (TextSpan{15, 25, {1, 4}, {1, 14}}));
}

TEST(MatcherTest, LongerAncestorChainWins)
{
  const auto tree = compile({
    make_rule({"string"}, "String"),
    make_rule({"module", "expression_statement", "string"}, "StringDocumentation"),
  });

  SyntaxTree src("\"doc\"\n");
  auto module = src.add_root("module");
  auto stmt = src.add_child(module, "expression_statement", 0, 5);
  src.add_child(stmt, "string", 0, 5);

  const auto out = tshl::highlight(*tree, src.root());

  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].label, "StringDocumentation");
  EXPECT_EQ(out[0].span.start_byte, 0u);
  EXPECT_EQ(out[0].span.end_byte, 5u);
}

TEST(MatcherTest, ShorterRuleAppliesWhenLongerChainBreaks)
{
  const auto tree = compile({
    make_rule({"string"}, "String"),
    make_rule({"module", "expression_statement", "string"}, "StringDocumentation"),
  });

  // module > expression_statement > call > string: the chain breaks at call.
  SyntaxTree src("f(\"x\")\n");
  auto module = src.add_root("module");
  auto stmt = src.add_child(module, "expression_statement", 0, 6);
  auto call = src.add_child(stmt, "call", 0, 6);
  src.add_child_over(call, "string", "\"x\"");

  const auto out = tshl::highlight(*tree, src.root());

  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].label, "String");
  EXPECT_EQ(out[0].span.start_byte, 2u);
  EXPECT_EQ(out[0].span.end_byte, 5u);
}

TEST(MatcherTest, IntermediateLabelKeptWhenDeeperLevelHasNone)
{
  // [b, c] is labelled; [a, x, b, c] reaches a deeper node but the chain
  // a > b > c does not go through x, so the [b, c] label stands.
  const auto tree = compile({
    make_rule({"b", "c"}, "BC"),
    make_rule({"a", "x", "b", "c"}, "AXBC"),
  });

  SyntaxTree src("abc");
  auto a = src.add_root("a");
  auto b = src.add_child(a, "b", 1, 3);
  src.add_child(b, "c", 2, 3);

  EXPECT_EQ(labels_of(tshl::highlight(*tree, src.root())), std::vector<std::string>{"BC"});
}

// =============================================================================
// Field qualification
// =============================================================================

TEST(MatcherTest, QualifiedKeyPreferredForTheNodeItself)
{
  const auto tree = compile({
    make_rule({"identifier"}, "Identifier"),
    make_rule({"name:identifier"}, "Name"),
  });

  SyntaxTree src("def f(x): y");
  auto root = src.add_root("function_definition");
  src.add_child(root, "identifier", 4, 5, "name");
  src.add_child(root, "identifier", 6, 7, "parameters");
  src.add_child(root, "identifier", 10, 11);

  EXPECT_EQ(
    labels_of(tshl::highlight(*tree, src.root())),
    (std::vector<std::string>{"Name", "Identifier", "Identifier"}));
}

TEST(MatcherTest, QualifiedKeyPreferredForAncestors)
{
  const auto tree = compile({
    make_rule({"block", "string"}, "BlockString"),
    make_rule({"body:block", "string"}, "BodyString"),
  });

  SyntaxTree src("'a' 'b'");
  auto root = src.add_root("class_definition");
  auto body = src.add_child(root, "block", 0, 3, "body");
  src.add_child(body, "string", 0, 3);
  auto other = src.add_child(root, "block", 4, 7);
  src.add_child(other, "string", 4, 7);

  EXPECT_EQ(
    labels_of(tshl::highlight(*tree, src.root())),
    (std::vector<std::string>{"BodyString", "BlockString"}));
}

TEST(MatcherTest, QualifiedMatchIsNotRetriedWithBareName)
{
  // The qualified key matches at the first level, so the walk follows it
  // even though the bare key would have led to a longer rule.
  const auto tree = compile({
    make_rule({"function:identifier"}, "Function"),
    make_rule({"call", "identifier"}, "CalledFunction"),
  });

  SyntaxTree src("f()");
  auto call = src.add_root("call");
  src.add_child_over(call, "identifier", "f", "function");

  EXPECT_EQ(labels_of(tshl::highlight(*tree, src.root())), std::vector<std::string>{"Function"});
}

TEST(MatcherTest, RootFieldIsIgnored)
{
  const auto tree = compile({make_rule({"name:identifier"}, "Name")});

  // A sub-tree handed to highlight() is treated as a whole tree.
  SyntaxTree src("x = f");
  auto root = src.add_root("assignment");
  auto right = src.add_child_over(root, "identifier", "f", "name");

  EXPECT_TRUE(tshl::highlight(*tree, right).empty());
  EXPECT_EQ(labels_of(tshl::highlight(*tree, src.root())), std::vector<std::string>{"Name"});
}

// =============================================================================
// Traversal
// =============================================================================

TEST(MatcherTest, UnmatchedParentsDoNotHideDescendants)
{
  const auto tree = compile({make_rule({"integer"}, "Number")});

  SyntaxTree src("f(1, [2])");
  auto module = src.add_root("module");
  auto call = src.add_child(module, "call", 0, 9);
  auto args = src.add_child(call, "argument_list", 1, 9, "arguments");
  src.add_child_over(args, "integer", "1");
  auto list = src.add_child_over(args, "list", "[2]");
  src.add_child_over(list, "integer", "2");

  const auto out = tshl::highlight(*tree, src.root());

  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].span.start_byte, 2u);
  EXPECT_EQ(out[1].span.start_byte, 6u);
}

TEST(MatcherTest, InstructionsFollowPreOrder)
{
  const auto tree = compile({
    make_rule({"a"}, "A"),
    make_rule({"b"}, "B"),
    make_rule({"c"}, "C"),
  });

  // a(b(c), c)
  SyntaxTree src("abcc");
  auto a = src.add_root("a");
  auto b = src.add_child(a, "b", 1, 3);
  src.add_child(b, "c", 2, 3);
  src.add_child(a, "c", 3, 4);

  const auto out = tshl::highlight(*tree, src.root());

  EXPECT_EQ(labels_of(out), (std::vector<std::string>{"A", "B", "C", "C"}));
  EXPECT_EQ(out[2].span.start_byte, 2u);
  EXPECT_EQ(out[3].span.start_byte, 3u);
}

TEST(MatcherTest, SpansAreCopiedFromNodes)
{
  const auto tree = compile({make_rule({"identifier"}, "Identifier")});

  SyntaxTree src("x = 1\n\nvalue = 2\n");
  auto module = src.add_root("module");
  src.add_child_over(module, "identifier", "value");

  const auto out = tshl::highlight(*tree, src.root());

  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].span, (TextSpan{7, 12, {2, 0}, {2, 5}}));
}

TEST(MatcherTest, EmptyTreeProducesNothing)
{
  const MatchTree empty;
  ClassWithDocstring src;
  EXPECT_TRUE(tshl::highlight(empty, src.tree.root()).empty());
}

TEST(MatcherTest, HighlightIsIdempotent)
{
  const auto tree = compile({
    make_rule({"class_definition", "class"}, "Class"),
    make_rule({"identifier"}, "Identifier"),
  });

  ClassWithDocstring src;
  const auto first = tshl::highlight(*tree, src.tree.root());
  const auto second = tshl::highlight(*tree, src.tree.root());
  EXPECT_EQ(first, second);
}

// =============================================================================
// Repetition
// =============================================================================

TEST(MatcherTest, RepeatedDescriptorConsumesNestedAncestors)
{
  const auto tree = compile({make_rule({"decorator", "attribute+", "identifier"}, "Decorator")});

  // @a.b.c : decorator > attribute > attribute > identifier
  SyntaxTree src("@a.b.c");
  auto decorator = src.add_root("decorator");
  auto outer = src.add_child(decorator, "attribute", 1, 6);
  auto inner = src.add_child(outer, "attribute", 1, 4, "object");
  src.add_child_over(inner, "identifier", "a", "object");
  src.add_child_over(inner, "identifier", "b", "attribute");
  src.add_child_over(outer, "identifier", "c", "attribute");

  const auto out = tshl::highlight(*tree, src.root());
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].span.start_byte, 1u);
  EXPECT_EQ(out[1].span.start_byte, 3u);
  EXPECT_EQ(out[2].span.start_byte, 5u);
}

TEST(MatcherTest, RepeatedDescriptorNeedsAtLeastOneAncestor)
{
  const auto tree = compile({make_rule({"decorator", "attribute+", "identifier"}, "Decorator")});

  SyntaxTree single("@a.b");
  auto decorator = single.add_root("decorator");
  auto attr = single.add_child(decorator, "attribute", 1, 4);
  single.add_child_over(attr, "identifier", "a", "object");
  single.add_child_over(attr, "identifier", "b", "attribute");

  SyntaxTree bare("@a");
  auto bare_decorator = bare.add_root("decorator");
  bare.add_child_over(bare_decorator, "identifier", "a");

  EXPECT_EQ(
    labels_of(tshl::highlight(*tree, single.root())),
    (std::vector<std::string>{"Decorator", "Decorator"}));
  EXPECT_TRUE(tshl::highlight(*tree, bare.root()).empty());
}

// =============================================================================
// Overrides
// =============================================================================

TEST(MatcherTest, LaterRuleForSamePathWins)
{
  const auto tree = compile({
    make_rule({"class_definition", "class"}, "Keyword"),
    make_rule({"class_definition", "class"}, "Class"),
  });

  ClassWithDocstring src;
  EXPECT_EQ(labels_of(tshl::highlight(*tree, src.tree.root())), std::vector<std::string>{"Class"});
}

TEST(MatcherTest, OverridingOneBranchKeepsSiblingRules)
{
  // Both rules share the innermost two keys [string, block]; they part ways
  // at the enclosing definition.
  const auto base = compile({
    make_rule({"class_definition", "block", "string"}, "ClassDoc"),
    make_rule({"function_definition", "block", "string"}, "FunctionDoc"),
  });
  const auto overridden = compile({
    make_rule({"class_definition", "block", "string"}, "ClassDoc"),
    make_rule({"function_definition", "block", "string"}, "FunctionDoc"),
    make_rule({"function_definition", "block", "string"}, "Docstring"),
  });

  SyntaxTree src("'c' 'f'");
  auto module = src.add_root("module");
  auto cls = src.add_child(module, "class_definition", 0, 3);
  auto cls_body = src.add_child(cls, "block", 0, 3, "body");
  src.add_child(cls_body, "string", 0, 3);
  auto fn = src.add_child(module, "function_definition", 4, 7);
  auto fn_body = src.add_child(fn, "block", 4, 7, "body");
  src.add_child(fn_body, "string", 4, 7);

  EXPECT_EQ(
    labels_of(tshl::highlight(*base, src.root())),
    (std::vector<std::string>{"ClassDoc", "FunctionDoc"}));
  EXPECT_EQ(
    labels_of(tshl::highlight(*overridden, src.root())),
    (std::vector<std::string>{"ClassDoc", "Docstring"}));
}

// =============================================================================
// classify()
// =============================================================================

TEST(MatcherTest, ClassifyAgreesWithHighlight)
{
  const auto tree = compile({
    make_rule({"class_definition", "class"}, "Class"),
    make_rule({"class_definition", "name:identifier"}, "ClassName"),
    make_rule({"class_definition", "block", "expression_statement", "string"}, "DocString"),
    make_rule({"string"}, "String"),
  });

  ClassWithDocstring src;

  EXPECT_EQ(tshl::classify(*tree, src.class_kw), std::optional<std::string>("Class"));
  EXPECT_EQ(tshl::classify(*tree, src.name), std::optional<std::string>("ClassName"));
  EXPECT_EQ(tshl::classify(*tree, src.string), std::optional<std::string>("DocString"));
  EXPECT_FALSE(tshl::classify(*tree, src.colon).has_value());
  EXPECT_FALSE(tshl::classify(*tree, src.block).has_value());
  EXPECT_FALSE(tshl::classify(*tree, SyntaxTree::Node()).has_value());

  // Every emitted instruction is what classify() says about that node.
  const auto out = tshl::highlight(*tree, src.tree.root());
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].label, *tshl::classify(*tree, src.class_kw));
  EXPECT_EQ(out[1].label, *tshl::classify(*tree, src.name));
  EXPECT_EQ(out[2].label, *tshl::classify(*tree, src.string));
}

TEST(MatcherTest, ResolveLabelWalksChainFromTheEnd)
{
  const auto tree = compile({
    make_rule({"string"}, "String"),
    make_rule({"module", "expression_statement", "string"}, "StringDocumentation"),
  });

  const std::vector<tshl::ChoiceKeyView> full{
    {{}, "module"}, {{}, "expression_statement"}, {{}, "string"}};
  const std::vector<tshl::ChoiceKeyView> partial{{{}, "call"}, {{}, "string"}};
  const std::vector<tshl::ChoiceKeyView> none{{{}, "module"}};

  const std::string * label = tshl::resolve_label(*tree, full);
  ASSERT_NE(label, nullptr);
  EXPECT_EQ(*label, "StringDocumentation");

  label = tshl::resolve_label(*tree, partial);
  ASSERT_NE(label, nullptr);
  EXPECT_EQ(*label, "String");

  EXPECT_EQ(tshl::resolve_label(*tree, none), nullptr);
  EXPECT_EQ(tshl::resolve_label(*tree, gsl::span<const tshl::ChoiceKeyView>()), nullptr);
}
