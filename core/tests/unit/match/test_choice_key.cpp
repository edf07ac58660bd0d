// test_choice_key.cpp - Descriptor tokens and choice keys
//
#include <gtest/gtest.h>

#include <map>
#include <string>

#include "tshl/match/choice_key.hpp"
#include "tshl/match/rule.hpp"

using tshl::ChoiceKey;
using tshl::ChoiceKeyView;
using tshl::NodeDescriptor;

TEST(NodeDescriptorTest, ParsesBareName)
{
  const auto d = NodeDescriptor::parse("class_definition");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->name, "class_definition");
  EXPECT_FALSE(d->field.has_value());
  EXPECT_FALSE(d->repeat);
  EXPECT_EQ(d->key(), ChoiceKey("class_definition"));
}

TEST(NodeDescriptorTest, ParsesFieldQualifiedName)
{
  const auto d = NodeDescriptor::parse("name:identifier");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->name, "identifier");
  ASSERT_TRUE(d->field.has_value());
  EXPECT_EQ(*d->field, "name");
  EXPECT_EQ(d->key(), ChoiceKey("name", "identifier"));
  EXPECT_EQ(d->to_string(), "name:identifier");
}

TEST(NodeDescriptorTest, PunctuationNodeTypesStayIntact)
{
  for (const char * token : {":", "::", ":=", "+", "->"}) {
    const auto d = NodeDescriptor::parse(token);
    ASSERT_TRUE(d.has_value()) << token;
    EXPECT_EQ(d->name, token);
    EXPECT_FALSE(d->field.has_value()) << token;
    EXPECT_FALSE(d->repeat) << token;
  }

  // Field on a punctuation type
  const auto d = NodeDescriptor::parse("operator:+");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d->field, "operator");
  EXPECT_EQ(d->name, "+");
}

TEST(NodeDescriptorTest, TrailingPlusMarksRepeat)
{
  const auto d = NodeDescriptor::parse("object:attribute+");
  ASSERT_TRUE(d.has_value());
  EXPECT_TRUE(d->repeat);
  EXPECT_EQ(d->name, "attribute");
  EXPECT_EQ(*d->field, "object");
  EXPECT_EQ(d->to_string(), "object:attribute+");

  const auto plus_plus = NodeDescriptor::parse("++");
  ASSERT_TRUE(plus_plus.has_value());
  EXPECT_FALSE(plus_plus->repeat);
  EXPECT_EQ(plus_plus->name, "++");
}

TEST(NodeDescriptorTest, RejectsEmptyToken)
{
  EXPECT_FALSE(NodeDescriptor::parse("").has_value());
}

TEST(ChoiceKeyTest, TransparentLookupByView)
{
  std::map<ChoiceKey, int, tshl::ChoiceKeyLess> m;
  m.emplace(ChoiceKey("identifier"), 1);
  m.emplace(ChoiceKey("name", "identifier"), 2);

  const std::string field = "name";
  const std::string kind = "identifier";
  const ChoiceKeyView qualified{field, kind};

  ASSERT_NE(m.find(qualified), m.end());
  EXPECT_EQ(m.find(qualified)->second, 2);
  EXPECT_EQ(m.find(qualified.unqualified())->second, 1);
  EXPECT_EQ(m.find(ChoiceKeyView{"value", kind}), m.end());
}

TEST(ChoiceKeyTest, ToString)
{
  EXPECT_EQ(ChoiceKey("string").to_string(), "string");
  EXPECT_EQ(ChoiceKey("body", "block").to_string(), "body:block");
}

TEST(RuleTest, PathStringJoinsDescriptors)
{
  const auto rule = tshl::make_rule({"call", "attribute+", "function:identifier"}, "Method");
  EXPECT_EQ(rule.path_string(), "call.attribute+.function:identifier");
  EXPECT_EQ(rule.label, "Method");
  EXPECT_FALSE(rule.origin.is_valid());
}
