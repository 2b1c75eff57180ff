#include <gtest/gtest.h>

#include <cmath>

#include "proba/extract/value_parser.hpp"
#include "proba/value/value.hpp"

namespace proba::extract {
namespace {

TEST(ValueParserTest, Keywords) {
  EXPECT_TRUE(ParseValue("null").IsNull());
  EXPECT_TRUE(ParseValue(" undefined ").IsUndefined());
  EXPECT_EQ(ParseValue("true"), Value::MakeBoolean(true));
  EXPECT_EQ(ParseValue("false"), Value::MakeBoolean(false));
}

TEST(ValueParserTest, JsonBeforeQuotes) {
  EXPECT_EQ(ParseValue("\"hi\""), Value::MakeText("hi"));
  EXPECT_EQ(ParseValue("'hi'"), Value::MakeText("hi"));
  EXPECT_EQ(ParseValue("[1, 2]"),
            Value::MakeList({Value::MakeNumber(1), Value::MakeNumber(2)}));
  EXPECT_EQ(ParseValue(R"({"a": 1})"),
            Value::MakeObject({{"a", Value::MakeNumber(1)}}));
}

TEST(ValueParserTest, NumericCoercion) {
  EXPECT_EQ(ParseValue("42"), Value::MakeNumber(42));
  EXPECT_EQ(ParseValue("0x1f"), Value::MakeNumber(31));
  EXPECT_EQ(ParseValue("Infinity").AsNumber(), INFINITY);
}

TEST(ValueParserTest, BlankTextCoercesToZero) {
  EXPECT_EQ(ParseValue(""), Value::MakeNumber(0));
  EXPECT_EQ(ParseValue("   "), Value::MakeNumber(0));
  EXPECT_EQ(ParseValue("''"), Value::MakeText(""));
}

TEST(ValueParserTest, RawTextFallback) {
  EXPECT_EQ(ParseValue("hello world"), Value::MakeText("hello world"));
  EXPECT_EQ(ParseValue("{broken"), Value::MakeText("{broken"));
}

TEST(ValueParserTest, ArgumentsPreferNumbers) {
  EXPECT_EQ(ParseArgument(" 5 "), Value::MakeNumber(5));
  EXPECT_EQ(ParseArgument("\"5\""), Value::MakeText("5"));
  EXPECT_EQ(ParseArgument("abc"), Value::MakeText("abc"));
  EXPECT_EQ(ParseArgument("null"), Value::MakeNull());
}

TEST(ValueParserTest, JsonArgumentBody) {
  auto values = ParseJsonArguments(R"(1, "two", [3])");
  ASSERT_TRUE(values.has_value());
  ASSERT_EQ(values->size(), 3);
  EXPECT_EQ((*values)[1], Value::MakeText("two"));
  EXPECT_TRUE(ParseJsonArguments("  ")->empty());
  EXPECT_FALSE(ParseJsonArguments("a, b").has_value());
}

TEST(ValueParserTest, ArgumentListFallsBackToCommaSplit) {
  auto values = ParseArgumentList("'a', 2, raw");
  ASSERT_EQ(values.size(), 3);
  EXPECT_EQ(values[0], Value::MakeText("a"));
  EXPECT_EQ(values[1], Value::MakeNumber(2));
  EXPECT_EQ(values[2], Value::MakeText("raw"));
}

}  // namespace
}  // namespace proba::extract
