#include <gtest/gtest.h>

#include <string>

#include "proba/extract/annotation_parser.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/value/value.hpp"

namespace proba::extract {
namespace {

auto Num(double d) -> Value {
  return Value::MakeNumber(d);
}

// =============================================================================
// Grammars
// =============================================================================

TEST(AnnotationParserTest, ArrayForm) {
  auto result = AnnotationParser().Extract("// add([1, 2], 3)");
  ASSERT_EQ(result.test_cases.size(), 1);
  const TestCase& tc = result.test_cases[0];
  EXPECT_EQ(tc.name, "Test 1");
  EXPECT_EQ(tc.function_name, "add");
  EXPECT_EQ(tc.input, (std::vector<Value>{Num(1), Num(2)}));
  EXPECT_EQ(tc.expected, Num(3));
  EXPECT_EQ(tc.source_line, 1);
  EXPECT_TRUE(result.errors.empty());
}

TEST(AnnotationParserTest, ArrayFormWithNestedList) {
  auto result = AnnotationParser().Extract("// sum([[1, 2, 3]], 6)");
  ASSERT_EQ(result.test_cases.size(), 1);
  ASSERT_EQ(result.test_cases[0].input.size(), 1);
  EXPECT_TRUE(result.test_cases[0].input[0].IsList());
}

TEST(AnnotationParserTest, ArrowForm) {
  auto result = AnnotationParser().Extract("// greet(\"Bob\", 2) => \"Hi Bob\"");
  ASSERT_EQ(result.test_cases.size(), 1);
  const TestCase& tc = result.test_cases[0];
  EXPECT_EQ(tc.function_name, "greet");
  EXPECT_EQ(tc.input, (std::vector<Value>{Value::MakeText("Bob"), Num(2)}));
  EXPECT_EQ(tc.expected, Value::MakeText("Hi Bob"));
}

TEST(AnnotationParserTest, ArrowFormWithoutArguments) {
  auto result = AnnotationParser().Extract("// answer() => 42");
  ASSERT_EQ(result.test_cases.size(), 1);
  EXPECT_TRUE(result.test_cases[0].input.empty());
  EXPECT_EQ(result.test_cases[0].expected, Num(42));
}

TEST(AnnotationParserTest, AssertForm) {
  auto result = AnnotationParser().Extract(
      "// assert(multiply(3, 4) === 12)\n"
      "// assert(upper(\"a\") == \"A\")");
  ASSERT_EQ(result.test_cases.size(), 2);
  EXPECT_EQ(result.test_cases[0].function_name, "multiply");
  EXPECT_EQ(result.test_cases[0].input, (std::vector<Value>{Num(3), Num(4)}));
  EXPECT_EQ(result.test_cases[0].expected, Num(12));
  EXPECT_EQ(result.test_cases[1].expected, Value::MakeText("A"));
  EXPECT_EQ(result.test_cases[1].name, "Test 2");
}

TEST(AnnotationParserTest, ArrayFormTakesPriority) {
  // Matches both the array and the arrow grammar.
  auto tc = AnnotationParser::ParseLine("f([1], 2) => 3", 0, 1);
  ASSERT_TRUE(tc.has_value());
  EXPECT_EQ(tc->input, (std::vector<Value>{Num(1)}));
  EXPECT_EQ(tc->expected, Num(2));
}

TEST(AnnotationParserTest, UnparseableArrayPayloadFallsThrough) {
  // The bracket body is not JSON, so the array grammar declines and the
  // arrow grammar takes the line.
  auto tc = AnnotationParser::ParseLine("f([a], b) => c", 0, 1);
  ASSERT_TRUE(tc.has_value());
  EXPECT_EQ(tc->function_name, "f");
  EXPECT_EQ(tc->expected, Value::MakeText("c"));
}

// =============================================================================
// Comment handling
// =============================================================================

TEST(AnnotationParserTest, BlockCommentMarkers) {
  auto result = AnnotationParser().Extract(
      "/* add([1, 1], 2) */\n"
      "/**\n"
      " * add([2, 2], 4)\n"
      " */\n");
  ASSERT_EQ(result.test_cases.size(), 2);
  EXPECT_EQ(result.test_cases[0].expected, Num(2));
  EXPECT_EQ(result.test_cases[1].expected, Num(4));
  EXPECT_EQ(result.test_cases[1].source_line, 3);
  EXPECT_TRUE(result.errors.empty());
}

TEST(AnnotationParserTest, CodeLinesAreIgnored) {
  auto result = AnnotationParser().Extract(
      "function add(a, b) { return a + b; }\n"
      "const x = add(1, 2) => 3;\n");
  EXPECT_TRUE(result.test_cases.empty());
  EXPECT_TRUE(result.errors.empty());
}

TEST(AnnotationParserTest, HashComments) {
  AnnotationParser parser(CommentStyle::kHash);
  auto result = parser.Extract(
      "# add([1, 2], 3)\n"
      "// not a comment here\n"
      "def add(a, b):\n"
      "    return a + b\n");
  ASSERT_EQ(result.test_cases.size(), 1);
  EXPECT_EQ(result.test_cases[0].function_name, "add");
  EXPECT_TRUE(result.errors.empty());
}

TEST(AnnotationParserTest, UnrecognizedCommentsBecomeErrors) {
  auto result = AnnotationParser().Extract(
      "// Adds two numbers\n"
      "// add([1, 2], 3)\n"
      "//\n");
  ASSERT_EQ(result.test_cases.size(), 1);
  EXPECT_EQ(result.test_cases[0].name, "Test 1");
  ASSERT_EQ(result.errors.size(), 1);
  EXPECT_EQ(result.errors[0].line, 1);
  EXPECT_EQ(result.errors[0].message, "Unable to parse test case format");
  EXPECT_EQ(result.errors[0].original_text, "Adds two numbers");
}

TEST(AnnotationParserTest, OverlongCommentIsReportedNotMatched) {
  std::string payload = "f(" + std::string(200000, 'x') + ") => 1";
  auto result = AnnotationParser().Extract(
      "// " + payload + "\n// add([1, 2], 3)");
  ASSERT_EQ(result.errors.size(), 1);
  EXPECT_EQ(result.errors[0].line, 1);
  EXPECT_EQ(result.errors[0].message, "Comment too long to parse");
  EXPECT_EQ(result.errors[0].original_text.size(), payload.size());
  ASSERT_EQ(result.test_cases.size(), 1);
  EXPECT_EQ(result.test_cases[0].name, "Test 1");
  EXPECT_FALSE(AnnotationParser::ParseLine(payload, 0, 1).has_value());
}

TEST(AnnotationParserTest, CommentAtLengthLimitIsMatched) {
  std::string text(AnnotationParser::kMaxCommentLength - 10, 'a');
  std::string payload = "f() => \"" + text + "\"";
  ASSERT_LE(payload.size(), AnnotationParser::kMaxCommentLength);
  auto result = AnnotationParser().Extract("// " + payload);
  ASSERT_EQ(result.test_cases.size(), 1);
  EXPECT_EQ(result.test_cases[0].expected, Value::MakeText(text));
}

TEST(AnnotationParserTest, ExtractionIsDeterministic) {
  const char* code =
      "// a([1], 1)\n// b(2) => 2\n// assert(c(3) === 3)\n// junk";
  EXPECT_EQ(AnnotationParser().Extract(code), AnnotationParser().Extract(code));
}

TEST(AnnotationParserTest, CommentStyleByLanguage) {
  EXPECT_EQ(CommentStyleFor("python"), CommentStyle::kHash);
  EXPECT_EQ(CommentStyleFor("PY"), CommentStyle::kHash);
  EXPECT_EQ(CommentStyleFor("javascript"), CommentStyle::kCLike);
  EXPECT_EQ(CommentStyleFor("java"), CommentStyle::kCLike);
}

TEST(AnnotationParserTest, StripCommentMarker) {
  EXPECT_EQ(StripCommentMarker("// text", CommentStyle::kCLike), "text");
  EXPECT_EQ(StripCommentMarker("/* text */", CommentStyle::kCLike), "text");
  EXPECT_EQ(StripCommentMarker("* text", CommentStyle::kCLike), "text");
  EXPECT_EQ(StripCommentMarker("*/", CommentStyle::kCLike), "");
  EXPECT_EQ(StripCommentMarker("#  text", CommentStyle::kHash), "text");
}

// =============================================================================
// Formats, validation and form entries
// =============================================================================

TEST(AnnotationParserTest, SupportedFormats) {
  auto formats = AnnotationParser::GetSupportedFormats();
  ASSERT_EQ(formats.size(), 3);
  EXPECT_EQ(formats[0], "functionName([arg1, arg2], expected)");
}

TEST(AnnotationParserTest, ValidateTestCase) {
  TestCase good{
      .name = "Test 1",
      .function_name = "add",
      .input = {},
      .expected = Num(1),
      .source_line = std::nullopt,
      .user_inputs = std::nullopt,
  };
  EXPECT_TRUE(AnnotationParser::ValidateTestCase(good).empty());

  TestCase bad = good;
  bad.function_name = "1add";
  bad.name = " ";
  bad.expected = Value();
  auto problems = AnnotationParser::ValidateTestCase(bad);
  ASSERT_EQ(problems.size(), 3);
  EXPECT_EQ(problems[0], "Invalid function name");
  EXPECT_EQ(problems[1], "Test case must have a name");
  EXPECT_EQ(problems[2], "Test case must have an expected value");
}

TEST(AnnotationParserTest, BuildTestCaseFromJsonInputs) {
  FunctionTestForm form{
      .name = "",
      .function_name = " add ",
      .inputs = "1, [2, 3]",
      .expected = "6",
      .user_inputs = std::nullopt,
  };
  auto tc = BuildTestCase(form, 1);
  ASSERT_TRUE(tc.has_value());
  EXPECT_EQ(tc->name, "Test 2");
  EXPECT_EQ(tc->function_name, "add");
  ASSERT_EQ(tc->input.size(), 2);
  EXPECT_TRUE(tc->input[1].IsList());
  EXPECT_EQ(tc->expected, Num(6));
}

TEST(AnnotationParserTest, BuildTestCaseFallsBackToText) {
  FunctionTestForm form{
      .name = "greeting",
      .function_name = "greet",
      .inputs = "Bob, 2",
      .expected = "Hello Bob",
      .user_inputs = "a,b",
  };
  auto tc = BuildTestCase(form, 0);
  ASSERT_TRUE(tc.has_value());
  EXPECT_EQ(tc->name, "greeting");
  EXPECT_EQ(tc->input, (std::vector<Value>{Value::MakeText("Bob"), Num(2)}));
  EXPECT_EQ(tc->expected, Value::MakeText("Hello Bob"));
  EXPECT_EQ(tc->user_inputs, "a,b");
}

TEST(AnnotationParserTest, BuildTestCaseRequiresNameAndExpected) {
  FunctionTestForm form{
      .name = "",
      .function_name = "",
      .inputs = "1",
      .expected = "1",
      .user_inputs = std::nullopt,
  };
  EXPECT_FALSE(BuildTestCase(form, 0).has_value());
  form.function_name = "f";
  form.expected = "";
  EXPECT_FALSE(BuildTestCase(form, 0).has_value());
}

}  // namespace
}  // namespace proba::extract
