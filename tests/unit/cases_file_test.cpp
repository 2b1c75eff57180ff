#include <gtest/gtest.h>

#include <string>

#include "cases_file.hpp"
#include "proba/common/diagnostic.hpp"
#include "proba/value/value.hpp"

namespace proba::driver {
namespace {

auto ErrorOf(const std::string& text) -> std::string {
  auto cases = ParseCasesFile(text, "cases.json");
  EXPECT_FALSE(cases.has_value());
  return cases ? "" : cases.error().primary.message;
}

TEST(CasesFileTest, FunctionEntries) {
  auto cases = ParseCasesFile(
      R"({"tests": [
            {"name": "adds", "functionName": "add", "input": [1, [2]],
             "expected": {"sum": 3}},
            {"functionName": "noop", "expected": null, "userInputs": "a,b"}
          ]})",
      "cases.json");
  ASSERT_TRUE(cases.has_value()) << cases.error().primary.message;
  ASSERT_TRUE(cases->tests.has_value());
  ASSERT_EQ(cases->tests->size(), 2);

  const auto& first = (*cases->tests)[0];
  EXPECT_EQ(first.name, "adds");
  EXPECT_EQ(first.function_name, "add");
  ASSERT_EQ(first.input.size(), 2);
  EXPECT_EQ(first.input[0], Value::MakeNumber(1));
  EXPECT_TRUE(first.input[1].IsList());
  EXPECT_EQ(first.expected, Value::MakeObject({{"sum", Value::MakeNumber(3)}}));

  const auto& second = (*cases->tests)[1];
  EXPECT_EQ(second.name, "Test 2");
  EXPECT_TRUE(second.input.empty());
  EXPECT_TRUE(second.expected.IsNull());
  EXPECT_EQ(second.user_inputs, "a,b");
  EXPECT_TRUE(cases->programs.empty());
}

TEST(CasesFileTest, FormEntries) {
  auto cases = ParseCasesFile(
      R"({"tests": [{"functionName": "greet", "inputs": "Bob, 2",
                     "expected": "Hi Bob"}]})",
      "cases.json");
  ASSERT_TRUE(cases.has_value()) << cases.error().primary.message;
  const auto& test_case = (*cases->tests)[0];
  EXPECT_EQ(test_case.name, "Test 1");
  EXPECT_EQ(test_case.input[0], Value::MakeText("Bob"));
  EXPECT_EQ(test_case.input[1], Value::MakeNumber(2));
  EXPECT_EQ(test_case.expected, Value::MakeText("Hi Bob"));
}

TEST(CasesFileTest, ProgramEntries) {
  auto cases = ParseCasesFile(
      R"({"programs": [{"stdin": "3\n4", "expectedOutput": "7"},
                       {"name": "empty", "expectedOutput": ""}]})",
      "cases.json");
  ASSERT_TRUE(cases.has_value()) << cases.error().primary.message;
  EXPECT_FALSE(cases->tests.has_value());
  ASSERT_EQ(cases->programs.size(), 2);
  EXPECT_EQ(cases->programs[0].name, "Test 1");
  EXPECT_EQ(cases->programs[0].stdin_text, "3\n4");
  EXPECT_EQ(cases->programs[0].expected_output, "7");
  EXPECT_EQ(cases->programs[1].name, "empty");
  EXPECT_EQ(cases->programs[1].stdin_text, "");
}

TEST(CasesFileTest, EmptyTestListIsKept) {
  auto cases = ParseCasesFile(R"({"tests": []})", "cases.json");
  ASSERT_TRUE(cases.has_value());
  ASSERT_TRUE(cases->tests.has_value());
  EXPECT_TRUE(cases->tests->empty());
}

TEST(CasesFileTest, ShapeErrorsCarryNote) {
  auto cases = ParseCasesFile("{}", "cases.json");
  ASSERT_FALSE(cases.has_value());
  ASSERT_EQ(cases.error().notes.size(), 1U);
  EXPECT_EQ(cases.error().notes[0].kind, DiagKind::kNote);
  EXPECT_NE(cases.error().notes[0].message.find("\"programs\""), std::string::npos);
}

TEST(CasesFileTest, Errors) {
  EXPECT_EQ(ErrorOf("{"), "cases.json: invalid JSON");
  EXPECT_EQ(ErrorOf("[]"), "cases.json: expected a JSON object");
  EXPECT_EQ(ErrorOf("{}"), "cases.json: no 'tests' or 'programs' entries");
  EXPECT_EQ(
      ErrorOf(R"({"tests": {}})"), "cases.json: 'tests' must be an array");
  EXPECT_EQ(
      ErrorOf(R"({"tests": [{"expected": 1}]})"),
      "cases.json: tests[0]: missing 'functionName'");
  EXPECT_EQ(
      ErrorOf(R"({"tests": [{"functionName": "f"}]})"),
      "cases.json: tests[0]: missing 'expected'");
  EXPECT_EQ(
      ErrorOf(R"({"tests": [{"functionName": "f", "input": 1, "expected": 1}]})"),
      "cases.json: tests[0]: 'input' must be an array");
  EXPECT_EQ(
      ErrorOf(R"({"tests": [{"functionName": "f", "inputs": "1"}]})"),
      "cases.json: tests[0]: 'functionName' and 'expected' are required");
  EXPECT_EQ(
      ErrorOf(R"({"programs": [{"stdin": ""}]})"),
      "cases.json: programs[0]: missing 'expectedOutput'");
}

TEST(CasesFileTest, UnreadableFile) {
  auto cases = LoadCasesFile("/nonexistent/proba/cases.json");
  ASSERT_FALSE(cases.has_value());
  EXPECT_EQ(
      cases.error().primary.message,
      "cannot open '/nonexistent/proba/cases.json'");
}

}  // namespace
}  // namespace proba::driver
