#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "proba/engine/code_runner.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/remote/remote_config.hpp"
#include "proba/sandbox/sandbox.hpp"
#include "proba/value/value.hpp"
#include "tests/common/fake_transport.hpp"

namespace proba::engine {
namespace {

using test::FakeTransport;

auto Num(double d) -> Value {
  return Value::MakeNumber(d);
}

auto Contains(const std::string& text, const std::string& fragment) -> bool {
  return text.find(fragment) != std::string::npos;
}

// Offline engine: no API key, and a transport that fails if it is ever used.
class CodeRunnerTest : public ::testing::Test {
 protected:
  CodeRunnerTest()
      : transport_(FakeTransport::Failing("network disabled in tests")),
        runner_(
            EngineOptions{
                .sandbox = {.timeout = std::chrono::milliseconds(1000),
                            .max_call_depth = 500,
                            .max_steps = 0},
                .remote = {},
            },
            transport_) {
  }

  std::shared_ptr<FakeTransport> transport_;
  CodeRunner runner_;
};

// =============================================================================
// Annotation-driven function tests
// =============================================================================

TEST_F(CodeRunnerTest, AnnotatedFunctionPasses) {
  TestSuiteResult suite = runner_.RunTests(
      "// add(2,3) => 5\nfunction add(a,b){return a+b;}");
  ASSERT_EQ(suite.total, 1);
  EXPECT_EQ(suite.passed, 1);
  EXPECT_TRUE(suite.AllPassed());
  EXPECT_FALSE(suite.HasParseErrors());

  const TestExecutionResult& result = suite.results[0];
  EXPECT_EQ(result.test_case.function_name, "add");
  EXPECT_EQ(result.test_case.input, (std::vector<Value>{Num(2), Num(3)}));
  EXPECT_EQ(result.test_case.expected, Num(5));
  EXPECT_TRUE(result.passed);
  EXPECT_EQ(result.actual, Num(5));
}

TEST_F(CodeRunnerTest, AnnotatedFunctionFails) {
  TestSuiteResult suite = runner_.RunTests(
      "// add(2,3) => 5\nfunction add(a,b){return a*b;}");
  ASSERT_EQ(suite.total, 1);
  EXPECT_EQ(suite.failed, 1);
  const TestExecutionResult& result = suite.results[0];
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(result.actual, Num(6));
  EXPECT_EQ(result.test_case.expected, Num(5));
  EXPECT_FALSE(result.error.has_value());
}

TEST_F(CodeRunnerTest, UnrecognizedCommentIsParseError) {
  extract::ExtractionResult extracted =
      CodeRunner::ParseTestCases("// not a real test\nfunction f() {}");
  EXPECT_TRUE(extracted.test_cases.empty());
  ASSERT_EQ(extracted.errors.size(), 1);
  EXPECT_EQ(extracted.errors[0].original_text, "not a real test");
  EXPECT_EQ(extracted.errors[0].line, 1u);
}

TEST_F(CodeRunnerTest, ParseErrorsTravelWithTheSuite) {
  TestSuiteResult suite = runner_.RunTests(
      "// TODO: more cases\n"
      "// assert(square(3) === 9)\n"
      "// square([4], 16)\n"
      "const square = (n) => n * n;\n");
  EXPECT_EQ(suite.total, 2);
  EXPECT_EQ(suite.passed, 2);
  ASSERT_TRUE(suite.HasParseErrors());
  EXPECT_EQ(suite.parse_errors[0].original_text, "TODO: more cases");
}

TEST_F(CodeRunnerTest, SuppliedCasesReplaceAnnotations) {
  std::vector<extract::TestCase> cases = {
      {.name = "doubles",
       .function_name = "twice",
       .input = {Value::MakeText("ab")},
       .expected = Value::MakeText("abab"),
       .source_line = std::nullopt,
       .user_inputs = std::nullopt},
  };
  TestSuiteResult suite = runner_.RunTests(
      "// twice(1) => 99\n// garbage\n"
      "function twice(s) { return s.repeat(2); }",
      cases);
  ASSERT_EQ(suite.total, 1);
  EXPECT_TRUE(suite.results[0].passed);
  EXPECT_EQ(suite.results[0].test_case.name, "doubles");
  EXPECT_FALSE(suite.HasParseErrors());
}

// =============================================================================
// Language routing
// =============================================================================

TEST_F(CodeRunnerTest, UnknownLanguageRun) {
  LanguageExecutionResult result =
      runner_.RunCodeWithLanguage("DISPLAY 'HI'.", "cobol");
  ASSERT_TRUE(result.error.has_value());
  EXPECT_TRUE(Contains(*result.error, "javascript, python, java"));
  EXPECT_TRUE(Contains(*result.error, "cobol"));
  EXPECT_EQ(result.execution_time_ms, 0);
  EXPECT_EQ(result.language, "cobol");
  EXPECT_EQ(result.output, "");
}

TEST_F(CodeRunnerTest, UnknownLanguageFailsEveryCase) {
  TestSuiteResult suite = runner_.RunTestsWithLanguage(
      "* f(1) => 1\n* f(2) => 2", "cobol");
  ASSERT_EQ(suite.total, 2);
  EXPECT_EQ(suite.failed, 2);
  for (const TestExecutionResult& result : suite.results) {
    EXPECT_EQ(result.error, UnsupportedLanguageMessage("cobol"));
  }

  TestSuiteResult programs = runner_.RunProgramTests(
      "x", "cobol", {{.name = "p", .stdin_text = "", .expected_output = ""}});
  ASSERT_EQ(programs.total, 1);
  EXPECT_EQ(programs.results[0].test_case.function_name, "program");
  EXPECT_EQ(programs.results[0].error, UnsupportedLanguageMessage("cobol"));
}

TEST_F(CodeRunnerTest, JavaScriptRun) {
  sandbox::ExecutionResult result =
      runner_.RunCode("console.log('hi'); 40 + 2");
  EXPECT_EQ(result.output, "hi\n\n→ 42");
  EXPECT_FALSE(result.error.has_value());

  LanguageExecutionResult routed =
      runner_.RunCodeWithLanguage("console.log('hi'); 40 + 2", "JS");
  EXPECT_EQ(routed.language, "javascript");
  EXPECT_EQ(routed.output, result.output);
}

TEST_F(CodeRunnerTest, PythonFallsBackWithoutKey) {
  LanguageExecutionResult result = runner_.RunCodeWithLanguage(
      CodeRunner::DefaultBoilerplate("python"), "python");
  EXPECT_EQ(result.language, "python");
  EXPECT_EQ(result.output, "Hello World!\n");
  EXPECT_FALSE(result.error.has_value());
  EXPECT_TRUE(transport_->Requests().empty());
}

TEST_F(CodeRunnerTest, JavaNeedsKey) {
  LanguageExecutionResult result = runner_.RunCodeWithLanguage(
      CodeRunner::DefaultBoilerplate("java"), "java");
  ASSERT_TRUE(result.error.has_value());
  EXPECT_TRUE(Contains(*result.error, "requires a valid RapidAPI key"));
}

TEST(ConfiguredCodeRunnerTest, PythonFunctionTestsGoRemote) {
  auto transport =
      FakeTransport::Replying(test::SuccessEnvelope("__TEST_RESULT__: 7\n"));
  CodeRunner runner(
      EngineOptions{.sandbox = {}, .remote = {.api_key = "live"}}, transport);
  EXPECT_TRUE(runner.IsApiConfigured());
  EXPECT_TRUE(runner.GetApiStatus().configured);

  TestSuiteResult suite = runner.RunTestsWithLanguage(
      "# add(3, 4) => 7\ndef add(a, b):\n    return a + b\n", "python");
  ASSERT_EQ(suite.total, 1);
  EXPECT_TRUE(suite.results[0].passed);
  ASSERT_EQ(transport->Requests().size(), 1);
  EXPECT_TRUE(Contains(transport->Requests()[0].body, "main.py"));
}

TEST_F(CodeRunnerTest, ProgramTests) {
  std::vector<ProgramTestCase> programs = {
      {.name = "sum", .stdin_text = "", .expected_output = "6"},
      {.name = "wrong", .stdin_text = "", .expected_output = "7"},
  };
  TestSuiteResult suite = runner_.RunProgramTests(
      "console.log([1, 2, 3].reduce((a, b) => a + b, 0))", "javascript",
      programs);
  EXPECT_EQ(suite.total, 2);
  EXPECT_EQ(suite.passed, 1);
  EXPECT_EQ(suite.results[1].actual, Value::MakeText("6"));
}

// =============================================================================
// Metadata
// =============================================================================

TEST_F(CodeRunnerTest, Metadata) {
  EXPECT_EQ(
      CodeRunner::GetSupportedLanguages(),
      (std::vector<std::string>{"javascript", "python", "java"}));
  EXPECT_EQ(CodeRunner::GetSupportedFormats().size(), 3);
  EXPECT_FALSE(runner_.IsApiConfigured());
  EXPECT_FALSE(runner_.GetApiStatus().configured);
  EXPECT_TRUE(CodeRunner::DefaultBoilerplate("py").starts_with("# Python Code"));
  EXPECT_TRUE(CodeRunner::DefaultBoilerplate("cobol").empty());
}

TEST_F(CodeRunnerTest, BoilerplateRunsInSandbox) {
  sandbox::ExecutionResult result =
      runner_.RunCode(CodeRunner::DefaultBoilerplate("javascript"));
  EXPECT_EQ(result.output, "Hello World!");
}

TEST_F(CodeRunnerTest, ValidateCodeForTesting) {
  EXPECT_TRUE(
      CodeRunner::ValidateCodeForTesting("function solve() {}", "solve")
          .empty());
  EXPECT_EQ(
      CodeRunner::ValidateCodeForTesting("function other() {}", "solve"),
      std::vector<std::string>{"Function \"solve\" not found in code"});
}

TEST_F(CodeRunnerTest, Statistics) {
  TestSuiteResult suite = runner_.RunTests(
      "// id(1) => 1\n// id(2) => 3\nfunction id(x) { return x; }");
  TestStatistics stats = CodeRunner::GetTestStatistics(suite.results);
  EXPECT_DOUBLE_EQ(stats.pass_rate, 50.0);
  EXPECT_TRUE(stats.slowest.has_value());
}

}  // namespace
}  // namespace proba::engine
