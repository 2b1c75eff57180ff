#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "proba/engine/execution_router.hpp"
#include "proba/engine/language.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/extract/test_case.hpp"

namespace proba::engine {

// Runs test cases one after another through the router and compares each
// reported value with the expectation.
class TestRunner {
 public:
  explicit TestRunner(const ExecutionRouter& router) : router_(&router) {
  }

  [[nodiscard]] auto RunOne(
      std::string_view code, const extract::TestCase& test_case,
      Language language = Language::kJavaScript) const -> TestExecutionResult;

  [[nodiscard]] auto RunSuite(
      std::string_view code, const std::vector<extract::TestCase>& test_cases,
      std::vector<extract::ParseError> parse_errors = {},
      Language language = Language::kJavaScript) const -> TestSuiteResult;

  // Whole-program cases: trimmed output against trimmed expected output.
  [[nodiscard]] auto RunProgramSuite(
      std::string_view code, Language language,
      const std::vector<ProgramTestCase>& program_cases) const
      -> TestSuiteResult;

 private:
  const ExecutionRouter* router_;
};

// Record of a program case in function-case shape: function "program",
// the stdin text (or "no input") as the only input.
auto ToTestCase(const ProgramTestCase& program, size_t index)
    -> extract::TestCase;

// Rewrites recognizable failure categories into a sentence naming the
// function under test; other messages pass through unchanged.
auto RefineError(
    std::string_view error, std::string_view function_name, bool timed_out)
    -> std::string;

auto GetTestStatistics(const std::vector<TestExecutionResult>& results)
    -> TestStatistics;

// Empty when a declaration of `function_name` appears in `code`.
auto ValidateUserCode(std::string_view code, std::string_view function_name)
    -> std::vector<std::string>;

// Totals and counts for `results`.
auto Summarize(
    std::vector<TestExecutionResult> results,
    std::vector<extract::ParseError> parse_errors, double total_time_ms)
    -> TestSuiteResult;

}  // namespace proba::engine
