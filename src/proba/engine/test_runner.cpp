#include "proba/engine/test_runner.hpp"

#include <chrono>
#include <cstddef>
#include <format>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "proba/common/string_utils.hpp"
#include "proba/engine/execution_router.hpp"
#include "proba/engine/harness.hpp"
#include "proba/engine/language.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/value/compare.hpp"
#include "proba/value/value.hpp"

namespace proba::engine {

namespace {

using Clock = std::chrono::steady_clock;

auto ElapsedMs(Clock::time_point start) -> double {
  return std::chrono::duration<double, std::milli>(Clock::now() - start)
      .count();
}

auto Contains(std::string_view text, std::string_view fragment) -> bool {
  return text.find(fragment) != std::string_view::npos;
}

// Identifier characters that are special inside a regex.
auto EscapeForRegex(std::string_view identifier) -> std::string {
  std::string escaped;
  for (char c : identifier) {
    if (c == '$') {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

}  // namespace

auto TestRunner::RunOne(
    std::string_view code, const extract::TestCase& test_case,
    Language language) const -> TestExecutionResult {
  auto start = Clock::now();
  TestExecutionResult result{.test_case = test_case};

  auto harness = BuildHarness(code, test_case, language);
  if (!harness) {
    result.error = harness.error().primary.message;
    result.execution_time_ms = ElapsedMs(start);
    return result;
  }

  std::string stdin_text;
  if (test_case.user_inputs) {
    stdin_text = UserInputsToStdin(*test_case.user_inputs);
  }
  LanguageExecutionResult run =
      router_->Run(*harness, ToString(language), stdin_text);
  result.output = run.output;

  if (run.error) {
    result.error =
        RefineError(*run.error, test_case.function_name, run.timed_out);
  } else {
    ExtractedResult extracted = ExtractActual(run.output);
    if (extracted.error) {
      result.error =
          RefineError(*extracted.error, test_case.function_name, false);
    } else {
      result.actual = std::move(extracted.actual);
      result.passed = StructuralEqual(*result.actual, test_case.expected);
    }
  }

  result.execution_time_ms = ElapsedMs(start);
  spdlog::debug(
      "test: {} ({}) {} in {:.2f} ms", test_case.name, test_case.function_name,
      result.passed ? "passed" : "failed", result.execution_time_ms);
  return result;
}

auto TestRunner::RunSuite(
    std::string_view code, const std::vector<extract::TestCase>& test_cases,
    std::vector<extract::ParseError> parse_errors, Language language) const
    -> TestSuiteResult {
  auto start = Clock::now();
  std::vector<TestExecutionResult> results;
  results.reserve(test_cases.size());
  for (const extract::TestCase& test_case : test_cases) {
    results.push_back(RunOne(code, test_case, language));
  }
  return Summarize(
      std::move(results), std::move(parse_errors), ElapsedMs(start));
}

auto TestRunner::RunProgramSuite(
    std::string_view code, Language language,
    const std::vector<ProgramTestCase>& program_cases) const
    -> TestSuiteResult {
  auto suite_start = Clock::now();
  std::vector<TestExecutionResult> results;
  results.reserve(program_cases.size());

  for (size_t i = 0; i < program_cases.size(); ++i) {
    const ProgramTestCase& program = program_cases[i];
    auto start = Clock::now();

    TestExecutionResult result{.test_case = ToTestCase(program, i)};

    LanguageExecutionResult run =
        router_->Run(code, ToString(language), program.stdin_text);
    std::string actual(common::Trim(run.output));
    result.output = run.output;
    result.actual = Value::MakeText(actual);
    if (run.error) {
      result.error = std::move(run.error);
    } else {
      result.passed = actual == common::Trim(program.expected_output);
    }
    result.execution_time_ms = ElapsedMs(start);
    spdlog::debug(
        "test: {} (program) {} in {:.2f} ms", result.test_case.name,
        result.passed ? "passed" : "failed", result.execution_time_ms);
    results.push_back(std::move(result));
  }

  return Summarize(std::move(results), {}, ElapsedMs(suite_start));
}

auto ToTestCase(const ProgramTestCase& program, size_t index)
    -> extract::TestCase {
  return extract::TestCase{
      .name = program.name.empty() ? std::format("Test {}", index + 1)
                                   : program.name,
      .function_name = "program",
      .input = {Value::MakeText(
          program.stdin_text.empty() ? "no input" : program.stdin_text)},
      .expected = Value::MakeText(program.expected_output),
      .source_line = std::nullopt,
      .user_inputs = std::nullopt,
  };
}

auto RefineError(
    std::string_view error, std::string_view function_name, bool timed_out)
    -> std::string {
  if (Contains(error, "is not defined")) {
    return std::format(
        "Function \"{}\" is not defined. Make sure you've implemented the "
        "function.",
        function_name);
  }
  if (Contains(error, "is not a function")) {
    return std::format(
        "\"{}\" exists but is not a function. Check your implementation.",
        function_name);
  }
  if (timed_out || Contains(error, "timeout") || Contains(error, "timed out")) {
    return std::format(
        "Test case timed out. The function \"{}\" may have an infinite loop "
        "or be too slow.",
        function_name);
  }
  if (Contains(error, "Maximum call stack")) {
    return std::format(
        "Stack overflow detected in \"{}\". Check for infinite recursion.",
        function_name);
  }
  return std::string(error);
}

auto GetTestStatistics(const std::vector<TestExecutionResult>& results)
    -> TestStatistics {
  if (results.empty()) {
    return TestStatistics{};
  }

  size_t passed = 0;
  double total_time = 0;
  size_t slowest = 0;
  size_t fastest = 0;
  for (size_t i = 0; i < results.size(); ++i) {
    const TestExecutionResult& result = results[i];
    if (result.passed) {
      ++passed;
    }
    total_time += result.execution_time_ms;
    if (result.execution_time_ms > results[slowest].execution_time_ms) {
      slowest = i;
    }
    if (result.execution_time_ms < results[fastest].execution_time_ms) {
      fastest = i;
    }
  }

  auto count = static_cast<double>(results.size());
  return TestStatistics{
      .pass_rate = static_cast<double>(passed) / count * 100.0,
      .average_time_ms = total_time / count,
      .slowest = slowest,
      .fastest = fastest,
  };
}

auto ValidateUserCode(std::string_view code, std::string_view function_name)
    -> std::vector<std::string> {
  std::vector<std::string> problems;
  std::string missing =
      std::format("Function \"{}\" not found in code", function_name);
  if (!common::IsIdentifier(function_name)) {
    problems.push_back(std::move(missing));
    return problems;
  }

  std::string name = EscapeForRegex(function_name);
  const std::vector<std::string> patterns = {
      std::format(R"(function\s+{}\s*\()", name),
      std::format(R"(const\s+{}\s*=)", name),
      std::format(R"(let\s+{}\s*=)", name),
      std::format(R"(var\s+{}\s*=)", name),
      std::format(R"(def\s+{}\s*\()", name),
      std::format(R"((^|[^\w$]){}\s*:)", name),
      std::format(R"((^|[^\w$]){}\s*=\s*function)", name),
      std::format(R"((^|[^\w$]){}\s*=\s*\()", name),
  };

  std::string text(code);
  for (const std::string& pattern : patterns) {
    if (std::regex_search(text, std::regex(pattern))) {
      return problems;
    }
  }
  problems.push_back(std::move(missing));
  return problems;
}

auto Summarize(
    std::vector<TestExecutionResult> results,
    std::vector<extract::ParseError> parse_errors, double total_time_ms)
    -> TestSuiteResult {
  TestSuiteResult suite{
      .results = std::move(results),
      .total = 0,
      .passed = 0,
      .failed = 0,
      .total_time_ms = total_time_ms,
      .parse_errors = std::move(parse_errors),
  };
  suite.total = suite.results.size();
  for (const TestExecutionResult& result : suite.results) {
    if (result.passed) {
      ++suite.passed;
    }
  }
  suite.failed = suite.total - suite.passed;
  return suite;
}

}  // namespace proba::engine
