#include "report.hpp"

#include <format>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "proba/common/string_utils.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/engine/test_runner.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/value/json.hpp"
#include "proba/value/value.hpp"

namespace proba::driver {

namespace {

using Json = nlohmann::ordered_json;

// name(1, "a")
auto FormatCall(const extract::TestCase& test_case) -> std::string {
  std::vector<std::string> arguments;
  arguments.reserve(test_case.input.size());
  for (const Value& value : test_case.input) {
    arguments.push_back(Stringify(value));
  }
  return std::format(
      "{}({})", test_case.function_name, common::Join(arguments, ", "));
}

auto ParseErrorsJson(const std::vector<extract::ParseError>& errors) -> Json {
  Json list = Json::array();
  for (const extract::ParseError& error : errors) {
    list.push_back({
        {"line", error.line},
        {"message", error.message},
        {"originalText", error.original_text},
    });
  }
  return list;
}

auto TestCaseJson(const extract::TestCase& test_case) -> Json {
  Json input = Json::array();
  for (const Value& value : test_case.input) {
    input.push_back(ToJson(value));
  }
  Json json = {
      {"name", test_case.name},
      {"functionName", test_case.function_name},
      {"input", std::move(input)},
      {"expected", ToJson(test_case.expected)},
  };
  if (test_case.source_line) {
    json["line"] = *test_case.source_line;
  }
  return json;
}

void AppendParseErrors(
    std::string& out, const std::vector<extract::ParseError>& errors) {
  for (const extract::ParseError& error : errors) {
    out += std::format(
        "line {}: {}: {}\n", error.line, error.message, error.original_text);
  }
}

}  // namespace

auto FormatSuiteText(const engine::TestSuiteResult& suite) -> std::string {
  std::string out;
  for (const engine::TestExecutionResult& result : suite.results) {
    const extract::TestCase& test_case = result.test_case;
    std::string subject = test_case.function_name == "program"
                              ? std::string("program")
                              : FormatCall(test_case);
    out += std::format(
        "{} {}: {} ({:.2f} ms)\n", result.passed ? "PASS" : "FAIL",
        test_case.name, subject, result.execution_time_ms);
    if (result.passed) {
      continue;
    }
    if (result.error) {
      out += std::format("  error: {}\n", *result.error);
      continue;
    }
    out += std::format("  expected: {}\n", Stringify(test_case.expected));
    out += std::format(
        "  actual:   {}\n",
        result.actual ? Stringify(*result.actual) : std::string("undefined"));
  }

  AppendParseErrors(out, suite.parse_errors);

  engine::TestStatistics stats = engine::GetTestStatistics(suite.results);
  out += std::format(
      "{} tests, {} passed, {} failed ({:.0f}%) in {:.2f} ms\n", suite.total,
      suite.passed, suite.failed, stats.pass_rate, suite.total_time_ms);
  return out;
}

auto FormatSuiteJson(const engine::TestSuiteResult& suite) -> std::string {
  Json results = Json::array();
  for (const engine::TestExecutionResult& result : suite.results) {
    Json json = {
        {"testCase", TestCaseJson(result.test_case)},
        {"passed", result.passed},
        {"executionTimeMs", result.execution_time_ms},
    };
    if (result.actual) {
      json["actual"] = ToJson(*result.actual);
    }
    if (result.error) {
      json["error"] = *result.error;
    }
    if (result.output) {
      json["output"] = *result.output;
    }
    results.push_back(std::move(json));
  }

  engine::TestStatistics stats = engine::GetTestStatistics(suite.results);
  Json report = {
      {"total", suite.total},
      {"passed", suite.passed},
      {"failed", suite.failed},
      {"totalTimeMs", suite.total_time_ms},
      {"hasParseErrors", suite.HasParseErrors()},
      {"parseErrors", ParseErrorsJson(suite.parse_errors)},
      {"statistics",
       {
           {"passRate", stats.pass_rate},
           {"averageTimeMs", stats.average_time_ms},
       }},
      {"results", std::move(results)},
  };
  return report.dump(2);
}

auto FormatExtractionText(const extract::ExtractionResult& extraction)
    -> std::string {
  std::string out;
  for (const extract::TestCase& test_case : extraction.test_cases) {
    out += std::format(
        "{}: {} => {}", test_case.name, FormatCall(test_case),
        Stringify(test_case.expected));
    if (test_case.source_line) {
      out += std::format(" (line {})", *test_case.source_line);
    }
    out += '\n';
  }
  AppendParseErrors(out, extraction.errors);
  return out;
}

auto FormatExtractionJson(const extract::ExtractionResult& extraction)
    -> std::string {
  Json cases = Json::array();
  for (const extract::TestCase& test_case : extraction.test_cases) {
    cases.push_back(TestCaseJson(test_case));
  }
  Json report = {
      {"testCases", std::move(cases)},
      {"errors", ParseErrorsJson(extraction.errors)},
  };
  return report.dump(2);
}

}  // namespace proba::driver
