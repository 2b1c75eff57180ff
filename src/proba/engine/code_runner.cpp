#include "proba/engine/code_runner.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "proba/engine/execution_router.hpp"
#include "proba/engine/language.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/engine/test_runner.hpp"
#include "proba/extract/annotation_parser.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/remote/dispatcher.hpp"
#include "proba/remote/httplib_transport.hpp"
#include "proba/sandbox/sandbox.hpp"

namespace proba::engine {

namespace {

auto MakeTransport(std::shared_ptr<remote::HttpTransport> transport)
    -> std::shared_ptr<remote::HttpTransport> {
  if (transport != nullptr) {
    return transport;
  }
  return std::make_shared<remote::HttplibTransport>();
}

// Every case fails with `message`.
auto FailAll(
    const std::vector<extract::TestCase>& test_cases,
    std::vector<extract::ParseError> parse_errors, const std::string& message)
    -> TestSuiteResult {
  std::vector<TestExecutionResult> results;
  results.reserve(test_cases.size());
  for (const extract::TestCase& test_case : test_cases) {
    results.push_back(
        TestExecutionResult{
            .test_case = test_case,
            .passed = false,
            .actual = std::nullopt,
            .error = message,
            .execution_time_ms = 0,
            .output = std::nullopt,
        });
  }
  return Summarize(std::move(results), std::move(parse_errors), 0);
}

}  // namespace

CodeRunner::CodeRunner(
    EngineOptions options, std::shared_ptr<remote::HttpTransport> transport)
    : router_(
          sandbox::Sandbox(options.sandbox),
          remote::RemoteDispatcher(
              std::move(options.remote), MakeTransport(std::move(transport)))),
      runner_(router_) {
}

auto CodeRunner::RunCode(std::string_view code) const
    -> sandbox::ExecutionResult {
  return router_.Local().Run(code);
}

auto CodeRunner::RunCodeWithLanguage(
    std::string_view code, std::string_view language,
    std::string_view stdin_text) const -> LanguageExecutionResult {
  return router_.Run(code, language, stdin_text);
}

auto CodeRunner::RunTests(
    std::string_view code,
    const std::optional<std::vector<extract::TestCase>>& test_cases) const
    -> TestSuiteResult {
  return RunTestsWithLanguage(code, "javascript", test_cases);
}

auto CodeRunner::RunTestsWithLanguage(
    std::string_view code, std::string_view language,
    const std::optional<std::vector<extract::TestCase>>& test_cases) const
    -> TestSuiteResult {
  std::vector<extract::TestCase> cases;
  std::vector<extract::ParseError> parse_errors;
  if (test_cases) {
    cases = *test_cases;
  } else {
    extract::ExtractionResult extracted = ParseTestCases(code, language);
    cases = std::move(extracted.test_cases);
    parse_errors = std::move(extracted.errors);
  }

  auto parsed = ParseLanguage(language);
  if (!parsed) {
    return FailAll(
        cases, std::move(parse_errors), UnsupportedLanguageMessage(language));
  }
  return runner_.RunSuite(code, cases, std::move(parse_errors), *parsed);
}

auto CodeRunner::RunProgramTests(
    std::string_view code, std::string_view language,
    const std::vector<ProgramTestCase>& program_cases) const
    -> TestSuiteResult {
  auto parsed = ParseLanguage(language);
  if (!parsed) {
    std::vector<extract::TestCase> cases;
    cases.reserve(program_cases.size());
    for (size_t i = 0; i < program_cases.size(); ++i) {
      cases.push_back(ToTestCase(program_cases[i], i));
    }
    return FailAll(cases, {}, UnsupportedLanguageMessage(language));
  }
  return runner_.RunProgramSuite(code, *parsed, program_cases);
}

auto CodeRunner::ParseTestCases(
    std::string_view code, std::string_view language)
    -> extract::ExtractionResult {
  extract::AnnotationParser parser(extract::CommentStyleFor(language));
  return parser.Extract(code);
}

auto CodeRunner::ValidateCodeForTesting(
    std::string_view code, std::string_view function_name)
    -> std::vector<std::string> {
  return ValidateUserCode(code, function_name);
}

auto CodeRunner::GetSupportedLanguages() -> std::vector<std::string> {
  return engine::GetSupportedLanguages();
}

auto CodeRunner::GetSupportedFormats() -> std::vector<std::string> {
  return extract::AnnotationParser::GetSupportedFormats();
}

auto CodeRunner::IsApiConfigured() const -> bool {
  return router_.Remote().IsConfigured();
}

auto CodeRunner::GetApiStatus() const -> remote::ApiStatus {
  return router_.Remote().Status();
}

auto CodeRunner::GetTestStatistics(
    const std::vector<TestExecutionResult>& results) -> TestStatistics {
  return engine::GetTestStatistics(results);
}

auto CodeRunner::DefaultBoilerplate(std::string_view language)
    -> std::string {
  auto parsed = ParseLanguage(language);
  if (!parsed) {
    return "";
  }
  return std::string(engine::DefaultBoilerplate(*parsed));
}

}  // namespace proba::engine
