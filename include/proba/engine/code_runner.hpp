#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proba/engine/execution_router.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/engine/test_runner.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/remote/dispatcher.hpp"
#include "proba/remote/http_transport.hpp"
#include "proba/remote/remote_config.hpp"
#include "proba/sandbox/execution_result.hpp"
#include "proba/sandbox/sandbox.hpp"

namespace proba::engine {

struct EngineOptions {
  sandbox::SandboxOptions sandbox;
  remote::RemoteConfig remote;
};

// Single entry point for running code and test suites. Picks extracted or
// caller-supplied cases and routes by language; extraction, execution and
// comparison are delegated. No operation throws.
class CodeRunner {
 public:
  // A null transport selects cpp-httplib.
  explicit CodeRunner(
      EngineOptions options = {},
      std::shared_ptr<remote::HttpTransport> transport = nullptr);

  CodeRunner(const CodeRunner&) = delete;
  auto operator=(const CodeRunner&) -> CodeRunner& = delete;
  CodeRunner(CodeRunner&&) = delete;
  auto operator=(CodeRunner&&) -> CodeRunner& = delete;
  ~CodeRunner() = default;

  // JavaScript in the sandbox.
  [[nodiscard]] auto RunCode(std::string_view code) const
      -> sandbox::ExecutionResult;

  [[nodiscard]] auto RunCodeWithLanguage(
      std::string_view code, std::string_view language,
      std::string_view stdin_text = {}) const -> LanguageExecutionResult;

  // JavaScript function tests. Without `test_cases` the cases are extracted
  // from the code's annotations and the extraction errors are attached.
  [[nodiscard]] auto RunTests(
      std::string_view code,
      const std::optional<std::vector<extract::TestCase>>& test_cases =
          std::nullopt) const -> TestSuiteResult;

  // Under an unknown language every case fails with the
  // unsupported-language message.
  [[nodiscard]] auto RunTestsWithLanguage(
      std::string_view code, std::string_view language,
      const std::optional<std::vector<extract::TestCase>>& test_cases =
          std::nullopt) const -> TestSuiteResult;

  [[nodiscard]] auto RunProgramTests(
      std::string_view code, std::string_view language,
      const std::vector<ProgramTestCase>& program_cases) const
      -> TestSuiteResult;

  // Comment style follows `language`; unknown languages use `//`.
  [[nodiscard]] static auto ParseTestCases(
      std::string_view code, std::string_view language = "javascript")
      -> extract::ExtractionResult;

  [[nodiscard]] static auto ValidateCodeForTesting(
      std::string_view code, std::string_view function_name)
      -> std::vector<std::string>;

  [[nodiscard]] static auto GetSupportedLanguages() -> std::vector<std::string>;
  [[nodiscard]] static auto GetSupportedFormats() -> std::vector<std::string>;
  [[nodiscard]] auto IsApiConfigured() const -> bool;
  [[nodiscard]] auto GetApiStatus() const -> remote::ApiStatus;
  [[nodiscard]] static auto GetTestStatistics(
      const std::vector<TestExecutionResult>& results) -> TestStatistics;

  // Empty for unknown languages.
  [[nodiscard]] static auto DefaultBoilerplate(std::string_view language)
      -> std::string;

 private:
  ExecutionRouter router_;
  TestRunner runner_;
};

}  // namespace proba::engine
