#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <vector>

#include "proba/common/string_utils.hpp"
#include "proba/engine/code_runner.hpp"
#include "proba/engine/test_result.hpp"
#include "tests/framework/scenario.hpp"
#include "tests/framework/yaml_loader.hpp"

namespace proba::test {
namespace {

// e.g., "tests/scenarios/sandbox/errors.yaml" -> "sandbox_errors"
auto ExtractCategory(const std::filesystem::path& yaml_path) -> std::string {
  auto stem = yaml_path.stem().string();
  auto parent = yaml_path.parent_path().filename().string();
  return parent + "_" + stem;
}

// PROBA_SCENARIO_YAML selects a single file; otherwise every YAML file
// under the scenario directory.
auto GetYamlPaths() -> std::vector<std::filesystem::path> {
  if (const char* yaml_path = std::getenv("PROBA_SCENARIO_YAML")) {
    return {yaml_path};
  }

  std::vector<std::filesystem::path> yaml_paths;
  for (const auto& entry :
       std::filesystem::recursive_directory_iterator(PROBA_SCENARIO_DIR)) {
    if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
      yaml_paths.push_back(entry.path());
    }
  }

  // Sort for deterministic test order
  std::ranges::sort(yaml_paths);
  return yaml_paths;
}

// Offline engine with a short sandbox budget. Without an API key the remote
// transport is never used.
auto Runner() -> const engine::CodeRunner& {
  static const engine::CodeRunner runner(
      engine::EngineOptions{
          .sandbox = {.timeout = std::chrono::milliseconds(500),
                      .max_call_depth = 500,
                      .max_steps = 0},
          .remote = {},
      });
  return runner;
}

void AssertText(
    const std::string& actual, const ExpectedText& expected,
    const std::string& what) {
  if (expected.IsExact()) {
    EXPECT_EQ(actual, expected.exact.value()) << what;
    return;
  }
  for (const auto& substring : expected.contains) {
    EXPECT_TRUE(actual.find(substring) != std::string::npos)
        << "Expected " << what << " to contain: \"" << substring << "\"\n"
        << "Actual " << what << ": \"" << actual << "\"";
  }
  for (const auto& substring : expected.not_contains) {
    EXPECT_TRUE(actual.find(substring) == std::string::npos)
        << "Expected " << what << " not to contain: \"" << substring
        << "\"\n"
        << "Actual " << what << ": \"" << actual << "\"";
  }
}

void CheckRun(const Scenario& scenario) {
  engine::LanguageExecutionResult result = Runner().RunCodeWithLanguage(
      scenario.code, scenario.language, scenario.stdin_text);

  if (scenario.expect_success) {
    EXPECT_FALSE(result.error.has_value()) << result.error.value_or("");
  }
  if (scenario.expected_output.has_value()) {
    AssertText(result.output, scenario.expected_output.value(), "output");
  }
  if (scenario.expected_error.has_value()) {
    ASSERT_TRUE(result.error.has_value()) << "Output: " << result.output;
    AssertText(*result.error, scenario.expected_error.value(), "error");
  }
  if (scenario.expected_timed_out.has_value()) {
    EXPECT_EQ(result.timed_out, scenario.expected_timed_out.value());
  }
}

void CheckTests(const Scenario& scenario) {
  engine::TestSuiteResult suite =
      Runner().RunTestsWithLanguage(scenario.code, scenario.language);

  if (scenario.expected_total.has_value()) {
    EXPECT_EQ(suite.total, scenario.expected_total.value());
  }
  if (scenario.expected_passed.has_value()) {
    EXPECT_EQ(suite.passed, scenario.expected_passed.value());
  }
  if (scenario.expected_parse_errors.has_value()) {
    EXPECT_EQ(suite.parse_errors.size(), scenario.expected_parse_errors.value());
  }
  if (scenario.expected_failures.has_value()) {
    std::vector<std::string> failures;
    for (const auto& result : suite.results) {
      if (result.error) {
        failures.push_back(*result.error);
      }
    }
    AssertText(
        common::Join(failures, "\n"), scenario.expected_failures.value(),
        "failures");
  }
}

class ScenarioTest : public testing::TestWithParam<Scenario> {};

TEST_P(ScenarioTest, Engine) {
  const auto& scenario = GetParam();
  switch (scenario.mode) {
    case ScenarioMode::kRun:
      CheckRun(scenario);
      break;
    case ScenarioMode::kTest:
      CheckTests(scenario);
      break;
  }
}

auto LoadScenarios() -> std::vector<Scenario> {
  std::vector<Scenario> all_scenarios;

  for (const auto& yaml_path : GetYamlPaths()) {
    auto scenarios = LoadScenariosFromYaml(yaml_path.string());
    auto category = ExtractCategory(yaml_path);

    // Prefix names with category for uniqueness across YAML files
    for (auto& scenario : scenarios) {
      scenario.name = category + "_" + scenario.name;
    }

    all_scenarios.insert(
        all_scenarios.end(), std::make_move_iterator(scenarios.begin()),
        std::make_move_iterator(scenarios.end()));
  }

  return all_scenarios;
}

INSTANTIATE_TEST_SUITE_P(
    Scenarios, ScenarioTest, testing::ValuesIn(LoadScenarios()),
    [](const testing::TestParamInfo<Scenario>& info) {
      return info.param.name;
    });

}  // namespace
}  // namespace proba::test
