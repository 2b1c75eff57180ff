#include "tests/framework/yaml_loader.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "tests/framework/scenario.hpp"

namespace proba::test {

namespace {

void ValidateKeys(
    const YAML::Node& node, std::initializer_list<std::string_view> allowed,
    std::string_view context, const std::string& file_path) {
  if (!node.IsMap()) {
    return;
  }
  for (const auto& pair : node) {
    auto key = pair.first.as<std::string>();
    bool found = std::ranges::find(allowed, key) != allowed.end();
    if (!found) {
      auto mark = pair.first.Mark();
      throw std::runtime_error(
          std::format(
              "{}:{}: Unknown field '{}' in {}", file_path, mark.line + 1, key,
              context));
    }
  }
}

// Either a plain string (exact match) or {contains, not_contains}.
auto LoadExpectedText(
    const YAML::Node& node, std::string_view context,
    const std::string& file_path) -> ExpectedText {
  ExpectedText text;
  if (node.IsScalar()) {
    text.exact = node.as<std::string>();
    return text;
  }
  ValidateKeys(node, {"contains", "not_contains"}, context, file_path);
  if (node["contains"]) {
    for (const auto& item : node["contains"]) {
      text.contains.push_back(item.as<std::string>());
    }
  }
  if (node["not_contains"]) {
    for (const auto& item : node["not_contains"]) {
      text.not_contains.push_back(item.as<std::string>());
    }
  }
  return text;
}

auto ParseMode(
    const std::string& mode, const std::string& case_name,
    const std::string& file_path) -> ScenarioMode {
  if (mode == "run") {
    return ScenarioMode::kRun;
  }
  if (mode == "test") {
    return ScenarioMode::kTest;
  }
  throw std::runtime_error(
      std::format(
          "{}: case '{}': mode must be 'run' or 'test', got '{}'", file_path,
          case_name, mode));
}

}  // namespace

auto LoadScenariosFromYaml(const std::string& path) -> std::vector<Scenario> {
  std::vector<Scenario> scenarios;

  // NOLINTNEXTLINE(misc-include-cleaner): LoadFile is provided by yaml.h
  auto root = YAML::LoadFile(path);
  ValidateKeys(root, {"feature", "description", "cases"}, "root", path);

  auto feature = root["feature"].as<std::string>("");

  for (const auto& node : root["cases"]) {
    Scenario scenario;
    scenario.name = node["name"].as<std::string>();
    scenario.feature = feature;
    scenario.source_yaml = path;

    ValidateKeys(
        node,
        {"name", "description", "mode", "language", "code", "stdin", "expect"},
        std::format("case '{}'", scenario.name), path);

    if (node["mode"]) {
      scenario.mode =
          ParseMode(node["mode"].as<std::string>(), scenario.name, path);
    }
    if (node["language"]) {
      scenario.language = node["language"].as<std::string>();
    }
    scenario.code = node["code"].as<std::string>();
    if (node["stdin"]) {
      scenario.stdin_text = node["stdin"].as<std::string>();
    }

    if (node["expect"]) {
      const auto& expect = node["expect"];
      auto context = std::format("expect in case '{}'", scenario.name);
      if (scenario.mode == ScenarioMode::kRun) {
        ValidateKeys(
            expect, {"output", "error", "succeeds", "timed_out"}, context,
            path);
        if (expect["output"]) {
          scenario.expected_output =
              LoadExpectedText(expect["output"], context, path);
        }
        if (expect["error"]) {
          scenario.expected_error =
              LoadExpectedText(expect["error"], context, path);
        }
        if (expect["succeeds"]) {
          scenario.expect_success = expect["succeeds"].as<bool>();
        }
        if (expect["timed_out"]) {
          scenario.expected_timed_out = expect["timed_out"].as<bool>();
        }
      } else {
        ValidateKeys(
            expect, {"total", "passed", "parse_errors", "failures"}, context,
            path);
        if (expect["total"]) {
          scenario.expected_total = expect["total"].as<size_t>();
        }
        if (expect["passed"]) {
          scenario.expected_passed = expect["passed"].as<size_t>();
        }
        if (expect["parse_errors"]) {
          scenario.expected_parse_errors = expect["parse_errors"].as<size_t>();
        }
        if (expect["failures"]) {
          scenario.expected_failures =
              LoadExpectedText(expect["failures"], context, path);
        }
      }
    }

    scenarios.push_back(std::move(scenario));
  }

  return scenarios;
}

}  // namespace proba::test
