#include "cases_file.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "proba/common/diagnostic.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/extract/annotation_parser.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/value/json.hpp"
#include "proba/value/value.hpp"

namespace proba::driver {

namespace {

using Json = nlohmann::ordered_json;

constexpr const char* kShapeNote =
    R"(expected {"tests": [...]} and/or {"programs": [...]})";

auto EntryError(
    std::string_view source, std::string_view list, size_t index,
    std::string_view message) -> Diagnostic {
  return Diagnostic::HostError(
      std::format("{}: {}[{}]: {}", source, list, index, message));
}

auto OptionalString(const Json& entry, const char* key)
    -> std::optional<std::string> {
  auto it = entry.find(key);
  if (it == entry.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

auto ParseTestEntry(const Json& entry, size_t index, std::string_view source)
    -> Result<extract::TestCase> {
  if (!entry.is_object()) {
    return std::unexpected(
        EntryError(source, "tests", index, "expected an object"));
  }

  // Form shape: every field is text.
  if (entry.contains("inputs")) {
    extract::FunctionTestForm form{
        .name = OptionalString(entry, "name").value_or(""),
        .function_name = OptionalString(entry, "functionName").value_or(""),
        .inputs = OptionalString(entry, "inputs").value_or(""),
        .expected = OptionalString(entry, "expected").value_or(""),
        .user_inputs = OptionalString(entry, "userInputs"),
    };
    auto test_case =
        extract::BuildTestCase(form, static_cast<uint32_t>(index));
    if (!test_case) {
      return std::unexpected(EntryError(
          source, "tests", index, "'functionName' and 'expected' are required"));
    }
    return *std::move(test_case);
  }

  auto function_name = OptionalString(entry, "functionName");
  if (!function_name || function_name->empty()) {
    return std::unexpected(
        EntryError(source, "tests", index, "missing 'functionName'"));
  }
  if (!entry.contains("expected")) {
    return std::unexpected(
        EntryError(source, "tests", index, "missing 'expected'"));
  }

  std::vector<Value> input;
  if (auto it = entry.find("input"); it != entry.end()) {
    if (!it->is_array()) {
      return std::unexpected(
          EntryError(source, "tests", index, "'input' must be an array"));
    }
    for (const Json& element : *it) {
      auto value = FromJson(element);
      if (!value) {
        return std::unexpected(
            EntryError(source, "tests", index, "'input' is nested too deeply"));
      }
      input.push_back(*std::move(value));
    }
  }
  auto expected = FromJson(entry.at("expected"));
  if (!expected) {
    return std::unexpected(
        EntryError(source, "tests", index, "'expected' is nested too deeply"));
  }

  return extract::TestCase{
      .name = OptionalString(entry, "name")
                  .value_or(std::format("Test {}", index + 1)),
      .function_name = *std::move(function_name),
      .input = std::move(input),
      .expected = *std::move(expected),
      .source_line = std::nullopt,
      .user_inputs = OptionalString(entry, "userInputs"),
  };
}

auto ParseProgramEntry(
    const Json& entry, size_t index, std::string_view source)
    -> Result<engine::ProgramTestCase> {
  if (!entry.is_object()) {
    return std::unexpected(
        EntryError(source, "programs", index, "expected an object"));
  }
  auto expected = OptionalString(entry, "expectedOutput");
  if (!expected) {
    return std::unexpected(
        EntryError(source, "programs", index, "missing 'expectedOutput'"));
  }
  return engine::ProgramTestCase{
      .name = OptionalString(entry, "name")
                  .value_or(std::format("Test {}", index + 1)),
      .stdin_text = OptionalString(entry, "stdin").value_or(""),
      .expected_output = *std::move(expected),
  };
}

}  // namespace

auto ParseCasesFile(std::string_view text, std::string_view source)
    -> Result<CasesFile> {
  Json root = Json::parse(
      text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) {
    return std::unexpected(
        Diagnostic::HostError(std::format("{}: invalid JSON", source)));
  }
  if (!root.is_object()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("{}: expected a JSON object", source))
            .WithNote(kShapeNote));
  }

  CasesFile cases;
  if (auto it = root.find("tests"); it != root.end()) {
    if (!it->is_array()) {
      return std::unexpected(Diagnostic::HostError(
          std::format("{}: 'tests' must be an array", source)));
    }
    std::vector<extract::TestCase> tests;
    for (size_t i = 0; i < it->size(); ++i) {
      auto test_case = ParseTestEntry((*it)[i], i, source);
      if (!test_case) {
        return std::unexpected(std::move(test_case.error()));
      }
      tests.push_back(*std::move(test_case));
    }
    cases.tests = std::move(tests);
  }

  if (auto it = root.find("programs"); it != root.end()) {
    if (!it->is_array()) {
      return std::unexpected(Diagnostic::HostError(
          std::format("{}: 'programs' must be an array", source)));
    }
    for (size_t i = 0; i < it->size(); ++i) {
      auto program = ParseProgramEntry((*it)[i], i, source);
      if (!program) {
        return std::unexpected(std::move(program.error()));
      }
      cases.programs.push_back(*std::move(program));
    }
  }

  if (!cases.tests && cases.programs.empty()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("{}: no 'tests' or 'programs' entries", source))
            .WithNote(kShapeNote));
  }
  return cases;
}

auto LoadCasesFile(const std::filesystem::path& path) -> Result<CasesFile> {
  auto text = ReadTextFile(path);
  if (!text) {
    return std::unexpected(std::move(text.error()));
  }
  return ParseCasesFile(*text, path.string());
}

auto ReadTextFile(const std::filesystem::path& path) -> Result<std::string> {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(Diagnostic::HostError(
        std::format("cannot open '{}'", path.string())));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace proba::driver
