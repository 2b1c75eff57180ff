#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/extract/test_case.hpp"

namespace proba::driver {

// Contents of a --cases file:
//   {"tests": [{"name", "functionName", "input": [...], "expected"}],
//    "programs": [{"name", "stdin", "expectedOutput"}]}
// A test entry may instead use the form shape with text fields
//   {"name", "functionName", "inputs": "1, 2", "expected": "3"}.
struct CasesFile {
  // Absent when the file has no "tests" key.
  std::optional<std::vector<extract::TestCase>> tests;
  std::vector<engine::ProgramTestCase> programs;
};

auto ParseCasesFile(std::string_view text, std::string_view source)
    -> Result<CasesFile>;

auto LoadCasesFile(const std::filesystem::path& path) -> Result<CasesFile>;

// Whole file as text.
auto ReadTextFile(const std::filesystem::path& path) -> Result<std::string>;

}  // namespace proba::driver
