#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "proba/extract/test_case.hpp"
#include "proba/value/value.hpp"

namespace proba::engine {

struct TestExecutionResult {
  extract::TestCase test_case;
  bool passed = false;
  std::optional<Value> actual;
  std::optional<std::string> error;
  double execution_time_ms = 0;
  std::optional<std::string> output;
};

// passed + failed == total == results.size()
struct TestSuiteResult {
  std::vector<TestExecutionResult> results;
  size_t total = 0;
  size_t passed = 0;
  size_t failed = 0;
  double total_time_ms = 0;
  std::vector<extract::ParseError> parse_errors;

  [[nodiscard]] auto HasParseErrors() const -> bool {
    return !parse_errors.empty();
  }
  [[nodiscard]] auto AllPassed() const -> bool {
    return failed == 0;
  }
};

// I/O-style case: the whole program runs with `stdin` and its trimmed
// output is compared with `expected_output`.
struct ProgramTestCase {
  std::string name;
  std::string stdin_text;
  std::string expected_output;
};

struct TestStatistics {
  double pass_rate = 0;  // percent
  double average_time_ms = 0;
  // Indices into the results; empty for an empty run.
  std::optional<size_t> slowest;
  std::optional<size_t> fastest;
};

}  // namespace proba::engine
