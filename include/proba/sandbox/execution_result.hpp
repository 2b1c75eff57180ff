#pragma once

#include <optional>
#include <string>

namespace proba::sandbox {

// Outcome of one run. `timed_out` is set only when the budget elapsed
// before the snippet produced a value or an error.
struct ExecutionResult {
  std::string output;
  std::optional<std::string> error;
  double execution_time_ms = 0;
  bool timed_out = false;

  [[nodiscard]] auto Succeeded() const -> bool {
    return !error.has_value();
  }
};

}  // namespace proba::sandbox
