#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proba/sandbox/execution_result.hpp"
#include "proba/script/console.hpp"

namespace proba::sandbox {

struct SandboxOptions {
  std::chrono::milliseconds timeout{5000};
  uint32_t max_call_depth = 500;
  // 0 means unlimited.
  uint64_t max_steps = 0;
};

// Runs JavaScript snippets in a fresh interpreter per call. Each run gets
// its own console buffer and worker thread; the caller waits at most
// `timeout` and then returns whatever output was captured so far.
class Sandbox {
 public:
  explicit Sandbox(SandboxOptions options = {});

  // Never throws.
  [[nodiscard]] auto Run(std::string_view code) const -> ExecutionResult;

  [[nodiscard]] auto Options() const -> const SandboxOptions& {
    return options_;
  }

 private:
  SandboxOptions options_;
};

// Log lines, then a blank line and "→ value" when the run produced one;
// surrounding whitespace trimmed.
auto FormatOutput(
    const std::vector<script::LogRecord>& records,
    const std::optional<std::string>& value) -> std::string;

// "Code execution timed out after 5 seconds"
auto TimeoutMessage(std::chrono::milliseconds timeout) -> std::string;

}  // namespace proba::sandbox
