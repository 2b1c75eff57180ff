#pragma once

#include <cstdint>
#include <exception>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

#include "proba/common/diagnostic.hpp"
#include "proba/script/runtime_value.hpp"

namespace proba::script {

// Source that cannot be tokenized or parsed.
class SyntaxError : public std::runtime_error {
 public:
  SyntaxError(std::string message, SourcePosition position)
      : std::runtime_error(message),
        message_(std::move(message)),
        position_(position) {
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }
  [[nodiscard]] auto Position() const -> SourcePosition {
    return position_;
  }
  [[nodiscard]] auto ToDiagnostic() const -> Diagnostic {
    return Diagnostic::Error(
        position_, std::format(
                       "{} ({}:{})", message_, position_.line,
                       position_.column));
  }

 private:
  std::string message_;
  SourcePosition position_;
};

// A value raised by `throw` (or by a built-in), unwinding to the nearest
// script `catch`.
class ThrowSignal : public std::exception {
 public:
  explicit ThrowSignal(RuntimeValue value) : value_(std::move(value)) {
  }

  [[nodiscard]] auto Value() const -> const RuntimeValue& {
    return value_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return "uncaught script exception";
  }

 private:
  RuntimeValue value_;
};

enum class InterruptReason : uint8_t {
  kDeadline,
  kStopRequested,
  kStepBudget,
};

// Deadline passed, stop requested or step budget spent. Script `catch`
// never sees this.
class Interrupted : public std::exception {
 public:
  explicit Interrupted(InterruptReason reason) : reason_(reason) {
  }

  [[nodiscard]] auto Reason() const -> InterruptReason {
    return reason_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return "script execution interrupted";
  }

 private:
  InterruptReason reason_;
};

}  // namespace proba::script
