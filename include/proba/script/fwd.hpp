#pragma once

#include <cstdint>

namespace proba::script {

struct ExpressionId {
  uint32_t value = 0;

  auto operator==(const ExpressionId&) const -> bool = default;
  auto operator<=>(const ExpressionId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

constexpr ExpressionId kInvalidExpressionId{UINT32_MAX};

struct StatementId {
  uint32_t value = 0;

  auto operator==(const StatementId&) const -> bool = default;
  auto operator<=>(const StatementId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

constexpr StatementId kInvalidStatementId{UINT32_MAX};

struct FunctionId {
  uint32_t value = 0;

  auto operator==(const FunctionId&) const -> bool = default;
  auto operator<=>(const FunctionId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

constexpr FunctionId kInvalidFunctionId{UINT32_MAX};

class Arena;
struct Program;
class Interpreter;
class Scope;
struct Object;

}  // namespace proba::script
