#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/script/fwd.hpp"

namespace proba::script {

enum class PatternKind : uint8_t {
  kIdentifier,
  kArray,
  kObject,
};

// One binding inside `[a, b = 1]` or `{x, y: z}`. An empty name is an
// array hole.
struct PatternElement {
  std::string key;  // Object patterns only
  std::string name;
  ExpressionId default_value = kInvalidExpressionId;

  auto operator==(const PatternElement&) const -> bool = default;
};

// Binding target of a declaration, parameter or for-of/in head. Patterns
// are one level deep.
struct BindingPattern {
  PatternKind kind = PatternKind::kIdentifier;
  std::string name;  // kIdentifier
  std::vector<PatternElement> elements;
  std::string rest;  // `...rest` element, empty if absent

  auto operator==(const BindingPattern&) const -> bool = default;
};

struct Parameter {
  BindingPattern pattern;
  ExpressionId default_value = kInvalidExpressionId;
  bool is_rest = false;

  auto operator==(const Parameter&) const -> bool = default;
};

struct Function {
  std::string name;  // Empty for anonymous functions and arrows
  std::vector<Parameter> parameters;
  StatementId body = kInvalidStatementId;
  // Arrow with a concise body: `x => x * 2`
  ExpressionId expression_body = kInvalidExpressionId;
  bool is_arrow = false;
  SourcePosition position;

  auto operator==(const Function&) const -> bool = default;
};

}  // namespace proba::script
