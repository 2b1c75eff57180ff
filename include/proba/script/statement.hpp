#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/script/fwd.hpp"
#include "proba/script/routine.hpp"

namespace proba::script {

enum class StatementKind {
  kBlock,
  kVariableDeclaration,
  kFunctionDeclaration,
  kExpression,
  kIf,
  kFor,
  kForIn,
  kForOf,
  kWhile,
  kDoWhile,
  kBreak,
  kContinue,
  kReturn,
  kThrow,
  kTry,
  kSwitch,
  kEmpty,
};

enum class DeclarationKind : uint8_t {
  kVar,
  kLet,
  kConst,
};

struct BlockStatementData {
  std::vector<StatementId> statements;

  auto operator==(const BlockStatementData&) const -> bool = default;
};

struct Declarator {
  BindingPattern target;
  ExpressionId init = kInvalidExpressionId;

  auto operator==(const Declarator&) const -> bool = default;
};

struct VariableDeclarationStatementData {
  DeclarationKind kind;
  std::vector<Declarator> declarators;

  auto operator==(const VariableDeclarationStatementData&) const
      -> bool = default;
};

struct FunctionDeclarationStatementData {
  FunctionId function;

  auto operator==(const FunctionDeclarationStatementData&) const
      -> bool = default;
};

struct ExpressionStatementData {
  ExpressionId expression;

  auto operator==(const ExpressionStatementData&) const -> bool = default;
};

struct IfStatementData {
  ExpressionId condition;
  StatementId then_branch;
  StatementId else_branch = kInvalidStatementId;

  auto operator==(const IfStatementData&) const -> bool = default;
};

struct ForStatementData {
  StatementId init = kInvalidStatementId;  // Declaration or expression
  ExpressionId test = kInvalidExpressionId;
  ExpressionId update = kInvalidExpressionId;
  StatementId body;

  auto operator==(const ForStatementData&) const -> bool = default;
};

// for (const x of xs) / for (k in obj); a head without a declaration
// assigns to an existing name.
struct ForEachStatementData {
  std::optional<DeclarationKind> declaration;
  BindingPattern target;
  ExpressionId iterable;
  StatementId body;

  auto operator==(const ForEachStatementData&) const -> bool = default;
};

struct WhileStatementData {
  ExpressionId condition;
  StatementId body;

  auto operator==(const WhileStatementData&) const -> bool = default;
};

struct BreakStatementData {
  auto operator==(const BreakStatementData&) const -> bool = default;
};

struct ContinueStatementData {
  auto operator==(const ContinueStatementData&) const -> bool = default;
};

struct ReturnStatementData {
  ExpressionId value = kInvalidExpressionId;

  auto operator==(const ReturnStatementData&) const -> bool = default;
};

struct ThrowStatementData {
  ExpressionId value;

  auto operator==(const ThrowStatementData&) const -> bool = default;
};

struct TryStatementData {
  StatementId block;
  std::optional<BindingPattern> catch_binding;
  StatementId handler = kInvalidStatementId;
  StatementId finalizer = kInvalidStatementId;

  auto operator==(const TryStatementData&) const -> bool = default;
};

struct SwitchCase {
  ExpressionId test = kInvalidExpressionId;  // Invalid for `default:`
  std::vector<StatementId> body;

  auto operator==(const SwitchCase&) const -> bool = default;
};

struct SwitchStatementData {
  ExpressionId discriminant;
  std::vector<SwitchCase> cases;

  auto operator==(const SwitchStatementData&) const -> bool = default;
};

struct EmptyStatementData {
  auto operator==(const EmptyStatementData&) const -> bool = default;
};

using StatementData = std::variant<
    BlockStatementData, VariableDeclarationStatementData,
    FunctionDeclarationStatementData, ExpressionStatementData,
    IfStatementData, ForStatementData, ForEachStatementData,
    WhileStatementData, BreakStatementData, ContinueStatementData,
    ReturnStatementData, ThrowStatementData, TryStatementData,
    SwitchStatementData, EmptyStatementData>;

struct Statement {
  StatementKind kind;
  SourcePosition position;
  StatementData data;

  auto operator==(const Statement&) const -> bool = default;
};

}  // namespace proba::script
