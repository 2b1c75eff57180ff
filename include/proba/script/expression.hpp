#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/script/fwd.hpp"
#include "proba/script/operator.hpp"
#include "proba/script/routine.hpp"

namespace proba::script {

enum class ExpressionKind {
  kNumber,
  kString,
  kTemplate,
  kBoolean,
  kNull,
  kThis,
  kIdentifier,
  kArrayLiteral,
  kObjectLiteral,
  kFunction,
  kUnary,
  kUpdate,
  kBinary,
  kLogical,
  kConditional,
  kAssignment,
  kDestructuringAssignment,
  kCall,
  kNew,
  kMember,  // obj.name
  kIndex,   // obj[expr]
  kSpread,  // Only inside array literals and argument lists
  kSequence,
};

struct NumberExpressionData {
  double value;

  auto operator==(const NumberExpressionData&) const -> bool = default;
};

struct StringExpressionData {
  std::string value;

  auto operator==(const StringExpressionData&) const -> bool = default;
};

struct TemplateExpressionData {
  std::vector<std::string> chunks;  // chunks.size() == holes.size() + 1
  std::vector<ExpressionId> holes;

  auto operator==(const TemplateExpressionData&) const -> bool = default;
};

struct BooleanExpressionData {
  bool value;

  auto operator==(const BooleanExpressionData&) const -> bool = default;
};

struct NullExpressionData {
  auto operator==(const NullExpressionData&) const -> bool = default;
};

struct ThisExpressionData {
  auto operator==(const ThisExpressionData&) const -> bool = default;
};

struct IdentifierExpressionData {
  std::string name;

  auto operator==(const IdentifierExpressionData&) const -> bool = default;
};

struct ArrayLiteralExpressionData {
  // kInvalidExpressionId marks a hole: [1, , 3]
  std::vector<ExpressionId> elements;

  auto operator==(const ArrayLiteralExpressionData&) const -> bool = default;
};

struct ObjectProperty {
  std::string key;
  ExpressionId computed_key = kInvalidExpressionId;  // { [expr]: v }
  ExpressionId value = kInvalidExpressionId;
  bool is_spread = false;  // { ...other }; value holds the source

  auto operator==(const ObjectProperty&) const -> bool = default;
};

struct ObjectLiteralExpressionData {
  std::vector<ObjectProperty> properties;

  auto operator==(const ObjectLiteralExpressionData&) const -> bool = default;
};

struct FunctionExpressionData {
  FunctionId function;

  auto operator==(const FunctionExpressionData&) const -> bool = default;
};

struct UnaryExpressionData {
  UnaryOp op;
  ExpressionId operand;

  auto operator==(const UnaryExpressionData&) const -> bool = default;
};

struct UpdateExpressionData {
  bool increment;
  bool prefix;
  ExpressionId target;

  auto operator==(const UpdateExpressionData&) const -> bool = default;
};

struct BinaryExpressionData {
  BinaryOp op;
  ExpressionId lhs;
  ExpressionId rhs;

  auto operator==(const BinaryExpressionData&) const -> bool = default;
};

struct LogicalExpressionData {
  LogicalOp op;
  ExpressionId lhs;
  ExpressionId rhs;

  auto operator==(const LogicalExpressionData&) const -> bool = default;
};

struct ConditionalExpressionData {
  ExpressionId condition;
  ExpressionId then_expr;
  ExpressionId else_expr;

  auto operator==(const ConditionalExpressionData&) const -> bool = default;
};

// `=`, compound (`+=`) and logical (`&&=`) assignment to a name, member or
// index target.
struct AssignmentExpressionData {
  ExpressionId target;
  ExpressionId value;
  std::optional<BinaryOp> compound_op;
  std::optional<LogicalOp> logical_op;

  auto operator==(const AssignmentExpressionData&) const -> bool = default;
};

// `[a, b] = [b, a]`
struct DestructuringAssignmentExpressionData {
  BindingPattern pattern;
  ExpressionId value;

  auto operator==(const DestructuringAssignmentExpressionData&) const
      -> bool = default;
};

struct CallExpressionData {
  ExpressionId callee;
  std::vector<ExpressionId> arguments;
  bool optional = false;  // f?.()

  auto operator==(const CallExpressionData&) const -> bool = default;
};

struct NewExpressionData {
  ExpressionId callee;
  std::vector<ExpressionId> arguments;

  auto operator==(const NewExpressionData&) const -> bool = default;
};

struct MemberExpressionData {
  ExpressionId object;
  std::string property;
  bool optional = false;  // obj?.name

  auto operator==(const MemberExpressionData&) const -> bool = default;
};

struct IndexExpressionData {
  ExpressionId object;
  ExpressionId index;
  bool optional = false;  // obj?.[i]

  auto operator==(const IndexExpressionData&) const -> bool = default;
};

struct SpreadExpressionData {
  ExpressionId argument;

  auto operator==(const SpreadExpressionData&) const -> bool = default;
};

struct SequenceExpressionData {
  std::vector<ExpressionId> expressions;

  auto operator==(const SequenceExpressionData&) const -> bool = default;
};

using ExpressionData = std::variant<
    NumberExpressionData, StringExpressionData, TemplateExpressionData,
    BooleanExpressionData, NullExpressionData, ThisExpressionData,
    IdentifierExpressionData, ArrayLiteralExpressionData,
    ObjectLiteralExpressionData, FunctionExpressionData, UnaryExpressionData,
    UpdateExpressionData, BinaryExpressionData, LogicalExpressionData,
    ConditionalExpressionData, AssignmentExpressionData,
    DestructuringAssignmentExpressionData, CallExpressionData,
    NewExpressionData, MemberExpressionData, IndexExpressionData,
    SpreadExpressionData, SequenceExpressionData>;

struct Expression {
  ExpressionKind kind;
  SourcePosition position;
  ExpressionData data;

  auto operator==(const Expression&) const -> bool = default;
};

}  // namespace proba::script
