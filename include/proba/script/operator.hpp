#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace proba::script {

enum class UnaryOp : uint8_t {
  kPlus,
  kMinus,
  kLogicalNot,
  kBitwiseNot,
  kTypeof,
  kVoid,
  kDelete,
};

enum class BinaryOp : uint8_t {
  // Arithmetic
  kAdd,
  kSubtract,
  kMultiply,
  kDivide,
  kMod,
  kPower,

  // Equality
  kEqual,
  kNotEqual,
  kStrictEqual,
  kStrictNotEqual,

  // Relational
  kLessThan,
  kLessThanEqual,
  kGreaterThan,
  kGreaterThanEqual,
  kInstanceof,
  kIn,

  // Bitwise
  kBitwiseAnd,
  kBitwiseOr,
  kBitwiseXor,
  kShiftLeft,
  kShiftRight,
  kUnsignedShiftRight,
};

enum class LogicalOp : uint8_t {
  kAnd,
  kOr,
  kNullish,
};

// Operator of a compound assignment token ("+=" -> kAdd), nullopt for
// anything else.
auto CompoundAssignmentOp(std::string_view token) -> std::optional<BinaryOp>;

// "&&=", "||=", "??=".
auto LogicalAssignmentOp(std::string_view token) -> std::optional<LogicalOp>;

auto ToString(BinaryOp op) -> std::string_view;

}  // namespace proba::script
