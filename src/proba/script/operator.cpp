#include "proba/script/operator.hpp"

#include <optional>
#include <string_view>

namespace proba::script {

auto CompoundAssignmentOp(std::string_view token) -> std::optional<BinaryOp> {
  if (token == "+=") {
    return BinaryOp::kAdd;
  }
  if (token == "-=") {
    return BinaryOp::kSubtract;
  }
  if (token == "*=") {
    return BinaryOp::kMultiply;
  }
  if (token == "/=") {
    return BinaryOp::kDivide;
  }
  if (token == "%=") {
    return BinaryOp::kMod;
  }
  if (token == "**=") {
    return BinaryOp::kPower;
  }
  if (token == "&=") {
    return BinaryOp::kBitwiseAnd;
  }
  if (token == "|=") {
    return BinaryOp::kBitwiseOr;
  }
  if (token == "^=") {
    return BinaryOp::kBitwiseXor;
  }
  if (token == "<<=") {
    return BinaryOp::kShiftLeft;
  }
  if (token == ">>=") {
    return BinaryOp::kShiftRight;
  }
  if (token == ">>>=") {
    return BinaryOp::kUnsignedShiftRight;
  }
  return std::nullopt;
}

auto LogicalAssignmentOp(std::string_view token) -> std::optional<LogicalOp> {
  if (token == "&&=") {
    return LogicalOp::kAnd;
  }
  if (token == "||=") {
    return LogicalOp::kOr;
  }
  if (token == "??=") {
    return LogicalOp::kNullish;
  }
  return std::nullopt;
}

auto ToString(BinaryOp op) -> std::string_view {
  switch (op) {
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSubtract:
      return "-";
    case BinaryOp::kMultiply:
      return "*";
    case BinaryOp::kDivide:
      return "/";
    case BinaryOp::kMod:
      return "%";
    case BinaryOp::kPower:
      return "**";
    case BinaryOp::kEqual:
      return "==";
    case BinaryOp::kNotEqual:
      return "!=";
    case BinaryOp::kStrictEqual:
      return "===";
    case BinaryOp::kStrictNotEqual:
      return "!==";
    case BinaryOp::kLessThan:
      return "<";
    case BinaryOp::kLessThanEqual:
      return "<=";
    case BinaryOp::kGreaterThan:
      return ">";
    case BinaryOp::kGreaterThanEqual:
      return ">=";
    case BinaryOp::kInstanceof:
      return "instanceof";
    case BinaryOp::kIn:
      return "in";
    case BinaryOp::kBitwiseAnd:
      return "&";
    case BinaryOp::kBitwiseOr:
      return "|";
    case BinaryOp::kBitwiseXor:
      return "^";
    case BinaryOp::kShiftLeft:
      return "<<";
    case BinaryOp::kShiftRight:
      return ">>";
    case BinaryOp::kUnsignedShiftRight:
      return ">>>";
  }
  return "?";
}

}  // namespace proba::script
