#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "proba/common/internal_error.hpp"
#include "proba/script/errors.hpp"
#include "proba/script/expression.hpp"
#include "proba/script/interpreter.hpp"
#include "proba/script/runtime_value.hpp"
#include "proba/script/scope.hpp"
#include "proba/value/number.hpp"

namespace proba::script {

namespace {

class DepthGuard {
 public:
  explicit DepthGuard(uint32_t& depth) : depth_(depth) {
    ++depth_;
  }
  ~DepthGuard() {
    --depth_;
  }
  DepthGuard(const DepthGuard&) = delete;
  auto operator=(const DepthGuard&) -> DepthGuard& = delete;

 private:
  uint32_t& depth_;
};

// Restores the running program after a call into a closure from another
// parse (template holes share the arena, so this is rare).
class ProgramGuard {
 public:
  ProgramGuard(
      std::shared_ptr<const Program>& slot,
      const std::shared_ptr<const Program>& next)
      : slot_(slot), saved_(slot) {
    if (slot_ != next) {
      slot_ = next;
    }
  }
  ~ProgramGuard() {
    slot_ = std::move(saved_);
  }
  ProgramGuard(const ProgramGuard&) = delete;
  auto operator=(const ProgramGuard&) -> ProgramGuard& = delete;

 private:
  std::shared_ptr<const Program>& slot_;
  std::shared_ptr<const Program> saved_;
};

auto Power(double base, double exponent) -> double {
  if (std::isnan(exponent)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (std::isinf(exponent) && std::fabs(base) == 1) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return std::pow(base, exponent);
}

void NameFunction(RuntimeValue& value, std::string_view name) {
  if (Object* function = AsObject(value);
      function != nullptr && function->IsFunction() && function->name.empty()) {
    function->name = std::string(name);
  }
}

}  // namespace

auto Interpreter::Evaluate(ExpressionId id, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  const Expression& expr = CurrentArena()[id];

  switch (expr.kind) {
    case ExpressionKind::kNumber:
      return std::get<NumberExpressionData>(expr.data).value;

    case ExpressionKind::kString:
      return std::get<StringExpressionData>(expr.data).value;

    case ExpressionKind::kTemplate:
      return EvaluateTemplate(std::get<TemplateExpressionData>(expr.data), scope);

    case ExpressionKind::kBoolean:
      return std::get<BooleanExpressionData>(expr.data).value;

    case ExpressionKind::kNull:
      return Null{};

    case ExpressionKind::kThis: {
      if (Binding* binding = scope->Lookup("this")) {
        return binding->value;
      }
      return Undefined{};
    }

    case ExpressionKind::kIdentifier:
      return LookupName(std::get<IdentifierExpressionData>(expr.data).name, scope);

    case ExpressionKind::kArrayLiteral:
      return EvaluateArrayLiteral(
          std::get<ArrayLiteralExpressionData>(expr.data), scope);

    case ExpressionKind::kObjectLiteral:
      return EvaluateObjectLiteral(
          std::get<ObjectLiteralExpressionData>(expr.data), scope);

    case ExpressionKind::kFunction: {
      FunctionId function = std::get<FunctionExpressionData>(expr.data).function;
      const Function& node = CurrentArena()[function];
      if (node.name.empty() || node.is_arrow) {
        return MakeClosure(function, scope);
      }
      // A named function expression sees its own name.
      auto name_scope = std::make_shared<Scope>(scope, false);
      ObjectRef closure = MakeClosure(function, name_scope);
      name_scope->Declare(node.name, closure, DeclarationKind::kConst);
      return closure;
    }

    case ExpressionKind::kUnary:
      return EvaluateUnary(std::get<UnaryExpressionData>(expr.data), scope);

    case ExpressionKind::kUpdate:
      return EvaluateUpdate(std::get<UpdateExpressionData>(expr.data), scope);

    case ExpressionKind::kBinary: {
      const auto& data = std::get<BinaryExpressionData>(expr.data);
      RuntimeValue lhs = Evaluate(data.lhs, scope);
      RuntimeValue rhs = Evaluate(data.rhs, scope);
      return BinaryOperation(data.op, lhs, rhs);
    }

    case ExpressionKind::kLogical:
      return EvaluateLogical(std::get<LogicalExpressionData>(expr.data), scope);

    case ExpressionKind::kConditional: {
      const auto& data = std::get<ConditionalExpressionData>(expr.data);
      if (ToBoolean(Evaluate(data.condition, scope))) {
        return Evaluate(data.then_expr, scope);
      }
      return Evaluate(data.else_expr, scope);
    }

    case ExpressionKind::kAssignment:
      return EvaluateAssignment(
          std::get<AssignmentExpressionData>(expr.data), scope);

    case ExpressionKind::kDestructuringAssignment: {
      const auto& data =
          std::get<DestructuringAssignmentExpressionData>(expr.data);
      RuntimeValue value = Evaluate(data.value, scope);
      BindPattern(data.pattern, value, scope, std::nullopt);
      return value;
    }

    case ExpressionKind::kCall:
    case ExpressionKind::kMember:
    case ExpressionKind::kIndex:
      return EvaluateChain(id, scope).value_or(Undefined{});

    case ExpressionKind::kNew:
      return EvaluateNew(std::get<NewExpressionData>(expr.data), scope);

    case ExpressionKind::kSpread:
      ThrowError(ErrorKind::kSyntaxError, "Unexpected spread element");

    case ExpressionKind::kSequence: {
      RuntimeValue last = Undefined{};
      for (ExpressionId part :
           std::get<SequenceExpressionData>(expr.data).expressions) {
        last = Evaluate(part, scope);
      }
      return last;
    }
  }
  common::ThrowInternalError(
      "Interpreter::Evaluate",
      std::format("unhandled expression kind {}", static_cast<int>(expr.kind)));
}

auto Interpreter::EvaluateTemplate(
    const TemplateExpressionData& expr, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  std::string out = expr.chunks.front();
  for (size_t i = 0; i < expr.holes.size(); ++i) {
    out += ToString(Evaluate(expr.holes[i], scope));
    out += expr.chunks[i + 1];
  }
  CheckStringLength(out.size());
  return out;
}

auto Interpreter::EvaluateArrayLiteral(
    const ArrayLiteralExpressionData& expr,
    const std::shared_ptr<Scope>& scope) -> RuntimeValue {
  std::vector<RuntimeValue> elements;
  elements.reserve(expr.elements.size());
  const Arena& arena = CurrentArena();
  for (ExpressionId element : expr.elements) {
    if (!element) {
      elements.emplace_back(Undefined{});
      continue;
    }
    const Expression& node = arena[element];
    if (node.kind == ExpressionKind::kSpread) {
      ExpressionId argument = std::get<SpreadExpressionData>(node.data).argument;
      for (auto& item :
           Iterate(Evaluate(argument, scope), DescribeExpression(argument))) {
        elements.push_back(std::move(item));
      }
      CheckArrayLength(elements.size());
      continue;
    }
    elements.push_back(Evaluate(element, scope));
  }
  return NewArray(std::move(elements));
}

auto Interpreter::EvaluateObjectLiteral(
    const ObjectLiteralExpressionData& expr,
    const std::shared_ptr<Scope>& scope) -> RuntimeValue {
  ObjectRef object = NewObject();
  for (const auto& property : expr.properties) {
    if (property.is_spread) {
      RuntimeValue source = Evaluate(property.value, scope);
      for (const auto& key : OwnKeys(source)) {
        object->properties.Set(key, GetProperty(source, key));
      }
      continue;
    }
    std::string key = property.key;
    if (property.computed_key) {
      key = ToString(Evaluate(property.computed_key, scope));
    }
    RuntimeValue value = Evaluate(property.value, scope);
    NameFunction(value, key);
    object->properties.Set(key, std::move(value));
  }
  return object;
}

auto Interpreter::EvaluateUnary(
    const UnaryExpressionData& expr, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  const Expression& operand = CurrentArena()[expr.operand];

  switch (expr.op) {
    case UnaryOp::kTypeof:
      // typeof on an undeclared name is not an error.
      if (operand.kind == ExpressionKind::kIdentifier) {
        const auto& name = std::get<IdentifierExpressionData>(operand.data).name;
        Binding* binding = scope->Lookup(name);
        if (binding == nullptr) {
          return std::string("undefined");
        }
        return std::string(TypeOf(binding->value));
      }
      return std::string(TypeOf(Evaluate(expr.operand, scope)));

    case UnaryOp::kDelete: {
      if (operand.kind == ExpressionKind::kMember) {
        const auto& member = std::get<MemberExpressionData>(operand.data);
        return DeleteProperty(Evaluate(member.object, scope), member.property);
      }
      if (operand.kind == ExpressionKind::kIndex) {
        const auto& index = std::get<IndexExpressionData>(operand.data);
        RuntimeValue base = Evaluate(index.object, scope);
        return DeleteProperty(base, ToString(Evaluate(index.index, scope)));
      }
      if (operand.kind == ExpressionKind::kIdentifier) {
        return false;
      }
      Evaluate(expr.operand, scope);
      return true;
    }

    case UnaryOp::kVoid:
      Evaluate(expr.operand, scope);
      return Undefined{};

    case UnaryOp::kLogicalNot:
      return !ToBoolean(Evaluate(expr.operand, scope));

    case UnaryOp::kMinus:
      return -ToNumber(Evaluate(expr.operand, scope));

    case UnaryOp::kPlus:
      return ToNumber(Evaluate(expr.operand, scope));

    case UnaryOp::kBitwiseNot:
      return static_cast<double>(~ToInt32(ToNumber(Evaluate(expr.operand, scope))));
  }
  common::ThrowInternalError("Interpreter::EvaluateUnary", "unhandled operator");
}

auto Interpreter::EvaluateUpdate(
    const UpdateExpressionData& expr, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  Reference ref = ResolveReference(expr.target, scope);
  double old_value = ToNumber(GetReference(ref, scope));
  double new_value = expr.increment ? old_value + 1 : old_value - 1;
  PutReference(ref, new_value, scope);
  return expr.prefix ? new_value : old_value;
}

auto Interpreter::EvaluateLogical(
    const LogicalExpressionData& expr, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  RuntimeValue lhs = Evaluate(expr.lhs, scope);
  switch (expr.op) {
    case LogicalOp::kAnd:
      if (!ToBoolean(lhs)) {
        return lhs;
      }
      break;
    case LogicalOp::kOr:
      if (ToBoolean(lhs)) {
        return lhs;
      }
      break;
    case LogicalOp::kNullish:
      if (!IsNullish(lhs)) {
        return lhs;
      }
      break;
  }
  return Evaluate(expr.rhs, scope);
}

auto Interpreter::EvaluateAssignment(
    const AssignmentExpressionData& expr, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  const Expression& target = CurrentArena()[expr.target];

  if (!expr.compound_op && !expr.logical_op) {
    if (target.kind == ExpressionKind::kIdentifier) {
      const auto& name = std::get<IdentifierExpressionData>(target.data).name;
      RuntimeValue value = Evaluate(expr.value, scope);
      NameFunction(value, name);
      AssignName(name, value, scope);
      return value;
    }
    Reference ref = ResolveReference(expr.target, scope);
    RuntimeValue value = Evaluate(expr.value, scope);
    PutReference(ref, value, scope);
    return value;
  }

  Reference ref = ResolveReference(expr.target, scope);
  RuntimeValue current = GetReference(ref, scope);

  if (expr.logical_op) {
    switch (*expr.logical_op) {
      case LogicalOp::kAnd:
        if (!ToBoolean(current)) {
          return current;
        }
        break;
      case LogicalOp::kOr:
        if (ToBoolean(current)) {
          return current;
        }
        break;
      case LogicalOp::kNullish:
        if (!IsNullish(current)) {
          return current;
        }
        break;
    }
    RuntimeValue value = Evaluate(expr.value, scope);
    PutReference(ref, value, scope);
    return value;
  }

  RuntimeValue value =
      BinaryOperation(*expr.compound_op, current, Evaluate(expr.value, scope));
  PutReference(ref, value, scope);
  return value;
}

auto Interpreter::EvaluateChain(
    ExpressionId id, const std::shared_ptr<Scope>& scope)
    -> std::optional<RuntimeValue> {
  const Expression& expr = CurrentArena()[id];
  switch (expr.kind) {
    case ExpressionKind::kMember: {
      const auto& data = std::get<MemberExpressionData>(expr.data);
      std::optional<RuntimeValue> base = EvaluateChain(data.object, scope);
      if (!base || (data.optional && IsNullish(*base))) {
        return std::nullopt;
      }
      return GetProperty(*base, data.property);
    }
    case ExpressionKind::kIndex: {
      const auto& data = std::get<IndexExpressionData>(expr.data);
      std::optional<RuntimeValue> base = EvaluateChain(data.object, scope);
      if (!base || (data.optional && IsNullish(*base))) {
        return std::nullopt;
      }
      RuntimeValue key = Evaluate(data.index, scope);
      return GetIndexed(*base, key);
    }
    case ExpressionKind::kCall:
      return EvaluateCall(std::get<CallExpressionData>(expr.data), scope);
    default:
      return Evaluate(id, scope);
  }
}

auto Interpreter::EvaluateCall(
    const CallExpressionData& expr, const std::shared_ptr<Scope>& scope)
    -> std::optional<RuntimeValue> {
  const Expression& callee = CurrentArena()[expr.callee];
  RuntimeValue function;
  RuntimeValue self = Undefined{};

  // Method calls bind `this` to the object the method was read from.
  if (callee.kind == ExpressionKind::kMember) {
    const auto& data = std::get<MemberExpressionData>(callee.data);
    std::optional<RuntimeValue> base = EvaluateChain(data.object, scope);
    if (!base || (data.optional && IsNullish(*base))) {
      return std::nullopt;
    }
    function = GetProperty(*base, data.property);
    self = std::move(*base);
  } else if (callee.kind == ExpressionKind::kIndex) {
    const auto& data = std::get<IndexExpressionData>(callee.data);
    std::optional<RuntimeValue> base = EvaluateChain(data.object, scope);
    if (!base || (data.optional && IsNullish(*base))) {
      return std::nullopt;
    }
    RuntimeValue key = Evaluate(data.index, scope);
    function = GetIndexed(*base, key);
    self = std::move(*base);
  } else {
    std::optional<RuntimeValue> value = EvaluateChain(expr.callee, scope);
    if (!value) {
      return std::nullopt;
    }
    function = std::move(*value);
  }

  if (expr.optional && IsNullish(function)) {
    return std::nullopt;
  }
  if (!IsCallable(function)) {
    ThrowError(
        ErrorKind::kTypeError,
        std::format("{} is not a function", DescribeExpression(expr.callee)));
  }
  std::vector<RuntimeValue> args = EvaluateArguments(expr.arguments, scope);
  return Call(function, self, args);
}

auto Interpreter::EvaluateNew(
    const NewExpressionData& expr, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  RuntimeValue callee = Evaluate(expr.callee, scope);
  Object* function = AsObject(callee);
  if (function == nullptr || !function->IsFunction() ||
      !function->is_constructor) {
    ThrowError(
        ErrorKind::kTypeError,
        std::format(
            "{} is not a constructor", DescribeExpression(expr.callee)));
  }
  std::vector<RuntimeValue> args = EvaluateArguments(expr.arguments, scope);
  return Construct(callee, args);
}

auto Interpreter::EvaluateArguments(
    const std::vector<ExpressionId>& arguments,
    const std::shared_ptr<Scope>& scope) -> std::vector<RuntimeValue> {
  std::vector<RuntimeValue> values;
  values.reserve(arguments.size());
  const Arena& arena = CurrentArena();
  for (ExpressionId argument : arguments) {
    const Expression& node = arena[argument];
    if (node.kind == ExpressionKind::kSpread) {
      ExpressionId inner = std::get<SpreadExpressionData>(node.data).argument;
      for (auto& item :
           Iterate(Evaluate(inner, scope), DescribeExpression(inner))) {
        values.push_back(std::move(item));
      }
      continue;
    }
    values.push_back(Evaluate(argument, scope));
  }
  return values;
}

auto Interpreter::BinaryOperation(
    BinaryOp op, const RuntimeValue& lhs, const RuntimeValue& rhs)
    -> RuntimeValue {
  switch (op) {
    case BinaryOp::kAdd: {
      RuntimeValue left = ToPrimitive(lhs);
      RuntimeValue right = ToPrimitive(rhs);
      if (std::holds_alternative<std::string>(left) ||
          std::holds_alternative<std::string>(right)) {
        std::string out = ToString(left);
        std::string tail = ToString(right);
        CheckStringLength(out.size() + tail.size());
        out += tail;
        return out;
      }
      return ToNumber(left) + ToNumber(right);
    }
    case BinaryOp::kSubtract:
      return ToNumber(lhs) - ToNumber(rhs);
    case BinaryOp::kMultiply:
      return ToNumber(lhs) * ToNumber(rhs);
    case BinaryOp::kDivide:
      return ToNumber(lhs) / ToNumber(rhs);
    case BinaryOp::kMod:
      return std::fmod(ToNumber(lhs), ToNumber(rhs));
    case BinaryOp::kPower:
      return Power(ToNumber(lhs), ToNumber(rhs));

    case BinaryOp::kEqual:
      return LooseEquals(lhs, rhs);
    case BinaryOp::kNotEqual:
      return !LooseEquals(lhs, rhs);
    case BinaryOp::kStrictEqual:
      return StrictEquals(lhs, rhs);
    case BinaryOp::kStrictNotEqual:
      return !StrictEquals(lhs, rhs);

    case BinaryOp::kLessThan:
    case BinaryOp::kLessThanEqual:
    case BinaryOp::kGreaterThan:
    case BinaryOp::kGreaterThanEqual: {
      RuntimeValue left = ToPrimitive(lhs);
      RuntimeValue right = ToPrimitive(rhs);
      const auto* left_text = std::get_if<std::string>(&left);
      const auto* right_text = std::get_if<std::string>(&right);
      if (left_text != nullptr && right_text != nullptr) {
        int order = left_text->compare(*right_text);
        switch (op) {
          case BinaryOp::kLessThan:
            return order < 0;
          case BinaryOp::kLessThanEqual:
            return order <= 0;
          case BinaryOp::kGreaterThan:
            return order > 0;
          default:
            return order >= 0;
        }
      }
      double a = ToNumber(left);
      double b = ToNumber(right);
      switch (op) {
        case BinaryOp::kLessThan:
          return a < b;
        case BinaryOp::kLessThanEqual:
          return a <= b;
        case BinaryOp::kGreaterThan:
          return a > b;
        default:
          return a >= b;
      }
    }

    case BinaryOp::kInstanceof:
      return InstanceOf(lhs, rhs);
    case BinaryOp::kIn:
      return HasProperty(rhs, ToString(lhs));

    case BinaryOp::kBitwiseAnd:
      return static_cast<double>(
          ToInt32(ToNumber(lhs)) & ToInt32(ToNumber(rhs)));
    case BinaryOp::kBitwiseOr:
      return static_cast<double>(
          ToInt32(ToNumber(lhs)) | ToInt32(ToNumber(rhs)));
    case BinaryOp::kBitwiseXor:
      return static_cast<double>(
          ToInt32(ToNumber(lhs)) ^ ToInt32(ToNumber(rhs)));
    case BinaryOp::kShiftLeft: {
      uint32_t shifted = ToUint32(ToNumber(lhs))
                         << (ToUint32(ToNumber(rhs)) & 31U);
      return static_cast<double>(static_cast<int32_t>(shifted));
    }
    case BinaryOp::kShiftRight:
      return static_cast<double>(
          ToInt32(ToNumber(lhs)) >> (ToUint32(ToNumber(rhs)) & 31U));
    case BinaryOp::kUnsignedShiftRight:
      return static_cast<double>(
          ToUint32(ToNumber(lhs)) >> (ToUint32(ToNumber(rhs)) & 31U));
  }
  common::ThrowInternalError(
      "Interpreter::BinaryOperation",
      std::format("unhandled operator {}", ToString(op)));
}

auto Interpreter::InstanceOf(const RuntimeValue& lhs, const RuntimeValue& rhs)
    -> bool {
  Object* constructor = AsObject(rhs);
  if (constructor == nullptr || !constructor->IsFunction()) {
    ThrowError(
        ErrorKind::kTypeError, "Right-hand side of 'instanceof' is not callable");
  }
  Object* object = AsObject(lhs);
  if (object == nullptr) {
    return false;
  }
  if (constructor->error_kind) {
    return object->IsError() &&
           (*constructor->error_kind == ErrorKind::kError ||
            object->error_kind == constructor->error_kind);
  }
  if (constructor->native) {
    if (constructor->name == "Object") {
      return true;
    }
    if (constructor->name == "Array") {
      return object->IsArray();
    }
    return false;
  }
  auto created_by = object->constructor.lock();
  return created_by.get() == constructor;
}

auto Interpreter::DescribeExpression(ExpressionId id) const -> std::string {
  const Expression& expr = CurrentArena()[id];
  switch (expr.kind) {
    case ExpressionKind::kIdentifier:
      return std::get<IdentifierExpressionData>(expr.data).name;
    case ExpressionKind::kThis:
      return "this";
    case ExpressionKind::kMember: {
      const auto& data = std::get<MemberExpressionData>(expr.data);
      return std::format(
          "{}{}{}", DescribeExpression(data.object), data.optional ? "?." : ".",
          data.property);
    }
    case ExpressionKind::kIndex: {
      const auto& data = std::get<IndexExpressionData>(expr.data);
      return std::format("{}[...]", DescribeExpression(data.object));
    }
    case ExpressionKind::kCall: {
      const auto& data = std::get<CallExpressionData>(expr.data);
      return std::format("{}(...)", DescribeExpression(data.callee));
    }
    default:
      return "expression";
  }
}

// ---------------------------------------------------------------------------
// References and bindings

auto Interpreter::ResolveReference(
    ExpressionId id, const std::shared_ptr<Scope>& scope) -> Reference {
  const Expression& expr = CurrentArena()[id];
  switch (expr.kind) {
    case ExpressionKind::kIdentifier:
      return Reference{.name = std::get<IdentifierExpressionData>(expr.data).name};
    case ExpressionKind::kMember: {
      const auto& data = std::get<MemberExpressionData>(expr.data);
      return Reference{
          .base = Evaluate(data.object, scope), .key = data.property};
    }
    case ExpressionKind::kIndex: {
      const auto& data = std::get<IndexExpressionData>(expr.data);
      RuntimeValue base = Evaluate(data.object, scope);
      RuntimeValue key = Evaluate(data.index, scope);
      return Reference{.base = std::move(base), .key = std::move(key)};
    }
    default:
      ThrowError(ErrorKind::kSyntaxError, "Invalid assignment target");
  }
}

auto Interpreter::GetReference(
    const Reference& ref, const std::shared_ptr<Scope>& scope) -> RuntimeValue {
  if (!ref.base) {
    return LookupName(ref.name, scope);
  }
  return GetIndexed(*ref.base, ref.key);
}

void Interpreter::PutReference(
    const Reference& ref, RuntimeValue value,
    const std::shared_ptr<Scope>& scope) {
  if (!ref.base) {
    AssignName(ref.name, std::move(value), scope);
    return;
  }
  SetIndexed(*ref.base, ref.key, std::move(value));
}

auto Interpreter::LookupName(
    std::string_view name, const std::shared_ptr<Scope>& scope)
    -> RuntimeValue {
  Binding* binding = scope->Lookup(name);
  if (binding == nullptr) {
    ThrowError(
        ErrorKind::kReferenceError, std::format("{} is not defined", name));
  }
  return binding->value;
}

void Interpreter::AssignName(
    std::string_view name, RuntimeValue value,
    const std::shared_ptr<Scope>& scope) {
  Binding* binding = scope->Lookup(name);
  if (binding == nullptr) {
    // Assignment to an undeclared name creates a global.
    globals_->Declare(name, std::move(value), DeclarationKind::kVar);
    return;
  }
  if (binding->IsConst()) {
    ThrowError(ErrorKind::kTypeError, "Assignment to constant variable.");
  }
  binding->value = std::move(value);
}

void Interpreter::BindName(
    const std::string& name, RuntimeValue value,
    const std::shared_ptr<Scope>& scope, std::optional<DeclarationKind> kind) {
  if (!kind) {
    AssignName(name, std::move(value), scope);
    return;
  }
  Scope& target =
      *kind == DeclarationKind::kVar ? scope->NearestFunctionScope() : *scope;
  if (!target.Declare(name, std::move(value), *kind)) {
    ThrowError(
        ErrorKind::kSyntaxError,
        std::format("Identifier '{}' has already been declared", name));
  }
}

void Interpreter::BindPattern(
    const BindingPattern& pattern, RuntimeValue value,
    const std::shared_ptr<Scope>& scope, std::optional<DeclarationKind> kind) {
  switch (pattern.kind) {
    case PatternKind::kIdentifier:
      BindName(pattern.name, std::move(value), scope, kind);
      return;

    case PatternKind::kArray: {
      std::vector<RuntimeValue> items = Iterate(value, ToString(value));
      for (size_t i = 0; i < pattern.elements.size(); ++i) {
        const PatternElement& element = pattern.elements[i];
        if (element.name.empty()) {
          continue;
        }
        RuntimeValue item =
            i < items.size() ? items[i] : RuntimeValue(Undefined{});
        if (IsUndefined(item) && element.default_value) {
          item = Evaluate(element.default_value, scope);
        }
        BindName(element.name, std::move(item), scope, kind);
      }
      if (!pattern.rest.empty()) {
        std::vector<RuntimeValue> rest;
        for (size_t i = pattern.elements.size(); i < items.size(); ++i) {
          rest.push_back(items[i]);
        }
        BindName(pattern.rest, NewArray(std::move(rest)), scope, kind);
      }
      return;
    }

    case PatternKind::kObject: {
      if (IsNullish(value)) {
        ThrowError(
            ErrorKind::kTypeError,
            std::format(
                "Cannot destructure '{}' as it is {}.", ToString(value),
                ToString(value)));
      }
      std::unordered_set<std::string> used;
      for (const auto& element : pattern.elements) {
        RuntimeValue item = GetProperty(value, element.key);
        if (IsUndefined(item) && element.default_value) {
          item = Evaluate(element.default_value, scope);
        }
        used.insert(element.key);
        BindName(element.name, std::move(item), scope, kind);
      }
      if (!pattern.rest.empty()) {
        ObjectRef rest = NewObject();
        for (const auto& key : OwnKeys(value)) {
          if (!used.contains(key)) {
            rest->properties.Set(key, GetProperty(value, key));
          }
        }
        BindName(pattern.rest, rest, scope, kind);
      }
      return;
    }
  }
}

// ---------------------------------------------------------------------------
// Functions

auto Interpreter::MakeClosure(FunctionId id, const std::shared_ptr<Scope>& scope)
    -> ObjectRef {
  const Function& function = CurrentArena()[id];
  ObjectRef object = heap_.Allocate(ObjectKind::kFunction);
  object->name = function.name;
  object->closure = Closure{.program = program_, .function = id, .scope = scope};
  object->is_constructor = !function.is_arrow;
  return object;
}

auto Interpreter::Call(
    const RuntimeValue& callee, const RuntimeValue& self,
    std::span<const RuntimeValue> args) -> RuntimeValue {
  if (!IsCallable(callee)) {
    ThrowError(
        ErrorKind::kTypeError,
        std::format("{} is not a function", ToString(callee)));
  }
  ObjectRef function = std::get<ObjectRef>(callee);
  Tick();
  if (call_depth_ >= limits_.max_call_depth) {
    ThrowError(ErrorKind::kRangeError, "Maximum call stack size exceeded");
  }
  DepthGuard depth(call_depth_);
  if (function->native) {
    return function->native(*this, self, args);
  }
  return CallClosure(function, self, args);
}

auto Interpreter::CallClosure(
    const ObjectRef& function, const RuntimeValue& self,
    std::span<const RuntimeValue> args) -> RuntimeValue {
  const Closure& closure = *function->closure;
  ProgramGuard program(program_, closure.program);
  const Function& node = CurrentArena()[closure.function];

  auto scope = std::make_shared<Scope>(closure.scope, true);
  if (!node.is_arrow) {
    scope->Declare("this", self, DeclarationKind::kConst);
    scope->Declare(
        "arguments",
        NewArray(std::vector<RuntimeValue>(args.begin(), args.end())),
        DeclarationKind::kVar);
  }

  for (size_t i = 0; i < node.parameters.size(); ++i) {
    const Parameter& parameter = node.parameters[i];
    if (parameter.is_rest) {
      std::vector<RuntimeValue> rest;
      for (size_t j = i; j < args.size(); ++j) {
        rest.push_back(args[j]);
      }
      BindPattern(
          parameter.pattern, NewArray(std::move(rest)), scope,
          DeclarationKind::kVar);
      break;
    }
    RuntimeValue value = i < args.size() ? args[i] : RuntimeValue(Undefined{});
    if (IsUndefined(value) && parameter.default_value) {
      value = Evaluate(parameter.default_value, scope);
    }
    BindPattern(parameter.pattern, std::move(value), scope, DeclarationKind::kVar);
  }

  if (node.expression_body) {
    return Evaluate(node.expression_body, scope);
  }

  const auto& body =
      std::get<BlockStatementData>(CurrentArena()[node.body].data).statements;
  for (const auto& name : VarNames(closure.function, body)) {
    scope->DeclareHoisted(name);
  }
  HoistFunctions(body, scope);
  ExecResult result = ExecStatements(body, scope);
  if (result.signal == ControlSignal::kReturn) {
    return std::move(result.value);
  }
  return Undefined{};
}

auto Interpreter::Construct(
    const RuntimeValue& callee, std::span<const RuntimeValue> args)
    -> RuntimeValue {
  Object* function = AsObject(callee);
  if (function == nullptr || !function->IsFunction() ||
      !function->is_constructor) {
    ThrowError(
        ErrorKind::kTypeError,
        std::format("{} is not a constructor", ToString(callee)));
  }
  if (function->native) {
    return Call(callee, Undefined{}, args);
  }
  ObjectRef instance = NewObject();
  instance->constructor = std::get<ObjectRef>(callee);
  RuntimeValue result = Call(callee, instance, args);
  if (AsObject(result) != nullptr) {
    return result;
  }
  return instance;
}

}  // namespace proba::script
