#include "proba/script/interpreter.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "builtins.hpp"
#include "proba/common/internal_error.hpp"
#include "proba/common/overloaded.hpp"
#include "proba/common/string_utils.hpp"
#include "proba/script/errors.hpp"
#include "proba/script/parser.hpp"
#include "proba/script/runtime_value.hpp"
#include "proba/script/scope.hpp"
#include "proba/script/statement.hpp"
#include "proba/value/json.hpp"
#include "proba/value/number.hpp"
#include "proba/value/value.hpp"

namespace proba::script {

namespace {

auto NeedsBlockScope(const Arena& arena, std::span<const StatementId> body)
    -> bool {
  return std::ranges::any_of(body, [&](StatementId id) {
    const Statement& stmt = arena[id];
    if (stmt.kind == StatementKind::kFunctionDeclaration) {
      return true;
    }
    if (stmt.kind == StatementKind::kVariableDeclaration) {
      return std::get<VariableDeclarationStatementData>(stmt.data).kind !=
             DeclarationKind::kVar;
    }
    return false;
  });
}

void PatternNames(
    const BindingPattern& pattern, std::vector<std::string>& names) {
  if (pattern.kind == PatternKind::kIdentifier) {
    names.push_back(pattern.name);
    return;
  }
  for (const auto& element : pattern.elements) {
    if (!element.name.empty()) {
      names.push_back(element.name);
    }
  }
  if (!pattern.rest.empty()) {
    names.push_back(pattern.rest);
  }
}

}  // namespace

Interpreter::Interpreter(ConsoleLog& console, RunLimits limits)
    : console_(console),
      limits_(std::move(limits)),
      globals_(std::make_shared<Scope>(nullptr, false)),
      random_(std::random_device{}()) {
  builtins::InstallGlobals(*this, *globals_);
}

Interpreter::~Interpreter() {
  globals_->Clear();
  heap_.Release();
}

auto Interpreter::Run(std::string_view source) -> RuntimeValue {
  program_ = ParseProgram(source);
  auto scope = std::make_shared<Scope>(globals_, true);
  for (const auto& name : VarNames(kInvalidFunctionId, program_->body)) {
    scope->DeclareHoisted(name);
  }
  HoistFunctions(program_->body, scope);

  completion_ = Undefined{};
  ExecResult result = ExecStatements(program_->body, scope);
  if (result.signal == ControlSignal::kReturn) {
    return result.value;
  }
  return completion_;
}

void Interpreter::CheckBudget() {
  if (limits_.max_steps != 0 && steps_ > limits_.max_steps) {
    throw Interrupted(InterruptReason::kStepBudget);
  }
  if (limits_.stop.stop_requested()) {
    throw Interrupted(InterruptReason::kStopRequested);
  }
  if (std::chrono::steady_clock::now() >= limits_.deadline) {
    throw Interrupted(InterruptReason::kDeadline);
  }
}

void Interpreter::ThrowError(ErrorKind kind, std::string message) {
  throw ThrowSignal(heap_.NewError(kind, std::move(message)));
}

auto Interpreter::NewObject() -> ObjectRef {
  return heap_.Allocate(ObjectKind::kPlain);
}

auto Interpreter::NewArray(std::vector<RuntimeValue> elements) -> ObjectRef {
  CheckArrayLength(elements.size());
  return heap_.NewArray(std::move(elements));
}

void Interpreter::CheckArrayLength(size_t length) {
  if (length > kMaxArrayLength) {
    ThrowError(ErrorKind::kRangeError, "Invalid array length");
  }
}

void Interpreter::CheckStringLength(size_t length) {
  if (length > kMaxStringLength) {
    ThrowError(ErrorKind::kRangeError, "Invalid string length");
  }
}

auto Interpreter::Random() -> double {
  return std::uniform_real_distribution<double>(0.0, 1.0)(random_);
}

// ---------------------------------------------------------------------------
// Statements

auto Interpreter::ExecStatements(
    std::span<const StatementId> statements,
    const std::shared_ptr<Scope>& scope) -> ExecResult {
  for (StatementId id : statements) {
    ExecResult result = Exec(id, scope);
    if (result.signal != ControlSignal::kNormal) {
      return result;
    }
  }
  return {};
}

auto Interpreter::Exec(StatementId id, const std::shared_ptr<Scope>& scope)
    -> ExecResult {
  Tick();
  const Statement& stmt = CurrentArena()[id];

  switch (stmt.kind) {
    case StatementKind::kBlock:
      return ExecBlock(std::get<BlockStatementData>(stmt.data), scope);

    case StatementKind::kVariableDeclaration:
      ExecVariableDeclaration(
          std::get<VariableDeclarationStatementData>(stmt.data), scope);
      return {};

    case StatementKind::kFunctionDeclaration:
      // Bound when the enclosing block was entered.
      return {};

    case StatementKind::kExpression: {
      RuntimeValue value = Evaluate(
          std::get<ExpressionStatementData>(stmt.data).expression, scope);
      if (call_depth_ == 0) {
        completion_ = std::move(value);
      }
      return {};
    }

    case StatementKind::kIf: {
      const auto& data = std::get<IfStatementData>(stmt.data);
      if (ToBoolean(Evaluate(data.condition, scope))) {
        return Exec(data.then_branch, scope);
      }
      if (data.else_branch) {
        return Exec(data.else_branch, scope);
      }
      return {};
    }

    case StatementKind::kFor:
      return ExecFor(std::get<ForStatementData>(stmt.data), scope);

    case StatementKind::kForIn:
      return ExecForIn(std::get<ForEachStatementData>(stmt.data), scope);

    case StatementKind::kForOf:
      return ExecForOf(std::get<ForEachStatementData>(stmt.data), scope);

    case StatementKind::kWhile:
      return ExecWhile(std::get<WhileStatementData>(stmt.data), scope, true);

    case StatementKind::kDoWhile:
      return ExecWhile(std::get<WhileStatementData>(stmt.data), scope, false);

    case StatementKind::kBreak:
      return ExecResult{.signal = ControlSignal::kBreak};

    case StatementKind::kContinue:
      return ExecResult{.signal = ControlSignal::kContinue};

    case StatementKind::kReturn: {
      const auto& data = std::get<ReturnStatementData>(stmt.data);
      RuntimeValue value = Undefined{};
      if (data.value) {
        value = Evaluate(data.value, scope);
      }
      return ExecResult{
          .signal = ControlSignal::kReturn, .value = std::move(value)};
    }

    case StatementKind::kThrow:
      throw ThrowSignal(
          Evaluate(std::get<ThrowStatementData>(stmt.data).value, scope));

    case StatementKind::kTry:
      return ExecTry(std::get<TryStatementData>(stmt.data), scope);

    case StatementKind::kSwitch:
      return ExecSwitch(std::get<SwitchStatementData>(stmt.data), scope);

    case StatementKind::kEmpty:
      return {};
  }
  common::ThrowInternalError(
      "Interpreter::Exec",
      std::format("unhandled statement kind {}", static_cast<int>(stmt.kind)));
}

auto Interpreter::ExecBlock(
    const BlockStatementData& block, const std::shared_ptr<Scope>& scope)
    -> ExecResult {
  if (!NeedsBlockScope(CurrentArena(), block.statements)) {
    return ExecStatements(block.statements, scope);
  }
  auto block_scope = std::make_shared<Scope>(scope, false);
  HoistFunctions(block.statements, block_scope);
  return ExecStatements(block.statements, block_scope);
}

void Interpreter::ExecVariableDeclaration(
    const VariableDeclarationStatementData& decl,
    const std::shared_ptr<Scope>& scope) {
  for (const auto& declarator : decl.declarators) {
    if (!declarator.init) {
      if (decl.kind == DeclarationKind::kVar) {
        // Hoisted already; `var x;` keeps the current value.
        std::vector<std::string> names;
        PatternNames(declarator.target, names);
        for (const auto& name : names) {
          scope->NearestFunctionScope().DeclareHoisted(name);
        }
        continue;
      }
      BindPattern(declarator.target, Undefined{}, scope, decl.kind);
      continue;
    }

    RuntimeValue value = Evaluate(declarator.init, scope);
    // const square = (x) => x * x;  gives the function its name
    if (declarator.target.kind == PatternKind::kIdentifier) {
      if (Object* function = AsObject(value);
          function != nullptr && function->IsFunction() &&
          function->name.empty()) {
        function->name = declarator.target.name;
      }
    }
    BindPattern(declarator.target, std::move(value), scope, decl.kind);
  }
}

auto Interpreter::ExecFor(
    const ForStatementData& loop, const std::shared_ptr<Scope>& scope)
    -> ExecResult {
  auto loop_scope = std::make_shared<Scope>(scope, false);
  // `let` loop variables get a fresh binding per iteration so closures
  // created in the body capture that iteration's value.
  std::vector<std::string> per_iteration;

  if (loop.init) {
    const Statement& init = CurrentArena()[loop.init];
    if (init.kind == StatementKind::kVariableDeclaration) {
      const auto& decl = std::get<VariableDeclarationStatementData>(init.data);
      ExecVariableDeclaration(decl, loop_scope);
      if (decl.kind == DeclarationKind::kLet) {
        for (const auto& declarator : decl.declarators) {
          PatternNames(declarator.target, per_iteration);
        }
      }
    } else {
      Exec(loop.init, loop_scope);
    }
  }

  while (true) {
    if (loop.test && !ToBoolean(Evaluate(loop.test, loop_scope))) {
      break;
    }

    std::shared_ptr<Scope> body_scope = loop_scope;
    if (!per_iteration.empty()) {
      body_scope = std::make_shared<Scope>(scope, false);
      for (const auto& name : per_iteration) {
        body_scope->Declare(
            name, loop_scope->Find(name)->value, DeclarationKind::kLet);
      }
    }

    ExecResult result = Exec(loop.body, body_scope);

    if (!per_iteration.empty()) {
      for (const auto& name : per_iteration) {
        loop_scope->Find(name)->value = body_scope->Find(name)->value;
      }
    }
    if (result.signal == ControlSignal::kBreak) {
      break;
    }
    if (result.signal == ControlSignal::kReturn) {
      return result;
    }
    if (loop.update) {
      Evaluate(loop.update, loop_scope);
    }
  }
  return {};
}

auto Interpreter::ExecForEachBody(
    const ForEachStatementData& loop, RuntimeValue item,
    const std::shared_ptr<Scope>& scope) -> ExecResult {
  auto iteration_scope = std::make_shared<Scope>(scope, false);
  BindPattern(loop.target, std::move(item), iteration_scope, loop.declaration);
  return Exec(loop.body, iteration_scope);
}

auto Interpreter::ExecForIn(
    const ForEachStatementData& loop, const std::shared_ptr<Scope>& scope)
    -> ExecResult {
  RuntimeValue object = Evaluate(loop.iterable, scope);
  for (auto& key : OwnKeys(object)) {
    ExecResult result = ExecForEachBody(loop, std::move(key), scope);
    if (result.signal == ControlSignal::kBreak) {
      break;
    }
    if (result.signal == ControlSignal::kReturn) {
      return result;
    }
  }
  return {};
}

auto Interpreter::ExecForOf(
    const ForEachStatementData& loop, const std::shared_ptr<Scope>& scope)
    -> ExecResult {
  RuntimeValue iterable = Evaluate(loop.iterable, scope);

  // Arrays are walked live so that pushes inside the body are visited.
  if (Object* object = AsObject(iterable);
      object != nullptr && object->IsArray()) {
    ObjectRef keep = std::get<ObjectRef>(iterable);
    for (size_t i = 0; i < keep->elements.size(); ++i) {
      ExecResult result = ExecForEachBody(loop, keep->elements[i], scope);
      if (result.signal == ControlSignal::kBreak) {
        break;
      }
      if (result.signal == ControlSignal::kReturn) {
        return result;
      }
    }
    return {};
  }

  for (auto& item : Iterate(iterable, DescribeExpression(loop.iterable))) {
    ExecResult result = ExecForEachBody(loop, std::move(item), scope);
    if (result.signal == ControlSignal::kBreak) {
      break;
    }
    if (result.signal == ControlSignal::kReturn) {
      return result;
    }
  }
  return {};
}

auto Interpreter::ExecWhile(
    const WhileStatementData& loop, const std::shared_ptr<Scope>& scope,
    bool test_first) -> ExecResult {
  while (true) {
    if (test_first && !ToBoolean(Evaluate(loop.condition, scope))) {
      break;
    }
    ExecResult result = Exec(loop.body, scope);
    if (result.signal == ControlSignal::kBreak) {
      break;
    }
    if (result.signal == ControlSignal::kReturn) {
      return result;
    }
    if (!test_first && !ToBoolean(Evaluate(loop.condition, scope))) {
      break;
    }
  }
  return {};
}

auto Interpreter::ExecTry(
    const TryStatementData& stmt, const std::shared_ptr<Scope>& scope)
    -> ExecResult {
  const Arena& arena = CurrentArena();
  ExecResult result;
  std::optional<ThrowSignal> pending;

  try {
    result = ExecBlock(
        std::get<BlockStatementData>(arena[stmt.block].data), scope);
  } catch (const ThrowSignal& signal) {
    if (!stmt.handler) {
      pending = signal;
    } else {
      auto catch_scope = std::make_shared<Scope>(scope, false);
      if (stmt.catch_binding) {
        BindPattern(
            *stmt.catch_binding, signal.Value(), catch_scope,
            DeclarationKind::kLet);
      }
      try {
        result = ExecBlock(
            std::get<BlockStatementData>(arena[stmt.handler].data),
            catch_scope);
      } catch (const ThrowSignal& rethrown) {
        if (!stmt.finalizer) {
          throw;
        }
        pending = rethrown;
      }
    }
  }

  if (stmt.finalizer) {
    ExecResult finally_result = ExecBlock(
        std::get<BlockStatementData>(arena[stmt.finalizer].data), scope);
    if (finally_result.signal != ControlSignal::kNormal) {
      return finally_result;
    }
  }
  if (pending) {
    throw *pending;
  }
  return result;
}

auto Interpreter::ExecSwitch(
    const SwitchStatementData& stmt, const std::shared_ptr<Scope>& scope)
    -> ExecResult {
  RuntimeValue discriminant = Evaluate(stmt.discriminant, scope);
  auto switch_scope = std::make_shared<Scope>(scope, false);
  for (const auto& switch_case : stmt.cases) {
    HoistFunctions(switch_case.body, switch_scope);
  }

  std::optional<size_t> start;
  std::optional<size_t> default_index;
  for (size_t i = 0; i < stmt.cases.size(); ++i) {
    const SwitchCase& switch_case = stmt.cases[i];
    if (!switch_case.test) {
      default_index = i;
      continue;
    }
    if (StrictEquals(discriminant, Evaluate(switch_case.test, switch_scope))) {
      start = i;
      break;
    }
  }
  if (!start) {
    start = default_index;
  }
  if (!start) {
    return {};
  }

  for (size_t i = *start; i < stmt.cases.size(); ++i) {
    ExecResult result = ExecStatements(stmt.cases[i].body, switch_scope);
    if (result.signal == ControlSignal::kBreak) {
      return {};
    }
    if (result.signal != ControlSignal::kNormal) {
      return result;
    }
  }
  return {};
}

// ---------------------------------------------------------------------------
// Hoisting

void Interpreter::HoistFunctions(
    std::span<const StatementId> statements,
    const std::shared_ptr<Scope>& scope) {
  const Arena& arena = CurrentArena();
  for (StatementId id : statements) {
    const Statement& stmt = arena[id];
    if (stmt.kind != StatementKind::kFunctionDeclaration) {
      continue;
    }
    FunctionId function =
        std::get<FunctionDeclarationStatementData>(stmt.data).function;
    const std::string& name = arena[function].name;
    if (!scope->Declare(
            name, MakeClosure(function, scope), DeclarationKind::kVar)) {
      ThrowError(
          ErrorKind::kSyntaxError,
          std::format("Identifier '{}' has already been declared", name));
    }
  }
}

auto Interpreter::VarNames(FunctionId function, std::span<const StatementId> body)
    -> const std::vector<std::string>& {
  auto key = std::make_pair(program_.get(), function.value);
  auto it = var_names_.find(key);
  if (it != var_names_.end()) {
    return it->second;
  }
  std::vector<std::string> names;
  for (StatementId id : body) {
    CollectVarNames(id, names);
  }
  return var_names_.emplace(key, std::move(names)).first->second;
}

void Interpreter::CollectVarNames(
    StatementId id, std::vector<std::string>& names) const {
  if (!id) {
    return;
  }
  const Statement& stmt = CurrentArena()[id];
  std::visit(
      common::Overloaded{
          [&](const BlockStatementData& data) {
            for (StatementId child : data.statements) {
              CollectVarNames(child, names);
            }
          },
          [&](const VariableDeclarationStatementData& data) {
            if (data.kind != DeclarationKind::kVar) {
              return;
            }
            for (const auto& declarator : data.declarators) {
              PatternNames(declarator.target, names);
            }
          },
          [&](const IfStatementData& data) {
            CollectVarNames(data.then_branch, names);
            CollectVarNames(data.else_branch, names);
          },
          [&](const ForStatementData& data) {
            CollectVarNames(data.init, names);
            CollectVarNames(data.body, names);
          },
          [&](const ForEachStatementData& data) {
            if (data.declaration == DeclarationKind::kVar) {
              PatternNames(data.target, names);
            }
            CollectVarNames(data.body, names);
          },
          [&](const WhileStatementData& data) {
            CollectVarNames(data.body, names);
          },
          [&](const TryStatementData& data) {
            CollectVarNames(data.block, names);
            CollectVarNames(data.handler, names);
            CollectVarNames(data.finalizer, names);
          },
          [&](const SwitchStatementData& data) {
            for (const auto& switch_case : data.cases) {
              for (StatementId child : switch_case.body) {
                CollectVarNames(child, names);
              }
            }
          },
          // Nested functions have their own var scope.
          [](const auto&) {},
      },
      stmt.data);
}

// ---------------------------------------------------------------------------
// Property access

auto Interpreter::MethodObject(
    const NativeFunction* method, std::string_view name) -> RuntimeValue {
  auto it = method_objects_.find(method);
  if (it != method_objects_.end()) {
    return it->second;
  }
  ObjectRef function = heap_.NewNative(std::string(name), *method);
  method_objects_.emplace(method, function);
  return function;
}

auto Interpreter::GetProperty(const RuntimeValue& base, std::string_view key)
    -> RuntimeValue {
  auto generic = [&]() -> RuntimeValue {
    if (const NativeFunction* method = builtins::FindObjectMethod(key)) {
      return MethodObject(method, key);
    }
    return Undefined{};
  };

  return std::visit(
      common::Overloaded{
          [&](const Undefined&) -> RuntimeValue {
            ThrowError(
                ErrorKind::kTypeError,
                std::format(
                    "Cannot read properties of undefined (reading '{}')",
                    key));
          },
          [&](const Null&) -> RuntimeValue {
            ThrowError(
                ErrorKind::kTypeError,
                std::format(
                    "Cannot read properties of null (reading '{}')", key));
          },
          [&](bool) -> RuntimeValue { return generic(); },
          [&](double) -> RuntimeValue {
            if (const NativeFunction* method =
                    builtins::FindNumberMethod(key)) {
              return MethodObject(method, key);
            }
            return generic();
          },
          [&](const std::string& text) -> RuntimeValue {
            if (key == "length") {
              return static_cast<double>(text.size());
            }
            if (auto index = ParseArrayIndex(key)) {
              if (*index < text.size()) {
                return std::string(1, text[*index]);
              }
              return Undefined{};
            }
            if (const NativeFunction* method =
                    builtins::FindStringMethod(key)) {
              return MethodObject(method, key);
            }
            return generic();
          },
          [&](const ObjectRef& object) -> RuntimeValue {
            if (object->IsArray()) {
              if (key == "length") {
                return static_cast<double>(object->elements.size());
              }
              if (auto index = ParseArrayIndex(key)) {
                if (*index < object->elements.size()) {
                  return object->elements[*index];
                }
                return Undefined{};
              }
            }
            if (const RuntimeValue* own = object->properties.Find(key)) {
              return *own;
            }
            switch (object->kind) {
              case ObjectKind::kArray:
                if (const NativeFunction* method =
                        builtins::FindArrayMethod(key)) {
                  return MethodObject(method, key);
                }
                break;
              case ObjectKind::kFunction:
                if (key == "name") {
                  return object->name;
                }
                if (key == "length") {
                  if (!object->closure) {
                    return 0.0;
                  }
                  const Function& function =
                      object->closure->program->arena[object->closure->function];
                  double length = 0;
                  for (const auto& parameter : function.parameters) {
                    if (parameter.is_rest || parameter.default_value) {
                      break;
                    }
                    ++length;
                  }
                  return length;
                }
                if (key == "prototype" && object->is_constructor &&
                    object->closure) {
                  ObjectRef prototype = NewObject();
                  object->properties.Set("prototype", prototype);
                  return prototype;
                }
                if (const NativeFunction* method =
                        builtins::FindFunctionMethod(key)) {
                  return MethodObject(method, key);
                }
                break;
              case ObjectKind::kError:
                if (key == "stack") {
                  return DescribeError(*object);
                }
                break;
              case ObjectKind::kPlain:
                // Methods assigned to F.prototype are shared by `new F()`.
                if (auto constructor = object->constructor.lock()) {
                  if (const RuntimeValue* prototype =
                          constructor->properties.Find("prototype")) {
                    if (AsObject(*prototype) != nullptr) {
                      RuntimeValue inherited = GetProperty(*prototype, key);
                      if (!IsUndefined(inherited)) {
                        return inherited;
                      }
                    }
                  }
                }
                break;
            }
            return generic();
          },
      },
      base);
}

auto Interpreter::GetIndexed(const RuntimeValue& base, const RuntimeValue& key)
    -> RuntimeValue {
  if (const auto* number = std::get_if<double>(&key)) {
    double index = *number;
    if (index >= 0 && index == std::floor(index)) {
      // Compare before casting; huge and infinite indices are out of range.
      if (Object* object = AsObject(base); object != nullptr &&
                                           object->IsArray()) {
        if (index < static_cast<double>(object->elements.size())) {
          return object->elements[static_cast<size_t>(index)];
        }
        return Undefined{};
      }
      if (const auto* text = std::get_if<std::string>(&base)) {
        if (index < static_cast<double>(text->size())) {
          return std::string(1, (*text)[static_cast<size_t>(index)]);
        }
        return Undefined{};
      }
    }
  }
  return GetProperty(base, ToString(key));
}

void Interpreter::SetProperty(
    const RuntimeValue& base, std::string_view key, RuntimeValue value) {
  if (IsNullish(base)) {
    ThrowError(
        ErrorKind::kTypeError,
        std::format(
            "Cannot set properties of {} (setting '{}')", ToString(base),
            key));
  }
  Object* object = AsObject(base);
  if (object == nullptr || object->frozen) {
    // Primitives and frozen objects ignore writes.
    return;
  }
  if (object->IsArray()) {
    if (key == "length") {
      double length = ToNumber(value);
      if (length < 0 || length != std::floor(length) ||
          length > static_cast<double>(kMaxArrayLength)) {
        ThrowError(ErrorKind::kRangeError, "Invalid array length");
      }
      object->elements.resize(static_cast<size_t>(length), Undefined{});
      return;
    }
    if (auto index = ParseArrayIndex(key)) {
      if (*index >= object->elements.size()) {
        CheckArrayLength(*index + 1);
        object->elements.resize(*index + 1, Undefined{});
      }
      object->elements[*index] = std::move(value);
      return;
    }
  }
  object->properties.Set(key, std::move(value));
}

void Interpreter::SetIndexed(
    const RuntimeValue& base, const RuntimeValue& key, RuntimeValue value) {
  if (const auto* number = std::get_if<double>(&key)) {
    Object* object = AsObject(base);
    double index = *number;
    if (object != nullptr && object->IsArray() && !object->frozen &&
        index >= 0 && index == std::floor(index)) {
      if (index >= static_cast<double>(kMaxArrayLength)) {
        ThrowError(ErrorKind::kRangeError, "Invalid array length");
      }
      auto position = static_cast<size_t>(index);
      if (position >= object->elements.size()) {
        object->elements.resize(position + 1, Undefined{});
      }
      object->elements[position] = std::move(value);
      return;
    }
  }
  SetProperty(base, ToString(key), std::move(value));
}

auto Interpreter::HasProperty(const RuntimeValue& base, std::string_view key)
    -> bool {
  Object* object = AsObject(base);
  if (object == nullptr) {
    ThrowError(
        ErrorKind::kTypeError,
        std::format(
            "Cannot use 'in' operator to search for '{}' in {}", key,
            ToString(base)));
  }
  if (object->properties.Contains(key)) {
    return true;
  }
  switch (object->kind) {
    case ObjectKind::kArray:
      if (key == "length") {
        return true;
      }
      if (auto index = ParseArrayIndex(key)) {
        return *index < object->elements.size();
      }
      return builtins::FindArrayMethod(key) != nullptr;
    case ObjectKind::kFunction:
      return key == "name" || key == "length" ||
             builtins::FindFunctionMethod(key) != nullptr;
    case ObjectKind::kError:
    case ObjectKind::kPlain:
      break;
  }
  if (auto constructor = object->constructor.lock()) {
    if (const RuntimeValue* prototype =
            constructor->properties.Find("prototype")) {
      if (AsObject(*prototype) != nullptr) {
        return HasProperty(*prototype, key);
      }
    }
  }
  return builtins::FindObjectMethod(key) != nullptr;
}

auto Interpreter::DeleteProperty(const RuntimeValue& base, std::string_view key)
    -> bool {
  if (IsNullish(base)) {
    ThrowError(
        ErrorKind::kTypeError,
        std::format(
            "Cannot convert undefined or null to object (deleting '{}')",
            key));
  }
  Object* object = AsObject(base);
  if (object == nullptr) {
    return true;
  }
  if (object->frozen) {
    return false;
  }
  if (object->IsArray()) {
    if (auto index = ParseArrayIndex(key)) {
      if (*index < object->elements.size()) {
        object->elements[*index] = Undefined{};
      }
      return true;
    }
  }
  object->properties.Erase(key);
  return true;
}

auto Interpreter::OwnKeys(const RuntimeValue& value)
    -> std::vector<std::string> {
  std::vector<std::string> keys;
  if (const auto* text = std::get_if<std::string>(&value)) {
    for (size_t i = 0; i < text->size(); ++i) {
      keys.push_back(std::to_string(i));
    }
    return keys;
  }
  Object* object = AsObject(value);
  if (object == nullptr) {
    return keys;
  }
  if (object->IsArray()) {
    for (size_t i = 0; i < object->elements.size(); ++i) {
      keys.push_back(std::to_string(i));
    }
  }
  if (object->IsError()) {
    return keys;
  }
  for (const auto& [key, unused] : object->properties.Entries()) {
    keys.push_back(key);
  }
  return keys;
}

auto Interpreter::Iterate(
    const RuntimeValue& iterable, std::string_view description)
    -> std::vector<RuntimeValue> {
  if (const auto* text = std::get_if<std::string>(&iterable)) {
    std::vector<RuntimeValue> chars;
    for (auto& c : common::SplitUtf8(*text)) {
      chars.emplace_back(std::move(c));
    }
    return chars;
  }
  if (Object* object = AsObject(iterable);
      object != nullptr && object->IsArray()) {
    return object->elements;
  }
  ThrowError(
      ErrorKind::kTypeError, std::format("{} is not iterable", description));
}

// ---------------------------------------------------------------------------
// Conversion to the test value model

auto Interpreter::ToValueImpl(
    const RuntimeValue& value, std::vector<const Object*>& stack, bool display)
    -> Value {
  return std::visit(
      common::Overloaded{
          [](const Undefined&) { return Value(); },
          [](const Null&) { return Value::MakeNull(); },
          [](bool b) { return Value::MakeBoolean(b); },
          [](double n) { return Value::MakeNumber(n); },
          [](const std::string& s) { return Value::MakeText(s); },
          [&](const ObjectRef& object) -> Value {
            Tick();
            if (std::ranges::find(stack, object.get()) != stack.end()) {
              if (display) {
                return Value::MakeText("[Circular]");
              }
              ThrowError(
                  ErrorKind::kTypeError,
                  "Converting circular structure to JSON");
            }
            switch (object->kind) {
              case ObjectKind::kFunction:
                if (!display) {
                  return Value();
                }
                return Value::MakeText(
                    object->name.empty()
                        ? std::string("[Function (anonymous)]")
                        : std::format("[Function: {}]", object->name));
              case ObjectKind::kError:
                if (display) {
                  return Value::MakeText(DescribeError(*object));
                }
                break;
              case ObjectKind::kArray: {
                CheckValueDepth(stack.size());
                stack.push_back(object.get());
                Value::List list;
                list.reserve(object->elements.size());
                for (const auto& element : object->elements) {
                  list.push_back(ToValueImpl(element, stack, display));
                }
                stack.pop_back();
                return Value::MakeList(std::move(list));
              }
              case ObjectKind::kPlain:
                break;
            }
            CheckValueDepth(stack.size());
            stack.push_back(object.get());
            Value::Object members;
            if (!object->IsError()) {
              for (const auto& [key, member] : object->properties.Entries()) {
                members.emplace_back(key, ToValueImpl(member, stack, display));
              }
            }
            stack.pop_back();
            return Value::MakeObject(std::move(members));
          },
      },
      value);
}

void Interpreter::CheckValueDepth(size_t depth) {
  if (depth >= kMaxValueDepth) {
    ThrowError(
        ErrorKind::kRangeError,
        std::format("Value nested deeper than {} levels", kMaxValueDepth));
  }
}

auto Interpreter::ToValue(const RuntimeValue& value) -> Value {
  std::vector<const Object*> stack;
  return ToValueImpl(value, stack, false);
}

auto Interpreter::FromValue(const Value& value) -> RuntimeValue {
  return std::visit(
      common::Overloaded{
          [](const Undefined&) -> RuntimeValue { return Undefined{}; },
          [](const Null&) -> RuntimeValue { return Null{}; },
          [](bool b) -> RuntimeValue { return b; },
          [](double n) -> RuntimeValue { return n; },
          [](const std::string& s) -> RuntimeValue { return s; },
          [&](const Value::List& list) -> RuntimeValue {
            std::vector<RuntimeValue> elements;
            elements.reserve(list.size());
            for (const auto& element : list) {
              elements.push_back(FromValue(element));
            }
            return NewArray(std::move(elements));
          },
          [&](const Value::Object& members) -> RuntimeValue {
            ObjectRef object = NewObject();
            for (const auto& [key, member] : members) {
              object->properties.Set(key, FromValue(member));
            }
            return object;
          },
      },
      value.Data());
}

auto Interpreter::Render(const RuntimeValue& value) -> std::string {
  Object* object = AsObject(value);
  if (object == nullptr) {
    return ToString(value);
  }
  if (object->IsError()) {
    return DescribeError(*object);
  }
  std::vector<const Object*> stack;
  Value display = ToValueImpl(value, stack, true);
  if (display.IsText()) {
    return display.AsText();
  }
  return Stringify(display, 2);
}

}  // namespace proba::script
