#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "proba/script/arena.hpp"
#include "proba/script/console.hpp"
#include "proba/script/fwd.hpp"
#include "proba/script/runtime_value.hpp"
#include "proba/script/statement.hpp"
#include "proba/value/value.hpp"

namespace proba::script {

inline constexpr size_t kMaxArrayLength = size_t{1} << 24;
inline constexpr size_t kMaxStringLength = size_t{1} << 27;

struct RunLimits {
  uint32_t max_call_depth = 500;
  // 0 means no step budget.
  uint64_t max_steps = 0;
  std::chrono::steady_clock::time_point deadline =
      std::chrono::steady_clock::time_point::max();
  std::stop_token stop;
};

enum class ControlSignal : uint8_t {
  kNormal,
  kReturn,
  kBreak,
  kContinue,
};

struct ExecResult {
  ControlSignal signal = ControlSignal::kNormal;
  RuntimeValue value;
};

// Tree-walking evaluator for one run. The global scope is built from an
// explicit allow-list; nothing of the host is reachable from a script
// except through the built-ins installed here.
//
// Faults propagate as C++ exceptions: ThrowSignal for script-visible
// throws, SyntaxError for unparseable source, Interrupted when the deadline
// passes or a stop is requested.
class Interpreter {
 public:
  Interpreter(ConsoleLog& console, RunLimits limits);
  ~Interpreter();

  Interpreter(const Interpreter&) = delete;
  auto operator=(const Interpreter&) -> Interpreter& = delete;
  Interpreter(Interpreter&&) = delete;
  auto operator=(Interpreter&&) -> Interpreter& = delete;

  // Value of a top-level `return`, else the completion value of the last
  // top-level expression statement.
  auto Run(std::string_view source) -> RuntimeValue;

  auto Call(
      const RuntimeValue& callee, const RuntimeValue& self,
      std::span<const RuntimeValue> args) -> RuntimeValue;
  auto Construct(const RuntimeValue& callee, std::span<const RuntimeValue> args)
      -> RuntimeValue;

  // Throws a new error object of `kind` as a script exception.
  [[noreturn]] void ThrowError(ErrorKind kind, std::string message);

  // Property access with receiver-specific built-in methods.
  auto GetProperty(const RuntimeValue& base, std::string_view key)
      -> RuntimeValue;
  auto GetIndexed(const RuntimeValue& base, const RuntimeValue& key)
      -> RuntimeValue;
  void SetProperty(
      const RuntimeValue& base, std::string_view key, RuntimeValue value);
  void SetIndexed(
      const RuntimeValue& base, const RuntimeValue& key, RuntimeValue value);
  auto HasProperty(const RuntimeValue& base, std::string_view key) -> bool;
  auto DeleteProperty(const RuntimeValue& base, std::string_view key) -> bool;
  // Enumerable own keys in for-in / Object.keys order.
  auto OwnKeys(const RuntimeValue& value) -> std::vector<std::string>;
  // Elements of an array or characters of a string; TypeError otherwise.
  auto Iterate(const RuntimeValue& iterable, std::string_view description)
      -> std::vector<RuntimeValue>;

  // JSON semantics: functions become undefined, cycles raise a TypeError.
  auto ToValue(const RuntimeValue& value) -> Value;
  auto FromValue(const Value& value) -> RuntimeValue;
  // console.log rendering: strings raw, objects as indented JSON.
  auto Render(const RuntimeValue& value) -> std::string;

  auto NewObject() -> ObjectRef;
  auto NewArray(std::vector<RuntimeValue> elements) -> ObjectRef;
  void CheckArrayLength(size_t length);
  void CheckStringLength(size_t length);
  // RangeError once a list or object nests kMaxValueDepth levels deep.
  void CheckValueDepth(size_t depth);

  [[nodiscard]] auto GetHeap() -> Heap& {
    return heap_;
  }
  [[nodiscard]] auto Console() -> ConsoleLog& {
    return console_;
  }
  auto Random() -> double;

  // Deadline, stop request and step budget. Throws Interrupted.
  void Tick() {
    ++steps_;
    if ((steps_ & 0xFF) == 0 ||
        (limits_.max_steps != 0 && steps_ > limits_.max_steps)) {
      CheckBudget();
    }
  }

 private:
  struct Reference {
    // Either a name or a (base, key) property slot.
    std::string name;
    std::optional<RuntimeValue> base;
    RuntimeValue key;
  };

  void CheckBudget();
  [[nodiscard]] auto CurrentArena() const -> const Arena& {
    return program_->arena;
  }

  // Statements
  auto Exec(StatementId id, const std::shared_ptr<Scope>& scope)
      -> ExecResult;
  auto ExecStatements(
      std::span<const StatementId> statements,
      const std::shared_ptr<Scope>& scope) -> ExecResult;
  auto ExecBlock(
      const BlockStatementData& block, const std::shared_ptr<Scope>& scope)
      -> ExecResult;
  void ExecVariableDeclaration(
      const VariableDeclarationStatementData& decl,
      const std::shared_ptr<Scope>& scope);
  auto ExecFor(const ForStatementData& loop, const std::shared_ptr<Scope>& scope)
      -> ExecResult;
  auto ExecForIn(
      const ForEachStatementData& loop, const std::shared_ptr<Scope>& scope)
      -> ExecResult;
  auto ExecForOf(
      const ForEachStatementData& loop, const std::shared_ptr<Scope>& scope)
      -> ExecResult;
  auto ExecForEachBody(
      const ForEachStatementData& loop, RuntimeValue item,
      const std::shared_ptr<Scope>& scope) -> ExecResult;
  auto ExecWhile(
      const WhileStatementData& loop, const std::shared_ptr<Scope>& scope,
      bool test_first) -> ExecResult;
  auto ExecTry(const TryStatementData& stmt, const std::shared_ptr<Scope>& scope)
      -> ExecResult;
  auto ExecSwitch(
      const SwitchStatementData& stmt, const std::shared_ptr<Scope>& scope)
      -> ExecResult;

  // Hoisting
  void HoistFunctions(
      std::span<const StatementId> statements,
      const std::shared_ptr<Scope>& scope);
  auto VarNames(FunctionId function, std::span<const StatementId> body)
      -> const std::vector<std::string>&;
  void CollectVarNames(StatementId id, std::vector<std::string>& names) const;

  // Expressions
  auto Evaluate(ExpressionId id, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  auto EvaluateTemplate(
      const TemplateExpressionData& expr, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  auto EvaluateArrayLiteral(
      const ArrayLiteralExpressionData& expr,
      const std::shared_ptr<Scope>& scope) -> RuntimeValue;
  auto EvaluateObjectLiteral(
      const ObjectLiteralExpressionData& expr,
      const std::shared_ptr<Scope>& scope) -> RuntimeValue;
  auto EvaluateUnary(
      const UnaryExpressionData& expr, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  auto EvaluateUpdate(
      const UpdateExpressionData& expr, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  auto EvaluateLogical(
      const LogicalExpressionData& expr, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  auto EvaluateAssignment(
      const AssignmentExpressionData& expr,
      const std::shared_ptr<Scope>& scope) -> RuntimeValue;
  // Member, index and call expressions; nullopt when an optional link
  // (`?.`) met null or undefined and the rest of the chain is skipped.
  auto EvaluateChain(ExpressionId id, const std::shared_ptr<Scope>& scope)
      -> std::optional<RuntimeValue>;
  auto EvaluateCall(
      const CallExpressionData& expr, const std::shared_ptr<Scope>& scope)
      -> std::optional<RuntimeValue>;
  auto EvaluateNew(
      const NewExpressionData& expr, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  auto EvaluateArguments(
      const std::vector<ExpressionId>& arguments,
      const std::shared_ptr<Scope>& scope) -> std::vector<RuntimeValue>;
  auto BinaryOperation(
      BinaryOp op, const RuntimeValue& lhs, const RuntimeValue& rhs)
      -> RuntimeValue;
  auto InstanceOf(const RuntimeValue& lhs, const RuntimeValue& rhs) -> bool;
  // Dotted source-like name of a callee for error messages ("obj.run").
  auto DescribeExpression(ExpressionId id) const -> std::string;

  // References and bindings
  auto ResolveReference(ExpressionId id, const std::shared_ptr<Scope>& scope)
      -> Reference;
  auto GetReference(const Reference& ref, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  void PutReference(
      const Reference& ref, RuntimeValue value,
      const std::shared_ptr<Scope>& scope);
  auto LookupName(std::string_view name, const std::shared_ptr<Scope>& scope)
      -> RuntimeValue;
  void AssignName(
      std::string_view name, RuntimeValue value,
      const std::shared_ptr<Scope>& scope);
  // `kind` empty: assignment to existing names (destructuring assignment,
  // for-in/of without a declaration).
  void BindPattern(
      const BindingPattern& pattern, RuntimeValue value,
      const std::shared_ptr<Scope>& scope,
      std::optional<DeclarationKind> kind);
  void BindName(
      const std::string& name, RuntimeValue value,
      const std::shared_ptr<Scope>& scope,
      std::optional<DeclarationKind> kind);

  // Functions
  auto MakeClosure(FunctionId id, const std::shared_ptr<Scope>& scope)
      -> ObjectRef;
  auto CallClosure(
      const ObjectRef& function, const RuntimeValue& self,
      std::span<const RuntimeValue> args) -> RuntimeValue;
  // Function object wrapping a built-in method, created once per run.
  auto MethodObject(const NativeFunction* method, std::string_view name)
      -> RuntimeValue;
  auto ToValueImpl(
      const RuntimeValue& value, std::vector<const Object*>& stack,
      bool display) -> Value;

  ConsoleLog& console_;
  RunLimits limits_;
  Heap heap_;
  std::shared_ptr<Scope> globals_;
  std::shared_ptr<const Program> program_;
  std::map<std::pair<const Program*, uint32_t>, std::vector<std::string>>
      var_names_;
  std::unordered_map<const NativeFunction*, ObjectRef> method_objects_;
  uint64_t steps_ = 0;
  uint32_t call_depth_ = 0;
  RuntimeValue completion_;
  std::mt19937_64 random_;
};

}  // namespace proba::script
