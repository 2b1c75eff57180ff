#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "proba/script/runtime_value.hpp"

namespace proba::script {

class Interpreter;
class Scope;

namespace builtins {

// Argument `index`, or undefined when the call passed fewer.
inline auto Arg(std::span<const RuntimeValue> args, size_t index)
    -> const RuntimeValue& {
  static const RuntimeValue kUndefined = Undefined{};
  return index < args.size() ? args[index] : kUndefined;
}

// Sets `name` on `target` to a native function.
void DefineMethod(
    Interpreter& interp, Object& target, std::string_view name,
    NativeFunction function);

// TypeError "<value> is not a function" unless `value` is callable.
void RequireCallable(Interpreter& interp, const RuntimeValue& value);

// Binds the allow-listed globals into `globals` and the disabled host names
// to undefined.
void InstallGlobals(Interpreter& interp, Scope& globals);

// Receiver-specific methods, looked up by GetProperty. nullptr if unknown.
auto FindArrayMethod(std::string_view name) -> const NativeFunction*;
auto FindStringMethod(std::string_view name) -> const NativeFunction*;
auto FindNumberMethod(std::string_view name) -> const NativeFunction*;
auto FindFunctionMethod(std::string_view name) -> const NativeFunction*;
// hasOwnProperty / toString / valueOf, available on every value.
auto FindObjectMethod(std::string_view name) -> const NativeFunction*;

}  // namespace builtins
}  // namespace proba::script
