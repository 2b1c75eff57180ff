#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "proba/script/fwd.hpp"
#include "proba/value/value.hpp"

namespace proba::script {

enum class ObjectKind : uint8_t {
  kPlain,
  kArray,
  kFunction,
  kError,
};

// Built-in error constructors; decides how an uncaught fault is classified.
enum class ErrorKind : uint8_t {
  kError,
  kTypeError,
  kReferenceError,
  kSyntaxError,
  kRangeError,
};

auto ErrorKindName(ErrorKind kind) -> std::string_view;

using ObjectRef = std::shared_ptr<Object>;

// Script-side value. Primitives are held inline; arrays, plain objects,
// functions and errors are shared heap objects.
using RuntimeValue =
    std::variant<Undefined, Null, bool, double, std::string, ObjectRef>;

// Built-in function body. `self` is the receiver of a method call
// (undefined for plain calls).
using NativeFunction = std::function<RuntimeValue(
    Interpreter& interp, const RuntimeValue& self,
    std::span<const RuntimeValue> args)>;

// Heterogeneous lookup for string-keyed maps.
struct StringHash {
  using is_transparent = void;
  auto operator()(std::string_view s) const -> size_t {
    return std::hash<std::string_view>{}(s);
  }
};

// Own properties in insertion order.
class PropertyMap {
 public:
  using Entry = std::pair<std::string, RuntimeValue>;

  [[nodiscard]] auto Find(std::string_view key) const -> const RuntimeValue*;
  [[nodiscard]] auto Find(std::string_view key) -> RuntimeValue*;
  [[nodiscard]] auto Contains(std::string_view key) const -> bool {
    return Find(key) != nullptr;
  }
  void Set(std::string_view key, RuntimeValue value);
  auto Erase(std::string_view key) -> bool;
  void Clear();

  [[nodiscard]] auto Entries() const -> const std::vector<Entry>& {
    return entries_;
  }
  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

 private:
  std::vector<Entry> entries_;
  std::unordered_map<std::string, size_t, StringHash, std::equal_to<>> index_;
};

// A user function bound to the scope it was created in.
struct Closure {
  std::shared_ptr<const Program> program;
  FunctionId function = kInvalidFunctionId;
  std::shared_ptr<Scope> scope;
};

struct Object {
  ObjectKind kind = ObjectKind::kPlain;
  PropertyMap properties;
  bool frozen = false;

  // kArray
  std::vector<RuntimeValue> elements;

  // kFunction: exactly one of closure / native is set.
  std::string name;
  std::optional<Closure> closure;
  NativeFunction native;
  bool is_constructor = false;
  // Set on Error constructors (and on error instances).
  std::optional<ErrorKind> error_kind;

  // Function that created this object with `new`.
  std::weak_ptr<Object> constructor;

  [[nodiscard]] auto IsArray() const -> bool {
    return kind == ObjectKind::kArray;
  }
  [[nodiscard]] auto IsFunction() const -> bool {
    return kind == ObjectKind::kFunction;
  }
  [[nodiscard]] auto IsError() const -> bool {
    return kind == ObjectKind::kError;
  }
};

// Owns the bookkeeping for every object created during one run. Closures,
// scopes and objects can reference each other in cycles, so Release() clears
// the object graph explicitly at the end of the run.
class Heap {
 public:
  Heap() = default;
  ~Heap();

  Heap(const Heap&) = delete;
  auto operator=(const Heap&) -> Heap& = delete;
  Heap(Heap&&) = delete;
  auto operator=(Heap&&) -> Heap& = delete;

  auto Allocate(ObjectKind kind) -> ObjectRef;
  auto NewArray(std::vector<RuntimeValue> elements) -> ObjectRef;
  auto NewError(ErrorKind kind, std::string message) -> ObjectRef;
  auto NewNative(
      std::string name, NativeFunction function, bool is_constructor = false)
      -> ObjectRef;

  void Release();

  [[nodiscard]] auto LiveCount() const -> size_t {
    return objects_.size();
  }

 private:
  void Prune();

  std::vector<std::weak_ptr<Object>> objects_;
  size_t prune_threshold_ = 4096;
};

// Accessors

[[nodiscard]] inline auto IsUndefined(const RuntimeValue& v) -> bool {
  return std::holds_alternative<Undefined>(v);
}
[[nodiscard]] inline auto IsNullish(const RuntimeValue& v) -> bool {
  return std::holds_alternative<Undefined>(v) ||
         std::holds_alternative<Null>(v);
}
[[nodiscard]] inline auto AsObject(const RuntimeValue& v) -> Object* {
  if (const auto* ref = std::get_if<ObjectRef>(&v)) {
    return ref->get();
  }
  return nullptr;
}
[[nodiscard]] inline auto IsCallable(const RuntimeValue& v) -> bool {
  const Object* object = AsObject(v);
  return object != nullptr && object->IsFunction();
}

// Conversions with JavaScript semantics. Objects convert through their
// string form ("1,2" for arrays, "[object Object]" for plain objects).

auto TypeOf(const RuntimeValue& v) -> std::string_view;
auto ToBoolean(const RuntimeValue& v) -> bool;
auto ToNumber(const RuntimeValue& v) -> double;
auto ToString(const RuntimeValue& v) -> std::string;
auto ToInt32(double number) -> int32_t;
auto ToUint32(double number) -> uint32_t;
// Integer in [0, length] for slice-style arguments (negative counts back).
auto ToRelativeIndex(const RuntimeValue& v, size_t length, size_t fallback)
    -> size_t;
// Objects become their string form; primitives are returned unchanged.
auto ToPrimitive(const RuntimeValue& v) -> RuntimeValue;

auto StrictEquals(const RuntimeValue& a, const RuntimeValue& b) -> bool;
auto LooseEquals(const RuntimeValue& a, const RuntimeValue& b) -> bool;
// Like StrictEquals but NaN equals NaN (Array#includes).
auto SameValueZero(const RuntimeValue& a, const RuntimeValue& b) -> bool;

// Canonical array index for a property key, nullopt if `key` is not one.
auto ParseArrayIndex(std::string_view key) -> std::optional<size_t>;

// "Name: message" / "Name" for error objects.
auto DescribeError(const Object& error) -> std::string;

}  // namespace proba::script
