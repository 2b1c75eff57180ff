#include "proba/script/runtime_value.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "proba/common/overloaded.hpp"
#include "proba/script/scope.hpp"
#include "proba/value/number.hpp"

namespace proba::script {

auto ErrorKindName(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::kError:
      return "Error";
    case ErrorKind::kTypeError:
      return "TypeError";
    case ErrorKind::kReferenceError:
      return "ReferenceError";
    case ErrorKind::kSyntaxError:
      return "SyntaxError";
    case ErrorKind::kRangeError:
      return "RangeError";
  }
  return "Error";
}

// ---------------------------------------------------------------------------
// PropertyMap

auto PropertyMap::Find(std::string_view key) const -> const RuntimeValue* {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

auto PropertyMap::Find(std::string_view key) -> RuntimeValue* {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

void PropertyMap::Set(std::string_view key, RuntimeValue value) {
  if (RuntimeValue* existing = Find(key)) {
    *existing = std::move(value);
    return;
  }
  index_.emplace(std::string(key), entries_.size());
  entries_.emplace_back(std::string(key), std::move(value));
}

auto PropertyMap::Erase(std::string_view key) -> bool {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return false;
  }
  size_t position = it->second;
  index_.erase(it);
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
  for (auto& [name, slot] : index_) {
    if (slot > position) {
      --slot;
    }
  }
  return true;
}

void PropertyMap::Clear() {
  entries_.clear();
  index_.clear();
}

// ---------------------------------------------------------------------------
// Heap

namespace {

// Objects whose last reference goes away while another object is being
// destroyed are queued, so releasing a long chain never nests destructors.
void DestroyObject(Object* object) {
  thread_local std::vector<Object*> pending;
  thread_local bool draining = false;
  pending.push_back(object);
  if (draining) {
    return;
  }
  draining = true;
  while (!pending.empty()) {
    Object* next = pending.back();
    pending.pop_back();
    delete next;
  }
  draining = false;
}

}  // namespace

Heap::~Heap() {
  Release();
}

auto Heap::Allocate(ObjectKind kind) -> ObjectRef {
  ObjectRef object(new Object(), DestroyObject);
  object->kind = kind;
  if (objects_.size() >= prune_threshold_) {
    Prune();
  }
  objects_.push_back(object);
  return object;
}

auto Heap::NewArray(std::vector<RuntimeValue> elements) -> ObjectRef {
  auto array = Allocate(ObjectKind::kArray);
  array->elements = std::move(elements);
  return array;
}

auto Heap::NewError(ErrorKind kind, std::string message) -> ObjectRef {
  auto error = Allocate(ObjectKind::kError);
  error->error_kind = kind;
  error->properties.Set("name", std::string(ErrorKindName(kind)));
  error->properties.Set("message", std::move(message));
  return error;
}

auto Heap::NewNative(
    std::string name, NativeFunction function, bool is_constructor)
    -> ObjectRef {
  auto object = Allocate(ObjectKind::kFunction);
  object->name = std::move(name);
  object->native = std::move(function);
  object->is_constructor = is_constructor;
  return object;
}

void Heap::Prune() {
  std::erase_if(objects_, [](const auto& weak) { return weak.expired(); });
  prune_threshold_ = std::max<size_t>(4096, objects_.size() * 2);
}

void Heap::Release() {
  // Clearing every reachable slot breaks closure/scope/object cycles; the
  // shared_ptrs then free the graph.
  std::vector<ObjectRef> alive;
  alive.reserve(objects_.size());
  for (const auto& weak : objects_) {
    if (auto object = weak.lock()) {
      alive.push_back(std::move(object));
    }
  }
  objects_.clear();
  for (const auto& object : alive) {
    object->properties.Clear();
    object->elements.clear();
    if (object->closure && object->closure->scope) {
      object->closure->scope->Clear();
    }
    object->closure.reset();
    object->native = nullptr;
  }
}

// ---------------------------------------------------------------------------
// Conversions

namespace {

// Arrays being joined on this thread; a cycle renders as "".
thread_local std::vector<const Object*> joining;

auto JoinForString(const Object& array) -> std::string {
  if (std::ranges::find(joining, &array) != joining.end()) {
    return "";
  }
  joining.push_back(&array);
  std::string out;
  for (size_t i = 0; i < array.elements.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    const RuntimeValue& element = array.elements[i];
    if (!IsNullish(element)) {
      out += ToString(element);
    }
  }
  joining.pop_back();
  return out;
}

}  // namespace

auto TypeOf(const RuntimeValue& v) -> std::string_view {
  return std::visit(
      common::Overloaded{
          [](const Undefined&) -> std::string_view { return "undefined"; },
          [](const Null&) -> std::string_view { return "object"; },
          [](bool) -> std::string_view { return "boolean"; },
          [](double) -> std::string_view { return "number"; },
          [](const std::string&) -> std::string_view { return "string"; },
          [](const ObjectRef& object) -> std::string_view {
            return object->IsFunction() ? "function" : "object";
          },
      },
      v);
}

auto ToBoolean(const RuntimeValue& v) -> bool {
  return std::visit(
      common::Overloaded{
          [](const Undefined&) { return false; },
          [](const Null&) { return false; },
          [](bool b) { return b; },
          [](double n) { return !(n == 0 || std::isnan(n)); },
          [](const std::string& s) { return !s.empty(); },
          [](const ObjectRef&) { return true; },
      },
      v);
}

auto ToNumber(const RuntimeValue& v) -> double {
  return std::visit(
      common::Overloaded{
          [](const Undefined&) {
            return std::numeric_limits<double>::quiet_NaN();
          },
          [](const Null&) { return 0.0; },
          [](bool b) { return b ? 1.0 : 0.0; },
          [](double n) { return n; },
          [](const std::string& s) { return CoerceToNumber(s); },
          [&](const ObjectRef&) { return CoerceToNumber(ToString(v)); },
      },
      v);
}

auto ToString(const RuntimeValue& v) -> std::string {
  return std::visit(
      common::Overloaded{
          [](const Undefined&) -> std::string { return "undefined"; },
          [](const Null&) -> std::string { return "null"; },
          [](bool b) -> std::string { return b ? "true" : "false"; },
          [](double n) -> std::string { return FormatNumber(n); },
          [](const std::string& s) -> std::string { return s; },
          [](const ObjectRef& object) -> std::string {
            switch (object->kind) {
              case ObjectKind::kArray:
                return JoinForString(*object);
              case ObjectKind::kFunction:
                if (object->native) {
                  return std::format(
                      "function {}() {{ [native code] }}", object->name);
                }
                return std::format("function {}() {{ ... }}", object->name);
              case ObjectKind::kError:
                return DescribeError(*object);
              case ObjectKind::kPlain:
                break;
            }
            return "[object Object]";
          },
      },
      v);
}

auto ToInt32(double number) -> int32_t {
  return static_cast<int32_t>(ToUint32(number));
}

auto ToUint32(double number) -> uint32_t {
  if (!std::isfinite(number)) {
    return 0;
  }
  double truncated = std::trunc(number);
  double modulo = std::fmod(truncated, 4294967296.0);
  if (modulo < 0) {
    modulo += 4294967296.0;
  }
  return static_cast<uint32_t>(modulo);
}

auto ToRelativeIndex(const RuntimeValue& v, size_t length, size_t fallback)
    -> size_t {
  if (IsUndefined(v)) {
    return fallback;
  }
  double relative = ToNumber(v);
  if (std::isnan(relative)) {
    return 0;
  }
  relative = std::trunc(relative);
  auto size = static_cast<double>(length);
  if (relative < 0) {
    return static_cast<size_t>(std::max(0.0, size + relative));
  }
  return static_cast<size_t>(std::min(relative, size));
}

auto ToPrimitive(const RuntimeValue& v) -> RuntimeValue {
  if (std::holds_alternative<ObjectRef>(v)) {
    return ToString(v);
  }
  return v;
}

auto StrictEquals(const RuntimeValue& a, const RuntimeValue& b) -> bool {
  if (a.index() != b.index()) {
    return false;
  }
  return std::visit(
      common::Overloaded{
          [](const Undefined&) { return true; },
          [](const Null&) { return true; },
          [&](bool x) { return x == std::get<bool>(b); },
          [&](double x) { return x == std::get<double>(b); },
          [&](const std::string& x) { return x == std::get<std::string>(b); },
          [&](const ObjectRef& x) { return x == std::get<ObjectRef>(b); },
      },
      a);
}

auto SameValueZero(const RuntimeValue& a, const RuntimeValue& b) -> bool {
  if (const auto* x = std::get_if<double>(&a)) {
    if (const auto* y = std::get_if<double>(&b)) {
      if (std::isnan(*x) && std::isnan(*y)) {
        return true;
      }
    }
  }
  return StrictEquals(a, b);
}

auto LooseEquals(const RuntimeValue& a, const RuntimeValue& b) -> bool {
  if (a.index() == b.index()) {
    return StrictEquals(a, b);
  }
  if (IsNullish(a) || IsNullish(b)) {
    return IsNullish(a) && IsNullish(b);
  }
  bool a_object = std::holds_alternative<ObjectRef>(a);
  bool b_object = std::holds_alternative<ObjectRef>(b);
  if (a_object || b_object) {
    return LooseEquals(ToPrimitive(a), ToPrimitive(b));
  }
  // Remaining mixes of boolean, number and string compare numerically.
  return ToNumber(a) == ToNumber(b);
}

auto ParseArrayIndex(std::string_view key) -> std::optional<size_t> {
  if (key.empty() || key.size() > 10) {
    return std::nullopt;
  }
  if (key.size() > 1 && key[0] == '0') {
    return std::nullopt;
  }
  uint64_t index = 0;
  for (char c : key) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    index = index * 10 + static_cast<uint64_t>(c - '0');
  }
  if (index >= 4294967295ULL) {
    return std::nullopt;
  }
  return static_cast<size_t>(index);
}

auto DescribeError(const Object& error) -> std::string {
  std::string name = "Error";
  if (error.error_kind) {
    name = std::string(ErrorKindName(*error.error_kind));
  }
  if (const RuntimeValue* value = error.properties.Find("name")) {
    name = ToString(*value);
  }
  std::string message;
  if (const RuntimeValue* value = error.properties.Find("message")) {
    message = ToString(*value);
  }
  if (message.empty()) {
    return name;
  }
  return std::format("{}: {}", name, message);
}

}  // namespace proba::script
