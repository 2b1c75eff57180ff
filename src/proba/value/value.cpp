#include "proba/value/value.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "proba/common/internal_error.hpp"

namespace proba {

auto Value::MakeNull() -> Value {
  return Value(Storage{Null{}});
}

auto Value::MakeBoolean(bool value) -> Value {
  return Value(Storage{value});
}

auto Value::MakeNumber(double value) -> Value {
  return Value(Storage{value});
}

auto Value::MakeText(std::string value) -> Value {
  return Value(Storage{std::move(value)});
}

auto Value::MakeList(List elements) -> Value {
  return Value(Storage{std::move(elements)});
}

auto Value::MakeObject(Object members) -> Value {
  return Value(Storage{std::move(members)});
}

auto Value::AsBoolean() const -> bool {
  if (!IsBoolean()) {
    common::ThrowInternalError(
        "Value::AsBoolean", std::string(ValueKindName(Kind())));
  }
  return std::get<bool>(data_);
}

auto Value::AsNumber() const -> double {
  if (!IsNumber()) {
    common::ThrowInternalError(
        "Value::AsNumber", std::string(ValueKindName(Kind())));
  }
  return std::get<double>(data_);
}

auto Value::AsText() const -> const std::string& {
  if (!IsText()) {
    common::ThrowInternalError(
        "Value::AsText", std::string(ValueKindName(Kind())));
  }
  return std::get<std::string>(data_);
}

auto Value::AsList() const -> const List& {
  if (!IsList()) {
    common::ThrowInternalError(
        "Value::AsList", std::string(ValueKindName(Kind())));
  }
  return std::get<List>(data_);
}

auto Value::AsObject() const -> const Object& {
  if (!IsObject()) {
    common::ThrowInternalError(
        "Value::AsObject", std::string(ValueKindName(Kind())));
  }
  return std::get<Object>(data_);
}

auto Value::Find(std::string_view key) const -> const Value* {
  const auto* members = std::get_if<Object>(&data_);
  if (members == nullptr) {
    return nullptr;
  }
  for (const auto& [name, value] : *members) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

auto ValueKindName(ValueKind kind) -> std::string_view {
  switch (kind) {
    case ValueKind::kUndefined:
      return "undefined";
    case ValueKind::kNull:
      return "null";
    case ValueKind::kBoolean:
      return "boolean";
    case ValueKind::kNumber:
      return "number";
    case ValueKind::kText:
      return "string";
    case ValueKind::kList:
      return "array";
    case ValueKind::kObject:
      return "object";
  }
  return "unknown";
}

}  // namespace proba
