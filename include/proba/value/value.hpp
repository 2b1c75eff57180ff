#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace proba {

// Lists and objects nest at most this deep when converted from JSON or from
// script values.
inline constexpr size_t kMaxValueDepth = 512;

// The absent value. JSON has no spelling for it; it renders as `undefined`.
struct Undefined {
  auto operator==(const Undefined&) const -> bool = default;
};

struct Null {
  auto operator==(const Null&) const -> bool = default;
};

enum class ValueKind : uint8_t {
  kUndefined,
  kNull,
  kBoolean,
  kNumber,
  kText,
  kList,
  kObject,
};

// Dynamically-typed test value: scalar, ordered sequence, or ordered mapping.
// Test inputs, expected values and actual results all use this model.
class Value {
 public:
  using List = std::vector<Value>;
  // Keys keep insertion order; the comparator sorts them when needed.
  using Object = std::vector<std::pair<std::string, Value>>;
  using Storage =
      std::variant<Undefined, Null, bool, double, std::string, List, Object>;

  Value() = default;

  static auto MakeNull() -> Value;
  static auto MakeBoolean(bool value) -> Value;
  static auto MakeNumber(double value) -> Value;
  static auto MakeText(std::string value) -> Value;
  static auto MakeList(List elements) -> Value;
  static auto MakeObject(Object members) -> Value;

  [[nodiscard]] auto Kind() const -> ValueKind {
    return static_cast<ValueKind>(data_.index());
  }
  [[nodiscard]] auto Data() const -> const Storage& {
    return data_;
  }

  [[nodiscard]] auto IsUndefined() const -> bool {
    return Kind() == ValueKind::kUndefined;
  }
  [[nodiscard]] auto IsNull() const -> bool {
    return Kind() == ValueKind::kNull;
  }
  // null or undefined
  [[nodiscard]] auto IsNullish() const -> bool {
    return IsUndefined() || IsNull();
  }
  [[nodiscard]] auto IsBoolean() const -> bool {
    return Kind() == ValueKind::kBoolean;
  }
  [[nodiscard]] auto IsNumber() const -> bool {
    return Kind() == ValueKind::kNumber;
  }
  [[nodiscard]] auto IsText() const -> bool {
    return Kind() == ValueKind::kText;
  }
  [[nodiscard]] auto IsList() const -> bool {
    return Kind() == ValueKind::kList;
  }
  [[nodiscard]] auto IsObject() const -> bool {
    return Kind() == ValueKind::kObject;
  }

  [[nodiscard]] auto AsBoolean() const -> bool;
  [[nodiscard]] auto AsNumber() const -> double;
  [[nodiscard]] auto AsText() const -> const std::string&;
  [[nodiscard]] auto AsList() const -> const List&;
  [[nodiscard]] auto AsObject() const -> const Object&;

  // Object member lookup; nullptr when absent or not an object.
  [[nodiscard]] auto Find(std::string_view key) const -> const Value*;

  // Exact equality (order-sensitive, NaN != NaN). Test comparisons go
  // through StructuralEqual instead.
  auto operator==(const Value&) const -> bool = default;

 private:
  explicit Value(Storage data) : data_(std::move(data)) {
  }

  Storage data_;
};

auto ValueKindName(ValueKind kind) -> std::string_view;

}  // namespace proba
