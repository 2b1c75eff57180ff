#include "proba/value/compare.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "proba/value/number.hpp"
#include "proba/value/value.hpp"

namespace proba {

namespace {

auto SortedKeys(const Value::Object& members) -> std::vector<std::string> {
  std::vector<std::string> keys;
  keys.reserve(members.size());
  for (const auto& [key, member] : members) {
    keys.push_back(key);
  }
  std::ranges::sort(keys);
  return keys;
}

auto ScalarIdentical(const Value& a, const Value& b) -> bool {
  switch (a.Kind()) {
    case ValueKind::kUndefined:
    case ValueKind::kNull:
      return true;
    case ValueKind::kBoolean:
      return a.AsBoolean() == b.AsBoolean();
    case ValueKind::kNumber: {
      double x = a.AsNumber();
      double y = b.AsNumber();
      return x == y || (std::isnan(x) && std::isnan(y));
    }
    case ValueKind::kText:
      return a.AsText() == b.AsText();
    case ValueKind::kList:
    case ValueKind::kObject:
      return false;
  }
  return false;
}

}  // namespace

auto StructuralEqual(const Value& actual, const Value& expected) -> bool {
  if (actual.Kind() == expected.Kind() && ScalarIdentical(actual, expected)) {
    return true;
  }

  if (actual.IsNullish() || expected.IsNullish()) {
    return actual.Kind() == expected.Kind();
  }

  if (actual.Kind() != expected.Kind()) {
    if (actual.IsNumber() && expected.IsText()) {
      return FormatNumber(actual.AsNumber()) == expected.AsText();
    }
    if (actual.IsText() && expected.IsNumber()) {
      return actual.AsText() == FormatNumber(expected.AsNumber());
    }
    return false;
  }

  if (actual.IsList()) {
    const auto& lhs = actual.AsList();
    const auto& rhs = expected.AsList();
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (!StructuralEqual(lhs[i], rhs[i])) {
        return false;
      }
    }
    return true;
  }

  if (actual.IsObject()) {
    auto keys = SortedKeys(actual.AsObject());
    if (keys != SortedKeys(expected.AsObject())) {
      return false;
    }
    return std::ranges::all_of(keys, [&](const std::string& key) {
      const Value* lhs = actual.Find(key);
      const Value* rhs = expected.Find(key);
      return lhs != nullptr && rhs != nullptr && StructuralEqual(*lhs, *rhs);
    });
  }

  return false;
}

}  // namespace proba
