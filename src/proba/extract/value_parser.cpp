#include "proba/extract/value_parser.hpp"

#include <cmath>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "proba/common/string_utils.hpp"
#include "proba/value/json.hpp"
#include "proba/value/number.hpp"
#include "proba/value/value.hpp"

namespace proba::extract {

namespace {

auto IsQuoted(std::string_view text) -> bool {
  if (text.size() < 2) {
    return false;
  }
  char quote = text.front();
  return (quote == '"' || quote == '\'') && text.back() == quote;
}

}  // namespace

auto ParseValue(std::string_view text) -> Value {
  std::string_view trimmed = common::Trim(text);

  if (trimmed == "null") {
    return Value::MakeNull();
  }
  if (trimmed == "undefined") {
    return Value();
  }
  if (trimmed == "true") {
    return Value::MakeBoolean(true);
  }
  if (trimmed == "false") {
    return Value::MakeBoolean(false);
  }
  if (auto json = ParseJson(trimmed)) {
    return *json;
  }
  if (IsQuoted(trimmed)) {
    return Value::MakeText(
        std::string(trimmed.substr(1, trimmed.size() - 2)));
  }
  if (double number = CoerceToNumber(trimmed); !std::isnan(number)) {
    return Value::MakeNumber(number);
  }
  return Value::MakeText(std::string(trimmed));
}

auto ParseArgument(std::string_view text) -> Value {
  std::string_view trimmed = common::Trim(text);
  if (double number = CoerceToNumber(trimmed); !std::isnan(number)) {
    return Value::MakeNumber(number);
  }
  if (auto json = ParseJson(trimmed)) {
    return *json;
  }
  return Value::MakeText(std::string(trimmed));
}

auto ParseJsonArguments(std::string_view text)
    -> std::optional<std::vector<Value>> {
  if (common::Trim(text).empty()) {
    return std::vector<Value>{};
  }
  auto parsed = ParseJson(std::format("[{}]", text));
  if (!parsed || !parsed->IsList()) {
    return std::nullopt;
  }
  return parsed->AsList();
}

auto ParseArgumentList(std::string_view text) -> std::vector<Value> {
  if (auto json = ParseJsonArguments(text)) {
    return *std::move(json);
  }
  std::vector<Value> values;
  for (const auto& piece : common::Split(text, ",")) {
    values.push_back(ParseValue(piece));
  }
  return values;
}

}  // namespace proba::extract
