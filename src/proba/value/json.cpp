#include "proba/value/json.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "proba/common/overloaded.hpp"
#include "proba/value/number.hpp"
#include "proba/value/value.hpp"

namespace proba {

namespace {

constexpr double kMaxSafeInteger = 9007199254740992.0;

void WriteValue(
    const Value& value, int indent, int depth, bool in_list,
    std::string& out) {
  auto newline = [&](int level) {
    if (indent > 0) {
      out += '\n';
      out.append(static_cast<size_t>(indent * level), ' ');
    }
  };

  std::visit(
      common::Overloaded{
          [&](const Undefined&) { out += in_list ? "null" : "undefined"; },
          [&](const Null&) { out += "null"; },
          [&](bool b) { out += b ? "true" : "false"; },
          [&](double d) { out += std::isfinite(d) ? FormatNumber(d) : "null"; },
          [&](const std::string& s) { out += QuoteJsonString(s); },
          [&](const Value::List& list) {
            if (list.empty()) {
              out += "[]";
              return;
            }
            out += '[';
            for (size_t i = 0; i < list.size(); ++i) {
              if (i > 0) {
                out += ',';
              }
              newline(depth + 1);
              WriteValue(list[i], indent, depth + 1, true, out);
            }
            newline(depth);
            out += ']';
          },
          [&](const Value::Object& members) {
            bool first = true;
            out += '{';
            for (const auto& [key, member] : members) {
              if (member.IsUndefined()) {
                continue;
              }
              if (!first) {
                out += ',';
              }
              first = false;
              newline(depth + 1);
              out += QuoteJsonString(key);
              out += indent > 0 ? ": " : ":";
              WriteValue(member, indent, depth + 1, false, out);
            }
            if (!first) {
              newline(depth);
            }
            out += '}';
          },
      },
      value.Data());
}

}  // namespace

auto ParseJson(std::string_view text) -> std::optional<Value> {
  auto json = nlohmann::ordered_json::parse(
      text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded()) {
    return std::nullopt;
  }
  return FromJson(json);
}

namespace {

auto FromJsonAt(const nlohmann::ordered_json& json, size_t depth)
    -> std::optional<Value> {
  switch (json.type()) {
    case nlohmann::ordered_json::value_t::null:
      return Value::MakeNull();
    case nlohmann::ordered_json::value_t::boolean:
      return Value::MakeBoolean(json.get<bool>());
    case nlohmann::ordered_json::value_t::number_integer:
    case nlohmann::ordered_json::value_t::number_unsigned:
    case nlohmann::ordered_json::value_t::number_float:
      return Value::MakeNumber(json.get<double>());
    case nlohmann::ordered_json::value_t::string:
      return Value::MakeText(json.get<std::string>());
    case nlohmann::ordered_json::value_t::array: {
      if (depth >= kMaxValueDepth) {
        return std::nullopt;
      }
      Value::List elements;
      elements.reserve(json.size());
      for (const auto& element : json) {
        auto converted = FromJsonAt(element, depth + 1);
        if (!converted) {
          return std::nullopt;
        }
        elements.push_back(*std::move(converted));
      }
      return Value::MakeList(std::move(elements));
    }
    case nlohmann::ordered_json::value_t::object: {
      if (depth >= kMaxValueDepth) {
        return std::nullopt;
      }
      Value::Object members;
      for (const auto& [key, member] : json.items()) {
        auto converted = FromJsonAt(member, depth + 1);
        if (!converted) {
          return std::nullopt;
        }
        members.emplace_back(key, *std::move(converted));
      }
      return Value::MakeObject(std::move(members));
    }
    case nlohmann::ordered_json::value_t::binary:
    case nlohmann::ordered_json::value_t::discarded:
      break;
  }
  return Value{};
}

}  // namespace

auto FromJson(const nlohmann::ordered_json& json) -> std::optional<Value> {
  return FromJsonAt(json, 0);
}

auto ToJson(const Value& value) -> nlohmann::ordered_json {
  return std::visit(
      common::Overloaded{
          [](const Undefined&) -> nlohmann::ordered_json { return nullptr; },
          [](const Null&) -> nlohmann::ordered_json { return nullptr; },
          [](bool b) -> nlohmann::ordered_json { return b; },
          [](double d) -> nlohmann::ordered_json {
            if (!std::isfinite(d)) {
              return nullptr;
            }
            // Integral values print without a fraction, as JSON.stringify does.
            if (std::trunc(d) == d && std::fabs(d) < kMaxSafeInteger) {
              return static_cast<int64_t>(d);
            }
            return d;
          },
          [](const std::string& s) -> nlohmann::ordered_json { return s; },
          [](const Value::List& list) -> nlohmann::ordered_json {
            auto array = nlohmann::ordered_json::array();
            for (const auto& element : list) {
              array.push_back(ToJson(element));
            }
            return array;
          },
          [](const Value::Object& members) -> nlohmann::ordered_json {
            auto object = nlohmann::ordered_json::object();
            for (const auto& [key, member] : members) {
              object[key] = ToJson(member);
            }
            return object;
          },
      },
      value.Data());
}

auto Stringify(const Value& value, int indent) -> std::string {
  std::string out;
  WriteValue(value, indent, 0, false, out);
  return out;
}

auto QuoteJsonString(std::string_view text) -> std::string {
  return nlohmann::ordered_json(std::string(text))
      .dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

}  // namespace proba
