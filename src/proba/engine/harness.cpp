#include "proba/engine/harness.hpp"

#include <cmath>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/common/overloaded.hpp"
#include "proba/common/string_utils.hpp"
#include "proba/engine/language.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/value/json.hpp"
#include "proba/value/number.hpp"
#include "proba/value/value.hpp"

namespace proba::engine {

namespace {

auto JoinArguments(const std::vector<Value>& input, auto to_literal)
    -> std::string {
  std::vector<std::string> parts;
  parts.reserve(input.size());
  for (const Value& value : input) {
    parts.push_back(to_literal(value));
  }
  return common::Join(parts, ", ");
}

auto NumberLiteral(double value, std::string_view nan, std::string_view inf)
    -> std::string {
  if (std::isnan(value)) {
    return std::string(nan);
  }
  if (std::isinf(value)) {
    return value < 0 ? std::format("-{}", inf) : std::string(inf);
  }
  return FormatNumber(value);
}

auto JavaScriptHarness(std::string_view code, const extract::TestCase& test)
    -> std::string {
  const std::string& name = test.function_name;
  return std::format(
      R"((function () {{
{0}
;
try {{
  if (typeof {1} === "undefined") {{
    throw new ReferenceError("{1} is not defined");
  }}
  if (typeof {1} !== "function") {{
    throw new TypeError("{1} is not a function");
  }}
  const __proba_result = {1}({2});
  console.log("{3} " + JSON.stringify(__proba_result));
}} catch (__proba_error) {{
  const __proba_message =
    __proba_error !== null && typeof __proba_error === "object" &&
    __proba_error.message !== undefined
      ? __proba_error.message
      : __proba_error;
  console.log("{4} " + String(__proba_message));
  throw __proba_error;
}}
}})();
)",
      code, name, JoinArguments(test.input, ToJavaScriptLiteral),
      kResultSentinel, kErrorSentinel);
}

auto PythonHarness(std::string_view code, const extract::TestCase& test)
    -> std::string {
  const std::string& name = test.function_name;
  return std::format(
      R"(import json as __proba_json

{0}

try:
    if "{1}" not in globals():
        raise NameError("name '{1}' is not defined")
    if not callable({1}):
        raise TypeError("'{1}' is not a function")
    __proba_result = {1}({2})
    print("{3} " + __proba_json.dumps(__proba_result))
except Exception as __proba_error:
    print("{4} " + str(__proba_error))
    raise
)",
      code, name, JoinArguments(test.input, ToPythonLiteral), kResultSentinel,
      kErrorSentinel);
}

// Text after `sentinel` on the first line that carries it.
auto FindSentinel(
    const std::vector<std::string>& lines, std::string_view sentinel)
    -> std::optional<std::string> {
  for (const std::string& line : lines) {
    size_t at = line.find(sentinel);
    if (at != std::string::npos) {
      return std::string(common::Trim(
          std::string_view(line).substr(at + sentinel.size())));
    }
  }
  return std::nullopt;
}

auto ParsePayload(std::string_view payload) -> Value {
  if (payload == "undefined") {
    return Value();
  }
  if (auto json = ParseJson(payload)) {
    return *std::move(json);
  }
  return Value::MakeText(std::string(payload));
}

}  // namespace

auto BuildHarness(
    std::string_view code, const extract::TestCase& test_case,
    Language language) -> Result<std::string> {
  if (!common::IsIdentifier(test_case.function_name)) {
    return std::unexpected(Diagnostic::Error(
        {}, std::format(
                "Invalid function name \"{}\"", test_case.function_name)));
  }
  switch (language) {
    case Language::kJavaScript:
      return JavaScriptHarness(code, test_case);
    case Language::kPython:
      return PythonHarness(code, test_case);
    case Language::kJava:
      break;
  }
  return std::unexpected(Diagnostic::Error(
      {}, std::format(
              "Function tests are not supported for {}; use program tests "
              "that compare the program's output instead",
              ToString(language))));
}

auto ToJavaScriptLiteral(const Value& value) -> std::string {
  return std::visit(
      common::Overloaded{
          [](Undefined) -> std::string { return "undefined"; },
          [](Null) -> std::string { return "null"; },
          [](bool b) -> std::string { return b ? "true" : "false"; },
          [](double d) -> std::string {
            return NumberLiteral(d, "NaN", "Infinity");
          },
          [](const std::string& s) -> std::string {
            return QuoteJsonString(s);
          },
          [](const Value::List& list) -> std::string {
            return "[" + JoinArguments(list, ToJavaScriptLiteral) + "]";
          },
          [](const Value::Object& object) -> std::string {
            std::vector<std::string> members;
            members.reserve(object.size());
            for (const auto& [key, member] : object) {
              members.push_back(std::format(
                  "{}: {}", QuoteJsonString(key), ToJavaScriptLiteral(member)));
            }
            return "{" + common::Join(members, ", ") + "}";
          },
      },
      value.Data());
}

auto ToPythonLiteral(const Value& value) -> std::string {
  return std::visit(
      common::Overloaded{
          [](Undefined) -> std::string { return "None"; },
          [](Null) -> std::string { return "None"; },
          [](bool b) -> std::string { return b ? "True" : "False"; },
          [](double d) -> std::string {
            return NumberLiteral(d, "float(\"nan\")", "float(\"inf\")");
          },
          [](const std::string& s) -> std::string {
            return "\"" + common::EscapeForQuotedString(s, '"') + "\"";
          },
          [](const Value::List& list) -> std::string {
            return "[" + JoinArguments(list, ToPythonLiteral) + "]";
          },
          [](const Value::Object& object) -> std::string {
            std::vector<std::string> members;
            members.reserve(object.size());
            for (const auto& [key, member] : object) {
              members.push_back(std::format(
                  "\"{}\": {}", common::EscapeForQuotedString(key, '"'),
                  ToPythonLiteral(member)));
            }
            return "{" + common::Join(members, ", ") + "}";
          },
      },
      value.Data());
}

auto ExtractActual(std::string_view output) -> ExtractedResult {
  std::vector<std::string> lines = common::SplitLines(output);

  if (auto payload = FindSentinel(lines, kResultSentinel)) {
    return ExtractedResult{.actual = ParsePayload(*payload), .error = {}};
  }
  if (auto message = FindSentinel(lines, kErrorSentinel)) {
    return ExtractedResult{.actual = std::nullopt, .error = *message};
  }

  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    std::string_view line = common::Trim(*it);
    if (line.empty()) {
      continue;
    }
    // The sandbox renders a completion value as "→ value".
    constexpr std::string_view kValueMarker = "→ ";
    if (line.starts_with(kValueMarker)) {
      line.remove_prefix(kValueMarker.size());
    }
    if (auto json = ParseJson(line)) {
      return ExtractedResult{.actual = *std::move(json), .error = {}};
    }
    return ExtractedResult{
        .actual = Value::MakeText(std::string(line)), .error = {}};
  }
  return ExtractedResult{.actual = Value(), .error = {}};
}

auto UserInputsToStdin(std::string_view user_inputs) -> std::string {
  if (common::Trim(user_inputs).empty()) {
    return "";
  }
  std::vector<std::string> lines;
  for (const std::string& piece : common::Split(user_inputs, ",")) {
    lines.emplace_back(common::Trim(piece));
  }
  return common::Join(lines, "\n");
}

}  // namespace proba::engine
