#include "proba/remote/offline_python.hpp"

#include <cmath>
#include <cstddef>
#include <format>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/common/string_utils.hpp"
#include "proba/value/json.hpp"
#include "proba/value/number.hpp"
#include "proba/value/value.hpp"

namespace proba::remote {

namespace {

using Variables = std::unordered_map<std::string, Value>;

// std::regex recurses per character; longer lines are refused.
constexpr size_t kMaxLineLength = 4096;

struct Function {
  std::string name;
  std::vector<std::string> params;
  std::string body;  // the returned expression
};

auto IsQuoted(std::string_view text) -> bool {
  return text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
         text.back() == text.front();
}

// Splits on `separator` outside quotes and brackets.
auto SplitTopLevel(std::string_view text, char separator)
    -> std::vector<std::string> {
  std::vector<std::string> parts;
  std::string current;
  int depth = 0;
  char quote = 0;
  for (char c : text) {
    if (quote != 0) {
      if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '(' || c == '[') {
      ++depth;
    } else if (c == ')' || c == ']') {
      --depth;
    } else if (c == separator && depth == 0) {
      parts.emplace_back(common::Trim(current));
      current.clear();
      continue;
    }
    current += c;
  }
  parts.emplace_back(common::Trim(current));
  return parts;
}

// str() of a value.
auto Str(const Value& value) -> std::string {
  switch (value.Kind()) {
    case ValueKind::kNumber:
      return FormatNumber(value.AsNumber());
    case ValueKind::kText:
      return value.AsText();
    case ValueKind::kList: {
      std::vector<std::string> parts;
      for (const Value& element : value.AsList()) {
        if (element.IsText()) {
          parts.push_back(
              "'" + common::EscapeForQuotedString(element.AsText(), '\'') +
              "'");
        } else {
          parts.push_back(Str(element));
        }
      }
      return "[" + common::Join(parts, ", ") + "]";
    }
    case ValueKind::kBoolean:
      return value.AsBoolean() ? "True" : "False";
    case ValueKind::kUndefined:
    case ValueKind::kNull:
    case ValueKind::kObject:
      break;
  }
  return "None";
}

auto AsNumber(const Value& value) -> double {
  if (value.IsNumber()) {
    return value.AsNumber();
  }
  if (value.IsText()) {
    return CoerceToNumber(value.AsText());
  }
  return std::nan("");
}

class Approximation {
 public:
  explicit Approximation(std::string_view stdin_text) {
    for (const std::string& line : common::SplitLines(stdin_text)) {
      std::string_view trimmed = common::Trim(line);
      if (!trimmed.empty()) {
        stdin_lines_.emplace_back(trimmed);
      }
    }
  }

  auto Execute(std::string_view code) -> Result<std::string> {
    std::vector<std::string> lines = common::SplitLines(code);
    for (size_t i = 0; i < lines.size(); ++i) {
      if (lines[i].size() > kMaxLineLength) {
        return std::unexpected(Diagnostic::Error(
            {}, std::format(
                    "line {} is too long for offline execution ({} > {} "
                    "characters)",
                    i + 1, lines[i].size(), kMaxLineLength)));
      }
    }
    CollectFunction(lines);

    // Function bodies and exception handlers are skipped; the bodies of
    // other blocks (try, if, for) run as if they were top level.
    bool in_body = false;
    for (const std::string& raw : lines) {
      std::string_view line = common::Trim(raw);
      if (line.empty() || line.starts_with("#")) {
        continue;
      }
      bool indented = common::IsSpace(raw.front());
      if (in_body && indented) {
        continue;
      }
      in_body = false;
      if (line.starts_with("def ") || line.starts_with("except")) {
        in_body = true;
        continue;
      }

      if (auto result = ExecuteLine(line); !result) {
        return std::unexpected(std::move(result.error()));
      }
    }

    if (output_.empty()) {
      return std::string(kNoOutputMessage);
    }
    return output_;
  }

 private:
  // First top-level `def name(params):` whose body reaches a `return`.
  void CollectFunction(const std::vector<std::string>& lines) {
    static const std::regex kDef(R"(^def\s+(\w+)\s*\(([^)]*)\)\s*:\s*$)");
    static const std::regex kReturn(R"(^return\s+(.+)$)");
    for (size_t i = 0; i < lines.size(); ++i) {
      std::string header(common::Trim(lines[i]));
      std::smatch match;
      if (!std::regex_match(header, match, kDef)) {
        continue;
      }
      Function function{.name = match[1].str(), .params = {}, .body = {}};
      std::string params = match[2].str();
      if (!common::Trim(params).empty()) {
        for (const std::string& param : common::Split(params, ",")) {
          function.params.emplace_back(common::Trim(param));
        }
      }
      for (size_t j = i + 1; j < lines.size(); ++j) {
        std::string body(common::Trim(lines[j]));
        if (body.empty() || body.starts_with("#")) {
          continue;
        }
        if (!common::IsSpace(lines[j].front())) {
          break;
        }
        std::smatch returned;
        if (std::regex_match(body, returned, kReturn)) {
          function.body = std::string(common::Trim(returned[1].str()));
          function_ = std::move(function);
          return;
        }
      }
    }
  }

  auto ExecuteLine(std::string_view line) -> Result<void> {
    static const std::regex kAssign(R"(^(\w+)\s*=\s*([^=].*)$)");
    static const std::regex kPrint(R"(^print\s*\((.*)\)$)");
    std::string text(line);
    std::smatch match;

    if (std::regex_match(text, match, kAssign)) {
      auto value = Evaluate(common::Trim(match[2].str()), globals_);
      if (!value) {
        return std::unexpected(std::move(value.error()));
      }
      globals_[match[1].str()] = *std::move(value);
      return {};
    }

    if (std::regex_match(text, match, kPrint)) {
      std::string arguments(common::Trim(match[1].str()));
      std::vector<std::string> rendered;
      if (!arguments.empty()) {
        for (const std::string& argument : SplitTopLevel(arguments, ',')) {
          auto value = Evaluate(argument, globals_);
          if (!value) {
            return std::unexpected(std::move(value.error()));
          }
          rendered.push_back(Str(*value));
        }
      }
      output_ += common::Join(rendered, " ");
      output_ += '\n';
    }
    return {};
  }

  auto Evaluate(std::string_view expression, const Variables& variables)
      -> Result<Value> {
    static const std::regex kBuiltin(R"(^(sum|len)\s*\(\s*(\w+)\s*\)$)");
    static const std::regex kInput(R"(^input\s*\(.*\)$)");
    static const std::regex kDumps(R"(^(?:\w+\.)?dumps\s*\((.*)\)$)");
    static const std::regex kCall(R"(^(\w+)\s*\(([^()]*)\)$)");

    std::string text(common::Trim(expression));
    if (IsQuoted(text)) {
      return Value::MakeText(text.substr(1, text.size() - 2));
    }
    if (!text.empty()) {
      double number = CoerceToNumber(text);
      if (!std::isnan(number)) {
        return Value::MakeNumber(number);
      }
    }
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
      Value::List elements;
      std::string_view inner = common::Trim(
          std::string_view(text).substr(1, text.size() - 2));
      if (!inner.empty()) {
        for (const std::string& piece : SplitTopLevel(inner, ',')) {
          auto element = Evaluate(piece, variables);
          if (!element) {
            return element;
          }
          elements.push_back(*std::move(element));
        }
      }
      return Value::MakeList(std::move(elements));
    }
    if (auto it = variables.find(text); it != variables.end()) {
      return it->second;
    }

    std::smatch match;
    if (std::regex_match(text, match, kBuiltin)) {
      auto it = variables.find(match[2].str());
      if (it != variables.end()) {
        return ApplyBuiltin(match[1].str(), it->second);
      }
    }
    if (std::regex_match(text, match, kDumps)) {
      auto value = Evaluate(match[1].str(), variables);
      if (!value) {
        return value;
      }
      return Value::MakeText(Stringify(*value));
    }
    if (std::regex_match(text, kInput)) {
      if (next_input_ < stdin_lines_.size()) {
        return Value::MakeText(stdin_lines_[next_input_++]);
      }
      return Value::MakeText("");
    }
    if (function_ && std::regex_match(text, match, kCall) &&
        match[1].str() == function_->name) {
      return CallFunction(match[2].str(), variables);
    }

    for (char op : {'+', '-', '*', '/'}) {
      std::vector<std::string> parts = SplitTopLevel(text, op);
      if (parts.size() != 2 || parts[0].empty()) {
        continue;
      }
      auto left = Evaluate(parts[0], variables);
      if (!left) {
        return left;
      }
      auto right = Evaluate(parts[1], variables);
      if (!right) {
        return right;
      }
      auto result = ApplyBinary(op, *left, *right);
      if (!result || !result->IsUndefined()) {
        return result;
      }
      break;
    }

    return Value::MakeText(std::move(text));
  }

  static auto ApplyBuiltin(const std::string& name, const Value& argument)
      -> Value {
    if (name == "len") {
      if (argument.IsList()) {
        return Value::MakeNumber(
            static_cast<double>(argument.AsList().size()));
      }
      return Value::MakeNumber(static_cast<double>(Str(argument).size()));
    }
    double total = 0;
    if (argument.IsList()) {
      for (const Value& element : argument.AsList()) {
        double number = AsNumber(element);
        total += std::isnan(number) ? 0 : number;
      }
    }
    return Value::MakeNumber(total);
  }

  // Undefined when the operands do not support `op`.
  static auto ApplyBinary(char op, const Value& left, const Value& right)
      -> Result<Value> {
    if (op == '+') {
      if (left.IsText() && right.IsText()) {
        return Value::MakeText(left.AsText() + right.AsText());
      }
      if (left.IsList() && right.IsList()) {
        Value::List joined = left.AsList();
        joined.insert(
            joined.end(), right.AsList().begin(), right.AsList().end());
        return Value::MakeList(std::move(joined));
      }
    }
    if (!left.IsNumber() || !right.IsNumber()) {
      return Value();
    }
    double a = left.AsNumber();
    double b = right.AsNumber();
    switch (op) {
      case '+':
        return Value::MakeNumber(a + b);
      case '-':
        return Value::MakeNumber(a - b);
      case '*':
        return Value::MakeNumber(a * b);
      case '/':
        if (b == 0) {
          return std::unexpected(Diagnostic::Error({}, "division by zero"));
        }
        return Value::MakeNumber(a / b);
      default:
        return Value();
    }
  }

  auto CallFunction(std::string_view arguments, const Variables& caller)
      -> Result<Value> {
    if (call_depth_ >= kMaxCallDepth) {
      return std::unexpected(
          Diagnostic::Error({}, "maximum recursion depth exceeded"));
    }
    Variables locals = globals_;
    std::vector<std::string> values;
    if (!common::Trim(arguments).empty()) {
      values = SplitTopLevel(arguments, ',');
    }
    for (size_t i = 0; i < function_->params.size(); ++i) {
      Value bound;
      if (i < values.size()) {
        auto value = Evaluate(values[i], caller);
        if (!value) {
          return value;
        }
        bound = *std::move(value);
      }
      locals[function_->params[i]] = std::move(bound);
    }
    std::string body = function_->body;
    ++call_depth_;
    auto result = Evaluate(body, locals);
    --call_depth_;
    return result;
  }

  static constexpr size_t kMaxCallDepth = 100;

  std::vector<std::string> stdin_lines_;
  size_t next_input_ = 0;
  size_t call_depth_ = 0;
  Variables globals_;
  std::optional<Function> function_;
  std::string output_;
};

}  // namespace

auto RunOfflinePython(std::string_view code, std::string_view stdin_text)
    -> Result<std::string> {
  Approximation approximation(stdin_text);
  return approximation.Execute(code);
}

}  // namespace proba::remote
