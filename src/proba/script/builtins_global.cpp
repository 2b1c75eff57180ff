#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <numbers>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "builtins.hpp"
#include "proba/common/string_utils.hpp"
#include "proba/script/console.hpp"
#include "proba/script/interpreter.hpp"
#include "proba/script/runtime_value.hpp"
#include "proba/script/scope.hpp"
#include "proba/value/json.hpp"
#include "proba/value/number.hpp"
#include "proba/value/value.hpp"

namespace proba::script::builtins {

namespace {

using Args = std::span<const RuntimeValue>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInfinity = std::numeric_limits<double>::infinity();

// Host capabilities that must look absent from inside a script.
constexpr std::string_view kDisabledNames[] = {
    "window", "document", "global", "globalThis", "process", "require",
    "module", "exports", "fetch", "XMLHttpRequest", "WebSocket", "localStorage",
    "sessionStorage", "indexedDB", "FileReader", "File", "Blob", "URL",
    "Worker", "SharedWorker", "ServiceWorker", "eval", "Function", "setTimeout",
    "setInterval", "clearTimeout", "clearInterval",
};

auto DigitValue(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'z') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'Z') {
    return c - 'A' + 10;
  }
  return 99;
}

auto ParseInt(std::string_view text, int radix) -> double {
  text = common::TrimStart(text);
  double sign = 1;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    sign = text.front() == '-' ? -1 : 1;
    text.remove_prefix(1);
  }
  bool has_hex_prefix = text.size() >= 2 && text[0] == '0' &&
                        (text[1] == 'x' || text[1] == 'X');
  if (radix == 0) {
    radix = has_hex_prefix ? 16 : 10;
  }
  if (radix == 16 && has_hex_prefix) {
    text.remove_prefix(2);
  }
  if (radix < 2 || radix > 36) {
    return kNaN;
  }
  double result = 0;
  size_t digits = 0;
  for (char c : text) {
    int digit = DigitValue(c);
    if (digit >= radix) {
      break;
    }
    result = result * radix + digit;
    ++digits;
  }
  if (digits == 0) {
    return kNaN;
  }
  return sign * result;
}

auto ParseFloat(std::string_view text) -> double {
  text = common::TrimStart(text);
  size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  if (text.substr(i).starts_with("Infinity")) {
    return text[0] == '-' ? -kInfinity : kInfinity;
  }
  size_t mantissa_start = i;
  while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
    ++i;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
      ++i;
    }
  }
  if (i == mantissa_start || (i == mantissa_start + 1 &&
                              text[mantissa_start] == '.')) {
    return kNaN;
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    size_t j = i + 1;
    if (j < text.size() && (text[j] == '+' || text[j] == '-')) {
      ++j;
    }
    size_t exponent_start = j;
    while (j < text.size() && text[j] >= '0' && text[j] <= '9') {
      ++j;
    }
    if (j > exponent_start) {
      i = j;
    }
  }
  std::string_view literal = text.substr(0, i);
  if (literal.front() == '+') {
    literal.remove_prefix(1);
  }
  double value = 0;
  auto [ptr, ec] = std::from_chars(
      literal.data(), literal.data() + literal.size(), value);
  if (ec == std::errc::result_out_of_range) {
    return literal.front() == '-' ? -kInfinity : kInfinity;
  }
  if (ec != std::errc{}) {
    return kNaN;
  }
  return value;
}

void AppendUtf8(std::string& out, uint32_t code_point) {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

auto RequireObjectCoercible(Interpreter& interp, const RuntimeValue& value)
    -> const RuntimeValue& {
  if (IsNullish(value)) {
    interp.ThrowError(
        ErrorKind::kTypeError, "Cannot convert undefined or null to object");
  }
  return value;
}

void InstallConsole(Interpreter& interp, Scope& globals) {
  ObjectRef console = interp.NewObject();
  for (LogLevel level :
       {LogLevel::kLog, LogLevel::kError, LogLevel::kWarn, LogLevel::kInfo}) {
    DefineMethod(
        interp, *console, LogLevelName(level),
        [level](Interpreter& interp, const RuntimeValue&, Args args) {
          std::vector<std::string> parts;
          parts.reserve(args.size());
          for (const auto& arg : args) {
            parts.push_back(interp.Render(arg));
          }
          interp.Console().Append(level, common::Join(parts, " "));
          return RuntimeValue(Undefined{});
        });
  }
  globals.Declare("console", console, DeclarationKind::kConst);
}

void InstallMath(Interpreter& interp, Scope& globals) {
  ObjectRef math = interp.NewObject();
  auto unary = [&](std::string_view name, double (*fn)(double)) {
    DefineMethod(
        interp, *math, name,
        [fn](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
          return fn(ToNumber(Arg(args, 0)));
        });
  };
  unary("abs", [](double x) { return std::fabs(x); });
  unary("floor", [](double x) { return std::floor(x); });
  unary("ceil", [](double x) { return std::ceil(x); });
  unary("round", [](double x) {
    if (!std::isfinite(x)) {
      return x;
    }
    return std::floor(x + 0.5);
  });
  unary("trunc", [](double x) { return std::trunc(x); });
  unary("sign", [](double x) {
    if (std::isnan(x) || x == 0) {
      return x;
    }
    return x > 0 ? 1.0 : -1.0;
  });
  unary("sqrt", [](double x) { return std::sqrt(x); });
  unary("cbrt", [](double x) { return std::cbrt(x); });
  unary("exp", [](double x) { return std::exp(x); });
  unary("log", [](double x) { return std::log(x); });
  unary("log2", [](double x) { return std::log2(x); });
  unary("log10", [](double x) { return std::log10(x); });
  unary("sin", [](double x) { return std::sin(x); });
  unary("cos", [](double x) { return std::cos(x); });
  unary("tan", [](double x) { return std::tan(x); });
  unary("asin", [](double x) { return std::asin(x); });
  unary("acos", [](double x) { return std::acos(x); });
  unary("atan", [](double x) { return std::atan(x); });

  DefineMethod(
      interp, *math, "atan2",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        return std::atan2(ToNumber(Arg(args, 0)), ToNumber(Arg(args, 1)));
      });
  DefineMethod(
      interp, *math, "pow",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        double base = ToNumber(Arg(args, 0));
        double exponent = ToNumber(Arg(args, 1));
        if (std::isnan(exponent) ||
            (std::isinf(exponent) && std::fabs(base) == 1)) {
          return kNaN;
        }
        return std::pow(base, exponent);
      });
  DefineMethod(
      interp, *math, "hypot",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        double sum = 0;
        for (const auto& arg : args) {
          double x = ToNumber(arg);
          sum += x * x;
        }
        return std::sqrt(sum);
      });
  DefineMethod(
      interp, *math, "max",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        double best = -kInfinity;
        for (const auto& arg : args) {
          double x = ToNumber(arg);
          if (std::isnan(x)) {
            return kNaN;
          }
          best = std::max(best, x);
        }
        return best;
      });
  DefineMethod(
      interp, *math, "min",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        double best = kInfinity;
        for (const auto& arg : args) {
          double x = ToNumber(arg);
          if (std::isnan(x)) {
            return kNaN;
          }
          best = std::min(best, x);
        }
        return best;
      });
  DefineMethod(
      interp, *math, "random",
      [](Interpreter& interp, const RuntimeValue&, Args) -> RuntimeValue {
        return interp.Random();
      });

  math->properties.Set("PI", std::numbers::pi);
  math->properties.Set("E", std::numbers::e);
  math->properties.Set("LN2", std::numbers::ln2);
  math->properties.Set("LN10", std::numbers::ln10);
  math->properties.Set("LOG2E", std::numbers::log2e);
  math->properties.Set("LOG10E", std::numbers::log10e);
  math->properties.Set("SQRT2", std::numbers::sqrt2);
  math->properties.Set("SQRT1_2", std::numbers::sqrt2 / 2);
  math->frozen = true;
  globals.Declare("Math", math, DeclarationKind::kConst);
}

void InstallJson(Interpreter& interp, Scope& globals) {
  ObjectRef json = interp.NewObject();
  DefineMethod(
      interp, *json, "parse",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        std::string text = ToString(Arg(args, 0));
        std::optional<Value> parsed = ParseJson(text);
        if (!parsed) {
          interp.ThrowError(
              ErrorKind::kSyntaxError,
              std::format("\"{}\" is not valid JSON", text));
        }
        return interp.FromValue(*parsed);
      });
  DefineMethod(
      interp, *json, "stringify",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        Value value = interp.ToValue(Arg(args, 0));
        if (value.IsUndefined()) {
          return Undefined{};
        }
        int indent = 0;
        if (const auto* number = std::get_if<double>(&Arg(args, 2))) {
          indent = static_cast<int>(std::clamp(*number, 0.0, 10.0));
        }
        std::string text = Stringify(value, indent);
        interp.CheckStringLength(text.size());
        return text;
      });
  json->frozen = true;
  globals.Declare("JSON", json, DeclarationKind::kConst);
}

void InstallFunctions(Interpreter& interp, Scope& globals) {
  auto define = [&](std::string_view name, NativeFunction function) {
    globals.Declare(
        name, interp.GetHeap().NewNative(std::string(name), std::move(function)),
        DeclarationKind::kVar);
  };
  define(
      "parseInt",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        int radix = IsUndefined(Arg(args, 1)) ? 0 : ToInt32(ToNumber(Arg(args, 1)));
        return ParseInt(ToString(Arg(args, 0)), radix);
      });
  define(
      "parseFloat",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        return ParseFloat(ToString(Arg(args, 0)));
      });
  define(
      "isNaN",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        return std::isnan(ToNumber(Arg(args, 0)));
      });
  define(
      "isFinite",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        return std::isfinite(ToNumber(Arg(args, 0)));
      });
}

void InstallString(Interpreter& interp, Scope& globals) {
  ObjectRef string = interp.GetHeap().NewNative(
      "String",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        if (args.empty()) {
          return std::string();
        }
        if (Object* object = AsObject(args[0]);
            object != nullptr && object->IsError()) {
          return DescribeError(*object);
        }
        return ToString(args[0]);
      },
      true);
  DefineMethod(
      interp, *string, "fromCharCode",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        std::string out;
        for (const auto& arg : args) {
          AppendUtf8(out, ToUint32(ToNumber(arg)) & 0xFFFF);
        }
        return out;
      });
  DefineMethod(
      interp, *string, "fromCodePoint",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        std::string out;
        for (const auto& arg : args) {
          double code = ToNumber(arg);
          if (code < 0 || code > 0x10FFFF || code != std::floor(code)) {
            interp.ThrowError(
                ErrorKind::kRangeError,
                std::format("Invalid code point {}", ToString(arg)));
          }
          AppendUtf8(out, static_cast<uint32_t>(code));
        }
        return out;
      });
  globals.Declare("String", string, DeclarationKind::kVar);
}

void InstallNumber(Interpreter& interp, Scope& globals) {
  ObjectRef number = interp.GetHeap().NewNative(
      "Number",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        return args.empty() ? 0.0 : ToNumber(args[0]);
      },
      true);
  auto predicate = [&](std::string_view name, bool (*test)(double)) {
    DefineMethod(
        interp, *number, name,
        [test](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
          const auto* value = std::get_if<double>(&Arg(args, 0));
          return value != nullptr && test(*value);
        });
  };
  predicate("isNaN", [](double x) { return std::isnan(x); });
  predicate("isFinite", [](double x) { return std::isfinite(x); });
  predicate("isInteger", [](double x) {
    return std::isfinite(x) && x == std::trunc(x);
  });
  predicate("isSafeInteger", [](double x) {
    return std::isfinite(x) && x == std::trunc(x) &&
           std::fabs(x) <= 9007199254740991.0;
  });
  if (Binding* parse_int = globals.Find("parseInt")) {
    number->properties.Set("parseInt", parse_int->value);
  }
  if (Binding* parse_float = globals.Find("parseFloat")) {
    number->properties.Set("parseFloat", parse_float->value);
  }
  number->properties.Set("MAX_SAFE_INTEGER", 9007199254740991.0);
  number->properties.Set("MIN_SAFE_INTEGER", -9007199254740991.0);
  number->properties.Set("EPSILON", std::numeric_limits<double>::epsilon());
  number->properties.Set("MAX_VALUE", std::numeric_limits<double>::max());
  number->properties.Set("MIN_VALUE", std::numeric_limits<double>::denorm_min());
  number->properties.Set("POSITIVE_INFINITY", kInfinity);
  number->properties.Set("NEGATIVE_INFINITY", -kInfinity);
  number->properties.Set("NaN", kNaN);
  globals.Declare("Number", number, DeclarationKind::kVar);
}

void InstallBoolean(Interpreter& interp, Scope& globals) {
  globals.Declare(
      "Boolean",
      interp.GetHeap().NewNative(
          "Boolean",
          [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
            return ToBoolean(Arg(args, 0));
          },
          true),
      DeclarationKind::kVar);
}

void InstallArray(Interpreter& interp, Scope& globals) {
  ObjectRef array = interp.GetHeap().NewNative(
      "Array",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        if (args.size() == 1) {
          if (const auto* length = std::get_if<double>(&args[0])) {
            if (*length < 0 || *length != std::floor(*length) ||
                *length > static_cast<double>(kMaxArrayLength)) {
              interp.ThrowError(ErrorKind::kRangeError, "Invalid array length");
            }
            return interp.NewArray(std::vector<RuntimeValue>(
                static_cast<size_t>(*length), Undefined{}));
          }
        }
        return interp.NewArray(std::vector<RuntimeValue>(args.begin(), args.end()));
      },
      true);
  DefineMethod(
      interp, *array, "isArray",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        Object* object = AsObject(Arg(args, 0));
        return object != nullptr && object->IsArray();
      });
  DefineMethod(
      interp, *array, "of",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        return interp.NewArray(std::vector<RuntimeValue>(args.begin(), args.end()));
      });
  DefineMethod(
      interp, *array, "from",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        const RuntimeValue& source = RequireObjectCoercible(interp, Arg(args, 0));
        const RuntimeValue& map = Arg(args, 1);
        if (!IsUndefined(map)) {
          RequireCallable(interp, map);
        }

        std::vector<RuntimeValue> items;
        Object* object = AsObject(source);
        if (std::holds_alternative<std::string>(source) ||
            (object != nullptr && object->IsArray())) {
          items = interp.Iterate(source, "source");
        } else if (object != nullptr) {
          // Array-like: { length: n }
          double length = ToNumber(interp.GetProperty(source, "length"));
          if (std::isnan(length) || length < 0) {
            length = 0;
          }
          if (length > static_cast<double>(kMaxArrayLength)) {
            interp.ThrowError(ErrorKind::kRangeError, "Invalid array length");
          }
          for (size_t i = 0; i < static_cast<size_t>(length); ++i) {
            interp.Tick();
            items.push_back(interp.GetProperty(source, std::to_string(i)));
          }
        }

        if (!IsUndefined(map)) {
          for (size_t i = 0; i < items.size(); ++i) {
            std::vector<RuntimeValue> call_args = {
                items[i], static_cast<double>(i)};
            items[i] = interp.Call(map, Undefined{}, call_args);
          }
        }
        return interp.NewArray(std::move(items));
      });
  globals.Declare("Array", array, DeclarationKind::kVar);
}

void InstallObject(Interpreter& interp, Scope& globals) {
  ObjectRef object = interp.GetHeap().NewNative(
      "Object",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        if (AsObject(Arg(args, 0)) != nullptr) {
          return args[0];
        }
        return interp.NewObject();
      },
      true);
  DefineMethod(
      interp, *object, "keys",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        const RuntimeValue& target = RequireObjectCoercible(interp, Arg(args, 0));
        std::vector<RuntimeValue> keys;
        for (auto& key : interp.OwnKeys(target)) {
          keys.emplace_back(std::move(key));
        }
        return interp.NewArray(std::move(keys));
      });
  DefineMethod(
      interp, *object, "values",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        const RuntimeValue& target = RequireObjectCoercible(interp, Arg(args, 0));
        std::vector<RuntimeValue> values;
        for (const auto& key : interp.OwnKeys(target)) {
          values.push_back(interp.GetProperty(target, key));
        }
        return interp.NewArray(std::move(values));
      });
  DefineMethod(
      interp, *object, "entries",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        const RuntimeValue& target = RequireObjectCoercible(interp, Arg(args, 0));
        std::vector<RuntimeValue> entries;
        for (const auto& key : interp.OwnKeys(target)) {
          entries.emplace_back(interp.NewArray(
              {RuntimeValue(key), interp.GetProperty(target, key)}));
        }
        return interp.NewArray(std::move(entries));
      });
  DefineMethod(
      interp, *object, "assign",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        const RuntimeValue& target = RequireObjectCoercible(interp, Arg(args, 0));
        for (size_t i = 1; i < args.size(); ++i) {
          if (IsNullish(args[i])) {
            continue;
          }
          for (const auto& key : interp.OwnKeys(args[i])) {
            interp.SetProperty(target, key, interp.GetProperty(args[i], key));
          }
        }
        return target;
      });
  DefineMethod(
      interp, *object, "fromEntries",
      [](Interpreter& interp, const RuntimeValue&, Args args) -> RuntimeValue {
        ObjectRef result = interp.NewObject();
        for (const auto& entry : interp.Iterate(Arg(args, 0), "entries")) {
          RuntimeValue key = interp.GetIndexed(entry, 0.0);
          result->properties.Set(ToString(key), interp.GetIndexed(entry, 1.0));
        }
        return result;
      });
  DefineMethod(
      interp, *object, "freeze",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        if (Object* target = AsObject(Arg(args, 0))) {
          target->frozen = true;
        }
        return Arg(args, 0);
      });
  DefineMethod(
      interp, *object, "isFrozen",
      [](Interpreter&, const RuntimeValue&, Args args) -> RuntimeValue {
        Object* target = AsObject(Arg(args, 0));
        return target == nullptr || target->frozen;
      });
  globals.Declare("Object", object, DeclarationKind::kVar);
}

void InstallErrors(Interpreter& interp, Scope& globals) {
  for (ErrorKind kind :
       {ErrorKind::kError, ErrorKind::kTypeError, ErrorKind::kReferenceError,
        ErrorKind::kSyntaxError, ErrorKind::kRangeError}) {
    ObjectRef constructor = interp.GetHeap().NewNative(
        std::string(ErrorKindName(kind)),
        [kind](Interpreter& interp, const RuntimeValue&, Args args)
            -> RuntimeValue {
          const RuntimeValue& message = Arg(args, 0);
          return interp.GetHeap().NewError(
              kind, IsUndefined(message) ? std::string() : ToString(message));
        },
        true);
    constructor->error_kind = kind;
    globals.Declare(ErrorKindName(kind), constructor, DeclarationKind::kVar);
  }
}

}  // namespace

void DefineMethod(
    Interpreter& interp, Object& target, std::string_view name,
    NativeFunction function) {
  target.properties.Set(
      name, interp.GetHeap().NewNative(std::string(name), std::move(function)));
}

void RequireCallable(Interpreter& interp, const RuntimeValue& value) {
  if (!IsCallable(value)) {
    interp.ThrowError(
        ErrorKind::kTypeError,
        std::format("{} is not a function", ToString(value)));
  }
}

void InstallGlobals(Interpreter& interp, Scope& globals) {
  globals.Declare("NaN", kNaN, DeclarationKind::kConst);
  globals.Declare("Infinity", kInfinity, DeclarationKind::kConst);
  globals.Declare("undefined", Undefined{}, DeclarationKind::kConst);

  InstallConsole(interp, globals);
  InstallMath(interp, globals);
  InstallJson(interp, globals);
  InstallFunctions(interp, globals);
  InstallString(interp, globals);
  InstallNumber(interp, globals);
  InstallBoolean(interp, globals);
  InstallArray(interp, globals);
  InstallObject(interp, globals);
  InstallErrors(interp, globals);

  for (std::string_view name : kDisabledNames) {
    globals.Declare(name, Undefined{}, DeclarationKind::kVar);
  }
}

}  // namespace proba::script::builtins
