#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <format>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "builtins.hpp"
#include "proba/common/string_utils.hpp"
#include "proba/script/interpreter.hpp"
#include "proba/script/runtime_value.hpp"
#include "proba/value/number.hpp"

namespace proba::script::builtins {

namespace {

using Args = std::span<const RuntimeValue>;
using MethodTable = std::unordered_map<std::string_view, NativeFunction>;

auto ThisString(
    Interpreter& interp, const RuntimeValue& self, std::string_view method)
    -> std::string {
  if (IsNullish(self)) {
    interp.ThrowError(
        ErrorKind::kTypeError,
        std::format(
            "String.prototype.{} called on null or undefined", method));
  }
  return ToString(self);
}

auto ThisNumber(
    Interpreter& interp, const RuntimeValue& self, std::string_view method)
    -> double {
  const auto* number = std::get_if<double>(&self);
  if (number == nullptr) {
    interp.ThrowError(
        ErrorKind::kTypeError,
        std::format("Number.prototype.{} requires a number", method));
  }
  return *number;
}

auto ReplaceText(
    Interpreter& interp, const std::string& text, const RuntimeValue& pattern,
    const RuntimeValue& replacement, bool all) -> std::string {
  std::string needle = ToString(pattern);
  bool use_callback = IsCallable(replacement);
  std::string fixed = use_callback ? std::string() : ToString(replacement);

  std::string out;
  size_t from = 0;
  while (from <= text.size()) {
    size_t at = text.find(needle, from);
    if (at == std::string::npos) {
      break;
    }
    out.append(text, from, at - from);
    if (use_callback) {
      std::vector<RuntimeValue> call_args = {
          needle, static_cast<double>(at), text};
      out += ToString(interp.Call(replacement, Undefined{}, call_args));
    } else {
      out += fixed;
    }
    interp.CheckStringLength(out.size());
    from = at + needle.size();
    if (!all) {
      break;
    }
    if (needle.empty()) {
      // An empty pattern matches between every character.
      if (at < text.size()) {
        out += text[at];
      }
      from = at + 1;
    }
  }
  if (from < text.size()) {
    out.append(text, from);
  }
  interp.CheckStringLength(out.size());
  return out;
}

auto Pad(
    Interpreter& interp, const std::string& text, Args args, bool at_start)
    -> std::string {
  double target = ToNumber(Arg(args, 0));
  std::string filler =
      IsUndefined(Arg(args, 1)) ? std::string(" ") : ToString(args[1]);
  if (std::isnan(target) || target <= static_cast<double>(text.size()) ||
      filler.empty()) {
    return text;
  }
  interp.CheckStringLength(static_cast<size_t>(std::min(
      target, static_cast<double>(kMaxStringLength) + 1)));
  auto missing = static_cast<size_t>(target) - text.size();
  std::string padding;
  while (padding.size() < missing) {
    padding += filler;
  }
  padding.resize(missing);
  return at_start ? padding + text : text + padding;
}

auto BuildStringMethods() -> MethodTable {
  MethodTable table;

  table["charAt"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "charAt");
    double index = std::trunc(ToNumber(Arg(args, 0)));
    if (std::isnan(index)) {
      index = 0;
    }
    if (index < 0 || index >= static_cast<double>(text.size())) {
      return std::string();
    }
    return std::string(1, text[static_cast<size_t>(index)]);
  };
  auto code_at = [](Interpreter& interp, const RuntimeValue& self,
                    Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "charCodeAt");
    double index = std::trunc(ToNumber(Arg(args, 0)));
    if (std::isnan(index)) {
      index = 0;
    }
    if (index < 0 || index >= static_cast<double>(text.size())) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    return static_cast<double>(
        static_cast<unsigned char>(text[static_cast<size_t>(index)]));
  };
  table["charCodeAt"] = code_at;
  table["codePointAt"] = code_at;
  table["at"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    std::string text = ThisString(interp, self, "at");
    double index = std::trunc(ToNumber(Arg(args, 0)));
    if (std::isnan(index)) {
      index = 0;
    }
    auto length = static_cast<double>(text.size());
    if (index < 0) {
      index += length;
    }
    if (index < 0 || index >= length) {
      return Undefined{};
    }
    return std::string(1, text[static_cast<size_t>(index)]);
  };
  table["indexOf"] = [](Interpreter& interp, const RuntimeValue& self,
                        Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "indexOf");
    size_t from = ToRelativeIndex(Arg(args, 1), text.size(), 0);
    size_t at = text.find(ToString(Arg(args, 0)), from);
    return at == std::string::npos ? -1.0 : static_cast<double>(at);
  };
  table["lastIndexOf"] = [](Interpreter& interp, const RuntimeValue& self,
                            Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "lastIndexOf");
    size_t at = text.rfind(ToString(Arg(args, 0)));
    return at == std::string::npos ? -1.0 : static_cast<double>(at);
  };
  table["includes"] = [](Interpreter& interp, const RuntimeValue& self,
                         Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "includes");
    return text.find(ToString(Arg(args, 0))) != std::string::npos;
  };
  table["startsWith"] = [](Interpreter& interp, const RuntimeValue& self,
                           Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "startsWith");
    size_t from = ToRelativeIndex(Arg(args, 1), text.size(), 0);
    return std::string_view(text).substr(from).starts_with(
        ToString(Arg(args, 0)));
  };
  table["endsWith"] = [](Interpreter& interp, const RuntimeValue& self,
                         Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "endsWith");
    size_t end = ToRelativeIndex(Arg(args, 1), text.size(), text.size());
    return std::string_view(text).substr(0, end).ends_with(
        ToString(Arg(args, 0)));
  };
  table["slice"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    std::string text = ThisString(interp, self, "slice");
    size_t start = ToRelativeIndex(Arg(args, 0), text.size(), 0);
    size_t end = ToRelativeIndex(Arg(args, 1), text.size(), text.size());
    if (start >= end) {
      return std::string();
    }
    return text.substr(start, end - start);
  };
  table["substring"] = [](Interpreter& interp, const RuntimeValue& self,
                          Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "substring");
    auto clamp = [&](const RuntimeValue& value, size_t fallback) -> size_t {
      if (IsUndefined(value)) {
        return fallback;
      }
      double number = ToNumber(value);
      if (std::isnan(number) || number < 0) {
        return 0;
      }
      return static_cast<size_t>(
          std::min(number, static_cast<double>(text.size())));
    };
    size_t start = clamp(Arg(args, 0), 0);
    size_t end = clamp(Arg(args, 1), text.size());
    if (start > end) {
      std::swap(start, end);
    }
    return text.substr(start, end - start);
  };
  table["substr"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "substr");
    size_t start = ToRelativeIndex(Arg(args, 0), text.size(), 0);
    size_t count = text.size() - start;
    if (!IsUndefined(Arg(args, 1))) {
      double requested = ToNumber(args[1]);
      if (std::isnan(requested) || requested < 0) {
        requested = 0;
      }
      count = static_cast<size_t>(
          std::min(std::trunc(requested), static_cast<double>(count)));
    }
    return text.substr(start, count);
  };
  table["toUpperCase"] = [](Interpreter& interp, const RuntimeValue& self,
                            Args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "toUpperCase");
    std::ranges::transform(text, text.begin(), [](char c) {
      return c >= 'a' && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c;
    });
    return text;
  };
  table["toLowerCase"] = [](Interpreter& interp, const RuntimeValue& self,
                            Args) -> RuntimeValue {
    return common::ToLower(ThisString(interp, self, "toLowerCase"));
  };
  table["trim"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    return std::string(common::Trim(ThisString(interp, self, "trim")));
  };
  table["trimStart"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    return std::string(
        common::TrimStart(ThisString(interp, self, "trimStart")));
  };
  table["trimEnd"] = [](Interpreter& interp, const RuntimeValue& self, Args)
      -> RuntimeValue {
    return std::string(common::TrimEnd(ThisString(interp, self, "trimEnd")));
  };
  table["split"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    std::string text = ThisString(interp, self, "split");
    size_t limit = kMaxArrayLength;
    if (!IsUndefined(Arg(args, 1))) {
      limit = ToUint32(ToNumber(args[1]));
    }
    std::vector<RuntimeValue> parts;
    if (IsUndefined(Arg(args, 0))) {
      parts.emplace_back(text);
    } else {
      std::string separator = ToString(args[0]);
      std::vector<std::string> pieces =
          separator.empty() ? common::SplitUtf8(text)
                            : common::Split(text, separator);
      for (auto& piece : pieces) {
        parts.emplace_back(std::move(piece));
      }
    }
    if (parts.size() > limit) {
      parts.resize(limit);
    }
    return interp.NewArray(std::move(parts));
  };
  table["replace"] = [](Interpreter& interp, const RuntimeValue& self,
                        Args args) -> RuntimeValue {
    return ReplaceText(
        interp, ThisString(interp, self, "replace"), Arg(args, 0),
        Arg(args, 1), false);
  };
  table["replaceAll"] = [](Interpreter& interp, const RuntimeValue& self,
                           Args args) -> RuntimeValue {
    return ReplaceText(
        interp, ThisString(interp, self, "replaceAll"), Arg(args, 0),
        Arg(args, 1), true);
  };
  table["repeat"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "repeat");
    double count = ToNumber(Arg(args, 0));
    if (std::isnan(count)) {
      count = 0;
    }
    if (count < 0 || std::isinf(count)) {
      interp.ThrowError(
          ErrorKind::kRangeError,
          std::format("Invalid count value: {}", FormatNumber(count)));
    }
    if (text.empty()) {
      return std::string();
    }
    if (std::trunc(count) >
        static_cast<double>(kMaxStringLength / text.size())) {
      interp.ThrowError(ErrorKind::kRangeError, "Invalid string length");
    }
    auto times = static_cast<size_t>(count);
    std::string out;
    out.reserve(text.size() * times);
    for (size_t i = 0; i < times; ++i) {
      out += text;
    }
    return out;
  };
  table["padStart"] = [](Interpreter& interp, const RuntimeValue& self,
                         Args args) -> RuntimeValue {
    return Pad(interp, ThisString(interp, self, "padStart"), args, true);
  };
  table["padEnd"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    return Pad(interp, ThisString(interp, self, "padEnd"), args, false);
  };
  table["concat"] = [](Interpreter& interp, const RuntimeValue& self,
                       Args args) -> RuntimeValue {
    std::string text = ThisString(interp, self, "concat");
    for (const auto& arg : args) {
      text += ToString(arg);
      interp.CheckStringLength(text.size());
    }
    return text;
  };
  table["localeCompare"] = [](Interpreter& interp, const RuntimeValue& self,
                              Args args) -> RuntimeValue {
    int order = ThisString(interp, self, "localeCompare")
                    .compare(ToString(Arg(args, 0)));
    return order < 0 ? -1.0 : (order > 0 ? 1.0 : 0.0);
  };

  return table;
}

auto NumberToRadix(double value, int radix) -> std::string {
  static constexpr std::string_view kDigits =
      "0123456789abcdefghijklmnopqrstuvwxyz";
  if (!std::isfinite(value)) {
    return FormatNumber(value);
  }
  bool negative = value < 0;
  double magnitude = std::fabs(value);
  double integer = std::floor(magnitude);
  double fraction = magnitude - integer;

  std::string digits;
  do {
    double digit = std::fmod(integer, radix);
    digits += kDigits[static_cast<size_t>(digit)];
    integer = std::floor(integer / radix);
  } while (integer > 0);
  std::ranges::reverse(digits);

  if (fraction > 0) {
    digits += '.';
    for (int i = 0; i < 52 && fraction > 0; ++i) {
      fraction *= radix;
      double digit = std::floor(fraction);
      digits += kDigits[static_cast<size_t>(digit)];
      fraction -= digit;
    }
  }
  return negative ? "-" + digits : digits;
}

auto BuildNumberMethods() -> MethodTable {
  MethodTable table;

  table["toFixed"] = [](Interpreter& interp, const RuntimeValue& self,
                        Args args) -> RuntimeValue {
    double value = ThisNumber(interp, self, "toFixed");
    double digits = IsUndefined(Arg(args, 0)) ? 0 : ToNumber(args[0]);
    if (std::isnan(digits)) {
      digits = 0;
    }
    if (digits < 0 || digits > 100) {
      interp.ThrowError(
          ErrorKind::kRangeError,
          "toFixed() digits argument must be between 0 and 100");
    }
    if (!std::isfinite(value) || std::fabs(value) >= 1e21) {
      return FormatNumber(value);
    }
    std::string out =
        std::format("{:.{}f}", value, static_cast<int>(digits));
    if (out.starts_with('-') &&
        out.find_first_not_of("0.", 1) == std::string::npos) {
      out.erase(0, 1);
    }
    return out;
  };
  table["toString"] = [](Interpreter& interp, const RuntimeValue& self,
                         Args args) -> RuntimeValue {
    double value = ThisNumber(interp, self, "toString");
    if (IsUndefined(Arg(args, 0))) {
      return FormatNumber(value);
    }
    double radix = ToNumber(args[0]);
    if (std::isnan(radix) || radix < 2 || radix > 36) {
      interp.ThrowError(
          ErrorKind::kRangeError, "toString() radix must be between 2 and 36");
    }
    if (radix == 10) {
      return FormatNumber(value);
    }
    return NumberToRadix(value, static_cast<int>(radix));
  };
  table["toPrecision"] = [](Interpreter& interp, const RuntimeValue& self,
                            Args args) -> RuntimeValue {
    double value = ThisNumber(interp, self, "toPrecision");
    if (IsUndefined(Arg(args, 0)) || !std::isfinite(value)) {
      return FormatNumber(value);
    }
    double precision = ToNumber(args[0]);
    if (std::isnan(precision) || precision < 1 || precision > 100) {
      interp.ThrowError(
          ErrorKind::kRangeError,
          "toPrecision() argument must be between 1 and 100");
    }
    auto digits = static_cast<int>(precision);
    int exponent = value == 0
                       ? 0
                       : static_cast<int>(std::floor(std::log10(std::fabs(value))));
    if (exponent < -6 || exponent >= digits) {
      std::string out = std::format("{:.{}e}", value, digits - 1);
      // C++ prints e+05; JavaScript prints e+5.
      size_t e = out.find('e');
      std::string mantissa = out.substr(0, e);
      int power = std::stoi(out.substr(e + 1));
      return std::format(
          "{}e{}{}", mantissa, power < 0 ? "-" : "+", std::abs(power));
    }
    return std::format("{:.{}f}", value, std::max(0, digits - 1 - exponent));
  };

  return table;
}

auto BuildFunctionMethods() -> MethodTable {
  MethodTable table;

  table["call"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    RequireCallable(interp, self);
    return interp.Call(
        self, Arg(args, 0), args.empty() ? args : args.subspan(1));
  };
  table["apply"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    RequireCallable(interp, self);
    std::vector<RuntimeValue> call_args;
    if (!IsNullish(Arg(args, 1))) {
      call_args = interp.Iterate(args[1], "argument list");
    }
    return interp.Call(self, Arg(args, 0), call_args);
  };
  table["bind"] = [](Interpreter& interp, const RuntimeValue& self, Args args)
      -> RuntimeValue {
    RequireCallable(interp, self);
    RuntimeValue target = self;
    RuntimeValue bound_this = Arg(args, 0);
    std::vector<RuntimeValue> bound_args;
    if (args.size() > 1) {
      bound_args.assign(args.begin() + 1, args.end());
    }
    std::string name = std::format("bound {}", AsObject(self)->name);
    return interp.GetHeap().NewNative(
        std::move(name),
        [target, bound_this, bound_args](
            Interpreter& interp, const RuntimeValue&,
            Args call_args) -> RuntimeValue {
          std::vector<RuntimeValue> all = bound_args;
          all.insert(all.end(), call_args.begin(), call_args.end());
          return interp.Call(target, bound_this, all);
        });
  };
  table["toString"] = [](Interpreter&, const RuntimeValue& self, Args)
      -> RuntimeValue { return ToString(self); };

  return table;
}

auto BuildObjectMethods() -> MethodTable {
  MethodTable table;

  table["hasOwnProperty"] = [](Interpreter& interp, const RuntimeValue& self,
                               Args args) -> RuntimeValue {
    std::string key = ToString(Arg(args, 0));
    if (IsNullish(self)) {
      interp.ThrowError(
          ErrorKind::kTypeError, "Cannot convert undefined or null to object");
    }
    if (const auto* text = std::get_if<std::string>(&self)) {
      if (key == "length") {
        return true;
      }
      auto index = ParseArrayIndex(key);
      return index && *index < text->size();
    }
    Object* object = AsObject(self);
    if (object == nullptr) {
      return false;
    }
    if (object->IsArray()) {
      if (key == "length") {
        return true;
      }
      if (auto index = ParseArrayIndex(key)) {
        return *index < object->elements.size();
      }
    }
    return object->properties.Contains(key);
  };
  table["toString"] = [](Interpreter&, const RuntimeValue& self, Args)
      -> RuntimeValue {
    if (Object* object = AsObject(self);
        object != nullptr && object->IsError()) {
      return DescribeError(*object);
    }
    return ToString(self);
  };
  table["valueOf"] = [](Interpreter&, const RuntimeValue& self, Args)
      -> RuntimeValue { return self; };

  return table;
}

auto Lookup(const MethodTable& table, std::string_view name)
    -> const NativeFunction* {
  auto it = table.find(name);
  return it == table.end() ? nullptr : &it->second;
}

}  // namespace

auto FindStringMethod(std::string_view name) -> const NativeFunction* {
  static const MethodTable kMethods = BuildStringMethods();
  return Lookup(kMethods, name);
}

auto FindNumberMethod(std::string_view name) -> const NativeFunction* {
  static const MethodTable kMethods = BuildNumberMethods();
  return Lookup(kMethods, name);
}

auto FindFunctionMethod(std::string_view name) -> const NativeFunction* {
  static const MethodTable kMethods = BuildFunctionMethods();
  return Lookup(kMethods, name);
}

auto FindObjectMethod(std::string_view name) -> const NativeFunction* {
  static const MethodTable kMethods = BuildObjectMethods();
  return Lookup(kMethods, name);
}

}  // namespace proba::script::builtins
