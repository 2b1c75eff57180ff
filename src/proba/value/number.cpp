#include "proba/value/number.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

#include "proba/common/string_utils.hpp"

namespace proba {

namespace {

auto IsDigit(char c) -> bool {
  return c >= '0' && c <= '9';
}

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

auto ParseRadixInteger(std::string_view digits, int radix) -> double {
  if (digits.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  double result = 0;
  for (char c : digits) {
    int d = DigitValue(c);
    if (d >= radix) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    result = (result * radix) + d;
  }
  return result;
}

}  // namespace

auto FormatNumber(double value) -> std::string {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "Infinity" : "-Infinity";
  }
  if (value == 0) {
    return "0";
  }

  std::array<char, 64> buffer{};
  auto [end, ec] = std::to_chars(
      buffer.data(), buffer.data() + buffer.size(), std::fabs(value),
      std::chars_format::scientific);
  if (ec != std::errc{}) {
    return "NaN";
  }
  std::string_view sci(buffer.data(), end);

  // sci is "d[.ddd]e[+-]xx"; collect the significant digits and exponent.
  size_t e_pos = sci.find('e');
  std::string digits;
  for (char c : sci.substr(0, e_pos)) {
    if (c != '.') {
      digits += c;
    }
  }
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }
  int exponent = 0;
  std::string_view exp_text = sci.substr(e_pos + 1);
  if (!exp_text.empty() && exp_text[0] == '+') {
    exp_text.remove_prefix(1);
  }
  std::from_chars(
      exp_text.data(), exp_text.data() + exp_text.size(), exponent);

  auto k = static_cast<int>(digits.size());
  int n = exponent + 1;
  std::string result = value < 0 ? "-" : "";

  if (k <= n && n <= 21) {
    result += digits;
    result.append(static_cast<size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    result += digits.substr(0, static_cast<size_t>(n));
    result += '.';
    result += digits.substr(static_cast<size_t>(n));
  } else if (-6 < n && n <= 0) {
    result += "0.";
    result.append(static_cast<size_t>(-n), '0');
    result += digits;
  } else {
    result += digits[0];
    if (k > 1) {
      result += '.';
      result += digits.substr(1);
    }
    result += 'e';
    result += (n - 1) < 0 ? '-' : '+';
    result += std::to_string(std::abs(n - 1));
  }
  return result;
}

auto IsDecimalLiteral(std::string_view text) -> bool {
  size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  size_t int_digits = 0;
  while (i < text.size() && IsDigit(text[i])) {
    ++i;
    ++int_digits;
  }
  size_t frac_digits = 0;
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && IsDigit(text[i])) {
      ++i;
      ++frac_digits;
    }
  }
  if (int_digits == 0 && frac_digits == 0) {
    return false;
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    size_t exp_digits = 0;
    while (i < text.size() && IsDigit(text[i])) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) {
      return false;
    }
  }
  return i == text.size();
}

auto CoerceToNumber(std::string_view text) -> double {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  constexpr double kInf = std::numeric_limits<double>::infinity();

  std::string_view trimmed = common::Trim(text);
  if (trimmed.empty()) {
    return 0;
  }
  if (trimmed == "Infinity" || trimmed == "+Infinity") {
    return kInf;
  }
  if (trimmed == "-Infinity") {
    return -kInf;
  }
  if (trimmed.size() > 2 && trimmed[0] == '0') {
    switch (trimmed[1]) {
      case 'x':
      case 'X':
        return ParseRadixInteger(trimmed.substr(2), 16);
      case 'o':
      case 'O':
        return ParseRadixInteger(trimmed.substr(2), 8);
      case 'b':
      case 'B':
        return ParseRadixInteger(trimmed.substr(2), 2);
      default:
        break;
    }
  }
  if (!IsDecimalLiteral(trimmed)) {
    return kNaN;
  }

  bool negative = trimmed[0] == '-';
  if (trimmed[0] == '+' || trimmed[0] == '-') {
    trimmed.remove_prefix(1);
  }
  double result = 0;
  auto [ptr, ec] = std::from_chars(
      trimmed.data(), trimmed.data() + trimmed.size(), result);
  if (ec == std::errc::result_out_of_range) {
    // Overflow saturates; underflow is zero.
    bool tiny = trimmed.find("e-") != std::string_view::npos ||
                trimmed.find("E-") != std::string_view::npos;
    result = tiny ? 0.0 : kInf;
  } else if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
    return kNaN;
  }
  return negative ? -result : result;
}

}  // namespace proba
