#pragma once

#include <string>
#include <string_view>

namespace proba {

// Shortest round-trip rendering with JavaScript Number#toString rules:
// integers without a fraction, exponent form below 1e-6 and from 1e21,
// "NaN", "Infinity", and -0 rendered as "0".
auto FormatNumber(double value) -> std::string;

// JavaScript Number(text) coercion: surrounding whitespace ignored, empty
// text is 0, 0x/0o/0b prefixes, signed Infinity; anything else is NaN.
auto CoerceToNumber(std::string_view text) -> double;

// Digits in `text` form a complete decimal literal (no prefixes, no
// Infinity); used where a looser coercion would over-match.
auto IsDecimalLiteral(std::string_view text) -> bool;

}  // namespace proba
