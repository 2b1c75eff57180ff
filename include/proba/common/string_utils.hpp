#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace proba::common {

// Whitespace as trimmed by String.prototype.trim (ASCII subset).
inline auto IsSpace(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

auto TrimStart(std::string_view s) -> std::string_view;
auto TrimEnd(std::string_view s) -> std::string_view;
auto Trim(std::string_view s) -> std::string_view;

// Split on '\n'; a trailing '\r' is dropped from every line.
auto SplitLines(std::string_view text) -> std::vector<std::string>;

// Split on every occurrence of `delimiter` (no trimming, keeps empties).
auto Split(std::string_view text, std::string_view delimiter)
    -> std::vector<std::string>;

auto Join(const std::vector<std::string>& parts, std::string_view separator)
    -> std::string;

auto ToLower(std::string_view s) -> std::string;

// [A-Za-z_$][A-Za-z0-9_$]*
auto IsIdentifier(std::string_view s) -> bool;

// One string per UTF-8 encoded code point; stray bytes stand alone.
auto SplitUtf8(std::string_view text) -> std::vector<std::string>;

// Escape for a single- or double-quoted JavaScript / Python string literal.
auto EscapeForQuotedString(std::string_view s, char quote) -> std::string;

}  // namespace proba::common
