#include "proba/common/string_utils.hpp"

#include <cctype>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace proba::common {

auto TrimStart(std::string_view s) -> std::string_view {
  size_t begin = 0;
  while (begin < s.size() && IsSpace(s[begin])) {
    ++begin;
  }
  return s.substr(begin);
}

auto TrimEnd(std::string_view s) -> std::string_view {
  size_t end = s.size();
  while (end > 0 && IsSpace(s[end - 1])) {
    --end;
  }
  return s.substr(0, end);
}

auto Trim(std::string_view s) -> std::string_view {
  return TrimEnd(TrimStart(s));
}

auto SplitLines(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    start = end + 1;
  }
  return lines;
}

auto Split(std::string_view text, std::string_view delimiter)
    -> std::vector<std::string> {
  std::vector<std::string> parts;
  if (delimiter.empty()) {
    parts.emplace_back(text);
    return parts;
  }
  size_t start = 0;
  while (true) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      break;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + delimiter.size();
  }
  return parts;
}

auto Join(const std::vector<std::string>& parts, std::string_view separator)
    -> std::string {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      result += separator;
    }
    result += parts[i];
  }
  return result;
}

auto ToLower(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

auto IsIdentifier(std::string_view s) -> bool {
  if (s.empty()) {
    return false;
  }
  auto is_start = [](char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '$';
  };
  if (!is_start(s[0])) {
    return false;
  }
  for (char c : s.substr(1)) {
    if (!is_start(c) && std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

auto EscapeForQuotedString(std::string_view s, char quote) -> std::string {
  std::string result;
  result.reserve(s.size() + (s.size() / 10));
  for (char c : s) {
    switch (c) {
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c == quote) {
          result += '\\';
          result += c;
        } else if (static_cast<unsigned char>(c) < 0x20) {
          result += std::format("\\x{:02x}", static_cast<unsigned>(c));
        } else {
          result += c;
        }
        break;
    }
  }
  return result;
}

auto SplitUtf8(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> chars;
  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    size_t width = 1;
    if ((lead & 0xE0) == 0xC0) {
      width = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      width = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      width = 4;
    }
    if (i + width > text.size()) {
      width = 1;
    }
    chars.emplace_back(text.substr(i, width));
    i += width;
  }
  return chars;
}

}  // namespace proba::common
