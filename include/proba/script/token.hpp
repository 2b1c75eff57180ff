#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "proba/common/diagnostic.hpp"

namespace proba::script {

enum class TokenKind : uint8_t {
  kEof,
  kNumber,
  kString,
  kTemplate,
  kIdentifier,
  kKeyword,
  kPunctuator,
};

// One `${...}` hole of a template literal, kept as source text and parsed
// by a nested parser.
struct TemplateHole {
  std::string source;
  SourcePosition position;
};

struct Token {
  TokenKind kind = TokenKind::kEof;
  // Identifier/keyword/punctuator spelling, or the cooked string value.
  std::string text;
  double number = 0;
  SourcePosition position;
  // A line terminator precedes this token (drives semicolon insertion).
  bool newline_before = false;

  // Template literals: cooked chunks around the holes (chunks.size() ==
  // holes.size() + 1).
  std::vector<std::string> chunks;
  std::vector<TemplateHole> holes;

  [[nodiscard]] auto Is(TokenKind k, std::string_view spelling) const -> bool {
    return kind == k && text == spelling;
  }
  [[nodiscard]] auto IsPunct(std::string_view spelling) const -> bool {
    return Is(TokenKind::kPunctuator, spelling);
  }
  [[nodiscard]] auto IsKeyword(std::string_view spelling) const -> bool {
    return Is(TokenKind::kKeyword, spelling);
  }
};

auto IsKeyword(std::string_view word) -> bool;

}  // namespace proba::script
