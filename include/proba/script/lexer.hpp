#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/script/token.hpp"

namespace proba::script {

class Lexer {
 public:
  // `origin` is the position of source[0] (template holes are re-lexed
  // from inside a larger snippet).
  explicit Lexer(std::string_view source, SourcePosition origin = {});

  // Throws script::SyntaxError on malformed input.
  auto Tokenize() -> std::vector<Token>;

 private:
  [[nodiscard]] auto Peek(size_t ahead = 0) const -> char;
  [[nodiscard]] auto IsAtEnd() const -> bool;
  auto Advance() -> char;
  [[nodiscard]] auto Position() const -> SourcePosition;

  // Returns true if a line terminator was skipped.
  auto SkipTrivia() -> bool;
  auto NextToken() -> Token;
  auto NumberToken() -> Token;
  auto IdentifierToken() -> Token;
  auto StringToken(char quote) -> Token;
  auto TemplateToken() -> Token;
  auto PunctuatorToken() -> Token;

  // Reads one escape sequence after the backslash, appending UTF-8.
  void ReadEscape(std::string& out);
  // Source text of a `${...}` hole; the opening `${` is consumed.
  auto ReadHoleSource() -> std::string;

  std::string_view source_;
  size_t index_ = 0;
  uint32_t line_;
  uint32_t column_;
};

}  // namespace proba::script
