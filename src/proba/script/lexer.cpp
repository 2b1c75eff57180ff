#include "proba/script/lexer.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/script/errors.hpp"
#include "proba/script/token.hpp"
#include "proba/value/number.hpp"

namespace proba::script {

namespace {

// Longest first so the scan can take the first prefix match.
constexpr std::array<std::string_view, 52> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=",
    "??=",  "=>",  "==",  "!=",  "<=",  ">=",  "&&",  "||",  "??",  "?.",
    "++",   "--",  "+=",  "-=",  "*=",  "/=",  "%=",  "&=",  "|=",  "^=",
    "**",   "<<",  ">>",  "{",   "}",   "(",   ")",   "[",   "]",   ";",
    ",",    "<",   ">",   "+",   "-",   "*",   "/",   "%",   "&",   "|",
    "^",    "!",
};

constexpr std::array<std::string_view, 5> kSingleExtra = {
    "~", "?", ":", "=", "."};

auto IsIdentStart(char c) -> bool {
  auto u = static_cast<unsigned char>(c);
  return std::isalpha(u) != 0 || c == '_' || c == '$' || u >= 0x80;
}

auto IsIdentPart(char c) -> bool {
  return IsIdentStart(c) || std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto HexValue(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

void AppendUtf8(uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

}  // namespace

auto IsKeyword(std::string_view word) -> bool {
  static const std::unordered_set<std::string_view> kKeywords = {
      "var",      "let",    "const",    "function", "return", "if",
      "else",     "for",    "while",    "do",       "break",  "continue",
      "throw",    "try",    "catch",    "finally",  "new",    "typeof",
      "instanceof", "in",   "true",     "false",    "null",   "this",
      "switch",   "case",   "default",  "void",     "delete", "class",
      "yield",    "async",  "await",    "import",   "export", "with",
      "debugger", "super",  "extends",
  };
  return kKeywords.contains(word);
}

Lexer::Lexer(std::string_view source, SourcePosition origin)
    : source_(source), line_(origin.line), column_(origin.column) {
}

auto Lexer::Peek(size_t ahead) const -> char {
  if (index_ + ahead >= source_.size()) {
    return '\0';
  }
  return source_[index_ + ahead];
}

auto Lexer::IsAtEnd() const -> bool {
  return index_ >= source_.size();
}

auto Lexer::Advance() -> char {
  char c = Peek();
  ++index_;
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

auto Lexer::Position() const -> SourcePosition {
  return SourcePosition{.line = line_, .column = column_};
}

auto Lexer::Tokenize() -> std::vector<Token> {
  if (Peek() == '#' && Peek(1) == '!') {
    while (!IsAtEnd() && Peek() != '\n') {
      Advance();
    }
  }
  std::vector<Token> tokens;
  while (true) {
    bool newline = SkipTrivia();
    Token token = NextToken();
    token.newline_before = newline;
    bool done = token.kind == TokenKind::kEof;
    tokens.push_back(std::move(token));
    if (done) {
      break;
    }
  }
  return tokens;
}

auto Lexer::SkipTrivia() -> bool {
  bool newline = false;
  while (!IsAtEnd()) {
    char c = Peek();
    if (c == '\n') {
      newline = true;
      Advance();
    } else if (c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f') {
      Advance();
    } else if (c == '/' && Peek(1) == '/') {
      while (!IsAtEnd() && Peek() != '\n') {
        Advance();
      }
    } else if (c == '/' && Peek(1) == '*') {
      SourcePosition start = Position();
      Advance();
      Advance();
      while (!(Peek() == '*' && Peek(1) == '/')) {
        if (IsAtEnd()) {
          throw SyntaxError("Unterminated comment", start);
        }
        if (Advance() == '\n') {
          newline = true;
        }
      }
      Advance();
      Advance();
    } else if (static_cast<unsigned char>(c) == 0xC2 &&
               static_cast<unsigned char>(Peek(1)) == 0xA0) {
      // U+00A0 no-break space
      Advance();
      Advance();
    } else {
      break;
    }
  }
  return newline;
}

auto Lexer::NextToken() -> Token {
  if (IsAtEnd()) {
    return Token{.kind = TokenKind::kEof, .position = Position()};
  }
  char c = Peek();
  if (std::isdigit(static_cast<unsigned char>(c)) != 0 ||
      (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))) != 0)) {
    return NumberToken();
  }
  if (IsIdentStart(c)) {
    return IdentifierToken();
  }
  if (c == '"' || c == '\'') {
    return StringToken(c);
  }
  if (c == '`') {
    return TemplateToken();
  }
  return PunctuatorToken();
}

auto Lexer::NumberToken() -> Token {
  SourcePosition start = Position();
  std::string lexeme;

  if (Peek() == '0' && std::string_view("xXoObB").find(Peek(1)) !=
                           std::string_view::npos) {
    lexeme += Advance();
    lexeme += Advance();
    while (std::isalnum(static_cast<unsigned char>(Peek())) != 0 ||
           Peek() == '_') {
      char d = Advance();
      if (d != '_') {
        lexeme += d;
      }
    }
  } else {
    auto digits = [&] {
      while (std::isdigit(static_cast<unsigned char>(Peek())) != 0 ||
             Peek() == '_') {
        char d = Advance();
        if (d != '_') {
          lexeme += d;
        }
      }
    };
    digits();
    if (Peek() == '.') {
      lexeme += Advance();
      digits();
    }
    if (Peek() == 'e' || Peek() == 'E') {
      lexeme += Advance();
      if (Peek() == '+' || Peek() == '-') {
        lexeme += Advance();
      }
      digits();
    }
  }

  if (Peek() == 'n') {
    throw SyntaxError("BigInt literals are not supported", start);
  }
  if (IsIdentStart(Peek())) {
    throw SyntaxError("Invalid or unexpected token", start);
  }
  double value = CoerceToNumber(lexeme);
  if (value != value) {
    throw SyntaxError(
        std::format("Invalid number literal '{}'", lexeme), start);
  }
  return Token{
      .kind = TokenKind::kNumber,
      .text = lexeme,
      .number = value,
      .position = start,
  };
}

auto Lexer::IdentifierToken() -> Token {
  SourcePosition start = Position();
  std::string lexeme;
  while (IsIdentPart(Peek())) {
    lexeme += Advance();
  }
  TokenKind kind =
      IsKeyword(lexeme) ? TokenKind::kKeyword : TokenKind::kIdentifier;
  return Token{.kind = kind, .text = std::move(lexeme), .position = start};
}

void Lexer::ReadEscape(std::string& out) {
  SourcePosition pos = Position();
  char c = Advance();
  switch (c) {
    case 'n':
      out += '\n';
      return;
    case 't':
      out += '\t';
      return;
    case 'r':
      out += '\r';
      return;
    case 'b':
      out += '\b';
      return;
    case 'f':
      out += '\f';
      return;
    case 'v':
      out += '\v';
      return;
    case '0':
      out += '\0';
      return;
    case '\r':
      if (Peek() == '\n') {
        Advance();
      }
      return;
    case '\n':
      return;
    case 'x': {
      int hi = HexValue(Advance());
      int lo = HexValue(Advance());
      if (hi < 0 || lo < 0) {
        throw SyntaxError("Invalid hexadecimal escape sequence", pos);
      }
      AppendUtf8(static_cast<uint32_t>((hi * 16) + lo), out);
      return;
    }
    case 'u': {
      uint32_t cp = 0;
      if (Peek() == '{') {
        Advance();
        while (Peek() != '}') {
          int d = HexValue(Advance());
          if (d < 0 || cp > 0x10FFFF) {
            throw SyntaxError("Invalid Unicode escape sequence", pos);
          }
          cp = (cp * 16) + static_cast<uint32_t>(d);
        }
        Advance();
      } else {
        for (int i = 0; i < 4; ++i) {
          int d = HexValue(Advance());
          if (d < 0) {
            throw SyntaxError("Invalid Unicode escape sequence", pos);
          }
          cp = (cp * 16) + static_cast<uint32_t>(d);
        }
      }
      AppendUtf8(cp, out);
      return;
    }
    default:
      if (c == '\0' && IsAtEnd()) {
        throw SyntaxError("Invalid or unexpected token", pos);
      }
      out += c;
      return;
  }
}

auto Lexer::StringToken(char quote) -> Token {
  SourcePosition start = Position();
  Advance();
  std::string value;
  while (Peek() != quote) {
    if (IsAtEnd() || Peek() == '\n') {
      throw SyntaxError("Invalid or unexpected token", start);
    }
    char c = Advance();
    if (c == '\\') {
      ReadEscape(value);
    } else {
      value += c;
    }
  }
  Advance();
  return Token{
      .kind = TokenKind::kString, .text = std::move(value), .position = start};
}

auto Lexer::ReadHoleSource() -> std::string {
  SourcePosition start = Position();
  std::string text;
  int depth = 0;
  while (true) {
    if (IsAtEnd()) {
      throw SyntaxError("Unterminated template literal", start);
    }
    char c = Peek();
    if (c == '}' && depth == 0) {
      Advance();
      return text;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      --depth;
    } else if (c == '"' || c == '\'') {
      text += Advance();
      while (!IsAtEnd() && Peek() != c) {
        if (Peek() == '\\') {
          text += Advance();
        }
        text += Advance();
      }
    } else if (c == '`') {
      // Nested template: copy through to its closing backtick.
      text += Advance();
      while (!IsAtEnd() && Peek() != '`') {
        if (Peek() == '\\') {
          text += Advance();
        } else if (Peek() == '$' && Peek(1) == '{') {
          text += Advance();
          text += Advance();
          text += ReadHoleSource();
          text += '}';
          continue;
        }
        text += Advance();
      }
    }
    text += Advance();
  }
}

auto Lexer::TemplateToken() -> Token {
  SourcePosition start = Position();
  Advance();
  Token token{.kind = TokenKind::kTemplate, .position = start};
  std::string chunk;
  while (Peek() != '`') {
    if (IsAtEnd()) {
      throw SyntaxError("Unterminated template literal", start);
    }
    if (Peek() == '\\') {
      Advance();
      ReadEscape(chunk);
      continue;
    }
    if (Peek() == '$' && Peek(1) == '{') {
      Advance();
      Advance();
      token.chunks.push_back(std::move(chunk));
      chunk.clear();
      SourcePosition hole_pos = Position();
      token.holes.push_back(
          TemplateHole{.source = ReadHoleSource(), .position = hole_pos});
      continue;
    }
    chunk += Advance();
  }
  Advance();
  token.chunks.push_back(std::move(chunk));
  return token;
}

auto Lexer::PunctuatorToken() -> Token {
  SourcePosition start = Position();
  std::string_view rest = source_.substr(index_);
  for (std::string_view p : kPunctuators) {
    if (!rest.starts_with(p)) {
      continue;
    }
    // `a ?.5 : b` is a conditional, not optional chaining.
    if (p == "?." && rest.size() > 2 &&
        std::isdigit(static_cast<unsigned char>(rest[2])) != 0) {
      continue;
    }
    for (size_t i = 0; i < p.size(); ++i) {
      Advance();
    }
    return Token{
        .kind = TokenKind::kPunctuator,
        .text = std::string(p),
        .position = start};
  }
  for (std::string_view p : kSingleExtra) {
    if (rest.starts_with(p)) {
      Advance();
      return Token{
          .kind = TokenKind::kPunctuator,
          .text = std::string(p),
          .position = start};
    }
  }
  throw SyntaxError(
      std::format("Invalid or unexpected token '{}'", rest.substr(0, 1)),
      start);
}

}  // namespace proba::script
