#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proba/script/arena.hpp"
#include "proba/script/fwd.hpp"
#include "proba/script/statement.hpp"
#include "proba/script/token.hpp"

namespace proba::script {

// Tokenizes and parses a whole snippet. Throws script::SyntaxError.
auto ParseProgram(std::string_view source) -> std::shared_ptr<const Program>;

// Recursive-descent parser producing nodes into an Arena.
class Parser {
 public:
  // Expressions and statements may nest at most this deep.
  static constexpr int kMaxNestingDepth = 256;

  Parser(std::vector<Token> tokens, Arena& arena, int depth = 0);

  // Statements up to end of input.
  auto ParseProgramBody() -> std::vector<StatementId>;

  // Exactly one expression up to end of input (template holes).
  auto ParseSingleExpression() -> ExpressionId;

 private:
  // Token cursor
  [[nodiscard]] auto Peek(size_t ahead = 0) const -> const Token&;
  [[nodiscard]] auto Check(std::string_view punct) const -> bool;
  [[nodiscard]] auto CheckKeyword(std::string_view word) const -> bool;
  [[nodiscard]] auto AtEnd() const -> bool;
  auto Advance() -> const Token&;
  auto Match(std::string_view punct) -> bool;
  auto MatchKeyword(std::string_view word) -> bool;
  void Expect(std::string_view punct);
  auto ExpectIdentifier() -> std::string;
  // Property names may be any identifier-like word, keywords included.
  auto ExpectPropertyName() -> std::string;
  void ConsumeSemicolon();
  [[noreturn]] void Unexpected(const Token& token) const;

  // Statements
  auto ParseStatement() -> StatementId;
  auto ParseBlock() -> StatementId;
  auto ParseVariableDeclaration(DeclarationKind kind, bool in_for_head)
      -> StatementId;
  auto ParseFunctionDeclaration() -> StatementId;
  auto ParseIf() -> StatementId;
  auto ParseFor() -> StatementId;
  auto ParseWhile() -> StatementId;
  auto ParseDoWhile() -> StatementId;
  auto ParseReturn() -> StatementId;
  auto ParseThrow() -> StatementId;
  auto ParseTry() -> StatementId;
  auto ParseSwitch() -> StatementId;
  auto ParseExpressionStatement() -> StatementId;

  // Expressions, lowest precedence first
  auto ParseExpression() -> ExpressionId;
  auto ParseAssignment() -> ExpressionId;
  auto ParseConditional() -> ExpressionId;
  auto ParseBinary(int min_precedence) -> ExpressionId;
  auto ParseExponent() -> ExpressionId;
  auto ParseUnary() -> ExpressionId;
  auto ParsePostfix() -> ExpressionId;
  auto ParseCallOrMember() -> ExpressionId;
  auto ParseNew() -> ExpressionId;
  auto ParsePrimary() -> ExpressionId;
  auto ParseArguments() -> std::vector<ExpressionId>;
  auto ParseArrayLiteral() -> ExpressionId;
  auto ParseObjectLiteral() -> ExpressionId;
  auto ParseTemplate(const Token& token) -> ExpressionId;

  // Functions and bindings
  auto ParseFunctionExpression() -> ExpressionId;
  auto ParseFunctionRest(std::string name, SourcePosition position)
      -> FunctionId;
  auto ParseParameters() -> std::vector<Parameter>;
  [[nodiscard]] auto IsArrowAhead() const -> bool;
  auto ParseArrowFunction() -> ExpressionId;
  auto ParseBindingPattern() -> BindingPattern;
  auto ToPattern(ExpressionId id) -> BindingPattern;

  // Restores the nesting depth when a production returns.
  class DepthScope {
   public:
    explicit DepthScope(int& depth) : depth_(depth), saved_(depth) {
    }
    ~DepthScope() {
      depth_ = saved_;
    }
    DepthScope(const DepthScope&) = delete;
    auto operator=(const DepthScope&) -> DepthScope& = delete;

   private:
    int& depth_;
    int saved_;
  };
  // Throws SyntaxError once kMaxNestingDepth is exceeded.
  void Nest(SourcePosition position);

  auto AddExpression(
      ExpressionKind kind, SourcePosition position, ExpressionData data)
      -> ExpressionId;
  auto AddStatement(
      StatementKind kind, SourcePosition position, StatementData data)
      -> StatementId;

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  Arena& arena_;
  // Set while parsing a for-statement head so `in` ends the init clause.
  bool no_in_ = false;
  int depth_ = 0;
};

}  // namespace proba::script
