#include "proba/script/parser.hpp"

#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/script/arena.hpp"
#include "proba/script/errors.hpp"
#include "proba/script/expression.hpp"
#include "proba/script/lexer.hpp"
#include "proba/script/operator.hpp"
#include "proba/script/routine.hpp"
#include "proba/script/statement.hpp"
#include "proba/script/token.hpp"
#include "proba/value/number.hpp"

namespace proba::script {

namespace {

struct BinaryOperatorInfo {
  int precedence;
  std::optional<BinaryOp> binary;
  std::optional<LogicalOp> logical;
};

auto LookupBinaryOperator(const Token& token, bool no_in)
    -> std::optional<BinaryOperatorInfo> {
  if (token.kind == TokenKind::kKeyword) {
    if (token.text == "instanceof") {
      return BinaryOperatorInfo{7, BinaryOp::kInstanceof, std::nullopt};
    }
    if (token.text == "in" && !no_in) {
      return BinaryOperatorInfo{7, BinaryOp::kIn, std::nullopt};
    }
    return std::nullopt;
  }
  if (token.kind != TokenKind::kPunctuator) {
    return std::nullopt;
  }
  const std::string& t = token.text;
  if (t == "??") {
    return BinaryOperatorInfo{1, std::nullopt, LogicalOp::kNullish};
  }
  if (t == "||") {
    return BinaryOperatorInfo{1, std::nullopt, LogicalOp::kOr};
  }
  if (t == "&&") {
    return BinaryOperatorInfo{2, std::nullopt, LogicalOp::kAnd};
  }
  if (t == "|") {
    return BinaryOperatorInfo{3, BinaryOp::kBitwiseOr, std::nullopt};
  }
  if (t == "^") {
    return BinaryOperatorInfo{4, BinaryOp::kBitwiseXor, std::nullopt};
  }
  if (t == "&") {
    return BinaryOperatorInfo{5, BinaryOp::kBitwiseAnd, std::nullopt};
  }
  if (t == "==") {
    return BinaryOperatorInfo{6, BinaryOp::kEqual, std::nullopt};
  }
  if (t == "!=") {
    return BinaryOperatorInfo{6, BinaryOp::kNotEqual, std::nullopt};
  }
  if (t == "===") {
    return BinaryOperatorInfo{6, BinaryOp::kStrictEqual, std::nullopt};
  }
  if (t == "!==") {
    return BinaryOperatorInfo{6, BinaryOp::kStrictNotEqual, std::nullopt};
  }
  if (t == "<") {
    return BinaryOperatorInfo{7, BinaryOp::kLessThan, std::nullopt};
  }
  if (t == ">") {
    return BinaryOperatorInfo{7, BinaryOp::kGreaterThan, std::nullopt};
  }
  if (t == "<=") {
    return BinaryOperatorInfo{7, BinaryOp::kLessThanEqual, std::nullopt};
  }
  if (t == ">=") {
    return BinaryOperatorInfo{7, BinaryOp::kGreaterThanEqual, std::nullopt};
  }
  if (t == "<<") {
    return BinaryOperatorInfo{8, BinaryOp::kShiftLeft, std::nullopt};
  }
  if (t == ">>") {
    return BinaryOperatorInfo{8, BinaryOp::kShiftRight, std::nullopt};
  }
  if (t == ">>>") {
    return BinaryOperatorInfo{8, BinaryOp::kUnsignedShiftRight, std::nullopt};
  }
  if (t == "+") {
    return BinaryOperatorInfo{9, BinaryOp::kAdd, std::nullopt};
  }
  if (t == "-") {
    return BinaryOperatorInfo{9, BinaryOp::kSubtract, std::nullopt};
  }
  if (t == "*") {
    return BinaryOperatorInfo{10, BinaryOp::kMultiply, std::nullopt};
  }
  if (t == "/") {
    return BinaryOperatorInfo{10, BinaryOp::kDivide, std::nullopt};
  }
  if (t == "%") {
    return BinaryOperatorInfo{10, BinaryOp::kMod, std::nullopt};
  }
  return std::nullopt;
}

auto IsAssignable(ExpressionKind kind) -> bool {
  return kind == ExpressionKind::kIdentifier ||
         kind == ExpressionKind::kMember || kind == ExpressionKind::kIndex;
}

auto DescribeToken(const Token& token) -> std::string {
  switch (token.kind) {
    case TokenKind::kEof:
      return "end of input";
    case TokenKind::kNumber:
      return "number";
    case TokenKind::kString:
      return "string";
    case TokenKind::kTemplate:
      return "template string";
    case TokenKind::kIdentifier:
      return std::format("identifier '{}'", token.text);
    case TokenKind::kKeyword:
    case TokenKind::kPunctuator:
      return std::format("token '{}'", token.text);
  }
  return "token";
}

}  // namespace

auto ParseProgram(std::string_view source) -> std::shared_ptr<const Program> {
  auto program = std::make_shared<Program>();
  Parser parser(Lexer(source).Tokenize(), program->arena);
  program->body = parser.ParseProgramBody();
  return program;
}

Parser::Parser(std::vector<Token> tokens, Arena& arena, int depth)
    : tokens_(std::move(tokens)), arena_(arena), depth_(depth) {
  if (tokens_.empty() || tokens_.back().kind != TokenKind::kEof) {
    tokens_.push_back(Token{.kind = TokenKind::kEof});
  }
}

auto Parser::ParseProgramBody() -> std::vector<StatementId> {
  std::vector<StatementId> body;
  while (!AtEnd()) {
    body.push_back(ParseStatement());
  }
  return body;
}

void Parser::Nest(SourcePosition position) {
  if (++depth_ > kMaxNestingDepth) {
    throw SyntaxError("Expression nested too deeply", position);
  }
}

auto Parser::ParseSingleExpression() -> ExpressionId {
  ExpressionId expr = ParseExpression();
  if (!AtEnd()) {
    Unexpected(Peek());
  }
  return expr;
}

// ---------------------------------------------------------------------------
// Token cursor

auto Parser::Peek(size_t ahead) const -> const Token& {
  size_t index = pos_ + ahead;
  if (index >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[index];
}

auto Parser::Check(std::string_view punct) const -> bool {
  return Peek().IsPunct(punct);
}

auto Parser::CheckKeyword(std::string_view word) const -> bool {
  return Peek().IsKeyword(word);
}

auto Parser::AtEnd() const -> bool {
  return Peek().kind == TokenKind::kEof;
}

auto Parser::Advance() -> const Token& {
  const Token& token = Peek();
  if (pos_ < tokens_.size() - 1) {
    ++pos_;
  }
  return token;
}

auto Parser::Match(std::string_view punct) -> bool {
  if (Check(punct)) {
    Advance();
    return true;
  }
  return false;
}

auto Parser::MatchKeyword(std::string_view word) -> bool {
  if (CheckKeyword(word)) {
    Advance();
    return true;
  }
  return false;
}

void Parser::Expect(std::string_view punct) {
  if (!Match(punct)) {
    Unexpected(Peek());
  }
}

auto Parser::ExpectIdentifier() -> std::string {
  if (Peek().kind != TokenKind::kIdentifier) {
    Unexpected(Peek());
  }
  return Advance().text;
}

auto Parser::ExpectPropertyName() -> std::string {
  const Token& token = Peek();
  if (token.kind != TokenKind::kIdentifier &&
      token.kind != TokenKind::kKeyword) {
    Unexpected(token);
  }
  return Advance().text;
}

void Parser::ConsumeSemicolon() {
  if (Match(";")) {
    return;
  }
  if (Check("}") || AtEnd() || Peek().newline_before) {
    return;
  }
  Unexpected(Peek());
}

void Parser::Unexpected(const Token& token) const {
  if (token.IsKeyword("class")) {
    throw SyntaxError("Class syntax is not supported", token.position);
  }
  if (token.IsKeyword("async") || token.IsKeyword("await") ||
      token.IsKeyword("yield")) {
    throw SyntaxError(
        "Asynchronous and generator functions are not supported",
        token.position);
  }
  if (token.IsKeyword("import") || token.IsKeyword("export")) {
    throw SyntaxError(
        "Cannot use import statement outside a module", token.position);
  }
  throw SyntaxError(
      std::format("Unexpected {}", DescribeToken(token)), token.position);
}

auto Parser::AddExpression(
    ExpressionKind kind, SourcePosition position, ExpressionData data)
    -> ExpressionId {
  return arena_.AddExpression(
      Expression{.kind = kind, .position = position, .data = std::move(data)});
}

auto Parser::AddStatement(
    StatementKind kind, SourcePosition position, StatementData data)
    -> StatementId {
  return arena_.AddStatement(
      Statement{.kind = kind, .position = position, .data = std::move(data)});
}

// ---------------------------------------------------------------------------
// Statements

auto Parser::ParseStatement() -> StatementId {
  const Token& token = Peek();
  SourcePosition position = token.position;
  DepthScope scope(depth_);
  Nest(position);

  if (token.IsPunct("{")) {
    return ParseBlock();
  }
  if (token.IsPunct(";")) {
    Advance();
    return AddStatement(StatementKind::kEmpty, position, EmptyStatementData{});
  }
  if (token.kind == TokenKind::kKeyword) {
    const std::string& word = token.text;
    bool let_declaration =
        word == "let" && (Peek(1).kind == TokenKind::kIdentifier ||
                          Peek(1).IsPunct("[") || Peek(1).IsPunct("{"));
    if (word == "var" || word == "const" || let_declaration) {
      DeclarationKind kind = word == "var"     ? DeclarationKind::kVar
                             : word == "let"   ? DeclarationKind::kLet
                                               : DeclarationKind::kConst;
      Advance();
      StatementId decl = ParseVariableDeclaration(kind, false);
      ConsumeSemicolon();
      return decl;
    }
    if (word == "function") {
      return ParseFunctionDeclaration();
    }
    if (word == "if") {
      return ParseIf();
    }
    if (word == "for") {
      return ParseFor();
    }
    if (word == "while") {
      return ParseWhile();
    }
    if (word == "do") {
      return ParseDoWhile();
    }
    if (word == "return") {
      return ParseReturn();
    }
    if (word == "throw") {
      return ParseThrow();
    }
    if (word == "try") {
      return ParseTry();
    }
    if (word == "switch") {
      return ParseSwitch();
    }
    if (word == "break") {
      Advance();
      ConsumeSemicolon();
      return AddStatement(
          StatementKind::kBreak, position, BreakStatementData{});
    }
    if (word == "continue") {
      Advance();
      ConsumeSemicolon();
      return AddStatement(
          StatementKind::kContinue, position, ContinueStatementData{});
    }
    if (word == "class" || word == "import" || word == "export" ||
        word == "async" || word == "with") {
      Unexpected(token);
    }
  }
  if (token.kind == TokenKind::kIdentifier && Peek(1).IsPunct(":") &&
      !Peek(1).newline_before) {
    throw SyntaxError("Labeled statements are not supported", position);
  }
  return ParseExpressionStatement();
}

auto Parser::ParseBlock() -> StatementId {
  SourcePosition position = Peek().position;
  Expect("{");
  std::vector<StatementId> statements;
  while (!Check("}")) {
    if (AtEnd()) {
      Unexpected(Peek());
    }
    statements.push_back(ParseStatement());
  }
  Expect("}");
  return AddStatement(
      StatementKind::kBlock, position,
      BlockStatementData{.statements = std::move(statements)});
}

auto Parser::ParseVariableDeclaration(DeclarationKind kind, bool in_for_head)
    -> StatementId {
  SourcePosition position = Peek().position;
  std::vector<Declarator> declarators;
  do {
    SourcePosition target_position = Peek().position;
    Declarator declarator{.target = ParseBindingPattern()};
    if (Match("=")) {
      declarator.init = ParseAssignment();
    } else if (
        !in_for_head && (kind == DeclarationKind::kConst ||
                         declarator.target.kind != PatternKind::kIdentifier)) {
      throw SyntaxError(
          "Missing initializer in destructuring or const declaration",
          target_position);
    }
    declarators.push_back(std::move(declarator));
  } while (Match(","));
  return AddStatement(
      StatementKind::kVariableDeclaration, position,
      VariableDeclarationStatementData{
          .kind = kind, .declarators = std::move(declarators)});
}

auto Parser::ParseFunctionDeclaration() -> StatementId {
  SourcePosition position = Peek().position;
  Advance();  // function
  if (Check("*")) {
    Unexpected(Peek());
  }
  std::string name = ExpectIdentifier();
  FunctionId function = ParseFunctionRest(std::move(name), position);
  return AddStatement(
      StatementKind::kFunctionDeclaration, position,
      FunctionDeclarationStatementData{.function = function});
}

auto Parser::ParseIf() -> StatementId {
  SourcePosition position = Advance().position;
  Expect("(");
  ExpressionId condition = ParseExpression();
  Expect(")");
  StatementId then_branch = ParseStatement();
  StatementId else_branch = kInvalidStatementId;
  if (MatchKeyword("else")) {
    else_branch = ParseStatement();
  }
  return AddStatement(
      StatementKind::kIf, position,
      IfStatementData{
          .condition = condition,
          .then_branch = then_branch,
          .else_branch = else_branch});
}

auto Parser::ParseFor() -> StatementId {
  SourcePosition position = Advance().position;
  Expect("(");

  StatementId init = kInvalidStatementId;
  if (Check(";")) {
    // No init clause
  } else if (
      CheckKeyword("var") || CheckKeyword("let") || CheckKeyword("const")) {
    const std::string& word = Advance().text;
    DeclarationKind kind = word == "var"     ? DeclarationKind::kVar
                           : word == "let"   ? DeclarationKind::kLet
                                             : DeclarationKind::kConst;
    // for (const x of xs) / for (const k in obj)
    size_t saved = pos_;
    BindingPattern target = ParseBindingPattern();
    bool is_of = Peek().kind == TokenKind::kIdentifier && Peek().text == "of";
    bool is_in = CheckKeyword("in");
    if (is_of || is_in) {
      Advance();
      ExpressionId iterable = is_of ? ParseAssignment() : ParseExpression();
      Expect(")");
      StatementId body = ParseStatement();
      return AddStatement(
          is_of ? StatementKind::kForOf : StatementKind::kForIn, position,
          ForEachStatementData{
              .declaration = kind,
              .target = std::move(target),
              .iterable = iterable,
              .body = body});
    }
    pos_ = saved;
    no_in_ = true;
    init = ParseVariableDeclaration(kind, true);
    no_in_ = false;
  } else {
    SourcePosition init_position = Peek().position;
    no_in_ = true;
    ExpressionId expr = ParseExpression();
    no_in_ = false;
    bool is_of = Peek().kind == TokenKind::kIdentifier && Peek().text == "of";
    bool is_in = CheckKeyword("in");
    if (is_of || is_in) {
      Advance();
      BindingPattern target = ToPattern(expr);
      ExpressionId iterable = is_of ? ParseAssignment() : ParseExpression();
      Expect(")");
      StatementId body = ParseStatement();
      return AddStatement(
          is_of ? StatementKind::kForOf : StatementKind::kForIn, position,
          ForEachStatementData{
              .declaration = std::nullopt,
              .target = std::move(target),
              .iterable = iterable,
              .body = body});
    }
    init = AddStatement(
        StatementKind::kExpression, init_position,
        ExpressionStatementData{.expression = expr});
  }
  Expect(";");

  ExpressionId test = kInvalidExpressionId;
  if (!Check(";")) {
    test = ParseExpression();
  }
  Expect(";");

  ExpressionId update = kInvalidExpressionId;
  if (!Check(")")) {
    update = ParseExpression();
  }
  Expect(")");

  StatementId body = ParseStatement();
  return AddStatement(
      StatementKind::kFor, position,
      ForStatementData{
          .init = init, .test = test, .update = update, .body = body});
}

auto Parser::ParseWhile() -> StatementId {
  SourcePosition position = Advance().position;
  Expect("(");
  ExpressionId condition = ParseExpression();
  Expect(")");
  StatementId body = ParseStatement();
  return AddStatement(
      StatementKind::kWhile, position,
      WhileStatementData{.condition = condition, .body = body});
}

auto Parser::ParseDoWhile() -> StatementId {
  SourcePosition position = Advance().position;
  StatementId body = ParseStatement();
  if (!MatchKeyword("while")) {
    Unexpected(Peek());
  }
  Expect("(");
  ExpressionId condition = ParseExpression();
  Expect(")");
  Match(";");
  return AddStatement(
      StatementKind::kDoWhile, position,
      WhileStatementData{.condition = condition, .body = body});
}

auto Parser::ParseReturn() -> StatementId {
  SourcePosition position = Advance().position;
  ExpressionId value = kInvalidExpressionId;
  if (!Check(";") && !Check("}") && !AtEnd() && !Peek().newline_before) {
    value = ParseExpression();
  }
  ConsumeSemicolon();
  return AddStatement(
      StatementKind::kReturn, position, ReturnStatementData{.value = value});
}

auto Parser::ParseThrow() -> StatementId {
  SourcePosition position = Advance().position;
  if (Peek().newline_before) {
    throw SyntaxError("Illegal newline after throw", position);
  }
  ExpressionId value = ParseExpression();
  ConsumeSemicolon();
  return AddStatement(
      StatementKind::kThrow, position, ThrowStatementData{.value = value});
}

auto Parser::ParseTry() -> StatementId {
  SourcePosition position = Advance().position;
  TryStatementData data{.block = ParseBlock()};
  if (MatchKeyword("catch")) {
    if (Match("(")) {
      data.catch_binding = ParseBindingPattern();
      Expect(")");
    }
    data.handler = ParseBlock();
  }
  if (MatchKeyword("finally")) {
    data.finalizer = ParseBlock();
  }
  if (!data.handler && !data.finalizer) {
    throw SyntaxError("Missing catch or finally after try", position);
  }
  return AddStatement(StatementKind::kTry, position, std::move(data));
}

auto Parser::ParseSwitch() -> StatementId {
  SourcePosition position = Advance().position;
  Expect("(");
  ExpressionId discriminant = ParseExpression();
  Expect(")");
  Expect("{");
  std::vector<SwitchCase> cases;
  bool seen_default = false;
  while (!Match("}")) {
    SwitchCase switch_case;
    if (MatchKeyword("case")) {
      switch_case.test = ParseExpression();
    } else if (CheckKeyword("default")) {
      if (seen_default) {
        throw SyntaxError(
            "More than one default clause in switch statement",
            Peek().position);
      }
      Advance();
      seen_default = true;
    } else {
      Unexpected(Peek());
    }
    Expect(":");
    while (!CheckKeyword("case") && !CheckKeyword("default") && !Check("}")) {
      if (AtEnd()) {
        Unexpected(Peek());
      }
      switch_case.body.push_back(ParseStatement());
    }
    cases.push_back(std::move(switch_case));
  }
  return AddStatement(
      StatementKind::kSwitch, position,
      SwitchStatementData{
          .discriminant = discriminant, .cases = std::move(cases)});
}

auto Parser::ParseExpressionStatement() -> StatementId {
  SourcePosition position = Peek().position;
  ExpressionId expr = ParseExpression();
  ConsumeSemicolon();
  return AddStatement(
      StatementKind::kExpression, position,
      ExpressionStatementData{.expression = expr});
}

// ---------------------------------------------------------------------------
// Expressions

auto Parser::ParseExpression() -> ExpressionId {
  SourcePosition position = Peek().position;
  ExpressionId first = ParseAssignment();
  if (!Check(",")) {
    return first;
  }
  std::vector<ExpressionId> expressions{first};
  while (Match(",")) {
    expressions.push_back(ParseAssignment());
  }
  return AddExpression(
      ExpressionKind::kSequence, position,
      SequenceExpressionData{.expressions = std::move(expressions)});
}

auto Parser::ParseAssignment() -> ExpressionId {
  DepthScope scope(depth_);
  Nest(Peek().position);
  if (IsArrowAhead()) {
    return ParseArrowFunction();
  }

  SourcePosition position = Peek().position;
  ExpressionId target = ParseConditional();

  const Token& token = Peek();
  if (token.kind != TokenKind::kPunctuator) {
    return target;
  }

  if (token.text == "=") {
    const Expression& lhs = arena_[target];
    if (lhs.kind == ExpressionKind::kArrayLiteral ||
        lhs.kind == ExpressionKind::kObjectLiteral) {
      Advance();
      BindingPattern pattern = ToPattern(target);
      ExpressionId value = ParseAssignment();
      return AddExpression(
          ExpressionKind::kDestructuringAssignment, position,
          DestructuringAssignmentExpressionData{
              .pattern = std::move(pattern), .value = value});
    }
    if (!IsAssignable(lhs.kind)) {
      throw SyntaxError("Invalid left-hand side in assignment", position);
    }
    Advance();
    ExpressionId value = ParseAssignment();
    return AddExpression(
        ExpressionKind::kAssignment, position,
        AssignmentExpressionData{.target = target, .value = value});
  }

  auto compound = CompoundAssignmentOp(token.text);
  auto logical = LogicalAssignmentOp(token.text);
  if (!compound && !logical) {
    return target;
  }
  if (!IsAssignable(arena_[target].kind)) {
    throw SyntaxError("Invalid left-hand side in assignment", position);
  }
  Advance();
  ExpressionId value = ParseAssignment();
  return AddExpression(
      ExpressionKind::kAssignment, position,
      AssignmentExpressionData{
          .target = target,
          .value = value,
          .compound_op = compound,
          .logical_op = logical});
}

auto Parser::ParseConditional() -> ExpressionId {
  SourcePosition position = Peek().position;
  ExpressionId condition = ParseBinary(1);
  if (!Match("?")) {
    return condition;
  }
  // `in` is allowed again inside the branches.
  bool saved_no_in = no_in_;
  no_in_ = false;
  ExpressionId then_expr = ParseAssignment();
  no_in_ = saved_no_in;
  Expect(":");
  ExpressionId else_expr = ParseAssignment();
  return AddExpression(
      ExpressionKind::kConditional, position,
      ConditionalExpressionData{
          .condition = condition,
          .then_expr = then_expr,
          .else_expr = else_expr});
}

auto Parser::ParseBinary(int min_precedence) -> ExpressionId {
  SourcePosition position = Peek().position;
  DepthScope scope(depth_);
  ExpressionId lhs = ParseExponent();
  while (true) {
    auto info = LookupBinaryOperator(Peek(), no_in_);
    if (!info || info->precedence < min_precedence) {
      return lhs;
    }
    // Each operator deepens the left-leaning tree.
    Nest(Advance().position);
    ExpressionId rhs = ParseBinary(info->precedence + 1);
    if (info->logical) {
      lhs = AddExpression(
          ExpressionKind::kLogical, position,
          LogicalExpressionData{.op = *info->logical, .lhs = lhs, .rhs = rhs});
    } else {
      lhs = AddExpression(
          ExpressionKind::kBinary, position,
          BinaryExpressionData{.op = *info->binary, .lhs = lhs, .rhs = rhs});
    }
  }
}

auto Parser::ParseExponent() -> ExpressionId {
  SourcePosition position = Peek().position;
  ExpressionId base = ParseUnary();
  if (!Match("**")) {
    return base;
  }
  DepthScope scope(depth_);
  Nest(position);
  ExpressionId exponent = ParseExponent();
  return AddExpression(
      ExpressionKind::kBinary, position,
      BinaryExpressionData{
          .op = BinaryOp::kPower, .lhs = base, .rhs = exponent});
}

auto Parser::ParseUnary() -> ExpressionId {
  const Token& token = Peek();
  SourcePosition position = token.position;
  DepthScope scope(depth_);
  Nest(position);

  std::optional<UnaryOp> op;
  if (token.kind == TokenKind::kPunctuator) {
    if (token.text == "!") {
      op = UnaryOp::kLogicalNot;
    } else if (token.text == "-") {
      op = UnaryOp::kMinus;
    } else if (token.text == "+") {
      op = UnaryOp::kPlus;
    } else if (token.text == "~") {
      op = UnaryOp::kBitwiseNot;
    } else if (token.text == "++" || token.text == "--") {
      bool increment = token.text == "++";
      Advance();
      ExpressionId target = ParseUnary();
      if (!IsAssignable(arena_[target].kind)) {
        throw SyntaxError(
            "Invalid left-hand side expression in prefix operation",
            position);
      }
      return AddExpression(
          ExpressionKind::kUpdate, position,
          UpdateExpressionData{
              .increment = increment, .prefix = true, .target = target});
    }
  } else if (token.kind == TokenKind::kKeyword) {
    if (token.text == "typeof") {
      op = UnaryOp::kTypeof;
    } else if (token.text == "void") {
      op = UnaryOp::kVoid;
    } else if (token.text == "delete") {
      op = UnaryOp::kDelete;
    } else if (token.text == "await") {
      Unexpected(token);
    }
  }

  if (!op) {
    return ParsePostfix();
  }
  Advance();
  ExpressionId operand = ParseUnary();
  return AddExpression(
      ExpressionKind::kUnary, position,
      UnaryExpressionData{.op = *op, .operand = operand});
}

auto Parser::ParsePostfix() -> ExpressionId {
  SourcePosition position = Peek().position;
  ExpressionId expr = ParseCallOrMember();
  const Token& token = Peek();
  if ((token.IsPunct("++") || token.IsPunct("--")) && !token.newline_before) {
    if (!IsAssignable(arena_[expr].kind)) {
      throw SyntaxError(
          "Invalid left-hand side expression in postfix operation", position);
    }
    bool increment = Advance().text == "++";
    return AddExpression(
        ExpressionKind::kUpdate, position,
        UpdateExpressionData{
            .increment = increment, .prefix = false, .target = expr});
  }
  return expr;
}

auto Parser::ParseCallOrMember() -> ExpressionId {
  SourcePosition position = Peek().position;
  DepthScope scope(depth_);
  ExpressionId expr = CheckKeyword("new") ? ParseNew() : ParsePrimary();

  while (true) {
    if (Check(".") || Check("?.") || Check("[") || Check("(")) {
      Nest(Peek().position);
    }
    if (Match(".")) {
      std::string property = ExpectPropertyName();
      expr = AddExpression(
          ExpressionKind::kMember, position,
          MemberExpressionData{.object = expr, .property = std::move(property)});
    } else if (Match("?.")) {
      if (Check("(")) {
        auto arguments = ParseArguments();
        expr = AddExpression(
            ExpressionKind::kCall, position,
            CallExpressionData{
                .callee = expr,
                .arguments = std::move(arguments),
                .optional = true});
      } else if (Match("[")) {
        ExpressionId index = ParseExpression();
        Expect("]");
        expr = AddExpression(
            ExpressionKind::kIndex, position,
            IndexExpressionData{
                .object = expr, .index = index, .optional = true});
      } else {
        std::string property = ExpectPropertyName();
        expr = AddExpression(
            ExpressionKind::kMember, position,
            MemberExpressionData{
                .object = expr,
                .property = std::move(property),
                .optional = true});
      }
    } else if (Match("[")) {
      bool saved_no_in = no_in_;
      no_in_ = false;
      ExpressionId index = ParseExpression();
      no_in_ = saved_no_in;
      Expect("]");
      expr = AddExpression(
          ExpressionKind::kIndex, position,
          IndexExpressionData{.object = expr, .index = index});
    } else if (Check("(")) {
      auto arguments = ParseArguments();
      expr = AddExpression(
          ExpressionKind::kCall, position,
          CallExpressionData{.callee = expr, .arguments = std::move(arguments)});
    } else if (Peek().kind == TokenKind::kTemplate) {
      throw SyntaxError(
          "Tagged templates are not supported", Peek().position);
    } else {
      return expr;
    }
  }
}

auto Parser::ParseNew() -> ExpressionId {
  SourcePosition position = Advance().position;  // new
  DepthScope scope(depth_);
  Nest(position);
  if (Check(".")) {
    throw SyntaxError("new.target is not supported", position);
  }
  ExpressionId callee = CheckKeyword("new") ? ParseNew() : ParsePrimary();
  while (true) {
    if (Match(".")) {
      std::string property = ExpectPropertyName();
      callee = AddExpression(
          ExpressionKind::kMember, position,
          MemberExpressionData{
              .object = callee, .property = std::move(property)});
    } else if (Match("[")) {
      ExpressionId index = ParseExpression();
      Expect("]");
      callee = AddExpression(
          ExpressionKind::kIndex, position,
          IndexExpressionData{.object = callee, .index = index});
    } else {
      break;
    }
  }
  std::vector<ExpressionId> arguments;
  if (Check("(")) {
    arguments = ParseArguments();
  }
  return AddExpression(
      ExpressionKind::kNew, position,
      NewExpressionData{.callee = callee, .arguments = std::move(arguments)});
}

auto Parser::ParseArguments() -> std::vector<ExpressionId> {
  Expect("(");
  bool saved_no_in = no_in_;
  no_in_ = false;
  std::vector<ExpressionId> arguments;
  while (!Check(")")) {
    SourcePosition position = Peek().position;
    if (Match("...")) {
      ExpressionId argument = ParseAssignment();
      arguments.push_back(AddExpression(
          ExpressionKind::kSpread, position,
          SpreadExpressionData{.argument = argument}));
    } else {
      arguments.push_back(ParseAssignment());
    }
    if (!Match(",")) {
      break;
    }
  }
  Expect(")");
  no_in_ = saved_no_in;
  return arguments;
}

auto Parser::ParsePrimary() -> ExpressionId {
  const Token& token = Peek();
  SourcePosition position = token.position;

  switch (token.kind) {
    case TokenKind::kNumber: {
      double value = Advance().number;
      return AddExpression(
          ExpressionKind::kNumber, position,
          NumberExpressionData{.value = value});
    }
    case TokenKind::kString: {
      std::string value = Advance().text;
      return AddExpression(
          ExpressionKind::kString, position,
          StringExpressionData{.value = std::move(value)});
    }
    case TokenKind::kTemplate: {
      Token template_token = Advance();
      return ParseTemplate(template_token);
    }
    case TokenKind::kIdentifier: {
      std::string name = Advance().text;
      return AddExpression(
          ExpressionKind::kIdentifier, position,
          IdentifierExpressionData{.name = std::move(name)});
    }
    case TokenKind::kKeyword: {
      const std::string& word = token.text;
      if (word == "true" || word == "false") {
        bool value = Advance().text == "true";
        return AddExpression(
            ExpressionKind::kBoolean, position,
            BooleanExpressionData{.value = value});
      }
      if (word == "null") {
        Advance();
        return AddExpression(
            ExpressionKind::kNull, position, NullExpressionData{});
      }
      if (word == "this") {
        Advance();
        return AddExpression(
            ExpressionKind::kThis, position, ThisExpressionData{});
      }
      if (word == "function") {
        return ParseFunctionExpression();
      }
      // `let` outside a declaration is a plain name
      if (word == "let") {
        Advance();
        return AddExpression(
            ExpressionKind::kIdentifier, position,
            IdentifierExpressionData{.name = "let"});
      }
      Unexpected(token);
    }
    case TokenKind::kPunctuator: {
      if (token.text == "(") {
        Advance();
        bool saved_no_in = no_in_;
        no_in_ = false;
        ExpressionId inner = ParseExpression();
        no_in_ = saved_no_in;
        Expect(")");
        return inner;
      }
      if (token.text == "[") {
        return ParseArrayLiteral();
      }
      if (token.text == "{") {
        return ParseObjectLiteral();
      }
      if (token.text == "/" || token.text == "/=") {
        throw SyntaxError(
            "Regular expression literals are not supported", position);
      }
      Unexpected(token);
    }
    case TokenKind::kEof:
      Unexpected(token);
  }
  Unexpected(token);
}

auto Parser::ParseArrayLiteral() -> ExpressionId {
  SourcePosition position = Advance().position;  // [
  bool saved_no_in = no_in_;
  no_in_ = false;
  std::vector<ExpressionId> elements;
  while (!Check("]")) {
    if (Check(",")) {
      Advance();
      elements.push_back(kInvalidExpressionId);
      continue;
    }
    SourcePosition element_position = Peek().position;
    if (Match("...")) {
      ExpressionId argument = ParseAssignment();
      elements.push_back(AddExpression(
          ExpressionKind::kSpread, element_position,
          SpreadExpressionData{.argument = argument}));
    } else {
      elements.push_back(ParseAssignment());
    }
    if (!Match(",")) {
      break;
    }
  }
  Expect("]");
  no_in_ = saved_no_in;
  return AddExpression(
      ExpressionKind::kArrayLiteral, position,
      ArrayLiteralExpressionData{.elements = std::move(elements)});
}

auto Parser::ParseObjectLiteral() -> ExpressionId {
  SourcePosition position = Advance().position;  // {
  bool saved_no_in = no_in_;
  no_in_ = false;
  std::vector<ObjectProperty> properties;

  while (!Check("}")) {
    const Token& token = Peek();
    SourcePosition property_position = token.position;
    ObjectProperty property;

    if (Match("...")) {
      property.is_spread = true;
      property.value = ParseAssignment();
      properties.push_back(std::move(property));
      if (!Match(",")) {
        break;
      }
      continue;
    }

    bool shorthand_allowed = false;
    if (Match("[")) {
      property.computed_key = ParseAssignment();
      Expect("]");
    } else if (token.kind == TokenKind::kString) {
      property.key = Advance().text;
    } else if (token.kind == TokenKind::kNumber) {
      property.key = FormatNumber(Advance().number);
    } else if (
        token.kind == TokenKind::kIdentifier ||
        token.kind == TokenKind::kKeyword) {
      if ((token.text == "get" || token.text == "set") &&
          (Peek(1).kind == TokenKind::kIdentifier ||
           Peek(1).kind == TokenKind::kKeyword)) {
        throw SyntaxError(
            "Getters and setters are not supported", property_position);
      }
      if (token.text == "async" && !Peek(1).IsPunct(":") &&
          !Peek(1).IsPunct(",") && !Peek(1).IsPunct("(")) {
        Unexpected(token);
      }
      shorthand_allowed = token.kind == TokenKind::kIdentifier;
      property.key = Advance().text;
    } else {
      Unexpected(token);
    }

    if (Match(":")) {
      property.value = ParseAssignment();
    } else if (Check("(")) {
      FunctionId method = ParseFunctionRest(property.key, property_position);
      property.value = AddExpression(
          ExpressionKind::kFunction, property_position,
          FunctionExpressionData{.function = method});
    } else if (shorthand_allowed && (Check(",") || Check("}"))) {
      property.value = AddExpression(
          ExpressionKind::kIdentifier, property_position,
          IdentifierExpressionData{.name = property.key});
    } else {
      Unexpected(Peek());
    }
    properties.push_back(std::move(property));
    if (!Match(",")) {
      break;
    }
  }
  Expect("}");
  no_in_ = saved_no_in;
  return AddExpression(
      ExpressionKind::kObjectLiteral, position,
      ObjectLiteralExpressionData{.properties = std::move(properties)});
}

auto Parser::ParseTemplate(const Token& token) -> ExpressionId {
  std::vector<ExpressionId> holes;
  holes.reserve(token.holes.size());
  for (const auto& hole : token.holes) {
    Parser nested(
        Lexer(hole.source, hole.position).Tokenize(), arena_, depth_ + 1);
    holes.push_back(nested.ParseSingleExpression());
  }
  return AddExpression(
      ExpressionKind::kTemplate, token.position,
      TemplateExpressionData{.chunks = token.chunks, .holes = std::move(holes)});
}

// ---------------------------------------------------------------------------
// Functions and bindings

auto Parser::ParseFunctionExpression() -> ExpressionId {
  SourcePosition position = Advance().position;  // function
  if (Check("*")) {
    Unexpected(Peek());
  }
  std::string name;
  if (Peek().kind == TokenKind::kIdentifier) {
    name = Advance().text;
  }
  FunctionId function = ParseFunctionRest(std::move(name), position);
  return AddExpression(
      ExpressionKind::kFunction, position,
      FunctionExpressionData{.function = function});
}

auto Parser::ParseFunctionRest(std::string name, SourcePosition position)
    -> FunctionId {
  bool saved_no_in = no_in_;
  no_in_ = false;
  std::vector<Parameter> parameters = ParseParameters();
  StatementId body = ParseBlock();
  no_in_ = saved_no_in;
  return arena_.AddFunction(
      Function{
          .name = std::move(name),
          .parameters = std::move(parameters),
          .body = body,
          .position = position});
}

auto Parser::ParseParameters() -> std::vector<Parameter> {
  Expect("(");
  std::vector<Parameter> parameters;
  while (!Check(")")) {
    Parameter parameter;
    if (Match("...")) {
      parameter.is_rest = true;
      parameter.pattern = ParseBindingPattern();
      parameters.push_back(std::move(parameter));
      break;
    }
    parameter.pattern = ParseBindingPattern();
    if (Match("=")) {
      parameter.default_value = ParseAssignment();
    }
    parameters.push_back(std::move(parameter));
    if (!Match(",")) {
      break;
    }
  }
  Expect(")");
  return parameters;
}

auto Parser::IsArrowAhead() const -> bool {
  const Token& first = Peek();
  if (first.kind == TokenKind::kIdentifier) {
    return Peek(1).IsPunct("=>");
  }
  if (!first.IsPunct("(")) {
    return false;
  }
  int depth = 0;
  for (size_t i = 0;; ++i) {
    const Token& token = Peek(i);
    if (token.kind == TokenKind::kEof) {
      return false;
    }
    if (token.kind != TokenKind::kPunctuator) {
      continue;
    }
    if (token.text == "(" || token.text == "[" || token.text == "{") {
      ++depth;
    } else if (token.text == ")" || token.text == "]" || token.text == "}") {
      --depth;
      if (depth == 0) {
        return Peek(i + 1).IsPunct("=>");
      }
    }
  }
}

auto Parser::ParseArrowFunction() -> ExpressionId {
  SourcePosition position = Peek().position;
  std::vector<Parameter> parameters;
  if (Peek().kind == TokenKind::kIdentifier) {
    parameters.push_back(
        Parameter{
            .pattern = BindingPattern{
                .kind = PatternKind::kIdentifier, .name = Advance().text}});
  } else {
    parameters = ParseParameters();
  }
  Expect("=>");

  Function function{
      .parameters = std::move(parameters),
      .is_arrow = true,
      .position = position,
  };
  if (Check("{")) {
    bool saved_no_in = no_in_;
    no_in_ = false;
    function.body = ParseBlock();
    no_in_ = saved_no_in;
  } else {
    function.expression_body = ParseAssignment();
  }
  FunctionId id = arena_.AddFunction(std::move(function));
  return AddExpression(
      ExpressionKind::kFunction, position,
      FunctionExpressionData{.function = id});
}

auto Parser::ParseBindingPattern() -> BindingPattern {
  BindingPattern pattern;
  if (Peek().kind == TokenKind::kIdentifier) {
    pattern.kind = PatternKind::kIdentifier;
    pattern.name = Advance().text;
    return pattern;
  }

  if (Match("[")) {
    pattern.kind = PatternKind::kArray;
    while (!Check("]")) {
      if (Match(",")) {
        pattern.elements.push_back(PatternElement{});
        continue;
      }
      if (Match("...")) {
        pattern.rest = ExpectIdentifier();
        break;
      }
      PatternElement element{.name = ExpectIdentifier()};
      if (Match("=")) {
        element.default_value = ParseAssignment();
      }
      pattern.elements.push_back(std::move(element));
      if (!Match(",")) {
        break;
      }
    }
    Expect("]");
    return pattern;
  }

  if (Match("{")) {
    pattern.kind = PatternKind::kObject;
    while (!Check("}")) {
      if (Match("...")) {
        pattern.rest = ExpectIdentifier();
        break;
      }
      PatternElement element;
      if (Peek().kind == TokenKind::kString) {
        element.key = Advance().text;
      } else {
        element.key = ExpectPropertyName();
      }
      if (Match(":")) {
        element.name = ExpectIdentifier();
      } else {
        if (IsKeyword(element.key)) {
          Unexpected(Peek());
        }
        element.name = element.key;
      }
      if (Match("=")) {
        element.default_value = ParseAssignment();
      }
      pattern.elements.push_back(std::move(element));
      if (!Match(",")) {
        break;
      }
    }
    Expect("}");
    return pattern;
  }

  Unexpected(Peek());
}

auto Parser::ToPattern(ExpressionId id) -> BindingPattern {
  const Expression& expr = arena_[id];
  auto invalid = [&]() -> BindingPattern {
    throw SyntaxError("Invalid destructuring assignment target", expr.position);
  };
  auto identifier_name = [&](ExpressionId element) -> std::string {
    const Expression& e = arena_[element];
    if (e.kind != ExpressionKind::kIdentifier) {
      invalid();
    }
    return std::get<IdentifierExpressionData>(e.data).name;
  };

  switch (expr.kind) {
    case ExpressionKind::kIdentifier:
      return BindingPattern{
          .kind = PatternKind::kIdentifier,
          .name = std::get<IdentifierExpressionData>(expr.data).name};
    case ExpressionKind::kArrayLiteral: {
      BindingPattern pattern{.kind = PatternKind::kArray};
      const auto& elements =
          std::get<ArrayLiteralExpressionData>(expr.data).elements;
      for (size_t i = 0; i < elements.size(); ++i) {
        ExpressionId element = elements[i];
        if (!element) {
          pattern.elements.push_back(PatternElement{});
          continue;
        }
        const Expression& e = arena_[element];
        if (e.kind == ExpressionKind::kSpread) {
          if (i + 1 != elements.size()) {
            invalid();
          }
          pattern.rest =
              identifier_name(std::get<SpreadExpressionData>(e.data).argument);
          continue;
        }
        if (e.kind == ExpressionKind::kAssignment) {
          const auto& assign = std::get<AssignmentExpressionData>(e.data);
          if (assign.compound_op || assign.logical_op) {
            invalid();
          }
          pattern.elements.push_back(
              PatternElement{
                  .name = identifier_name(assign.target),
                  .default_value = assign.value});
          continue;
        }
        pattern.elements.push_back(
            PatternElement{.name = identifier_name(element)});
      }
      return pattern;
    }
    case ExpressionKind::kObjectLiteral: {
      BindingPattern pattern{.kind = PatternKind::kObject};
      for (const auto& property :
           std::get<ObjectLiteralExpressionData>(expr.data).properties) {
        if (property.is_spread) {
          pattern.rest = identifier_name(property.value);
          continue;
        }
        if (property.computed_key) {
          invalid();
        }
        pattern.elements.push_back(
            PatternElement{
                .key = property.key, .name = identifier_name(property.value)});
      }
      return pattern;
    }
    default:
      return invalid();
  }
}

}  // namespace proba::script
