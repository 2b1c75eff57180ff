#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "proba/script/expression.hpp"
#include "proba/script/fwd.hpp"
#include "proba/script/routine.hpp"
#include "proba/script/statement.hpp"

namespace proba::script {

class Arena final {
 public:
  Arena() = default;
  ~Arena() = default;

  Arena(const Arena&) = delete;
  auto operator=(const Arena&) -> Arena& = delete;

  Arena(Arena&&) = default;
  auto operator=(Arena&&) -> Arena& = default;

  auto AddExpression(Expression expr) -> ExpressionId {
    ExpressionId id{static_cast<uint32_t>(expressions_.size())};
    expressions_.push_back(std::move(expr));
    return id;
  }

  auto AddStatement(Statement stmt) -> StatementId {
    StatementId id{static_cast<uint32_t>(statements_.size())};
    statements_.push_back(std::move(stmt));
    return id;
  }

  auto AddFunction(Function func) -> FunctionId {
    FunctionId id{static_cast<uint32_t>(functions_.size())};
    functions_.push_back(std::move(func));
    return id;
  }

  [[nodiscard]] auto operator[](ExpressionId id) const -> const Expression& {
    return expressions_[id.value];
  }

  [[nodiscard]] auto operator[](StatementId id) const -> const Statement& {
    return statements_[id.value];
  }

  [[nodiscard]] auto operator[](FunctionId id) const -> const Function& {
    return functions_[id.value];
  }

  [[nodiscard]] auto ExpressionCount() const -> size_t {
    return expressions_.size();
  }
  [[nodiscard]] auto StatementCount() const -> size_t {
    return statements_.size();
  }

 private:
  std::vector<Expression> expressions_;
  std::vector<Statement> statements_;
  std::vector<Function> functions_;
};

// A parsed snippet. Function objects created while running it keep the
// program alive through a shared_ptr.
struct Program {
  Arena arena;
  std::vector<StatementId> body;
};

}  // namespace proba::script
