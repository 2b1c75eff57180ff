#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "proba/script/runtime_value.hpp"
#include "proba/script/statement.hpp"

namespace proba::script {

struct Binding {
  RuntimeValue value;
  DeclarationKind kind = DeclarationKind::kVar;

  [[nodiscard]] auto IsConst() const -> bool {
    return kind == DeclarationKind::kConst;
  }
};

// One lexical environment. Function scopes receive `var` declarations;
// block scopes only hold `let`/`const` and block-level functions.
class Scope {
 public:
  Scope(std::shared_ptr<Scope> parent, bool is_function_scope)
      : parent_(std::move(parent)), is_function_scope_(is_function_scope) {
  }

  // This scope only.
  [[nodiscard]] auto Find(std::string_view name) -> Binding*;
  // This scope and its ancestors.
  [[nodiscard]] auto Lookup(std::string_view name) -> Binding*;

  // Returns false when `name` collides with an existing binding that may
  // not be redeclared (any let/const, or a var over a let/const).
  auto Declare(std::string_view name, RuntimeValue value, DeclarationKind kind)
      -> bool;

  // Creates an undefined `var` binding unless one exists (hoisting).
  void DeclareHoisted(std::string_view name);

  [[nodiscard]] auto NearestFunctionScope() -> Scope&;

  [[nodiscard]] auto Parent() const -> const std::shared_ptr<Scope>& {
    return parent_;
  }
  [[nodiscard]] auto IsFunctionScope() const -> bool {
    return is_function_scope_;
  }

  void Clear() {
    bindings_.clear();
  }

 private:
  std::shared_ptr<Scope> parent_;
  bool is_function_scope_;
  std::unordered_map<std::string, Binding, StringHash, std::equal_to<>>
      bindings_;
};

}  // namespace proba::script
