#include "proba/script/scope.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "proba/script/runtime_value.hpp"
#include "proba/script/statement.hpp"

namespace proba::script {

auto Scope::Find(std::string_view name) -> Binding* {
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto Scope::Lookup(std::string_view name) -> Binding* {
  for (Scope* scope = this; scope != nullptr; scope = scope->parent_.get()) {
    if (Binding* binding = scope->Find(name)) {
      return binding;
    }
  }
  return nullptr;
}

auto Scope::Declare(
    std::string_view name, RuntimeValue value, DeclarationKind kind) -> bool {
  if (Binding* existing = Find(name)) {
    if (kind != DeclarationKind::kVar ||
        existing->kind != DeclarationKind::kVar) {
      return false;
    }
    existing->value = std::move(value);
    return true;
  }
  bindings_.emplace(
      std::string(name), Binding{.value = std::move(value), .kind = kind});
  return true;
}

void Scope::DeclareHoisted(std::string_view name) {
  if (Find(name) == nullptr) {
    bindings_.emplace(
        std::string(name),
        Binding{.value = Undefined{}, .kind = DeclarationKind::kVar});
  }
}

auto Scope::NearestFunctionScope() -> Scope& {
  Scope* scope = this;
  while (!scope->is_function_scope_ && scope->parent_ != nullptr) {
    scope = scope->parent_.get();
  }
  return *scope;
}

}  // namespace proba::script
