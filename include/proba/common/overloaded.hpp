#pragma once

namespace proba::common {

// Visitor helper for std::visit with one lambda per alternative.
//
//   std::visit(Overloaded{
//       [](const Value::List& list) { ... },
//       [](const auto& other) { ... },
//   }, value.Data());
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace proba::common
