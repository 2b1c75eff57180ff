#pragma once

#include "proba/value/value.hpp"

namespace proba {

// Structural equality used for every test verdict.
//
// - identical scalars are equal (NaN included, so the relation is reflexive)
// - null and undefined equal only themselves
// - a number and a text compare by the number's textual rendering
//   (2 equals "2"); any other kind mismatch is unequal
// - lists compare element-wise in order
// - objects compare by sorted key set, then value under each key
auto StructuralEqual(const Value& actual, const Value& expected) -> bool;

}  // namespace proba
