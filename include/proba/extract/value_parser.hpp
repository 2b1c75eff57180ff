#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "proba/value/value.hpp"

namespace proba::extract {

// Expected-value rules, in order: null, undefined, true, false, JSON,
// a quoted string with its quotes removed, JavaScript numeric coercion
// (blank text is 0), and finally the raw text.
auto ParseValue(std::string_view text) -> Value;

// Positional argument of the arrow grammar: numeric coercion first, then
// JSON, then the raw text.
auto ParseArgument(std::string_view text) -> Value;

// `text` as the body of a JSON array ("1, [2], \"x\"").
auto ParseJsonArguments(std::string_view text)
    -> std::optional<std::vector<Value>>;

// JSON array body, falling back to comma-split ParseValue.
auto ParseArgumentList(std::string_view text) -> std::vector<Value>;

}  // namespace proba::extract
