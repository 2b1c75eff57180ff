#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "proba/value/value.hpp"

namespace proba {

// Strict JSON parse. Returns nullopt on malformed input or on nesting
// deeper than kMaxValueDepth.
auto ParseJson(std::string_view text) -> std::optional<Value>;

// nullopt when `json` nests deeper than kMaxValueDepth.
auto FromJson(const nlohmann::ordered_json& json) -> std::optional<Value>;

// Undefined maps to null; non-finite numbers map to null.
auto ToJson(const Value& value) -> nlohmann::ordered_json;

// JSON.stringify semantics: undefined members are dropped, undefined list
// elements and non-finite numbers become null, numbers use JavaScript
// formatting. A top-level undefined yields "undefined". indent == 0 is the
// compact form.
auto Stringify(const Value& value, int indent = 0) -> std::string;

// JSON string literal for `text`, escaped the way JSON.stringify does.
auto QuoteJsonString(std::string_view text) -> std::string;

}  // namespace proba
