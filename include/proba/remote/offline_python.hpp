#pragma once

#include <string>
#include <string_view>

#include "proba/common/diagnostic.hpp"

namespace proba::remote {

// Output printed when a program produced none.
inline constexpr std::string_view kNoOutputMessage =
    "Code executed (no output)";

// Degraded-mode approximation used when the remote service cannot be
// reached. It is not a Python interpreter: it follows a handful of line
// patterns and treats everything else as inert text.
//
// Recognized at top level (lines trimmed, blank and `#` lines skipped):
//   name = expr
//   print(expr, ...)
//   def name(params):      followed by an indented `return expr`
// Bodies of `def` and `except` are skipped; other block bodies run in line.
//
// Expressions: string and number literals, list literals, variables,
// sum(var), len(var), input() (next stdin line), json.dumps(expr), one
// binary + - * /, and calls of the defined function. Anything else
// evaluates to its own text.
//
// Fails on division by zero and on runaway recursion.
auto RunOfflinePython(std::string_view code, std::string_view stdin_text)
    -> Result<std::string>;

}  // namespace proba::remote
