#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "proba/common/diagnostic.hpp"
#include "proba/engine/language.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/value/value.hpp"

namespace proba::engine {

inline constexpr std::string_view kResultSentinel = "__TEST_RESULT__:";
inline constexpr std::string_view kErrorSentinel = "__TEST_ERROR__:";

// Wrapper program that declares the user source, checks that
// `function_name` is callable, invokes it with the inputs and prints one
// sentinel line. Java has no function contract and is rejected.
auto BuildHarness(
    std::string_view code, const extract::TestCase& test_case,
    Language language) -> Result<std::string>;

// Source literal for `value`. Undefined, NaN and the infinities keep their
// JavaScript spellings.
auto ToJavaScriptLiteral(const Value& value) -> std::string;

// Undefined and null both become None.
auto ToPythonLiteral(const Value& value) -> std::string;

// What the harness run reported.
struct ExtractedResult {
  std::optional<Value> actual;
  std::optional<std::string> error;
};

// Success sentinel, then error sentinel, then the last non-empty output
// line; Undefined when the output is empty.
auto ExtractActual(std::string_view output) -> ExtractedResult;

// Comma-separated user inputs as stdin lines.
auto UserInputsToStdin(std::string_view user_inputs) -> std::string;

}  // namespace proba::engine
