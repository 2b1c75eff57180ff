#pragma once

#include <string>

#include "proba/engine/test_result.hpp"
#include "proba/extract/test_case.hpp"

namespace proba::driver {

// Human-readable suite report: one line per case, parse errors, summary.
auto FormatSuiteText(const engine::TestSuiteResult& suite) -> std::string;

auto FormatSuiteJson(const engine::TestSuiteResult& suite) -> std::string;

auto FormatExtractionText(const extract::ExtractionResult& extraction)
    -> std::string;

auto FormatExtractionJson(const extract::ExtractionResult& extraction)
    -> std::string;

}  // namespace proba::driver
