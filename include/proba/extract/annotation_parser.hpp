#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proba/extract/test_case.hpp"

namespace proba::extract {

enum class CommentStyle : uint8_t {
  kCLike,  // `//`, `/*`, leading `*`
  kHash,   // `#`
};

// javascript and java use kCLike; python uses kHash. Unknown languages
// fall back to kCLike.
auto CommentStyleFor(std::string_view language) -> CommentStyle;

auto IsCommentLine(std::string_view trimmed_line, CommentStyle style) -> bool;

// Comment text with its marker removed and whitespace trimmed.
auto StripCommentMarker(std::string_view trimmed_line, CommentStyle style)
    -> std::string;

// Extracts test cases from comment annotations. Each grammar is an
// independent matcher; the first that accepts a line wins.
class AnnotationParser {
 public:
  // Longer comment payloads are reported instead of matched.
  static constexpr size_t kMaxCommentLength = 4096;

  explicit AnnotationParser(CommentStyle style = CommentStyle::kCLike)
      : style_(style) {
  }

  [[nodiscard]] auto Extract(std::string_view code) const -> ExtractionResult;

  // Single comment payload (marker already stripped). nullopt when no
  // grammar accepts it.
  [[nodiscard]] static auto ParseLine(
      std::string_view content, uint32_t index, uint32_t line)
      -> std::optional<TestCase>;

  // Human-readable description of each accepted annotation form.
  static auto GetSupportedFormats() -> std::vector<std::string>;

  // Empty when `test_case` is well formed.
  static auto ValidateTestCase(const TestCase& test_case)
      -> std::vector<std::string>;

 private:
  CommentStyle style_;
};

// Converts a form entry; nullopt when the function name or the expected
// value is empty. `index` is the 0-based position among the form entries.
auto BuildTestCase(const FunctionTestForm& form, uint32_t index)
    -> std::optional<TestCase>;

}  // namespace proba::extract
