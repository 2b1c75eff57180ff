#include "proba/extract/annotation_parser.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "proba/common/string_utils.hpp"
#include "proba/extract/test_case.hpp"
#include "proba/extract/value_parser.hpp"
#include "proba/value/json.hpp"
#include "proba/value/value.hpp"

namespace proba::extract {

namespace {

struct GrammarMatch {
  std::string function_name;
  std::vector<Value> input;
  Value expected;
};

using Grammar = auto (*)(const std::string& content)
    -> std::optional<GrammarMatch>;

// name([a, b], expected)
auto MatchArrayForm(const std::string& content)
    -> std::optional<GrammarMatch> {
  static const std::regex kPattern(R"((\w+)\s*\(\s*\[(.*?)\]\s*,\s*(.*?)\s*\))");
  std::smatch match;
  if (!std::regex_search(content, match, kPattern)) {
    return std::nullopt;
  }
  auto input = ParseJsonArguments(match[2].str());
  if (!input) {
    return std::nullopt;
  }
  return GrammarMatch{
      .function_name = match[1].str(),
      .input = *std::move(input),
      .expected = ParseValue(match[3].str()),
  };
}

// name(a, b) => expected
auto MatchArrowForm(const std::string& content)
    -> std::optional<GrammarMatch> {
  static const std::regex kPattern(R"((\w+)\s*\(\s*(.*?)\s*\)\s*=>\s*(.+))");
  std::smatch match;
  if (!std::regex_search(content, match, kPattern)) {
    return std::nullopt;
  }
  std::vector<Value> input;
  std::string arguments = match[2].str();
  if (!common::Trim(arguments).empty()) {
    for (const auto& piece : common::Split(arguments, ",")) {
      input.push_back(ParseArgument(piece));
    }
  }
  return GrammarMatch{
      .function_name = match[1].str(),
      .input = std::move(input),
      .expected = ParseValue(match[3].str()),
  };
}

// assert(name(a, b) === expected), also `==`
auto MatchAssertForm(const std::string& content)
    -> std::optional<GrammarMatch> {
  static const std::regex kPattern(
      R"(assert\s*\(\s*(\w+)\s*\(\s*(.*?)\s*\)\s*===?\s*(.*?)\s*\))");
  std::smatch match;
  if (!std::regex_search(content, match, kPattern)) {
    return std::nullopt;
  }
  return GrammarMatch{
      .function_name = match[1].str(),
      .input = ParseArgumentList(match[2].str()),
      .expected = ParseValue(match[3].str()),
  };
}

// Priority order.
constexpr std::array<Grammar, 3> kGrammars = {
    MatchArrayForm,
    MatchArrowForm,
    MatchAssertForm,
};

}  // namespace

auto CommentStyleFor(std::string_view language) -> CommentStyle {
  std::string lower = common::ToLower(language);
  if (lower == "python" || lower == "py") {
    return CommentStyle::kHash;
  }
  return CommentStyle::kCLike;
}

auto IsCommentLine(std::string_view trimmed_line, CommentStyle style) -> bool {
  switch (style) {
    case CommentStyle::kCLike:
      return trimmed_line.starts_with("//") || trimmed_line.starts_with("*") ||
             trimmed_line.starts_with("/*");
    case CommentStyle::kHash:
      return trimmed_line.starts_with("#");
  }
  return false;
}

auto StripCommentMarker(std::string_view trimmed_line, CommentStyle style)
    -> std::string {
  std::string_view content = trimmed_line;
  switch (style) {
    case CommentStyle::kCLike:
      if (content.ends_with("*/")) {
        content.remove_suffix(2);
      }
      if (content.starts_with("//")) {
        content.remove_prefix(2);
      } else if (content.starts_with("/*") || content.starts_with("*")) {
        // Doc-comment openers and continuation lines: "/**", " * ".
        size_t body = content.find_first_not_of('*', 1);
        content.remove_prefix(
            body == std::string_view::npos ? content.size() : body);
      }
      break;
    case CommentStyle::kHash:
      if (content.starts_with("#")) {
        content.remove_prefix(1);
      }
      break;
  }
  return std::string(common::Trim(content));
}

auto AnnotationParser::Extract(std::string_view code) const
    -> ExtractionResult {
  ExtractionResult result;
  std::vector<std::string> lines = common::SplitLines(code);

  for (size_t i = 0; i < lines.size(); ++i) {
    std::string_view trimmed = common::Trim(lines[i]);
    if (!IsCommentLine(trimmed, style_)) {
      continue;
    }
    std::string content = StripCommentMarker(trimmed, style_);
    if (content.empty()) {
      continue;
    }

    auto line_number = static_cast<uint32_t>(i + 1);
    if (content.size() > kMaxCommentLength) {
      result.errors.push_back(
          ParseError{
              .line = line_number,
              .message = "Comment too long to parse",
              .original_text = std::move(content),
          });
      continue;
    }
    auto index = static_cast<uint32_t>(result.test_cases.size());
    if (auto test_case = ParseLine(content, index, line_number)) {
      result.test_cases.push_back(*std::move(test_case));
    } else {
      result.errors.push_back(
          ParseError{
              .line = line_number,
              .message = "Unable to parse test case format",
              .original_text = std::move(content),
          });
    }
  }
  return result;
}

auto AnnotationParser::ParseLine(
    std::string_view content, uint32_t index, uint32_t line)
    -> std::optional<TestCase> {
  if (content.size() > kMaxCommentLength) {
    return std::nullopt;
  }
  std::string text(content);
  for (Grammar grammar : kGrammars) {
    if (auto match = grammar(text)) {
      return TestCase{
          .name = std::format("Test {}", index + 1),
          .function_name = std::move(match->function_name),
          .input = std::move(match->input),
          .expected = std::move(match->expected),
          .source_line = line,
          .user_inputs = std::nullopt,
      };
    }
  }
  return std::nullopt;
}

auto AnnotationParser::GetSupportedFormats() -> std::vector<std::string> {
  return {
      "functionName([arg1, arg2], expected)",
      "functionName(arg1, arg2) => expected",
      "assert(functionName(arg1, arg2) === expected)",
  };
}

auto AnnotationParser::ValidateTestCase(const TestCase& test_case)
    -> std::vector<std::string> {
  std::vector<std::string> problems;
  if (!common::IsIdentifier(test_case.function_name)) {
    problems.emplace_back("Invalid function name");
  }
  if (common::Trim(test_case.name).empty()) {
    problems.emplace_back("Test case must have a name");
  }
  if (test_case.expected.IsUndefined()) {
    problems.emplace_back("Test case must have an expected value");
  }
  return problems;
}

auto BuildTestCase(const FunctionTestForm& form, uint32_t index)
    -> std::optional<TestCase> {
  if (common::Trim(form.function_name).empty() || form.expected.empty()) {
    return std::nullopt;
  }

  std::vector<Value> input;
  if (auto json = ParseJsonArguments(form.inputs)) {
    input = *std::move(json);
  } else {
    for (const auto& piece : common::Split(form.inputs, ",")) {
      std::string_view trimmed = common::Trim(piece);
      if (auto value = ParseJson(trimmed)) {
        input.push_back(*std::move(value));
      } else {
        input.push_back(Value::MakeText(std::string(trimmed)));
      }
    }
  }

  Value expected;
  if (auto json = ParseJson(form.expected)) {
    expected = *std::move(json);
  } else {
    expected = Value::MakeText(form.expected);
  }

  return TestCase{
      .name = common::Trim(form.name).empty() ? std::format("Test {}", index + 1)
                                              : form.name,
      .function_name = std::string(common::Trim(form.function_name)),
      .input = std::move(input),
      .expected = std::move(expected),
      .source_line = index + 1,
      .user_inputs = form.user_inputs,
  };
}

}  // namespace proba::extract
