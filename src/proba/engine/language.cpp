#include "proba/engine/language.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proba/common/string_utils.hpp"

namespace proba::engine {

namespace {

constexpr std::string_view kJavaScriptBoilerplate = R"(// JavaScript Code
function solve() {
    // Write your solution here
    return "Hello World!";
}

console.log(solve());)";

constexpr std::string_view kPythonBoilerplate = R"(# Python Code
def solve():
    # Write your solution here
    return "Hello World!"

print(solve()))";

constexpr std::string_view kJavaBoilerplate = R"(import java.util.*;

public class Main {
    public static void main(String[] args) {
        Scanner sc = new Scanner(System.in);

        // Write your solution here
        System.out.println("Hello World!");

        sc.close();
    }
})";

}  // namespace

auto ParseLanguage(std::string_view id) -> std::optional<Language> {
  std::string lower = common::ToLower(common::Trim(id));
  if (lower == "javascript" || lower == "js") {
    return Language::kJavaScript;
  }
  if (lower == "python" || lower == "py") {
    return Language::kPython;
  }
  if (lower == "java") {
    return Language::kJava;
  }
  return std::nullopt;
}

auto ToString(Language language) -> std::string_view {
  switch (language) {
    case Language::kJavaScript:
      return "javascript";
    case Language::kPython:
      return "python";
    case Language::kJava:
      return "java";
  }
  return "javascript";
}

auto GetSupportedLanguages() -> std::vector<std::string> {
  return {"javascript", "python", "java"};
}

auto UnsupportedLanguageMessage(std::string_view id) -> std::string {
  return std::format(
      "Language \"{}\" is not supported yet. Supported languages: {}", id,
      common::Join(GetSupportedLanguages(), ", "));
}

auto DefaultBoilerplate(Language language) -> std::string_view {
  switch (language) {
    case Language::kJavaScript:
      return kJavaScriptBoilerplate;
    case Language::kPython:
      return kPythonBoilerplate;
    case Language::kJava:
      return kJavaBoilerplate;
  }
  return {};
}

auto LanguageFromPath(std::string_view path) -> std::optional<Language> {
  size_t dot = path.rfind('.');
  if (dot == std::string_view::npos) {
    return std::nullopt;
  }
  std::string extension = common::ToLower(path.substr(dot + 1));
  if (extension == "js" || extension == "mjs" || extension == "cjs") {
    return Language::kJavaScript;
  }
  if (extension == "py") {
    return Language::kPython;
  }
  if (extension == "java") {
    return Language::kJava;
  }
  return std::nullopt;
}

}  // namespace proba::engine
