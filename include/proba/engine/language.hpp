#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace proba::engine {

enum class Language : uint8_t {
  kJavaScript,  // in-process sandbox
  kPython,      // remote, offline approximation as fallback
  kJava,        // remote only
};

// Case-insensitive; accepts the aliases "js" and "py".
auto ParseLanguage(std::string_view id) -> std::optional<Language>;

// Canonical lower-case identifier.
auto ToString(Language language) -> std::string_view;

// In routing order: javascript, python, java.
auto GetSupportedLanguages() -> std::vector<std::string>;

auto UnsupportedLanguageMessage(std::string_view id) -> std::string;

// Starter program shown when the language changes.
auto DefaultBoilerplate(Language language) -> std::string_view;

// By file extension (.js .mjs .cjs, .py, .java).
auto LanguageFromPath(std::string_view path) -> std::optional<Language>;

[[nodiscard]] inline auto IsRemote(Language language) -> bool {
  return language != Language::kJavaScript;
}

}  // namespace proba::engine
