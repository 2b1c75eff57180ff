#include "proba/engine/execution_router.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "proba/engine/language.hpp"
#include "proba/remote/dispatcher.hpp"
#include "proba/sandbox/sandbox.hpp"

namespace proba::engine {

ExecutionRouter::ExecutionRouter(
    sandbox::Sandbox local, remote::RemoteDispatcher dispatcher)
    : sandbox_(std::move(local)), dispatcher_(std::move(dispatcher)) {
}

auto ExecutionRouter::Run(
    std::string_view code, std::string_view language,
    std::string_view stdin_text) const -> LanguageExecutionResult {
  auto parsed = ParseLanguage(language);
  if (!parsed) {
    LanguageExecutionResult result;
    result.error = UnsupportedLanguageMessage(language);
    result.language = std::string(language);
    return result;
  }

  auto start = std::chrono::steady_clock::now();
  LanguageExecutionResult result;
  result.language = std::string(ToString(*parsed));
  spdlog::debug("router: dispatching {} run", result.language);

  try {
    if (*parsed == Language::kJavaScript) {
      static_cast<sandbox::ExecutionResult&>(result) = sandbox_.Run(code);
      return result;
    }
    remote::RemoteOutput output =
        dispatcher_.Run(code, result.language, stdin_text);
    result.output = std::move(output.output);
    result.error = std::move(output.error);
  } catch (const std::exception& error) {
    spdlog::error("router: {} run failed: {}", result.language, error.what());
    result.output.clear();
    result.error = error.what();
  }
  result.execution_time_ms = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
  return result;
}

}  // namespace proba::engine
