#pragma once

#include <string>
#include <string_view>

#include "proba/remote/dispatcher.hpp"
#include "proba/sandbox/execution_result.hpp"
#include "proba/sandbox/sandbox.hpp"

namespace proba::engine {

struct LanguageExecutionResult : sandbox::ExecutionResult {
  // Canonical identifier of the backend that ran, or the id as given when
  // it was not recognized.
  std::string language;
};

// Routes a run to the in-process sandbox or to the remote dispatcher.
class ExecutionRouter {
 public:
  ExecutionRouter(sandbox::Sandbox local, remote::RemoteDispatcher dispatcher);

  // Never throws. Unknown languages yield an error result with zero time.
  [[nodiscard]] auto Run(
      std::string_view code, std::string_view language,
      std::string_view stdin_text = {}) const -> LanguageExecutionResult;

  [[nodiscard]] auto Local() const -> const sandbox::Sandbox& {
    return sandbox_;
  }
  [[nodiscard]] auto Remote() const -> const remote::RemoteDispatcher& {
    return dispatcher_;
  }

 private:
  sandbox::Sandbox sandbox_;
  remote::RemoteDispatcher dispatcher_;
};

}  // namespace proba::engine
