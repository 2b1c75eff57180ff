#include "proba/sandbox/sandbox.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "proba/common/internal_error.hpp"
#include "proba/common/string_utils.hpp"
#include "proba/script/console.hpp"
#include "proba/script/errors.hpp"
#include "proba/script/interpreter.hpp"
#include "proba/script/runtime_value.hpp"
#include "proba/value/number.hpp"

namespace proba::sandbox {

namespace {

struct Outcome {
  std::optional<std::string> value;
  std::optional<std::string> error;
  bool timed_out = false;
};

// Shared between the caller and the worker. A detached worker keeps it
// alive until it finishes.
struct RunState {
  script::ConsoleLog console;
  std::promise<Outcome> done;
};

// One-line message by the declared kind of the thrown value.
auto DescribeFault(const script::RuntimeValue& thrown) -> std::string {
  const script::Object* object = script::AsObject(thrown);
  if (object == nullptr || !object->IsError()) {
    return std::format("Unknown Error: {}", script::ToString(thrown));
  }
  std::string message;
  if (const script::RuntimeValue* text = object->properties.Find("message")) {
    message = script::ToString(*text);
  }
  switch (object->error_kind.value_or(script::ErrorKind::kError)) {
    case script::ErrorKind::kSyntaxError:
      return std::format("Syntax Error: {}", message);
    case script::ErrorKind::kReferenceError:
      return std::format("Reference Error: {}", message);
    case script::ErrorKind::kTypeError:
      return std::format("Type Error: {}", message);
    case script::ErrorKind::kError:
    case script::ErrorKind::kRangeError:
      break;
  }
  return std::format("Error: {}", message);
}

// Runs on the worker. The interpreter (and every object it created) is
// gone when this returns, so the value is rendered here.
auto Evaluate(
    RunState& state, const std::string& code, script::RunLimits limits,
    std::chrono::milliseconds timeout) -> Outcome {
  uint64_t max_steps = limits.max_steps;
  script::Interpreter interp(state.console, std::move(limits));
  try {
    script::RuntimeValue result = interp.Run(code);
    Outcome outcome;
    if (!script::IsUndefined(result)) {
      outcome.value = interp.Render(result);
    }
    return outcome;
  } catch (const script::ThrowSignal& signal) {
    return Outcome{.error = DescribeFault(signal.Value())};
  } catch (const script::SyntaxError& error) {
    return Outcome{.error = std::format("Syntax Error: {}", error.Message())};
  } catch (const script::Interrupted& interrupted) {
    if (interrupted.Reason() == script::InterruptReason::kStepBudget) {
      return Outcome{
          .error = std::format(
              "Code execution exceeded the step budget of {} steps",
              max_steps),
          .timed_out = true};
    }
    return Outcome{.error = TimeoutMessage(timeout), .timed_out = true};
  } catch (const common::InternalError& error) {
    spdlog::error("{}", error.what());
    return Outcome{.error = std::format("Error: {}", error.what())};
  } catch (const std::exception& error) {
    return Outcome{.error = std::format("Error: {}", error.what())};
  }
}

}  // namespace

Sandbox::Sandbox(SandboxOptions options) : options_(options) {
}

auto Sandbox::Run(std::string_view code) const -> ExecutionResult {
  auto start = std::chrono::steady_clock::now();
  auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  auto state = std::make_shared<RunState>();
  std::future<Outcome> future = state->done.get_future();

  script::RunLimits limits{
      .max_call_depth = options_.max_call_depth,
      .max_steps = options_.max_steps,
      .deadline = start + options_.timeout,
      .stop = {},
  };
  std::jthread worker(
      [state, source = std::string(code), limits,
       timeout = options_.timeout](std::stop_token stop) mutable {
        limits.stop = std::move(stop);
        state->done.set_value(
            Evaluate(*state, source, std::move(limits), timeout));
      });

  if (future.wait_for(options_.timeout) != std::future_status::ready) {
    // The worker stops at its next budget check; output it appends after
    // this point is not part of the result.
    worker.request_stop();
    worker.detach();
    spdlog::debug(
        "sandbox: run timed out after {} ms", options_.timeout.count());
    return ExecutionResult{
        .output = FormatOutput(state->console.Snapshot(), std::nullopt),
        .error = TimeoutMessage(options_.timeout),
        .execution_time_ms = elapsed_ms(),
        .timed_out = true,
    };
  }

  Outcome outcome = future.get();
  worker.join();
  ExecutionResult result{
      .output = FormatOutput(state->console.Snapshot(), outcome.value),
      .error = std::move(outcome.error),
      .execution_time_ms = elapsed_ms(),
      .timed_out = outcome.timed_out,
  };
  spdlog::debug(
      "sandbox: run finished in {:.2f} ms{}", result.execution_time_ms,
      result.error ? " with an error" : "");
  return result;
}

auto FormatOutput(
    const std::vector<script::LogRecord>& records,
    const std::optional<std::string>& value) -> std::string {
  std::string output = script::FormatRecords(records);
  if (value) {
    output += "\n→ ";
    output += *value;
  }
  return std::string(common::Trim(output));
}

auto TimeoutMessage(std::chrono::milliseconds timeout) -> std::string {
  return std::format(
      "Code execution timed out after {} seconds",
      FormatNumber(static_cast<double>(timeout.count()) / 1000.0));
}

}  // namespace proba::sandbox
