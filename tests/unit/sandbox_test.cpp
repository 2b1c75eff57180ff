#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "proba/sandbox/execution_result.hpp"
#include "proba/sandbox/sandbox.hpp"
#include "proba/script/console.hpp"

namespace proba::sandbox {
namespace {

using std::chrono::milliseconds;

TEST(SandboxTest, CapturesConsoleAndResultValue) {
  Sandbox sandbox;
  ExecutionResult result = sandbox.Run(R"(
    console.log("Hello");
    console.warn("careful");
    1 + 1;
  )");
  EXPECT_FALSE(result.error.has_value());
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.output, "Hello\n[WARN] careful\n\n→ 2");
  EXPECT_GE(result.execution_time_ms, 0);
}

TEST(SandboxTest, UndefinedResultAddsNoValueLine) {
  Sandbox sandbox;
  ExecutionResult result = sandbox.Run("console.info('x'); let y = 1;");
  EXPECT_EQ(result.output, "[INFO] x");
}

TEST(SandboxTest, EmptyProgram) {
  Sandbox sandbox;
  ExecutionResult result = sandbox.Run("");
  EXPECT_EQ(result.output, "");
  EXPECT_TRUE(result.Succeeded());
}

TEST(SandboxTest, ClassifiesErrorsByKind) {
  Sandbox sandbox;
  EXPECT_EQ(sandbox.Run("missing()").error, "Reference Error: missing is not defined");
  EXPECT_EQ(sandbox.Run("null.x").error,
            "Type Error: Cannot read properties of null (reading 'x')");
  EXPECT_EQ(sandbox.Run("throw new Error('boom')").error, "Error: boom");
  EXPECT_EQ(sandbox.Run("throw new RangeError('r')").error, "Error: r");
  EXPECT_EQ(sandbox.Run("throw new SyntaxError('s')").error, "Syntax Error: s");
  EXPECT_EQ(sandbox.Run("throw 42").error, "Unknown Error: 42");
  EXPECT_EQ(sandbox.Run("let = ;").error, "Syntax Error: Unexpected token '='");
}

TEST(SandboxTest, OutputBeforeErrorIsKept) {
  Sandbox sandbox;
  ExecutionResult result = sandbox.Run("console.log('before'); undefinedFn();");
  EXPECT_EQ(result.output, "before");
  EXPECT_EQ(result.error, "Reference Error: undefinedFn is not defined");
}

TEST(SandboxTest, TimeoutReturnsPartialOutput) {
  Sandbox sandbox(SandboxOptions{.timeout = milliseconds(200)});
  auto start = std::chrono::steady_clock::now();
  ExecutionResult result = sandbox.Run("console.log('started'); while (true) {}");
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.error, "Code execution timed out after 0.2 seconds");
  EXPECT_EQ(result.output, "started");
  EXPECT_GE(result.execution_time_ms, 200);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// The timed-out worker keeps running briefly after Run returns; neither the
// returned result nor the next run may observe what it does afterwards.
TEST(SandboxTest, TimedOutWorkerDoesNotLeakIntoNextRun) {
  Sandbox sandbox(SandboxOptions{.timeout = milliseconds(100)});
  ExecutionResult first = sandbox.Run(
      "let i = 0; while (true) { if (i < 3) { console.log(i); } i++; }");
  ExecutionResult second = sandbox.Run("console.log('next');");

  EXPECT_TRUE(first.timed_out);
  EXPECT_EQ(first.output, "0\n1\n2");
  EXPECT_FALSE(second.timed_out);
  EXPECT_EQ(second.output, "next");
}

TEST(SandboxTest, StepBudget) {
  Sandbox sandbox(SandboxOptions{.max_steps = 10000});
  ExecutionResult result = sandbox.Run("for (;;) {}");
  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(
      result.error, "Code execution exceeded the step budget of 10000 steps");
}

TEST(SandboxTest, CallDepthIsConfigurable) {
  Sandbox sandbox(SandboxOptions{.max_call_depth = 20});
  ExecutionResult result =
      sandbox.Run("function down(n) { return n === 0 ? 0 : down(n - 1); } down(50)");
  EXPECT_EQ(result.error, "Error: Maximum call stack size exceeded");
  EXPECT_FALSE(result.timed_out);
}

TEST(SandboxTest, DeeplyNestedSourceIsASyntaxError) {
  Sandbox sandbox;
  EXPECT_EQ(
      sandbox.Run(std::string(100000, '(')).error,
      "Syntax Error: Expression nested too deeply");
  EXPECT_EQ(
      sandbox.Run(std::string(100000, '[')).error,
      "Syntax Error: Expression nested too deeply");
}

TEST(SandboxTest, DeeplyNestedResultIsARangeError) {
  Sandbox sandbox;
  ExecutionResult result = sandbox.Run(
      "let a = []; for (let i = 0; i < 50000; i++) a = [a]; a");
  EXPECT_EQ(result.error, "Error: Value nested deeper than 512 levels");
  EXPECT_FALSE(result.timed_out);
}

TEST(SandboxTest, FlatteningACycleIsARangeError) {
  Sandbox sandbox;
  EXPECT_EQ(
      sandbox.Run("const a = [1]; a.push(a); a.flat(Infinity)").error,
      "Error: Maximum call stack size exceeded");
}

TEST(SandboxTest, RunsAreIsolated) {
  Sandbox sandbox;
  sandbox.Run("var leaked = 1; console.log('first');");
  ExecutionResult second = sandbox.Run("typeof leaked");
  EXPECT_EQ(second.output, "→ undefined");
}

TEST(SandboxTest, HostCapabilitiesAreUnreachable) {
  Sandbox sandbox;
  ExecutionResult result = sandbox.Run(
      "[typeof window, typeof process, typeof require, typeof globalThis]"
      ".join(',')");
  EXPECT_EQ(result.output, "→ undefined,undefined,undefined,undefined");
  EXPECT_EQ(
      sandbox.Run("require('fs')").error,
      "Type Error: require is not a function");
}

TEST(SandboxTest, RepeatedRunsAreDeterministic) {
  Sandbox sandbox;
  const char* code = "const a = [3, 1, 2]; console.log(a.sort()); a.length";
  ExecutionResult first = sandbox.Run(code);
  ExecutionResult second = sandbox.Run(code);
  EXPECT_EQ(first.output, second.output);
  EXPECT_EQ(first.error, second.error);
}

TEST(SandboxTest, FormatOutputTrimsAndAppendsValue) {
  std::vector<script::LogRecord> records = {
      {.level = script::LogLevel::kLog, .message = "  line", .timestamp = {}},
      {.level = script::LogLevel::kError, .message = "bad", .timestamp = {}},
  };
  EXPECT_EQ(FormatOutput(records, std::nullopt), "line\n[ERROR] bad");
  EXPECT_EQ(FormatOutput({}, std::string("7")), "→ 7");
}

TEST(SandboxTest, TimeoutMessage) {
  EXPECT_EQ(
      TimeoutMessage(milliseconds(5000)),
      "Code execution timed out after 5 seconds");
  EXPECT_EQ(
      TimeoutMessage(milliseconds(1500)),
      "Code execution timed out after 1.5 seconds");
}

}  // namespace
}  // namespace proba::sandbox
