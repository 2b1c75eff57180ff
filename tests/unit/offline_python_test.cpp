#include <gtest/gtest.h>

#include <string>

#include "proba/remote/offline_python.hpp"

namespace proba::remote {
namespace {

auto Output(const std::string& code, const std::string& stdin_text = "")
    -> std::string {
  auto result = RunOfflinePython(code, stdin_text);
  EXPECT_TRUE(result.has_value()) << result.error().primary.message;
  return result.value_or("");
}

TEST(OfflinePythonTest, PrintsLiterals) {
  EXPECT_EQ(Output("print(\"Hello, World!\")"), "Hello, World!\n");
  EXPECT_EQ(Output("print('a', 1, 2.5)"), "a 1 2.5\n");
  EXPECT_EQ(Output("print()"), "\n");
}

TEST(OfflinePythonTest, NoOutput) {
  EXPECT_EQ(Output("x = 1\n# nothing printed"), "Code executed (no output)");
}

TEST(OfflinePythonTest, Arithmetic) {
  EXPECT_EQ(Output("x = 5\ny = 3\nprint(x + y)\nprint(x * y)"), "8\n15\n");
  EXPECT_EQ(Output("print(7 / 2)"), "3.5\n");
  EXPECT_EQ(Output("a = 'ab'\nb = 'cd'\nprint(a + b)"), "abcd\n");
}

TEST(OfflinePythonTest, ListsAndBuiltins) {
  std::string code =
      "nums = [1, 2, 3]\n"
      "print(nums)\n"
      "print(sum(nums))\n"
      "print(len(nums))\n"
      "words = ['x', 'y']\n"
      "print(words)\n";
  EXPECT_EQ(Output(code), "[1, 2, 3]\n6\n3\n['x', 'y']\n");
}

TEST(OfflinePythonTest, DefinedFunction) {
  std::string code =
      "def add(a, b):\n"
      "    # sum of two\n"
      "    return a + b\n"
      "\n"
      "print(add(2, 3))\n"
      "result = add(10, 20)\n"
      "print(result)\n";
  EXPECT_EQ(Output(code), "5\n30\n");
}

TEST(OfflinePythonTest, ReadsStdinLines) {
  std::string code =
      "name = input()\n"
      "greeting = input(\"prompt\")\n"
      "extra = input()\n"
      "print(greeting, name)\n"
      "print(extra)\n";
  EXPECT_EQ(Output(code, "Bob\n\n  Hi  \n"), "Hi Bob\n\n");
}

TEST(OfflinePythonTest, UnknownExpressionsAreText) {
  EXPECT_EQ(Output("print(foo.bar)"), "foo.bar\n");
}

TEST(OfflinePythonTest, JsonDumps) {
  std::string code =
      "import json\n"
      "words = ['a', 'b']\n"
      "print(json.dumps(words))\n"
      "print(dumps(3))\n";
  EXPECT_EQ(Output(code), "[\"a\",\"b\"]\n3\n");
}

TEST(OfflinePythonTest, TryRunsAndExceptIsSkipped) {
  std::string code =
      "try:\n"
      "    print('inside')\n"
      "except Exception as e:\n"
      "    print('handler')\n"
      "print('after')\n";
  EXPECT_EQ(Output(code), "inside\nafter\n");
}

TEST(OfflinePythonTest, DivisionByZeroFails) {
  auto result = RunOfflinePython("print(1 / 0)", "");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().primary.message, "division by zero");
}

TEST(OfflinePythonTest, RunawayRecursionFails) {
  std::string code =
      "def loop(n):\n"
      "    return loop(n)\n"
      "print(loop(1))\n";
  auto result = RunOfflinePython(code, "");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().primary.message, "maximum recursion depth exceeded");
}

TEST(OfflinePythonTest, OverlongLineFails) {
  std::string code = "x = 1\nprint('" + std::string(200000, 'a') + "')\n";
  auto result = RunOfflinePython(code, "");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(
      result.error().primary.message,
      "line 2 is too long for offline execution (200009 > 4096 characters)");
}

}  // namespace
}  // namespace proba::remote
