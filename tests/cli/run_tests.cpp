#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace proba::test {
namespace {

class RunTest : public CliTestFixture {
 protected:
  void SetUp() override {
    CliTestFixture::SetUp();
    WriteProbaToml(2000);
  }
};

// Test: console output is printed
TEST_F(RunTest, PrintsConsoleOutput) {
  WriteFile("hello.js", "console.log(\"hi\", 1 + 2);\n");

  auto result = Run({"run", "hello.js"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "hi 3\n");
}

// Test: a trailing expression value is shown after an arrow
TEST_F(RunTest, PrintsCompletionValue) {
  WriteFile("value.js", "console.log(\"hi\");\n6 * 7;\n");

  auto result = Run({"run", "value.js"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("hi"));
  EXPECT_TRUE(result.Mentions("→ 42"));
}

// Test: uncaught errors exit non-zero
TEST_F(RunTest, ReportsThrownError) {
  WriteFile("throw.js", "throw new Error(\"boom\");\n");

  auto result = Run({"run", "throw.js"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("error:"));
  EXPECT_TRUE(result.Mentions("boom"));
}

// Test: output produced before an error is still printed
TEST_F(RunTest, KeepsOutputBeforeError) {
  WriteFile("partial.js", "console.log(\"before\");\nmissing();\n");

  auto result = Run({"run", "partial.js"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("before"));
  EXPECT_TRUE(result.Mentions("missing is not defined"));
}

// Test: syntax errors are reported
TEST_F(RunTest, ReportsSyntaxError) {
  WriteFile("broken.js", "let = ;\n");

  auto result = Run({"run", "broken.js"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("Syntax Error"));
}

// Test: Python runs offline and reads --stdin
TEST_F(RunTest, PythonOfflineWithStdin) {
  WriteFile("greet.py", "name = input()\nprint(\"Hi\", name)\n");

  auto result = Run({"run", "greet.py", "--stdin", "Ada"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "Hi Ada\n");
}

// Test: --stdin-file supplies standard input
TEST_F(RunTest, StdinFromFile) {
  WriteFile("sum.py", "a = input()\nb = input()\nprint(a + b)\n");
  WriteFile("input.txt", "2\n3\n");

  auto result = Run({"run", "sum.py", "--stdin-file", "input.txt"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("23"));
}

// Test: a missing --stdin-file is an error
TEST_F(RunTest, StdinFileMissing) {
  WriteFile("sum.py", "print(1)\n");

  auto result = Run({"run", "sum.py", "--stdin-file", "absent.txt"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("absent.txt"));
}

// Test: Java needs an API key
TEST_F(RunTest, JavaRequiresKey) {
  WriteFile(
      "Main.java",
      "public class Main { public static void main(String[] a) {} }\n");

  auto result = Run({"run", "Main.java"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("Java execution requires a valid RapidAPI key"));
}

// Test: --language overrides the file extension
TEST_F(RunTest, LanguageOverride) {
  WriteFile("script.txt", "console.log(\"from text\");\n");

  auto result = Run({"run", "script.txt", "--language", "js"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("from text"));
}

// Test: unknown extensions need --language
TEST_F(RunTest, CannotInferLanguage) {
  WriteFile("script.txt", "console.log(1);\n");

  auto result = Run({"run", "script.txt"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions(
      "cannot infer the language of 'script.txt', pass --language"));
}

// Test: unsupported languages are reported
TEST_F(RunTest, UnsupportedLanguage) {
  WriteFile("prog.cob", "DISPLAY 'HI'.\n");

  auto result = Run({"run", "prog.cob", "--language", "cobol"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("Language \"cobol\" is not supported yet"));
}

// Test: a missing source file is reported
TEST_F(RunTest, MissingSourceFile) {
  auto result = Run({"run", "nope.js"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("cannot open 'nope.js'"));
}

// Test: the languages command lists every language
TEST_F(RunTest, LanguagesCommand) {
  auto result = Run({"languages"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "javascript\npython\njava\n");
}

}  // namespace
}  // namespace proba::test
