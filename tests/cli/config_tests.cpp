#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace proba::test {
namespace {

class ConfigTest : public CliTestFixture {};

// Test: proba status works without any proba.toml
TEST_F(ConfigTest, StatusWithoutConfig) {
  auto result = Run({"status"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("remote: not configured"));
  EXPECT_TRUE(result.Mentions("annotation formats:"));
  EXPECT_TRUE(result.Mentions("functionName(arg1, arg2) => expected"));
}

// Test: an api_key in proba.toml configures the remote service
TEST_F(ConfigTest, StatusWithConfiguredKey) {
  WriteFile("proba.toml", "[remote]\napi_key = \"secret-key\"\n");

  auto result = Run({"status"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("remote: configured"));
  EXPECT_TRUE(result.Mentions("RapidAPI OneCompiler is configured and ready"));
}

// Test: placeholder keys count as unconfigured
TEST_F(ConfigTest, PlaceholderKeyIsNotConfigured) {
  WriteFile("proba.toml", "[remote]\napi_key = \"your_rapidapi_key_here\"\n");

  auto result = Run({"status"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("remote: not configured"));
}

// Test: proba.toml is found from a subdirectory
TEST_F(ConfigTest, FindsConfigInParentDirectory) {
  WriteFile("proba.toml", "[remote]\napi_key = \"secret-key\"\n");
  WriteFile("src/sub/.keep", "");

  auto result = RunIn(TestDir() / "src" / "sub", {"status"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("remote: configured"));
}

// Test: -C changes directory before the config is discovered
TEST_F(ConfigTest, ChangeDirectoryOption) {
  WriteFile("project/proba.toml", "[remote]\napi_key = \"secret-key\"\n");

  auto result = Run({"-C", "project", "status"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("remote: configured"));
}

// Test: -C to a missing directory fails
TEST_F(ConfigTest, ChangeDirectoryMissing) {
  auto result = Run({"-C", "nowhere", "status"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("cannot change to 'nowhere'"));
}

// Test: --config loads an explicit file
TEST_F(ConfigTest, ExplicitConfigFile) {
  WriteFile("custom.toml", "[remote]\napi_key = \"secret-key\"\n");

  auto result = Run({"--config", "custom.toml", "status"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Mentions("remote: configured"));
}

// Test: --config to a missing file fails
TEST_F(ConfigTest, ExplicitConfigMissing) {
  auto result = Run({"--config", "missing.toml", "status"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("cannot open"));
}

// Test: TOML syntax errors are reported
TEST_F(ConfigTest, SyntaxError) {
  WriteFile("proba.toml", "[sandbox\ntimeout_ms = 5\n");

  auto result = Run({"status"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("failed to parse"));
}

// Test: a value of the wrong type names the key
TEST_F(ConfigTest, WrongType) {
  WriteFile("proba.toml", "[sandbox]\ntimeout_ms = \"fast\"\n");

  auto result = Run({"status"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("'sandbox.timeout_ms' must be an integer"));
}

// Test: an unknown log level is rejected
TEST_F(ConfigTest, UnknownLogLevel) {
  WriteFile("proba.toml", "[log]\nlevel = \"loud\"\n");

  auto result = Run({"status"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("log.level"));
}

// Test: init and languages do not read the configuration
TEST_F(ConfigTest, InitIgnoresBrokenConfig) {
  WriteFile("proba.toml", "[sandbox\n");

  auto languages = Run({"languages"});
  EXPECT_TRUE(languages.Success()) << languages.output;

  auto init = Run({"init", "python"});
  EXPECT_TRUE(init.Success()) << init.output;
}

// Test: the sandbox timeout comes from proba.toml
TEST_F(ConfigTest, SandboxTimeoutFromConfig) {
  WriteProbaToml(200);
  WriteFile("loop.js", "while (true) {}\n");

  auto result = Run({"run", "loop.js"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("Code execution timed out after 0.2 seconds"));
}

// Test: the call depth limit comes from proba.toml
TEST_F(ConfigTest, CallDepthFromConfig) {
  WriteProbaToml(2000, "max_call_depth = 50\n");
  WriteFile(
      "deep.js",
      "function down(n) { return n === 0 ? 0 : down(n - 1); }\n"
      "down(100);\n");

  auto result = Run({"run", "deep.js"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Mentions("Maximum call stack size exceeded"));
}

}  // namespace
}  // namespace proba::test
