#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "proba/config/engine_config.hpp"
#include "proba/remote/remote_config.hpp"

namespace proba::config {
namespace {

auto ErrorOf(const std::string& text) -> std::string {
  auto config = ParseConfig(text, "proba.toml");
  EXPECT_FALSE(config.has_value());
  return config ? "" : config.error().primary.message;
}

TEST(EngineConfigTest, EmptyFileKeepsDefaults) {
  auto config = ParseConfig("", "proba.toml");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->options.sandbox.timeout, std::chrono::milliseconds(5000));
  EXPECT_EQ(config->options.sandbox.max_call_depth, 500u);
  EXPECT_EQ(config->options.sandbox.max_steps, 0u);
  EXPECT_EQ(config->options.remote.endpoint, remote::kDefaultEndpoint);
  EXPECT_EQ(config->options.remote.host, remote::kDefaultHost);
  EXPECT_TRUE(config->options.remote.api_key.empty());
  EXPECT_EQ(config->log_level, "warn");
}

TEST(EngineConfigTest, ReadsEverySection) {
  auto config = ParseConfig(
      R"(
[sandbox]
timeout_ms = 250
max_call_depth = 64
max_steps = 1000000

[remote]
endpoint = "https://example.test/run"
host = "example.test"
api_key = "abc"
timeout_ms = 9000

[log]
level = "debug"
)",
      "proba.toml");
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;
  EXPECT_EQ(config->options.sandbox.timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(config->options.sandbox.max_call_depth, 64u);
  EXPECT_EQ(config->options.sandbox.max_steps, 1000000u);
  EXPECT_EQ(config->options.remote.endpoint, "https://example.test/run");
  EXPECT_EQ(config->options.remote.host, "example.test");
  EXPECT_EQ(config->options.remote.api_key, "abc");
  EXPECT_EQ(config->options.remote.timeout, std::chrono::milliseconds(9000));
  EXPECT_EQ(config->log_level, "debug");
}

TEST(EngineConfigTest, SyntaxError) {
  std::string message = ErrorOf("[sandbox\ntimeout_ms = 1");
  EXPECT_TRUE(message.starts_with("failed to parse proba.toml")) << message;
}

TEST(EngineConfigTest, WrongTypes) {
  EXPECT_EQ(
      ErrorOf("[sandbox]\ntimeout_ms = \"fast\""),
      "proba.toml: 'sandbox.timeout_ms' must be an integer");
  EXPECT_EQ(
      ErrorOf("[remote]\napi_key = 12"),
      "proba.toml: 'remote.api_key' must be a string");
}

TEST(EngineConfigTest, OutOfRange) {
  EXPECT_EQ(
      ErrorOf("[sandbox]\ntimeout_ms = 0"),
      "proba.toml: 'sandbox.timeout_ms' must be between 1 and 2147483647");
  EXPECT_EQ(
      ErrorOf("[sandbox]\nmax_call_depth = 100001"),
      "proba.toml: 'sandbox.max_call_depth' must be between 1 and 100000");
}

TEST(EngineConfigTest, UnknownLogLevel) {
  EXPECT_EQ(
      ErrorOf("[log]\nlevel = \"loud\""),
      "proba.toml: 'log.level' must be one of trace, debug, info, warn, "
      "error, off");
}

TEST(EngineConfigTest, LogLevels) {
  for (const char* level : {"trace", "debug", "info", "warn", "error", "off"}) {
    EXPECT_TRUE(IsValidLogLevel(level)) << level;
  }
  EXPECT_FALSE(IsValidLogLevel("WARN"));
  EXPECT_FALSE(IsValidLogLevel(""));
}

TEST(EngineConfigTest, ApiKeyOverride) {
  EngineConfig config;
  config.options.remote.api_key = "from-file";

  ApplyApiKeyOverride(config, nullptr);
  EXPECT_EQ(config.options.remote.api_key, "from-file");
  ApplyApiKeyOverride(config, "");
  EXPECT_EQ(config.options.remote.api_key, "from-file");
  ApplyApiKeyOverride(config, "from-env");
  EXPECT_EQ(config.options.remote.api_key, "from-env");
}

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("proba_config_test_" +
             std::string(
                 ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::create_directories(root_ / "a" / "b");
  }

  void TearDown() override {
    std::filesystem::remove_all(root_);
  }

  void Write(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
  }

  std::filesystem::path root_;
};

TEST_F(ConfigFileTest, FindsConfigInParent) {
  Write(root_ / "proba.toml", "[sandbox]\ntimeout_ms = 10\n");
  auto found = FindConfig(root_ / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(
      std::filesystem::weakly_canonical(*found),
      std::filesystem::weakly_canonical(root_ / "proba.toml"));

  auto config = LoadConfig(*found);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->options.sandbox.timeout, std::chrono::milliseconds(10));
  EXPECT_EQ(
      std::filesystem::weakly_canonical(config->root_dir),
      std::filesystem::weakly_canonical(root_));
}

TEST_F(ConfigFileTest, MissingFile) {
  auto config = LoadConfig(root_ / "absent.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_TRUE(config.error().primary.message.starts_with("cannot open"));
}

}  // namespace
}  // namespace proba::config
