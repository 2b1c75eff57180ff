#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace proba::test {

// Exit status and merged stdout/stderr of one proba invocation
struct CliResult {
  int exit_code;
  std::string output;

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  // Substring match, so ANSI styling around message parts does not matter
  [[nodiscard]] auto Mentions(const std::string& text) const -> bool {
    return output.find(text) != std::string::npos;
  }
};

// Runs the built proba binary inside a fresh temporary directory.
// RAPIDAPI_KEY is removed from the child environment, so python and java
// never reach the network.
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(const std::vector<std::string>& args) -> CliResult;
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // proba.toml with the given sandbox timeout plus extra [sandbox] lines
  void WriteProbaToml(int timeout_ms, const std::string& extra = "");

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;

  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path proba_bin_;
};

}  // namespace proba::test
