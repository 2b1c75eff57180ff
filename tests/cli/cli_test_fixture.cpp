#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <utility>

namespace proba::test {
namespace {

auto UniqueDirName() -> std::string {
  static std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, 999999);
  return std::format("proba_cli_test_{:06}", dis(gen));
}

// Single-quoted for /bin/sh
auto ShellQuote(const std::string& arg) -> std::string {
  std::string quoted = "'";
  for (char c : arg) {
    quoted += c == '\'' ? std::string("'\\''") : std::string(1, c);
  }
  return quoted + "'";
}

}  // namespace

void CliTestFixture::SetUp() {
  test_dir_ = std::filesystem::temp_directory_path() / UniqueDirName();
  std::filesystem::create_directories(test_dir_);

  const char* from_env = std::getenv("PROBA_BIN");
  proba_bin_ = from_env != nullptr ? from_env : PROBA_BIN;
}

void CliTestFixture::TearDown() {
  if (!test_dir_.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  return RunIn(test_dir_, args);
}

auto CliTestFixture::RunIn(
    const std::filesystem::path& dir, const std::vector<std::string>& args)
    -> CliResult {
  std::string command = std::format(
      "cd {} && env -u RAPIDAPI_KEY {}", ShellQuote(dir.string()),
      ShellQuote(proba_bin_.string()));
  for (const auto& arg : args) {
    command += " " + ShellQuote(arg);
  }
  command += " 2>&1";

  FILE* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return CliResult{.exit_code = -1, .output = "popen failed"};
  }
  std::string output;
  std::array<char, 4096> buffer{};
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  int status = pclose(pipe);
  return CliResult{
      .exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1,
      .output = std::move(output),
  };
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("cannot write " + full_path.string());
  }
  out << content;
}

void CliTestFixture::WriteProbaToml(int timeout_ms, const std::string& extra) {
  WriteFile(
      "proba.toml",
      std::format("[sandbox]\ntimeout_ms = {}\n{}", timeout_ms, extra));
}

auto CliTestFixture::FileExists(
    const std::filesystem::path& relative_path) const -> bool {
  return std::filesystem::exists(test_dir_ / relative_path);
}

auto CliTestFixture::ReadFile(const std::filesystem::path& relative_path) const
    -> std::string {
  std::ifstream in(test_dir_ / relative_path);
  if (!in) {
    throw std::runtime_error("cannot read " + relative_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace proba::test
