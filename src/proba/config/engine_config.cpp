#include "proba/config/engine_config.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.hpp>

#include "proba/common/diagnostic.hpp"

namespace proba::config {

namespace fs = std::filesystem;

namespace {

auto Invalid(
    std::string_view source, std::string_view key,
    std::string_view expectation) -> Diagnostic {
  return Diagnostic::HostError(
      std::format("{}: '{}' must be {}", source, key, expectation));
}

// Optional integer in [min, max].
auto ReadInteger(
    const toml::table& tbl, std::string_view section, std::string_view key,
    int64_t min, int64_t max, std::string_view source)
    -> Result<std::optional<int64_t>> {
  auto node = tbl[section][key];
  if (!node) {
    return std::nullopt;
  }
  std::string path = std::format("{}.{}", section, key);
  auto value = node.value<int64_t>();
  if (!node.is_integer() || !value) {
    return std::unexpected(Invalid(source, path, "an integer"));
  }
  if (*value < min || *value > max) {
    return std::unexpected(Invalid(
        source, path, std::format("between {} and {}", min, max)));
  }
  return value;
}

auto ReadString(
    const toml::table& tbl, std::string_view section, std::string_view key,
    std::string_view source) -> Result<std::optional<std::string>> {
  auto node = tbl[section][key];
  if (!node) {
    return std::nullopt;
  }
  auto value = node.value<std::string>();
  if (!node.is_string() || !value) {
    return std::unexpected(
        Invalid(source, std::format("{}.{}", section, key), "a string"));
  }
  return value;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view source)
    -> Result<EngineConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source);
  } catch (const toml::parse_error& e) {
    return std::unexpected(Diagnostic::HostError(
        std::format("failed to parse {}: {}", source, e.description())));
  }

  EngineConfig config;
  constexpr int64_t kMaxInt32 = std::numeric_limits<int32_t>::max();

  // [sandbox]
  auto timeout = ReadInteger(tbl, "sandbox", "timeout_ms", 1, kMaxInt32, source);
  if (!timeout) {
    return std::unexpected(std::move(timeout.error()));
  }
  if (*timeout) {
    config.options.sandbox.timeout = std::chrono::milliseconds(**timeout);
  }

  auto depth =
      ReadInteger(tbl, "sandbox", "max_call_depth", 1, 100000, source);
  if (!depth) {
    return std::unexpected(std::move(depth.error()));
  }
  if (*depth) {
    config.options.sandbox.max_call_depth = static_cast<uint32_t>(**depth);
  }

  auto steps = ReadInteger(
      tbl, "sandbox", "max_steps", 0, std::numeric_limits<int64_t>::max(),
      source);
  if (!steps) {
    return std::unexpected(std::move(steps.error()));
  }
  if (*steps) {
    config.options.sandbox.max_steps = static_cast<uint64_t>(**steps);
  }

  // [remote]
  auto endpoint = ReadString(tbl, "remote", "endpoint", source);
  if (!endpoint) {
    return std::unexpected(std::move(endpoint.error()));
  }
  if (*endpoint) {
    config.options.remote.endpoint = **endpoint;
  }

  auto host = ReadString(tbl, "remote", "host", source);
  if (!host) {
    return std::unexpected(std::move(host.error()));
  }
  if (*host) {
    config.options.remote.host = **host;
  }

  auto api_key = ReadString(tbl, "remote", "api_key", source);
  if (!api_key) {
    return std::unexpected(std::move(api_key.error()));
  }
  if (*api_key) {
    config.options.remote.api_key = **api_key;
  }

  auto remote_timeout =
      ReadInteger(tbl, "remote", "timeout_ms", 1, kMaxInt32, source);
  if (!remote_timeout) {
    return std::unexpected(std::move(remote_timeout.error()));
  }
  if (*remote_timeout) {
    config.options.remote.timeout = std::chrono::milliseconds(**remote_timeout);
  }

  // [log]
  auto level = ReadString(tbl, "log", "level", source);
  if (!level) {
    return std::unexpected(std::move(level.error()));
  }
  if (*level) {
    if (!IsValidLogLevel(**level)) {
      return std::unexpected(Invalid(
          source, "log.level",
          "one of trace, debug, info, warn, error, off"));
    }
    config.log_level = **level;
  }

  return config;
}

auto LoadConfig(const fs::path& config_path) -> Result<EngineConfig> {
  std::ifstream file(config_path);
  if (!file) {
    return std::unexpected(Diagnostic::HostError(
        std::format("cannot open {}", config_path.string())));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = ParseConfig(buffer.str(), config_path.string());
  if (config) {
    config->root_dir = config_path.parent_path();
  }
  return config;
}

void ApplyApiKeyOverride(EngineConfig& config, const char* api_key) {
  if (api_key != nullptr && *api_key != '\0') {
    config.options.remote.api_key = api_key;
  }
}

auto IsValidLogLevel(std::string_view level) -> bool {
  constexpr std::array<std::string_view, 6> kLevels = {
      "trace", "debug", "info", "warn", "error", "off"};
  for (std::string_view candidate : kLevels) {
    if (level == candidate) {
      return true;
    }
  }
  return false;
}

}  // namespace proba::config
