#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "proba/common/diagnostic.hpp"
#include "proba/engine/code_runner.hpp"

namespace proba::config {

inline constexpr std::string_view kConfigFileName = "proba.toml";
inline constexpr std::string_view kApiKeyVariable = "RAPIDAPI_KEY";

struct EngineConfig {
  engine::EngineOptions options;
  std::string log_level = "warn";

  // Directory where proba.toml was found; empty for defaults
  std::filesystem::path root_dir;
};

// Search for proba.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse proba.toml contents. Every key is optional; a key of the wrong
// type or out of range is an error. `source` names the file in messages.
auto ParseConfig(std::string_view text, std::string_view source)
    -> Result<EngineConfig>;

auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<EngineConfig>;

// A non-empty `api_key` (normally $RAPIDAPI_KEY) replaces remote.api_key.
void ApplyApiKeyOverride(EngineConfig& config, const char* api_key);

// trace, debug, info, warn, error, off
auto IsValidLogLevel(std::string_view level) -> bool;

}  // namespace proba::config
