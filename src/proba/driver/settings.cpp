#include "settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "proba/common/diagnostic.hpp"
#include "proba/config/engine_config.hpp"

namespace proba::driver {

auto LoadSettings(const std::optional<std::string>& config_path)
    -> Result<config::EngineConfig> {
  config::EngineConfig settings;
  std::optional<std::filesystem::path> path;
  if (config_path) {
    path = *config_path;
  } else {
    path = config::FindConfig();
  }

  if (path) {
    auto loaded = config::LoadConfig(*path);
    if (!loaded) {
      return loaded;
    }
    settings = *std::move(loaded);
    spdlog::debug("config: loaded {}", path->string());
  }

  config::ApplyApiKeyOverride(
      settings, std::getenv(std::string(config::kApiKeyVariable).c_str()));
  return settings;
}

void InstallLogger(bool verbose) {
  auto logger = spdlog::stderr_color_mt("proba");
  logger->set_pattern("[%l] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

void ApplyLogLevel(std::string_view level, bool verbose) {
  if (verbose) {
    return;
  }
  spdlog::set_level(spdlog::level::from_str(std::string(level)));
}

}  // namespace proba::driver
