#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "proba/common/diagnostic.hpp"
#include "proba/config/engine_config.hpp"

namespace proba::driver {

// --config when given, else proba.toml found from the working directory,
// else defaults. $RAPIDAPI_KEY is applied last.
auto LoadSettings(const std::optional<std::string>& config_path)
    -> Result<config::EngineConfig>;

// Default logger on stderr; debug when `verbose`, else warn.
void InstallLogger(bool verbose);

// Level from the configuration; `verbose` keeps debug.
void ApplyLogLevel(std::string_view level, bool verbose);

}  // namespace proba::driver
