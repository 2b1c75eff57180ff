#pragma once

#include <argparse/argparse.hpp>

#include "proba/config/engine_config.hpp"

namespace proba::driver {

auto RunCommand(
    const argparse::ArgumentParser& cmd, const config::EngineConfig& settings)
    -> int;
auto TestCommand(
    const argparse::ArgumentParser& cmd, const config::EngineConfig& settings)
    -> int;
auto ParseCommand(const argparse::ArgumentParser& cmd) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;
auto LanguagesCommand() -> int;
auto StatusCommand(const config::EngineConfig& settings) -> int;

}  // namespace proba::driver
