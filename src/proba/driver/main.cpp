#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "print.hpp"
#include "settings.hpp"

namespace {

namespace fs = std::filesystem;

void AddSourceArguments(argparse::ArgumentParser& cmd) {
  cmd.add_argument("file").help("Source file");
  cmd.add_argument("--language", "-l")
      .help("javascript, python or java (default: from the file extension)");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("proba", "0.1.0");
  program.add_description("Run code snippets and their annotated test cases");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log execution details to stderr");
  program.add_argument("--config").help("Configuration file").metavar("path");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Run a program and print its output");
  AddSourceArguments(run_cmd);
  run_cmd.add_argument("--stdin").help("Text supplied as standard input");
  run_cmd.add_argument("--stdin-file").help("File supplied as standard input");

  // Subcommand: test
  argparse::ArgumentParser test_cmd("test");
  test_cmd.add_description("Run the test cases annotated in a source file");
  AddSourceArguments(test_cmd);
  test_cmd.add_argument("--cases").help(
      "JSON file with test cases (replaces the annotations)");
  test_cmd.add_argument("--json")
      .default_value(false)
      .implicit_value(true)
      .help("Print the suite result as JSON");

  // Subcommand: parse
  argparse::ArgumentParser parse_cmd("parse");
  parse_cmd.add_description("List the test cases annotated in a source file");
  AddSourceArguments(parse_cmd);
  parse_cmd.add_argument("--json")
      .default_value(false)
      .implicit_value(true)
      .help("Print the extraction result as JSON");

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a starter program and proba.toml");
  init_cmd.add_argument("language").help("javascript, python or java");
  init_cmd.add_argument("name").nargs(0, 1).help("Program name");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite an existing program file");

  // Subcommand: languages
  argparse::ArgumentParser languages_cmd("languages");
  languages_cmd.add_description("List supported languages");

  // Subcommand: status
  argparse::ArgumentParser status_cmd("status");
  status_cmd.add_description("Show remote execution status");

  program.add_subparser(run_cmd);
  program.add_subparser(test_cmd);
  program.add_subparser(parse_cmd);
  program.add_subparser(init_cmd);
  program.add_subparser(languages_cmd);
  program.add_subparser(status_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    proba::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  bool verbose = program.get<bool>("--verbose");
  proba::driver::InstallLogger(verbose);

  // Handle -C before loading configuration
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      proba::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("init")) {
    return proba::driver::InitCommand(init_cmd);
  }
  if (program.is_subcommand_used("languages")) {
    return proba::driver::LanguagesCommand();
  }

  auto settings = proba::driver::LoadSettings(program.present("--config"));
  if (!settings) {
    proba::driver::PrintDiagnostic(settings.error());
    return 1;
  }
  proba::driver::ApplyLogLevel(settings->log_level, verbose);

  if (program.is_subcommand_used("run")) {
    return proba::driver::RunCommand(run_cmd, *settings);
  }
  if (program.is_subcommand_used("test")) {
    return proba::driver::TestCommand(test_cmd, *settings);
  }
  if (program.is_subcommand_used("parse")) {
    return proba::driver::ParseCommand(parse_cmd);
  }
  if (program.is_subcommand_used("status")) {
    return proba::driver::StatusCommand(*settings);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
