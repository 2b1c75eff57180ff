#include "commands.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "cases_file.hpp"
#include "print.hpp"
#include "proba/config/engine_config.hpp"
#include "proba/engine/code_runner.hpp"
#include "proba/engine/language.hpp"
#include "proba/engine/test_result.hpp"
#include "proba/engine/test_runner.hpp"
#include "proba/extract/test_case.hpp"
#include "report.hpp"

namespace proba::driver {

namespace fs = std::filesystem;

namespace {

// --language, else inferred from the file extension.
auto ResolveLanguage(const argparse::ArgumentParser& cmd, const std::string& file)
    -> std::optional<std::string> {
  if (auto language = cmd.present<std::string>("--language")) {
    return *language;
  }
  if (auto inferred = engine::LanguageFromPath(file)) {
    return std::string(engine::ToString(*inferred));
  }
  PrintError(std::format(
      "cannot infer the language of '{}', pass --language", file));
  return std::nullopt;
}

auto ReadStdin(const argparse::ArgumentParser& cmd)
    -> std::optional<std::string> {
  if (auto text = cmd.present<std::string>("--stdin")) {
    return *text;
  }
  if (auto path = cmd.present<std::string>("--stdin-file")) {
    auto text = ReadTextFile(*path);
    if (!text) {
      PrintDiagnostic(text.error());
      return std::nullopt;
    }
    return *std::move(text);
  }
  return std::string();
}

// Warns about functions the cases call but the code never declares.
void WarnMissingFunctions(
    const engine::CodeRunner& runner, const std::string& code,
    const std::vector<engine::TestExecutionResult>& results) {
  std::set<std::string> checked;
  for (const engine::TestExecutionResult& result : results) {
    const std::string& name = result.test_case.function_name;
    if (name == "program" || !checked.insert(name).second) {
      continue;
    }
    for (const std::string& problem :
         runner.ValidateCodeForTesting(code, name)) {
      PrintWarning(problem);
    }
  }
}

auto Merge(engine::TestSuiteResult first, engine::TestSuiteResult second)
    -> engine::TestSuiteResult {
  std::vector<engine::TestExecutionResult> results = std::move(first.results);
  for (auto& result : second.results) {
    results.push_back(std::move(result));
  }
  return engine::Summarize(
      std::move(results), std::move(first.parse_errors),
      first.total_time_ms + second.total_time_ms);
}

auto SourceFileFor(engine::Language language, const std::string& name)
    -> std::string {
  switch (language) {
    case engine::Language::kJavaScript:
      return name + ".js";
    case engine::Language::kPython:
      return name + ".py";
    case engine::Language::kJava:
      // The service compiles Main.java.
      return "Main.java";
  }
  return name;
}

constexpr const char* kConfigTemplate = R"([sandbox]
timeout_ms = 5000
max_call_depth = 500
max_steps = 0

[remote]
endpoint = "https://onecompiler-apis.p.rapidapi.com/api/v1/run"
host = "onecompiler-apis.p.rapidapi.com"
api_key = ""
timeout_ms = 5000

[log]
level = "warn"
)";

}  // namespace

auto RunCommand(
    const argparse::ArgumentParser& cmd, const config::EngineConfig& settings)
    -> int {
  auto file = cmd.get<std::string>("file");
  auto code = ReadTextFile(file);
  if (!code) {
    PrintDiagnostic(code.error());
    return 1;
  }
  auto language = ResolveLanguage(cmd, file);
  if (!language) {
    return 1;
  }
  auto stdin_text = ReadStdin(cmd);
  if (!stdin_text) {
    return 1;
  }

  engine::CodeRunner runner(settings.options);
  engine::LanguageExecutionResult result =
      runner.RunCodeWithLanguage(*code, *language, *stdin_text);
  if (!result.output.empty()) {
    std::cout << result.output;
    if (result.output.back() != '\n') {
      std::cout << '\n';
    }
  }
  spdlog::debug(
      "run: {} finished in {:.2f} ms", result.language,
      result.execution_time_ms);
  if (result.error) {
    PrintError(*result.error);
    return 1;
  }
  return 0;
}

auto TestCommand(
    const argparse::ArgumentParser& cmd, const config::EngineConfig& settings)
    -> int {
  auto file = cmd.get<std::string>("file");
  auto code = ReadTextFile(file);
  if (!code) {
    PrintDiagnostic(code.error());
    return 1;
  }
  auto language = ResolveLanguage(cmd, file);
  if (!language) {
    return 1;
  }

  std::optional<CasesFile> cases;
  if (auto path = cmd.present<std::string>("--cases")) {
    auto loaded = LoadCasesFile(*path);
    if (!loaded) {
      PrintDiagnostic(loaded.error());
      return 1;
    }
    cases = *std::move(loaded);
  }

  engine::CodeRunner runner(settings.options);
  engine::TestSuiteResult suite;
  if (!cases) {
    suite = runner.RunTestsWithLanguage(*code, *language);
  } else {
    if (cases->tests) {
      suite = runner.RunTestsWithLanguage(*code, *language, cases->tests);
    }
    if (!cases->programs.empty()) {
      suite = Merge(
          std::move(suite),
          runner.RunProgramTests(*code, *language, cases->programs));
    }
  }

  WarnMissingFunctions(runner, *code, suite.results);
  if (cmd.get<bool>("--json")) {
    std::cout << FormatSuiteJson(suite) << '\n';
  } else {
    std::cout << FormatSuiteText(suite);
  }

  if (suite.total == 0) {
    PrintWarning("no test cases found");
    return 1;
  }
  return suite.AllPassed() ? 0 : 1;
}

auto ParseCommand(const argparse::ArgumentParser& cmd) -> int {
  auto file = cmd.get<std::string>("file");
  auto code = ReadTextFile(file);
  if (!code) {
    PrintDiagnostic(code.error());
    return 1;
  }
  auto language = ResolveLanguage(cmd, file);
  if (!language) {
    return 1;
  }

  extract::ExtractionResult extraction =
      engine::CodeRunner::ParseTestCases(*code, *language);
  if (cmd.get<bool>("--json")) {
    std::cout << FormatExtractionJson(extraction) << '\n';
  } else {
    std::cout << FormatExtractionText(extraction);
  }
  return 0;
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  auto id = cmd.get<std::string>("language");
  auto language = engine::ParseLanguage(id);
  if (!language) {
    PrintError(engine::UnsupportedLanguageMessage(id));
    return 1;
  }
  std::string name = "main";
  if (auto n = cmd.present<std::string>("name")) {
    name = *n;
  }
  bool force = cmd.get<bool>("--force");

  fs::path source = fs::current_path() / SourceFileFor(*language, name);
  if (fs::exists(source) && !force) {
    PrintError(std::format(
        "{} already exists (use --force to overwrite)",
        source.filename().string()));
    return 1;
  }

  try {
    std::ofstream source_file(source);
    source_file << engine::DefaultBoilerplate(*language) << '\n';

    fs::path config_path = fs::current_path() / config::kConfigFileName;
    if (!fs::exists(config_path)) {
      std::ofstream config_file(config_path);
      config_file << kConfigTemplate;
    }

    std::cout << std::format("Created {}\n", source.filename().string());
    return 0;
  } catch (const std::exception& e) {
    PrintError(e.what());
    return 1;
  }
}

auto LanguagesCommand() -> int {
  for (const std::string& language :
       engine::CodeRunner::GetSupportedLanguages()) {
    std::cout << language << '\n';
  }
  return 0;
}

auto StatusCommand(const config::EngineConfig& settings) -> int {
  engine::CodeRunner runner(settings.options);
  remote::ApiStatus status = runner.GetApiStatus();
  std::cout << std::format(
      "remote: {}\n{}\n", status.configured ? "configured" : "not configured",
      status.message);
  std::cout << "annotation formats:\n";
  for (const std::string& format : engine::CodeRunner::GetSupportedFormats()) {
    std::cout << "  " << format << '\n';
  }
  return 0;
}

}  // namespace proba::driver
