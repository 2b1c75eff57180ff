#include "proba/remote/dispatcher.hpp"

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "proba/common/diagnostic.hpp"
#include "proba/remote/http_transport.hpp"
#include "proba/remote/offline_python.hpp"
#include "proba/remote/remote_config.hpp"

namespace proba::remote {

namespace {

// "python" -> "Python"
auto DisplayName(std::string_view language) -> std::string {
  std::string name(language);
  if (!name.empty() && name[0] >= 'a' && name[0] <= 'z') {
    name[0] = static_cast<char>(name[0] - 'a' + 'A');
  }
  return name;
}

// Empty strings count as absent.
auto NonEmptyString(const nlohmann::json& object, const char* key)
    -> std::optional<std::string> {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto text = it->get<std::string>();
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

}  // namespace

auto SourceFileName(std::string_view language) -> std::string {
  if (language == "java") {
    return "Main.java";
  }
  if (language == "python") {
    return "main.py";
  }
  return std::format("main.{}", language);
}

auto BuildRequestBody(
    std::string_view code, std::string_view language,
    std::string_view stdin_text) -> std::string {
  nlohmann::json body = {
      {"language", std::string(language)},
      {"stdin", std::string(stdin_text)},
      {"files",
       nlohmann::json::array({{
           {"name", SourceFileName(language)},
           {"content", std::string(code)},
       }})},
  };
  return body.dump();
}

auto DecodeResponse(std::string_view body) -> Result<RemoteOutput> {
  auto json = nlohmann::json::parse(
      body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded() || !json.is_object()) {
    return std::unexpected(
        Diagnostic::HostError("malformed response from execution service"));
  }

  auto status = json.find("status");
  if (status != json.end() && status->is_string() &&
      status->get<std::string>() == "success") {
    return RemoteOutput{
        .output = NonEmptyString(json, "stdout").value_or(""),
        .error = std::nullopt,
    };
  }

  std::optional<std::string> error = NonEmptyString(json, "stderr");
  if (!error) {
    error = NonEmptyString(json, "exception");
  }
  return RemoteOutput{
      .output = "",
      .error = error.value_or("Execution failed"),
  };
}

auto MissingKeyMessage(std::string_view language) -> std::string {
  return std::format(
      "{} execution requires a valid RapidAPI key. Set RAPIDAPI_KEY or "
      "remote.api_key in proba.toml.",
      DisplayName(language));
}

RemoteDispatcher::RemoteDispatcher(
    RemoteConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
}

auto RemoteDispatcher::Run(
    std::string_view code, std::string_view language,
    std::string_view stdin_text) const -> RemoteOutput {
  if (!config_.IsConfigured() || transport_ == nullptr) {
    spdlog::debug("remote: no API key configured for {}", language);
    return Fallback(code, language, stdin_text);
  }

  HttpRequest request{
      .url = config_.endpoint,
      .headers =
          {
              {"X-RapidAPI-Key", config_.api_key},
              {"X-RapidAPI-Host", config_.host},
          },
      .content_type = "application/json",
      .body = BuildRequestBody(code, language, stdin_text),
      .timeout = config_.timeout,
  };

  auto response = transport_->Post(request);
  if (!response) {
    spdlog::warn(
        "remote: {}, falling back", response.error().primary.message);
    return Fallback(code, language, stdin_text);
  }
  if (response->status == 401 || response->status == 403) {
    spdlog::warn(
        "remote: authentication failed (HTTP {}), check the API key",
        response->status);
    return Fallback(code, language, stdin_text);
  }
  if (!response->IsSuccess()) {
    spdlog::warn(
        "remote: request failed (HTTP {}), falling back", response->status);
    return Fallback(code, language, stdin_text);
  }

  auto decoded = DecodeResponse(response->body);
  if (!decoded) {
    spdlog::warn("remote: {}, falling back", decoded.error().primary.message);
    return Fallback(code, language, stdin_text);
  }
  return *std::move(decoded);
}

auto RemoteDispatcher::Fallback(
    std::string_view code, std::string_view language,
    std::string_view stdin_text) const -> RemoteOutput {
  if (language != "python") {
    return RemoteOutput{.output = "", .error = MissingKeyMessage(language)};
  }
  auto output = RunOfflinePython(code, stdin_text);
  if (!output) {
    spdlog::warn(
        "remote: offline approximation failed: {}",
        output.error().primary.message);
    return RemoteOutput{.output = "", .error = MissingKeyMessage(language)};
  }
  return RemoteOutput{.output = *std::move(output), .error = std::nullopt};
}

auto RemoteDispatcher::Status() const -> ApiStatus {
  if (config_.IsConfigured()) {
    return ApiStatus{
        .configured = true,
        .message = "RapidAPI OneCompiler is configured and ready",
    };
  }
  return ApiStatus{
      .configured = false,
      .message =
          "RapidAPI key not configured. Python execution will use basic "
          "simulation. Set RAPIDAPI_KEY or remote.api_key in proba.toml for "
          "full Python support.",
  };
}

}  // namespace proba::remote
