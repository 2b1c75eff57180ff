#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "proba/common/diagnostic.hpp"
#include "proba/remote/http_transport.hpp"
#include "proba/remote/remote_config.hpp"

namespace proba::remote {

struct RemoteOutput {
  std::string output;
  std::optional<std::string> error;
};

struct ApiStatus {
  bool configured = false;
  std::string message;
};

// Source file name the service expects for `language`: main.py for python,
// Main.java for java.
auto SourceFileName(std::string_view language) -> std::string;

// {"language", "stdin", "files": [{"name", "content"}]}
auto BuildRequestBody(
    std::string_view code, std::string_view language,
    std::string_view stdin_text) -> std::string;

// Maps the service envelope. Fails when the body is not a JSON object.
auto DecodeResponse(std::string_view body) -> Result<RemoteOutput>;

// Surfaced when no output can be produced without a working API key.
auto MissingKeyMessage(std::string_view language) -> std::string;

// Sends code to the OneCompiler service through RapidAPI and maps the
// response into the common shape. Never throws: transport and
// authorization failures fall back to the offline approximation for
// python and to a configuration error for everything else.
class RemoteDispatcher {
 public:
  RemoteDispatcher(RemoteConfig config, std::shared_ptr<HttpTransport> transport);

  // `language` is the canonical lower-case identifier.
  [[nodiscard]] auto Run(
      std::string_view code, std::string_view language,
      std::string_view stdin_text) const -> RemoteOutput;

  [[nodiscard]] auto IsConfigured() const -> bool {
    return config_.IsConfigured();
  }
  [[nodiscard]] auto Status() const -> ApiStatus;
  [[nodiscard]] auto Config() const -> const RemoteConfig& {
    return config_;
  }

 private:
  [[nodiscard]] auto Fallback(
      std::string_view code, std::string_view language,
      std::string_view stdin_text) const -> RemoteOutput;

  RemoteConfig config_;
  std::shared_ptr<HttpTransport> transport_;
};

}  // namespace proba::remote
