#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "proba/remote/dispatcher.hpp"
#include "proba/remote/remote_config.hpp"
#include "tests/common/fake_transport.hpp"

namespace proba::remote {
namespace {

using test::FakeTransport;

auto ConfiguredRemote() -> RemoteConfig {
  return RemoteConfig{
      .endpoint = "https://example.test/run",
      .host = "example.test",
      .api_key = "secret",
      .timeout = std::chrono::milliseconds(1500),
  };
}

// =============================================================================
// Request and response mapping
// =============================================================================

TEST(DispatcherTest, SourceFileNames) {
  EXPECT_EQ(SourceFileName("python"), "main.py");
  EXPECT_EQ(SourceFileName("java"), "Main.java");
  EXPECT_EQ(SourceFileName("ruby"), "main.ruby");
}

TEST(DispatcherTest, RequestBodyShape) {
  auto body = nlohmann::json::parse(
      BuildRequestBody("print(1)", "python", "a\nb"));
  EXPECT_EQ(body["language"], "python");
  EXPECT_EQ(body["stdin"], "a\nb");
  ASSERT_EQ(body["files"].size(), 1);
  EXPECT_EQ(body["files"][0]["name"], "main.py");
  EXPECT_EQ(body["files"][0]["content"], "print(1)");
}

TEST(DispatcherTest, DecodeSuccess) {
  auto decoded = DecodeResponse(test::SuccessEnvelope("hi\n"));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->output, "hi\n");
  EXPECT_FALSE(decoded->error.has_value());
}

TEST(DispatcherTest, DecodeSuccessWithoutStdout) {
  auto decoded = DecodeResponse(R"({"status": "success", "stdout": null})");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->output, "");
  EXPECT_FALSE(decoded->error.has_value());
}

TEST(DispatcherTest, DecodeFailurePrefersStderr) {
  auto decoded = DecodeResponse(
      R"({"status": "failed", "stderr": "Traceback", "exception": "E"})");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->output, "");
  EXPECT_EQ(decoded->error, "Traceback");

  decoded = DecodeResponse(
      R"({"status": "failed", "stderr": "", "exception": "Compile error"})");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->error, "Compile error");

  decoded = DecodeResponse(R"({"status": "failed"})");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->error, "Execution failed");
}

TEST(DispatcherTest, DecodeRejectsNonObjects) {
  EXPECT_FALSE(DecodeResponse("not json").has_value());
  EXPECT_FALSE(DecodeResponse("[1, 2]").has_value());
}

// =============================================================================
// Dispatch
// =============================================================================

TEST(DispatcherTest, SendsAuthenticatedRequest) {
  auto transport = FakeTransport::Replying(test::SuccessEnvelope("3\n"));
  RemoteDispatcher dispatcher(ConfiguredRemote(), transport);

  RemoteOutput result = dispatcher.Run("print(1 + 2)", "python", "");
  EXPECT_EQ(result.output, "3\n");
  EXPECT_FALSE(result.error.has_value());

  ASSERT_EQ(transport->Requests().size(), 1);
  const HttpRequest& request = transport->Requests()[0];
  EXPECT_EQ(request.url, "https://example.test/run");
  EXPECT_EQ(request.content_type, "application/json");
  EXPECT_EQ(request.timeout, std::chrono::milliseconds(1500));
  ASSERT_EQ(request.headers.size(), 2);
  EXPECT_EQ(request.headers[0].first, "X-RapidAPI-Key");
  EXPECT_EQ(request.headers[0].second, "secret");
  EXPECT_EQ(request.headers[1].first, "X-RapidAPI-Host");
  EXPECT_EQ(request.headers[1].second, "example.test");
}

TEST(DispatcherTest, ServiceFailureIsReported) {
  auto transport = FakeTransport::Replying(
      test::FailureEnvelope("Main.java:1: error: ';' expected"));
  RemoteDispatcher dispatcher(ConfiguredRemote(), transport);

  RemoteOutput result = dispatcher.Run("class Main {", "java", "");
  EXPECT_EQ(result.output, "");
  EXPECT_EQ(result.error, "Main.java:1: error: ';' expected");
}

TEST(DispatcherTest, UnconfiguredSkipsTransport) {
  auto transport = FakeTransport::Replying(test::SuccessEnvelope("remote\n"));
  RemoteDispatcher dispatcher(RemoteConfig{}, transport);

  RemoteOutput result = dispatcher.Run("print(\"local\")", "python", "");
  EXPECT_EQ(result.output, "local\n");
  EXPECT_FALSE(result.error.has_value());
  EXPECT_TRUE(transport->Requests().empty());
}

TEST(DispatcherTest, PlaceholderKeysAreNotConfigured) {
  RemoteConfig config = ConfiguredRemote();
  config.api_key = "demo-key-limited-usage";
  EXPECT_FALSE(config.IsConfigured());
  config.api_key = "your_rapidapi_key_here";
  EXPECT_FALSE(config.IsConfigured());
  config.api_key = "";
  EXPECT_FALSE(config.IsConfigured());
  config.api_key = "real";
  EXPECT_TRUE(config.IsConfigured());
}

TEST(DispatcherTest, JavaWithoutKeyNeedsConfiguration) {
  RemoteDispatcher dispatcher(RemoteConfig{}, nullptr);
  RemoteOutput result = dispatcher.Run("class Main {}", "java", "");
  EXPECT_EQ(result.output, "");
  EXPECT_EQ(
      result.error,
      "Java execution requires a valid RapidAPI key. Set RAPIDAPI_KEY or "
      "remote.api_key in proba.toml.");
}

TEST(DispatcherTest, TransportErrorFallsBack) {
  auto transport = FakeTransport::Failing("connection refused");
  RemoteDispatcher dispatcher(ConfiguredRemote(), transport);

  RemoteOutput python = dispatcher.Run("print(\"offline\")", "python", "");
  EXPECT_EQ(python.output, "offline\n");
  EXPECT_FALSE(python.error.has_value());

  RemoteOutput java = dispatcher.Run("class Main {}", "java", "");
  EXPECT_EQ(java.error, MissingKeyMessage("java"));
  EXPECT_EQ(transport->Requests().size(), 2);
}

TEST(DispatcherTest, AuthenticationFailureFallsBack) {
  for (int status : {401, 403}) {
    auto transport = FakeTransport::Replying("{}", status);
    RemoteDispatcher dispatcher(ConfiguredRemote(), transport);
    RemoteOutput result = dispatcher.Run("print(7)", "python", "");
    EXPECT_EQ(result.output, "7\n") << status;
    EXPECT_FALSE(result.error.has_value()) << status;
  }
}

TEST(DispatcherTest, ServerErrorAndMalformedBodyFallBack) {
  RemoteDispatcher server_error(
      ConfiguredRemote(), FakeTransport::Replying("oops", 500));
  EXPECT_EQ(server_error.Run("print(1)", "python", "").output, "1\n");

  RemoteDispatcher malformed(
      ConfiguredRemote(), FakeTransport::Replying("<html>"));
  EXPECT_EQ(malformed.Run("print(2)", "python", "").output, "2\n");
}

TEST(DispatcherTest, FailedApproximationReportsMissingKey) {
  RemoteDispatcher dispatcher(RemoteConfig{}, nullptr);
  RemoteOutput result = dispatcher.Run("print(1 / 0)", "python", "");
  EXPECT_EQ(result.error, MissingKeyMessage("python"));
}

TEST(DispatcherTest, Status) {
  RemoteDispatcher configured(ConfiguredRemote(), nullptr);
  EXPECT_TRUE(configured.Status().configured);
  EXPECT_EQ(
      configured.Status().message,
      "RapidAPI OneCompiler is configured and ready");

  RemoteDispatcher unconfigured(RemoteConfig{}, nullptr);
  ApiStatus status = unconfigured.Status();
  EXPECT_FALSE(status.configured);
  EXPECT_NE(status.message.find("RapidAPI key not configured"), std::string::npos);
}

}  // namespace
}  // namespace proba::remote
