#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "proba/common/diagnostic.hpp"
#include "proba/remote/http_transport.hpp"

namespace proba::test {

// Transport that never touches the network: every POST is recorded and
// answered with the same canned result.
class FakeTransport : public remote::HttpTransport {
 public:
  explicit FakeTransport(Result<remote::HttpResponse> reply)
      : reply_(std::move(reply)) {
  }

  // 200 with `body`.
  static auto Replying(std::string body, int status = 200)
      -> std::shared_ptr<FakeTransport>;

  // Transport-level failure such as a refused connection.
  static auto Failing(std::string message) -> std::shared_ptr<FakeTransport>;

  auto Post(const remote::HttpRequest& request)
      -> Result<remote::HttpResponse> override;

  [[nodiscard]] auto Requests() const
      -> const std::vector<remote::HttpRequest>& {
    return requests_;
  }

 private:
  Result<remote::HttpResponse> reply_;
  std::vector<remote::HttpRequest> requests_;
};

// OneCompiler envelope for a successful run printing `stdout_text`.
auto SuccessEnvelope(std::string_view stdout_text) -> std::string;

// OneCompiler envelope for a failed run.
auto FailureEnvelope(std::string_view stderr_text) -> std::string;

}  // namespace proba::test
