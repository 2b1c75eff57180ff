#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "proba/common/diagnostic.hpp"

namespace proba::remote {

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string content_type = "application/json";
  std::string body;
  // Applied to both connect and read.
  std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
  int status = 0;
  std::string body;

  [[nodiscard]] auto IsSuccess() const -> bool {
    return status >= 200 && status < 300;
  }
};

// Blocking POST. A transport error (DNS, connect, TLS, timeout) is a
// kHostError diagnostic; any HTTP status, 4xx and 5xx included, is a
// response.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual auto Post(const HttpRequest& request) -> Result<HttpResponse> = 0;
};

}  // namespace proba::remote
