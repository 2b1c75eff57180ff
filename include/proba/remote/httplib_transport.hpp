#pragma once

#include <string>
#include <string_view>

#include "proba/common/diagnostic.hpp"
#include "proba/remote/http_transport.hpp"

namespace proba::remote {

// HttpTransport over cpp-httplib. https URLs go through OpenSSL.
class HttplibTransport final : public HttpTransport {
 public:
  auto Post(const HttpRequest& request) -> Result<HttpResponse> override;
};

// "https://host:443/api/v1/run" -> {"https://host:443", "/api/v1/run"}.
struct UrlParts {
  std::string origin;
  std::string path;
};

auto SplitUrl(std::string_view url) -> Result<UrlParts>;

}  // namespace proba::remote
