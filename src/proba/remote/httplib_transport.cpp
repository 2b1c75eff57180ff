#include "proba/remote/httplib_transport.hpp"

#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "proba/common/diagnostic.hpp"
#include "proba/remote/http_transport.hpp"

namespace proba::remote {

auto SplitUrl(std::string_view url) -> Result<UrlParts> {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return std::unexpected(
        Diagnostic::HostError(std::format("invalid endpoint URL '{}'", url)));
  }
  size_t path_start = url.find('/', scheme_end + 3);
  if (path_start == scheme_end + 3) {
    return std::unexpected(Diagnostic::HostError(
        std::format("endpoint URL '{}' has no host", url)));
  }
  if (path_start == std::string_view::npos) {
    return UrlParts{.origin = std::string(url), .path = "/"};
  }
  return UrlParts{
      .origin = std::string(url.substr(0, path_start)),
      .path = std::string(url.substr(path_start)),
  };
}

auto HttplibTransport::Post(const HttpRequest& request)
    -> Result<HttpResponse> {
  auto parts = SplitUrl(request.url);
  if (!parts) {
    return std::unexpected(std::move(parts.error()));
  }

  httplib::Client client(parts->origin);
  client.set_connection_timeout(request.timeout);
  client.set_read_timeout(request.timeout);
  client.set_write_timeout(request.timeout);

  httplib::Headers headers;
  for (const auto& [name, value] : request.headers) {
    headers.emplace(name, value);
  }

  spdlog::debug("http: POST {}{}", parts->origin, parts->path);
  httplib::Result result = client.Post(
      parts->path, headers, request.body, request.content_type);
  if (!result) {
    return std::unexpected(Diagnostic::HostError(std::format(
        "request to {} failed: {}", parts->origin,
        httplib::to_string(result.error()))));
  }
  return HttpResponse{.status = result->status, .body = result->body};
}

}  // namespace proba::remote
