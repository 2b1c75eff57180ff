#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace proba::remote {

inline constexpr std::string_view kDefaultEndpoint =
    "https://onecompiler-apis.p.rapidapi.com/api/v1/run";
inline constexpr std::string_view kDefaultHost =
    "onecompiler-apis.p.rapidapi.com";

// Keys shipped in sample configurations. They never authenticate.
inline constexpr std::string_view kPlaceholderKeys[] = {
    "demo-key-limited-usage",
    "your_rapidapi_key_here",
};

struct RemoteConfig {
  std::string endpoint{kDefaultEndpoint};
  std::string host{kDefaultHost};
  std::string api_key;
  std::chrono::milliseconds timeout{5000};

  // A key is present and is not a placeholder.
  [[nodiscard]] auto IsConfigured() const -> bool {
    if (api_key.empty()) {
      return false;
    }
    for (std::string_view placeholder : kPlaceholderKeys) {
      if (api_key == placeholder) {
        return false;
      }
    }
    return true;
  }
};

}  // namespace proba::remote
