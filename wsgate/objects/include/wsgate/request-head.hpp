#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "wsgate/http-constants.hpp"
#include "wsgate/http-header.hpp"

namespace wsgate {

/// Head of an HTTP/1.1 request (request line and header fields), as produced by the HTTP layer.
/// It is owned by the caller and only borrowed by the upgrade machinery for one handshake attempt.
struct RequestHead {
  /// Request target without its query part.
  [[nodiscard]] std::string_view path() const noexcept {
    std::string_view ret(target);
    return ret.substr(0, ret.find('?'));
  }

  /// Shortcut for headers.value(name).
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return headers.value(name);
  }

  std::string method{http::GET};
  std::string target{"/"};
  std::string version{http::HTTP11Sv};
  http::HeaderSet headers;
};

}  // namespace wsgate
