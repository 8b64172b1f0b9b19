#include "wsgate/websocket-upgrader.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "wsgate/http-header.hpp"
#include "wsgate/request-head.hpp"
#include "wsgate/websocket-upgrade.hpp"

namespace wsgate::websocket {

UpgraderRegistry& UpgraderRegistry::registerUpgrader(UpgradeSelector selector, UpgradeActivation onActivate) {
  if (!selector) {
    throw std::invalid_argument("Cannot register a WebSocket upgrader without selector");
  }
  if (!onActivate) {
    throw std::invalid_argument("Cannot register a WebSocket upgrader without activation callback");
  }
  _descriptors.push_back(UpgraderDescriptor{std::move(selector), std::move(onActivate)});
  return *this;
}

HandshakeResult UpgraderRegistry::select(const RequestHead& head) const {
  HandshakeResult result;

  const UpgradeValidationResult validation = ValidateWebSocketUpgrade(head);
  if (!validation.valid) {
    result.error = validation.error;
    result.errorMessage = validation.errorMessage;
    return result;
  }

  for (const UpgraderDescriptor& descriptor : _descriptors) {
    std::optional<http::HeaderSet> extraHeaders = descriptor.selector(head);
    if (!extraHeaders) {
      continue;
    }
    result.status = HandshakeResult::Status::Accepted;
    result.responseHeaders = BuildUpgradeResponseHeaders(validation.acceptKey(), *extraHeaders);
    result.pDescriptor = &descriptor;
    result.acceptKey = validation.secWebSocketAccept;
    return result;
  }

  result.error = UpgradeError::UnsupportedWebSocketTarget;
  result.errorMessage = "No WebSocket endpoint accepted the request";
  return result;
}

UpgradeSelector MatchPath(std::string path, http::HeaderSet extraHeaders) {
  return [path = std::move(path),
          extraHeaders = std::move(extraHeaders)](const RequestHead& head) -> std::optional<http::HeaderSet> {
    if (head.path() != path) {
      return std::nullopt;
    }
    return extraHeaders;
  };
}

}  // namespace wsgate::websocket
