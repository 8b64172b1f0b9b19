#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wsgate/http-header.hpp"
#include "wsgate/request-head.hpp"
#include "wsgate/websocket-upgrade.hpp"

namespace wsgate::websocket {

class WebSocketHandler;

/// Decides whether an endpoint accepts an upgrade request.
/// Returns the extra headers to add to the 101 response (possibly empty) to accept, std::nullopt to reject.
/// Must be free of side effects: it may be evaluated for requests that end up served by another endpoint.
using UpgradeSelector = std::function<std::optional<http::HeaderSet>(const RequestHead& head)>;

/// Invoked exactly once on an accepted connection, after the 101 response has been queued and
/// before any frame is delivered. Typically installs the frame callbacks on 'channel'.
using UpgradeActivation = std::function<void(WebSocketHandler& channel, const RequestHead& head)>;

/// A registered WebSocket endpoint.
struct UpgraderDescriptor {
  UpgradeSelector selector;
  UpgradeActivation onActivate;
};

/// Outcome of a handshake attempt on one connection.
struct HandshakeResult {
  enum class Status : uint8_t { Accepted, Rejected };

  [[nodiscard]] bool accepted() const noexcept { return status == Status::Accepted; }

  Status status{Status::Rejected};
  UpgradeError error{UpgradeError::None};          // Set if Rejected
  std::string_view errorMessage;                   // Set if Rejected
  http::HeaderSet responseHeaders;                 // Full 101 header set, if Accepted
  const UpgraderDescriptor* pDescriptor{nullptr};  // Chosen endpoint, if Accepted
  B64EncodedSha1 acceptKey{};                      // Sec-WebSocket-Accept value, if Accepted
};

/// Ordered list of WebSocket endpoints.
///
/// Filled at setup, then only read: a single registry can be shared by all connections
/// without synchronization.
class UpgraderRegistry {
 public:
  /// Append an endpoint. Registration order is the evaluation order.
  /// Throws std::invalid_argument if 'selector' or 'onActivate' is empty.
  UpgraderRegistry& registerUpgrader(UpgradeSelector selector, UpgradeActivation onActivate);

  /// Validate 'head' as an RFC 6455 upgrade request, then pick the first endpoint whose selector
  /// accepts it. Selectors after the chosen one are not evaluated, and none is evaluated for an
  /// invalid request.
  [[nodiscard]] HandshakeResult select(const RequestHead& head) const;

  [[nodiscard]] std::size_t size() const noexcept { return _descriptors.size(); }

  [[nodiscard]] bool empty() const noexcept { return _descriptors.empty(); }

 private:
  std::vector<UpgraderDescriptor> _descriptors;
};

/// Selector accepting requests whose path (query excluded) is exactly 'path', answering with 'extraHeaders'.
[[nodiscard]] UpgradeSelector MatchPath(std::string path, http::HeaderSet extraHeaders = {});

}  // namespace wsgate::websocket
