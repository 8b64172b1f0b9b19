#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "wsgate/http-header.hpp"
#include "wsgate/request-head.hpp"

namespace wsgate::websocket {

// Base64-encoded SHA-1 is always 28 chars
using B64EncodedSha1 = std::array<char, 28>;

/// Reasons for which a connection does not switch to WebSocket.
enum class UpgradeError : uint8_t {
  None,
  InvalidUpgradeHeader,        // Not a well-formed RFC 6455 upgrade request
  UnsupportedWebSocketTarget,  // Well-formed, but no registered endpoint accepted it
  MalformedRequestHead,        // Request head could not be parsed or exceeded the configured size
  AlreadyUpgraded,             // The connection already speaks WebSocket
  EndpointError,               // An endpoint selector or activation callback threw
};

[[nodiscard]] std::string_view UpgradeErrorName(UpgradeError error) noexcept;

/// Result of validating an HTTP Upgrade request.
struct UpgradeValidationResult {
  [[nodiscard]] std::string_view acceptKey() const noexcept {
    return {secWebSocketAccept.data(), secWebSocketAccept.size()};
  }

  bool valid{false};
  UpgradeError error{UpgradeError::InvalidUpgradeHeader};
  std::string_view errorMessage;      // Populated if !valid
  B64EncodedSha1 secWebSocketAccept{};  // Computed Sec-WebSocket-Accept value, if valid
};

/// Check that the request is a WebSocket opening handshake (RFC 6455 §4.2.1).
///
/// Validates:
///   - method GET, version HTTP/1.1
///   - Connection: token list containing "upgrade" (case-insensitive, all field lines considered)
///   - Upgrade: token list containing "websocket" (case-insensitive)
///   - Sec-WebSocket-Version: present exactly once, equal to 13
///   - Sec-WebSocket-Key: present exactly once and not empty. Its content is not checked further.
///
/// Any failure is reported as InvalidUpgradeHeader.
[[nodiscard]] UpgradeValidationResult ValidateWebSocketUpgrade(const RequestHead& head);

/// Compute the Sec-WebSocket-Accept value from a client's Sec-WebSocket-Key.
///
/// The algorithm (RFC 6455 §1.3):
///   1. Concatenate the key with the WebSocket GUID
///   2. Compute SHA-1 hash
///   3. Base64 encode the result
/// Throws std::runtime_error if OpenSSL fails to compute the digest.
[[nodiscard]] B64EncodedSha1 ComputeWebSocketAccept(std::string_view key);

/// Header fields of a successful 101 response: Upgrade, Connection, Sec-WebSocket-Accept, then
/// 'extraHeaders' in order, with their case preserved.
[[nodiscard]] http::HeaderSet BuildUpgradeResponseHeaders(std::string_view acceptKey,
                                                          const http::HeaderSet& extraHeaders = {});

/// Render the complete 101 Switching Protocols response (status line, fields, empty line).
[[nodiscard]] std::string BuildUpgradeResponse(const http::HeaderSet& headers);

}  // namespace wsgate::websocket
