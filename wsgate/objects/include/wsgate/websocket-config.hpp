#pragma once

#include <cstddef>
#include <cstdint>

#include "wsgate/websocket-constants.hpp"

namespace wsgate::websocket {

/// Masking requirement applied to received frames.
/// RFC 6455 §5.1 mandates masking of client frames, but some peers (and tests) talk to servers
/// without it, so enforcement is opt-in.
enum class MaskPolicy : uint8_t {
  Any,        // Accept masked and unmasked frames
  Required,   // Reject unmasked frames (server receiving from a compliant client)
  Forbidden,  // Reject masked frames (client receiving from a server)
};

/// Configuration of the upgrade machinery and of the connections it produces.
struct WebSocketConfig {
  /// Maximum size of a single frame payload. 0 means unlimited.
  /// Frames above this size close the connection with 1009 (message too big).
  /// Default: 16 MiB.
  std::size_t maxFrameSize{kDefaultMaxFrameSize};

  /// Maximum size of the HTTP request head (request line + header fields + empty line).
  /// Default: 8 KiB.
  std::size_t maxRequestHeadSize{kDefaultMaxRequestHeadSize};

  /// Masking requirement for frames received after the upgrade.
  /// Default: Any.
  MaskPolicy inboundMaskPolicy{MaskPolicy::Any};

  /// Whether extended payload lengths must use the shortest encoding (RFC 6455 §5.2).
  /// Default: true.
  bool requireMinimalLength{true};

  /// Validates coherence of the configuration, throwing std::invalid_argument if invalid.
  void validate() const;

  WebSocketConfig& withMaxFrameSize(std::size_t size) {
    maxFrameSize = size;
    return *this;
  }

  WebSocketConfig& withMaxRequestHeadSize(std::size_t size) {
    maxRequestHeadSize = size;
    return *this;
  }

  WebSocketConfig& withInboundMaskPolicy(MaskPolicy policy) {
    inboundMaskPolicy = policy;
    return *this;
  }

  WebSocketConfig& withRequireMinimalLength(bool enable = true) {
    requireMinimalLength = enable;
    return *this;
  }

  bool operator==(const WebSocketConfig&) const noexcept = default;
};

}  // namespace wsgate::websocket
