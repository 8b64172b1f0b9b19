#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "wsgate/websocket-config.hpp"
#include "wsgate/websocket-constants.hpp"

namespace wsgate::websocket {

/// 4-byte masking key type.
using MaskingKey = std::array<std::byte, kMaskingKeySize>;

/// A WebSocket frame, as exchanged with the application.
/// The payload is always stored unmasked. A present masking key means the MASK bit is (or will be) set
/// on the wire.
struct WebSocketFrame {
  static WebSocketFrame Text(std::string_view text, bool fin = true);

  static WebSocketFrame Binary(std::span<const std::byte> data, bool fin = true);

  static WebSocketFrame Ping(std::span<const std::byte> data = {});

  static WebSocketFrame Pong(std::span<const std::byte> data = {});

  /// Close frame carrying 'code' (omitted when NoStatusReceived) and 'reason' (truncated to fit).
  static WebSocketFrame Close(CloseCode code = CloseCode::Normal, std::string_view reason = {});

  [[nodiscard]] bool masked() const noexcept { return maskingKey.has_value(); }

  /// View of the payload as characters (no UTF-8 validation).
  [[nodiscard]] std::string_view payloadAsText() const noexcept {
    return {reinterpret_cast<const char*>(payload.data()), payload.size()};
  }

  bool operator==(const WebSocketFrame&) const noexcept = default;

  Opcode opcode{Opcode::Text};
  bool fin{true};
  std::optional<MaskingKey> maskingKey;
  std::vector<std::byte> payload;
};

/// Encoded size of 'frame' (header + payload).
[[nodiscard]] std::size_t EncodedFrameSize(const WebSocketFrame& frame) noexcept;

/// Append the wire representation of 'frame' to 'out', choosing the shortest length encoding.
/// Throws std::invalid_argument if the opcode is reserved, or if a control frame is fragmented or
/// carries more than 125 bytes of payload.
void EncodeFrame(const WebSocketFrame& frame, std::vector<std::byte>& out);

[[nodiscard]] std::vector<std::byte> EncodeFrame(const WebSocketFrame& frame);

/// Options controlling which frames DecodeFrame accepts.
struct FrameDecodeOptions {
  static FrameDecodeOptions FromConfig(const WebSocketConfig& config) noexcept {
    return {config.maxFrameSize, config.inboundMaskPolicy, config.requireMinimalLength};
  }

  std::size_t maxPayloadSize{0};  // 0 = unlimited
  MaskPolicy maskPolicy{MaskPolicy::Any};
  bool requireMinimalLength{true};
};

/// Result of decoding a WebSocket frame from raw bytes.
struct FrameDecodeResult {
  enum class Status : uint8_t {
    Complete,        // Frame fully decoded, 'bytesConsumed' bytes belong to it
    NeedMoreData,    // Input ends before the end of the frame, nothing consumed
    FrameError,      // Invalid frame (connection should be closed with 1002)
    PayloadTooLarge  // Payload exceeds configured maximum (close with 1009)
  };

  Status status{Status::NeedMoreData};
  WebSocketFrame frame;           // Unmasked frame, valid if Complete
  std::size_t bytesConsumed{0};   // Total bytes consumed (header + payload)
  std::string_view errorMessage;  // Populated on FrameError and PayloadTooLarge
};

/// Decode one WebSocket frame from the start of 'data'.
/// Stateless: when NeedMoreData is returned, call again with the same bytes followed by more data.
[[nodiscard]] FrameDecodeResult DecodeFrame(std::span<const std::byte> data, const FrameDecodeOptions& options = {});

/// Apply XOR masking to WebSocket payload data, in place.
/// The same function is used for both masking and unmasking (XOR is symmetric).
/// 'offset' is the position of data[0] in the whole payload.
void ApplyMask(std::span<std::byte> data, const MaskingKey& maskingKey, std::size_t offset = 0) noexcept;

/// Draw a fresh masking key from the OpenSSL CSPRNG. Throws std::runtime_error on failure.
[[nodiscard]] MaskingKey GenerateMaskingKey();

/// Payload of a Close frame: 2-byte big endian code followed by the reason.
/// NoStatusReceived produces an empty payload. Reasons are truncated to 123 bytes.
[[nodiscard]] std::vector<std::byte> BuildClosePayload(CloseCode code, std::string_view reason = {});

struct ClosePayload {
  CloseCode code{CloseCode::NoStatusReceived};
  std::string_view reason;  // View into the parsed payload
};

/// Parse a Close frame payload. An empty payload gives NoStatusReceived, a 1-byte payload
/// ProtocolError.
[[nodiscard]] ClosePayload ParseClosePayload(std::span<const std::byte> payload) noexcept;

}  // namespace wsgate::websocket
