#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace wsgate::websocket {

// WebSocket Protocol Constants (RFC 6455)
// ========================================

// The magic GUID used in the Sec-WebSocket-Accept calculation (RFC 6455 §1.3)
inline constexpr std::string_view kWebSocketGUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// The only protocol version we speak
inline constexpr std::string_view kWebSocketVersion = "13";

// Header field names specific to the opening handshake
inline constexpr std::string_view SecWebSocketKey = "Sec-WebSocket-Key";
inline constexpr std::string_view SecWebSocketAccept = "Sec-WebSocket-Accept";
inline constexpr std::string_view SecWebSocketVersion = "Sec-WebSocket-Version";

// Token of the Upgrade header selecting this protocol
inline constexpr std::string_view UpgradeValue = "websocket";

// WebSocket Frame Opcodes (RFC 6455 §5.2)
// ========================================
enum class Opcode : uint8_t {
  // Data frames (0x0 - 0x7)
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  // 0x3-0x7 reserved for further non-control frames

  // Control frames (0x8 - 0xF)
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
  // 0xB-0xF reserved for further control frames
};

[[nodiscard]] constexpr bool IsControlFrame(Opcode op) noexcept { return static_cast<uint8_t>(op) >= 0x8; }

[[nodiscard]] constexpr bool IsReservedOpcode(uint8_t rawOpcode) noexcept {
  return (rawOpcode >= 0x3 && rawOpcode <= 0x7) || (rawOpcode >= 0xB && rawOpcode <= 0xF);
}

// WebSocket Close Status Codes (RFC 6455 §7.4.1)
// ==============================================
enum class CloseCode : uint16_t {
  Normal = 1000,
  GoingAway = 1001,
  ProtocolError = 1002,
  UnsupportedData = 1003,
  NoStatusReceived = 1005,  // API only, never on the wire
  AbnormalClosure = 1006,   // API only, never on the wire
  InvalidPayloadData = 1007,
  PolicyViolation = 1008,
  MessageTooBig = 1009,
  MandatoryExtension = 1010,
  InternalError = 1011,
};

// Codes 1005 and 1006 are reserved for APIs and must not be sent in a Close frame.
[[nodiscard]] constexpr bool IsValidWireCloseCode(uint16_t code) noexcept {
  return (code >= 1000 && code <= 1003) || (code >= 1007 && code <= 1011) || (code >= 3000 && code <= 4999);
}

// First byte of frame: FIN | RSV1 | RSV2 | RSV3 | OPCODE (4 bits)
inline constexpr uint8_t kFinBit = 0x80;
inline constexpr uint8_t kRsvBitsMask = 0x70;
inline constexpr uint8_t kOpcodeMask = 0x0F;

// Second byte: MASK | Payload length (7 bits)
inline constexpr uint8_t kMaskBit = 0x80;
inline constexpr uint8_t kPayloadLenMask = 0x7F;

// Extended payload length indicators
inline constexpr uint8_t kPayloadLen16 = 126;
inline constexpr uint8_t kPayloadLen64 = 127;

// Maximum control frame payload size (RFC 6455 §5.5)
inline constexpr std::size_t kMaxControlFramePayload = 125;

inline constexpr std::size_t kMaskingKeySize = 4;

inline constexpr std::size_t kMinFrameHeaderSize = 2;

// Default limits (can be overridden in configuration)
inline constexpr std::size_t kDefaultMaxFrameSize = 16UL * 1024UL * 1024UL;  // 16 MiB
inline constexpr std::size_t kDefaultMaxRequestHeadSize = 8UL * 1024UL;     // 8 KiB

}  // namespace wsgate::websocket
