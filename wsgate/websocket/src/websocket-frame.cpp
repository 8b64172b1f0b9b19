#include "wsgate/websocket-frame.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "wsgate/websocket-config.hpp"
#include "wsgate/websocket-constants.hpp"

namespace wsgate::websocket {

namespace {

constexpr std::size_t kMaxCloseReasonSize = kMaxControlFramePayload - 2;

std::vector<std::byte> ToVector(std::span<const std::byte> data) { return {data.begin(), data.end()}; }

std::size_t HeaderSize(std::size_t payloadSize, bool masked) noexcept {
  std::size_t sz = kMinFrameHeaderSize;
  if (payloadSize > 0xFFFF) {
    sz += 8;
  } else if (payloadSize >= kPayloadLen16) {
    sz += 2;
  }
  if (masked) {
    sz += kMaskingKeySize;
  }
  return sz;
}

FrameDecodeResult Failure(FrameDecodeResult::Status status, std::string_view message) {
  FrameDecodeResult result;
  result.status = status;
  result.errorMessage = message;
  return result;
}

FrameDecodeResult FrameError(std::string_view message) {
  return Failure(FrameDecodeResult::Status::FrameError, message);
}

}  // namespace

WebSocketFrame WebSocketFrame::Text(std::string_view text, bool fin) {
  WebSocketFrame frame;
  frame.opcode = Opcode::Text;
  frame.fin = fin;
  frame.payload = ToVector(std::as_bytes(std::span(text)));
  return frame;
}

WebSocketFrame WebSocketFrame::Binary(std::span<const std::byte> data, bool fin) {
  WebSocketFrame frame;
  frame.opcode = Opcode::Binary;
  frame.fin = fin;
  frame.payload = ToVector(data);
  return frame;
}

WebSocketFrame WebSocketFrame::Ping(std::span<const std::byte> data) {
  WebSocketFrame frame;
  frame.opcode = Opcode::Ping;
  frame.payload = ToVector(data);
  return frame;
}

WebSocketFrame WebSocketFrame::Pong(std::span<const std::byte> data) {
  WebSocketFrame frame;
  frame.opcode = Opcode::Pong;
  frame.payload = ToVector(data);
  return frame;
}

WebSocketFrame WebSocketFrame::Close(CloseCode code, std::string_view reason) {
  WebSocketFrame frame;
  frame.opcode = Opcode::Close;
  frame.payload = BuildClosePayload(code, reason);
  return frame;
}

std::size_t EncodedFrameSize(const WebSocketFrame& frame) noexcept {
  return HeaderSize(frame.payload.size(), frame.masked()) + frame.payload.size();
}

void EncodeFrame(const WebSocketFrame& frame, std::vector<std::byte>& out) {
  const auto rawOpcode = static_cast<uint8_t>(frame.opcode);
  if (rawOpcode > kOpcodeMask || IsReservedOpcode(rawOpcode)) {
    throw std::invalid_argument("Cannot encode a frame with a reserved opcode");
  }
  const std::size_t payloadSize = frame.payload.size();
  if (IsControlFrame(frame.opcode)) {
    if (!frame.fin) {
      throw std::invalid_argument("Control frames must not be fragmented");
    }
    if (payloadSize > kMaxControlFramePayload) {
      throw std::invalid_argument("Control frame payload too large");
    }
  }

  out.reserve(out.size() + EncodedFrameSize(frame));

  // First byte: FIN | RSV1-3 (always 0) | Opcode
  uint8_t byte0 = rawOpcode;
  if (frame.fin) {
    byte0 |= kFinBit;
  }
  out.push_back(static_cast<std::byte>(byte0));

  // Second byte: MASK | Payload length (7 bits or indicator)
  const uint8_t maskBit = frame.masked() ? kMaskBit : uint8_t{0};
  if (payloadSize < kPayloadLen16) {
    out.push_back(static_cast<std::byte>(maskBit | static_cast<uint8_t>(payloadSize)));
  } else if (payloadSize <= 0xFFFF) {
    out.push_back(static_cast<std::byte>(maskBit | kPayloadLen16));
    out.push_back(static_cast<std::byte>((payloadSize >> 8) & 0xFF));
    out.push_back(static_cast<std::byte>(payloadSize & 0xFF));
  } else {
    out.push_back(static_cast<std::byte>(maskBit | kPayloadLen64));
    for (int idx = 7; idx >= 0; --idx) {
      out.push_back(static_cast<std::byte>((static_cast<uint64_t>(payloadSize) >> (idx * 8)) & 0xFF));
    }
  }

  const std::size_t payloadStart = out.size() + (frame.masked() ? kMaskingKeySize : 0);
  if (frame.masked()) {
    out.insert(out.end(), frame.maskingKey->begin(), frame.maskingKey->end());
  }
  out.insert(out.end(), frame.payload.begin(), frame.payload.end());
  if (frame.masked()) {
    ApplyMask(std::span<std::byte>(out).subspan(payloadStart), *frame.maskingKey);
  }
}

std::vector<std::byte> EncodeFrame(const WebSocketFrame& frame) {
  std::vector<std::byte> out;
  EncodeFrame(frame, out);
  return out;
}

FrameDecodeResult DecodeFrame(std::span<const std::byte> data, const FrameDecodeOptions& options) {
  // Need at least 2 bytes for the minimal header
  if (data.size() < kMinFrameHeaderSize) {
    return {};
  }

  const auto byte0 = static_cast<uint8_t>(data[0]);
  const auto byte1 = static_cast<uint8_t>(data[1]);

  // No extension is ever negotiated, so all RSV bits must be 0
  if ((byte0 & kRsvBitsMask) != 0) {
    return FrameError("Reserved bits must be 0");
  }

  const uint8_t rawOpcode = byte0 & kOpcodeMask;
  if (IsReservedOpcode(rawOpcode)) {
    return FrameError("Reserved opcode");
  }
  const auto opcode = static_cast<Opcode>(rawOpcode);
  const bool fin = (byte0 & kFinBit) != 0;

  if (IsControlFrame(opcode) && !fin) {
    return FrameError("Control frames must not be fragmented");
  }

  const bool masked = (byte1 & kMaskBit) != 0;
  if (masked && options.maskPolicy == MaskPolicy::Forbidden) {
    return FrameError("Received frames must not be masked");
  }
  if (!masked && options.maskPolicy == MaskPolicy::Required) {
    return FrameError("Received frames must be masked");
  }

  std::size_t offset = kMinFrameHeaderSize;
  uint64_t payloadLength = byte1 & kPayloadLenMask;

  if (payloadLength == kPayloadLen16) {
    if (data.size() < offset + 2) {
      return {};
    }
    // Network byte order (big-endian)
    payloadLength = (static_cast<uint64_t>(data[offset]) << 8) | static_cast<uint64_t>(data[offset + 1]);
    offset += 2;

    // RFC 6455 §5.2: the minimal number of bytes MUST be used to encode the length
    if (options.requireMinimalLength && payloadLength < kPayloadLen16) {
      return FrameError("Non-minimal extended length encoding");
    }
  } else if (payloadLength == kPayloadLen64) {
    if (data.size() < offset + 8) {
      return {};
    }
    payloadLength = 0;
    for (std::size_t idx = 0; idx < 8; ++idx) {
      payloadLength = (payloadLength << 8) | static_cast<uint64_t>(data[offset + idx]);
    }
    offset += 8;

    // RFC 6455 §5.2: MSB must be 0 (payload length is unsigned)
    if ((payloadLength >> 63) != 0) {
      return FrameError("Invalid payload length (MSB set)");
    }
    if (options.requireMinimalLength && payloadLength <= 0xFFFF) {
      return FrameError("Non-minimal extended length encoding");
    }
  }

  // Control frames have a max payload size of 125
  if (IsControlFrame(opcode) && payloadLength > kMaxControlFramePayload) {
    return FrameError("Control frame payload too large");
  }

  if (options.maxPayloadSize != 0 && payloadLength > options.maxPayloadSize) {
    return Failure(FrameDecodeResult::Status::PayloadTooLarge, "Payload exceeds maximum size");
  }

  MaskingKey maskingKey{};
  if (masked) {
    if (data.size() < offset + kMaskingKeySize) {
      return {};
    }
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), kMaskingKeySize, maskingKey.begin());
    offset += kMaskingKeySize;
  }

  // Compare without adding to payloadLength, which may be close to 2^63
  if (data.size() - offset < payloadLength) {
    return {};
  }

  FrameDecodeResult result;
  result.status = FrameDecodeResult::Status::Complete;
  result.frame.opcode = opcode;
  result.frame.fin = fin;
  result.frame.payload = ToVector(data.subspan(offset, static_cast<std::size_t>(payloadLength)));
  if (masked) {
    result.frame.maskingKey = maskingKey;
    ApplyMask(result.frame.payload, maskingKey);
  }
  result.bytesConsumed = offset + static_cast<std::size_t>(payloadLength);
  return result;
}

void ApplyMask(std::span<std::byte> data, const MaskingKey& maskingKey, std::size_t offset) noexcept {
  for (std::size_t idx = 0; idx < data.size(); ++idx) {
    data[idx] ^= maskingKey[(offset + idx) % kMaskingKeySize];
  }
}

MaskingKey GenerateMaskingKey() {
  MaskingKey key;
  if (::RAND_bytes(reinterpret_cast<unsigned char*>(key.data()), static_cast<int>(key.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed generating masking key");
  }
  return key;
}

std::vector<std::byte> BuildClosePayload(CloseCode code, std::string_view reason) {
  std::vector<std::byte> payload;
  if (code == CloseCode::NoStatusReceived) {
    return payload;
  }
  reason = reason.substr(0, std::min(reason.size(), kMaxCloseReasonSize));
  payload.reserve(2 + reason.size());

  const auto codeVal = static_cast<uint16_t>(code);
  payload.push_back(static_cast<std::byte>((codeVal >> 8) & 0xFF));
  payload.push_back(static_cast<std::byte>(codeVal & 0xFF));
  const auto reasonBytes = std::as_bytes(std::span(reason));
  payload.insert(payload.end(), reasonBytes.begin(), reasonBytes.end());
  return payload;
}

ClosePayload ParseClosePayload(std::span<const std::byte> payload) noexcept {
  ClosePayload result;

  if (payload.size() >= 2) {
    result.code = static_cast<CloseCode>((static_cast<uint16_t>(payload[0]) << 8) | static_cast<uint16_t>(payload[1]));
    result.reason = std::string_view(reinterpret_cast<const char*>(payload.data() + 2), payload.size() - 2);
  } else if (payload.size() == 1) {
    // 1 byte is invalid per RFC 6455 §5.5.1
    result.code = CloseCode::ProtocolError;
  }

  return result;
}

}  // namespace wsgate::websocket
