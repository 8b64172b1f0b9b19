#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace wsgate {

/// Number of characters of the padded base64 representation of 'binDataLen' bytes.
constexpr std::size_t B64EncodedLen(std::size_t binDataLen) noexcept { return ((binDataLen + 2) / 3) * 4; }

/// Base64 encode (RFC 4648 standard alphabet, '=' padded) 'binData' into [out, endOut).
/// The output range must hold at least B64EncodedLen(binData.size()) characters, the remaining
/// characters after the encoded data are filled with padding.
constexpr void B64Encode(std::span<const std::byte> binData, char* out, const char* endOut) {
  constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::size_t pos = 0;
  for (; pos + 3 <= binData.size(); pos += 3) {
    const uint32_t triple = (static_cast<uint32_t>(binData[pos]) << 16) |
                            (static_cast<uint32_t>(binData[pos + 1]) << 8) | static_cast<uint32_t>(binData[pos + 2]);
    *out++ = kAlphabet[(triple >> 18) & 0x3F];
    *out++ = kAlphabet[(triple >> 12) & 0x3F];
    *out++ = kAlphabet[(triple >> 6) & 0x3F];
    *out++ = kAlphabet[triple & 0x3F];
  }

  const std::size_t remaining = binData.size() - pos;
  if (remaining != 0) {
    uint32_t triple = static_cast<uint32_t>(binData[pos]) << 16;
    if (remaining == 2) {
      triple |= static_cast<uint32_t>(binData[pos + 1]) << 8;
    }
    *out++ = kAlphabet[(triple >> 18) & 0x3F];
    *out++ = kAlphabet[(triple >> 12) & 0x3F];
    if (remaining == 2) {
      *out++ = kAlphabet[(triple >> 6) & 0x3F];
    }
  }
  while (out != endOut) {
    *out++ = '=';
  }
}

template <std::size_t N>
[[nodiscard]] constexpr auto B64Encode(const std::array<std::byte, N>& binData) {
  std::array<char, B64EncodedLen(N)> ret;
  B64Encode(std::span<const std::byte>(binData), ret.data(), ret.data() + ret.size());
  return ret;
}

}  // namespace wsgate
