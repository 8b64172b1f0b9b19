#pragma once

#include <algorithm>
#include <string_view>

namespace wsgate {

/// ASCII only, the current locale is ignored.
constexpr char ToLowerAscii(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

/// Header names and tokens are compared this way (RFC 7230 §3.2).
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, {}, ToLowerAscii, ToLowerAscii);
}

}  // namespace wsgate
