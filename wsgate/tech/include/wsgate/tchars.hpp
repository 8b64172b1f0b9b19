#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace wsgate {

namespace detail {

// token = 1*tchar, tchar being ALPHA, DIGIT or one of the symbols below (RFC 7230 §3.2.6)
inline constexpr std::array<bool, 256> kTokenCharTable = [] {
  std::array<bool, 256> table{};
  for (char ch = '0'; ch <= '9'; ++ch) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  for (char ch = 'a'; ch <= 'z'; ++ch) {
    table[static_cast<unsigned char>(ch)] = true;
    table[static_cast<unsigned char>(ch - 'a' + 'A')] = true;
  }
  for (char ch : std::string_view("!#$%&'*+-.^_`|~")) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  return table;
}();

}  // namespace detail

constexpr bool IsTokenChar(char ch) noexcept { return detail::kTokenCharTable[static_cast<unsigned char>(ch)]; }

constexpr bool IsToken(std::string_view value) noexcept {
  return !value.empty() && std::ranges::all_of(value, IsTokenChar);
}

}  // namespace wsgate
