#pragma once

#include <string_view>

namespace wsgate {

// RFC 7230 §3.2.3: optional whitespace (OWS) is SP or HTAB.
constexpr bool IsOws(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Trim OWS on both sides.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && IsOws(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsOws(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace wsgate
