#include "wsgate/http-header.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "wsgate/http-constants.hpp"
#include "wsgate/string-equal-ignore-case.hpp"
#include "wsgate/string-trim.hpp"
#include "wsgate/tchars.hpp"

namespace wsgate::http {

Header::Header(std::string_view name, std::string_view value) {
  if (!IsValidHeaderName(name)) {
    throw std::invalid_argument("HTTP header name is invalid");
  }
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
  _name.assign(name);
  _value.assign(value);
}

HeaderSet::HeaderSet(std::initializer_list<std::pair<std::string_view, std::string_view>> headers) {
  _headers.reserve(headers.size());
  for (const auto& [name, value] : headers) {
    _headers.emplace_back(name, value);
  }
}

HeaderSet& HeaderSet::add(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

HeaderSet& HeaderSet::append(const HeaderSet& other) {
  _headers.insert(_headers.end(), other._headers.begin(), other._headers.end());
  return *this;
}

std::optional<std::string_view> HeaderSet::value(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_headers, [name](const Header& hdr) { return CaseInsensitiveEqual(hdr.name(), name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->value();
}

std::size_t HeaderSet::count(std::string_view name) const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(_headers, [name](const Header& hdr) { return CaseInsensitiveEqual(hdr.name(), name); }));
}

bool HeaderSet::containsToken(std::string_view name, std::string_view token) const noexcept {
  return std::ranges::any_of(_headers, [name, token](const Header& hdr) {
    return CaseInsensitiveEqual(hdr.name(), name) && ContainsToken(hdr.value(), token);
  });
}

void HeaderSet::appendTo(std::string& out) const {
  for (const Header& hdr : _headers) {
    out.append(hdr.name());
    out.append(HeaderSep);
    out.append(hdr.value());
    out.append(CRLF);
  }
}

bool IsValidHeaderName(std::string_view name) noexcept {
  return IsToken(name);
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](unsigned char ch) {
    if (ch == '\t') {
      return true;
    }
    // Visible ASCII characters and obs-text
    return ch >= 0x20 && ch != 0x7F;
  });
}

bool ContainsToken(std::string_view headerValue, std::string_view token) noexcept {
  while (!headerValue.empty()) {
    const auto commaPos = headerValue.find(',');
    const auto element = TrimOws(headerValue.substr(0, commaPos));
    if (CaseInsensitiveEqual(element, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace wsgate::http
