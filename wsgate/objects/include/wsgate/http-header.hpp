#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wsgate::http {

// Represents a single HTTP header field.
// The name and value are validated upon construction and stored as given. Stripping the OWS
// surrounding received values is the parser's job.
class Header {
 public:
  explicit Header(std::string_view name, std::string_view value);

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] std::string_view value() const noexcept { return _value; }

  bool operator==(const Header&) const noexcept = default;

 private:
  std::string _name;
  std::string _value;
};

// Ordered collection of header fields.
//  - names are compared case-insensitively, their case is preserved for emission
//  - insertion order is preserved, duplicate names are allowed and kept in order
class HeaderSet {
 public:
  using const_iterator = std::vector<Header>::const_iterator;

  HeaderSet() noexcept = default;

  HeaderSet(std::initializer_list<std::pair<std::string_view, std::string_view>> headers);

  // Append a header field. Throws std::invalid_argument if the name is not a token or if the
  // value contains forbidden characters.
  HeaderSet& add(std::string_view name, std::string_view value);

  // Append all fields of 'other', in order.
  HeaderSet& append(const HeaderSet& other);

  // Value of the first field named 'name', if any.
  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view valueOrEmpty(std::string_view name) const noexcept {
    return value(name).value_or(std::string_view{});
  }

  // Number of fields named 'name'.
  [[nodiscard]] std::size_t count(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return value(name).has_value(); }

  // Tells whether any field named 'name' lists 'token' in its comma separated value (case-insensitive).
  [[nodiscard]] bool containsToken(std::string_view name, std::string_view token) const noexcept;

  // Appends "Name: Value\r\n" for each field to 'out'.
  void appendTo(std::string& out) const;

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }

  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

  [[nodiscard]] const Header& operator[](std::size_t pos) const noexcept { return _headers[pos]; }

  bool operator==(const HeaderSet&) const noexcept = default;

 private:
  std::vector<Header> _headers;
};

// Validates that a header name consists only of tchar characters as per RFC 7230 §3.2.6.
bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value does not contain CR, LF or other control characters (HTAB is allowed).
// The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

// Tells whether the comma separated list 'headerValue' contains 'token' (case-insensitive, OWS around
// elements ignored). Empty list elements are skipped, as allowed by RFC 7230 §7.
bool ContainsToken(std::string_view headerValue, std::string_view token) noexcept;

}  // namespace wsgate::http
