#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "wsgate/request-head.hpp"

namespace wsgate::http {

/// Outcome of an attempt to parse an HTTP/1.1 request head from the start of a buffer.
struct RequestHeadParseResult {
  enum class Status : uint8_t {
    Complete,    // Head fully parsed, 'headSize' bytes belong to it
    Incomplete,  // Terminating empty line not received yet
    Malformed,   // Request line or a header line is invalid
    TooLarge,    // Head exceeds the configured maximum size
  };

  Status status{Status::Incomplete};
  RequestHead head;              // Populated when Complete
  std::size_t headSize{0};       // Bytes of the head including the final empty line
  std::string_view errorMessage;  // Populated when Malformed or TooLarge
};

/// Parse the request line and header fields at the start of 'data'.
///
/// Bytes after the empty line ending the head are left untouched: they are the start of whatever
/// the client pipelined after the request (frames, in the case of an upgrade).
/// Only HTTP/1.0 and HTTP/1.1 request lines are accepted. Header values are OWS-trimmed.
///
/// @param data             Bytes received so far
/// @param maxHeadSize      Maximum allowed size of the head (request line + fields + empty line)
[[nodiscard]] RequestHeadParseResult ParseRequestHead(std::string_view data, std::size_t maxHeadSize);

}  // namespace wsgate::http
