#include "wsgate/request-head-parser.hpp"

#include <cstddef>
#include <stdexcept>
#include <string_view>

#include "wsgate/http-constants.hpp"
#include "wsgate/http-header.hpp"
#include "wsgate/string-trim.hpp"
#include "wsgate/tchars.hpp"

namespace wsgate::http {

namespace {

using Status = RequestHeadParseResult::Status;

RequestHeadParseResult Failure(Status status, std::string_view message) {
  RequestHeadParseResult result;
  result.status = status;
  result.errorMessage = message;
  return result;
}

bool IsValidVersion(std::string_view version) { return version == HTTP11Sv || version == HTTP10Sv; }

}  // namespace

RequestHeadParseResult ParseRequestHead(std::string_view data, std::size_t maxHeadSize) {
  const auto headEnd = data.find(DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    if (data.size() > maxHeadSize) {
      return Failure(Status::TooLarge, "Request head too large");
    }
    // A request line can already be rejected before the end of the head is received
    const auto lineEnd = data.find(CRLF);
    if (lineEnd != std::string_view::npos && lineEnd + CRLF.size() < kHttpReqLineMinLen) {
      return Failure(Status::Malformed, "Request line too short");
    }
    return {};
  }

  const std::size_t headSize = headEnd + DoubleCRLF.size();
  if (headSize > maxHeadSize) {
    return Failure(Status::TooLarge, "Request head too large");
  }

  // Keep the CRLF ending the last header line so that each line is CRLF terminated
  std::string_view remaining = data.substr(0, headEnd + CRLF.size());

  auto lineLast = remaining.find(CRLF);
  std::string_view requestLine = remaining.substr(0, lineLast);
  remaining.remove_prefix(lineLast + CRLF.size());

  if (requestLine.size() + CRLF.size() < kHttpReqLineMinLen) {
    return Failure(Status::Malformed, "Request line too short");
  }

  const auto firstSpace = requestLine.find(' ');
  const auto lastSpace = requestLine.rfind(' ');
  if (firstSpace == std::string_view::npos || firstSpace == lastSpace) {
    return Failure(Status::Malformed, "Request line must contain method, target and version");
  }

  RequestHeadParseResult result;

  const std::string_view method = requestLine.substr(0, firstSpace);
  const std::string_view target = requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1);
  const std::string_view version = requestLine.substr(lastSpace + 1);

  if (!IsToken(method)) {
    return Failure(Status::Malformed, "Invalid request method");
  }
  if (target.empty() || target.find(' ') != std::string_view::npos) {
    return Failure(Status::Malformed, "Invalid request target");
  }
  if (!IsValidVersion(version)) {
    return Failure(Status::Malformed, "Unsupported HTTP version");
  }

  result.head.method.assign(method);
  result.head.target.assign(target);
  result.head.version.assign(version);

  while (!remaining.empty()) {
    lineLast = remaining.find(CRLF);
    const std::string_view line = remaining.substr(0, lineLast);
    remaining.remove_prefix(lineLast + CRLF.size());

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return Failure(Status::Malformed, "Header line without colon");
    }
    const std::string_view name = line.substr(0, colonPos);
    const std::string_view value = line.substr(colonPos + 1);
    // RFC 7230 §3.2.4: no whitespace is allowed between the field name and colon
    if (!IsValidHeaderName(name)) {
      return Failure(Status::Malformed, "Invalid header name");
    }
    if (!IsValidHeaderValue(value)) {
      return Failure(Status::Malformed, "Invalid header value");
    }
    result.head.headers.add(name, TrimOws(value));
  }

  result.status = Status::Complete;
  result.headSize = headSize;
  return result;
}

}  // namespace wsgate::http
