#include "wsgate/websocket-upgrade.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "wsgate/base64-encode.hpp"
#include "wsgate/http-constants.hpp"
#include "wsgate/http-header.hpp"
#include "wsgate/request-head.hpp"
#include "wsgate/websocket-constants.hpp"

namespace wsgate::websocket {

namespace {

using Sha1Digest = std::array<std::byte, SHA_DIGEST_LENGTH>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;

UpgradeValidationResult Invalid(std::string_view message) {
  UpgradeValidationResult result;
  result.errorMessage = message;
  return result;
}

}  // namespace

std::string_view UpgradeErrorName(UpgradeError error) noexcept {
  switch (error) {
    case UpgradeError::None:
      return "none";
    case UpgradeError::InvalidUpgradeHeader:
      return "invalid-upgrade-header";
    case UpgradeError::UnsupportedWebSocketTarget:
      return "unsupported-websocket-target";
    case UpgradeError::MalformedRequestHead:
      return "malformed-request-head";
    case UpgradeError::AlreadyUpgraded:
      return "already-upgraded";
    case UpgradeError::EndpointError:
      return "endpoint-error";
    default:
      return "unknown";
  }
}

B64EncodedSha1 ComputeWebSocketAccept(std::string_view key) {
  static_assert(B64EncodedLen(std::tuple_size_v<Sha1Digest>) == std::tuple_size_v<B64EncodedSha1>,
                "Unexpected B64EncodedSha1 size");

  EvpMdCtxPtr ctx(::EVP_MD_CTX_new(), ::EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  Sha1Digest hash;
  unsigned int hashLen = 0;
  if (::EVP_DigestInit_ex(ctx.get(), ::EVP_sha1(), nullptr) != 1 ||
      ::EVP_DigestUpdate(ctx.get(), key.data(), key.size()) != 1 ||
      ::EVP_DigestUpdate(ctx.get(), kWebSocketGUID.data(), kWebSocketGUID.size()) != 1 ||
      ::EVP_DigestFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(hash.data()), &hashLen) != 1 ||
      hashLen != hash.size()) {
    throw std::runtime_error("SHA-1 digest of Sec-WebSocket-Key failed");
  }

  return B64Encode(hash);
}

UpgradeValidationResult ValidateWebSocketUpgrade(const RequestHead& head) {
  if (head.method != http::GET) {
    return Invalid("WebSocket upgrade requires the GET method");
  }
  // RFC 6455 §4.1, the HTTP/2 variant (RFC 8441) does not use this handshake
  if (head.version != http::HTTP11Sv) {
    return Invalid("WebSocket upgrade requires HTTP/1.1");
  }

  const http::HeaderSet& headers = head.headers;

  if (!headers.containsToken(http::Connection, http::UpgradeToken)) {
    return Invalid("Connection header does not contain 'upgrade'");
  }

  if (!headers.containsToken(http::Upgrade, UpgradeValue)) {
    return Invalid("Upgrade header does not contain 'websocket'");
  }

  if (headers.count(SecWebSocketVersion) != 1) {
    return Invalid("Sec-WebSocket-Version header must be present exactly once");
  }
  if (headers.valueOrEmpty(SecWebSocketVersion) != kWebSocketVersion) {
    return Invalid("Unsupported Sec-WebSocket-Version (expected 13)");
  }

  if (headers.count(SecWebSocketKey) != 1) {
    return Invalid("Sec-WebSocket-Key header must be present exactly once");
  }
  const std::string_view key = headers.valueOrEmpty(SecWebSocketKey);
  if (key.empty()) {
    return Invalid("Empty Sec-WebSocket-Key header");
  }

  UpgradeValidationResult result;
  result.valid = true;
  result.error = UpgradeError::None;
  result.secWebSocketAccept = ComputeWebSocketAccept(key);
  return result;
}

http::HeaderSet BuildUpgradeResponseHeaders(std::string_view acceptKey, const http::HeaderSet& extraHeaders) {
  http::HeaderSet headers;
  headers.add(http::Upgrade, UpgradeValue).add(http::Connection, http::UpgradeToken).add(SecWebSocketAccept, acceptKey);
  headers.append(extraHeaders);
  return headers;
}

std::string BuildUpgradeResponse(const http::HeaderSet& headers) {
  std::size_t size = http::SwitchingProtocolsStatusLine.size() + http::CRLF.size();
  for (const http::Header& header : headers) {
    size += header.name().size() + http::HeaderSep.size() + header.value().size() + http::CRLF.size();
  }

  std::string response;
  response.reserve(size);
  response.append(http::SwitchingProtocolsStatusLine);
  headers.appendTo(response);
  response.append(http::CRLF);
  return response;
}

}  // namespace wsgate::websocket
