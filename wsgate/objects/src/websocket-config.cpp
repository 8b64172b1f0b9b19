#include "wsgate/websocket-config.hpp"

#include <stdexcept>

#include "wsgate/http-constants.hpp"
#include "wsgate/websocket-constants.hpp"

namespace wsgate::websocket {

void WebSocketConfig::validate() const {
  // Control frames may carry up to 125 bytes, a smaller limit would make close frames undeliverable
  if (maxFrameSize != 0 && maxFrameSize < kMaxControlFramePayload) {
    throw std::invalid_argument("WebSocketConfig: maxFrameSize must be 0 (unlimited) or at least 125");
  }

  // Must at least fit "GET / HTTP/1.1\r\n\r\n"
  if (maxRequestHeadSize < http::kHttpReqLineMinLen + http::CRLF.size()) {
    throw std::invalid_argument("WebSocketConfig: maxRequestHeadSize is too small to hold a request line");
  }

  switch (inboundMaskPolicy) {
    case MaskPolicy::Any:
      [[fallthrough]];
    case MaskPolicy::Required:
      [[fallthrough]];
    case MaskPolicy::Forbidden:
      break;
    default:
      throw std::invalid_argument("WebSocketConfig: invalid inboundMaskPolicy");
  }
}

}  // namespace wsgate::websocket
