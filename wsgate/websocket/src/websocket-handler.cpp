#include "wsgate/websocket-handler.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "wsgate/log.hpp"
#include "wsgate/protocol-handler.hpp"
#include "wsgate/websocket-config.hpp"
#include "wsgate/websocket-constants.hpp"
#include "wsgate/websocket-frame.hpp"

namespace wsgate::websocket {

WebSocketHandler::WebSocketHandler(const WebSocketConfig& config, WebSocketCallbacks callbacks)
    : _decodeOptions(FrameDecodeOptions::FromConfig(config)), _callbacks(std::move(callbacks)) {}

void WebSocketHandler::setCallbacks(WebSocketCallbacks callbacks) { _callbacks = std::move(callbacks); }

ProtocolProcessResult WebSocketHandler::processInput(std::span<const std::byte> data) {
  ProtocolProcessResult result;
  // Partial frames are kept in _inputBuffer, so all bytes are always consumed
  result.bytesConsumed = data.size();

  // A failed or closed connection decodes nothing more
  if (_closeState == CloseState::Closed) {
    result.action = ProtocolProcessResult::Action::Close;
    return result;
  }
  // Nothing may follow a Close frame (RFC 6455 §5.5.1)
  if (_closeReceived) {
    return result;
  }

  // Decode from the carried-over partial frame if there is one
  const bool useBuffer = !_inputBuffer.empty();
  if (useBuffer) {
    _inputBuffer.insert(_inputBuffer.end(), data.begin(), data.end());
    data = _inputBuffer;
  }

  std::size_t pos = 0;
  while (pos < data.size()) {
    auto decoded = DecodeFrame(data.subspan(pos), _decodeOptions);

    if (decoded.status == FrameDecodeResult::Status::NeedMoreData) {
      break;
    }

    if (decoded.status != FrameDecodeResult::Status::Complete) {
      failConnection(decoded.status == FrameDecodeResult::Status::PayloadTooLarge ? CloseCode::MessageTooBig
                                                                                  : CloseCode::ProtocolError,
                     decoded.errorMessage);
      _inputBuffer.clear();
      result.action = ProtocolProcessResult::Action::Close;
      return result;
    }

    pos += decoded.bytesConsumed;

    const auto action = handleFrame(decoded.frame);
    if (action == ProtocolProcessResult::Action::Close || _closeReceived) {
      _inputBuffer.clear();
      result.action = action;
      return result;
    }
  }

  // Keep the partial frame for the next call
  if (useBuffer) {
    _inputBuffer.erase(_inputBuffer.begin(), _inputBuffer.begin() + static_cast<std::ptrdiff_t>(pos));
  } else {
    _inputBuffer.assign(data.begin() + static_cast<std::ptrdiff_t>(pos), data.end());
  }

  if (hasPendingOutput()) {
    result.action = ProtocolProcessResult::Action::ResponseReady;
  }
  return result;
}

ProtocolProcessResult::Action WebSocketHandler::handleFrame(const WebSocketFrame& frame) {
  auto action = ProtocolProcessResult::Action::Continue;

  if (frame.opcode == Opcode::Close) {
    _closeReceived = true;
    switch (_closeState) {
      case CloseState::Open:
        _closeState = CloseState::CloseReceived;
        break;
      case CloseState::CloseSent:
        _closeState = CloseState::Closed;
        action = ProtocolProcessResult::Action::Close;
        break;
      default:
        break;
    }
  }

  if (_callbacks.onFrame) {
    _callbacks.onFrame(frame);
  }

  // The answer to a received Close may have been sent from the callback
  if (_closeReceived && _closeState == CloseState::Closed) {
    action = ProtocolProcessResult::Action::Close;
  }
  return action;
}

void WebSocketHandler::failConnection(CloseCode code, std::string_view message) {
  log::error("WebSocket frame error: {} (closing with {})", message, static_cast<uint16_t>(code));
  if (_callbacks.onError) {
    _callbacks.onError(code, message);
  }
  sendClose(code, message);
  _closeState = CloseState::Closed;
}

std::span<const std::byte> WebSocketHandler::getPendingOutput() {
  return std::span<const std::byte>(_outputBuffer).subspan(_outputOffset);
}

void WebSocketHandler::onOutputWritten(std::size_t bytesWritten) {
  _outputOffset = std::min(_outputOffset + bytesWritten, _outputBuffer.size());
  if (_outputOffset == _outputBuffer.size()) {
    _outputBuffer.clear();
    _outputOffset = 0;
  }
}

void WebSocketHandler::initiateClose() {
  if (!isClosing()) {
    sendClose(CloseCode::GoingAway, "Server shutting down");
  }
}

bool WebSocketHandler::send(const WebSocketFrame& frame) {
  const bool closeSent = _closeState == CloseState::CloseSent || _closeState == CloseState::Closed;
  if (closeSent) {
    return false;
  }

  EncodeFrame(frame, _outputBuffer);

  if (frame.opcode == Opcode::Close) {
    _closeState = _closeState == CloseState::CloseReceived ? CloseState::Closed : CloseState::CloseSent;
  }
  return true;
}

bool WebSocketHandler::sendPing(std::span<const std::byte> payload) {
  return send(WebSocketFrame::Ping(payload.first(std::min(payload.size(), kMaxControlFramePayload))));
}

bool WebSocketHandler::sendPong(std::span<const std::byte> payload) {
  return send(WebSocketFrame::Pong(payload.first(std::min(payload.size(), kMaxControlFramePayload))));
}

bool WebSocketHandler::sendClose(CloseCode code, std::string_view reason) {
  return send(WebSocketFrame::Close(code, reason));
}

}  // namespace wsgate::websocket
