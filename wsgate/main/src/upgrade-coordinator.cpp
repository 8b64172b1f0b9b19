#include "wsgate/upgrade-coordinator.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "wsgate/log.hpp"
#include "wsgate/protocol-handler.hpp"
#include "wsgate/request-head-parser.hpp"
#include "wsgate/request-head.hpp"
#include "wsgate/websocket-config.hpp"
#include "wsgate/websocket-handler.hpp"
#include "wsgate/websocket-upgrade.hpp"
#include "wsgate/websocket-upgrader.hpp"

namespace wsgate {

using websocket::HandshakeResult;
using websocket::UpgradeError;

UpgradeCoordinator::UpgradeCoordinator(const websocket::UpgraderRegistry& registry, websocket::WebSocketConfig config)
    : _pRegistry(&registry), _config(std::move(config)) {
  _config.validate();
}

UpgradeCoordinator::InputResult UpgradeCoordinator::processInput(std::span<const std::byte> data) {
  InputResult result;

  switch (_phase) {
    case Phase::FrameMode: {
      const auto frameResult = _channel->processInput(data);
      result.action = frameResult.action;
      result.bytesConsumed = frameResult.bytesConsumed;
      return result;
    }
    case Phase::Rejected:
      result.error = _lastError;
      return result;
    case Phase::AwaitingRequest:
      break;
    default:
      // Validating and Accepted only exist during onRequestHead
      throw std::logic_error("UpgradeCoordinator::processInput called re-entrantly");
  }

  _inputBuffer.insert(_inputBuffer.end(), data.begin(), data.end());
  result.bytesConsumed = data.size();

  const std::string_view buffered(reinterpret_cast<const char*>(_inputBuffer.data()), _inputBuffer.size());
  auto parsed = http::ParseRequestHead(buffered, _config.maxRequestHeadSize);

  switch (parsed.status) {
    case http::RequestHeadParseResult::Status::Incomplete:
      return result;
    case http::RequestHeadParseResult::Status::Malformed:
      [[fallthrough]];
    case http::RequestHeadParseResult::Status::TooLarge:
      _inputBuffer.clear();
      reject(UpgradeError::MalformedRequestHead, parsed.errorMessage);
      result.error = _lastError;
      return result;
    default:
      break;
  }

  const auto tail = std::span<const std::byte>(_inputBuffer).subspan(parsed.headSize);
  const HandshakeResult handshake = onRequestHead(parsed.head, tail);
  if (!handshake.accepted()) {
    result.error = handshake.error;
    return result;
  }

  result.action = _tailAction == ProtocolProcessResult::Action::Close ||
                          _tailAction == ProtocolProcessResult::Action::CloseImmediate
                      ? _tailAction
                      : ProtocolProcessResult::Action::Upgrade;
  return result;
}

HandshakeResult UpgradeCoordinator::onRequestHead(const RequestHead& head, std::span<const std::byte> bufferedTail) {
  if (_phase == Phase::FrameMode || _phase == Phase::Accepted) {
    // The connection only carries frames now, it cannot be upgraded again
    log::warn("Ignoring WebSocket upgrade request for '{}' on an already upgraded connection", head.path());
    HandshakeResult result;
    result.error = UpgradeError::AlreadyUpgraded;
    result.errorMessage = "Connection already upgraded to WebSocket";
    return result;
  }
  if (_phase == Phase::Rejected) {
    HandshakeResult result;
    result.error = *_lastError;
    result.errorMessage = "Handshake already rejected on this connection";
    return result;
  }

  _phase = Phase::Validating;
  HandshakeResult result;
  try {
    result = _pRegistry->select(head);
  } catch (const std::exception& ex) {
    log::error("Exception in WebSocket endpoint selector for '{}': {}", head.path(), ex.what());
    return abortHandshake();
  } catch (...) {
    abortHandshake();
    throw;
  }
  if (!result.accepted()) {
    _inputBuffer.clear();
    return reject(result.error, result.errorMessage);
  }

  // Bytes pipelined after the head may live in _inputBuffer, which is released below
  std::vector<std::byte> tail(bufferedTail.begin(), bufferedTail.end());
  _inputBuffer.clear();

  _phase = Phase::Accepted;
  _handshakeOutput.append(websocket::BuildUpgradeResponse(result.responseHeaders));
  _channel = std::make_unique<websocket::WebSocketHandler>(_config);
  log::debug("WebSocket upgrade accepted for '{}'", head.path());

  try {
    result.pDescriptor->onActivate(*_channel, head);
  } catch (const std::exception& ex) {
    log::error("Exception in WebSocket endpoint activation for '{}': {}", head.path(), ex.what());
    return abortHandshake();
  } catch (...) {
    abortHandshake();
    throw;
  }
  _phase = Phase::FrameMode;

  if (!tail.empty()) {
    _tailAction = _channel->processInput(tail).action;
  }
  return result;
}

HandshakeResult UpgradeCoordinator::reject(UpgradeError error, std::string_view errorMessage) {
  _phase = Phase::Rejected;
  _lastError = error;
  log::warn("WebSocket upgrade rejected: {} ({})", websocket::UpgradeErrorName(error), errorMessage);

  HandshakeResult result;
  result.error = error;
  result.errorMessage = errorMessage;
  return result;
}

HandshakeResult UpgradeCoordinator::abortHandshake() {
  // Nothing of the failed handshake may reach the transport
  _handshakeOutput.clear();
  _handshakeOutputOffset = 0;
  _channel.reset();
  _inputBuffer.clear();
  return reject(UpgradeError::EndpointError, "WebSocket endpoint failed during the handshake");
}

bool UpgradeCoordinator::hasPendingOutput() const noexcept {
  return _handshakeOutputOffset < _handshakeOutput.size() || (_channel && _channel->hasPendingOutput());
}

std::span<const std::byte> UpgradeCoordinator::pendingOutput() {
  // The 101 response always goes out before any frame
  if (_handshakeOutputOffset < _handshakeOutput.size()) {
    return std::as_bytes(std::span(_handshakeOutput)).subspan(_handshakeOutputOffset);
  }
  if (_channel) {
    return _channel->getPendingOutput();
  }
  return {};
}

void UpgradeCoordinator::onOutputWritten(std::size_t bytesWritten) {
  if (_handshakeOutputOffset < _handshakeOutput.size()) {
    _handshakeOutputOffset += bytesWritten;
    if (_handshakeOutputOffset >= _handshakeOutput.size()) {
      _handshakeOutput.clear();
      _handshakeOutputOffset = 0;
    }
    return;
  }
  if (_channel) {
    _channel->onOutputWritten(bytesWritten);
  }
}

std::string_view PhaseName(UpgradeCoordinator::Phase phase) noexcept {
  switch (phase) {
    case UpgradeCoordinator::Phase::AwaitingRequest:
      return "awaiting-request";
    case UpgradeCoordinator::Phase::Validating:
      return "validating";
    case UpgradeCoordinator::Phase::Accepted:
      return "accepted";
    case UpgradeCoordinator::Phase::Rejected:
      return "rejected";
    case UpgradeCoordinator::Phase::FrameMode:
      return "frame-mode";
    default:
      return "unknown";
  }
}

}  // namespace wsgate
