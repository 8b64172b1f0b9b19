#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "wsgate/protocol-handler.hpp"
#include "wsgate/request-head.hpp"
#include "wsgate/websocket-config.hpp"
#include "wsgate/websocket-handler.hpp"
#include "wsgate/websocket-upgrade.hpp"
#include "wsgate/websocket-upgrader.hpp"

namespace wsgate {

/// Drives one connection through the WebSocket opening handshake, then hands its byte stream
/// over to a WebSocketHandler.
///
/// Phases: AwaitingRequest -> Validating -> (Accepted | Rejected), then FrameMode for accepted
/// connections. On rejection nothing is written and the connection is left open: what to answer
/// (and whether to close) belongs to the caller.
///
/// Output produced by the coordinator (the 101 response) and by the frame-mode handler is exposed
/// through a single pull interface, in order.
///
/// Thread safety: Not thread-safe (a connection is driven by a single thread).
/// The registry must outlive the coordinator.
class UpgradeCoordinator {
 public:
  enum class Phase : uint8_t {
    AwaitingRequest,  // Buffering the HTTP request head
    Validating,       // Running validation and endpoint selection
    Accepted,         // 101 response queued, endpoint being activated
    Rejected,         // Handshake failed, see lastError()
    FrameMode,        // Bytes are WebSocket frames
  };

  struct InputResult {
    ProtocolProcessResult::Action action{ProtocolProcessResult::Action::Continue};
    std::size_t bytesConsumed{0};
    std::optional<websocket::UpgradeError> error;  // Set when the connection is (or was) rejected
  };

  /// Throws std::invalid_argument if 'config' is invalid.
  explicit UpgradeCoordinator(const websocket::UpgraderRegistry& registry, websocket::WebSocketConfig config = {});

  UpgradeCoordinator(const UpgradeCoordinator&) = delete;
  UpgradeCoordinator& operator=(const UpgradeCoordinator&) = delete;
  UpgradeCoordinator(UpgradeCoordinator&&) noexcept = default;
  UpgradeCoordinator& operator=(UpgradeCoordinator&&) noexcept = default;

  ~UpgradeCoordinator() = default;

  /// Feed raw bytes read from the connection.
  ///  - AwaitingRequest: buffered until a complete request head is parsed, then the handshake runs
  ///    and the bytes following the head are decoded as frames if it succeeds. Action is Upgrade on success.
  ///  - FrameMode: forwarded to the WebSocketHandler.
  ///  - Rejected: left untouched (0 bytes consumed), the stored error is reported again.
  [[nodiscard]] InputResult processInput(std::span<const std::byte> data);

  /// Run the handshake on a request head parsed by an external HTTP layer.
  /// 'bufferedTail' holds the bytes already read past the end of the head, decoded as frames
  /// once the connection is upgraded.
  /// On an upgraded connection, returns AlreadyUpgraded without writing anything.
  /// If a selector or the activation callback throws a std::exception, it is logged, the queued
  /// 101 response is discarded and the connection is rejected with EndpointError. Other exceptions
  /// propagate after the same rollback.
  websocket::HandshakeResult onRequestHead(const RequestHead& head, std::span<const std::byte> bufferedTail = {});

  [[nodiscard]] bool hasPendingOutput() const noexcept;

  /// Next bytes to write to the transport. Valid until the next call on the coordinator.
  [[nodiscard]] std::span<const std::byte> pendingOutput();

  /// Notify that 'bytesWritten' bytes of the last pendingOutput() were written.
  void onOutputWritten(std::size_t bytesWritten);

  [[nodiscard]] Phase phase() const noexcept { return _phase; }

  [[nodiscard]] ProtocolType protocol() const noexcept {
    return _channel ? ProtocolType::WebSocket : ProtocolType::Http11;
  }

  [[nodiscard]] std::optional<websocket::UpgradeError> lastError() const noexcept { return _lastError; }

  /// The frame-mode handler, or nullptr before the connection is upgraded.
  [[nodiscard]] websocket::WebSocketHandler* channel() noexcept { return _channel.get(); }

  [[nodiscard]] const websocket::WebSocketConfig& config() const noexcept { return _config; }

 private:
  websocket::HandshakeResult reject(websocket::UpgradeError error, std::string_view errorMessage);

  // Rolls back a handshake interrupted by an exception from endpoint code, then rejects it.
  websocket::HandshakeResult abortHandshake();

  const websocket::UpgraderRegistry* _pRegistry;
  websocket::WebSocketConfig _config;
  std::vector<std::byte> _inputBuffer;  // Request head being received
  std::string _handshakeOutput;         // 101 response
  std::size_t _handshakeOutputOffset{0};
  std::unique_ptr<websocket::WebSocketHandler> _channel;
  ProtocolProcessResult::Action _tailAction{ProtocolProcessResult::Action::Continue};
  std::optional<websocket::UpgradeError> _lastError;
  Phase _phase{Phase::AwaitingRequest};
};

[[nodiscard]] std::string_view PhaseName(UpgradeCoordinator::Phase phase) noexcept;

}  // namespace wsgate
