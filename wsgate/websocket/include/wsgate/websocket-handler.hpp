#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

#include "wsgate/protocol-handler.hpp"
#include "wsgate/websocket-config.hpp"
#include "wsgate/websocket-constants.hpp"
#include "wsgate/websocket-frame.hpp"

namespace wsgate::websocket {

/// Endpoint hooks of an upgraded connection.
/// All callbacks are invoked from processInput(), on the thread driving the connection.
struct WebSocketCallbacks {
  /// Called for each decoded frame, in arrival order. Control frames are delivered too,
  /// nothing is answered automatically.
  std::function<void(const WebSocketFrame& frame)> onFrame;

  /// Fatal decoding error. A Close frame with 'code' (ProtocolError or MessageTooBig) is queued
  /// right after this returns and processInput() reports Close.
  std::function<void(CloseCode code, std::string_view message)> onError;
};

/// Frame-mode protocol handler installed on a connection once the opening handshake succeeded.
///
/// Decodes frames out of the incoming byte stream (partial frames are buffered between calls),
/// delivers them to the callbacks, and encodes outgoing frames into its output buffer.
///
/// Thread safety: Not thread-safe (a connection is driven by a single thread).
class WebSocketHandler final : public IProtocolHandler {
 public:
  explicit WebSocketHandler(const WebSocketConfig& config = {}, WebSocketCallbacks callbacks = {});

  WebSocketHandler(const WebSocketHandler&) = delete;
  WebSocketHandler& operator=(const WebSocketHandler&) = delete;
  WebSocketHandler(WebSocketHandler&&) noexcept = default;
  WebSocketHandler& operator=(WebSocketHandler&&) noexcept = default;

  ~WebSocketHandler() override = default;

  [[nodiscard]] ProtocolType type() const noexcept override { return ProtocolType::WebSocket; }

  [[nodiscard]] ProtocolProcessResult processInput(std::span<const std::byte> data) override;

  [[nodiscard]] bool hasPendingOutput() const noexcept override { return _outputOffset < _outputBuffer.size(); }

  [[nodiscard]] std::span<const std::byte> getPendingOutput() override;

  void onOutputWritten(std::size_t bytesWritten) override;

  /// Send a GoingAway close frame if the connection is still open.
  void initiateClose() override;

  /// Replaces the callbacks, typically from the endpoint activation.
  void setCallbacks(WebSocketCallbacks callbacks);

  /// Encode and queue a frame.
  /// @return true if queued, false if a close frame was already sent
  /// Throws std::invalid_argument if the frame cannot be encoded (see EncodeFrame).
  bool send(const WebSocketFrame& frame);

  bool sendText(std::string_view text) { return send(WebSocketFrame::Text(text)); }

  bool sendBinary(std::span<const std::byte> data) { return send(WebSocketFrame::Binary(data)); }

  /// Send a Ping frame. Payloads above 125 bytes are truncated.
  bool sendPing(std::span<const std::byte> payload = {});

  /// Send a Pong frame. Payloads above 125 bytes are truncated.
  bool sendPong(std::span<const std::byte> payload = {});

  /// Answers a received Close, or starts the close handshake. 'reason' is cut to 123 bytes.
  bool sendClose(CloseCode code = CloseCode::Normal, std::string_view reason = {});

  /// A Close frame was sent or received.
  [[nodiscard]] bool isClosing() const noexcept { return _closeState != CloseState::Open; }

  /// Both sides sent their Close frame, the transport can be closed.
  [[nodiscard]] bool isCloseComplete() const noexcept { return _closeState == CloseState::Closed; }

  [[nodiscard]] bool closeReceived() const noexcept { return _closeReceived; }

  [[nodiscard]] const FrameDecodeOptions& decodeOptions() const noexcept { return _decodeOptions; }

 private:
  enum class CloseState : uint8_t { Open, CloseSent, CloseReceived, Closed };

  /// Deliver a decoded frame, updating the close state.
  ProtocolProcessResult::Action handleFrame(const WebSocketFrame& frame);

  /// Report a fatal decoding error and queue the matching Close frame.
  void failConnection(CloseCode code, std::string_view message);

  FrameDecodeOptions _decodeOptions;
  WebSocketCallbacks _callbacks;
  std::vector<std::byte> _outputBuffer;  // Pending output data
  std::size_t _outputOffset{0};          // Bytes already written from _outputBuffer
  std::vector<std::byte> _inputBuffer;   // Carry-over from incomplete frames
  CloseState _closeState{CloseState::Open};
  bool _closeReceived{false};
};

}  // namespace wsgate::websocket
