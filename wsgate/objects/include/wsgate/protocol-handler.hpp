#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace wsgate {

/// Protocol spoken on a connection.
enum class ProtocolType : uint8_t {
  Http11,     // HTTP/1.1 (before the opening handshake)
  WebSocket,  // WebSocket (RFC 6455)
};

/// Result of processing incoming data by a protocol handler.
struct ProtocolProcessResult {
  enum class Action : uint8_t {
    Continue,        // More data needed or processing can continue
    ResponseReady,   // Output is ready to be sent
    Upgrade,         // Protocol upgrade performed (101 Switching Protocols queued)
    Close,           // Connection should be closed once pending output is flushed
    CloseImmediate,  // Connection should be closed immediately
  };

  Action action{Action::Continue};
  std::size_t bytesConsumed{0};  // Bytes consumed from the input
};

/// Interface of the handler consuming the bytes of a connection once it left HTTP/1.1.
///
/// The transport layer asks the connection which handler consumes the next bytes, feeds them
/// through processInput() and drains the output through getPendingOutput() / onOutputWritten().
///
/// Handlers are not thread-safe; a connection is driven by a single thread at a time.
class IProtocolHandler {
 public:
  virtual ~IProtocolHandler() = default;

  [[nodiscard]] virtual ProtocolType type() const noexcept = 0;

  /// Process incoming bytes. Bytes that cannot be interpreted yet (partial frames) are kept by the
  /// handler and reported as consumed.
  [[nodiscard]] virtual ProtocolProcessResult processInput(std::span<const std::byte> data) = 0;

  [[nodiscard]] virtual bool hasPendingOutput() const noexcept = 0;

  /// Get pending output data to be written to the transport.
  /// The returned view stays valid until the next call on the handler.
  [[nodiscard]] virtual std::span<const std::byte> getPendingOutput() = 0;

  /// Notify the handler that 'bytesWritten' bytes of the pending output were written.
  virtual void onOutputWritten(std::size_t bytesWritten) = 0;

  /// Request graceful shutdown of the protocol.
  virtual void initiateClose() = 0;
};

}  // namespace wsgate
