/**
 * @file protocol.hpp
 * @brief Per-connection protocol handler interface.
 *
 * A ConnectionManager owns one ProtocolHandler per connection, created from
 * the HandlerFactory given to Listen() or Connect(). Callbacks arrive in
 * this order and never concurrently for the same connection:
 *
 *   OnSetup()  ->  OnMessage()*  ->  OnClose(error)   (exactly once)
 *
 * Send() and Close() may be called from any callback, including from
 * OnMessage() of the connection being closed.
 */

#ifndef HIDREM_PROTOCOL_HPP_
#define HIDREM_PROTOCOL_HPP_

#include "hidrem/frame_codec.hpp"
#include "hidrem/vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace hidrem {

class ConnectionManager;

// ============================================================================
// ManagerError
// ============================================================================

enum class ManagerError : uint8_t {
  kAlreadyRunning = 0,
  kNotRunning,
  kNotFound,        ///< Connection id is not (or no longer) registered.
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kInvalidAddress,
  kPollFailed
};

inline const char* ManagerErrorName(ManagerError err) noexcept {
  switch (err) {
    case ManagerError::kAlreadyRunning:
      return "already running";
    case ManagerError::kNotRunning:
      return "not running";
    case ManagerError::kNotFound:
      return "no such connection";
    case ManagerError::kBindFailed:
      return "bind failed";
    case ManagerError::kListenFailed:
      return "listen failed";
    case ManagerError::kConnectFailed:
      return "connect failed";
    case ManagerError::kInvalidAddress:
      return "invalid address";
    case ManagerError::kPollFailed:
      return "poll failed";
    default:
      return "?";
  }
}

// ============================================================================
// ConnectionId
// ============================================================================

/**
 * @brief Stable connection handle. Never reused within one manager.
 */
struct ConnectionIdTag {};
using ConnectionId = NewType<uint32_t, ConnectionIdTag>;

constexpr ConnectionId kInvalidConnectionId{0U};

// ============================================================================
// ProtocolHandler
// ============================================================================

class ProtocolHandler {
 public:
  ProtocolHandler() noexcept = default;
  virtual ~ProtocolHandler() = default;

  ProtocolHandler(const ProtocolHandler&) = delete;
  ProtocolHandler& operator=(const ProtocolHandler&) = delete;

  /** @brief Called once after the connection is established. */
  virtual void OnSetup() {}

  /** @brief Called once per received frame, in arrival order. */
  virtual void OnMessage(const uint8_t* data, uint32_t len) = 0;

  /**
   * @brief Called exactly once when the connection ends.
   * @param error true for transport or framing faults, false for an
   *        orderly close from either side.
   */
  virtual void OnClose(bool error) { (void)error; }

  /** @brief Frame @p data and queue it for this connection. */
  expected<void, ManagerError> Send(const void* data, uint32_t len);

  expected<void, ManagerError> Send(const Bytes& payload) {
    return Send(payload.data(), static_cast<uint32_t>(payload.size()));
  }

  /** @brief Close this connection; OnClose(false) runs before returning. */
  expected<void, ManagerError> Close();

  ConnectionId Id() const noexcept { return id_; }
  ConnectionManager* Manager() const noexcept { return manager_; }

 private:
  friend class ConnectionManager;

  void Bind(ConnectionManager* manager, ConnectionId id) noexcept {
    manager_ = manager;
    id_ = id;
  }

  ConnectionManager* manager_ = nullptr;
  ConnectionId id_ = kInvalidConnectionId;
};

using HandlerFactory = std::function<std::unique_ptr<ProtocolHandler>()>;

/**
 * @brief Factory constructing @p Handler from copies of @p args.
 */
template <typename Handler, typename... Args>
HandlerFactory MakeHandlerFactory(Args... args) {
  return [args...]() -> std::unique_ptr<ProtocolHandler> {
    return std::unique_ptr<ProtocolHandler>(new Handler(args...));
  };
}

}  // namespace hidrem

#endif  // HIDREM_PROTOCOL_HPP_
