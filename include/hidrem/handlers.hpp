/**
 * @file handlers.hpp
 * @brief The two ends of a HIDrem session.
 *
 * ControllerProtocol runs on the controller (the side that connects): it
 * measures latency with PING and sends key presses. HostProtocol runs on
 * the machine being controlled: it echoes PING and applies KEYBOARD
 * messages through a KeyInjector.
 *
 * Both decode with DecodeMessage(). An empty payload is ignored; any other
 * decode failure closes that connection only.
 */

#ifndef HIDREM_HANDLERS_HPP_
#define HIDREM_HANDLERS_HPP_

#include "hidrem/connection_manager.hpp"
#include "hidrem/key_injector.hpp"
#include "hidrem/log.hpp"
#include "hidrem/messages.hpp"
#include "hidrem/platform.hpp"
#include "hidrem/protocol.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace hidrem {

// ============================================================================
// Ping tokens
// ============================================================================

/** @brief Current wall time as decimal seconds, e.g. "1700000000.123456". */
inline std::string MakePingToken() {
  char buf[32];
  (void)std::snprintf(buf, sizeof(buf), "%.6f", WallNowSeconds());
  return std::string(buf);
}

/**
 * @brief One-way latency estimate from an echoed token.
 * @return Half the round trip in whole milliseconds, or -1 if the token is
 *         not a number.
 */
inline int64_t HalfRoundTripMs(const std::string& token, double now_seconds) {
  if (token.empty()) {
    return -1;
  }
  char* end = nullptr;
  const double sent = std::strtod(token.c_str(), &end);
  if (end == token.c_str() || *end != '\0') {
    return -1;
  }
  return static_cast<int64_t>(std::llround((now_seconds - sent) / 2.0 * 1000.0));
}

// ============================================================================
// ControllerState
// ============================================================================

/**
 * @brief State a ControllerProtocol shares with the application that owns
 *        the connection (the handler itself is owned by the manager).
 */
class ControllerState {
 public:
  using PingListener = std::function<void(int64_t half_rtt_ms)>;

  /** @brief Must be installed before the connection is opened. */
  void SetPingListener(PingListener listener) {
    on_ping_ = std::move(listener);
  }

  /** @brief Latest half round trip in ms, -1 before the first echo. */
  int64_t LastPingMs() const noexcept { return last_ping_ms_.load(); }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  bool ClosedWithError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_error_;
  }

  /** @brief Block until the connection ends or @p timeout elapses. */
  bool WaitClosed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return closed_; });
  }

 private:
  friend class ControllerProtocol;

  void ReportPing(int64_t half_rtt_ms) {
    last_ping_ms_.store(half_rtt_ms);
    if (on_ping_) {
      on_ping_(half_rtt_ms);
    }
  }

  void ReportClosed(bool error) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    close_error_ = error;
    cv_.notify_all();
  }

  PingListener on_ping_;
  std::atomic<int64_t> last_ping_ms_{-1};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool closed_ = false;
  bool close_error_ = false;
};

// ============================================================================
// ControllerProtocol
// ============================================================================

class ControllerProtocol final : public ProtocolHandler {
 public:
  explicit ControllerProtocol(std::shared_ptr<ControllerState> state = nullptr)
      : state_(state ? std::move(state) : std::make_shared<ControllerState>()) {}

  void OnMessage(const uint8_t* data, uint32_t len) override {
    auto decoded = DecodeMessage(data, len);
    if (!decoded.has_value()) {
      if (decoded.get_error() == ProtocolError::kEmptyPayload) {
        return;
      }
      HIDREM_LOG_WARN("Controller", "protocol violation (%s), closing",
                      ProtocolErrorName(decoded.get_error()));
      (void)Close();
      return;
    }
    const Message& msg = decoded.value();
    if (msg.kind != MessageKind::kPing) {
      HIDREM_LOG_DEBUG("Controller", "ignoring %s from host", KindName(msg.kind));
      return;
    }
    const int64_t half_rtt = HalfRoundTripMs(msg.body, WallNowSeconds());
    if (half_rtt < 0) {
      HIDREM_LOG_DEBUG("Controller", "ignoring unusable ping token '%s'",
                       msg.body.c_str());
      return;
    }
    state_->ReportPing(half_rtt);
  }

  void OnClose(bool error) override { state_->ReportClosed(error); }

  expected<void, ManagerError> Ping() { return Send(EncodePing(MakePingToken())); }

  expected<void, ManagerError> PressKey(const std::string& key) {
    return Send(EncodeKeyboard(KeyAction::kPress, key));
  }

  expected<void, ManagerError> ReleaseKey(const std::string& key) {
    return Send(EncodeKeyboard(KeyAction::kRelease, key));
  }

  int64_t LastPingMs() const noexcept { return state_->LastPingMs(); }
  const std::shared_ptr<ControllerState>& State() const noexcept {
    return state_;
  }

 private:
  std::shared_ptr<ControllerState> state_;
};

// ============================================================================
// ControllerLink
// ============================================================================

/**
 * @brief Application-side handle on a controller connection.
 *
 * Sends the same messages as ControllerProtocol, addressed by connection
 * id, so the application never holds a pointer into the manager. As a
 * KeyInjector it can be driven directly by an InputMapper; send failures
 * (connection gone) are logged.
 */
class ControllerLink final : public KeyInjector {
 public:
  ControllerLink(ConnectionManager& manager, ConnectionId id) noexcept
      : manager_(manager), id_(id) {}

  expected<void, ManagerError> Ping() { return SendPayload(EncodePing(MakePingToken())); }

  void PressKey(const std::string& key) override {
    Report(SendPayload(EncodeKeyboard(KeyAction::kPress, key)), "press", key);
  }

  void ReleaseKey(const std::string& key) override {
    Report(SendPayload(EncodeKeyboard(KeyAction::kRelease, key)), "release",
           key);
  }

  ConnectionId Id() const noexcept { return id_; }

 private:
  expected<void, ManagerError> SendPayload(const Bytes& payload) {
    return manager_.Send(id_, payload.data(),
                         static_cast<uint32_t>(payload.size()));
  }

  static void Report(const expected<void, ManagerError>& r, const char* what,
                     const std::string& key) {
    if (!r.has_value()) {
      HIDREM_LOG_WARN("Controller", "cannot send %s '%s': %s", what,
                      key.c_str(), ManagerErrorName(r.get_error()));
    }
  }

  ConnectionManager& manager_;
  ConnectionId id_;
};

// ============================================================================
// HostProtocol
// ============================================================================

class HostProtocol final : public ProtocolHandler {
 public:
  explicit HostProtocol(std::shared_ptr<KeyInjector> injector)
      : injector_(std::move(injector)) {}

  void OnSetup() override {
    HIDREM_LOG_INFO("Host", "controller attached (id=%u)", Id().value());
  }

  void OnMessage(const uint8_t* data, uint32_t len) override {
    auto decoded = DecodeMessage(data, len);
    if (!decoded.has_value()) {
      if (decoded.get_error() == ProtocolError::kEmptyPayload) {
        return;
      }
      HIDREM_LOG_WARN("Host", "protocol violation from id=%u (%s), closing",
                      Id().value(), ProtocolErrorName(decoded.get_error()));
      (void)Close();
      return;
    }
    const Message& msg = decoded.value();
    switch (msg.kind) {
      case MessageKind::kPing:
        // Echo the whole payload verbatim.
        (void)Send(data, len);
        break;
      case MessageKind::kKeyboard:
        if (injector_ == nullptr) {
          break;
        }
        if (msg.action == KeyAction::kPress) {
          injector_->PressKey(msg.body);
        } else {
          injector_->ReleaseKey(msg.body);
        }
        break;
      case MessageKind::kMouse:
        break;
    }
  }

  void OnClose(bool error) override {
    HIDREM_LOG_INFO("Host", "controller detached (id=%u%s)", Id().value(),
                    error ? ", error" : "");
  }

 private:
  std::shared_ptr<KeyInjector> injector_;
};

}  // namespace hidrem

#endif  // HIDREM_HANDLERS_HPP_
