/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM driven graceful shutdown for the executables.
 *
 * The signal handler only stores the signal number and writes one byte to
 * a self-pipe; WaitForShutdown() blocks on that pipe and then runs the
 * registered cleanup callbacks in reverse registration order.
 */

#ifndef HIDREM_SHUTDOWN_HPP_
#define HIDREM_SHUTDOWN_HPP_

#include "hidrem/platform.hpp"
#include "hidrem/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include <unistd.h>

namespace hidrem {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// Cleanup callback. Receives the signal number (0 for Quit() without one).
using ShutdownFn = std::function<void(int signo)>;

class ShutdownManager;

namespace detail {

// Exactly one ShutdownManager may own the signal handlers per process.
inline std::atomic<ShutdownManager*>& ShutdownInstance() noexcept {
  static std::atomic<ShutdownManager*> instance{nullptr};
  return instance;
}

}  // namespace detail

/**
 * @brief Owns the process's SIGINT/SIGTERM handling.
 *
 * Usage:
 * @code
 *   hidrem::ShutdownManager shutdown;
 *   shutdown.Register([&](int) { manager.Stop(); });
 *   shutdown.InstallSignalHandlers();
 *   shutdown.WaitForShutdown();
 * @endcode
 *
 * A second instance constructed while one exists is invalid: every call on
 * it fails with kAlreadyInstantiated.
 */
class ShutdownManager final {
 public:
  explicit ShutdownManager(uint32_t max_callbacks = kMaxCallbacks) noexcept
      : max_callbacks_(max_callbacks) {
    ShutdownManager* expected_none = nullptr;
    if (!detail::ShutdownInstance().compare_exchange_strong(expected_none,
                                                            this)) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    valid_ = true;
  }

  ~ShutdownManager() {
    if (pipe_fd_[0] >= 0) {
      ::close(pipe_fd_[0]);
    }
    if (pipe_fd_[1] >= 0) {
      ::close(pipe_fd_[1]);
    }
    ShutdownManager* self = this;
    (void)detail::ShutdownInstance().compare_exchange_strong(self, nullptr);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn) {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (!fn || callbacks_.size() >= max_callbacks_) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_.push_back(std::move(fn));
    return expected<void, ShutdownError>::success();
  }

  /** @brief Install handlers for SIGINT and SIGTERM (SA_RESTART). */
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /** @brief Trigger shutdown from code. Only the first trigger counts. */
  void Quit(int signo = 0) noexcept {
    bool idle = false;
    if (shutdown_flag_.compare_exchange_strong(idle, true)) {
      signo_.store(signo);
      Wake();
    }
  }

  /** @brief Block until a signal or Quit(), then run callbacks LIFO. */
  void WaitForShutdown() {
    // The wake byte is written after signo_, so it is read only once the
    // signal number is visible.
    while (pipe_fd_[0] >= 0) {
      uint8_t byte = 0;
      const ssize_t n = ::read(pipe_fd_[0], &byte, 1);
      if (n > 0 || (n < 0 && errno != EINTR)) {
        break;
      }
    }
    const int signo = signo_.load();
    for (auto it = callbacks_.rbegin(); it != callbacks_.rend(); ++it) {
      (*it)(signo);
    }
  }

  bool IsShutdownRequested() const noexcept { return shutdown_flag_.load(); }
  int Signal() const noexcept { return signo_.load(); }

 private:
  static constexpr uint32_t kMaxCallbacks = 16;

  // Async-signal-safe: atomics and write(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::ShutdownInstance().load();
    if (self != nullptr) {
      self->Quit(signo);
    }
  }

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)!::write(pipe_fd_[1], &byte, 1);
    }
  }

  std::vector<ShutdownFn> callbacks_;
  uint32_t max_callbacks_;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2] = {-1, -1};
  bool valid_ = false;
};

}  // namespace hidrem

#endif  // HIDREM_SHUTDOWN_HPP_
