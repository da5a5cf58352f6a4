/**
 * @file io_poller.hpp
 * @brief Level-triggered readiness wait over poll(2).
 *
 * The interest set is rebuilt by the caller before every Wait(): Clear(),
 * then one Add() per descriptor. Results keep the index of the Add() call
 * that produced them, so the caller can map each one back to the object it
 * snapshotted without looking the descriptor up again.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef HIDREM_IO_POLLER_HPP_
#define HIDREM_IO_POLLER_HPP_

#include "hidrem/platform.hpp"
#include "hidrem/vocabulary.hpp"

#include <poll.h>

#include <cerrno>
#include <cstdint>
#include <thread>
#include <vector>

namespace hidrem {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kInterrupted,    ///< EINTR: rebuild the interest set and wait again.
  kBadDescriptor,  ///< EBADF: a descriptor was closed underneath; rebuild.
  kWaitFailed      ///< Anything else: not recoverable.
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError    = 0x04,  ///< POLLERR or POLLNVAL.
  kHangup   = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t mask, IoEvent ev) {
  return (mask & static_cast<uint8_t>(ev)) != 0U;
}

struct PollResult {
  int32_t fd;
  uint8_t events;  ///< Bitmask of IoEvent.
  uint32_t slot;   ///< Index of the Add() call for this descriptor.
};

// ============================================================================
// IoPoller
// ============================================================================

class IoPoller {
 public:
  IoPoller() = default;

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  /** @brief Drop the interest set and the previous results. */
  void Clear() noexcept;

  /**
   * @brief Register interest for the next Wait().
   * @param events kReadable and/or kWritable. Error and hangup conditions
   *        are always reported.
   * @return The slot index that results for @p fd will carry.
   */
  uint32_t Add(int32_t fd, uint8_t events);

  /** @brief Number of descriptors in the interest set. */
  uint32_t Size() const noexcept {
    return static_cast<uint32_t>(fds_.size());
  }

  /**
   * @brief Wait up to @p timeout_ms for any registered descriptor.
   *
   * With an empty interest set this sleeps for @p timeout_ms and reports
   * zero results.
   * @return Number of ready descriptors, available through Results().
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms);

  const PollResult* Results() const noexcept { return results_.data(); }
  uint32_t ResultCount() const noexcept {
    return static_cast<uint32_t>(results_.size());
  }

 private:
  static uint8_t Translate(short revents) noexcept;

  std::vector<struct pollfd> fds_;
  std::vector<PollResult> results_;
};

// ============================================================================
// Inline Implementation
// ============================================================================

inline void IoPoller::Clear() noexcept {
  fds_.clear();
  results_.clear();
}

inline uint32_t IoPoller::Add(int32_t fd, uint8_t events) {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = 0;
  pfd.revents = 0;
  if (HasEvent(events, IoEvent::kReadable)) {
    pfd.events |= POLLIN;
  }
  if (HasEvent(events, IoEvent::kWritable)) {
    pfd.events |= POLLOUT;
  }
  fds_.push_back(pfd);
  return static_cast<uint32_t>(fds_.size() - 1U);
}

inline expected<uint32_t, PollerError> IoPoller::Wait(int32_t timeout_ms) {
  results_.clear();

  if (fds_.empty()) {
    if (timeout_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
    }
    return expected<uint32_t, PollerError>::success(0U);
  }

  int n = ::poll(fds_.data(), static_cast<nfds_t>(fds_.size()), timeout_ms);
  if (n < 0) {
    if (errno == EINTR) {
      return expected<uint32_t, PollerError>::error(PollerError::kInterrupted);
    }
    if (errno == EBADF) {
      return expected<uint32_t, PollerError>::error(
          PollerError::kBadDescriptor);
    }
    return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
  }

  for (uint32_t i = 0; i < fds_.size() && n > 0; ++i) {
    if (fds_[i].revents == 0) {
      continue;
    }
    results_.push_back(PollResult{fds_[i].fd, Translate(fds_[i].revents), i});
    --n;
  }
  return expected<uint32_t, PollerError>::success(
      static_cast<uint32_t>(results_.size()));
}

inline uint8_t IoPoller::Translate(short revents) noexcept {
  uint8_t ev = 0;
  if ((revents & POLLIN) != 0) {
    ev |= static_cast<uint8_t>(IoEvent::kReadable);
  }
  if ((revents & POLLOUT) != 0) {
    ev |= static_cast<uint8_t>(IoEvent::kWritable);
  }
  if ((revents & (POLLERR | POLLNVAL)) != 0) {
    ev |= static_cast<uint8_t>(IoEvent::kError);
  }
  if ((revents & POLLHUP) != 0) {
    ev |= static_cast<uint8_t>(IoEvent::kHangup);
  }
  return ev;
}

}  // namespace hidrem

#endif  // HIDREM_IO_POLLER_HPP_
