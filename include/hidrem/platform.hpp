/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macro and clocks.
 */

#ifndef HIDREM_PLATFORM_HPP_
#define HIDREM_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace hidrem {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define HIDREM_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define HIDREM_PLATFORM_MACOS 1
#endif

/// BSD sockets and poll(2) are available on every POSIX target we build for.
#if defined(HIDREM_PLATFORM_LINUX) || defined(HIDREM_PLATFORM_MACOS)
#define HIDREM_HAS_NETWORK 1
#else
#define HIDREM_HAS_NETWORK 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define HIDREM_LIKELY(x) __builtin_expect(!!(x), 1)
#define HIDREM_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define HIDREM_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define HIDREM_LIKELY(x) (x)
#define HIDREM_UNLIKELY(x) (x)
#define HIDREM_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "HIDREM_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define HIDREM_ASSERT(cond) ((void)0)
#else
#define HIDREM_ASSERT(cond) \
  ((cond) ? ((void)0) : ::hidrem::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define HIDREM_CONCAT_IMPL(a, b) a##b
#define HIDREM_CONCAT(a, b) HIDREM_CONCAT_IMPL(a, b)

// ============================================================================
// Clocks
// ============================================================================

/** @brief Monotonic time in milliseconds, for deadlines and intervals. */
inline uint64_t SteadyNowMs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/** @brief Monotonic time in microseconds. */
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/**
 * @brief Wall-clock time as fractional seconds since the Unix epoch.
 *
 * Used for tokens that travel to a peer and come back, so both ends of
 * the subtraction are taken on the same host.
 */
inline double WallNowSeconds() noexcept {
  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace hidrem

#endif  // HIDREM_PLATFORM_HPP_
