/**
 * @file log.hpp
 * @brief Synchronous printf-style leveled logging.
 *
 * Each record is formatted into a stack buffer and written to the output
 * stream (stderr unless redirected) under one mutex, as a single line:
 *
 *   [2024-01-01 12:00:00.123] [INFO] [Manager] listening on 0.0.0.0:5000 (connection_manager.hpp:210)
 *
 * Two filters apply:
 *  - HIDREM_LOG_MIN_LEVEL (compile time) drops the call site entirely.
 *  - SetLevel() (run time) drops records below the threshold.
 */

#ifndef HIDREM_LOG_HPP_
#define HIDREM_LOG_HPP_

#include "hidrem/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <sys/time.h>

/// Compile-time floor: 0=DEBUG 1=INFO 2=WARN 3=ERROR 4=FATAL 5=OFF.
#ifndef HIDREM_LOG_MIN_LEVEL
#ifdef NDEBUG
#define HIDREM_LOG_MIN_LEVEL 1
#else
#define HIDREM_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef HIDREM_LOG_LINE_SIZE
#define HIDREM_LOG_LINE_SIZE 512U
#endif

namespace hidrem {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline std::atomic<uint8_t>& LevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitFlag() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::atomic<std::FILE*>& OutputRef() noexcept {
  static std::atomic<std::FILE*> out{nullptr};
  return out;
}

inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

/** @brief Strip the directory part of __FILE__. */
inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/** @brief Format "YYYY-MM-DD HH:MM:SS.mmm" (local time) into @p buf. */
inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  const time_t secs = tv.tv_sec;
  ::localtime_r(&secs, &tm_buf);
  const size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03ld",
                      static_cast<long>(tv.tv_usec / 1000));
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelRef().store(static_cast<uint8_t>(level),
                           std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelRef().load(std::memory_order_relaxed));
}

/** @brief Mark the logger ready. Logging before Init() still works. */
inline void Init() noexcept { detail::InitFlag().store(true); }

/** @brief Flush the output and clear the initialized flag. */
inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  std::FILE* out = detail::OutputRef().load();
  (void)std::fflush(out != nullptr ? out : stderr);
  detail::InitFlag().store(false);
}

inline bool IsInitialized() noexcept { return detail::InitFlag().load(); }

/**
 * @brief Redirect records to @p out (nullptr restores stderr).
 *
 * The stream is not owned; the caller keeps it open while it is installed.
 */
inline void SetOutput(std::FILE* out) noexcept {
  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  detail::OutputRef().store(out);
}

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal",
 *        "off"; case-sensitive lower case).
 * @return true and sets @p out on a known name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {{"debug", Level::kDebug}, {"info", Level::kInfo},
                {"warn", Level::kWarn},   {"error", Level::kError},
                {"fatal", Level::kFatal}, {"off", Level::kOff}};
  if (name == nullptr) {
    return false;
  }
  for (const auto& entry : kNames) {
    if (std::strcmp(entry.name, name) == 0) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Record output
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      detail::LevelRef().load(std::memory_order_relaxed)) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[HIDREM_LOG_LINE_SIZE];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  std::FILE* out = detail::OutputRef().load();
  if (out == nullptr) {
    out = stderr;
  }
  (void)std::fprintf(out, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
  if (level >= Level::kWarn) {
    (void)std::fflush(out);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept
    HIDREM_PRINTF_FORMAT(5, 6);

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace hidrem

// ============================================================================
// Macros
// ============================================================================

#define HIDREM_LOG_IMPL_(lvl_num, lvl, cat, fmt, ...)                       \
  do {                                                                      \
    if (HIDREM_LOG_MIN_LEVEL <= (lvl_num)) {                                \
      ::hidrem::log::LogWrite(::hidrem::log::Level::lvl, (cat), __FILE__,   \
                              __LINE__, (fmt), ##__VA_ARGS__);              \
    }                                                                       \
  } while (0)

#define HIDREM_LOG_DEBUG(cat, fmt, ...) \
  HIDREM_LOG_IMPL_(0, kDebug, cat, fmt, ##__VA_ARGS__)
#define HIDREM_LOG_INFO(cat, fmt, ...) \
  HIDREM_LOG_IMPL_(1, kInfo, cat, fmt, ##__VA_ARGS__)
#define HIDREM_LOG_WARN(cat, fmt, ...) \
  HIDREM_LOG_IMPL_(2, kWarn, cat, fmt, ##__VA_ARGS__)
#define HIDREM_LOG_ERROR(cat, fmt, ...) \
  HIDREM_LOG_IMPL_(3, kError, cat, fmt, ##__VA_ARGS__)

/// Logs unconditionally at FATAL, then aborts.
#define HIDREM_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                      \
    ::hidrem::log::LogWrite(::hidrem::log::Level::kFatal, (cat), __FILE__,  \
                            __LINE__, (fmt), ##__VA_ARGS__);                \
    std::abort();                                                           \
  } while (0)

#endif  // HIDREM_LOG_HPP_
