/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every module: expected<V,E>,
 *        optional<T>, strong integer ids, scope guard and the error enums.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef HIDREM_VOCABULARY_HPP_
#define HIDREM_VOCABULARY_HPP_

#include "hidrem/platform.hpp"

#include <cstdint>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace hidrem {

// ============================================================================
// Shared Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kBufferFull,
  kFormatNotSupported
};

enum class TimerError : uint8_t {
  kSlotsFull = 0,
  kInvalidPeriod,
  kNotRunning,
  kAlreadyRunning
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Either a value of type V or an error of type E.
 *
 * Constructed only through success() / error(). Accessing value() on an
 * error (or get_error() on a value) is a programming fault caught by
 * HIDREM_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) { return expected(ValueTag{}, val); }
  static expected success(V&& val) {
    return expected(ValueTag{}, std::move(val));
  }
  static expected error(E err) noexcept { return expected(ErrorTag{}, err); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) V(other.val_);
    } else {
      err_ = other.err_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) V(std::move(other.val_));
    } else {
      err_ = other.err_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&val_)) V(other.val_);
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&val_)) V(std::move(other.val_));
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    HIDREM_ASSERT(has_value_);
    return val_;
  }
  const V& value() const& noexcept {
    HIDREM_ASSERT(has_value_);
    return val_;
  }

  E get_error() const noexcept {
    HIDREM_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? val_ : fallback; }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  expected(ValueTag, const V& val) : has_value_(true) {
    ::new (static_cast<void*>(&val_)) V(val);
  }
  expected(ValueTag, V&& val) : has_value_(true) {
    ::new (static_cast<void*>(&val_)) V(std::move(val));
  }
  expected(ErrorTag, E err) noexcept : err_(err), has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      val_.~V();
    }
  }

  union {
    V val_;
    E err_;
  };
  bool has_value_;
};

/** @brief Specialization carrying only success or an error. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    HIDREM_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E err) noexcept : err_(err), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

/** @brief A value of type T or nothing. */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (static_cast<void*>(&val_)) T(val);
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) T(other.val_);
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&val_)) T(std::move(other.val_));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&val_)) T(other.val_);
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const T& value() const noexcept {
    HIDREM_ASSERT(has_value_);
    return val_;
  }
  const T& operator*() const noexcept { return value(); }

  T value_or(const T& fallback) const { return has_value_ ? val_ : fallback; }

  void reset() noexcept {
    if (has_value_) {
      val_.~T();
      has_value_ = false;
    }
  }

 private:
  union {
    T val_;
  };
  bool has_value_;
};

// ============================================================================
// NewType
// ============================================================================

/**
 * @brief Strong typedef over an integral value.
 *
 * Two NewTypes with different tags never compare or convert to each other.
 */
template <typename T, typename Tag>
class NewType {
 public:
  constexpr NewType() noexcept : val_{} {}
  constexpr explicit NewType(T val) noexcept : val_(val) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& rhs) const noexcept {
    return val_ == rhs.val_;
  }
  constexpr bool operator!=(const NewType& rhs) const noexcept {
    return val_ != rhs.val_;
  }
  constexpr bool operator<(const NewType& rhs) const noexcept {
    return val_ < rhs.val_;
  }

 private:
  T val_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a cleanup callable when leaving scope unless released.
 */
class ScopeGuard {
 public:
  explicit ScopeGuard(std::function<void()> fn) : fn_(std::move(fn)) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_ && fn_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  std::function<void()> fn_;
  bool active_ = true;
};

#define HIDREM_SCOPE_EXIT(...)                                   \
  ::hidrem::ScopeGuard HIDREM_CONCAT(hidrem_scope_exit_, __LINE__)( \
      [&]() { __VA_ARGS__; })

}  // namespace hidrem

#endif  // HIDREM_VOCABULARY_HPP_
