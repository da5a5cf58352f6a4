/**
 * @file frame_codec.hpp
 * @brief Length-prefixed framing for byte streams.
 *
 * Wire format of one frame:
 *
 *   +----------------------+------------------------+
 *   | length (uint32, BE)  | payload[length]        |
 *   +----------------------+------------------------+
 *
 * FrameDecoder is a two-state machine fed with arbitrary chunks. It needs
 * exactly 4 bytes in kAwaitingLengthPrefix and exactly `length` bytes in
 * kAwaitingBody; the accumulation buffer never holds more than the current
 * field. A zero length yields an empty message at once.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef HIDREM_FRAME_CODEC_HPP_
#define HIDREM_FRAME_CODEC_HPP_

#include "hidrem/platform.hpp"
#include "hidrem/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <vector>

/// Largest length prefix accepted before the stream is declared corrupt.
#ifndef HIDREM_MAX_FRAME_SIZE
#define HIDREM_MAX_FRAME_SIZE (16U * 1024U * 1024U)
#endif

namespace hidrem {

using Bytes = std::vector<uint8_t>;

constexpr uint32_t kFramePrefixSize = 4U;

enum class FrameError : uint8_t {
  kFrameTooLarge = 0
};

enum class DecodeState : uint8_t {
  kAwaitingLengthPrefix = 0,
  kAwaitingBody
};

// ============================================================================
// Big-endian helpers
// ============================================================================

inline void WriteBe32(uint8_t* dst, uint32_t v) noexcept {
  dst[0] = static_cast<uint8_t>(v >> 24);
  dst[1] = static_cast<uint8_t>(v >> 16);
  dst[2] = static_cast<uint8_t>(v >> 8);
  dst[3] = static_cast<uint8_t>(v);
}

inline uint32_t ReadBe32(const uint8_t* src) noexcept {
  return (static_cast<uint32_t>(src[0]) << 24) |
         (static_cast<uint32_t>(src[1]) << 16) |
         (static_cast<uint32_t>(src[2]) << 8) | static_cast<uint32_t>(src[3]);
}

// ============================================================================
// Encoding
// ============================================================================

/**
 * @brief Append one frame (prefix + payload) to @p out.
 */
inline void EncodeFrame(const void* payload, uint32_t len, Bytes& out) {
  const size_t base = out.size();
  out.resize(base + kFramePrefixSize + len);
  WriteBe32(out.data() + base, len);
  if (len > 0U) {
    std::memcpy(out.data() + base + kFramePrefixSize, payload, len);
  }
}

inline Bytes EncodeFrame(const void* payload, uint32_t len) {
  Bytes out;
  out.reserve(kFramePrefixSize + len);
  EncodeFrame(payload, len, out);
  return out;
}

// ============================================================================
// FrameDecoder
// ============================================================================

class FrameDecoder {
 public:
  explicit FrameDecoder(uint32_t max_frame_size = HIDREM_MAX_FRAME_SIZE) noexcept
      : max_frame_size_(max_frame_size) {}

  /**
   * @brief Consume @p len bytes, appending each completed message to @p out.
   *
   * Messages completed before a fault are still appended. Once a length
   * prefix above the maximum is seen the decoder is faulted: this and every
   * later call return kFrameTooLarge until Reset().
   *
   * @return Number of messages appended by this call.
   */
  expected<uint32_t, FrameError> Feed(const uint8_t* data, size_t len,
                                      std::vector<Bytes>& out) {
    if (faulted_) {
      return expected<uint32_t, FrameError>::error(FrameError::kFrameTooLarge);
    }
    uint32_t emitted = 0;
    while (len > 0U) {
      if (state_ == DecodeState::kAwaitingLengthPrefix) {
        const size_t take = std::min<size_t>(kFramePrefixSize - prefix_len_, len);
        std::memcpy(prefix_ + prefix_len_, data, take);
        prefix_len_ += static_cast<uint32_t>(take);
        data += take;
        len -= take;
        if (prefix_len_ < kFramePrefixSize) {
          break;
        }
        prefix_len_ = 0;
        const uint32_t body_len = ReadBe32(prefix_);
        if (body_len > max_frame_size_) {
          faulted_ = true;
          return expected<uint32_t, FrameError>::error(
              FrameError::kFrameTooLarge);
        }
        if (body_len == 0U) {
          out.emplace_back();
          ++emitted;
          continue;
        }
        body_.clear();
        body_.reserve(std::min<uint32_t>(body_len, kInitialBodyReserve));
        body_len_ = body_len;
        state_ = DecodeState::kAwaitingBody;
      } else {
        const size_t take = std::min<size_t>(body_len_ - body_.size(), len);
        body_.insert(body_.end(), data, data + take);
        data += take;
        len -= take;
        if (body_.size() < body_len_) {
          break;
        }
        out.push_back(std::move(body_));
        body_ = Bytes();
        body_len_ = 0;
        state_ = DecodeState::kAwaitingLengthPrefix;
        ++emitted;
      }
    }
    return expected<uint32_t, FrameError>::success(emitted);
  }

  /** @brief Drop any partial field and clear a fault. */
  void Reset() noexcept {
    state_ = DecodeState::kAwaitingLengthPrefix;
    prefix_len_ = 0;
    body_.clear();
    body_len_ = 0;
    faulted_ = false;
  }

  DecodeState State() const noexcept { return state_; }

  /** @brief Bytes still missing from the field being assembled (> 0). */
  uint32_t Required() const noexcept {
    return (state_ == DecodeState::kAwaitingLengthPrefix)
               ? kFramePrefixSize - prefix_len_
               : body_len_ - static_cast<uint32_t>(body_.size());
  }

  /** @brief Bytes held for the field being assembled. */
  uint32_t Buffered() const noexcept {
    return (state_ == DecodeState::kAwaitingLengthPrefix)
               ? prefix_len_
               : static_cast<uint32_t>(body_.size());
  }

  bool Faulted() const noexcept { return faulted_; }
  uint32_t MaxFrameSize() const noexcept { return max_frame_size_; }

 private:
  static constexpr uint32_t kInitialBodyReserve = 64U * 1024U;

  uint32_t max_frame_size_;
  DecodeState state_ = DecodeState::kAwaitingLengthPrefix;
  uint8_t prefix_[kFramePrefixSize] = {};
  uint32_t prefix_len_ = 0;
  Bytes body_;
  uint32_t body_len_ = 0;
  bool faulted_ = false;
};

}  // namespace hidrem

#endif  // HIDREM_FRAME_CODEC_HPP_
