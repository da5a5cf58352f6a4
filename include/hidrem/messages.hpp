/**
 * @file messages.hpp
 * @brief Payload vocabulary carried inside frames.
 *
 *   Payload := uint8(kind) ++ body
 *     kPing     = 0x01  body = opaque echo token
 *     kKeyboard = 0x02  body = uint8(action) ++ key identifier
 *     kMouse    = 0x03  body reserved, ignored
 */

#ifndef HIDREM_MESSAGES_HPP_
#define HIDREM_MESSAGES_HPP_

#include "hidrem/frame_codec.hpp"
#include "hidrem/vocabulary.hpp"

#include <cstdint>
#include <string>

namespace hidrem {

enum class MessageKind : uint8_t {
  kPing = 0x01,
  kKeyboard = 0x02,
  kMouse = 0x03
};

enum class KeyAction : uint8_t {
  kPress = 0x01,
  kRelease = 0x02
};

enum class ProtocolError : uint8_t {
  kEmptyPayload = 0,  ///< Zero-length frame; receivers ignore it.
  kUnknownKind,
  kMissingAction,     ///< Keyboard payload without its action byte.
  kUnknownAction
};

/**
 * @brief One decoded payload.
 *
 * For kPing @c body is the echo token, for kKeyboard it is the key
 * identifier (and @c action is meaningful), for kMouse the raw remainder.
 */
struct Message {
  MessageKind kind = MessageKind::kPing;
  KeyAction action = KeyAction::kPress;
  std::string body;
};

inline const char* KindName(MessageKind kind) noexcept {
  switch (kind) {
    case MessageKind::kPing:
      return "PING";
    case MessageKind::kKeyboard:
      return "KEYBOARD";
    case MessageKind::kMouse:
      return "MOUSE";
    default:
      return "UNKNOWN";
  }
}

inline const char* ProtocolErrorName(ProtocolError err) noexcept {
  switch (err) {
    case ProtocolError::kEmptyPayload:
      return "empty payload";
    case ProtocolError::kUnknownKind:
      return "unknown message kind";
    case ProtocolError::kMissingAction:
      return "keyboard message without action";
    case ProtocolError::kUnknownAction:
      return "unknown keyboard action";
    default:
      return "?";
  }
}

// ============================================================================
// Encoding
// ============================================================================

inline Bytes EncodePing(const std::string& token) {
  Bytes out;
  out.reserve(1U + token.size());
  out.push_back(static_cast<uint8_t>(MessageKind::kPing));
  out.insert(out.end(), token.begin(), token.end());
  return out;
}

inline Bytes EncodeKeyboard(KeyAction action, const std::string& key) {
  Bytes out;
  out.reserve(2U + key.size());
  out.push_back(static_cast<uint8_t>(MessageKind::kKeyboard));
  out.push_back(static_cast<uint8_t>(action));
  out.insert(out.end(), key.begin(), key.end());
  return out;
}

// ============================================================================
// Decoding
// ============================================================================

inline expected<Message, ProtocolError> DecodeMessage(const uint8_t* data,
                                                      uint32_t len) {
  if (len == 0U) {
    return expected<Message, ProtocolError>::error(ProtocolError::kEmptyPayload);
  }
  Message msg;
  const char* rest = reinterpret_cast<const char*>(data + 1);
  const uint32_t rest_len = len - 1U;

  switch (data[0]) {
    case static_cast<uint8_t>(MessageKind::kPing):
      msg.kind = MessageKind::kPing;
      msg.body.assign(rest, rest_len);
      break;
    case static_cast<uint8_t>(MessageKind::kKeyboard):
      msg.kind = MessageKind::kKeyboard;
      if (rest_len == 0U) {
        return expected<Message, ProtocolError>::error(
            ProtocolError::kMissingAction);
      }
      if (data[1] == static_cast<uint8_t>(KeyAction::kPress)) {
        msg.action = KeyAction::kPress;
      } else if (data[1] == static_cast<uint8_t>(KeyAction::kRelease)) {
        msg.action = KeyAction::kRelease;
      } else {
        return expected<Message, ProtocolError>::error(
            ProtocolError::kUnknownAction);
      }
      msg.body.assign(rest + 1, rest_len - 1U);
      break;
    case static_cast<uint8_t>(MessageKind::kMouse):
      msg.kind = MessageKind::kMouse;
      msg.body.assign(rest, rest_len);
      break;
    default:
      return expected<Message, ProtocolError>::error(ProtocolError::kUnknownKind);
  }
  return expected<Message, ProtocolError>::success(std::move(msg));
}

}  // namespace hidrem

#endif  // HIDREM_MESSAGES_HPP_
