/**
 * @file input_mapper.hpp
 * @brief Translates controller control changes into key press/release calls.
 *
 * Three binding kinds, written in config files as:
 *
 *   button   <key>                                 value != 0 presses
 *   pressure <key> <trigger>                       value >= trigger presses
 *   vector   <deadzone> <up> <down> <left> <right>  2-D stick outside the deadzone
 *
 * For a vector binding every direction is re-evaluated on each update, so
 * returning the stick to centre releases whatever was pressed. An empty key
 * ("-" in the text form) disables that direction.
 */

#ifndef HIDREM_INPUT_MAPPER_HPP_
#define HIDREM_INPUT_MAPPER_HPP_

#include "hidrem/config.hpp"
#include "hidrem/key_injector.hpp"
#include "hidrem/log.hpp"

#include <cstdint>
#include <cstdlib>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace hidrem {

enum class BindingKind : uint8_t {
  kButton = 0,
  kPressure,
  kVector
};

struct Binding {
  BindingKind kind = BindingKind::kButton;
  std::string key;          ///< kButton, kPressure
  double trigger = 0.5;     ///< kPressure
  double deadzone = 0.0;    ///< kVector
  std::string up;
  std::string down;
  std::string left;
  std::string right;
};

namespace detail {

inline bool ParseNumber(const std::string& text, double& out) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  out = std::strtod(text.c_str(), &end);
  return *end == '\0';
}

inline std::string KeyField(const std::string& token) {
  return token == "-" ? std::string() : token;
}

}  // namespace detail

/**
 * @brief Parse the text form of one binding.
 * @return false on an unknown kind, a wrong field count or a bad number.
 */
inline bool ParseBinding(const std::string& text, Binding& out) {
  std::istringstream in(text);
  std::vector<std::string> tokens;
  std::string token;
  while (in >> token) {
    tokens.push_back(token);
  }
  if (tokens.empty()) {
    return false;
  }

  Binding b;
  if (tokens[0] == "button" && tokens.size() == 2U) {
    b.kind = BindingKind::kButton;
    b.key = detail::KeyField(tokens[1]);
  } else if (tokens[0] == "pressure" && tokens.size() == 3U) {
    b.kind = BindingKind::kPressure;
    b.key = detail::KeyField(tokens[1]);
    if (!detail::ParseNumber(tokens[2], b.trigger)) {
      return false;
    }
  } else if (tokens[0] == "vector" && tokens.size() == 6U) {
    b.kind = BindingKind::kVector;
    if (!detail::ParseNumber(tokens[1], b.deadzone) || b.deadzone < 0.0) {
      return false;
    }
    b.up = detail::KeyField(tokens[2]);
    b.down = detail::KeyField(tokens[3]);
    b.left = detail::KeyField(tokens[4]);
    b.right = detail::KeyField(tokens[5]);
  } else {
    return false;
  }
  out = b;
  return true;
}

// ============================================================================
// InputMapper
// ============================================================================

class InputMapper {
 public:
  explicit InputMapper(KeyInjector& sink) noexcept : sink_(sink) {}

  void Bind(const std::string& control, const Binding& binding) {
    bindings_[control] = binding;
  }

  void Unbind(const std::string& control) { bindings_.erase(control); }

  bool IsBound(const std::string& control) const {
    return bindings_.find(control) != bindings_.end();
  }

  uint32_t Size() const noexcept {
    return static_cast<uint32_t>(bindings_.size());
  }

  /**
   * @brief Apply a new value for @p control.
   *
   * @p x is the button state or trigger pressure; vector bindings use
   * (@p x, @p y). Unbound controls are ignored.
   * @return false if @p control is unbound.
   */
  bool Update(const std::string& control, double x, double y = 0.0) {
    auto it = bindings_.find(control);
    if (it == bindings_.end()) {
      return false;
    }
    const Binding& b = it->second;
    switch (b.kind) {
      case BindingKind::kButton:
        Apply(b.key, x != 0.0);
        break;
      case BindingKind::kPressure:
        Apply(b.key, x >= b.trigger);
        break;
      case BindingKind::kVector:
        Apply(b.up, y > b.deadzone);
        Apply(b.down, y < -b.deadzone);
        Apply(b.right, x > b.deadzone);
        Apply(b.left, x < -b.deadzone);
        break;
    }
    return true;
  }

  /**
   * @brief Bind every entry of the "keymap" section of @p config.
   * @return Number of bindings loaded; malformed entries are skipped with
   *         a warning.
   */
  uint32_t LoadKeymap(const ConfigStore& config) {
    uint32_t loaded = 0;
    for (const std::string& control : config.Keys("keymap")) {
      Binding b;
      const char* text = config.GetString("keymap", control.c_str());
      if (!ParseBinding(text, b)) {
        HIDREM_LOG_WARN("Input", "ignoring bad binding %s = '%s'",
                        control.c_str(), text);
        continue;
      }
      Bind(control, b);
      ++loaded;
    }
    return loaded;
  }

 private:
  void Apply(const std::string& key, bool pressed) {
    if (key.empty()) {
      return;
    }
    if (pressed) {
      sink_.PressKey(key);
    } else {
      sink_.ReleaseKey(key);
    }
  }

  KeyInjector& sink_;
  std::map<std::string, Binding> bindings_;
};

}  // namespace hidrem

#endif  // HIDREM_INPUT_MAPPER_HPP_
