/**
 * @file key_injector.hpp
 * @brief Boundary to the host's synthetic keyboard.
 *
 * The transport only ever calls PressKey()/ReleaseKey() with the key
 * identifier received from the controller. Platform back ends implement
 * this interface; LoggingKeyInjector records the calls in the log.
 */

#ifndef HIDREM_KEY_INJECTOR_HPP_
#define HIDREM_KEY_INJECTOR_HPP_

#include "hidrem/log.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace hidrem {

class KeyInjector {
 public:
  virtual ~KeyInjector() = default;

  virtual void PressKey(const std::string& key) = 0;
  virtual void ReleaseKey(const std::string& key) = 0;
};

class LoggingKeyInjector final : public KeyInjector {
 public:
  void PressKey(const std::string& key) override {
    presses_.fetch_add(1U);
    HIDREM_LOG_INFO("Keys", "press '%s'", key.c_str());
  }

  void ReleaseKey(const std::string& key) override {
    releases_.fetch_add(1U);
    HIDREM_LOG_INFO("Keys", "release '%s'", key.c_str());
  }

  uint32_t PressCount() const noexcept { return presses_.load(); }
  uint32_t ReleaseCount() const noexcept { return releases_.load(); }

 private:
  std::atomic<uint32_t> presses_{0U};
  std::atomic<uint32_t> releases_{0U};
};

}  // namespace hidrem

#endif  // HIDREM_KEY_INJECTOR_HPP_
