/**
 * @file discovery.hpp
 * @brief UDP broadcast discovery of HIDrem servers.
 *
 * A server runs a Broadcaster that announces itself once per interval with
 * a text record sent to the broadcast address:
 *
 *   IDENTIFIER|base64(hostname)|ip|port        e.g. HIDrem0:1|aG9zdA==|10.0.0.5|40213
 *
 * A client calls Discover(), which listens on the discovery port for a
 * bounded window and returns every distinct server heard. Records with a
 * different identifier, or malformed in any field, are ignored.
 *
 * Header-only, C++17.
 */

#ifndef HIDREM_DISCOVERY_HPP_
#define HIDREM_DISCOVERY_HPP_

#include "hidrem/log.hpp"
#include "hidrem/platform.hpp"
#include "hidrem/socket.hpp"
#include "hidrem/timer.hpp"
#include "hidrem/vocabulary.hpp"

#if HIDREM_HAS_NETWORK

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#ifndef HIDREM_DISCOVERY_IDENTIFIER
#define HIDREM_DISCOVERY_IDENTIFIER "HIDrem0:1"
#endif

#ifndef HIDREM_DISCOVERY_PORT
#define HIDREM_DISCOVERY_PORT 5026U
#endif

#ifndef HIDREM_DISCOVERY_INTERVAL_MS
#define HIDREM_DISCOVERY_INTERVAL_MS 1000U
#endif

#ifndef HIDREM_DISCOVERY_WINDOW_MS
#define HIDREM_DISCOVERY_WINDOW_MS 3000U
#endif

/// Largest datagram Discover() reads; longer records are truncated.
#ifndef HIDREM_DISCOVERY_MAX_RECORD
#define HIDREM_DISCOVERY_MAX_RECORD 2048U
#endif

namespace hidrem {

// ============================================================================
// Discovery Error
// ============================================================================

enum class DiscoveryError : uint8_t {
  kSocketFailed = 0,
  kBindFailed,
  kSendFailed,
  kResolveFailed,
  kAlreadyRunning,
  kNotRunning,
  kInvalidIdentifier
};

// ============================================================================
// Base64 (RFC 4648, standard alphabet, '=' padding)
// ============================================================================

namespace base64 {

inline std::string Encode(const uint8_t* data, size_t len) {
  static const char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((len + 2U) / 3U) * 4U);
  size_t i = 0;
  for (; i + 3U <= len; i += 3U) {
    const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                       (static_cast<uint32_t>(data[i + 1U]) << 8) |
                       static_cast<uint32_t>(data[i + 2U]);
    out.push_back(kAlphabet[(v >> 18) & 0x3FU]);
    out.push_back(kAlphabet[(v >> 12) & 0x3FU]);
    out.push_back(kAlphabet[(v >> 6) & 0x3FU]);
    out.push_back(kAlphabet[v & 0x3FU]);
  }
  const size_t rest = len - i;
  if (rest > 0U) {
    uint32_t v = static_cast<uint32_t>(data[i]) << 16;
    if (rest == 2U) {
      v |= static_cast<uint32_t>(data[i + 1U]) << 8;
    }
    out.push_back(kAlphabet[(v >> 18) & 0x3FU]);
    out.push_back(kAlphabet[(v >> 12) & 0x3FU]);
    out.push_back(rest == 2U ? kAlphabet[(v >> 6) & 0x3FU] : '=');
    out.push_back('=');
  }
  return out;
}

inline std::string Encode(const std::string& text) {
  return Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/**
 * @brief Strict decode: length must be a multiple of 4, padding only at
 *        the end.
 * @return false on any invalid input.
 */
inline bool Decode(const std::string& text, std::string& out) {
  auto value_of = [](char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  };

  if (text.size() % 4U != 0U) {
    return false;
  }
  std::string decoded;
  decoded.reserve((text.size() / 4U) * 3U);
  for (size_t i = 0; i < text.size(); i += 4U) {
    const bool last = (i + 4U == text.size());
    int vals[4];
    uint32_t pad = 0;
    for (size_t j = 0; j < 4U; ++j) {
      const char c = text[i + j];
      if (c == '=' && last && j >= 2U) {
        vals[j] = 0;
        ++pad;
        continue;
      }
      if (pad > 0U) {
        return false;  // data after padding
      }
      vals[j] = value_of(c);
      if (vals[j] < 0) {
        return false;
      }
    }
    const uint32_t v = (static_cast<uint32_t>(vals[0]) << 18) |
                       (static_cast<uint32_t>(vals[1]) << 12) |
                       (static_cast<uint32_t>(vals[2]) << 6) |
                       static_cast<uint32_t>(vals[3]);
    decoded.push_back(static_cast<char>((v >> 16) & 0xFFU));
    if (pad < 2U) {
      decoded.push_back(static_cast<char>((v >> 8) & 0xFFU));
    }
    if (pad < 1U) {
      decoded.push_back(static_cast<char>(v & 0xFFU));
    }
  }
  out.swap(decoded);
  return true;
}

}  // namespace base64

// ============================================================================
// Advertisement
// ============================================================================

/**
 * @brief One server as seen by Discover().
 *
 * @c ip is where the datagram came from; @c advertised_ip is the address
 * the server put in its record. Equality (used for de-duplication) covers
 * hostname, ip and port only.
 */
struct Advertisement {
  std::string hostname;
  std::string ip;
  uint16_t port = 0;
  std::string advertised_ip;

  bool operator==(const Advertisement& rhs) const {
    return hostname == rhs.hostname && ip == rhs.ip && port == rhs.port;
  }
  bool operator!=(const Advertisement& rhs) const { return !(*this == rhs); }
};

/** @brief Identifiers are the first record field and must not contain '|'. */
inline bool IsValidIdentifier(const char* identifier) noexcept {
  return identifier != nullptr && identifier[0] != '\0' &&
         std::strchr(identifier, '|') == nullptr;
}

inline std::string SerializeAdvertisement(const char* identifier,
                                          const std::string& hostname,
                                          const std::string& ip,
                                          uint16_t port) {
  std::string record(identifier);
  record += '|';
  record += base64::Encode(hostname);
  record += '|';
  record += ip;
  record += '|';
  record += std::to_string(port);
  return record;
}

/**
 * @brief Parse a received record.
 * @param sender_ip Source address of the datagram, reported as @c out.ip.
 * @return false if the identifier differs or any field is malformed.
 */
inline bool ParseAdvertisement(const char* identifier, const char* data,
                               size_t len, const std::string& sender_ip,
                               Advertisement& out) {
  const std::string record(data, len);
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    const size_t bar = record.find('|', start);
    if (bar == std::string::npos) {
      fields.push_back(record.substr(start));
      break;
    }
    fields.push_back(record.substr(start, bar - start));
    start = bar + 1U;
  }
  if (fields.size() != 4U || fields[0] != identifier) {
    return false;
  }

  std::string hostname;
  if (!base64::Decode(fields[1], hostname)) {
    return false;
  }

  const std::string& port_text = fields[3];
  if (port_text.empty() || port_text.size() > 5U) {
    return false;
  }
  uint32_t port = 0;
  for (char c : port_text) {
    if (c < '0' || c > '9') {
      return false;
    }
    port = port * 10U + static_cast<uint32_t>(c - '0');
  }
  if (port == 0U || port > 65535U) {
    return false;
  }

  out.hostname = std::move(hostname);
  out.ip = sender_ip;
  out.port = static_cast<uint16_t>(port);
  out.advertised_ip = fields[2];
  return true;
}

// ============================================================================
// DiscoveryConfig
// ============================================================================

struct DiscoveryConfig {
  std::string identifier = HIDREM_DISCOVERY_IDENTIFIER;
  uint16_t port = HIDREM_DISCOVERY_PORT;
  uint32_t interval_ms = HIDREM_DISCOVERY_INTERVAL_MS;
  uint32_t window_ms = HIDREM_DISCOVERY_WINDOW_MS;
  /// Destination of announcements.
  std::string broadcast_address = "255.255.255.255";
  /// Address put in the record; empty means resolve this host's own name.
  std::string advertise_ip;
};

// ============================================================================
// Broadcaster
// ============================================================================

/**
 * @brief Periodically announces one service port.
 *
 * Runs on its own TimerScheduler thread, independent of any reactor.
 *
 * Typical usage:
 *
 *   hidrem::Broadcaster caster;
 *   caster.Start(bound_port);
 *   // ...
 *   caster.Stop();
 */
class Broadcaster final {
 public:
  explicit Broadcaster(const DiscoveryConfig& config = DiscoveryConfig())
      : config_(config), scheduler_(1U) {}

  ~Broadcaster() { (void)Stop(); }

  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  /**
   * @brief Resolve the local address, send the first announcement, and
   *        schedule the rest.
   * @return kResolveFailed if this host's address cannot be determined.
   */
  expected<void, DiscoveryError> Start(uint16_t service_port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kAlreadyRunning);
    }
    if (!IsValidIdentifier(config_.identifier.c_str())) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kInvalidIdentifier);
    }

    std::string ip = config_.advertise_ip;
    if (ip.empty()) {
      auto resolved = ResolveLocalIp();
      if (!resolved.has_value()) {
        HIDREM_LOG_ERROR("Discovery", "cannot determine local IP for '%s'",
                         LocalHostname().c_str());
        return expected<void, DiscoveryError>::error(
            DiscoveryError::kResolveFailed);
      }
      ip = resolved.value();
    }

    auto dest = SocketAddress::FromIpv4(config_.broadcast_address.c_str(),
                                        config_.port);
    if (!dest.has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kResolveFailed);
    }
    auto created = UdpSocket::Create();
    if (!created.has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSocketFailed);
    }
    sock_ = std::move(created.value());
    if (!sock_.SetBroadcast(true).has_value()) {
      sock_.Close();
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSocketFailed);
    }
    dest_ = dest.value();
    record_ = SerializeAdvertisement(config_.identifier.c_str(),
                                     LocalHostname(), ip, service_port);

    auto task = scheduler_.Add(config_.interval_ms, &Broadcaster::OnTick, this);
    if (!task.has_value() || !scheduler_.Start().has_value()) {
      sock_.Close();
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSocketFailed);
    }
    task_ = task.value();
    running_ = true;
    SendLocked();
    HIDREM_LOG_INFO("Discovery", "announcing '%s' to %s:%u every %u ms",
                    record_.c_str(), config_.broadcast_address.c_str(),
                    static_cast<unsigned>(config_.port), config_.interval_ms);
    return expected<void, DiscoveryError>::success();
  }

  /** @brief Cancel announcements; returns once no send is in progress. */
  expected<void, DiscoveryError> Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_) {
        return expected<void, DiscoveryError>::error(
            DiscoveryError::kNotRunning);
      }
      running_ = false;
    }
    (void)scheduler_.Remove(task_);
    scheduler_.Stop();
    std::lock_guard<std::mutex> lock(mutex_);
    sock_.Close();
    HIDREM_LOG_DEBUG("Discovery", "broadcaster stopped after %u sends",
                     sent_count_.load());
    return expected<void, DiscoveryError>::success();
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  /** @brief The record being announced (empty before Start()). */
  std::string Record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
  }

  uint32_t SentCount() const noexcept { return sent_count_.load(); }

 private:
  static void OnTick(void* ctx) {
    auto* self = static_cast<Broadcaster*>(ctx);
    std::lock_guard<std::mutex> lock(self->mutex_);
    if (self->running_) {
      self->SendLocked();
    }
  }

  // Requires mutex_. A failed send is logged and retried next interval.
  void SendLocked() {
    auto sent = sock_.SendTo(record_.data(), record_.size(), dest_);
    if (!sent.has_value()) {
      HIDREM_LOG_WARN("Discovery", "announcement to %s:%u failed: errno=%d",
                      config_.broadcast_address.c_str(),
                      static_cast<unsigned>(config_.port), errno);
      return;
    }
    sent_count_.fetch_add(1U);
  }

  DiscoveryConfig config_;
  TimerScheduler scheduler_;
  mutable std::mutex mutex_;
  UdpSocket sock_;
  SocketAddress dest_;
  std::string record_;
  TimerTaskId task_;
  bool running_ = false;
  std::atomic<uint32_t> sent_count_{0U};
};

// ============================================================================
// Discover
// ============================================================================

/**
 * @brief Listen for announcements for @c config.window_ms and return each
 *        distinct server heard, in order of first arrival.
 *
 * Blocks the caller for the whole window regardless of traffic.
 */
inline expected<std::vector<Advertisement>, DiscoveryError> Discover(
    const DiscoveryConfig& config = DiscoveryConfig()) {
  using Result = expected<std::vector<Advertisement>, DiscoveryError>;
  if (!IsValidIdentifier(config.identifier.c_str())) {
    return Result::error(DiscoveryError::kInvalidIdentifier);
  }

  auto created = UdpSocket::Create();
  if (!created.has_value()) {
    return Result::error(DiscoveryError::kSocketFailed);
  }
  UdpSocket sock = std::move(created.value());
  (void)sock.SetReuseAddr(true);
  if (!sock.Bind(SocketAddress::Any(config.port)).has_value()) {
    HIDREM_LOG_WARN("Discovery", "cannot bind discovery port %u: errno=%d",
                    static_cast<unsigned>(config.port), errno);
    return Result::error(DiscoveryError::kBindFailed);
  }

  std::vector<Advertisement> found;
  char buf[HIDREM_DISCOVERY_MAX_RECORD];
  const uint64_t deadline = SteadyNowMs() + config.window_ms;

  while (true) {
    const uint64_t now = SteadyNowMs();
    if (now >= deadline) {
      break;
    }
    const uint64_t remaining = deadline - now;
    if (!sock.SetRecvTimeout(static_cast<uint32_t>(remaining)).has_value()) {
      return Result::error(DiscoveryError::kSocketFailed);
    }

    SocketAddress sender;
    auto received = sock.RecvFrom(buf, sizeof(buf), sender);
    if (!received.has_value()) {
      if (received.get_error() == SocketError::kWouldBlock) {
        continue;
      }
      return Result::error(DiscoveryError::kSocketFailed);
    }

    Advertisement ad;
    if (!ParseAdvertisement(config.identifier.c_str(), buf,
                            static_cast<size_t>(received.value()),
                            sender.Ip(), ad)) {
      HIDREM_LOG_DEBUG("Discovery", "ignoring %d-byte datagram from %s",
                       received.value(), sender.Ip().c_str());
      continue;
    }
    bool duplicate = false;
    for (const Advertisement& known : found) {
      if (known == ad) {
        duplicate = true;
        break;
      }
    }
    if (!duplicate) {
      HIDREM_LOG_DEBUG("Discovery", "found %s at %s:%u", ad.hostname.c_str(),
                       ad.ip.c_str(), static_cast<unsigned>(ad.port));
      found.push_back(std::move(ad));
    }
  }
  return Result::success(std::move(found));
}

}  // namespace hidrem

#endif  // HIDREM_HAS_NETWORK

#endif  // HIDREM_DISCOVERY_HPP_
