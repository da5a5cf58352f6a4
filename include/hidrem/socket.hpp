/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */


/**
 * @file socket.hpp
 * @brief POSIX socket RAII wrappers used by the reactor and discovery.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Provides TcpSocket, UdpSocket and TcpListener with RAII fd ownership,
 * SocketAddress over sockaddr_in with name resolution, the "host:port"
 * endpoint parser, and local hostname / IPv4 discovery helpers.
 * All errors are returned via hidrem::expected<V,E>.
 */

#ifndef HIDREM_SOCKET_HPP_
#define HIDREM_SOCKET_HPP_

#include "hidrem/platform.hpp"
#include "hidrem/vocabulary.hpp"

#if HIDREM_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

namespace hidrem {

// ============================================================================
// Constants
// ============================================================================

constexpr int32_t kDefaultBacklog = 16;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kResolveFailed,
  kWouldBlock  ///< EAGAIN/EWOULDBLOCK (or SO_RCVTIMEO expiry), retry later.
};

// ============================================================================
// SocketAddress
// ============================================================================

/**
 * @brief IPv4 socket address (sockaddr_in).
 */
class SocketAddress {
 public:
  SocketAddress() noexcept {
    std::memset(&addr_, 0, sizeof(addr_));
    addr_.sin_family = AF_INET;
  }

  /**
   * @brief Build an address from a dotted-decimal IPv4 literal.
   * @return kResolveFailed if @p ip is not a valid literal.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kResolveFailed);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /**
   * @brief Resolve a host name or literal to its first IPv4 address.
   *
   * An empty host means INADDR_ANY. Literals skip the resolver.
   * @return kResolveFailed if the name has no IPv4 address.
   */
  static expected<SocketAddress, SocketError> Resolve(const char* host,
                                                      uint16_t port) noexcept {
    if (host == nullptr || host[0] == '\0') {
      return expected<SocketAddress, SocketError>::success(Any(port));
    }
    auto literal = FromIpv4(host, port);
    if (literal.has_value()) {
      return literal;
    }
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &res) != 0 || res == nullptr) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kResolveFailed);
    }
    SocketAddress sa;
    std::memcpy(&sa.addr_, res->ai_addr, sizeof(sa.addr_));
    sa.addr_.sin_port = htons(port);
    ::freeaddrinfo(res);
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /** @brief 0.0.0.0:port */
  static SocketAddress Any(uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    sa.addr_.sin_port = htons(port);
    return sa;
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  /** @brief Port in host byte order. */
  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /** @brief Dotted-decimal form of the address part. */
  std::string Ip() const {
    char buf[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof(buf)) == nullptr) {
      return std::string();
    }
    return std::string(buf);
  }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// Endpoint
// ============================================================================

/**
 * @brief A "host:port" pair as typed by a user.
 */
struct Endpoint {
  std::string host;
  uint16_t port = 0;
};

/**
 * @brief Split "host:port" at the last colon.
 *
 * The host must be non-empty and the port a decimal number in 1..65535.
 * @return false on malformed input; @p out is left untouched.
 */
inline bool ParseEndpoint(const char* text, Endpoint& out) {
  if (text == nullptr) {
    return false;
  }
  const char* colon = std::strrchr(text, ':');
  if (colon == nullptr || colon == text || colon[1] == '\0') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const long port = std::strtol(colon + 1, &end, 10);
  if (errno != 0 || *end != '\0' || port < 1 || port > 65535) {
    return false;
  }
  out.host.assign(text, static_cast<size_t>(colon - text));
  out.port = static_cast<uint16_t>(port);
  return true;
}

// ============================================================================
// Local host identity
// ============================================================================

/** @brief gethostname(2), or an empty string if it fails. */
inline std::string LocalHostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    return std::string();
  }
  return std::string(buf);
}

/**
 * @brief The IPv4 address this host's own name resolves to.
 *
 * Tries the plain hostname first, then its canonical (fully qualified)
 * name. @return kResolveFailed when neither yields an IPv4 address.
 */
inline expected<std::string, SocketError> ResolveLocalIp() {
  const std::string host = LocalHostname();
  if (host.empty()) {
    return expected<std::string, SocketError>::error(
        SocketError::kResolveFailed);
  }
  auto direct = SocketAddress::Resolve(host.c_str(), 0);
  if (direct.has_value()) {
    return expected<std::string, SocketError>::success(direct.value().Ip());
  }

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_flags = AI_CANONNAME;
  struct addrinfo* res = nullptr;
  if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 ||
      res == nullptr) {
    return expected<std::string, SocketError>::error(
        SocketError::kResolveFailed);
  }
  std::string fqdn = (res->ai_canonname != nullptr) ? res->ai_canonname : "";
  ::freeaddrinfo(res);
  if (fqdn.empty() || fqdn == host) {
    return expected<std::string, SocketError>::error(
        SocketError::kResolveFailed);
  }
  auto via_fqdn = SocketAddress::Resolve(fqdn.c_str(), 0);
  if (!via_fqdn.has_value()) {
    return expected<std::string, SocketError>::error(
        SocketError::kResolveFailed);
  }
  return expected<std::string, SocketError>::success(via_fqdn.value().Ip());
}

// ============================================================================
// SocketBase
// ============================================================================

/**
 * @brief Owns one descriptor and the options every socket kind shares.
 *
 * Move-only. The descriptor is closed exactly once, by Close() or the
 * destructor, whichever comes first.
 */
class SocketBase {
 public:
  SocketBase(const SocketBase&) = delete;
  SocketBase& operator=(const SocketBase&) = delete;

  /** @brief Close the descriptor. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

  expected<void, SocketError> SetNonBlocking(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, flags) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    return SetIntOption(SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
  }

  /** @brief Bound local address (port 0 binds resolve here). */
  expected<SocketAddress, SocketError> LocalAddress() const noexcept {
    if (fd_ < 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidFd);
    }
    SocketAddress sa;
    socklen_t len = sa.Size();
    if (::getsockname(fd_, sa.RawMut(), &len) < 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidFd);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

 protected:
  SocketBase() noexcept : fd_(-1) {}
  explicit SocketBase(int32_t fd) noexcept : fd_(fd) {}
  ~SocketBase() { Close(); }

  SocketBase(SocketBase&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  SocketBase& operator=(SocketBase&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  expected<void, SocketError> SetIntOption(int level, int name,
                                           int32_t value) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::setsockopt(fd_, level, name, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> BindTo(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  static bool IsTransient(int err) noexcept {
    return err == EAGAIN || err == EWOULDBLOCK;
  }

  int32_t fd_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief RAII TCP stream socket.
 */
class TcpSocket : public SocketBase {
 public:
  TcpSocket() noexcept = default;
  TcpSocket(TcpSocket&&) noexcept = default;
  TcpSocket& operator=(TcpSocket&&) noexcept = default;

  static expected<TcpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  /** @brief Blocking connect; retried transparently on EINTR. */
  expected<void, SocketError> Connect(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int rc;
    do {
      rc = ::connect(fd_, addr.Raw(), addr.Size());
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      return expected<void, SocketError>::error(SocketError::kConnectFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(
          IsTransient(errno) || errno == EINTR ? SocketError::kWouldBlock
                                               : SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /** @brief A zero return means the peer closed its side. */
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::recv(fd_, buf, len, 0);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(
          IsTransient(errno) || errno == EINTR ? SocketError::kWouldBlock
                                               : SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<void, SocketError> SetNoDelay(bool enable) noexcept {
    return SetIntOption(IPPROTO_TCP, TCP_NODELAY, enable ? 1 : 0);
  }

 private:
  friend class TcpListener;
  explicit TcpSocket(int32_t fd) noexcept : SocketBase(fd) {}
};

// ============================================================================
// UdpSocket
// ============================================================================

/**
 * @brief RAII UDP datagram socket.
 */
class UdpSocket : public SocketBase {
 public:
  UdpSocket() noexcept = default;
  UdpSocket(UdpSocket&&) noexcept = default;
  UdpSocket& operator=(UdpSocket&&) noexcept = default;

  static expected<UdpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
      return expected<UdpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<UdpSocket, SocketError>::success(UdpSocket(fd));
  }

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    return BindTo(addr);
  }

  /** @brief SO_BROADCAST, required before sending to 255.255.255.255. */
  expected<void, SocketError> SetBroadcast(bool enable) noexcept {
    return SetIntOption(SOL_SOCKET, SO_BROADCAST, enable ? 1 : 0);
  }

  /**
   * @brief SO_RCVTIMEO. A RecvFrom that times out reports kWouldBlock.
   * @param timeout_ms 0 restores fully blocking receives.
   */
  expected<void, SocketError> SetRecvTimeout(uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000U) * 1000U);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv,
                     static_cast<socklen_t>(sizeof(tv))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<int32_t, SocketError> SendTo(const void* data, size_t len,
                                        const SocketAddress& dest) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::sendto(fd_, data, len, 0, dest.Raw(), dest.Size());
    if (n < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<int32_t, SocketError> RecvFrom(void* buf, size_t len,
                                          SocketAddress& src) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t addr_len = src.Size();
    auto n = ::recvfrom(fd_, buf, len, 0, src.RawMut(), &addr_len);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(
          IsTransient(errno) || errno == EINTR ? SocketError::kWouldBlock
                                               : SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

 private:
  explicit UdpSocket(int32_t fd) noexcept : SocketBase(fd) {}
};

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief RAII TCP listening socket producing TcpSocket on Accept().
 */
class TcpListener : public SocketBase {
 public:
  TcpListener() noexcept = default;
  TcpListener(TcpListener&&) noexcept = default;
  TcpListener& operator=(TcpListener&&) noexcept = default;

  static expected<TcpListener, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(
          SocketError::kInvalidFd);
    }
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
  }

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    return BindTo(addr);
  }

  expected<void, SocketError> Listen(
      int32_t backlog = kDefaultBacklog) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::listen(fd_, backlog) < 0) {
      return expected<void, SocketError>::error(SocketError::kListenFailed);
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Accept one pending connection.
   * @param[out] peer Filled with the remote address on success.
   * @return kWouldBlock when a non-blocking listener has nothing queued.
   */
  expected<TcpSocket, SocketError> Accept(SocketAddress& peer) noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t addr_len = peer.Size();
    int32_t client_fd = ::accept(fd_, peer.RawMut(), &addr_len);
    if (client_fd < 0) {
      return expected<TcpSocket, SocketError>::error(
          IsTransient(errno) ? SocketError::kWouldBlock
                             : SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client_fd));
  }

  /** @brief Port actually bound (resolves a port-0 request). */
  uint16_t LocalPort() const noexcept {
    auto addr = LocalAddress();
    return addr.has_value() ? addr.value().Port() : 0U;
  }

 private:
  explicit TcpListener(int32_t fd) noexcept : SocketBase(fd) {}
};

}  // namespace hidrem

#endif  // HIDREM_HAS_NETWORK

#endif  // HIDREM_SOCKET_HPP_
