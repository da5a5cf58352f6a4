/**
 * @file connection_manager.hpp
 * @brief Reactor multiplexing listeners and framed TCP connections.
 *
 * One loop thread waits on every registered socket with poll(2), accepts
 * incoming connections, reads and reassembles frames, dispatches them to
 * each connection's ProtocolHandler, and drains per-connection outbound
 * queues. Any thread may Listen(), Connect(), Send() or Close() while the
 * loop runs.
 *
 * Locking:
 *  - mutex_ guards the listener and connection registries and every
 *    outbound queue. It is never held while a handler callback runs.
 *  - Each connection has a recursive dispatch mutex held around its
 *    callbacks, so OnMessage() and a concurrent Close() are serialized and
 *    a handler may close itself from inside OnMessage().
 *  Order: dispatch mutex before mutex_.
 *
 * Header-only, C++17.
 */

#ifndef HIDREM_CONNECTION_MANAGER_HPP_
#define HIDREM_CONNECTION_MANAGER_HPP_

#include "hidrem/frame_codec.hpp"
#include "hidrem/io_poller.hpp"
#include "hidrem/log.hpp"
#include "hidrem/platform.hpp"
#include "hidrem/protocol.hpp"
#include "hidrem/socket.hpp"
#include "hidrem/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifndef HIDREM_POLL_TIMEOUT_MS
#define HIDREM_POLL_TIMEOUT_MS 100
#endif

#ifndef HIDREM_MAX_READ
#define HIDREM_MAX_READ 2048U
#endif

#ifndef HIDREM_MAX_WRITE
#define HIDREM_MAX_WRITE 2048U
#endif

namespace hidrem {

enum class ManagerState : uint8_t {
  kStopped = 0,
  kRunning
};

// ============================================================================
// ConnectionManager
// ============================================================================

class ConnectionManager final {
 public:
  ConnectionManager() = default;

  /**
   * @brief Stops a started loop, then closes every connection with
   *        OnClose(false) and releases every listener.
   */
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // --------------------------------------------------------------------------
  // Control surface
  // --------------------------------------------------------------------------

  /**
   * @brief Bind and listen on @p host : @p port.
   *
   * Every accepted connection gets a handler from @p factory.
   * @return The bound port (the system-assigned one when @p port is 0).
   */
  expected<uint16_t, ManagerError> Listen(const char* host, uint16_t port,
                                          HandlerFactory factory);

  /**
   * @brief Connect to @p host : @p port, blocking the caller until done.
   *
   * The handler's OnSetup() has run by the time this returns.
   */
  expected<ConnectionId, ManagerError> Connect(const char* host, uint16_t port,
                                               const HandlerFactory& factory);

  /** @brief Frame @p data and append it to the connection's queue. */
  expected<void, ManagerError> Send(ConnectionId id, const void* data,
                                    uint32_t len);

  /** @brief Deregister, call OnClose(false), release the socket. */
  expected<void, ManagerError> Close(ConnectionId id);

  /** @brief Run the loop on the calling thread until Stop() or a fatal poll. */
  expected<void, ManagerError> Run();

  /** @brief Run the loop on a dedicated thread. */
  expected<void, ManagerError> Start();

  /**
   * @brief Ask the loop to exit at its next wait boundary.
   *
   * When the loop was started with Start() and this is called from another
   * thread, waits for the loop thread to finish.
   */
  expected<void, ManagerError> Stop();

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  bool IsRunning() const noexcept { return running_.load(); }
  ManagerState State() const noexcept {
    return IsRunning() ? ManagerState::kRunning : ManagerState::kStopped;
  }
  uint32_t ConnectionCount() const;
  uint32_t ListenerCount() const;
  bool IsConnected(ConnectionId id) const;

  /** @brief Bytes queued for @p id and not yet written (0 if unknown). */
  size_t PendingBytes(ConnectionId id) const;

 private:
  struct Listener {
    uint32_t key = 0;
    TcpListener sock;
    HandlerFactory factory;
    uint16_t port = 0;
  };

  struct Connection {
    ConnectionId id;
    TcpSocket sock;
    std::unique_ptr<ProtocolHandler> handler;
    FrameDecoder decoder;
    Bytes outbound;                         // guarded by mutex_
    std::recursive_mutex dispatch_mutex;    // serializes handler callbacks
    std::string peer;
  };

  using ListenerPtr = std::shared_ptr<Listener>;
  using ConnectionPtr = std::shared_ptr<Connection>;

  // One interest-set entry; exactly one pointer is set.
  struct SnapshotEntry {
    ListenerPtr listener;
    ConnectionPtr conn;
  };

  expected<void, ManagerError> Loop(uint32_t generation);
  expected<void, ManagerError> Iterate();
  bool IsCurrent(uint32_t generation) const noexcept {
    return running_.load() && generation_.load() == generation;
  }

  ConnectionPtr Register(TcpSocket sock, std::unique_ptr<ProtocolHandler> handler,
                         std::string peer);
  ConnectionPtr Detach(ConnectionId id);
  void Finish(const ConnectionPtr& conn, bool error);
  void Retire(const ConnectionPtr& conn, bool error);
  void DropListener(uint32_t key);

  void AcceptFrom(const ListenerPtr& listener);
  void ReadFrom(const ConnectionPtr& conn);
  void WriteTo(const ConnectionPtr& conn);

  mutable std::mutex mutex_;
  std::map<uint32_t, ListenerPtr> listeners_;
  std::map<uint32_t, ConnectionPtr> connections_;
  uint32_t next_listener_key_ = 1U;
  uint32_t next_connection_id_ = 1U;

  // Loop-thread only.
  IoPoller poller_;
  std::vector<SnapshotEntry> snapshot_;

  std::mutex state_mutex_;    // serializes Run/Start/Stop transitions
  std::mutex run_mutex_;      // held by whichever loop is running
  std::atomic<bool> running_{false};
  std::atomic<uint32_t> generation_{0U};
  std::thread loop_thread_;
};

// ============================================================================
// ProtocolHandler inline members (need the complete manager)
// ============================================================================

inline expected<void, ManagerError> ProtocolHandler::Send(const void* data,
                                                          uint32_t len) {
  if (manager_ == nullptr) {
    return expected<void, ManagerError>::error(ManagerError::kNotFound);
  }
  return manager_->Send(id_, data, len);
}

inline expected<void, ManagerError> ProtocolHandler::Close() {
  if (manager_ == nullptr) {
    return expected<void, ManagerError>::error(ManagerError::kNotFound);
  }
  return manager_->Close(id_);
}

// ============================================================================
// Inline Implementation
// ============================================================================

inline ConnectionManager::~ConnectionManager() {
  (void)Stop();
  std::thread loop;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    loop = std::move(loop_thread_);
  }
  if (loop.joinable()) {
    if (loop.get_id() == std::this_thread::get_id()) {
      loop.detach();
    } else {
      loop.join();
    }
  }

  std::vector<ConnectionPtr> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : connections_) {
      remaining.push_back(kv.second);
    }
    connections_.clear();
    listeners_.clear();
  }
  for (auto& conn : remaining) {
    Finish(conn, false);
  }
}

inline expected<uint16_t, ManagerError> ConnectionManager::Listen(
    const char* host, uint16_t port, HandlerFactory factory) {
  auto addr = SocketAddress::Resolve(host, port);
  if (!addr.has_value()) {
    HIDREM_LOG_WARN("Manager", "cannot resolve listen address '%s'",
                    host != nullptr ? host : "");
    return expected<uint16_t, ManagerError>::error(ManagerError::kInvalidAddress);
  }

  auto created = TcpListener::Create();
  if (!created.has_value()) {
    return expected<uint16_t, ManagerError>::error(ManagerError::kListenFailed);
  }
  auto listener = std::make_shared<Listener>();
  listener->sock = std::move(created.value());
  (void)listener->sock.SetReuseAddr(true);

  if (!listener->sock.Bind(addr.value()).has_value()) {
    HIDREM_LOG_WARN("Manager", "bind %s:%u failed: errno=%d",
                    addr.value().Ip().c_str(), static_cast<unsigned>(port),
                    errno);
    return expected<uint16_t, ManagerError>::error(ManagerError::kBindFailed);
  }
  if (!listener->sock.Listen().has_value() ||
      !listener->sock.SetNonBlocking(true).has_value()) {
    return expected<uint16_t, ManagerError>::error(ManagerError::kListenFailed);
  }
  listener->factory = std::move(factory);
  listener->port = listener->sock.LocalPort();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener->key = next_listener_key_++;
    listeners_.emplace(listener->key, listener);
  }
  HIDREM_LOG_INFO("Manager", "listening on %s:%u", addr.value().Ip().c_str(),
                  static_cast<unsigned>(listener->port));
  return expected<uint16_t, ManagerError>::success(listener->port);
}

inline expected<ConnectionId, ManagerError> ConnectionManager::Connect(
    const char* host, uint16_t port, const HandlerFactory& factory) {
  auto addr = SocketAddress::Resolve(host, port);
  if (!addr.has_value() || port == 0U) {
    HIDREM_LOG_WARN("Manager", "cannot resolve '%s:%u'",
                    host != nullptr ? host : "", static_cast<unsigned>(port));
    return expected<ConnectionId, ManagerError>::error(
        ManagerError::kInvalidAddress);
  }

  auto created = TcpSocket::Create();
  if (!created.has_value()) {
    return expected<ConnectionId, ManagerError>::error(
        ManagerError::kConnectFailed);
  }
  TcpSocket sock = std::move(created.value());
  HIDREM_LOG_DEBUG("Manager", "connecting to %s:%u", addr.value().Ip().c_str(),
                   static_cast<unsigned>(port));
  if (!sock.Connect(addr.value()).has_value()) {
    HIDREM_LOG_WARN("Manager", "connect %s:%u failed: errno=%d",
                    addr.value().Ip().c_str(), static_cast<unsigned>(port),
                    errno);
    return expected<ConnectionId, ManagerError>::error(
        ManagerError::kConnectFailed);
  }
  (void)sock.SetNoDelay(true);
  if (!sock.SetNonBlocking(true).has_value()) {
    return expected<ConnectionId, ManagerError>::error(
        ManagerError::kConnectFailed);
  }

  std::unique_ptr<ProtocolHandler> handler = factory ? factory() : nullptr;
  if (!handler) {
    HIDREM_LOG_ERROR("Manager", "handler factory produced no handler");
    return expected<ConnectionId, ManagerError>::error(
        ManagerError::kConnectFailed);
  }

  char peer[64];
  (void)std::snprintf(peer, sizeof(peer), "%s:%u", addr.value().Ip().c_str(),
                      static_cast<unsigned>(port));
  ConnectionPtr conn = Register(std::move(sock), std::move(handler), peer);
  HIDREM_LOG_INFO("Manager", "connected to %s (id=%u)", peer,
                  conn->id.value());
  return expected<ConnectionId, ManagerError>::success(conn->id);
}

inline expected<void, ManagerError> ConnectionManager::Send(ConnectionId id,
                                                            const void* data,
                                                            uint32_t len) {
  Bytes frame = EncodeFrame(data, len);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id.value());
  if (it == connections_.end()) {
    return expected<void, ManagerError>::error(ManagerError::kNotFound);
  }
  Bytes& queue = it->second->outbound;
  queue.insert(queue.end(), frame.begin(), frame.end());
  return expected<void, ManagerError>::success();
}

inline expected<void, ManagerError> ConnectionManager::Close(ConnectionId id) {
  ConnectionPtr conn = Detach(id);
  if (!conn) {
    return expected<void, ManagerError>::error(ManagerError::kNotFound);
  }
  HIDREM_LOG_DEBUG("Manager", "closing %s (id=%u)", conn->peer.c_str(),
                   id.value());
  Finish(conn, false);
  return expected<void, ManagerError>::success();
}

inline expected<void, ManagerError> ConnectionManager::Run() {
  uint32_t generation;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_.load()) {
      return expected<void, ManagerError>::error(ManagerError::kAlreadyRunning);
    }
    running_.store(true);
    generation = generation_.load();
  }
  return Loop(generation);
}

inline expected<void, ManagerError> ConnectionManager::Start() {
  std::thread previous;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_.load()) {
      return expected<void, ManagerError>::error(ManagerError::kAlreadyRunning);
    }
    running_.store(true);
    const uint32_t generation = generation_.load();
    previous = std::move(loop_thread_);
    loop_thread_ = std::thread([this, generation]() { (void)Loop(generation); });
  }
  if (previous.joinable()) {
    previous.join();
  }
  return expected<void, ManagerError>::success();
}

inline expected<void, ManagerError> ConnectionManager::Stop() {
  std::thread loop;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!running_.load()) {
      return expected<void, ManagerError>::error(ManagerError::kNotRunning);
    }
    running_.store(false);
    generation_.fetch_add(1U);
    if (loop_thread_.joinable() &&
        loop_thread_.get_id() != std::this_thread::get_id()) {
      loop = std::move(loop_thread_);
    }
  }
  if (loop.joinable()) {
    loop.join();
  }
  return expected<void, ManagerError>::success();
}

inline uint32_t ConnectionManager::ConnectionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<uint32_t>(connections_.size());
}

inline uint32_t ConnectionManager::ListenerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<uint32_t>(listeners_.size());
}

inline bool ConnectionManager::IsConnected(ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.find(id.value()) != connections_.end();
}

inline size_t ConnectionManager::PendingBytes(ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id.value());
  return (it == connections_.end()) ? 0U : it->second->outbound.size();
}

// ----------------------------------------------------------------------------
// Loop
// ----------------------------------------------------------------------------

inline expected<void, ManagerError> ConnectionManager::Loop(
    uint32_t generation) {
  // A loop from an earlier Start() may still be finishing its last pass.
  std::lock_guard<std::mutex> run_lock(run_mutex_);
  HIDREM_LOG_DEBUG("Manager", "entering loop");

  while (IsCurrent(generation)) {
    auto r = Iterate();
    if (!r.has_value()) {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (generation_.load() == generation) {
        running_.store(false);
        generation_.fetch_add(1U);
      }
      snapshot_.clear();
      return r;
    }
  }
  snapshot_.clear();
  HIDREM_LOG_DEBUG("Manager", "loop exited");
  return expected<void, ManagerError>::success();
}

inline expected<void, ManagerError> ConnectionManager::Iterate() {
  snapshot_.clear();
  poller_.Clear();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : listeners_) {
      poller_.Add(kv.second->sock.Fd(), static_cast<uint8_t>(IoEvent::kReadable));
      snapshot_.push_back(SnapshotEntry{kv.second, nullptr});
    }
    for (auto& kv : connections_) {
      uint8_t interest = static_cast<uint8_t>(IoEvent::kReadable);
      if (!kv.second->outbound.empty()) {
        interest |= static_cast<uint8_t>(IoEvent::kWritable);
      }
      poller_.Add(kv.second->sock.Fd(), interest);
      snapshot_.push_back(SnapshotEntry{nullptr, kv.second});
    }
  }

  auto waited = poller_.Wait(HIDREM_POLL_TIMEOUT_MS);
  if (!waited.has_value()) {
    const PollerError err = waited.get_error();
    if (err == PollerError::kInterrupted || err == PollerError::kBadDescriptor) {
      HIDREM_LOG_DEBUG("Manager", "poll interrupted, rebuilding interest set");
      return expected<void, ManagerError>::success();
    }
    HIDREM_LOG_ERROR("Manager", "poll failed: errno=%d", errno);
    return expected<void, ManagerError>::error(ManagerError::kPollFailed);
  }

  const uint32_t count = waited.value();
  const PollResult* results = poller_.Results();
  std::vector<bool> handled(count, false);

  // Error conditions first, before any read or write on the same socket.
  for (uint32_t i = 0; i < count; ++i) {
    if (!HasEvent(results[i].events, IoEvent::kError)) {
      continue;
    }
    handled[i] = true;
    const SnapshotEntry& entry = snapshot_[results[i].slot];
    if (entry.listener) {
      HIDREM_LOG_WARN("Manager", "listener on port %u failed, dropping it",
                      static_cast<unsigned>(entry.listener->port));
      DropListener(entry.listener->key);
    } else {
      HIDREM_ASSERT(entry.conn != nullptr);
      HIDREM_LOG_WARN("Manager", "socket error on %s (id=%u)",
                      entry.conn->peer.c_str(), entry.conn->id.value());
      Retire(entry.conn, true);
    }
  }

  for (uint32_t i = 0; i < count; ++i) {
    const SnapshotEntry& entry = snapshot_[results[i].slot];
    if (!handled[i] && entry.listener &&
        HasEvent(results[i].events, IoEvent::kReadable)) {
      AcceptFrom(entry.listener);
    }
  }

  for (uint32_t i = 0; i < count; ++i) {
    const SnapshotEntry& entry = snapshot_[results[i].slot];
    if (!handled[i] && entry.conn &&
        (HasEvent(results[i].events, IoEvent::kReadable) ||
         HasEvent(results[i].events, IoEvent::kHangup))) {
      ReadFrom(entry.conn);
    }
  }

  for (uint32_t i = 0; i < count; ++i) {
    const SnapshotEntry& entry = snapshot_[results[i].slot];
    if (!handled[i] && entry.conn &&
        HasEvent(results[i].events, IoEvent::kWritable)) {
      WriteTo(entry.conn);
    }
  }

  // Release the snapshot so closed connections are destroyed now.
  snapshot_.clear();
  return expected<void, ManagerError>::success();
}

// ----------------------------------------------------------------------------
// Registry
// ----------------------------------------------------------------------------

inline ConnectionManager::ConnectionPtr ConnectionManager::Register(
    TcpSocket sock, std::unique_ptr<ProtocolHandler> handler, std::string peer) {
  auto conn = std::make_shared<Connection>();
  conn->sock = std::move(sock);
  conn->handler = std::move(handler);
  conn->peer = std::move(peer);

  // Held across registration and OnSetup() so the loop cannot dispatch a
  // message (and Close() cannot run OnClose) before setup has finished.
  std::lock_guard<std::recursive_mutex> dispatch(conn->dispatch_mutex);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    conn->id = ConnectionId(next_connection_id_++);
    conn->handler->Bind(this, conn->id);
    connections_.emplace(conn->id.value(), conn);
  }
  conn->handler->OnSetup();
  return conn;
}

inline ConnectionManager::ConnectionPtr ConnectionManager::Detach(
    ConnectionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id.value());
  if (it == connections_.end()) {
    return nullptr;
  }
  ConnectionPtr conn = std::move(it->second);
  connections_.erase(it);
  return conn;
}

inline void ConnectionManager::Finish(const ConnectionPtr& conn, bool error) {
  std::lock_guard<std::recursive_mutex> dispatch(conn->dispatch_mutex);
  conn->handler->OnClose(error);
  conn->sock.Close();
}

inline void ConnectionManager::Retire(const ConnectionPtr& conn, bool error) {
  ConnectionPtr detached = Detach(conn->id);
  if (detached) {
    Finish(detached, error);
  }
}

inline void ConnectionManager::DropListener(uint32_t key) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(key);
}

// ----------------------------------------------------------------------------
// I/O
// ----------------------------------------------------------------------------

inline void ConnectionManager::AcceptFrom(const ListenerPtr& listener) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listeners_.find(listener->key) == listeners_.end()) {
      return;
    }
  }

  SocketAddress peer_addr;
  auto accepted = listener->sock.Accept(peer_addr);
  if (!accepted.has_value()) {
    if (accepted.get_error() != SocketError::kWouldBlock) {
      HIDREM_LOG_WARN("Manager", "accept on port %u failed: errno=%d",
                      static_cast<unsigned>(listener->port), errno);
    }
    return;
  }
  TcpSocket sock = std::move(accepted.value());
  if (!sock.SetNonBlocking(true).has_value()) {
    HIDREM_LOG_WARN("Manager", "cannot make accepted socket non-blocking");
    return;
  }
  (void)sock.SetNoDelay(true);

  std::unique_ptr<ProtocolHandler> handler =
      listener->factory ? listener->factory() : nullptr;
  if (!handler) {
    HIDREM_LOG_ERROR("Manager", "handler factory produced no handler");
    return;
  }

  char peer[64];
  (void)std::snprintf(peer, sizeof(peer), "%s:%u", peer_addr.Ip().c_str(),
                      static_cast<unsigned>(peer_addr.Port()));
  ConnectionPtr conn = Register(std::move(sock), std::move(handler), peer);
  HIDREM_LOG_INFO("Manager", "accepted %s on port %u (id=%u)", peer,
                  static_cast<unsigned>(listener->port), conn->id.value());
}

inline void ConnectionManager::ReadFrom(const ConnectionPtr& conn) {
  uint8_t buf[HIDREM_MAX_READ];
  std::vector<Bytes> messages;

  std::lock_guard<std::recursive_mutex> dispatch(conn->dispatch_mutex);
  if (!IsConnected(conn->id)) {
    return;
  }

  auto received = conn->sock.Recv(buf, sizeof(buf));
  if (!received.has_value()) {
    if (received.get_error() == SocketError::kWouldBlock) {
      return;
    }
    HIDREM_LOG_WARN("Manager", "read from %s failed: errno=%d",
                    conn->peer.c_str(), errno);
    Retire(conn, true);
    return;
  }
  if (received.value() == 0) {
    HIDREM_LOG_INFO("Manager", "%s closed the connection (id=%u)",
                    conn->peer.c_str(), conn->id.value());
    Retire(conn, false);
    return;
  }

  auto fed = conn->decoder.Feed(buf, static_cast<size_t>(received.value()),
                                messages);
  for (const Bytes& msg : messages) {
    if (!IsConnected(conn->id)) {
      return;
    }
    conn->handler->OnMessage(msg.data(), static_cast<uint32_t>(msg.size()));
  }
  if (!fed.has_value()) {
    HIDREM_LOG_WARN("Manager",
                    "oversized frame from %s (limit %u bytes), closing",
                    conn->peer.c_str(), conn->decoder.MaxFrameSize());
    Retire(conn, true);
  }
}

inline void ConnectionManager::WriteTo(const ConnectionPtr& conn) {
  bool failed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connections_.find(conn->id.value()) == connections_.end() ||
        conn->outbound.empty()) {
      return;
    }
    const size_t chunk =
        std::min<size_t>(conn->outbound.size(), HIDREM_MAX_WRITE);
    auto sent = conn->sock.Send(conn->outbound.data(), chunk);
    if (sent.has_value()) {
      conn->outbound.erase(conn->outbound.begin(),
                           conn->outbound.begin() + sent.value());
    } else if (sent.get_error() != SocketError::kWouldBlock) {
      failed = true;
    }
  }
  if (failed) {
    HIDREM_LOG_WARN("Manager", "write to %s failed: errno=%d",
                    conn->peer.c_str(), errno);
    Retire(conn, true);
  }
}

}  // namespace hidrem

#endif  // HIDREM_CONNECTION_MANAGER_HPP_
