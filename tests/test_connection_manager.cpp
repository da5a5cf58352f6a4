/**
 * @file test_connection_manager.cpp
 * @brief Tests for connection_manager.hpp over loopback TCP.
 */

#include "hidrem/connection_manager.hpp"

#include <catch2/catch.hpp>

#include <sys/socket.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

/// Event record shared between a test and the handlers it creates.
struct Journal {
  bool echo = false;
  std::string greeting;   // sent from OnSetup when not empty
  std::string close_on;   // handler closes itself on this message

  void Add(const std::string& event) {
    std::lock_guard<std::mutex> lock(mtx);
    events.push_back(event);
  }

  std::vector<std::string> Events() {
    std::lock_guard<std::mutex> lock(mtx);
    return events;
  }

  size_t Count(const std::string& event) {
    std::lock_guard<std::mutex> lock(mtx);
    return static_cast<size_t>(std::count(events.begin(), events.end(), event));
  }

  size_t Messages() {
    std::lock_guard<std::mutex> lock(mtx);
    return static_cast<size_t>(
        std::count_if(events.begin(), events.end(), [](const std::string& e) {
          return e.compare(0, 4, "msg:") == 0;
        }));
  }

  std::mutex mtx;
  std::vector<std::string> events;
};

class RecordingHandler : public hidrem::ProtocolHandler {
 public:
  explicit RecordingHandler(std::shared_ptr<Journal> journal)
      : journal_(std::move(journal)) {}

  void OnSetup() override {
    journal_->Add("setup");
    if (!journal_->greeting.empty()) {
      (void)Send(journal_->greeting.data(),
                 static_cast<uint32_t>(journal_->greeting.size()));
    }
  }

  void OnMessage(const uint8_t* data, uint32_t len) override {
    const std::string text(reinterpret_cast<const char*>(data), len);
    journal_->Add("msg:" + text);
    if (journal_->echo) {
      (void)Send(data, len);
    }
    if (!journal_->close_on.empty() && text == journal_->close_on) {
      (void)Close();
    }
  }

  void OnClose(bool error) override {
    journal_->Add(error ? "close:error" : "close");
  }

 private:
  std::shared_ptr<Journal> journal_;
};

template <typename Pred>
bool WaitFor(Pred pred, int timeout_ms = 3000) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

hidrem::HandlerFactory Recorder(const std::shared_ptr<Journal>& journal) {
  return hidrem::MakeHandlerFactory<RecordingHandler>(journal);
}

hidrem::expected<void, hidrem::ManagerError> SendText(
    hidrem::ConnectionManager& mgr, hidrem::ConnectionId id,
    const std::string& text) {
  return mgr.Send(id, text.data(), static_cast<uint32_t>(text.size()));
}

}  // namespace

// ============================================================================
// Listen / Connect
// ============================================================================

TEST_CASE("ConnectionManager Listen on port 0 reports the bound port",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto journal = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(journal));
  REQUIRE(port.has_value());
  REQUIRE(port.value() != 0U);
  REQUIRE(mgr.ListenerCount() == 1U);
  REQUIRE(mgr.ConnectionCount() == 0U);
}

TEST_CASE("ConnectionManager Listen on a taken port fails",
          "[connection_manager]") {
  hidrem::ConnectionManager first;
  auto journal = std::make_shared<Journal>();
  auto port = first.Listen("127.0.0.1", 0, Recorder(journal));
  REQUIRE(port.has_value());

  hidrem::ConnectionManager second;
  auto again = second.Listen("127.0.0.1", port.value(), Recorder(journal));
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == hidrem::ManagerError::kBindFailed);
}

TEST_CASE("ConnectionManager Connect runs OnSetup before returning",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(port.has_value());
  REQUIRE(mgr.Start().has_value());

  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));
  REQUIRE(id.has_value());
  REQUIRE(id.value() != hidrem::kInvalidConnectionId);
  REQUIRE(client->Count("setup") == 1U);
  REQUIRE(mgr.IsConnected(id.value()));

  REQUIRE(WaitFor([&] { return server->Count("setup") == 1U; }));
  REQUIRE(mgr.ConnectionCount() == 2U);
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager Connect failures", "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto journal = std::make_shared<Journal>();

  auto no_port = mgr.Connect("127.0.0.1", 0, Recorder(journal));
  REQUIRE(!no_port.has_value());
  REQUIRE(no_port.get_error() == hidrem::ManagerError::kInvalidAddress);

  uint16_t closed_port = 0;
  {
    hidrem::ConnectionManager tmp;
    closed_port = tmp.Listen("127.0.0.1", 0, Recorder(journal)).value();
  }
  auto refused = mgr.Connect("127.0.0.1", closed_port, Recorder(journal));
  REQUIRE(!refused.has_value());
  REQUIRE(refused.get_error() == hidrem::ManagerError::kConnectFailed);
  REQUIRE(journal->Events().empty());
}

// ============================================================================
// Messaging
// ============================================================================

TEST_CASE("ConnectionManager delivers messages in order after setup",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  server->echo = true;
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());
  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));
  REQUIRE(id.has_value());

  const int kCount = 50;
  for (int i = 0; i < kCount; ++i) {
    REQUIRE(SendText(mgr, id.value(), "m" + std::to_string(i)).has_value());
  }

  REQUIRE(WaitFor([&] { return server->Messages() == kCount; }));
  REQUIRE(WaitFor([&] { return client->Messages() == kCount; }));

  auto events = server->Events();
  REQUIRE(events.front() == "setup");
  for (int i = 0; i < kCount; ++i) {
    REQUIRE(events[static_cast<size_t>(i) + 1U] == "msg:m" + std::to_string(i));
  }
  auto echoed = client->Events();
  REQUIRE(echoed[1] == "msg:m0");
  REQUIRE(echoed.back() == "msg:m" + std::to_string(kCount - 1));
  REQUIRE(WaitFor([&] { return mgr.PendingBytes(id.value()) == 0U; }));
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager zero-length frames arrive as empty messages",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());
  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));

  REQUIRE(mgr.Send(id.value(), nullptr, 0U).has_value());
  REQUIRE(SendText(mgr, id.value(), "after").has_value());
  REQUIRE(WaitFor([&] { return server->Messages() == 2U; }));
  auto events = server->Events();
  REQUIRE(events[1] == "msg:");
  REQUIRE(events[2] == "msg:after");
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager large messages span several writes",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());
  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));

  const std::string big(5U * HIDREM_MAX_WRITE + 17U, 'k');
  REQUIRE(SendText(mgr, id.value(), big).has_value());
  REQUIRE(WaitFor([&] { return server->Messages() == 1U; }));
  REQUIRE(server->Events()[1] == "msg:" + big);
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager handler may send from OnSetup",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  server->greeting = "welcome";
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());
  REQUIRE(mgr.Connect("127.0.0.1", port.value(), Recorder(client)).has_value());

  REQUIRE(WaitFor([&] { return client->Count("msg:welcome") == 1U; }));
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager queues sends before the loop starts",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));
  REQUIRE(id.has_value());

  REQUIRE(SendText(mgr, id.value(), "early").has_value());
  REQUIRE(mgr.PendingBytes(id.value()) == hidrem::kFramePrefixSize + 5U);

  REQUIRE(mgr.Start().has_value());
  REQUIRE(WaitFor([&] { return server->Count("msg:early") == 1U; }));
  REQUIRE(mgr.Stop().has_value());
}

// ============================================================================
// Closing
// ============================================================================

TEST_CASE("ConnectionManager Close runs OnClose once on both ends",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());
  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));
  REQUIRE(WaitFor([&] { return server->Count("setup") == 1U; }));

  REQUIRE(mgr.Close(id.value()).has_value());
  REQUIRE(client->Count("close") == 1U);
  REQUIRE(!mgr.IsConnected(id.value()));

  // Peer side observes an orderly disconnect.
  REQUIRE(WaitFor([&] { return server->Count("close") == 1U; }));
  REQUIRE(WaitFor([&] { return mgr.ConnectionCount() == 0U; }));

  auto again = mgr.Close(id.value());
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == hidrem::ManagerError::kNotFound);
  auto late = SendText(mgr, id.value(), "late");
  REQUIRE(late.get_error() == hidrem::ManagerError::kNotFound);

  REQUIRE(mgr.Stop().has_value());
  REQUIRE(client->Count("close") == 1U);
  REQUIRE(server->Count("close") == 1U);
  REQUIRE(client->Count("close:error") == 0U);
}

TEST_CASE("ConnectionManager handler may close itself from OnMessage",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  server->close_on = "bye";
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());
  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));

  REQUIRE(SendText(mgr, id.value(), "bye").has_value());
  REQUIRE(SendText(mgr, id.value(), "ignored").has_value());
  REQUIRE(WaitFor([&] { return server->Count("close") == 1U; }));
  REQUIRE(WaitFor([&] { return client->Count("close") == 1U; }));
  REQUIRE(server->Count("msg:ignored") == 0U);
  REQUIRE(mgr.ConnectionCount() == 0U);
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager oversized frame closes with error",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());

  auto raw = hidrem::TcpSocket::Create();
  REQUIRE(raw.has_value());
  auto addr = hidrem::SocketAddress::FromIpv4("127.0.0.1", port.value());
  REQUIRE(raw.value().Connect(addr.value()).has_value());

  hidrem::Bytes stream = hidrem::EncodeFrame("ok", 2U);
  const uint8_t huge[4] = {0xFF, 0xFF, 0xFF, 0xFF};
  stream.insert(stream.end(), huge, huge + 4);
  REQUIRE(raw.value().Send(stream.data(), stream.size()).has_value());

  REQUIRE(WaitFor([&] { return server->Count("close:error") == 1U; }));
  REQUIRE(server->Count("msg:ok") == 1U);
  REQUIRE(server->Count("close") == 0U);
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager peer reset closes with error once",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(mgr.Start().has_value());

  auto raw = hidrem::TcpSocket::Create();
  REQUIRE(raw.has_value());
  auto addr = hidrem::SocketAddress::FromIpv4("127.0.0.1", port.value());
  REQUIRE(raw.value().Connect(addr.value()).has_value());
  REQUIRE(WaitFor([&] { return server->Count("setup") == 1U; }));

  // Zero linger turns close() into a reset.
  struct linger lin;
  lin.l_onoff = 1;
  lin.l_linger = 0;
  REQUIRE(::setsockopt(raw.value().Fd(), SOL_SOCKET, SO_LINGER, &lin,
                       sizeof(lin)) == 0);
  raw.value().Close();

  REQUIRE(WaitFor([&] { return server->Count("close:error") == 1U; }));
  REQUIRE(WaitFor([&] { return mgr.ConnectionCount() == 0U; }));
  REQUIRE(mgr.Stop().has_value());
  REQUIRE(server->Count("close:error") == 1U);
  REQUIRE(server->Count("close") == 0U);
  REQUIRE(server->Count("setup") == 1U);
}

TEST_CASE("ConnectionManager destructor closes remaining connections",
          "[connection_manager]") {
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  {
    hidrem::ConnectionManager mgr;
    auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
    REQUIRE(mgr.Start().has_value());
    REQUIRE(mgr.Connect("127.0.0.1", port.value(), Recorder(client)).has_value());
    REQUIRE(WaitFor([&] { return server->Count("setup") == 1U; }));
  }
  REQUIRE(client->Count("close") == 1U);
  REQUIRE(server->Count("close") == 1U);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("ConnectionManager lifecycle errors", "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  REQUIRE(mgr.State() == hidrem::ManagerState::kStopped);

  auto not_running = mgr.Stop();
  REQUIRE(!not_running.has_value());
  REQUIRE(not_running.get_error() == hidrem::ManagerError::kNotRunning);

  REQUIRE(mgr.Start().has_value());
  REQUIRE(mgr.IsRunning());
  REQUIRE(mgr.State() == hidrem::ManagerState::kRunning);

  auto twice = mgr.Start();
  REQUIRE(twice.get_error() == hidrem::ManagerError::kAlreadyRunning);
  auto run = mgr.Run();
  REQUIRE(run.get_error() == hidrem::ManagerError::kAlreadyRunning);

  REQUIRE(mgr.Stop().has_value());
  REQUIRE(!mgr.IsRunning());
  REQUIRE(mgr.Stop().get_error() == hidrem::ManagerError::kNotRunning);
}

TEST_CASE("ConnectionManager can be restarted", "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto client = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  auto id = mgr.Connect("127.0.0.1", port.value(), Recorder(client));

  REQUIRE(mgr.Start().has_value());
  REQUIRE(mgr.Stop().has_value());
  REQUIRE(mgr.Start().has_value());

  REQUIRE(SendText(mgr, id.value(), "second run").has_value());
  REQUIRE(WaitFor([&] { return server->Count("msg:second run") == 1U; }));
  REQUIRE(mgr.Stop().has_value());
}

TEST_CASE("ConnectionManager Run blocks until Stop from another thread",
          "[connection_manager]") {
  hidrem::ConnectionManager mgr;
  auto server = std::make_shared<Journal>();
  auto port = mgr.Listen("127.0.0.1", 0, Recorder(server));
  REQUIRE(port.has_value());

  bool ok = false;
  std::thread runner([&] { ok = mgr.Run().has_value(); });
  REQUIRE(WaitFor([&] { return mgr.IsRunning(); }));
  REQUIRE(mgr.Stop().has_value());
  runner.join();
  REQUIRE(ok);
  REQUIRE(!mgr.IsRunning());
}
