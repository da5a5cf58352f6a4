/**
 * @file main.cpp
 * @brief hidrem_client -- interactive controller for a HIDrem server.
 *
 * Usage: hidrem_client [--config path] [host:port]
 *
 * Without an address the client runs discovery and connects to the first
 * server heard. Commands are read line by line from stdin:
 *
 *   press <key>               send a key press
 *   release <key>             send a key release
 *   input <control> <x> [y]   feed an analog value through the [keymap]
 *   ping                      measure latency now
 *   quit                      leave
 *
 * The session ends when the server closes the connection.
 */

#include "hidrem/connection_manager.hpp"
#include "hidrem/discovery.hpp"
#include "hidrem/handlers.hpp"
#include "hidrem/input_mapper.hpp"
#include "hidrem/io_poller.hpp"
#include "hidrem/log.hpp"
#include "hidrem/socket.hpp"
#include "hidrem/timer.hpp"
#include "../app_config.hpp"

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

namespace {

/// Splits stdin into lines without blocking past the poll timeout.
class LineReader {
 public:
  /// @return false once stdin reached end of file.
  bool ReadAvailable() {
    char buf[256];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      return false;
    }
    pending_.append(buf, static_cast<size_t>(n));
    return true;
  }

  bool NextLine(std::string& line) {
    const size_t pos = pending_.find('\n');
    if (pos == std::string::npos) {
      return false;
    }
    line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1U);
    return true;
  }

 private:
  std::string pending_;
};

void PingTask(void* ctx) {
  auto r = static_cast<hidrem::ControllerLink*>(ctx)->Ping();
  if (!r.has_value()) {
    HIDREM_LOG_DEBUG("Client", "periodic ping not sent: %s",
                     hidrem::ManagerErrorName(r.get_error()));
  }
}

/// @return false when the command asks to quit.
bool Execute(const std::string& line, hidrem::ControllerLink& link,
             hidrem::InputMapper& mapper) {
  std::istringstream in(line);
  std::string cmd;
  if (!(in >> cmd)) {
    return true;
  }

  if (cmd == "quit" || cmd == "exit") {
    return false;
  }
  if (cmd == "ping") {
    PingTask(&link);
    return true;
  }
  if (cmd == "press" || cmd == "release") {
    std::string key;
    if (!(in >> key)) {
      std::printf("usage: %s <key>\n", cmd.c_str());
      return true;
    }
    if (cmd == "press") {
      link.PressKey(key);
    } else {
      link.ReleaseKey(key);
    }
    return true;
  }
  if (cmd == "input") {
    std::string control;
    double x = 0.0;
    double y = 0.0;
    if (!(in >> control >> x)) {
      std::printf("usage: input <control> <x> [y]\n");
      return true;
    }
    if (!(in >> y)) {
      y = 0.0;
    }
    if (!mapper.Update(control, x, y)) {
      std::printf("control '%s' is not bound\n", control.c_str());
    }
    return true;
  }

  std::printf("unknown command '%s'\n", cmd.c_str());
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  hidrem::log::Init();

  hidrem_app::AppSettings settings;
  const char* cfg_path = hidrem_app::FindConfigArg(argc, argv);
  if (cfg_path != nullptr) {
    (void)hidrem_app::LoadSettings(cfg_path, settings);
  }
  hidrem::log::SetLevel(settings.log_level);

  hidrem::Endpoint server;
  const char* address = hidrem_app::FindPositionalArg(argc, argv);
  if (address != nullptr) {
    if (!hidrem::ParseEndpoint(address, server)) {
      std::fprintf(stderr, "invalid address '%s', expected host:port\n", address);
      return 1;
    }
  } else {
    std::printf("Searching for servers (%u ms)...\n",
                static_cast<unsigned>(settings.discovery.window_ms));
    std::fflush(stdout);
    auto found = hidrem::Discover(settings.discovery);
    if (!found.has_value()) {
      std::fprintf(stderr, "discovery failed\n");
      return 1;
    }
    if (found.value().empty()) {
      std::fprintf(stderr, "no server found\n");
      return 1;
    }
    for (const auto& ad : found.value()) {
      std::printf("  %s at %s:%u\n", ad.hostname.c_str(), ad.ip.c_str(),
                  static_cast<unsigned>(ad.port));
    }
    server.host = found.value().front().ip;
    server.port = found.value().front().port;
  }

  auto state = std::make_shared<hidrem::ControllerState>();
  state->SetPingListener([](int64_t half_rtt_ms) {
    std::printf("ping: %lld ms\n", static_cast<long long>(half_rtt_ms));
    std::fflush(stdout);
  });

  hidrem::ConnectionManager manager;
  auto connected = manager.Connect(
      server.host.c_str(), server.port,
      hidrem::MakeHandlerFactory<hidrem::ControllerProtocol>(state));
  if (!connected.has_value()) {
    std::fprintf(stderr, "cannot connect to %s:%u: %s\n", server.host.c_str(),
                 static_cast<unsigned>(server.port),
                 hidrem::ManagerErrorName(connected.get_error()));
    return 1;
  }
  if (!manager.Start().has_value()) {
    std::fprintf(stderr, "cannot start connection manager\n");
    return 1;
  }
  HIDREM_SCOPE_EXIT((void)manager.Stop());

  hidrem::ControllerLink link(manager, connected.value());
  hidrem::InputMapper mapper(link);
  const uint32_t bound = mapper.LoadKeymap(settings.raw);
  HIDREM_LOG_INFO("Client", "connected to %s:%u, %u control(s) mapped",
                  server.host.c_str(), static_cast<unsigned>(server.port),
                  static_cast<unsigned>(bound));

  hidrem::TimerScheduler pinger(1);
  if (settings.ping_interval_ms > 0U) {
    if (pinger.Add(settings.ping_interval_ms, &PingTask, &link).has_value()) {
      (void)pinger.Start();
    }
  }
  HIDREM_SCOPE_EXIT(pinger.Stop());

  LineReader reader;
  hidrem::IoPoller poller;
  bool running = true;
  while (running) {
    if (state->IsClosed()) {
      std::printf("disconnected%s\n", state->ClosedWithError() ? " (error)" : "");
      break;
    }
    poller.Clear();
    (void)poller.Add(STDIN_FILENO, static_cast<uint8_t>(hidrem::IoEvent::kReadable));
    auto ready = poller.Wait(HIDREM_POLL_TIMEOUT_MS);
    if (!ready.has_value()) {
      if (ready.get_error() == hidrem::PollerError::kInterrupted) {
        continue;
      }
      break;
    }
    if (ready.value() == 0U) {
      continue;
    }
    if (!reader.ReadAvailable()) {
      break;
    }
    std::string line;
    while (running && reader.NextLine(line)) {
      running = Execute(line, link, mapper);
    }
    std::fflush(stdout);
  }

  hidrem::log::Shutdown();
  return 0;
}
