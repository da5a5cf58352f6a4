/**
 * @file main.cpp
 * @brief hidrem_server -- accepts controllers and injects their key events.
 *
 * Usage: hidrem_server [--config path] [port]
 *
 * Listens on [server] host:port (default 0.0.0.0, system-assigned port),
 * announces the bound port with a discovery Broadcaster, and serves every
 * controller with a HostProtocol until SIGINT/SIGTERM.
 */

#include "hidrem/connection_manager.hpp"
#include "hidrem/discovery.hpp"
#include "hidrem/handlers.hpp"
#include "hidrem/key_injector.hpp"
#include "hidrem/log.hpp"
#include "hidrem/shutdown.hpp"
#include "../app_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>

static void PrintUsage(const char* prog) {
  std::fprintf(stderr, "usage: %s [--config path] [port]\n", prog);
}

int main(int argc, char* argv[]) {
  hidrem::log::Init();

  hidrem_app::AppSettings settings;
  const char* cfg_path = hidrem_app::FindConfigArg(argc, argv);
  if (cfg_path != nullptr) {
    (void)hidrem_app::LoadSettings(cfg_path, settings);
  }
  hidrem::log::SetLevel(settings.log_level);

  const char* port_arg = hidrem_app::FindPositionalArg(argc, argv);
  if (port_arg != nullptr) {
    char* end = nullptr;
    const long port = std::strtol(port_arg, &end, 10);
    if (end == port_arg || *end != '\0' || port < 0 || port > 65535) {
      PrintUsage(argv[0]);
      return 1;
    }
    settings.server_port = static_cast<uint16_t>(port);
  }

  hidrem::ShutdownManager shutdown;
  if (!shutdown.InstallSignalHandlers().has_value()) {
    HIDREM_LOG_ERROR("Server", "cannot install signal handlers");
    return 1;
  }

  std::shared_ptr<hidrem::KeyInjector> injector =
      std::make_shared<hidrem::LoggingKeyInjector>();
  hidrem::ConnectionManager manager;
  auto bound = manager.Listen(settings.server_host.c_str(), settings.server_port,
                              hidrem::MakeHandlerFactory<hidrem::HostProtocol>(injector));
  if (!bound.has_value()) {
    HIDREM_LOG_ERROR("Server", "cannot listen on %s:%u: %s",
                     settings.server_host.c_str(),
                     static_cast<unsigned>(settings.server_port),
                     hidrem::ManagerErrorName(bound.get_error()));
    return 1;
  }

  // The server keeps serving direct connections when it cannot announce.
  hidrem::Broadcaster caster(settings.discovery);
  auto announced = caster.Start(bound.value());
  if (!announced.has_value()) {
    HIDREM_LOG_ERROR("Server", "discovery disabled, clients must connect to port %u",
                     static_cast<unsigned>(bound.value()));
  }

  if (!manager.Start().has_value()) {
    HIDREM_LOG_ERROR("Server", "cannot start connection manager");
    return 1;
  }
  std::printf("HIDrem server listening on port %u\n",
              static_cast<unsigned>(bound.value()));
  std::fflush(stdout);

  (void)shutdown.Register([&manager](int) { (void)manager.Stop(); });
  (void)shutdown.Register([&caster](int) { (void)caster.Stop(); });
  shutdown.WaitForShutdown();

  HIDREM_LOG_INFO("Server", "shutting down (signal %d)", shutdown.Signal());
  hidrem::log::Shutdown();
  return 0;
}
