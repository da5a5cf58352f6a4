/**
 * @file app_config.hpp
 * @brief Settings shared by hidrem_server and hidrem_client.
 *
 * Defaults are compiled in; an optional --config file (INI, JSON or YAML,
 * whichever backends were enabled at build time) overrides them.
 */

#ifndef HIDREM_APP_CONFIG_HPP_
#define HIDREM_APP_CONFIG_HPP_

#include "hidrem/config.hpp"
#include "hidrem/discovery.hpp"
#include "hidrem/log.hpp"

#include <cstdint>
#include <cstring>
#include <string>

namespace hidrem_app {

struct AppSettings {
  std::string server_host = "0.0.0.0";
  uint16_t server_port = 0;
  hidrem::DiscoveryConfig discovery;
  uint32_t ping_interval_ms = 1000;
  hidrem::log::Level log_level = hidrem::log::Level::kInfo;
  /// Everything the file contained, for sections read elsewhere (keymap).
  hidrem::ConfigStore raw;
};

inline void ReadString(const hidrem::ConfigStore& cfg, const char* section,
                       const char* key, std::string& field) {
  if (cfg.HasKey(section, key)) {
    field = cfg.GetString(section, key);
  }
}

/** @brief Copy the recognised keys of @p cfg over the defaults in @p out. */
inline void ApplySettings(const hidrem::ConfigStore& cfg, AppSettings& out) {
  ReadString(cfg, "server", "host", out.server_host);
  out.server_port = cfg.GetPort("server", "port", out.server_port);

  ReadString(cfg, "discovery", "identifier", out.discovery.identifier);
  out.discovery.port = cfg.GetPort("discovery", "port", out.discovery.port);
  out.discovery.interval_ms =
      cfg.GetUint32("discovery", "interval_ms", out.discovery.interval_ms);
  out.discovery.window_ms =
      cfg.GetUint32("discovery", "window_ms", out.discovery.window_ms);
  ReadString(cfg, "discovery", "broadcast_address",
             out.discovery.broadcast_address);
  ReadString(cfg, "discovery", "advertise_ip", out.discovery.advertise_ip);

  out.ping_interval_ms =
      cfg.GetUint32("client", "ping_interval_ms", out.ping_interval_ms);

  const char* level = cfg.GetString("log", "level", "");
  if (level[0] != '\0' && !hidrem::log::ParseLevel(level, out.log_level)) {
    HIDREM_LOG_WARN("Config", "unknown log level '%s', keeping default", level);
  }
  out.raw = cfg;
}

/**
 * @brief Load @p path into @p out. A missing file, a parse error or a build
 *        without config backends leaves the defaults in place.
 */
inline bool LoadSettings(const char* path, AppSettings& out) {
#ifdef HIDREM_CONFIG_ANY_ENABLED
  hidrem::MultiConfig cfg;
  auto r = cfg.LoadFile(path);
  if (!r.has_value()) {
    HIDREM_LOG_WARN("Config", "cannot load '%s', using defaults", path);
    return false;
  }
  HIDREM_LOG_INFO("Config", "loaded configuration from '%s'", path);
  ApplySettings(cfg, out);
  return true;
#else
  HIDREM_LOG_WARN("Config",
                  "built without config backends, ignoring '%s'", path);
  (void)out;
  return false;
#endif
}

/** @brief Value following "--config", or nullptr. */
inline const char* FindConfigArg(int argc, char* argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

/** @brief First argument that is neither "--config" nor its value. */
inline const char* FindPositionalArg(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      ++i;
      continue;
    }
    return argv[i];
  }
  return nullptr;
}

}  // namespace hidrem_app

#endif  // HIDREM_APP_CONFIG_HPP_
