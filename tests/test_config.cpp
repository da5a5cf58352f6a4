/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and the executables' settings mapping.
 */

#include "hidrem/config.hpp"
#include "app_config.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstring>
#include <string>

namespace {

/// Writes @p content to a fresh file under /tmp and removes it on scope exit.
class TempFile {
 public:
  TempFile(const char* name, const char* content) : path_("/tmp/") {
    path_ += name;
    std::FILE* f = std::fopen(path_.c_str(), "wb");
    REQUIRE(f != nullptr);
    std::fputs(content, f);
    std::fclose(f);
  }
  ~TempFile() { std::remove(path_.c_str()); }
  const char* Path() const { return path_.c_str(); }

 private:
  std::string path_;
};

}  // namespace

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore Set and typed getters", "[config][store]") {
  hidrem::ConfigStore store;
  store.Set("server", "host", "127.0.0.1");
  store.Set("server", "port", "5090");
  store.Set("client", "verbose", "yes");
  store.Set("client", "ratio", "0.75");

  REQUIRE(std::strcmp(store.GetString("server", "host"), "127.0.0.1") == 0);
  REQUIRE(store.GetInt("server", "port") == 5090);
  REQUIRE(store.GetPort("server", "port") == 5090);
  REQUIRE(store.GetBool("client", "verbose"));
  REQUIRE(store.GetDouble("client", "ratio") == 0.75);
  REQUIRE(store.EntryCount() == 4U);
}

TEST_CASE("ConfigStore defaults for missing or malformed values",
          "[config][store]") {
  hidrem::ConfigStore store;
  store.Set("a", "word", "abc");
  store.Set("a", "neg", "-5");

  REQUIRE(std::strcmp(store.GetString("a", "missing", "dflt"), "dflt") == 0);
  REQUIRE(store.GetInt("a", "word", 7) == 7);
  REQUIRE(store.GetUint32("a", "neg", 9U) == 9U);
  REQUIRE(store.GetDouble("a", "word", 1.5) == 1.5);
  REQUIRE(!store.GetBool("a", "missing"));
  REQUIRE(!store.FindInt("a", "word").has_value());
  REQUIRE(!store.FindBool("a", "missing").has_value());
}

TEST_CASE("ConfigStore GetPort clamping", "[config][store]") {
  hidrem::ConfigStore store;
  store.Set("net", "high", "70000");
  store.Set("net", "low", "-1");
  REQUIRE(store.GetPort("net", "high") == 65535);
  REQUIRE(store.GetPort("net", "low") == 0);
  REQUIRE(store.GetPort("net", "missing", 42) == 42);
}

TEST_CASE("ConfigStore lookups are case-insensitive and Set overrides",
          "[config][store]") {
  hidrem::ConfigStore store;
  store.Set("Server", "Port", "1");
  store.Set("server", "port", "2");
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.GetInt("SERVER", "PORT") == 2);
  REQUIRE(store.HasSection("server"));
  REQUIRE(store.HasKey("server", "port"));
  REQUIRE(!store.HasKey("server", "host"));
  REQUIRE(!store.HasSection("client"));
}

TEST_CASE("ConfigStore capacity and value length are bounded",
          "[config][store]") {
  hidrem::ConfigStore store;
  char key[16];
  uint32_t stored = 0;
  for (uint32_t i = 0; i < 200U; ++i) {
    std::snprintf(key, sizeof(key), "k%u", i);
    if (!store.Set("bulk", key, "v")) {
      break;
    }
    ++stored;
  }
  REQUIRE(stored == 128U);
  REQUIRE(store.EntryCount() == 128U);
  REQUIRE(!store.Set("bulk", "one_more", "v"));
  // Overwriting an existing key still succeeds when full.
  REQUIRE(store.Set("bulk", "k0", "w"));
  REQUIRE(std::strcmp(store.GetString("bulk", "k0"), "w") == 0);

  hidrem::ConfigStore small;
  const std::string long_value(400U, 'x');
  REQUIRE(small.Set("s", "long", long_value.c_str()));
  REQUIRE(std::strlen(small.GetString("s", "long")) == 255U);
}

TEST_CASE("ConfigStore Keys preserves load order", "[config][store]") {
  hidrem::ConfigStore store;
  store.Set("keymap", "btn_a", "button a");
  store.Set("other", "x", "1");
  store.Set("keymap", "stick", "vector 0.2 w s a d");
  auto keys = store.Keys("keymap");
  REQUIRE(keys.size() == 2U);
  REQUIRE(keys[0] == "btn_a");
  REQUIRE(keys[1] == "stick");
  REQUIRE(store.Keys("none").empty());
}

// ============================================================================
// Backend tags
// ============================================================================

TEST_CASE("Backend MatchesExtension", "[config][tag]") {
  REQUIRE(hidrem::IniBackend::MatchesExtension("ini"));
  REQUIRE(hidrem::IniBackend::MatchesExtension("conf"));
  REQUIRE(!hidrem::IniBackend::MatchesExtension("json"));
  REQUIRE(hidrem::JsonBackend::MatchesExtension("json"));
  REQUIRE(hidrem::YamlBackend::MatchesExtension("yaml"));
  REQUIRE(hidrem::YamlBackend::MatchesExtension("yml"));
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef HIDREM_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer", "[config][ini]") {
  const char* ini =
      "[server]\n"
      "host = 0.0.0.0\n"
      "port = 5090\n"
      "[keymap]\n"
      "btn_a = button a\n";
  hidrem::IniConfig cfg;
  auto r = cfg.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)),
                          hidrem::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetPort("server", "port") == 5090);
  REQUIRE(std::strcmp(cfg.GetString("keymap", "btn_a"), "button a") == 0);
}

TEST_CASE("INI LoadFile errors", "[config][ini]") {
  hidrem::IniConfig cfg;
  auto missing = cfg.LoadFile("/tmp/__hidrem_missing__.ini");
  REQUIRE(missing.get_error() == hidrem::ConfigError::kFileNotFound);

  auto wrong = cfg.LoadBuffer("{}", 2U, hidrem::ConfigFormat::kJson);
  REQUIRE(wrong.get_error() == hidrem::ConfigError::kFormatNotSupported);
}

TEST_CASE("INI LoadFile from disk", "[config][ini]") {
  TempFile file("hidrem_test_config.ini", "[log]\nlevel = warn\n");
  hidrem::IniConfig cfg;
  REQUIRE(cfg.LoadFile(file.Path()).has_value());
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "warn") == 0);
}

#endif  // HIDREM_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef HIDREM_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadBuffer sections and scalars", "[config][json]") {
  const char* json =
      R"({"discovery": {"port": 6000, "identifier": "HIDrem0:1"},)"
      R"( "client": {"ping_interval_ms": 250, "verbose": true}})";
  hidrem::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                          hidrem::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetPort("discovery", "port") == 6000);
  REQUIRE(std::strcmp(cfg.GetString("discovery", "identifier"), "HIDrem0:1") == 0);
  REQUIRE(cfg.GetUint32("client", "ping_interval_ms") == 250U);
  REQUIRE(cfg.GetBool("client", "verbose"));
}

TEST_CASE("JSON parse error", "[config][json]") {
  const char* bad = "{ not json";
  hidrem::JsonConfig cfg;
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                          hidrem::ConfigFormat::kJson);
  REQUIRE(r.get_error() == hidrem::ConfigError::kParseError);
}

#endif  // HIDREM_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef HIDREM_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer sections", "[config][yaml]") {
  const char* yaml =
      "server:\n"
      "  port: 7000\n"
      "log:\n"
      "  level: debug\n";
  hidrem::YamlConfig cfg;
  auto r = cfg.LoadBuffer(yaml, static_cast<uint32_t>(std::strlen(yaml)),
                          hidrem::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetPort("server", "port") == 7000);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "debug") == 0);
}

#endif  // HIDREM_CONFIG_YAML_ENABLED

// ============================================================================
// Application settings
// ============================================================================

TEST_CASE("ApplySettings keeps defaults for an empty store", "[config][app]") {
  hidrem_app::AppSettings s;
  hidrem::ConfigStore empty;
  hidrem_app::ApplySettings(empty, s);
  REQUIRE(s.server_host == "0.0.0.0");
  REQUIRE(s.server_port == 0U);
  REQUIRE(s.discovery.identifier == "HIDrem0:1");
  REQUIRE(s.discovery.port == 5026U);
  REQUIRE(s.discovery.interval_ms == 1000U);
  REQUIRE(s.discovery.window_ms == 3000U);
  REQUIRE(s.ping_interval_ms == 1000U);
  REQUIRE(s.log_level == hidrem::log::Level::kInfo);
}

TEST_CASE("ApplySettings maps every recognised key", "[config][app]") {
  hidrem::ConfigStore cfg;
  cfg.Set("server", "host", "127.0.0.1");
  cfg.Set("server", "port", "6001");
  cfg.Set("discovery", "identifier", "Lab0:2");
  cfg.Set("discovery", "port", "6026");
  cfg.Set("discovery", "interval_ms", "250");
  cfg.Set("discovery", "window_ms", "800");
  cfg.Set("discovery", "broadcast_address", "192.168.1.255");
  cfg.Set("discovery", "advertise_ip", "192.168.1.4");
  cfg.Set("client", "ping_interval_ms", "0");
  cfg.Set("log", "level", "error");
  cfg.Set("keymap", "btn_a", "button a");

  hidrem_app::AppSettings s;
  hidrem_app::ApplySettings(cfg, s);
  REQUIRE(s.server_host == "127.0.0.1");
  REQUIRE(s.server_port == 6001U);
  REQUIRE(s.discovery.identifier == "Lab0:2");
  REQUIRE(s.discovery.port == 6026U);
  REQUIRE(s.discovery.interval_ms == 250U);
  REQUIRE(s.discovery.window_ms == 800U);
  REQUIRE(s.discovery.broadcast_address == "192.168.1.255");
  REQUIRE(s.discovery.advertise_ip == "192.168.1.4");
  REQUIRE(s.ping_interval_ms == 0U);
  REQUIRE(s.log_level == hidrem::log::Level::kError);
  REQUIRE(s.raw.HasKey("keymap", "btn_a"));
}

TEST_CASE("ApplySettings ignores an unknown log level", "[config][app]") {
  hidrem::ConfigStore cfg;
  cfg.Set("log", "level", "chatty");
  hidrem_app::AppSettings s;
  hidrem_app::ApplySettings(cfg, s);
  REQUIRE(s.log_level == hidrem::log::Level::kInfo);
}

TEST_CASE("Command line helpers", "[config][app]") {
  char prog[] = "hidrem_client";
  char flag[] = "--config";
  char path[] = "client.ini";
  char addr[] = "10.0.0.2:5000";

  char* with_both[] = {prog, flag, path, addr};
  REQUIRE(std::strcmp(hidrem_app::FindConfigArg(4, with_both), "client.ini") == 0);
  REQUIRE(std::strcmp(hidrem_app::FindPositionalArg(4, with_both), addr) == 0);

  char* addr_first[] = {prog, addr, flag, path};
  REQUIRE(std::strcmp(hidrem_app::FindPositionalArg(4, addr_first), addr) == 0);
  REQUIRE(std::strcmp(hidrem_app::FindConfigArg(4, addr_first), path) == 0);

  char* dangling[] = {prog, flag};
  REQUIRE(hidrem_app::FindConfigArg(2, dangling) == nullptr);
  char* none[] = {prog};
  REQUIRE(hidrem_app::FindPositionalArg(1, none) == nullptr);
}

TEST_CASE("LoadSettings with a missing file keeps defaults", "[config][app]") {
  hidrem_app::AppSettings s;
  REQUIRE(!hidrem_app::LoadSettings("/tmp/__hidrem_missing__.ini", s));
  REQUIRE(s.discovery.port == 5026U);
}
