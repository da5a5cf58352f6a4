/**
 * @file config.hpp
 * @brief Multi-format configuration reader with template-based backend dispatch.
 *
 * Design patterns:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (HIDREM_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (HIDREM_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (HIDREM_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Top-level scalars
 * land in the "" section. Section and key lookups are case-insensitive;
 * keys keep their spelling for Keys().
 *
 * Usage:
 * @code
 *   hidrem::MultiConfig cfg;
 *   cfg.LoadFile("hidrem.ini");
 *   uint16_t port = cfg.GetPort("server", "port", 0);
 * @endcode
 */

#ifndef HIDREM_CONFIG_HPP_
#define HIDREM_CONFIG_HPP_

#include "hidrem/platform.hpp"
#include "hidrem/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <vector>

#ifdef HIDREM_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef HIDREM_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef HIDREM_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#if defined(HIDREM_CONFIG_INI_ENABLED) || defined(HIDREM_CONFIG_JSON_ENABLED) || \
    defined(HIDREM_CONFIG_YAML_ENABLED)
#define HIDREM_CONFIG_ANY_ENABLED 1
#endif

/// Largest file ParseFile() reads for the buffer-based backends.
#ifndef HIDREM_CONFIG_MAX_FILE_SIZE
#define HIDREM_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace hidrem {

// ============================================================================
// ConfigFormat
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a; ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend Tag Types
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - Flat key-value storage base
// ============================================================================

class ConfigStore {
 public:
  // --- Typed Getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  /** @brief Non-negative integer; negative or malformed values give the default. */
  uint32_t GetUint32(const char* section, const char* key,
                     uint32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return (v.has_value() && *v >= 0) ? static_cast<uint32_t>(*v) : default_val;
  }

  /** @brief Port number, clamped to 0..65535. */
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    auto v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    if (*v < 0) return 0;
    if (*v > 65535) return 65535;
    return static_cast<uint16_t>(*v);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : val;
  }

  // --- Optional Getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    return (end == e->value) ? optional<int32_t>{}
                             : optional<int32_t>{static_cast<int32_t>(val)};
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>{} : optional<bool>{ParseBool(e->value)};
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    HIDREM_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /** @brief Keys of @p section in the order they were first loaded. */
  std::vector<std::string> Keys(const char* section) const {
    std::vector<std::string> keys;
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) {
        keys.emplace_back(entries_[i].key);
      }
    }
    return keys;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /**
   * @brief Set or overwrite one value (later loads override earlier ones).
   * @return false when the store is full.
   */
  bool Set(const char* section, const char* key, const char* value) {
    return AddEntry(section, key, value);
  }

 protected:
  static constexpr uint32_t kMaxEntries = 128;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  /** @return Bytes read; kBufferFull if the file does not fit @p buf. */
  static expected<uint32_t, ConfigError> ReadFileToBuffer(
      const char* path, char* buf, uint32_t buf_size) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr)
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (bytes == buf_size - 1U) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated)
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    HIDREM_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key))
        return &entries_[i];
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) { dst[0] = '\0'; return; }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') { dst[i] = src[i]; ++i; }
    dst[i] = '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend> - Template specialization per format
// ============================================================================

/** Default: format not supported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef HIDREM_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string text(data, size);
    int result = ini_parse_string(text.c_str(), Handler, &store);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "") ? 1 : 0;
  }
};
#endif

// --- JSON Backend ---

#ifdef HIDREM_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[HIDREM_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(),
                              ToStr(*kit).c_str()))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else if (!store.AddEntry("", it.key().c_str(), ToStr(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_float()) {
      char b[32];
      std::snprintf(b, sizeof(b), "%g", n.get<double>());
      return b;
    }
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef HIDREM_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[HIDREM_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string yaml_str(data, size);
    auto root = fkyaml::node::deserialize(yaml_str);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          if (!store.AddEntry(sec.c_str(), key.c_str(), ToStr(*kit).c_str()))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else if (!store.AddEntry("", sec.c_str(), ToStr(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char b[32];
      std::snprintf(b, sizeof(b), "%g", n.get_value<double>());
      return b;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...> - Compile-time composable config reader
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    HIDREM_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    HIDREM_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Convenience Type Aliases
// ============================================================================

#ifdef HIDREM_CONFIG_ANY_ENABLED
using MultiConfig = Config<
#ifdef HIDREM_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(HIDREM_CONFIG_INI_ENABLED) && \
    (defined(HIDREM_CONFIG_JSON_ENABLED) || defined(HIDREM_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef HIDREM_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(HIDREM_CONFIG_JSON_ENABLED) && defined(HIDREM_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef HIDREM_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef HIDREM_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef HIDREM_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef HIDREM_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace hidrem

#endif  // HIDREM_CONFIG_HPP_
