/**
 * @file config.hpp
 * @brief Configuration file reader with template-based backend dispatch.
 *
 *   - IniBackend / JsonBackend are tag types
 *   - ConfigParser<Backend> specializations do the parsing
 *   - Config<Backends...> composes the enabled backends at compile time
 *   - ConfigStore holds the flattened "section.key = value" entries
 *
 * Backends:
 *   - JsonBackend : nlohmann/json (PEERLINK_CONFIG_JSON_ENABLED, default on)
 *   - IniBackend  : inih          (PEERLINK_CONFIG_INI_ENABLED)
 *
 * JSON arrays are kept as their JSON text and read back with GetList(), which
 * also splits comma separated INI values.
 *
 * @code
 *   peerlink::MultiConfig cfg;
 *   if (cfg.LoadFile("peerlinkd.json").has_value()) {
 *     uint16_t udp = cfg.GetPort("network", "udp_port", 1816);
 *   }
 * @endcode
 */

#ifndef PEERLINK_CONFIG_HPP_
#define PEERLINK_CONFIG_HPP_

#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <vector>

#ifndef PEERLINK_CONFIG_JSON_ENABLED
#define PEERLINK_CONFIG_JSON_ENABLED 1
#endif

#if PEERLINK_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef PEERLINK_CONFIG_INI_ENABLED
#include <ini.h>
#endif

namespace peerlink {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef PEERLINK_CONFIG_MAX_FILE_SIZE
#define PEERLINK_CONFIG_MAX_FILE_SIZE (256U * 1024U)
#endif

#ifndef PEERLINK_CONFIG_MAX_ENTRIES
#define PEERLINK_CONFIG_MAX_ENTRIES 256U
#endif

/** @brief Flat key-value storage; section and key lookups ignore case. */
class ConfigStore {
 public:
  std::string GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : std::string(default_val);
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  /** @brief Port number clamped to [0, 65535]. */
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    if (v.value() < 0) return 0;
    if (v.value() > 65535) return 65535;
    return static_cast<uint16_t>(v.value());
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value.c_str()) : default_val;
  }

  /**
   * @brief List value: a JSON array of scalars, or comma separated text.
   * Items are trimmed; empty items are dropped.
   */
  std::vector<std::string> GetList(const char* section, const char* key) const {
    std::vector<std::string> out;
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return out;
#if PEERLINK_CONFIG_JSON_ENABLED
    if (!e->value.empty() && e->value[0] == '[') {
      auto j = nlohmann::json::parse(e->value, nullptr, false);
      if (!j.is_discarded() && j.is_array()) {
        for (const auto& item : j) {
          std::string s = Trim(item.is_string() ? item.get<std::string>()
                                                : item.dump());
          if (!s.empty()) out.push_back(s);
        }
        return out;
      }
    }
#endif
    size_t start = 0;
    while (start <= e->value.size()) {
      size_t comma = e->value.find(',', start);
      if (comma == std::string::npos) comma = e->value.size();
      std::string item = Trim(e->value.substr(start, comma - start));
      if (!item.empty()) out.push_back(item);
      start = comma + 1;
    }
    return out;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    const char* text = e->value.c_str();
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (end == text) return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  bool HasSection(const char* section) const {
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  bool AddEntry(const char* section, const char* key, const std::string& value) {
    for (auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        e.value = value;
        return true;
      }
    }
    if (entries_.size() >= PEERLINK_CONFIG_MAX_ENTRIES) return false;
    entries_.push_back(Entry{section, key, value});
    return true;
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    using R = expected<std::string, ConfigError>;
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) return R::error(ConfigError::kFileNotFound);
    std::string data;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
      data.append(buf, n);
      if (data.size() > PEERLINK_CONFIG_MAX_FILE_SIZE) {
        std::fclose(f);
        return R::error(ConfigError::kBufferFull);
      }
    }
    std::fclose(f);
    return R::success(std::move(data));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    PEERLINK_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static std::string Trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
           detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Formats without a compiled-in parser report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                 const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef PEERLINK_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  // inih: nonzero return means "keep going".
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section != nullptr ? section : "",
                           name != nullptr ? name : "",
                           value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#if PEERLINK_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  /** Top-level objects become sections; top-level scalars land in "". */
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    using R = expected<void, ConfigError>;
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return R::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(),
                              ToStr(*kit))) {
            return R::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.AddEntry("", it.key().c_str(), ToStr(*it))) {
        return R::error(ConfigError::kBufferFull);
      }
    }
    return R::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_null()) return std::string();
    return n.dump();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  /** @brief Parse @p path; kAuto picks the backend from the extension. */
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    PEERLINK_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, format);
    }
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
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

#if PEERLINK_CONFIG_JSON_ENABLED && defined(PEERLINK_CONFIG_INI_ENABLED)
using MultiConfig = Config<JsonBackend, IniBackend>;
#elif PEERLINK_CONFIG_JSON_ENABLED
using MultiConfig = Config<JsonBackend>;
#elif defined(PEERLINK_CONFIG_INI_ENABLED)
using MultiConfig = Config<IniBackend>;
#endif

#if PEERLINK_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef PEERLINK_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif

}  // namespace peerlink

#endif  // PEERLINK_CONFIG_HPP_
