/**
 * @file config.hpp
 * @brief Flat "section + key = value" configuration with pluggable parsers.
 *
 * Backends are selected at build time (CMake options):
 *   - IniBackend  : inih          (MIIA_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (MIIA_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (MIIA_CONFIG_YAML_ENABLED)
 *
 * JSON and YAML documents are flattened one level deep: top-level mappings
 * become sections, scalars at the top level go to section "".
 *
 * Usage:
 * @code
 *   miia::Config<miia::IniBackend> cfg;
 *   if (cfg.LoadFile("robot.ini")) {
 *     uint32_t baud = cfg.GetUint("serial", "baud", 57600);
 *   }
 * @endcode
 */

#ifndef MIIA_CONFIG_HPP_
#define MIIA_CONFIG_HPP_

#include "miia/platform.hpp"
#include "miia/vocabulary.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <tuple>

#ifdef MIIA_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef MIIA_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef MIIA_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#include <string>
#endif

namespace miia {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
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

#ifndef MIIA_CONFIG_MAX_FILE_SIZE
#define MIIA_CONFIG_MAX_FILE_SIZE 4096U
#endif

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 128;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0U) const {
    const optional<int32_t> v = FindInt(section, key);
    if (!v || v.value() < 0) return default_val;
    return static_cast<uint32_t>(v.value());
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  /// Empty when the key is absent, not a complete base-10 integer, or
  /// outside the int32_t range.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    errno = 0;
    const long long val = std::strtoll(e->value, &end, 10);
    if (end == e->value || *end != '\0' || errno == ERANGE) return {};
    if (val < INT32_MIN || val > INT32_MAX) return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    if (detail::CaseEqual(e->value, "true") || detail::CaseEqual(e->value, "1") ||
        detail::CaseEqual(e->value, "yes") || detail::CaseEqual(e->value, "on")) {
      return optional<bool>(true);
    }
    if (detail::CaseEqual(e->value, "false") || detail::CaseEqual(e->value, "0") ||
        detail::CaseEqual(e->value, "no") || detail::CaseEqual(e->value, "off")) {
      return optional<bool>(false);
    }
    return {};
  }

  bool HasSection(const char* section) const {
    MIIA_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// Insert or overwrite one value, e.g. a command-line override.
  expected<void, ConfigError> SetValue(const char* section, const char* key,
                                       const char* value) {
    MIIA_ASSERT(section != nullptr && key != nullptr);
    if (!AddEntry(section, key, value)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 protected:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

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

  const Entry* FindEntry(const char* section, const char* key) const {
    MIIA_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (bytes == buf_size - 1U) && std::fgetc(f) != EOF;
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  template <typename>
  friend struct ConfigParser;

 private:
  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backends compiled out report kFormatNotSupported.
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

#ifdef MIIA_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    const int rc = ini_parse(path, Handler, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (rc != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    if (ini_parse_string(data, Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section ? section : "", name ? name : "",
                           value ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef MIIA_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MIIA_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto doc = nlohmann::json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = doc.begin(); it != doc.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!Add(store, it.key().c_str(), kit.key().c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", it.key().c_str(), *it)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const nlohmann::json& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      ConfigStore::SafeCopy(val, n.get_ref<const std::string&>().c_str(),
                            sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get<bool>() ? "true" : "false", sizeof(val));
    } else if (n.is_number_integer()) {
      (void)std::snprintf(val, sizeof(val), "%ld",
                          static_cast<long>(n.get<int64_t>()));
    } else {
      ConfigStore::SafeCopy(val, n.dump().c_str(), sizeof(val));
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

#ifdef MIIA_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MIIA_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    const std::string text(data, size);
    auto root = fkyaml::node::deserialize(text);
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const auto key = kit.key().get_value<std::string>();
          if (!Add(store, section.c_str(), key.c_str(), *kit)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!Add(store, "", section.c_str(), node)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const fkyaml::node& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      ConfigStore::SafeCopy(val, n.get_value<std::string>().c_str(),
                            sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get_value<bool>() ? "true" : "false",
                            sizeof(val));
    } else if (n.is_integer()) {
      (void)std::snprintf(val, sizeof(val), "%ld",
                          static_cast<long>(n.get_value<int64_t>()));
    } else {
      val[0] = '\0';
    }
    return store.AddEntry(section, key, val);
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
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    MIIA_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    MIIA_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
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
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* dot = std::strrchr(path, '.');
    if (dot == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(dot + 1);
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

#ifdef MIIA_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef MIIA_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef MIIA_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace miia

#endif  // MIIA_CONFIG_HPP_
