/**
 * @file config.hpp
 * @brief Section/key configuration store behind channel topologies and
 *        registry tunables.
 *
 * Every format is reduced to the same shape: named sections holding
 * `key = value` text entries. INI sections map one to one. JSON and YAML
 * tables are flattened, nested tables joining their names with '.', so
 *
 * @code
 *   { "channel": { "ctrl": { "priority": 10 } } }
 * @endcode
 *
 * and `[channel.ctrl] priority = 10` produce the same store.
 *
 * Backends are type tags selected at compile time; a backend whose library
 * is not compiled in (MCH_CONFIG_INI_ENABLED / _JSON_ / _YAML_) parses
 * nothing and answers kFormatNotSupported.
 *
 * @code
 *   mch::Config<mch::IniBackend, mch::JsonBackend> cfg;
 *   if (cfg.LoadFile("topology.json")) {
 *     cfg.ForEachSection([&](const char* sec) {
 *       auto weight = cfg.FindUint(sec, "weight");
 *     });
 *   }
 * @endcode
 */

#ifndef MCH_CONFIG_HPP_
#define MCH_CONFIG_HPP_

#include "mch/platform.hpp"
#include "mch/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef MCH_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef MCH_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef MCH_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef MCH_CONFIG_MAX_FILE_SIZE
#define MCH_CONFIG_MAX_FILE_SIZE 16384U
#endif

#ifndef MCH_CONFIG_MAX_ENTRIES
#define MCH_CONFIG_MAX_ENTRIES 256U
#endif

#ifndef MCH_CONFIG_MAX_SECTIONS
#define MCH_CONFIG_MAX_SECTIONS 64U
#endif

namespace mch {

enum class ConfigFormat : uint8_t { kAuto = 0, kIni, kJson, kYaml };

namespace detail {

/** ASCII case-insensitive equality; section and key names ignore case. */
inline bool NameEqual(const char* a, const char* b) noexcept {
  for (;; ++a, ++b) {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    if (la == '\0') return true;
  }
}

/** @return true if @p name starts with @p prefix, ignoring ASCII case. */
inline bool NameHasPrefix(const char* name, const char* prefix) noexcept {
  for (; *prefix != '\0'; ++name, ++prefix) {
    const char ln =
        (*name >= 'A' && *name <= 'Z') ? static_cast<char>(*name + 32) : *name;
    const char lp = (*prefix >= 'A' && *prefix <= 'Z')
                        ? static_cast<char>(*prefix + 32)
                        : *prefix;
    if (ln != lp) return false;
  }
  return true;
}

/** Whole-string integer parse; trailing blanks allowed, anything else not. */
inline bool ParseInteger(const char* text, long long& out) noexcept {
  if (text == nullptr || *text == '\0') return false;
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(text, &end, 10);
  if (end == text || errno == ERANGE) return false;
  while (*end == ' ' || *end == '\t') ++end;
  if (*end != '\0') return false;
  out = v;
  return true;
}

inline bool ParseFlag(const char* text) noexcept {
  return NameEqual(text, "true") || NameEqual(text, "1") ||
         NameEqual(text, "yes") || NameEqual(text, "on");
}

inline void CopyText(char* dst, const char* src, uint32_t cap) noexcept {
  uint32_t i = 0;
  if (src != nullptr) {
    for (; i + 1U < cap && src[i] != '\0'; ++i) dst[i] = src[i];
  }
  dst[i] = '\0';
}

/** Extension after the last '.' of the file name, or nullptr. */
inline const char* FileExtension(const char* path) noexcept {
  const char* ext = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') {
      ext = nullptr;
    } else if (*p == '.') {
      ext = p + 1;
    }
  }
  return ext;
}

}  // namespace detail

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::NameEqual(ext, "ini") || detail::NameEqual(ext, "cfg") ||
           detail::NameEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::NameEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::NameEqual(ext, "yaml") || detail::NameEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Fixed-capacity table of sections and their entries.
 *
 * Sections keep the order in which they first appeared. The unnamed section
 * "" holds top-level keys. Lookups are linear; topologies hold a few dozen
 * entries at most.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = MCH_CONFIG_MAX_ENTRIES;
  static constexpr uint32_t kMaxSections = MCH_CONFIG_MAX_SECTIONS;
  static constexpr uint32_t kMaxNameLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  // --- Getters with defaults ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Lookup(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = Lookup(section, key);
    return (e != nullptr) ? detail::ParseFlag(e->value) : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    const double v = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : v;
  }

  // --- Checked getters ---

  /** @brief Empty when absent, not an integer, or outside int32_t. */
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    long long v = 0;
    if (e == nullptr || !detail::ParseInteger(e->value, v) ||
        v < INT32_MIN || v > INT32_MAX) {
      return {};
    }
    return optional<int32_t>(static_cast<int32_t>(v));
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return {};
    return optional<bool>(detail::ParseFlag(e->value));
  }

  /**
   * @brief Non-negative integer that fits uint32_t.
   * @return kMissingKey when absent, kInvalidValue when present but
   *         negative, out of range, or not a number.
   */
  expected<uint32_t, ConfigError> FindUint(const char* section,
                                           const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kMissingKey);
    }
    long long v = 0;
    if (!detail::ParseInteger(e->value, v) || v < 0 || v > UINT32_MAX) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(v));
  }

  // --- Structure ---

  bool HasSection(const char* section) const {
    return SectionIndex(section) >= 0;
  }

  bool HasKey(const char* section, const char* key) const {
    return Lookup(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return entry_count_; }
  uint32_t SectionCount() const noexcept { return section_count_; }

  /** @return Name of the idx-th section, nullptr past the end. */
  const char* SectionAt(uint32_t idx) const noexcept {
    return (idx < section_count_) ? sections_[idx] : nullptr;
  }

  /** @brief Calls fn(const char* section) in order of first appearance. */
  template <typename Fn>
  void ForEachSection(Fn&& fn) const {
    for (uint32_t i = 0; i < section_count_; ++i) fn(sections_[i]);
  }

  // --- Mutation ---

  /**
   * @brief Insert or overwrite one entry.
   * @return false when the entry or section table is full, or the section
   *         name does not fit.
   */
  bool Set(const char* section, const char* key, const char* value) {
    MCH_ASSERT(section != nullptr && key != nullptr);
    return Put(section, key, value);
  }

  void Clear() noexcept {
    entry_count_ = 0;
    section_count_ = 0;
  }

 protected:
  struct Entry {
    uint16_t section;
    char key[kMaxNameLen];
    char value[kMaxValueLen];
  };

  char sections_[kMaxSections][kMaxNameLen];
  uint32_t section_count_ = 0;
  Entry entries_[kMaxEntries];
  uint32_t entry_count_ = 0;

  int32_t SectionIndex(const char* section) const {
    MCH_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < section_count_; ++i) {
      if (detail::NameEqual(sections_[i], section)) {
        return static_cast<int32_t>(i);
      }
    }
    return -1;
  }

  const Entry* Lookup(const char* section, const char* key) const {
    MCH_ASSERT(key != nullptr);
    const int32_t sec = SectionIndex(section);
    if (sec < 0) return nullptr;
    for (uint32_t i = 0; i < entry_count_; ++i) {
      if (entries_[i].section == static_cast<uint16_t>(sec) &&
          detail::NameEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  bool Put(const char* section, const char* key, const char* value) {
    int32_t sec = SectionIndex(section);
    if (sec < 0) {
      if (section_count_ >= kMaxSections ||
          std::strlen(section) >= kMaxNameLen) {
        return false;
      }
      detail::CopyText(sections_[section_count_], section, kMaxNameLen);
      sec = static_cast<int32_t>(section_count_++);
    }
    for (uint32_t i = 0; i < entry_count_; ++i) {
      Entry& e = entries_[i];
      if (e.section == static_cast<uint16_t>(sec) &&
          detail::NameEqual(e.key, key)) {
        detail::CopyText(e.value, value, kMaxValueLen);
        return true;
      }
    }
    if (entry_count_ >= kMaxEntries) return false;
    Entry& e = entries_[entry_count_++];
    e.section = static_cast<uint16_t>(sec);
    detail::CopyText(e.key, key, kMaxNameLen);
    detail::CopyText(e.value, value, kMaxValueLen);
    return true;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// Parsers
// ============================================================================

namespace detail {

using ParseResult = expected<void, ConfigError>;

inline ParseResult Slurp(const char* path, std::string& out) {
  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) return ParseResult::error(ConfigError::kFileNotFound);
  char chunk[1024];
  size_t n = 0;
  out.clear();
  while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0U) {
    out.append(chunk, n);
    if (out.size() > MCH_CONFIG_MAX_FILE_SIZE) {
      std::fclose(f);
      return ParseResult::error(ConfigError::kBufferFull);
    }
  }
  std::fclose(f);
  return ParseResult::success();
}

inline std::string JoinSection(const std::string& parent,
                               const std::string& child) {
  return parent.empty() ? child : parent + "." + child;
}

}  // namespace detail

/** Primary template: backend not compiled in. */
template <typename Backend>
struct ConfigParser {
  static detail::ParseResult ParseFile(ConfigStore&, const char*) {
    return detail::ParseResult::error(ConfigError::kFormatNotSupported);
  }
  static detail::ParseResult ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return detail::ParseResult::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef MCH_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static detail::ParseResult ParseFile(ConfigStore& store, const char* path) {
    return Check(ini_parse(path, &OnEntry, &store));
  }

  static detail::ParseResult ParseBuffer(ConfigStore& store, const char* data,
                                         uint32_t size) {
    // ini_parse_string wants a terminated string.
    const std::string text(data, size);
    return Check(ini_parse_string(text.c_str(), &OnEntry, &store));
  }

 private:
  // ini_parse: 0 ok, -1 open failed, -2 out of memory, >0 first bad line.
  static detail::ParseResult Check(int rc) {
    if (rc == 0) return detail::ParseResult::success();
    if (rc == -1) return detail::ParseResult::error(ConfigError::kFileNotFound);
    return detail::ParseResult::error(ConfigError::kParseError);
  }

  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    return static_cast<ConfigStore*>(user)->Put(
               section != nullptr ? section : "", name != nullptr ? name : "",
               value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif  // MCH_CONFIG_INI_ENABLED

#ifdef MCH_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static detail::ParseResult ParseFile(ConfigStore& store, const char* path) {
    std::string text;
    auto r = detail::Slurp(path, text);
    if (!r) return r;
    return ParseBuffer(store, text.data(), static_cast<uint32_t>(text.size()));
  }

  static detail::ParseResult ParseBuffer(ConfigStore& store, const char* data,
                                         uint32_t size) {
    const nlohmann::ordered_json root =
        nlohmann::ordered_json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return detail::ParseResult::error(ConfigError::kParseError);
    }
    return Flatten(store, root, std::string());
  }

 private:
  static detail::ParseResult Flatten(ConfigStore& store,
                                     const nlohmann::ordered_json& table,
                                     const std::string& section) {
    for (auto it = table.begin(); it != table.end(); ++it) {
      if (it->is_object()) {
        auto r = Flatten(store, *it, detail::JoinSection(section, it.key()));
        if (!r) return r;
        continue;
      }
      if (!store.Put(section.c_str(), it.key().c_str(), Text(*it).c_str())) {
        return detail::ParseResult::error(ConfigError::kBufferFull);
      }
    }
    return detail::ParseResult::success();
  }

  static std::string Text(const nlohmann::ordered_json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_null()) return std::string();
    return v.dump();
  }
};
#endif  // MCH_CONFIG_JSON_ENABLED

#ifdef MCH_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static detail::ParseResult ParseFile(ConfigStore& store, const char* path) {
    std::string text;
    auto r = detail::Slurp(path, text);
    if (!r) return r;
    return ParseBuffer(store, text.data(), static_cast<uint32_t>(text.size()));
  }

  static detail::ParseResult ParseBuffer(ConfigStore& store, const char* data,
                                         uint32_t size) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(std::string(data, size));
    } catch (const fkyaml::exception&) {
      return detail::ParseResult::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return detail::ParseResult::error(ConfigError::kParseError);
    }
    return Flatten(store, root, std::string());
  }

 private:
  static detail::ParseResult Flatten(ConfigStore& store,
                                     const fkyaml::node& table,
                                     const std::string& section) {
    for (auto it = table.begin(); it != table.end(); ++it) {
      if (!it.key().is_string()) {
        return detail::ParseResult::error(ConfigError::kParseError);
      }
      const std::string key = it.key().get_value<std::string>();
      const fkyaml::node& v = *it;
      if (v.is_mapping()) {
        auto r = Flatten(store, v, detail::JoinSection(section, key));
        if (!r) return r;
        continue;
      }
      if (!store.Put(section.c_str(), key.c_str(), Text(v).c_str())) {
        return detail::ParseResult::error(ConfigError::kBufferFull);
      }
    }
    return detail::ParseResult::success();
  }

  static std::string Text(const fkyaml::node& v) {
    if (v.is_string()) return v.get_value<std::string>();
    if (v.is_boolean()) return v.get_value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(v.get_value<int64_t>());
    if (v.is_float_number()) return std::to_string(v.get_value<double>());
    return std::string();
  }
};
#endif  // MCH_CONFIG_YAML_ENABLED

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore that can load any of the listed formats.
 *
 * LoadFile() with kAuto picks the backend by file extension and falls back
 * to the first listed backend. Loading merges into what is already stored.
 */
template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");
  using Primary = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    MCH_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      const char* ext = detail::FileExtension(path);
      format = (ext != nullptr) ? FormatOf<Backends...>(ext) : Primary::kFormat;
    }
    return FromFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    MCH_ASSERT(data != nullptr);
    if (format == ConfigFormat::kAuto) format = Primary::kFormat;
    return FromBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename B, typename... Rest>
  static ConfigFormat FormatOf(const char* ext) noexcept {
    if (B::MatchesExtension(ext)) return B::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return FormatOf<Rest...>(ext);
    } else {
      return Primary::kFormat;
    }
  }

  template <typename B, typename... Rest>
  expected<void, ConfigError> FromFile(const char* path, ConfigFormat format) {
    if (B::kFormat == format) return ConfigParser<B>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) {
      return FromFile<Rest...>(path, format);
    } else {
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    }
  }

  template <typename B, typename... Rest>
  expected<void, ConfigError> FromBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    if (B::kFormat == format) {
      return ConfigParser<B>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return FromBuffer<Rest...>(data, size, format);
    } else {
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
    }
  }
};

/// All three formats; the ones not compiled in answer kFormatNotSupported.
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;
using IniConfig = Config<IniBackend>;
using JsonConfig = Config<JsonBackend>;
using YamlConfig = Config<YamlBackend>;

}  // namespace mch

#endif  // MCH_CONFIG_HPP_
