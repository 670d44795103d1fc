/**
 * @file config.hpp
 * @brief Multi-format configuration store with template-based backend dispatch.
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (SHP_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (SHP_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (SHP_CONFIG_YAML_ENABLED)
 *
 * All formats are flattened to a "section + key = value" model. In JSON
 * and YAML, scalar lists are joined with ':' and anything nested deeper
 * than one level is stored as its serialized text.
 *
 * Usage:
 * @code
 *   shp::MultiConfig cfg;
 *   if (cfg.LoadFile("shepherd.ini").has_value()) {
 *     int32_t ceiling = cfg.GetInt("supervisor", "max_concurrent", 5);
 *   }
 * @endcode
 */

#ifndef SHP_CONFIG_HPP_
#define SHP_CONFIG_HPP_

#include "shp/platform.hpp"
#include "shp/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef SHP_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef SHP_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef SHP_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace shp {

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
    if (la != lb)
      return false;
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
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - flat section/key/value table
// ============================================================================

#ifndef SHP_CONFIG_MAX_FILE_SIZE
#define SHP_CONFIG_MAX_FILE_SIZE 16384U
#endif

class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 128;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  const char* GetString(const char* section, const char* key, const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    return FindDouble(section, key).value_or(default_val);
  }

  /// Present and fully numeric; trailing garbage yields an empty optional.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr)
      return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value || !AtEnd(end))
      return {};
    return optional<int32_t>{static_cast<int32_t>(val)};
  }

  optional<double> FindDouble(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr)
      return {};
    char* end = nullptr;
    double val = std::strtod(e->value, &end);
    if (end == e->value || !AtEnd(end))
      return {};
    return optional<double>{val};
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>{} : optional<bool>{ParseBool(e->value)};
  }

  bool HasSection(const char* section) const {
    SHP_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section))
        return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const { return FindEntry(section, key) != nullptr; }

  /// @brief Visit every (key, value) of @p section in insertion order.
  template <typename Fn>
  void ForEachInSection(const char* section, Fn&& fn) const {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) {
        fn(static_cast<const char*>(entries_[i].key), static_cast<const char*>(entries_[i].value));
      }
    }
  }

  /**
   * @brief Insert or overwrite an entry (case-insensitive match).
   * @return false if the table is full.
   */
  bool Set(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) && detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries)
      return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  uint32_t EntryCount() const noexcept { return count_; }

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

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path, char* buf, uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr)
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    const bool truncated = (bytes == buf_size - 1) && std::fgetc(f) != EOF;
    (void)std::fclose(f);
    if (truncated)
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

 protected:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  const Entry* FindEntry(const char* section, const char* key) const {
    SHP_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) && detail::CaseEqual(entries_[i].key, key))
        return &entries_[i];
    }
    return nullptr;
  }

  static bool AtEnd(const char* p) noexcept {
    while (*p == ' ' || *p == '\t')
      ++p;
    return *p == '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") || detail::CaseEqual(str, "yes") ||
           detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash))
      return nullptr;
    return dot + 1;
  }
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backend compiled out: every load reports kFormatNotSupported.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef SHP_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t) {
    if (ini_parse_string(data, Handler, &store) != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name, const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->Set(section ? section : "", name ? name : "", value ? value : "") ? 1 : 0;
  }
};
#endif

// ============================================================================
// Tree backends (JSON, YAML)
// ============================================================================

namespace detail {

template <typename Ops>
void RenderTreeValue(const typename Ops::Node& n, char* out, uint32_t size) {
  if (Ops::RenderScalar(n, out, size))
    return;
  if (!Ops::IsSequence(n)) {
    ConfigStore::SafeCopy(out, Ops::Serialize(n).c_str(), size);
    return;
  }
  std::string joined;
  char item[ConfigStore::kMaxValueLen];
  for (const auto& e : n) {
    if (!Ops::RenderScalar(e, item, sizeof(item)))
      continue;
    if (!joined.empty())
      joined += ':';
    joined += item;
  }
  ConfigStore::SafeCopy(out, joined.c_str(), size);
}

/**
 * @brief Flatten a two-level document into @p store.
 *
 * Top-level mappings become sections; top-level scalars land in the ""
 * section. A sequence of scalars is joined with ':' so a list of library
 * directories reads like a search path. Anything deeper is stored as its
 * serialized text. @p Ops adapts one document library.
 */
template <typename Ops>
expected<void, ConfigError> FlattenTree(ConfigStore& store, const typename Ops::Node& root) {
  if (!Ops::IsMapping(root))
    return expected<void, ConfigError>::error(ConfigError::kParseError);

  char val[ConfigStore::kMaxValueLen];
  for (auto it = root.begin(); it != root.end(); ++it) {
    const std::string outer = Ops::KeyOf(it);
    if (!Ops::IsMapping(*it)) {
      RenderTreeValue<Ops>(*it, val, sizeof(val));
      if (!store.Set("", outer.c_str(), val))
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      continue;
    }
    const auto& section = *it;
    for (auto kit = section.begin(); kit != section.end(); ++kit) {
      RenderTreeValue<Ops>(*kit, val, sizeof(val));
      if (!store.Set(outer.c_str(), Ops::KeyOf(kit).c_str(), val))
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
  }
  return expected<void, ConfigError>::success();
}

/// Shared file path for the buffer-based backends.
template <typename Parser>
expected<void, ConfigError> ParseFileThroughBuffer(ConfigStore& store, const char* path) {
  char buf[SHP_CONFIG_MAX_FILE_SIZE];
  auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
  if (!r.has_value())
    return expected<void, ConfigError>::error(r.get_error());
  return Parser::ParseBuffer(store, buf, r.value());
}

}  // namespace detail

#ifdef SHP_CONFIG_JSON_ENABLED
namespace detail {

struct JsonTreeOps {
  using Node = nlohmann::json;

  static bool IsMapping(const Node& n) { return n.is_object(); }
  static bool IsSequence(const Node& n) { return n.is_array(); }
  template <typename It>
  static std::string KeyOf(const It& it) {
    return it.key();
  }
  static std::string Serialize(const Node& n) { return n.dump(); }

  static bool RenderScalar(const Node& n, char* out, uint32_t size) {
    if (n.is_string()) {
      ConfigStore::SafeCopy(out, n.get_ref<const std::string&>().c_str(), size);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(out, n.get<bool>() ? "true" : "false", size);
    } else if (n.is_number_integer()) {
      std::snprintf(out, size, "%lld", static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      std::snprintf(out, size, "%g", n.get<double>());
    } else {
      return false;
    }
    return true;
  }
};

}  // namespace detail

template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    return detail::ParseFileThroughBuffer<ConfigParser>(store, path);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    const auto doc = nlohmann::json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded())
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return detail::FlattenTree<detail::JsonTreeOps>(store, doc);
  }
};
#endif

#ifdef SHP_CONFIG_YAML_ENABLED
namespace detail {

struct YamlTreeOps {
  using Node = fkyaml::node;

  static bool IsMapping(const Node& n) { return n.is_mapping(); }
  static bool IsSequence(const Node& n) { return n.is_sequence(); }
  template <typename It>
  static std::string KeyOf(const It& it) {
    return it.key().template get_value<std::string>();
  }
  static std::string Serialize(const Node& n) { return Node::serialize(n); }

  static bool RenderScalar(const Node& n, char* out, uint32_t size) {
    if (n.is_string()) {
      ConfigStore::SafeCopy(out, n.get_value<std::string>().c_str(), size);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(out, n.get_value<bool>() ? "true" : "false", size);
    } else if (n.is_integer()) {
      std::snprintf(out, size, "%lld", static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      std::snprintf(out, size, "%g", n.get_value<double>());
    } else if (n.is_null()) {
      out[0] = '\0';
    } else {
      return false;
    }
    return true;
  }
};

}  // namespace detail

template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    return detail::ParseFileThroughBuffer<ConfigParser>(store, path);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    const auto doc = fkyaml::node::deserialize(std::string(data, size));
    return detail::FlattenTree<detail::YamlTreeOps>(store, doc);
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

  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    SHP_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto)
      format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    SHP_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size, ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr)
      return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext))
      return First::kFormat;
    if constexpr (sizeof...(Rest) > 0)
      return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

// ============================================================================
// Aliases
// ============================================================================

#if defined(SHP_CONFIG_INI_ENABLED) || defined(SHP_CONFIG_JSON_ENABLED) || defined(SHP_CONFIG_YAML_ENABLED)
using MultiConfig = Config<
#ifdef SHP_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(SHP_CONFIG_INI_ENABLED) && (defined(SHP_CONFIG_JSON_ENABLED) || defined(SHP_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef SHP_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(SHP_CONFIG_JSON_ENABLED) && defined(SHP_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef SHP_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef SHP_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef SHP_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef SHP_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace shp

#endif  // SHP_CONFIG_HPP_
