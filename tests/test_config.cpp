/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - template-based multi-format config parser.
 */

#include "shp/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <string>

namespace {

/// Writes @p content to a unique temp file; removed on destruction.
class TempFile {
 public:
  TempFile(const char* suffix, const std::string& content) {
    char tmpl[64];
    std::snprintf(tmpl, sizeof(tmpl), "/tmp/shp_cfg_XXXXXX%s", suffix);
    const int fd = mkstemps(tmpl, static_cast<int>(std::strlen(suffix)));
    REQUIRE(fd >= 0);
    REQUIRE(write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
    close(fd);
    path_ = tmpl;
  }
  ~TempFile() { (void)std::remove(path_.c_str()); }
  const char* path() const { return path_.c_str(); }

 private:
  std::string path_;
};

}  // namespace

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore Set overwrites case-insensitively", "[config]") {
  shp::ConfigStore store;
  REQUIRE(store.Set("Supervisor", "Max_Concurrent", "5"));
  REQUIRE(store.Set("supervisor", "max_concurrent", "7"));
  REQUIRE(store.EntryCount() == 1);
  REQUIRE(store.GetInt("SUPERVISOR", "MAX_CONCURRENT") == 7);
  REQUIRE(store.HasSection("supervisor"));
  REQUIRE_FALSE(store.HasSection("janitor"));
}

TEST_CASE("ConfigStore rejects trailing garbage in numbers", "[config]") {
  shp::ConfigStore store;
  REQUIRE(store.Set("s", "good", " 42  "));
  REQUIRE(store.Set("s", "bad", "42abc"));
  REQUIRE(store.Set("s", "ratio", "0.75"));
  REQUIRE(store.Set("s", "empty", ""));

  REQUIRE(store.FindInt("s", "good").value() == 42);
  REQUIRE_FALSE(store.FindInt("s", "bad").has_value());
  REQUIRE_FALSE(store.FindInt("s", "ratio").has_value());
  REQUIRE_FALSE(store.FindInt("s", "empty").has_value());
  REQUIRE(store.FindDouble("s", "ratio").value() == 0.75);
  REQUIRE(store.GetInt("s", "bad", -1) == -1);
  REQUIRE_FALSE(store.FindInt("s", "missing").has_value());
}

TEST_CASE("ConfigStore bool spellings", "[config]") {
  shp::ConfigStore store;
  store.Set("f", "a", "true");
  store.Set("f", "b", "YES");
  store.Set("f", "c", "on");
  store.Set("f", "d", "1");
  store.Set("f", "e", "false");
  store.Set("f", "g", "nope");
  REQUIRE(store.GetBool("f", "a"));
  REQUIRE(store.GetBool("f", "b"));
  REQUIRE(store.GetBool("f", "c"));
  REQUIRE(store.GetBool("f", "d"));
  REQUIRE_FALSE(store.GetBool("f", "e", true));
  REQUIRE_FALSE(store.GetBool("f", "g", true));
  REQUIRE(store.GetBool("f", "missing", true));
  REQUIRE_FALSE(store.FindBool("f", "missing").has_value());
}

TEST_CASE("ConfigStore ForEachInSection keeps insertion order", "[config]") {
  shp::ConfigStore store;
  store.Set("environment", "DISPLAY", ":1");
  store.Set("other", "x", "y");
  store.Set("environment", "WINEESYNC", "0");

  std::string seen;
  store.ForEachInSection("environment", [&](const char* k, const char* v) {
    seen += k;
    seen += '=';
    seen += v;
    seen += ';';
  });
  REQUIRE(seen == "DISPLAY=:1;WINEESYNC=0;");
}

TEST_CASE("ConfigStore capacity and truncation", "[config]") {
  shp::ConfigStore store;
  char key[16];
  for (uint32_t i = 0; i < shp::ConfigStore::kMaxEntries; ++i) {
    std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.Set("s", key, "v"));
  }
  REQUIRE_FALSE(store.Set("s", "overflow", "v"));
  REQUIRE(store.Set("s", "k0", "updated"));

  const std::string long_value(400, 'x');
  REQUIRE(store.Set("s", "k1", long_value.c_str()));
  REQUIRE(std::strlen(store.GetString("s", "k1")) == shp::ConfigStore::kMaxValueLen - 1);
}

TEST_CASE("ConfigStore ReadFileToBuffer", "[config]") {
  char buf[16];
  auto missing = shp::ConfigStore::ReadFileToBuffer("/nonexistent/x.ini", buf, sizeof(buf));
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == shp::ConfigError::kFileNotFound);

  TempFile small(".txt", "abc");
  auto ok = shp::ConfigStore::ReadFileToBuffer(small.path(), buf, sizeof(buf));
  REQUIRE(ok.has_value());
  REQUIRE(ok.value() == 3);
  REQUIRE(std::strcmp(buf, "abc") == 0);

  TempFile big(".txt", std::string(64, 'z'));
  auto full = shp::ConfigStore::ReadFileToBuffer(big.path(), buf, sizeof(buf));
  REQUIRE(!full.has_value());
  REQUIRE(full.get_error() == shp::ConfigError::kBufferFull);
}

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef SHP_CONFIG_INI_ENABLED

using IniCfg = shp::Config<shp::IniBackend>;

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const char* ini_data =
      "[supervisor]\n"
      "max_concurrent = 3\n"
      "cpu_throttle_percent = 85.5\n"
      "[environment]\n"
      "DISPLAY = :1\n";

  IniCfg cfg;
  auto result = cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)), shp::ConfigFormat::kIni);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("supervisor", "max_concurrent", 0) == 3);
  REQUIRE(cfg.GetDouble("supervisor", "cpu_throttle_percent") == 85.5);
  REQUIRE(std::strcmp(cfg.GetString("environment", "DISPLAY"), ":1") == 0);
}

TEST_CASE("INI GetString default", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(std::strcmp(cfg.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(cfg.GetInt("x", "y", 42) == 42);
}

TEST_CASE("INI LoadFile with extension detection", "[config][ini]") {
  TempFile f(".ini", "[timeouts]\ngeneric_minutes = 15\n");
  IniCfg cfg;
  REQUIRE(cfg.LoadFile(f.path()).has_value());
  REQUIRE(cfg.GetInt("timeouts", "generic_minutes") == 15);
}

TEST_CASE("INI LoadFile nonexistent", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadFile("/nonexistent/path.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shp::ConfigError::kFileNotFound);
}

TEST_CASE("INI malformed input", "[config][ini]") {
  const char* bad = "[supervisor\nmax_concurrent\n";
  IniCfg cfg;
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)), shp::ConfigFormat::kIni);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shp::ConfigError::kParseError);
}

TEST_CASE("INI unsupported format request", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadBuffer("{}", 2, shp::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shp::ConfigError::kFormatNotSupported);
}

#endif  // SHP_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef SHP_CONFIG_JSON_ENABLED

using JsonCfg = shp::Config<shp::JsonBackend>;

TEST_CASE("JSON LoadBuffer sections and scalars", "[config][json]") {
  const char* json_data = R"({
    "supervisor": {"max_concurrent": 4, "cpu_throttle_percent": 80.5, "detect_missing_components": false},
    "environment": {"DISPLAY": ":2"},
    "top_level": "x"
  })";

  JsonCfg cfg;
  auto r = cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)), shp::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt("supervisor", "max_concurrent") == 4);
  REQUIRE(cfg.GetDouble("supervisor", "cpu_throttle_percent") == 80.5);
  REQUIRE_FALSE(cfg.GetBool("supervisor", "detect_missing_components", true));
  REQUIRE(std::strcmp(cfg.GetString("environment", "DISPLAY"), ":2") == 0);
  REQUIRE(std::strcmp(cfg.GetString("", "top_level"), "x") == 0);
}

TEST_CASE("JSON malformed and non-object input", "[config][json]") {
  JsonCfg cfg;
  const char* bad = "{\"a\": ";
  auto r1 = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)), shp::ConfigFormat::kJson);
  REQUIRE(!r1.has_value());
  REQUIRE(r1.get_error() == shp::ConfigError::kParseError);

  const char* arr = "[1, 2]";
  auto r2 = cfg.LoadBuffer(arr, static_cast<uint32_t>(std::strlen(arr)), shp::ConfigFormat::kJson);
  REQUIRE(!r2.has_value());
  REQUIRE(r2.get_error() == shp::ConfigError::kParseError);
}

TEST_CASE("JSON lists join as a search path, deeper objects stay serialized", "[config][json]") {
  const char* json_data = R"({
    "supervisor": {"library_path": ["/opt/wine/lib", "/opt/wine/lib64"], "extra": {"a": 1}}
  })";

  JsonCfg cfg;
  REQUIRE(cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)), shp::ConfigFormat::kJson)
              .has_value());
  REQUIRE(std::string(cfg.GetString("supervisor", "library_path")) == "/opt/wine/lib:/opt/wine/lib64");
  REQUIRE(std::string(cfg.GetString("supervisor", "extra")) == R"({"a":1})");
}

TEST_CASE("JSON LoadFile", "[config][json]") {
  TempFile f(".json", R"({"janitor": {"enabled": true, "helper_limit": 4}})");
  JsonCfg cfg;
  REQUIRE(cfg.LoadFile(f.path()).has_value());
  REQUIRE(cfg.GetBool("janitor", "enabled"));
  REQUIRE(cfg.GetInt("janitor", "helper_limit") == 4);
}

#endif  // SHP_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef SHP_CONFIG_YAML_ENABLED

using YamlCfg = shp::Config<shp::YamlBackend>;

TEST_CASE("YAML LoadBuffer sections and scalars", "[config][yaml]") {
  const char* yaml_data =
      "supervisor:\n"
      "  max_concurrent: 2\n"
      "  grace_period_ms: 1500\n"
      "janitor:\n"
      "  enabled: false\n"
      "  hot_percent: 65.5\n";

  YamlCfg cfg;
  auto r = cfg.LoadBuffer(yaml_data, static_cast<uint32_t>(std::strlen(yaml_data)), shp::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt("supervisor", "max_concurrent") == 2);
  REQUIRE(cfg.GetInt("supervisor", "grace_period_ms") == 1500);
  REQUIRE_FALSE(cfg.GetBool("janitor", "enabled", true));
  REQUIRE(cfg.GetDouble("janitor", "hot_percent") == 65.5);
}

TEST_CASE("YAML sequences join as a search path", "[config][yaml]") {
  const char* yaml_data =
      "supervisor:\n"
      "  library_path:\n"
      "    - /opt/wine/lib\n"
      "    - /opt/wine/lib64\n"
      "environment:\n"
      "  DISPLAY: \":1\"\n";

  YamlCfg cfg;
  REQUIRE(cfg.LoadBuffer(yaml_data, static_cast<uint32_t>(std::strlen(yaml_data)), shp::ConfigFormat::kYaml)
              .has_value());
  REQUIRE(std::string(cfg.GetString("supervisor", "library_path")) == "/opt/wine/lib:/opt/wine/lib64");
  REQUIRE(std::string(cfg.GetString("environment", "DISPLAY")) == ":1");
}

TEST_CASE("YAML top-level sequence is rejected", "[config][yaml]") {
  const char* yaml_data = "- a\n- b\n";
  YamlCfg cfg;
  auto r = cfg.LoadBuffer(yaml_data, static_cast<uint32_t>(std::strlen(yaml_data)), shp::ConfigFormat::kYaml);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == shp::ConfigError::kParseError);
}

TEST_CASE("YAML LoadFile", "[config][yaml]") {
  TempFile f(".yaml", "timeouts:\n  app_minutes: 45\n");
  YamlCfg cfg;
  REQUIRE(cfg.LoadFile(f.path()).has_value());
  REQUIRE(cfg.GetInt("timeouts", "app_minutes") == 45);
}

#endif  // SHP_CONFIG_YAML_ENABLED

// ============================================================================
// MultiConfig
// ============================================================================

#if defined(SHP_CONFIG_INI_ENABLED) && defined(SHP_CONFIG_JSON_ENABLED)

TEST_CASE("MultiConfig picks the backend by extension", "[config][multi]") {
  TempFile ini(".conf", "[supervisor]\nmax_concurrent = 6\n");
  TempFile json(".json", R"({"supervisor": {"max_concurrent": 9}})");

  shp::MultiConfig a;
  REQUIRE(a.LoadFile(ini.path()).has_value());
  REQUIRE(a.GetInt("supervisor", "max_concurrent") == 6);

  shp::MultiConfig b;
  REQUIRE(b.LoadFile(json.path()).has_value());
  REQUIRE(b.GetInt("supervisor", "max_concurrent") == 9);
}

#endif
