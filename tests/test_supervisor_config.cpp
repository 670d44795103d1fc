/**
 * @file test_supervisor_config.cpp
 * @brief Tests for supervisor_config.hpp
 */

#include "shp/supervisor_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

TEST_CASE("SupervisorConfig defaults", "[supervisor_config]") {
  shp::SupervisorConfig cfg;
  REQUIRE(cfg.max_concurrent == 5);
  REQUIRE(cfg.cpu_throttle_percent == 90.0);
  REQUIRE(cfg.sample_budget_ms == 1000);
  REQUIRE(cfg.watchdog_poll_ms == 30000);
  REQUIRE(cfg.timeouts.installer_ms == 2ULL * 3600ULL * 1000ULL);
  REQUIRE(cfg.timeouts.generic_ms == 30ULL * 60ULL * 1000ULL);
  REQUIRE(cfg.janitor_enabled);
  REQUIRE(cfg.environment.enforced.at("WINEDEBUG") == "-all");
  REQUIRE(cfg.environment.fallbacks.at("DISPLAY") == ":0");
}

TEST_CASE("LoadSupervisorConfig: empty store keeps defaults", "[supervisor_config]") {
  shp::ConfigStore store;
  shp::SupervisorConfig cfg;
  REQUIRE(shp::LoadSupervisorConfig(store, cfg).has_value());
  REQUIRE(cfg.max_concurrent == 5);
  REQUIRE(cfg.janitor.runaway_percent == 95.0);
}

TEST_CASE("LoadSupervisorConfig: overlays present keys", "[supervisor_config]") {
  shp::ConfigStore store;
  store.Set("supervisor", "max_concurrent", "3");
  store.Set("supervisor", "cpu_throttle_percent", "80");
  store.Set("supervisor", "watchdog_poll_ms", "1000");
  store.Set("supervisor", "grace_period_ms", "250");
  store.Set("supervisor", "capture_limit_bytes", "4096");
  store.Set("supervisor", "detect_missing_components", "no");
  store.Set("supervisor", "library_path", "/opt/wine/lib::/opt/wine/lib64");
  store.Set("timeouts", "installer_minutes", "60");
  store.Set("timeouts", "generic_minutes", "5");
  store.Set("janitor", "enabled", "false");
  store.Set("janitor", "hot_percent", "60");
  store.Set("janitor", "helper_limit", "4");
  store.Set("janitor", "nice_increment", "5");
  store.Set("janitor", "suspend_throttle", "on");
  store.Set("environment", "DISPLAY", ":3");
  store.Set("environment", "WINEPREFIX", "/srv/prefix");

  shp::SupervisorConfig cfg;
  REQUIRE(shp::LoadSupervisorConfig(store, cfg).has_value());
  REQUIRE(cfg.max_concurrent == 3);
  REQUIRE(cfg.cpu_throttle_percent == 80.0);
  REQUIRE(cfg.watchdog_poll_ms == 1000);
  REQUIRE(cfg.grace_period_ms == 250);
  REQUIRE(cfg.capture_limit_bytes == 4096);
  REQUIRE_FALSE(cfg.detect_missing_components);
  REQUIRE(cfg.environment.library_dirs.size() == 2);
  REQUIRE(cfg.environment.library_dirs[0] == "/opt/wine/lib");
  REQUIRE(cfg.environment.library_dirs[1] == "/opt/wine/lib64");
  REQUIRE(cfg.timeouts.installer_ms == 60ULL * 60ULL * 1000ULL);
  REQUIRE(cfg.timeouts.app_ms == 2ULL * 3600ULL * 1000ULL);
  REQUIRE(cfg.timeouts.generic_ms == 5ULL * 60ULL * 1000ULL);
  REQUIRE_FALSE(cfg.janitor_enabled);
  REQUIRE(cfg.janitor.hot_percent == 60.0);
  REQUIRE(cfg.janitor.helper_limit == 4);
  REQUIRE(cfg.janitor.nice_increment == 5);
  REQUIRE(cfg.janitor.suspend_throttle);
  REQUIRE(cfg.environment.fallbacks.at("DISPLAY") == ":3");
  REQUIRE(cfg.environment.fallbacks.at("WINEPREFIX") == "/srv/prefix");
  // Untouched fallbacks survive.
  REQUIRE(cfg.environment.fallbacks.at("WINEESYNC") == "1");
}

TEST_CASE("LoadSupervisorConfig: invalid value leaves config untouched", "[supervisor_config]") {
  shp::ConfigStore store;
  store.Set("supervisor", "max_concurrent", "3");
  store.Set("supervisor", "grace_period_ms", "soon");

  shp::SupervisorConfig cfg;
  auto r = shp::LoadSupervisorConfig(store, cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shp::ConfigError::kInvalidValue);
  REQUIRE(cfg.max_concurrent == 5);
  REQUIRE(cfg.grace_period_ms == 5000);
}

TEST_CASE("LoadSupervisorConfig: range checks", "[supervisor_config]") {
  shp::SupervisorConfig cfg;

  SECTION("ceiling above registry capacity") {
    shp::ConfigStore store;
    store.Set("supervisor", "max_concurrent", "17");
    REQUIRE(!shp::LoadSupervisorConfig(store, cfg).has_value());
  }
  SECTION("zero ceiling") {
    shp::ConfigStore store;
    store.Set("supervisor", "max_concurrent", "0");
    REQUIRE(!shp::LoadSupervisorConfig(store, cfg).has_value());
  }
  SECTION("percentage above 100") {
    shp::ConfigStore store;
    store.Set("supervisor", "cpu_throttle_percent", "120");
    REQUIRE(!shp::LoadSupervisorConfig(store, cfg).has_value());
  }
  SECTION("negative integer") {
    shp::ConfigStore store;
    store.Set("supervisor", "watchdog_poll_ms", "-5");
    REQUIRE(!shp::LoadSupervisorConfig(store, cfg).has_value());
  }
  SECTION("nice increment out of range") {
    shp::ConfigStore store;
    store.Set("janitor", "nice_increment", "25");
    REQUIRE(!shp::LoadSupervisorConfig(store, cfg).has_value());
  }
  SECTION("zero minutes") {
    shp::ConfigStore store;
    store.Set("timeouts", "app_minutes", "0");
    REQUIRE(!shp::LoadSupervisorConfig(store, cfg).has_value());
  }
  REQUIRE(cfg.max_concurrent == 5);
}

TEST_CASE("LoadSupervisorConfig: hot must stay below runaway", "[supervisor_config]") {
  shp::ConfigStore store;
  store.Set("janitor", "hot_percent", "96");
  shp::SupervisorConfig cfg;
  auto r = shp::LoadSupervisorConfig(store, cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == shp::ConfigError::kInvalidValue);
  REQUIRE(cfg.janitor.hot_percent == 70.0);
}

#ifdef SHP_CONFIG_INI_ENABLED

TEST_CASE("LoadSupervisorConfig from an INI buffer", "[supervisor_config][ini]") {
  const char* ini =
      "[supervisor]\n"
      "max_concurrent = 2\n"
      "[timeouts]\n"
      "app_minutes = 90\n";
  shp::IniConfig store;
  REQUIRE(store.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)), shp::ConfigFormat::kIni).has_value());

  shp::SupervisorConfig cfg;
  REQUIRE(shp::LoadSupervisorConfig(store, cfg).has_value());
  REQUIRE(cfg.max_concurrent == 2);
  REQUIRE(cfg.timeouts.app_ms == 90ULL * 60ULL * 1000ULL);
}

#endif

#ifdef SHP_CONFIG_YAML_ENABLED

TEST_CASE("LoadSupervisorConfig from a YAML buffer with a library list", "[supervisor_config][yaml]") {
  const char* yaml =
      "supervisor:\n"
      "  max_concurrent: 4\n"
      "  library_path:\n"
      "    - /opt/wine/lib\n"
      "    - /opt/wine/lib64\n"
      "environment:\n"
      "  WINEPREFIX: /srv/prefix\n";
  shp::YamlConfig store;
  REQUIRE(store.LoadBuffer(yaml, static_cast<uint32_t>(std::strlen(yaml)), shp::ConfigFormat::kYaml).has_value());

  shp::SupervisorConfig cfg;
  REQUIRE(shp::LoadSupervisorConfig(store, cfg).has_value());
  REQUIRE(cfg.max_concurrent == 4);
  REQUIRE(cfg.environment.library_dirs.size() == 2);
  REQUIRE(cfg.environment.library_dirs[1] == "/opt/wine/lib64");
  REQUIRE(cfg.environment.fallbacks.at("WINEPREFIX") == "/srv/prefix");
}

#endif
