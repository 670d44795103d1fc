/**
 * @file supervisor_config.hpp
 * @brief Supervisor tunables and their loading from a ConfigStore.
 *
 * Recognized keys (all optional; absent keys keep their defaults):
 *
 *   [supervisor]
 *   max_concurrent            = 5
 *   cpu_throttle_percent      = 90
 *   sample_budget_ms          = 1000
 *   sample_interval_ms        = 0        ; background sampling, 0 = off
 *   watchdog_poll_ms          = 30000
 *   grace_period_ms           = 5000
 *   capture_limit_bytes       = 1048576
 *   detect_missing_components = true
 *   library_path              = /opt/wine/lib:/opt/wine/lib64
 *
 *   [timeouts]
 *   installer_minutes = 120
 *   app_minutes       = 120
 *   generic_minutes   = 30
 *
 *   [janitor]
 *   enabled, runaway_percent, hot_percent, sustained_sweeps,
 *   sweep_interval_ms, helper_limit, nice_increment, suspend_throttle
 *
 *   [environment]
 *   KEY = VALUE   ; child environment fallbacks
 */

#ifndef SHP_SUPERVISOR_CONFIG_HPP_
#define SHP_SUPERVISOR_CONFIG_HPP_

#include "shp/config.hpp"
#include "shp/environment.hpp"
#include "shp/janitor.hpp"
#include "shp/log.hpp"
#include "shp/timeout_classifier.hpp"
#include "shp/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>

namespace shp {

/// Hard upper bound for max_concurrent (registry / watchdog capacity).
static constexpr uint32_t kMaxSupervisedProcesses = 16;

struct SupervisorConfig {
  uint32_t max_concurrent = 5;
  double cpu_throttle_percent = 90.0;
  uint32_t sample_budget_ms = 1000;
  uint32_t sample_interval_ms = 0;
  uint32_t watchdog_poll_ms = 30000;
  uint32_t grace_period_ms = 5000;
  uint32_t capture_limit_bytes = 1024U * 1024U;
  bool detect_missing_components = true;
  TimeoutPolicy timeouts;
  bool janitor_enabled = true;
  JanitorPolicy janitor;
  EnvironmentPolicy environment = EnvironmentPolicy::Default();
};

namespace detail {

/// Overlay an integer key; a present but malformed or out-of-range value fails.
inline bool OverlayUint(const ConfigStore& store, const char* sec, const char* key, uint32_t min, uint32_t max,
                        uint32_t& out) {
  if (!store.HasKey(sec, key))
    return true;
  auto v = store.FindInt(sec, key);
  if (!v.has_value() || v.value() < 0 || static_cast<uint32_t>(v.value()) < min ||
      static_cast<uint32_t>(v.value()) > max) {
    SHP_LOG_ERROR("Config", "[%s] %s = '%s' is invalid (expected %u..%u)", sec, key, store.GetString(sec, key), min,
                  max);
    return false;
  }
  out = static_cast<uint32_t>(v.value());
  return true;
}

inline bool OverlayPercent(const ConfigStore& store, const char* sec, const char* key, double& out) {
  if (!store.HasKey(sec, key))
    return true;
  auto v = store.FindDouble(sec, key);
  if (!v.has_value() || v.value() <= 0.0 || v.value() > 100.0) {
    SHP_LOG_ERROR("Config", "[%s] %s = '%s' is not a percentage in (0, 100]", sec, key, store.GetString(sec, key));
    return false;
  }
  out = v.value();
  return true;
}

inline bool OverlayMinutes(const ConfigStore& store, const char* key, uint64_t& out_ms) {
  uint32_t minutes = 0;
  if (!store.HasKey("timeouts", key))
    return true;
  if (!OverlayUint(store, "timeouts", key, 1U, 7U * 24U * 60U, minutes))
    return false;
  out_ms = static_cast<uint64_t>(minutes) * 60ULL * 1000ULL;
  return true;
}

}  // namespace detail

/**
 * @brief Overlay the keys present in @p store onto @p cfg.
 *
 * All-or-nothing: on error @p cfg is left untouched.
 *
 * @return kInvalidValue if any present key is malformed or out of range.
 */
inline expected<void, ConfigError> LoadSupervisorConfig(const ConfigStore& store, SupervisorConfig& cfg) {
  SupervisorConfig c = cfg;
  bool ok = true;

  ok = ok && detail::OverlayUint(store, "supervisor", "max_concurrent", 1U, kMaxSupervisedProcesses, c.max_concurrent);
  ok = ok && detail::OverlayPercent(store, "supervisor", "cpu_throttle_percent", c.cpu_throttle_percent);
  ok = ok && detail::OverlayUint(store, "supervisor", "sample_budget_ms", 1U, 10000U, c.sample_budget_ms);
  ok = ok && detail::OverlayUint(store, "supervisor", "sample_interval_ms", 0U, 3600000U, c.sample_interval_ms);
  ok = ok && detail::OverlayUint(store, "supervisor", "watchdog_poll_ms", 1U, 3600000U, c.watchdog_poll_ms);
  ok = ok && detail::OverlayUint(store, "supervisor", "grace_period_ms", 0U, 600000U, c.grace_period_ms);
  ok = ok && detail::OverlayUint(store, "supervisor", "capture_limit_bytes", 0U, 256U * 1024U * 1024U,
                                 c.capture_limit_bytes);
  c.detect_missing_components = store.GetBool("supervisor", "detect_missing_components", c.detect_missing_components);

  if (store.HasKey("supervisor", "library_path")) {
    c.environment.library_dirs.clear();
    std::string path = store.GetString("supervisor", "library_path");
    size_t start = 0;
    while (start <= path.size()) {
      size_t colon = path.find(':', start);
      if (colon == std::string::npos)
        colon = path.size();
      if (colon > start)
        c.environment.library_dirs.push_back(path.substr(start, colon - start));
      start = colon + 1;
    }
  }

  ok = ok && detail::OverlayMinutes(store, "installer_minutes", c.timeouts.installer_ms);
  ok = ok && detail::OverlayMinutes(store, "app_minutes", c.timeouts.app_ms);
  ok = ok && detail::OverlayMinutes(store, "generic_minutes", c.timeouts.generic_ms);

  c.janitor_enabled = store.GetBool("janitor", "enabled", c.janitor_enabled);
  ok = ok && detail::OverlayPercent(store, "janitor", "runaway_percent", c.janitor.runaway_percent);
  ok = ok && detail::OverlayPercent(store, "janitor", "hot_percent", c.janitor.hot_percent);
  ok = ok && detail::OverlayUint(store, "janitor", "sustained_sweeps", 1U, 1000U, c.janitor.sustained_sweeps);
  ok = ok && detail::OverlayUint(store, "janitor", "sweep_interval_ms", 100U, 3600000U, c.janitor.sweep_interval_ms);
  ok = ok && detail::OverlayUint(store, "janitor", "helper_limit", 1U, 1024U, c.janitor.helper_limit);
  uint32_t nice = static_cast<uint32_t>(c.janitor.nice_increment);
  ok = ok && detail::OverlayUint(store, "janitor", "nice_increment", 1U, 19U, nice);
  c.janitor.nice_increment = static_cast<int>(nice);
  c.janitor.suspend_throttle = store.GetBool("janitor", "suspend_throttle", c.janitor.suspend_throttle);

  if (!ok) {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (c.janitor.hot_percent >= c.janitor.runaway_percent) {
    SHP_LOG_ERROR("Config", "[janitor] hot_percent %.1f must be below runaway_percent %.1f", c.janitor.hot_percent,
                  c.janitor.runaway_percent);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }

  store.ForEachInSection("environment", [&c](const char* key, const char* value) {
    c.environment.fallbacks[key] = value;
  });

  cfg = c;
  return expected<void, ConfigError>::success();
}

}  // namespace shp

#endif  // SHP_SUPERVISOR_CONFIG_HPP_
