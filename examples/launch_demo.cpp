/**
 * @file launch_demo.cpp
 * @brief Launch one program under the supervisor and report the outcome.
 *
 * Shows: config loading (INI / JSON / YAML by extension), admission,
 * live output streaming, deadline classification, result reporting.
 *
 * Build: cmake -DSHP_BUILD_EXAMPLES=ON ..
 * Run:   ./launch_demo [-c shepherd.ini|shepherd.yaml] /usr/bin/wine64 setup.exe
 */

#include "shp/config.hpp"
#include "shp/log.hpp"
#include "shp/supervisor.hpp"
#include "shp/supervisor_config.hpp"

#include <cstdio>
#include <cstring>
#include <string>

static void PrintUsage(const char* prog) {
  std::fprintf(stderr, "usage: %s [-c config] [--installer|--app] <executable> [args...]\n", prog);
}

/// Returns false if a config was named but could not be applied.
static bool LoadConfig(const char* path, shp::SupervisorConfig& cfg) {
  if (path == nullptr)
    return true;
#if defined(SHP_CONFIG_INI_ENABLED) || defined(SHP_CONFIG_JSON_ENABLED) || defined(SHP_CONFIG_YAML_ENABLED)
  shp::MultiConfig store;
  auto loaded = store.LoadFile(path);
  if (!loaded.has_value()) {
    SHP_LOG_ERROR("Demo", "cannot load %s (error=%d)", path, static_cast<int>(loaded.get_error()));
    return false;
  }
  return shp::LoadSupervisorConfig(store, cfg).has_value();
#else
  SHP_LOG_ERROR("Demo", "no config backend enabled, ignoring %s", path);
  return false;
#endif
}

int main(int argc, char* argv[]) {
  shp::log::Init(shp::log::Level::kInfo);

  const char* config_path = nullptr;
  shp::LaunchRequest req;
  int i = 1;
  for (; i < argc; ++i) {
    if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--installer") == 0) {
      req.role_hint = shp::RoleHint::kInstaller;
    } else if (std::strcmp(argv[i], "--app") == 0) {
      req.role_hint = shp::RoleHint::kInteractiveApp;
    } else {
      break;
    }
  }
  if (i >= argc) {
    PrintUsage(argv[0]);
    return 2;
  }
  req.executable_path = argv[i];
  for (++i; i < argc; ++i) {
    req.arguments.emplace_back(argv[i]);
  }

  shp::SupervisorConfig cfg;
  if (!LoadConfig(config_path, cfg)) {
    return 2;
  }

  shp::ProcessSupervisor sup(cfg);
  auto stats = sup.CurrentStats();
  std::printf("CPU %.1f%%%s, memory %.1f%%, %u active\n", stats.cpu_percent, stats.cpu_valid ? "" : " (unknown)",
              stats.memory_percent, stats.active_process_count);

  auto result = sup.Launch(req, [](const char* data, size_t len) { (void)std::fwrite(data, 1, len, stdout); });
  if (!result.has_value()) {
    const shp::SupervisorError& err = result.get_error();
    std::fprintf(stderr, "%s", shp::SupervisorErrorName(err.code));
    if (err.code == shp::SupervisorErrorCode::kHighCpu) {
      std::fprintf(stderr, " (%.1f%%)", err.cpu_percent);
    } else if (err.code == shp::SupervisorErrorCode::kLaunchFailed) {
      std::fprintf(stderr, ": %s", std::strerror(err.sys_errno));
    }
    std::fprintf(stderr, "\n");
    return err.IsAdmissionDenied() ? 75 : 1;
  }

  const shp::ProcessResult& r = result.value();
  std::printf("\n--- pid %d %s", static_cast<int>(r.pid), shp::LaunchStateName(r.state));
  if (r.term_signal != 0) {
    std::printf(", signal %d", r.term_signal);
  } else {
    std::printf(", exit %d", r.exit_code);
  }
  std::printf(", %llu ms, %llu bytes%s\n", static_cast<unsigned long long>(r.runtime_ms),
              static_cast<unsigned long long>(r.output_bytes), r.output_truncated ? " (capture truncated)" : "");
  if (r.terminated_by_timeout)
    std::printf("    terminated: deadline exceeded\n");
  if (r.terminated_by_resource_limit)
    std::printf("    terminated: resource limit\n");
  if (!r.missing_component.empty())
    std::printf("    missing component: %s\n", r.missing_component.c_str());

  return (r.state == shp::LaunchState::kCompleted && r.exit_code == 0) ? 0 : 1;
}
