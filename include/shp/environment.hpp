/**
 * @file environment.hpp
 * @brief Child environment construction for supervised launches.
 *
 * Layering, lowest to highest precedence:
 *   1. supervisor fallbacks (display, audio latency, DLL overrides)
 *   2. the supervisor's own environment (when inherit_parent is set)
 *   3. the caller's LaunchRequest environment
 *   4. supervisor-enforced keys (debug-output suppression)
 * Library directories are then prepended to LD_LIBRARY_PATH, keeping
 * whatever value the lower layers produced.
 */

#ifndef SHP_ENVIRONMENT_HPP_
#define SHP_ENVIRONMENT_HPP_

#include <unistd.h>

#include <cstring>
#include <map>
#include <string>
#include <vector>

namespace shp {

using EnvMap = std::map<std::string, std::string>;

struct EnvironmentPolicy {
  EnvMap fallbacks;
  EnvMap enforced;
  std::vector<std::string> library_dirs;
  bool inherit_parent = true;

  static EnvironmentPolicy Default() {
    EnvironmentPolicy p;
    p.fallbacks["DISPLAY"] = ":0";
    p.fallbacks["PULSE_LATENCY_MSEC"] = "60";
    p.fallbacks["WINEDLLOVERRIDES"] = "winemenubuilder.exe=d";
    p.fallbacks["WINEESYNC"] = "1";
    p.fallbacks["DXVK_ASYNC"] = "1";
    p.enforced["WINEDEBUG"] = "-all";
    p.enforced["DXVK_LOG_LEVEL"] = "none";
    p.enforced["MTL_DEBUG_LAYER"] = "0";
    return p;
  }
};

/// @brief Parse a NULL-terminated "K=V" array (e.g. environ) into a map.
inline EnvMap ParseEnvBlock(const char* const* envp) {
  EnvMap out;
  if (envp == nullptr)
    return out;
  for (; *envp != nullptr; ++envp) {
    const char* eq = std::strchr(*envp, '=');
    if (eq == nullptr || eq == *envp)
      continue;
    out[std::string(*envp, static_cast<size_t>(eq - *envp))] = std::string(eq + 1);
  }
  return out;
}

/**
 * @brief Merge the layers described above.
 *
 * @param parent_envp Parent block; nullptr means the process environ.
 */
inline EnvMap BuildEnvironment(const EnvironmentPolicy& policy, const EnvMap& caller,
                               const char* const* parent_envp = nullptr) {
  EnvMap env = policy.fallbacks;

  if (policy.inherit_parent) {
    const EnvMap parent = ParseEnvBlock(parent_envp != nullptr ? parent_envp : environ);
    for (const auto& kv : parent)
      env[kv.first] = kv.second;
  }
  for (const auto& kv : caller)
    env[kv.first] = kv.second;
  for (const auto& kv : policy.enforced)
    env[kv.first] = kv.second;

  if (!policy.library_dirs.empty()) {
    std::string path;
    for (const auto& dir : policy.library_dirs) {
      if (dir.empty())
        continue;
      if (!path.empty())
        path += ':';
      path += dir;
    }
    auto it = env.find("LD_LIBRARY_PATH");
    if (it != env.end() && !it->second.empty()) {
      path += ':';
      path += it->second;
    }
    if (!path.empty())
      env["LD_LIBRARY_PATH"] = path;
  }
  return env;
}

/**
 * @brief Owns a NULL-terminated envp array built from an EnvMap.
 *
 * Data() stays valid for the lifetime of the block.
 */
class EnvBlock final {
 public:
  explicit EnvBlock(const EnvMap& env) {
    strings_.reserve(env.size());
    for (const auto& kv : env)
      strings_.push_back(kv.first + "=" + kv.second);
    ptrs_.reserve(strings_.size() + 1U);
    for (const auto& s : strings_)
      ptrs_.push_back(s.c_str());
    ptrs_.push_back(nullptr);
  }

  EnvBlock(const EnvBlock&) = delete;
  EnvBlock& operator=(const EnvBlock&) = delete;

  const char* const* Data() const noexcept { return ptrs_.data(); }
  size_t Size() const noexcept { return strings_.size(); }

 private:
  std::vector<std::string> strings_;
  std::vector<const char*> ptrs_;
};

}  // namespace shp

#endif  // SHP_ENVIRONMENT_HPP_
