/**
 * @file timeout_classifier.hpp
 * @brief Pure mapping from executable name + role hint to a runtime budget.
 */

#ifndef SHP_TIMEOUT_CLASSIFIER_HPP_
#define SHP_TIMEOUT_CLASSIFIER_HPP_

#include "shp/process_registry.hpp"

#include <cstdint>
#include <cstring>

namespace shp {

/// Budgets per class, in milliseconds.
struct TimeoutPolicy {
  uint64_t installer_ms = 2ULL * 3600ULL * 1000ULL;
  uint64_t app_ms = 2ULL * 3600ULL * 1000ULL;
  uint64_t generic_ms = 30ULL * 60ULL * 1000ULL;
};

struct TimeoutClass {
  RoleHint role;
  uint64_t budget_ms;
};

namespace detail {

inline char ToLowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

/// Case-insensitive substring search.
inline bool ContainsNoCase(const char* hay, const char* needle) noexcept {
  const size_t n = std::strlen(needle);
  if (n == 0U)
    return true;
  for (; *hay != '\0'; ++hay) {
    size_t i = 0;
    while (i < n && hay[i] != '\0' && ToLowerAscii(hay[i]) == ToLowerAscii(needle[i]))
      ++i;
    if (i == n)
      return true;
  }
  return false;
}

inline bool EndsWithNoCase(const char* s, const char* suffix) noexcept {
  const size_t ls = std::strlen(s);
  const size_t lx = std::strlen(suffix);
  if (lx > ls)
    return false;
  for (size_t i = 0; i < lx; ++i) {
    if (ToLowerAscii(s[ls - lx + i]) != ToLowerAscii(suffix[i]))
      return false;
  }
  return true;
}

/// Last path component, accepting both '/' and '\\' separators.
inline const char* FileNamePart(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\')
      base = p + 1;
  }
  return base;
}

}  // namespace detail

/**
 * @brief Classify an executable.
 *
 * Rules, first match wins:
 *   1. Uninstaller names ("unins") always get the generic budget.
 *   2. An explicit Installer or InteractiveApp hint is honored.
 *   3. "setup" / "install" in the name: installer budget.
 *   4. Any other ".exe": application budget.
 *   5. Everything else: generic budget.
 *
 * Only the file-name part of @p executable_path is inspected.
 */
inline TimeoutClass ClassifyTimeout(const char* executable_path, RoleHint hint,
                                    const TimeoutPolicy& policy = TimeoutPolicy()) noexcept {
  const char* name = detail::FileNamePart(executable_path != nullptr ? executable_path : "");

  if (detail::ContainsNoCase(name, "unins")) {
    return TimeoutClass{RoleHint::kGeneric, policy.generic_ms};
  }
  if (hint == RoleHint::kInstaller) {
    return TimeoutClass{RoleHint::kInstaller, policy.installer_ms};
  }
  if (hint == RoleHint::kInteractiveApp) {
    return TimeoutClass{RoleHint::kInteractiveApp, policy.app_ms};
  }
  if (detail::ContainsNoCase(name, "setup") || detail::ContainsNoCase(name, "install")) {
    return TimeoutClass{RoleHint::kInstaller, policy.installer_ms};
  }
  if (detail::EndsWithNoCase(name, ".exe")) {
    return TimeoutClass{RoleHint::kInteractiveApp, policy.app_ms};
  }
  return TimeoutClass{RoleHint::kGeneric, policy.generic_ms};
}

}  // namespace shp

#endif  // SHP_TIMEOUT_CLASSIFIER_HPP_
