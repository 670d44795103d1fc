/**
 * @file platform.hpp
 * @brief Platform detection, monotonic clocks, and assertion macros.
 */

#ifndef SHP_PLATFORM_HPP_
#define SHP_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace shp {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define SHP_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SHP_PLATFORM_MACOS 1
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "SHP_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define SHP_ASSERT(cond) ((void)0)
#else
#define SHP_ASSERT(cond) \
  ((cond) ? ((void)0) : ::shp::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Monotonic Clock Helpers
// ============================================================================

/// @brief Monotonic time in nanoseconds (steady_clock).
inline uint64_t SteadyNowNs() noexcept {
  const auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count());
}

/// @brief Monotonic time in milliseconds (steady_clock).
inline uint64_t SteadyNowMs() noexcept {
  return SteadyNowNs() / 1000000ULL;
}

// ============================================================================
// Macro Helpers
// ============================================================================

#define SHP_CONCAT_IMPL(a, b) a##b
#define SHP_CONCAT(a, b) SHP_CONCAT_IMPL(a, b)

}  // namespace shp

#endif  // SHP_PLATFORM_HPP_
