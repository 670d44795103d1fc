/**
 * @file log.hpp
 * @brief Lightweight printf-style logging with category tags.
 *
 * Synchronous: every enabled call formats onto the stack and hands one line
 * to the sink under a mutex, so lines from concurrent supervised-process
 * threads never interleave.
 *
 * Compile-time floor: SHP_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, default 0).
 * Runtime floor: shp::log::SetLevel().
 *
 * Usage:
 * @code
 *   SHP_LOG_INFO("Supervisor", "spawned pid=%d (%s)", pid, path);
 * @endcode
 */

#ifndef SHP_LOG_HPP_
#define SHP_LOG_HPP_

#include "shp/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <sys/time.h>

#ifndef SHP_LOG_MIN_LEVEL
#define SHP_LOG_MIN_LEVEL 0
#endif

namespace shp {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Sink invoked with one fully formatted line (no trailing newline).
 */
using SinkFn = void (*)(Level level, const char* line, void* ctx);

namespace detail {

struct LogContext {
  std::atomic<Level> level{Level::kInfo};
  std::atomic<bool> initialized{false};
  std::mutex mutex;
  SinkFn sink = nullptr;
  void* sink_ctx = nullptr;

  static LogContext& Instance() noexcept {
    static LogContext ctx;
    return ctx;
  }
};

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

}  // namespace detail

// ============================================================================
// Lifecycle / configuration
// ============================================================================

inline void Init(Level level = Level::kInfo) noexcept {
  auto& ctx = detail::LogContext::Instance();
  ctx.level.store(level, std::memory_order_relaxed);
  ctx.initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  auto& ctx = detail::LogContext::Instance();
  std::lock_guard<std::mutex> lock(ctx.mutex);
  (void)std::fflush(stderr);
  ctx.sink = nullptr;
  ctx.sink_ctx = nullptr;
  ctx.initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::LogContext::Instance().initialized.load(std::memory_order_acquire);
}

inline void SetLevel(Level level) noexcept {
  detail::LogContext::Instance().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogContext::Instance().level.load(std::memory_order_relaxed);
}

/// @brief Redirect output; nullptr restores the stderr sink.
inline void SetSink(SinkFn fn, void* ctx = nullptr) noexcept {
  auto& c = detail::LogContext::Instance();
  std::lock_guard<std::mutex> lock(c.mutex);
  c.sink = fn;
  c.sink_ctx = ctx;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file, int line, const char* fmt,
                       va_list args) noexcept {
  auto& ctx = detail::LogContext::Instance();
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(ctx.level.load(std::memory_order_relaxed))) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  const time_t secs = tv.tv_sec;
  localtime_r(&secs, &tm_buf);

  char out[768];
  (void)std::snprintf(out, sizeof(out), "[%04d-%02d-%02d %02d:%02d:%02d.%03ld] [%s] [%s] %s (%s:%d)",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min,
                      tm_buf.tm_sec, static_cast<long>(tv.tv_usec / 1000), detail::LevelTag(level),
                      category, msg, detail::Basename(file), line);

  std::lock_guard<std::mutex> lock(ctx.mutex);
  if (ctx.sink != nullptr) {
    ctx.sink(level, out, ctx.sink_ctx);
    return;
  }
  (void)std::fprintf(stderr, "%s\n", out);
  if (level >= Level::kError) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file, int line, const char* fmt,
                     ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace shp

// ============================================================================
// Macros
// ============================================================================

#define SHP_LOG_DEBUG(cat, fmt, ...)                                                               \
  do {                                                                                             \
    if (SHP_LOG_MIN_LEVEL <= 0) {                                                                  \
      ::shp::log::LogWrite(::shp::log::Level::kDebug, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                              \
  } while (0)

#define SHP_LOG_INFO(cat, fmt, ...)                                                               \
  do {                                                                                            \
    if (SHP_LOG_MIN_LEVEL <= 1) {                                                                 \
      ::shp::log::LogWrite(::shp::log::Level::kInfo, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                             \
  } while (0)

#define SHP_LOG_WARN(cat, fmt, ...)                                                               \
  do {                                                                                            \
    if (SHP_LOG_MIN_LEVEL <= 2) {                                                                 \
      ::shp::log::LogWrite(::shp::log::Level::kWarn, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                             \
  } while (0)

#define SHP_LOG_ERROR(cat, fmt, ...)                                                               \
  do {                                                                                             \
    if (SHP_LOG_MIN_LEVEL <= 3) {                                                                  \
      ::shp::log::LogWrite(::shp::log::Level::kError, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                              \
  } while (0)

#define SHP_LOG_FATAL(cat, fmt, ...)                                                             \
  do {                                                                                           \
    ::shp::log::LogWrite(::shp::log::Level::kFatal, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    std::abort();                                                                                \
  } while (0)

#endif  // SHP_LOG_HPP_
