/**
 * @file resource_monitor.hpp
 * @brief Bounded-time system CPU / memory sampling for admission control.
 *
 * CPU utilization comes from a pluggable CpuSampler so the supervisor's
 * admission logic can be tested with a fixed value:
 *   - ProcStatSampler   : delta of /proc/stat jiffies (default).
 *   - CommandCpuSampler : runs an introspection command (top) with a
 *                         bounded wait and parses the idle percentage.
 *
 * Sample() never fails. A sampler error or overrun yields cpu_percent 0.0
 * with valid == false and a log line; callers treat that as "unknown,
 * assume permissive", never as a guarantee of idle CPU.
 *
 * Typical usage:
 *
 *   shp::ProcStatSampler sampler;
 *   shp::ResourceMonitor<> monitor(&sampler, 90.0, 1000);
 *   shp::ResourceSnapshot snap = monitor.Sample();
 */

#ifndef SHP_RESOURCE_MONITOR_HPP_
#define SHP_RESOURCE_MONITOR_HPP_

#include "shp/log.hpp"
#include "shp/platform.hpp"
#include "shp/process.hpp"
#include "shp/vocabulary.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>

namespace shp {

// ============================================================================
// Snapshots
// ============================================================================

struct ResourceSnapshot {
  double cpu_percent = 0.0;     ///< System-wide CPU utilization (0-100)
  double memory_percent = 0.0;  ///< Used / total physical memory (0-100)
  uint64_t sampled_at_ms = 0;   ///< Monotonic timestamp (SteadyNowMs)
  bool valid = false;           ///< false: CPU figure is a permissive default
};

/// Aggregates over the monitor's bounded history.
struct ResourceStats {
  double avg_cpu_percent = 0.0;
  double max_cpu_percent = 0.0;
  double avg_memory_percent = 0.0;
  double max_memory_percent = 0.0;
  uint32_t samples = 0;
};

// ============================================================================
// CpuSampler interface
// ============================================================================

class CpuSampler {
 public:
  virtual ~CpuSampler() = default;

  /**
   * @brief Measure system-wide CPU utilization.
   *
   * Implementations must return within budget_ms. ResourceMonitor does not
   * interrupt a sampler; it only discards a late value, so admission waits
   * for as long as the sampler runs.
   *
   * @param budget_ms Upper bound on the time spent measuring.
   * @return Percentage in [0, 100], or empty on failure.
   */
  virtual optional<double> SampleCpuPercent(uint32_t budget_ms) = 0;

  virtual const char* Name() const = 0;
};

namespace detail {

inline double ClampPercent(double v) noexcept {
  if (v < 0.0)
    return 0.0;
  return (v > 100.0) ? 100.0 : v;
}

struct CpuJiffies {
  uint64_t total = 0;
  uint64_t idle = 0;  ///< idle + iowait
};

inline bool ReadCpuJiffies(CpuJiffies& out) {
  char buf[256];
  if (ReadProcFile("/proc/stat", buf, sizeof(buf)) <= 0)
    return false;

  uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
  const int parsed = std::sscanf(
      buf, "cpu %" SCNu64 " %" SCNu64 " %" SCNu64 " %" SCNu64 " %" SCNu64 " %" SCNu64 " %" SCNu64 " %" SCNu64,
      &user, &nice, &system, &idle, &iowait, &irq, &softirq, &steal);
  if (parsed < 4)
    return false;

  out.total = user + nice + system + idle + iowait + irq + softirq + steal;
  out.idle = idle + iowait;
  return true;
}

}  // namespace detail

// ============================================================================
// ReadMemoryPercent - /proc/meminfo
// ============================================================================

/// @return Used memory percentage, or -1.0 if /proc/meminfo is unreadable.
inline double ReadMemoryPercent() {
  char buf[512];
  if (detail::ReadProcFile("/proc/meminfo", buf, sizeof(buf)) <= 0)
    return -1.0;

  uint64_t total_kb = 0;
  uint64_t available_kb = 0;
  bool found_total = false;
  bool found_available = false;
  const char* line = buf;
  while (*line != '\0' && (!found_total || !found_available)) {
    if (std::strncmp(line, "MemTotal:", 9) == 0) {
      found_total = std::sscanf(line + 9, " %" SCNu64, &total_kb) == 1;
    } else if (std::strncmp(line, "MemAvailable:", 13) == 0) {
      found_available = std::sscanf(line + 13, " %" SCNu64, &available_kb) == 1;
    }
    while (*line != '\0' && *line != '\n')
      ++line;
    if (*line == '\n')
      ++line;
  }

  if (!found_total || !found_available || total_kb == 0 || available_kb > total_kb)
    return -1.0;
  return detail::ClampPercent(static_cast<double>(total_kb - available_kb) * 100.0 / static_cast<double>(total_kb));
}

// ============================================================================
// ProcStatSampler
// ============================================================================

/**
 * @brief CPU utilization from two /proc/stat readings.
 *
 * The readings are at least kWindowMs apart: a recent baseline is reused
 * and only the rest of the window is slept, capped at half the budget.
 * A window too short to show any jiffy movement never reads as 0% idle
 * CPU; it yields the last computed figure, or failure when there is none.
 */
class ProcStatSampler final : public CpuSampler {
 public:
  static constexpr uint32_t kWindowMs = 100;
  static constexpr uint64_t kMaxBaselineAgeMs = 2000;

  optional<double> SampleCpuPercent(uint32_t budget_ms) override {
    std::lock_guard<std::mutex> lock(mutex_);

    const uint64_t now = SteadyNowMs();
    if (!has_baseline_ || now - baseline_at_ms_ > kMaxBaselineAgeMs) {
      if (!detail::ReadCpuJiffies(prev_))
        return {};
      baseline_at_ms_ = now;
      has_baseline_ = true;
    }

    const uint64_t age = SteadyNowMs() - baseline_at_ms_;
    if (age < kWindowMs) {
      uint64_t wait = kWindowMs - age;
      if (wait > budget_ms / 2U)
        wait = budget_ms / 2U;
      if (wait > 0U)
        detail::SleepMs(static_cast<uint32_t>(wait));
    }

    detail::CpuJiffies curr;
    if (!detail::ReadCpuJiffies(curr))
      return {};
    if (curr.total <= prev_.total) {
      // Baseline kept so the next call measures a longer window.
      if (has_last_)
        return optional<double>{last_percent_};
      return {};
    }

    const uint64_t total_delta = curr.total - prev_.total;
    const uint64_t idle_delta = (curr.idle > prev_.idle) ? curr.idle - prev_.idle : 0U;
    const uint64_t busy = (idle_delta > total_delta) ? 0U : total_delta - idle_delta;
    prev_ = curr;
    baseline_at_ms_ = SteadyNowMs();
    last_percent_ = detail::ClampPercent(static_cast<double>(busy) * 100.0 / static_cast<double>(total_delta));
    has_last_ = true;
    return optional<double>{last_percent_};
  }

  const char* Name() const override { return "proc-stat"; }

 private:
  std::mutex mutex_;
  detail::CpuJiffies prev_;
  uint64_t baseline_at_ms_ = 0;
  bool has_baseline_ = false;
  double last_percent_ = 0.0;
  bool has_last_ = false;
};

// ============================================================================
// CommandCpuSampler
// ============================================================================

/**
 * @brief Extract utilization from introspection-tool text.
 *
 * Looks for the idle figure on a CPU summary line, in either of
 *   "%Cpu(s):  3.1 us,  1.0 sy,  0.0 ni, 95.4 id, ..."
 *   "CPU usage: 12.34% user, 5.67% sys, 81.99% idle"
 * and returns 100 - idle.
 */
inline optional<double> ParseCpuSummary(const char* text) {
  const char* line = text;
  while (*line != '\0') {
    const char* eol = std::strchr(line, '\n');
    const size_t len = (eol != nullptr) ? static_cast<size_t>(eol - line) : std::strlen(line);
    std::string l(line, len);

    if (l.find("Cpu") != std::string::npos || l.find("CPU") != std::string::npos) {
      // Walk comma/colon separated fields: "<number>[%] <label>"
      size_t pos = 0;
      while (pos < l.size()) {
        size_t end = l.find_first_of(",:", pos);
        if (end == std::string::npos)
          end = l.size();
        const std::string field = l.substr(pos, end - pos);
        char* num_end = nullptr;
        const double value = std::strtod(field.c_str(), &num_end);
        if (num_end != field.c_str()) {
          const char* label = num_end;
          while (*label == '%' || *label == ' ')
            ++label;
          if (std::strncmp(label, "id", 2) == 0) {
            return optional<double>{detail::ClampPercent(100.0 - value)};
          }
        }
        pos = end + 1;
      }
    }
    if (eol == nullptr)
      break;
    line = eol + 1;
  }
  return {};
}

/// @brief Runs an external command (default: "top -bn1") and parses it.
class CommandCpuSampler final : public CpuSampler {
 public:
  CommandCpuSampler() : argv_{"top", "-bn1", nullptr, nullptr, nullptr} {}

  /// @param argv NULL-terminated, at most 4 entries plus terminator.
  explicit CommandCpuSampler(const char* const* argv) : argv_{} {
    for (uint32_t i = 0; i < kMaxArgs && argv != nullptr && argv[i] != nullptr; ++i)
      argv_[i] = argv[i];
  }

  optional<double> SampleCpuPercent(uint32_t budget_ms) override {
    std::string output;
    int exit_code = -1;
    const ProcStatus st = RunCommand(argv_, output, exit_code, budget_ms);
    if (st != ProcStatus::kSuccess) {
      SHP_LOG_DEBUG("Monitor", "%s did not complete (status=%d)", argv_[0], static_cast<int>(st));
      return {};
    }
    if (exit_code != 0)
      return {};
    return ParseCpuSummary(output.c_str());
  }

  const char* Name() const override { return argv_[0]; }

 private:
  static constexpr uint32_t kMaxArgs = 4;
  const char* argv_[kMaxArgs + 1];
};

// ============================================================================
// ResourceMonitor
// ============================================================================

/**
 * @brief Snapshot provider with a bounded history.
 *
 * Thread-safe: concurrent Sample() calls are allowed (the sampler is
 * responsible for its own serialization).
 *
 * @tparam HistoryLen Number of snapshots kept for Stats().
 */
template <uint32_t HistoryLen = 30>
class ResourceMonitor final {
  static_assert(HistoryLen > 0, "HistoryLen must be > 0");

 public:
  /**
   * @param sampler        CPU source (not owned, must outlive the monitor).
   * @param cpu_threshold  Percentage above which a crossing is logged.
   * @param budget_ms      Upper bound for a single Sample().
   */
  ResourceMonitor(CpuSampler* sampler, double cpu_threshold = 90.0, uint32_t budget_ms = 1000)
      : sampler_(sampler), cpu_threshold_(cpu_threshold), budget_ms_(budget_ms) {}

  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;

  ResourceSnapshot Sample() {
    ResourceSnapshot snap;
    const uint64_t start = SteadyNowMs();

    optional<double> cpu;
    if (sampler_ != nullptr) {
      cpu = sampler_->SampleCpuPercent(budget_ms_);
    }
    const uint64_t elapsed = SteadyNowMs() - start;

    if (!cpu.has_value()) {
      SHP_LOG_WARN("Monitor", "CPU sampling via %s failed, assuming permissive 0%%",
                   sampler_ != nullptr ? sampler_->Name() : "(none)");
    } else if (elapsed > budget_ms_) {
      SHP_LOG_WARN("Monitor", "CPU sampling took %" PRIu64 " ms (budget %u ms), discarded", elapsed, budget_ms_);
    } else {
      snap.cpu_percent = detail::ClampPercent(cpu.value());
      snap.valid = true;
    }

    const double mem = ReadMemoryPercent();
    snap.memory_percent = (mem < 0.0) ? 0.0 : mem;
    snap.sampled_at_ms = SteadyNowMs();

    Record(snap);
    return snap;
  }

  ResourceSnapshot LastSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
  }

  ResourceStats Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ResourceStats s;
    s.samples = count_;
    if (count_ == 0U)
      return s;
    double cpu_sum = 0.0;
    double mem_sum = 0.0;
    for (uint32_t i = 0; i < count_; ++i) {
      const ResourceSnapshot& h = history_[i];
      cpu_sum += h.cpu_percent;
      mem_sum += h.memory_percent;
      if (h.cpu_percent > s.max_cpu_percent)
        s.max_cpu_percent = h.cpu_percent;
      if (h.memory_percent > s.max_memory_percent)
        s.max_memory_percent = h.memory_percent;
    }
    s.avg_cpu_percent = cpu_sum / count_;
    s.avg_memory_percent = mem_sum / count_;
    return s;
  }

  double CpuThreshold() const noexcept { return cpu_threshold_; }
  uint32_t BudgetMs() const noexcept { return budget_ms_; }

  /**
   * @brief Static callback for TimerScheduler integration.
   *
   * Usage:
   *   timer.Add(2000, &shp::ResourceMonitor<>::SampleTick, &monitor);
   */
  static void SampleTick(void* ctx) {
    if (ctx != nullptr) {
      (void)static_cast<ResourceMonitor*>(ctx)->Sample();
    }
  }

 private:
  CpuSampler* sampler_;
  double cpu_threshold_;
  uint32_t budget_ms_;

  mutable std::mutex mutex_;
  ResourceSnapshot history_[HistoryLen];
  ResourceSnapshot last_;
  uint32_t head_ = 0;
  uint32_t count_ = 0;
  bool above_ = false;

  void Record(const ResourceSnapshot& snap) {
    bool crossed = false;
    bool exceeded = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_ = snap;
      history_[head_] = snap;
      head_ = (head_ + 1U) % HistoryLen;
      if (count_ < HistoryLen)
        ++count_;

      // Invalid samples do not move the crossing state.
      if (snap.valid) {
        exceeded = snap.cpu_percent > cpu_threshold_;
        crossed = exceeded != above_;
        above_ = exceeded;
      }
    }
    if (crossed) {
      SHP_LOG_WARN("Monitor", "CPU usage %s threshold: %.1f%% (limit %.1f%%)", exceeded ? "exceeded" : "below",
                   snap.cpu_percent, cpu_threshold_);
    }
  }
};

}  // namespace shp

#endif  // SHP_RESOURCE_MONITOR_HPP_
