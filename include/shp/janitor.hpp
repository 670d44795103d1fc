/**
 * @file janitor.hpp
 * @brief Periodic sweep over the supervised process family.
 *
 * Independent of any single launch, Sweep() enumerates processes whose
 * name matches the family markers, measures their CPU usage and applies
 * graduated responses:
 *   - runaway (>= runaway_percent for sustained_sweeps consecutive sweeps):
 *     SIGTERM
 *   - hot (>= hot_percent): priority reduction (renice), or a brief
 *     SIGSTOP/SIGCONT cycle when suspend_throttle is set; once per pid
 *   - family count above helper_limit: non-essential helpers
 *     (winedevice, plugplay, services) are terminated
 *
 * A process is acted on only when the ownership callback reports it as
 * supervised, or when the caller's foreign classifier approves it. Without
 * a classifier, unknown processes are skipped and counted.
 *
 * Process enumeration and control sit behind ProcessEnumerator and
 * ProcessController so the policy can be tested with fakes.
 */

#ifndef SHP_JANITOR_HPP_
#define SHP_JANITOR_HPP_

#include "shp/log.hpp"
#include "shp/platform.hpp"
#include "shp/process.hpp"
#include "shp/timeout_classifier.hpp"
#include "shp/vocabulary.hpp"

#include <signal.h>
#include <unistd.h>

#include <cstdint>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace shp {

// ============================================================================
// Policy / report
// ============================================================================

struct JanitorPolicy {
  double runaway_percent = 95.0;
  double hot_percent = 70.0;
  uint32_t sustained_sweeps = 2;
  uint32_t sweep_interval_ms = 5000;
  uint32_t helper_limit = 8;
  int nice_increment = 10;
  bool suspend_throttle = false;
  uint32_t suspend_ms = 100;
  std::vector<std::string> family_markers{"wine", "wineserver", "wine64", "winedevice",
                                          "gptk", "game-porting-toolkit", ".exe"};
  std::vector<std::string> helper_markers{"winedevice", "plugplay", "services"};
};

struct SweepReport {
  uint32_t enumerated = 0;          ///< Family members seen
  uint32_t throttled = 0;
  uint32_t terminated = 0;          ///< Runaway terminations
  uint32_t helpers_terminated = 0;  ///< Helper-limit terminations
  uint32_t skipped_unknown = 0;     ///< Family members neither owned nor approved
};

// ============================================================================
// Seams
// ============================================================================

struct ProcessUsage {
  ProcessEntry entry;
  double cpu_percent = 0.0;  ///< Since the previous enumeration (0 when first seen)
};

class ProcessEnumerator {
 public:
  virtual ~ProcessEnumerator() = default;
  /// @return false if the process table could not be read.
  virtual bool Snapshot(std::vector<ProcessUsage>& out) = 0;
};

class ProcessController {
 public:
  virtual ~ProcessController() = default;
  virtual ProcStatus Terminate(pid_t pid) = 0;
  virtual ProcStatus Kill(pid_t pid) = 0;
  virtual ProcStatus Renice(pid_t pid, int increment) = 0;
  virtual ProcStatus Suspend(pid_t pid) = 0;
  virtual ProcStatus Resume(pid_t pid) = 0;
};

/// Reads /proc; per-process CPU% is the tick delta over wall time between calls.
class ProcProcessEnumerator final : public ProcessEnumerator {
 public:
  bool Snapshot(std::vector<ProcessUsage>& out) override {
    out.clear();
    const uint64_t now_ms = SteadyNowMs();
    const double elapsed_s = (prev_at_ms_ == 0U) ? 0.0 : static_cast<double>(now_ms - prev_at_ms_) / 1000.0;
    const long ticks_per_s = sysconf(_SC_CLK_TCK);

    std::map<pid_t, uint64_t> ticks;
    const int32_t visited = ForEachProcess([&](const ProcessEntry& pe) {
      ProcessUsage u;
      u.entry = pe;
      auto it = prev_ticks_.find(pe.pid);
      if (it != prev_ticks_.end() && elapsed_s > 0.0 && ticks_per_s > 0 && pe.cpu_ticks >= it->second) {
        u.cpu_percent = static_cast<double>(pe.cpu_ticks - it->second) * 100.0 /
                        (elapsed_s * static_cast<double>(ticks_per_s));
      }
      ticks[pe.pid] = pe.cpu_ticks;
      out.push_back(u);
    });
    if (visited < 0) {
      return false;
    }
    prev_ticks_.swap(ticks);
    prev_at_ms_ = now_ms;
    return true;
  }

 private:
  std::map<pid_t, uint64_t> prev_ticks_;
  uint64_t prev_at_ms_ = 0;
};

class PosixProcessController final : public ProcessController {
 public:
  ProcStatus Terminate(pid_t pid) override { return SignalProcess(pid, SIGTERM); }
  ProcStatus Kill(pid_t pid) override { return KillProcess(pid); }
  ProcStatus Renice(pid_t pid, int increment) override { return ReniceProcess(pid, increment); }
  ProcStatus Suspend(pid_t pid) override { return FreezeProcess(pid); }
  ProcStatus Resume(pid_t pid) override { return ResumeProcess(pid); }
};

// ============================================================================
// Janitor
// ============================================================================

/// @return true if @p pid (or its process group @p pgid) is supervised.
using OwnershipFn = bool (*)(pid_t pid, pid_t pgid, void* ctx);

/// @return true if the caller approves acting on an unsupervised process.
using ForeignClassifierFn = bool (*)(const ProcessEntry& entry, void* ctx);

class Janitor final {
 public:
  Janitor(const JanitorPolicy& policy, ProcessEnumerator* enumerator, ProcessController* controller)
      : policy_(policy), enumerator_(enumerator), controller_(controller) {}

  Janitor(const Janitor&) = delete;
  Janitor& operator=(const Janitor&) = delete;

  void SetOwnership(OwnershipFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    owner_fn_ = fn;
    owner_ctx_ = ctx;
  }

  void SetForeignClassifier(ForeignClassifierFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    foreign_fn_ = fn;
    foreign_ctx_ = ctx;
  }

  bool IsFamilyMember(const ProcessEntry& e) const {
    for (const auto& m : policy_.family_markers) {
      if (detail::ContainsNoCase(e.comm.c_str(), m.c_str()) || detail::ContainsNoCase(e.exe_name.c_str(), m.c_str()))
        return true;
    }
    return false;
  }

  SweepReport Sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    SweepReport report;

    std::vector<ProcessUsage> procs;
    if (!enumerator_->Snapshot(procs)) {
      SHP_LOG_WARN("Janitor", "process enumeration failed, sweep skipped");
      return report;
    }

    const pid_t self = getpid();
    std::vector<const ProcessUsage*> approved;
    std::set<pid_t> seen;
    for (const ProcessUsage& u : procs) {
      if (u.entry.pid == self || !IsFamilyMember(u.entry)) {
        continue;
      }
      ++report.enumerated;
      if (!IsApprovedLocked(u.entry)) {
        ++report.skipped_unknown;
        continue;
      }
      approved.push_back(&u);
      seen.insert(u.entry.pid);
    }

    std::set<pid_t> terminated;
    for (const ProcessUsage* u : approved) {
      const pid_t pid = u->entry.pid;
      if (u->cpu_percent >= policy_.runaway_percent) {
        const uint32_t streak = ++runaway_streak_[pid];
        if (streak >= policy_.sustained_sweeps) {
          if (controller_->Terminate(pid) == ProcStatus::kSuccess) {
            SHP_LOG_WARN("Janitor", "terminated runaway %s (pid=%d, %.1f%% CPU over %u sweeps)",
                         u->entry.comm.c_str(), static_cast<int>(pid), u->cpu_percent, streak);
            ++report.terminated;
            terminated.insert(pid);
          }
          runaway_streak_.erase(pid);
          continue;
        }
      } else {
        runaway_streak_.erase(pid);
      }

      if (u->cpu_percent >= policy_.hot_percent && throttled_.count(pid) == 0U) {
        if (Throttle(pid)) {
          SHP_LOG_INFO("Janitor", "throttled %s (pid=%d, %.1f%% CPU)", u->entry.comm.c_str(), static_cast<int>(pid),
                       u->cpu_percent);
          throttled_.insert(pid);
          ++report.throttled;
        }
      }
    }

    if (report.enumerated > policy_.helper_limit) {
      for (const ProcessUsage* u : approved) {
        if (terminated.count(u->entry.pid) != 0U || !IsHelper(u->entry)) {
          continue;
        }
        if (controller_->Terminate(u->entry.pid) == ProcStatus::kSuccess) {
          SHP_LOG_INFO("Janitor", "terminated helper %s (pid=%d), family size %u > %u", u->entry.comm.c_str(),
                       static_cast<int>(u->entry.pid), report.enumerated, policy_.helper_limit);
          ++report.helpers_terminated;
        }
      }
    }

    Prune(seen);

    if (report.throttled + report.terminated + report.helpers_terminated > 0U) {
      SHP_LOG_INFO("Janitor", "sweep: %u family, %u throttled, %u terminated, %u helpers, %u skipped", report.enumerated,
                   report.throttled, report.terminated, report.helpers_terminated, report.skipped_unknown);
    }
    return report;
  }

  /**
   * @brief SIGKILL every family member. With a foreign classifier set,
   *        unsupervised members are killed only if it approves them.
   * @return Number of processes signalled.
   */
  uint32_t EmergencyKillFamily() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProcessUsage> procs;
    if (!enumerator_->Snapshot(procs)) {
      SHP_LOG_ERROR("Janitor", "process enumeration failed during emergency cleanup");
      return 0;
    }
    const pid_t self = getpid();
    uint32_t killed = 0;
    for (const ProcessUsage& u : procs) {
      if (u.entry.pid == self || !IsFamilyMember(u.entry)) {
        continue;
      }
      if (foreign_fn_ != nullptr && !IsApprovedLocked(u.entry)) {
        continue;
      }
      if (controller_->Kill(u.entry.pid) == ProcStatus::kSuccess) {
        ++killed;
      }
    }
    runaway_streak_.clear();
    throttled_.clear();
    SHP_LOG_WARN("Janitor", "emergency: killed %u family processes", killed);
    return killed;
  }

  /**
   * @brief Static callback for TimerScheduler integration.
   *
   * Usage:
   *   timer.Add(policy.sweep_interval_ms, &shp::Janitor::SweepTick, &janitor);
   */
  static void SweepTick(void* ctx) {
    SHP_ASSERT(ctx != nullptr);
    (void)static_cast<Janitor*>(ctx)->Sweep();
  }

  const JanitorPolicy& Policy() const noexcept { return policy_; }

 private:
  JanitorPolicy policy_;
  ProcessEnumerator* enumerator_;
  ProcessController* controller_;

  std::mutex mutex_;
  OwnershipFn owner_fn_ = nullptr;
  void* owner_ctx_ = nullptr;
  ForeignClassifierFn foreign_fn_ = nullptr;
  void* foreign_ctx_ = nullptr;
  std::map<pid_t, uint32_t> runaway_streak_;
  std::set<pid_t> throttled_;

  bool IsApprovedLocked(const ProcessEntry& e) const {
    if (owner_fn_ != nullptr && owner_fn_(e.pid, e.pgid, owner_ctx_)) {
      return true;
    }
    return foreign_fn_ != nullptr && foreign_fn_(e, foreign_ctx_);
  }

  bool IsHelper(const ProcessEntry& e) const {
    for (const auto& m : policy_.helper_markers) {
      if (detail::ContainsNoCase(e.comm.c_str(), m.c_str()) || detail::ContainsNoCase(e.exe_name.c_str(), m.c_str()))
        return true;
    }
    return false;
  }

  bool Throttle(pid_t pid) {
    if (!policy_.suspend_throttle) {
      return controller_->Renice(pid, policy_.nice_increment) == ProcStatus::kSuccess;
    }
    if (controller_->Suspend(pid) != ProcStatus::kSuccess) {
      return false;
    }
    detail::SleepMs(policy_.suspend_ms);
    if (controller_->Resume(pid) != ProcStatus::kSuccess) {
      SHP_LOG_ERROR("Janitor", "pid=%d left stopped: SIGCONT failed", static_cast<int>(pid));
      return false;
    }
    return true;
  }

  void Prune(const std::set<pid_t>& seen) {
    for (auto it = runaway_streak_.begin(); it != runaway_streak_.end();) {
      it = (seen.count(it->first) == 0U) ? runaway_streak_.erase(it) : std::next(it);
    }
    for (auto it = throttled_.begin(); it != throttled_.end();) {
      it = (seen.count(*it) == 0U) ? throttled_.erase(it) : std::next(it);
    }
  }
};

}  // namespace shp

#endif  // SHP_JANITOR_HPP_
