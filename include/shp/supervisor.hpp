/**
 * @file supervisor.hpp
 * @brief Admission, spawn, output streaming, deadline enforcement and
 *        cleanup for compatibility-layer processes.
 *
 * Lifecycle of one request:
 *
 *   Pending --(CPU above threshold)--------------------> Denied (HighCpu)
 *   Pending --(registry at ceiling)--------------------> Denied (ConcurrencyCeiling)
 *   Pending --> Admitted --(spawn error)---------------> LaunchFailed (errno)
 *                        --> Running --(exit)-----------> Completed
 *                                    --(deadline)-------> TimedOut
 *                                    --(Cancel)---------> Cancelled
 *
 * Admission checks run before any process is spawned: first the CPU
 * sample, then the registry slot. Both denials are returned to the caller
 * and never retried here.
 *
 * Each running process gets one pump thread that polls the merged
 * stdout/stderr pipe, forwards every chunk to the caller's sink as it
 * arrives, and reaps the child with waitpid(WNOHANG). End of stream alone
 * never completes a launch; the reaped exit status does. Timeout, cancel,
 * janitor and emergency terminations converge on one idempotent path
 * (SIGTERM to the process group, SIGKILL after the grace period), and
 * completion returns the registry slot and the deadline slot exactly once.
 *
 * Usage:
 * @code
 *   shp::ProcessSupervisor sup(shp::SupervisorConfig{});
 *   shp::LaunchRequest req;
 *   req.executable_path = "/usr/bin/wine64";
 *   req.arguments = {"setup.exe"};
 *   auto r = sup.Launch(req, [](const char* d, size_t n) { fwrite(d, 1, n, stdout); });
 *   if (!r.has_value()) { ... r.get_error().code ... }
 * @endcode
 */

#ifndef SHP_SUPERVISOR_HPP_
#define SHP_SUPERVISOR_HPP_

#include "shp/deadline_watchdog.hpp"
#include "shp/environment.hpp"
#include "shp/janitor.hpp"
#include "shp/log.hpp"
#include "shp/output_scanner.hpp"
#include "shp/platform.hpp"
#include "shp/process.hpp"
#include "shp/process_registry.hpp"
#include "shp/resource_monitor.hpp"
#include "shp/supervisor_config.hpp"
#include "shp/timeout_classifier.hpp"
#include "shp/timer.hpp"
#include "shp/vocabulary.hpp"

#include <signal.h>
#include <sys/types.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace shp {

// ============================================================================
// Request / result types
// ============================================================================

struct LaunchRequest {
  std::string executable_path;
  std::vector<std::string> arguments;
  EnvMap environment;
  std::string working_directory;  ///< Empty: inherit the supervisor's cwd
  RoleHint role_hint = RoleHint::kGeneric;
};

enum class LaunchState : uint8_t {
  kPending = 0,
  kAdmitted,
  kRunning,
  kCompleted,
  kTimedOut,
  kCancelled,
  kDenied,
  kLaunchFailed,
};

inline const char* LaunchStateName(LaunchState s) noexcept {
  switch (s) {
    case LaunchState::kPending:
      return "pending";
    case LaunchState::kAdmitted:
      return "admitted";
    case LaunchState::kRunning:
      return "running";
    case LaunchState::kCompleted:
      return "completed";
    case LaunchState::kTimedOut:
      return "timed-out";
    case LaunchState::kCancelled:
      return "cancelled";
    case LaunchState::kDenied:
      return "denied";
    case LaunchState::kLaunchFailed:
      return "launch-failed";
    default:
      return "?";
  }
}

enum class SupervisorErrorCode : uint8_t {
  kHighCpu = 0,          ///< Admission denied: CPU above throttle threshold
  kConcurrencyCeiling,   ///< Admission denied: registry full
  kLaunchFailed,         ///< Spawn failed; sys_errno holds the cause
  kShuttingDown,         ///< Supervisor no longer accepts requests
};

struct SupervisorError {
  SupervisorErrorCode code;
  double cpu_percent;  ///< Sampled utilization (kHighCpu)
  int sys_errno;       ///< OS error (kLaunchFailed)

  static SupervisorError HighCpu(double cpu) noexcept { return SupervisorError{SupervisorErrorCode::kHighCpu, cpu, 0}; }
  static SupervisorError Ceiling() noexcept {
    return SupervisorError{SupervisorErrorCode::kConcurrencyCeiling, 0.0, 0};
  }
  static SupervisorError LaunchFailed(int err) noexcept {
    return SupervisorError{SupervisorErrorCode::kLaunchFailed, 0.0, err};
  }
  static SupervisorError ShuttingDown() noexcept {
    return SupervisorError{SupervisorErrorCode::kShuttingDown, 0.0, 0};
  }

  bool IsAdmissionDenied() const noexcept {
    return code == SupervisorErrorCode::kHighCpu || code == SupervisorErrorCode::kConcurrencyCeiling;
  }
};

inline const char* SupervisorErrorName(SupervisorErrorCode c) noexcept {
  switch (c) {
    case SupervisorErrorCode::kHighCpu:
      return "admission denied: high CPU";
    case SupervisorErrorCode::kConcurrencyCeiling:
      return "admission denied: concurrency ceiling";
    case SupervisorErrorCode::kLaunchFailed:
      return "launch failed";
    case SupervisorErrorCode::kShuttingDown:
      return "shutting down";
    default:
      return "?";
  }
}

struct ProcessResult {
  pid_t pid = -1;
  LaunchState state = LaunchState::kCompleted;
  int exit_code = -1;        ///< Valid when the child exited normally
  int term_signal = 0;       ///< Non-zero when the child died from a signal
  std::string captured_output;  ///< Tail of the stream, at most capture_limit_bytes
  uint64_t output_bytes = 0;    ///< Total bytes streamed to the sink
  bool output_truncated = false;
  bool terminated_by_timeout = false;
  bool terminated_by_resource_limit = false;
  bool cancelled = false;
  std::string missing_component;  ///< Empty unless a runtime marker was seen
  uint64_t runtime_ms = 0;
};

struct SupervisorStats {
  double cpu_percent = 0.0;
  double memory_percent = 0.0;
  bool cpu_valid = false;
  uint32_t active_process_count = 0;
};

struct CleanupReport {
  uint32_t handles_killed = 0;
  uint32_t family_killed = 0;
  uint32_t slots_cleared = 0;
};

/// Receives output chunks on the process's pump thread, in stream order.
using OutputSink = FixedFunction<void(const char* data, size_t len), 8 * sizeof(void*)>;

enum class TerminationReason : uint8_t {
  kNone = 0,
  kTimeout,
  kCancel,
  kResourceLimit,
  kEmergency,
};

class ProcessSupervisor;

// ============================================================================
// LaunchHandle
// ============================================================================

class LaunchHandle final {
 public:
  ~LaunchHandle() {
    if (pump_.joinable()) {
      if (pump_.get_id() == std::this_thread::get_id()) {
        pump_.detach();
      } else {
        pump_.join();
      }
    }
  }

  LaunchHandle(const LaunchHandle&) = delete;
  LaunchHandle& operator=(const LaunchHandle&) = delete;

  /// @brief Block until the process has exited and been accounted for.
  ProcessResult Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return done_; });
    return result_;
  }

  optional<ProcessResult> WaitFor(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return done_; })) {
      return {};
    }
    return optional<ProcessResult>{result_};
  }

  /// @brief Graceful terminate, escalating to SIGKILL after the grace period.
  void Cancel() { (void)RequestTermination(TerminationReason::kCancel, false); }

  pid_t Pid() const noexcept { return pid_; }
  LaunchState State() const noexcept { return static_cast<LaunchState>(state_.load(std::memory_order_acquire)); }
  bool Done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
  }
  const LaunchRequest& Request() const noexcept { return request_; }
  const TimeoutClass& Classification() const noexcept { return class_; }

 private:
  friend class ProcessSupervisor;

  LaunchHandle(const LaunchRequest& req, const TimeoutClass& cls, AdmissionToken token, OutputSink sink,
               const SupervisorConfig& cfg)
      : request_(req),
        class_(cls),
        token_(token),
        sink_(std::move(sink)),
        grace_ms_(cfg.grace_period_ms),
        capture_limit_(cfg.capture_limit_bytes),
        scan_(cfg.detect_missing_components) {}

  void SetState(LaunchState s) noexcept { state_.store(static_cast<uint8_t>(s), std::memory_order_release); }

  /**
   * @brief First caller wins the reason; a hard request always sends
   *        SIGKILL even when a graceful termination is already pending.
   * @return true if this call changed the termination state.
   */
  bool RequestTermination(TerminationReason reason, bool hard) {
    uint8_t expected_reason = static_cast<uint8_t>(TerminationReason::kNone);
    const bool first =
        reason_.compare_exchange_strong(expected_reason, static_cast<uint8_t>(reason), std::memory_order_acq_rel);
    if (!first && !hard) {
      return false;
    }
    kill_at_ms_.store(hard ? 0U : SteadyNowMs() + grace_ms_, std::memory_order_release);

    const int signo = hard ? SIGKILL : SIGTERM;
    ProcStatus st;
    {
      std::lock_guard<std::mutex> lock(proc_mutex_);
      st = proc_.Signal(signo);
    }
    if (st == ProcStatus::kSuccess) {
      SHP_LOG_INFO("Supervisor", "sent %s to pid=%d (%s)", hard ? "SIGKILL" : "SIGTERM", static_cast<int>(pid_),
                   request_.executable_path.c_str());
    } else if (st == ProcStatus::kFailed) {
      SHP_LOG_ERROR("Supervisor", "signal %d to pid=%d failed: %s", signo, static_cast<int>(pid_),
                    std::strerror(errno));
    }
    cv_.notify_all();
    return true;
  }

  /// Pump thread only.
  void EscalateIfDue() {
    if (killed_ || reason_.load(std::memory_order_acquire) == static_cast<uint8_t>(TerminationReason::kNone)) {
      return;
    }
    if (SteadyNowMs() < kill_at_ms_.load(std::memory_order_acquire)) {
      return;
    }
    killed_ = true;
    ProcStatus st;
    {
      std::lock_guard<std::mutex> lock(proc_mutex_);
      st = proc_.Signal(SIGKILL);
    }
    if (st == ProcStatus::kSuccess) {
      SHP_LOG_WARN("Supervisor", "pid=%d ignored SIGTERM for %u ms, sent SIGKILL", static_cast<int>(pid_), grace_ms_);
    }
  }

  /// Pump thread only.
  void Deliver(const char* data, size_t n) {
    output_bytes_ += n;
    if (scan_) {
      scanner_.Feed(data, n);
    }
    if (capture_limit_ > 0U) {
      captured_.append(data, n);
      // Amortized tail trim: cut back to the limit once 2x is reached.
      if (captured_.size() >= 2U * static_cast<size_t>(capture_limit_)) {
        captured_.erase(0, captured_.size() - capture_limit_);
        truncated_ = true;
      }
    } else {
      truncated_ = true;
    }
    if (sink_) {
      sink_(data, n);
    }
  }

  void Complete(const ProcessResult& r) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      result_ = r;
      done_ = true;
      SetState(r.state);
    }
    cv_.notify_all();
  }

  const LaunchRequest request_;
  const TimeoutClass class_;
  const AdmissionToken token_;
  OutputSink sink_;
  const uint32_t grace_ms_;
  const uint32_t capture_limit_;
  const bool scan_;

  Subprocess proc_;
  std::mutex proc_mutex_;  ///< Serializes signal delivery against reaping
  pid_t pid_ = -1;
  uint64_t started_at_ms_ = 0;
  WatchdogSlotId watchdog_id_;
  std::thread pump_;

  std::atomic<uint8_t> state_{static_cast<uint8_t>(LaunchState::kPending)};
  std::atomic<uint8_t> reason_{static_cast<uint8_t>(TerminationReason::kNone)};
  std::atomic<uint64_t> kill_at_ms_{0};
  bool killed_ = false;

  // Pump-thread-owned until Complete().
  std::string captured_;
  uint64_t output_bytes_ = 0;
  bool truncated_ = false;
  OutputScanner scanner_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool done_ = false;
  ProcessResult result_;
};

using LaunchHandlePtr = std::shared_ptr<LaunchHandle>;

// ============================================================================
// ProcessSupervisor
// ============================================================================

class ProcessSupervisor final {
 public:
  using Registry = ProcessRegistry<kMaxSupervisedProcesses>;
  using Watchdog = DeadlineWatchdog<kMaxSupervisedProcesses>;

  /**
   * @param cfg         Tunables (copied).
   * @param sampler     CPU source; nullptr selects ProcStatSampler.
   * @param enumerator  Janitor's process source; nullptr selects /proc.
   * @param controller  Janitor's signal sink; nullptr selects POSIX signals.
   *
   * Non-null collaborators are not owned and must outlive the supervisor.
   */
  explicit ProcessSupervisor(const SupervisorConfig& cfg, CpuSampler* sampler = nullptr,
                             ProcessEnumerator* enumerator = nullptr, ProcessController* controller = nullptr)
      : cfg_(Sanitize(cfg)),
        own_sampler_(sampler == nullptr ? new ProcStatSampler() : nullptr),
        own_enumerator_(enumerator == nullptr ? new ProcProcessEnumerator() : nullptr),
        own_controller_(controller == nullptr ? new PosixProcessController() : nullptr),
        monitor_(sampler != nullptr ? sampler : own_sampler_.get(), cfg_.cpu_throttle_percent, cfg_.sample_budget_ms),
        routed_(this, controller != nullptr ? controller : own_controller_.get()),
        janitor_(cfg_.janitor, enumerator != nullptr ? enumerator : own_enumerator_.get(), &routed_),
        timer_(4) {
    janitor_.SetOwnership(&ProcessSupervisor::IsSupervised, this);

    AddTimerTask(cfg_.watchdog_poll_ms, &Watchdog::CheckTick, &watchdog_, "deadline check");
    if (cfg_.janitor_enabled) {
      AddTimerTask(cfg_.janitor.sweep_interval_ms, &Janitor::SweepTick, &janitor_, "janitor sweep");
    }
    if (cfg_.sample_interval_ms > 0U) {
      AddTimerTask(cfg_.sample_interval_ms, &ResourceMonitor<>::SampleTick, &monitor_, "resource sampling");
    }
    auto started = timer_.Start();
    if (!started.has_value()) {
      SHP_LOG_ERROR("Supervisor", "timer scheduler failed to start (error=%d)", static_cast<int>(started.get_error()));
    }
    SHP_LOG_INFO("Supervisor", "ready: ceiling=%u cpu-threshold=%.1f%% poll=%u ms janitor=%s", cfg_.max_concurrent,
                 cfg_.cpu_throttle_percent, cfg_.watchdog_poll_ms, cfg_.janitor_enabled ? "on" : "off");
  }

  ~ProcessSupervisor() { Shutdown(); }

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  /**
   * @brief Admit and spawn a process, returning once it is running.
   *
   * @param req  Launch parameters (copied into the handle).
   * @param sink Optional per-chunk output callback, invoked on the pump
   *             thread.
   * @return Running handle, or HighCpu / ConcurrencyCeiling / LaunchFailed.
   */
  expected<LaunchHandlePtr, SupervisorError> Submit(const LaunchRequest& req, OutputSink sink = nullptr) {
    using R = expected<LaunchHandlePtr, SupervisorError>;
    if (shutting_down_.load(std::memory_order_acquire)) {
      return R::error(SupervisorError::ShuttingDown());
    }
    if (req.executable_path.empty()) {
      SHP_LOG_ERROR("Supervisor", "rejected request with empty executable path");
      return R::error(SupervisorError::LaunchFailed(EINVAL));
    }

    // -- Admission: CPU first, so a denied request never holds a slot --
    const ResourceSnapshot snap = monitor_.Sample();
    if (snap.valid && snap.cpu_percent > cfg_.cpu_throttle_percent) {
      SHP_LOG_WARN("Supervisor", "denied %s: CPU %.1f%% above %.1f%%", req.executable_path.c_str(), snap.cpu_percent,
                   cfg_.cpu_throttle_percent);
      return R::error(SupervisorError::HighCpu(snap.cpu_percent));
    }

    auto admit = registry_.TryAdmit(cfg_.max_concurrent);
    if (!admit.has_value()) {
      SHP_LOG_WARN("Supervisor", "denied %s: %u processes already running", req.executable_path.c_str(),
                   cfg_.max_concurrent);
      return R::error(SupervisorError::Ceiling());
    }
    const AdmissionToken token = admit.value();
    ScopeGuard release_slot([this, token]() { (void)registry_.Release(token); });

    // -- Classification --
    const TimeoutClass cls = ClassifyTimeout(ClassificationSubject(req), req.role_hint, cfg_.timeouts);
    LaunchHandlePtr h(new LaunchHandle(req, cls, token, std::move(sink), cfg_));
    h->SetState(LaunchState::kAdmitted);

    // -- Spawn --
    const EnvBlock env(BuildEnvironment(cfg_.environment, req.environment));
    std::vector<const char*> argv;
    argv.reserve(req.arguments.size() + 2U);
    argv.push_back(req.executable_path.c_str());
    for (const auto& a : req.arguments) {
      argv.push_back(a.c_str());
    }
    argv.push_back(nullptr);

    SubprocessConfig sc;
    sc.argv = argv.data();
    sc.envp = env.Data();
    sc.working_dir = req.working_directory.empty() ? nullptr : req.working_directory.c_str();
    sc.capture_output = true;
    sc.new_session = true;

    if (h->proc_.Start(sc) != ProcStatus::kSuccess) {
      const int err = h->proc_.StartErrno();
      h->SetState(LaunchState::kLaunchFailed);
      SHP_LOG_ERROR("Supervisor", "failed to launch %s: %s", req.executable_path.c_str(), std::strerror(err));
      return R::error(SupervisorError::LaunchFailed(err));
    }

    const uint64_t now = SteadyNowMs();
    h->pid_ = h->proc_.GetPid();
    h->started_at_ms_ = now;

    ActiveProcessHandle active;
    active.pid = h->pid_;
    active.started_at_ms = now;
    active.classification = cls.role;
    active.deadline_ms = now + cls.budget_ms;
    if (!registry_.Attach(token, active)) {
      // Emergency cleanup cleared the slot between admission and spawn.
      SHP_LOG_WARN("Supervisor", "slot for pid=%d was cleared before attach", static_cast<int>(h->pid_));
    }

    // Registered under mutex_ so OnDeadline always finds the handle.
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutting_down_.load(std::memory_order_acquire)) {
        h->SetState(LaunchState::kCancelled);
        return R::error(SupervisorError::ShuttingDown());  // ~Subprocess kills and reaps
      }
      auto wd = watchdog_.Register(detail::FileNamePart(req.executable_path.c_str()), h->pid_, cls.budget_ms,
                                   &ProcessSupervisor::OnDeadline, this);
      if (!wd.has_value()) {
        SHP_LOG_ERROR("Supervisor", "no deadline slot for pid=%d, killing it", static_cast<int>(h->pid_));
        h->SetState(LaunchState::kLaunchFailed);
        return R::error(SupervisorError::LaunchFailed(ENOSPC));  // ~Subprocess kills and reaps
      }
      h->watchdog_id_ = wd.value();
      handles_.push_back(h);
      h->SetState(LaunchState::kRunning);
      // Counted only once the thread exists; Pump's decrement also takes
      // mutex_, so it cannot run ahead of this increment.
      h->pump_ = std::thread(&ProcessSupervisor::Pump, this, h);
      ++active_pumps_;
    }
    release_slot.release();

    SHP_LOG_INFO("Supervisor", "launched %s pid=%d class=%s budget=%llu s", req.executable_path.c_str(),
                 static_cast<int>(h->pid_), RoleHintName(cls.role),
                 static_cast<unsigned long long>(cls.budget_ms / 1000U));
    return R::success(h);
  }

  /// @brief Submit() then Wait().
  expected<ProcessResult, SupervisorError> Launch(const LaunchRequest& req, OutputSink sink = nullptr) {
    auto h = Submit(req, std::move(sink));
    if (!h.has_value()) {
      return expected<ProcessResult, SupervisorError>::error(h.get_error());
    }
    return expected<ProcessResult, SupervisorError>::success(h.value()->Wait());
  }

  /// @brief Cancel a running launch by pid. @return false if not supervised.
  bool Cancel(pid_t pid) {
    LaunchHandlePtr h = FindByPid(pid);
    if (!h) {
      return false;
    }
    h->Cancel();
    return true;
  }

  SupervisorStats CurrentStats() {
    const ResourceSnapshot snap = monitor_.Sample();
    SupervisorStats s;
    s.cpu_percent = snap.cpu_percent;
    s.memory_percent = snap.memory_percent;
    s.cpu_valid = snap.valid;
    s.active_process_count = registry_.ActiveCount();
    return s;
  }

  ResourceStats HistoryStats() const { return monitor_.Stats(); }

  /**
   * @brief Panic recovery: SIGKILL every supervised process group, kill
   *        the remaining process family and clear the registry.
   */
  CleanupReport EmergencyCleanup() {
    CleanupReport rep;
    for (const LaunchHandlePtr& h : SnapshotHandles()) {
      if (h->RequestTermination(TerminationReason::kEmergency, true)) {
        ++rep.handles_killed;
      }
    }
    rep.family_killed = janitor_.EmergencyKillFamily();
    rep.slots_cleared = registry_.Clear();
    SHP_LOG_WARN("Supervisor", "emergency cleanup: %u supervised, %u family, %u slots cleared", rep.handles_killed,
                 rep.family_killed, rep.slots_cleared);
    return rep;
  }

  /// @brief Run one janitor sweep now (also scheduled when enabled).
  SweepReport SweepNow() { return janitor_.Sweep(); }

  void SetForeignClassifier(ForeignClassifierFn fn, void* ctx) { janitor_.SetForeignClassifier(fn, ctx); }

  /**
   * @brief Stop accepting requests, cancel running processes and wait for
   *        every pump thread to finish. Idempotent.
   */
  void Shutdown() {
    shutting_down_.store(true, std::memory_order_release);
    timer_.Stop();

    std::vector<LaunchHandlePtr> running = SnapshotHandles();
    for (const LaunchHandlePtr& h : running) {
      h->Cancel();
    }
    {
      std::unique_lock<std::mutex> lock(mutex_);
      pumps_cv_.wait(lock, [this] { return active_pumps_ == 0U; });
    }
  }

  uint32_t ActiveCount() const { return registry_.ActiveCount(); }
  const SupervisorConfig& Config() const noexcept { return cfg_; }
  const Registry& GetRegistry() const noexcept { return registry_; }
  const Watchdog& GetWatchdog() const noexcept { return watchdog_; }

 private:
  /// Routes janitor terminations of supervised pids through their handle.
  class RoutedController final : public ProcessController {
   public:
    RoutedController(ProcessSupervisor* sup, ProcessController* inner) : sup_(sup), inner_(inner) {}

    ProcStatus Terminate(pid_t pid) override {
      LaunchHandlePtr h = sup_->FindByPid(pid);
      if (h) {
        (void)h->RequestTermination(TerminationReason::kResourceLimit, false);
        return ProcStatus::kSuccess;
      }
      return inner_->Terminate(pid);
    }
    ProcStatus Kill(pid_t pid) override {
      LaunchHandlePtr h = sup_->FindByPid(pid);
      if (h) {
        (void)h->RequestTermination(TerminationReason::kEmergency, true);
        return ProcStatus::kSuccess;
      }
      return inner_->Kill(pid);
    }
    ProcStatus Renice(pid_t pid, int increment) override { return inner_->Renice(pid, increment); }
    ProcStatus Suspend(pid_t pid) override { return inner_->Suspend(pid); }
    ProcStatus Resume(pid_t pid) override { return inner_->Resume(pid); }

   private:
    ProcessSupervisor* sup_;
    ProcessController* inner_;
  };

  static constexpr uint32_t kPumpSliceMs = 20;
  static constexpr size_t kReadChunk = 8192;

  static SupervisorConfig Sanitize(const SupervisorConfig& in) {
    SupervisorConfig c = in;
    if (c.max_concurrent == 0U || c.max_concurrent > kMaxSupervisedProcesses) {
      SHP_LOG_WARN("Supervisor", "max_concurrent %u out of range, clamped", c.max_concurrent);
      c.max_concurrent = (c.max_concurrent == 0U) ? 1U : kMaxSupervisedProcesses;
    }
    if (c.watchdog_poll_ms == 0U) {
      c.watchdog_poll_ms = 30000U;
    }
    return c;
  }

  /// Bare loaders ("wine64 game.exe") are classified by their first .exe argument.
  static const char* ClassificationSubject(const LaunchRequest& req) {
    if (detail::EndsWithNoCase(req.executable_path.c_str(), ".exe")) {
      return req.executable_path.c_str();
    }
    for (const auto& a : req.arguments) {
      if (detail::EndsWithNoCase(a.c_str(), ".exe")) {
        return a.c_str();
      }
    }
    return req.executable_path.c_str();
  }

  void AddTimerTask(uint32_t period_ms, TimerTaskFn fn, void* ctx, const char* what) {
    auto r = timer_.Add(period_ms, fn, ctx);
    if (!r.has_value()) {
      SHP_LOG_ERROR("Supervisor", "cannot schedule %s (error=%d)", what, static_cast<int>(r.get_error()));
    }
  }

  static bool IsSupervised(pid_t pid, pid_t pgid, void* ctx) {
    auto* self = static_cast<ProcessSupervisor*>(ctx);
    return self->registry_.Contains(pid) || self->registry_.Contains(pgid);
  }

  static void OnDeadline(WatchdogSlotId id, pid_t pid, const char* name, void* ctx) {
    auto* self = static_cast<ProcessSupervisor*>(ctx);
    LaunchHandlePtr h;
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      for (const LaunchHandlePtr& c : self->handles_) {
        if (c->watchdog_id_ == id) {
          h = c;
          break;
        }
      }
    }
    if (!h) {
      return;  // completed between Check() and this callback
    }
    SHP_LOG_WARN("Supervisor", "%s (pid=%d) exceeded its %llu s budget", name, static_cast<int>(pid),
                 static_cast<unsigned long long>(h->class_.budget_ms / 1000U));
    (void)h->RequestTermination(TerminationReason::kTimeout, false);
  }

  LaunchHandlePtr FindByPid(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const LaunchHandlePtr& h : handles_) {
      if (h->pid_ == pid) {
        return h;
      }
    }
    return nullptr;
  }

  std::vector<LaunchHandlePtr> SnapshotHandles() {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_;
  }

  void RemoveHandle(const LaunchHandle* h) {
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.erase(std::remove_if(handles_.begin(), handles_.end(),
                                  [h](const LaunchHandlePtr& p) { return p.get() == h; }),
                   handles_.end());
  }

  /// @return true once the pipe reached EOF (or failed).
  static bool DrainOutput(LaunchHandle& h, char* buf, size_t size) {
    for (;;) {
      const ReadChunk rc = h.proc_.ReadOutput(buf, size);
      if (rc.bytes > 0) {
        h.Deliver(buf, static_cast<size_t>(rc.bytes));
        continue;
      }
      if (rc.error) {
        SHP_LOG_ERROR("Supervisor", "read from pid=%d failed: %s", static_cast<int>(h.pid_), std::strerror(errno));
      }
      return rc.eof || rc.error;
    }
  }

  void Pump(LaunchHandlePtr h) {
    char buf[kReadChunk];
    WaitResult wr;
    bool exited = false;
    bool eof = !h->proc_.HasOutput();

    while (!exited) {
      if (!eof) {
        (void)h->proc_.WaitReadable(kPumpSliceMs);
        eof = DrainOutput(*h, buf, sizeof(buf));
      } else {
        std::unique_lock<std::mutex> lock(h->mutex_);
        h->cv_.wait_for(lock, std::chrono::milliseconds(kPumpSliceMs));
      }
      {
        std::lock_guard<std::mutex> lock(h->proc_mutex_);
        exited = h->proc_.TryReap(wr);
      }
      if (!exited) {
        h->EscalateIfDue();
      }
    }

    // The exit status is authoritative; collect what is already buffered
    // without waiting on descendants that still hold the pipe.
    if (!eof) {
      (void)DrainOutput(*h, buf, sizeof(buf));
    }
    h->proc_.CloseOutput();
    Finish(h, wr);
  }

  void Finish(const LaunchHandlePtr& h, const WaitResult& wr) {
    auto wd = watchdog_.Unregister(h->watchdog_id_);
    if (!wd.has_value()) {
      SHP_LOG_DEBUG("Supervisor", "deadline slot for pid=%d already fired", static_cast<int>(h->pid_));
    }
    if (!registry_.Release(h->token_)) {
      SHP_LOG_DEBUG("Supervisor", "slot for pid=%d already cleared", static_cast<int>(h->pid_));
    }
    RemoveHandle(h.get());

    ProcessResult r;
    r.pid = h->pid_;
    r.exit_code = wr.exited ? wr.exit_code : -1;
    r.term_signal = wr.signaled ? wr.term_signal : 0;
    r.output_bytes = h->output_bytes_;
    r.output_truncated = h->truncated_;
    if (h->captured_.size() > h->capture_limit_) {
      h->captured_.erase(0, h->captured_.size() - h->capture_limit_);
      r.output_truncated = true;
    }
    r.captured_output.swap(h->captured_);
    const char* missing = h->scan_ ? h->scanner_.Detected() : nullptr;
    if (missing != nullptr) {
      r.missing_component = missing;
    }
    r.runtime_ms = SteadyNowMs() - h->started_at_ms_;

    switch (static_cast<TerminationReason>(h->reason_.load(std::memory_order_acquire))) {
      case TerminationReason::kTimeout:
        r.terminated_by_timeout = true;
        r.state = LaunchState::kTimedOut;
        break;
      case TerminationReason::kCancel:
        r.cancelled = true;
        r.state = LaunchState::kCancelled;
        break;
      case TerminationReason::kResourceLimit:
        r.terminated_by_resource_limit = true;
        r.state = LaunchState::kCompleted;
        break;
      case TerminationReason::kEmergency:
        r.terminated_by_resource_limit = true;
        r.cancelled = true;
        r.state = LaunchState::kCancelled;
        break;
      default:
        r.state = LaunchState::kCompleted;
        break;
    }

    if (r.term_signal != 0) {
      SHP_LOG_INFO("Supervisor", "pid=%d %s killed by signal %d after %llu ms (%s)", static_cast<int>(r.pid),
                   h->request_.executable_path.c_str(), r.term_signal, static_cast<unsigned long long>(r.runtime_ms),
                   LaunchStateName(r.state));
    } else {
      SHP_LOG_INFO("Supervisor", "pid=%d %s exited with %d after %llu ms", static_cast<int>(r.pid),
                   h->request_.executable_path.c_str(), r.exit_code, static_cast<unsigned long long>(r.runtime_ms));
    }
    if (!r.missing_component.empty()) {
      SHP_LOG_WARN("Supervisor", "pid=%d output suggests missing component '%s'", static_cast<int>(r.pid),
                   r.missing_component.c_str());
    }

    h->Complete(r);

    std::lock_guard<std::mutex> lock(mutex_);
    --active_pumps_;
    pumps_cv_.notify_all();
  }

  const SupervisorConfig cfg_;
  std::unique_ptr<CpuSampler> own_sampler_;
  std::unique_ptr<ProcessEnumerator> own_enumerator_;
  std::unique_ptr<ProcessController> own_controller_;

  ResourceMonitor<> monitor_;
  Registry registry_;
  Watchdog watchdog_;
  RoutedController routed_;
  Janitor janitor_;

  std::atomic<bool> shutting_down_{false};
  std::mutex mutex_;
  std::condition_variable pumps_cv_;
  std::vector<LaunchHandlePtr> handles_;
  uint32_t active_pumps_ = 0;

  TimerScheduler timer_;  ///< Last member: stopped and destroyed first
};

}  // namespace shp

#endif  // SHP_SUPERVISOR_HPP_
