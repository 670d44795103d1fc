/**
 * @file timer.hpp
 * @brief Header-only periodic task scheduler.
 *
 * A single background thread fires registered callbacks at fixed periods.
 * Drives the deadline watchdog's Check(), the janitor's sweeps and the
 * resource monitor's background sampling.
 *
 * Callbacks are collected under the lock and invoked after it is released,
 * so a callback may itself call Add()/Remove(). Stop() wakes the loop
 * immediately instead of waiting out the current sleep.
 */

#ifndef SHP_TIMER_HPP_
#define SHP_TIMER_HPP_

#include "shp/platform.hpp"
#include "shp/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace shp {

/**
 * @brief Plain function pointer invoked by the scheduler on each period tick.
 *
 * @param ctx  User-supplied opaque context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

/**
 * @brief Fixed-capacity periodic scheduler driven by a background thread.
 *
 * Typical usage:
 *
 *   shp::TimerScheduler sched(8);
 *   sched.Add(30000, &shp::DeadlineWatchdog<>::CheckTick, &wd);
 *   sched.Start();
 *   // ...
 *   sched.Stop();
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 16) : slots_(new TaskSlot[max_tasks]), max_tasks_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  /**
   * @brief Register a periodic task.
   *
   * @param period_ms  Firing period in milliseconds (must be > 0).
   * @param fn         Callback invoked every period_ms milliseconds.
   * @param ctx        Opaque context pointer forwarded to fn.
   *
   * @return TimerTaskId, or kInvalidPeriod / kSlotsFull.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn, void* ctx = nullptr) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (!slots_[i].active) {
        const uint64_t period_ns = static_cast<uint64_t>(period_ms) * 1000000ULL;
        slots_[i].fn = fn;
        slots_[i].ctx = ctx;
        slots_[i].period_ns = period_ns;
        slots_[i].next_fire_ns = SteadyNowNs() + period_ns;
        slots_[i].id = next_id_++;
        slots_[i].active = true;
        cv_.notify_all();
        return expected<TimerTaskId, TimerError>::success(TimerTaskId(slots_[i].id));
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /**
   * @brief Remove a task. A firing already collected by the loop may still
   *        run once after this returns.
   *
   * @return Success, or kNotRunning if @p task_id is unknown.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active && slots_[i].id == task_id.value()) {
        slots_[i].active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  expected<void, TimerError> Start() {
    bool expected_state = false;
    if (!running_.compare_exchange_strong(expected_state, true, std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /// @brief Stop the scheduler thread and join it. Safe when not running.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active) {
        ++count;
      }
    }
    return count;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ns = 0;
    uint64_t next_fire_ns = 0;  ///< Absolute monotonic deadline
    uint32_t id = 0;
    bool active = false;
  };

  struct Due {
    TimerTaskFn fn;
    void* ctx;
  };

  std::unique_ptr<TaskSlot[]> slots_;
  uint32_t max_tasks_;
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;

  void ScheduleLoop() {
    std::unique_ptr<Due[]> due(new Due[max_tasks_]);

    while (running_.load(std::memory_order_acquire)) {
      uint32_t due_count = 0U;
      uint64_t next_wake = UINT64_MAX;

      {
        std::unique_lock<std::mutex> lock(mutex_);
        const uint64_t now = SteadyNowNs();
        for (uint32_t i = 0U; i < max_tasks_; ++i) {
          TaskSlot& s = slots_[i];
          if (!s.active) {
            continue;
          }
          if (now >= s.next_fire_ns) {
            due[due_count++] = Due{s.fn, s.ctx};
            // Skip missed periods instead of firing a burst.
            while (s.next_fire_ns <= now) {
              s.next_fire_ns += s.period_ns;
            }
          }
          if (s.next_fire_ns < next_wake) {
            next_wake = s.next_fire_ns;
          }
        }

        if (due_count == 0U) {
          if (next_wake == UINT64_MAX) {
            cv_.wait(lock, [this] { return !running_.load(std::memory_order_acquire) || AnyActiveLocked(); });
          } else {
            const uint64_t wait_ns = (next_wake > now) ? (next_wake - now) : 0U;
            cv_.wait_for(lock, std::chrono::nanoseconds(wait_ns));
          }
          continue;
        }
      }

      for (uint32_t i = 0U; i < due_count; ++i) {
        due[i].fn(due[i].ctx);
      }
    }
  }

  bool AnyActiveLocked() const {
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace shp

#endif  // SHP_TIMER_HPP_
