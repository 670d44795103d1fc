/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file deadline_watchdog.hpp
 * @brief Per-process runtime deadline monitor.
 *
 * Each admitted process owns exactly one slot holding its absolute
 * deadline. Check() is polled at a fixed interval through CheckTick on a
 * TimerScheduler; a slot whose deadline has elapsed fires
 * its expiry callback exactly once. Unregister() on normal exit cancels the
 * slot so the callback never runs.
 *
 * Design:
 * - Fixed-capacity slot array guarded by a mutex.
 * - Callbacks executed outside the mutex (collect-release-execute).
 * - Slot ids carry a generation counter, so a stale id from a finished
 *   process can never cancel the slot's next occupant.
 *
 * Typical usage:
 *
 *   shp::DeadlineWatchdog<16> wd;
 *   auto r = wd.Register("setup.exe", pid, 2 * 3600 * 1000, &OnExpire, ctx);
 *   timer.Add(30000, &shp::DeadlineWatchdog<16>::CheckTick, &wd);
 *   // ... process exits normally:
 *   wd.Unregister(r.value());
 */

#ifndef SHP_DEADLINE_WATCHDOG_HPP_
#define SHP_DEADLINE_WATCHDOG_HPP_

#include "shp/log.hpp"
#include "shp/platform.hpp"
#include "shp/vocabulary.hpp"

#include <sys/types.h>

#include <cstdint>
#include <mutex>

namespace shp {

struct WatchdogSlotIdTag {};
/// Low 8 bits: slot index. Upper bits: generation.
using WatchdogSlotId = NewType<uint32_t, WatchdogSlotIdTag>;

enum class WatchdogError : uint8_t {
  kSlotsFull = 0,    ///< All deadline slots are occupied.
  kInvalidTimeout,   ///< Budget is zero.
  kNotRegistered,    ///< Slot id unknown, stale, or already fired/removed.
};

/// Diagnostic snapshot of one armed slot.
struct WatchdogSlotInfo {
  WatchdogSlotId id;
  const char* name;       ///< Points into the slot, valid during the visit only
  pid_t pid;
  uint64_t budget_ms;
  uint64_t remaining_ms;  ///< 0 once the deadline has elapsed
  bool expired;
};

/**
 * @brief Expiry callback.
 *
 * @param id   Slot that expired.
 * @param pid  Process registered with the slot.
 * @param name Process name (valid for the duration of the call).
 * @param ctx  Context given to Register().
 */
using DeadlineExpiredFn = void (*)(WatchdogSlotId id, pid_t pid, const char* name, void* ctx);

template <uint32_t MaxSlots = 32>
class DeadlineWatchdog final {
  static_assert(MaxSlots > 0 && MaxSlots <= 256, "MaxSlots must be in 1..256");

 public:
  DeadlineWatchdog() noexcept = default;
  ~DeadlineWatchdog() = default;

  DeadlineWatchdog(const DeadlineWatchdog&) = delete;
  DeadlineWatchdog& operator=(const DeadlineWatchdog&) = delete;
  DeadlineWatchdog(DeadlineWatchdog&&) = delete;
  DeadlineWatchdog& operator=(DeadlineWatchdog&&) = delete;

  /**
   * @brief Arm a deadline @p budget_ms from now.
   *
   * @param name       Process name (truncated to 47 chars).
   * @param pid        Process the deadline belongs to.
   * @param budget_ms  Runtime budget in milliseconds (must be > 0).
   * @param on_expire  Invoked once, outside the lock, when the budget elapses.
   * @param ctx        Forwarded to @p on_expire.
   */
  expected<WatchdogSlotId, WatchdogError> Register(const char* name, pid_t pid, uint64_t budget_ms,
                                                   DeadlineExpiredFn on_expire, void* ctx = nullptr) {
    if (budget_ms == 0U) {
      return expected<WatchdogSlotId, WatchdogError>::error(WatchdogError::kInvalidTimeout);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < MaxSlots; ++i) {
      Slot& s = slots_[i];
      if (s.armed) {
        continue;
      }
      ++s.generation;
      s.name.assign(TruncateToCapacity, name);
      s.pid = pid;
      s.budget_ms = budget_ms;
      s.deadline_ms = SteadyNowMs() + budget_ms;
      s.on_expire = on_expire;
      s.ctx = ctx;
      s.armed = true;
      return expected<WatchdogSlotId, WatchdogError>::success(MakeId(i, s.generation));
    }
    SHP_LOG_WARN("Watchdog", "no free deadline slot for %s (pid=%d)", name, static_cast<int>(pid));
    return expected<WatchdogSlotId, WatchdogError>::error(WatchdogError::kSlotsFull);
  }

  /**
   * @brief Cancel a deadline. Fails with kNotRegistered if the slot already
   *        fired, was removed, or was reused since @p id was issued.
   */
  expected<void, WatchdogError> Unregister(WatchdogSlotId id) {
    const uint32_t idx = id.value() & 0xFFU;
    if (idx >= MaxSlots) {
      return expected<void, WatchdogError>::error(WatchdogError::kNotRegistered);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& s = slots_[idx];
    if (!s.armed || MakeId(idx, s.generation) != id) {
      return expected<void, WatchdogError>::error(WatchdogError::kNotRegistered);
    }
    s.armed = false;
    return expected<void, WatchdogError>::success();
  }

  /**
   * @brief Fire every elapsed deadline once.
   * @return Number of callbacks fired by this call.
   */
  uint32_t Check() {
    struct Pending {
      DeadlineExpiredFn fn;
      WatchdogSlotId id;
      pid_t pid;
      FixedString<47> name;
      void* ctx;
    };

    Pending pending[MaxSlots];
    uint32_t count = 0U;
    const uint64_t now = SteadyNowMs();

    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (uint32_t i = 0U; i < MaxSlots; ++i) {
        Slot& s = slots_[i];
        if (!s.armed || now < s.deadline_ms) {
          continue;
        }
        // Disarm before firing: the callback runs at most once per slot.
        s.armed = false;
        if (s.on_expire != nullptr) {
          pending[count].fn = s.on_expire;
          pending[count].id = MakeId(i, s.generation);
          pending[count].pid = s.pid;
          pending[count].name = s.name;
          pending[count].ctx = s.ctx;
          ++count;
        }
      }
    }

    for (uint32_t i = 0U; i < count; ++i) {
      SHP_LOG_WARN("Watchdog", "deadline elapsed for %s (pid=%d)", pending[i].name.c_str(),
                   static_cast<int>(pending[i].pid));
      pending[i].fn(pending[i].id, pending[i].pid, pending[i].name.c_str(), pending[i].ctx);
    }
    return count;
  }

  uint32_t ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < MaxSlots; ++i) {
      if (slots_[i].armed) {
        ++count;
      }
    }
    return count;
  }

  static constexpr uint32_t Capacity() noexcept { return MaxSlots; }

  /// Callback signature: void(const WatchdogSlotInfo&). Runs under the lock.
  template <typename Fn>
  void ForEachSlot(Fn&& fn) const {
    const uint64_t now = SteadyNowMs();
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < MaxSlots; ++i) {
      const Slot& s = slots_[i];
      if (!s.armed) {
        continue;
      }
      WatchdogSlotInfo info{};
      info.id = MakeId(i, s.generation);
      info.name = s.name.c_str();
      info.pid = s.pid;
      info.budget_ms = s.budget_ms;
      info.expired = now >= s.deadline_ms;
      info.remaining_ms = info.expired ? 0U : (s.deadline_ms - now);
      fn(static_cast<const WatchdogSlotInfo&>(info));
    }
  }

  /**
   * @brief Static callback for TimerScheduler integration.
   *
   * Usage:
   *   timer.Add(30000, &shp::DeadlineWatchdog<32>::CheckTick, &wd);
   */
  static void CheckTick(void* ctx) {
    SHP_ASSERT(ctx != nullptr);
    static_cast<DeadlineWatchdog*>(ctx)->Check();
  }

 private:
  struct Slot {
    FixedString<47> name;
    pid_t pid{-1};
    uint64_t budget_ms{0};
    uint64_t deadline_ms{0};
    DeadlineExpiredFn on_expire{nullptr};
    void* ctx{nullptr};
    uint32_t generation{0};
    bool armed{false};
  };

  static WatchdogSlotId MakeId(uint32_t idx, uint32_t generation) noexcept {
    return WatchdogSlotId((generation << 8) | idx);
  }

  Slot slots_[MaxSlots]{};
  mutable std::mutex mutex_;
};

}  // namespace shp

#endif  // SHP_DEADLINE_WATCHDOG_HPP_
