/**
 * @file process_registry.hpp
 * @brief Concurrency accounting for supervised processes.
 *
 * The registry is the single source of truth for how many supervised
 * processes are active. Admission and release are linearizable: both run
 * under one mutex, so two concurrent TryAdmit() calls can never both take
 * the last free slot. Release() is idempotent; a token that was already
 * released (or cleared by emergency cleanup) is a no-op.
 */

#ifndef SHP_PROCESS_REGISTRY_HPP_
#define SHP_PROCESS_REGISTRY_HPP_

#include "shp/log.hpp"
#include "shp/platform.hpp"
#include "shp/vocabulary.hpp"

#include <sys/types.h>

#include <cstdint>
#include <mutex>

namespace shp {

enum class RoleHint : uint8_t {
  kInstaller = 0,
  kInteractiveApp,
  kGeneric,
};

inline const char* RoleHintName(RoleHint r) noexcept {
  switch (r) {
    case RoleHint::kInstaller:
      return "installer";
    case RoleHint::kInteractiveApp:
      return "app";
    case RoleHint::kGeneric:
      return "generic";
    default:
      return "?";
  }
}

enum class AdmissionError : uint8_t {
  kCeilingReached = 0,  ///< Active count already at the requested ceiling
  kInvalidCeiling,      ///< Ceiling is zero or exceeds registry capacity
};

struct AdmissionTokenTag {};
/// Never reused: each successful TryAdmit() issues a fresh value.
using AdmissionToken = NewType<uint64_t, AdmissionTokenTag>;

/// Bookkeeping for one running process. Owned by the registry.
struct ActiveProcessHandle {
  pid_t pid = -1;
  uint64_t started_at_ms = 0;
  RoleHint classification = RoleHint::kGeneric;
  uint64_t deadline_ms = 0;  ///< Absolute monotonic deadline
};

/**
 * @brief Fixed-capacity, mutex-guarded slot table.
 *
 * @tparam MaxSlots Hard capacity; any per-call ceiling must be <= MaxSlots.
 */
template <uint32_t MaxSlots = 16>
class ProcessRegistry final {
  static_assert(MaxSlots > 0, "MaxSlots must be > 0");

 public:
  ProcessRegistry() = default;

  ProcessRegistry(const ProcessRegistry&) = delete;
  ProcessRegistry& operator=(const ProcessRegistry&) = delete;

  /**
   * @brief Take a slot if fewer than @p max_concurrent are in use.
   */
  expected<AdmissionToken, AdmissionError> TryAdmit(uint32_t max_concurrent) {
    if (max_concurrent == 0U || max_concurrent > MaxSlots) {
      return expected<AdmissionToken, AdmissionError>::error(AdmissionError::kInvalidCeiling);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ >= max_concurrent) {
      return expected<AdmissionToken, AdmissionError>::error(AdmissionError::kCeilingReached);
    }
    for (uint32_t i = 0; i < MaxSlots; ++i) {
      Slot& s = slots_[i];
      if (s.in_use) {
        continue;
      }
      s.in_use = true;
      s.token = next_token_++;
      s.handle = ActiveProcessHandle();
      ++count_;
      SHP_LOG_DEBUG("Registry", "admitted token=%llu (%u/%u active)", static_cast<unsigned long long>(s.token),
                    count_, max_concurrent);
      return expected<AdmissionToken, AdmissionError>::success(AdmissionToken(s.token));
    }
    // count_ < max_concurrent <= MaxSlots guarantees a free slot.
    SHP_LOG_FATAL("Registry", "slot table inconsistent (count=%u)", count_);
  }

  /**
   * @brief Bind the spawned process to its admission slot.
   * @return false if the token was already released.
   */
  bool Attach(AdmissionToken token, const ActiveProcessHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* s = FindLocked(token);
    if (s == nullptr) {
      return false;
    }
    s->handle = handle;
    return true;
  }

  /**
   * @brief Return a slot. Idempotent.
   * @return true if this call freed the slot, false if it was already free.
   */
  bool Release(AdmissionToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* s = FindLocked(token);
    if (s == nullptr) {
      return false;
    }
    s->in_use = false;
    s->handle = ActiveProcessHandle();
    if (count_ > 0U) {
      --count_;
    }
    SHP_LOG_DEBUG("Registry", "released token=%llu (%u active)", static_cast<unsigned long long>(token.value()),
                  count_);
    return true;
  }

  uint32_t ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
  }

  bool Contains(pid_t pid) const {
    if (pid <= 0) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0; i < MaxSlots; ++i) {
      if (slots_[i].in_use && slots_[i].handle.pid == pid) {
        return true;
      }
    }
    return false;
  }

  /// Callback signature: void(AdmissionToken, const ActiveProcessHandle&).
  /// Runs under the registry lock; keep it short and do not re-enter.
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0; i < MaxSlots; ++i) {
      if (slots_[i].in_use) {
        fn(AdmissionToken(slots_[i].token), static_cast<const ActiveProcessHandle&>(slots_[i].handle));
      }
    }
  }

  /**
   * @brief Drop every slot (emergency cleanup). Outstanding tokens become
   *        stale, so their later Release() is a no-op.
   * @return Number of slots cleared.
   */
  uint32_t Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t cleared = count_;
    for (uint32_t i = 0; i < MaxSlots; ++i) {
      slots_[i].in_use = false;
      slots_[i].handle = ActiveProcessHandle();
    }
    count_ = 0;
    return cleared;
  }

  static constexpr uint32_t Capacity() noexcept { return MaxSlots; }

 private:
  struct Slot {
    uint64_t token = 0;
    ActiveProcessHandle handle;
    bool in_use = false;
  };

  Slot* FindLocked(AdmissionToken token) {
    for (uint32_t i = 0; i < MaxSlots; ++i) {
      if (slots_[i].in_use && slots_[i].token == token.value()) {
        return &slots_[i];
      }
    }
    return nullptr;
  }

  Slot slots_[MaxSlots];
  uint64_t next_token_ = 1;
  uint32_t count_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace shp

#endif  // SHP_PROCESS_REGISTRY_HPP_
