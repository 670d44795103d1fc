/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, NewType, FixedString,
 *        FixedFunction, ScopeGuard.
 *
 * Header-only, no exceptions thrown on any path. All fallible shepherd
 * operations return expected<V, E> with an enum (or small POD) error.
 */

#ifndef SHP_VOCABULARY_HPP_
#define SHP_VOCABULARY_HPP_

#include "shp/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace shp {

// ============================================================================
// Shared error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class TimerError : uint8_t {
  kSlotsFull = 0,
  kInvalidPeriod,
  kNotRunning,
  kAlreadyRunning,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * Construct through the static factories success() / error().
 */
template <typename V, typename E>
class expected final {
 public:
  template <typename... Args>
  static expected success(Args&&... args) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.value)) V(std::forward<Args>(args)...);
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) {
    expected r;
    r.storage_.err = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value)) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    SHP_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    SHP_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    SHP_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    SHP_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(V fallback) const { return has_value_ ? storage_.value : fallback; }

 private:
  expected() noexcept : has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
      has_value_ = false;
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    SHP_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

/// @brief Chain a fallible step onto a successful result.
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using R = decltype(fn(r.value()));
  if (!r.has_value()) {
    return R::error(r.get_error());
  }
  return fn(r.value());
}

/// @brief Invoke @p fn with the error when @p r failed.
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) { ::new (static_cast<void*>(&storage_.value)) T(v); }  // NOLINT
  optional(T&& v) : has_value_(true) {  // NOLINT
    ::new (static_cast<void*>(&storage_.value)) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) T(other.storage_.value);
    }
  }
  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) T(std::move(other.storage_.value));
    }
  }
  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_.value)) T(other.storage_.value);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_.value)) T(std::move(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }
  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() {
    SHP_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const {
    SHP_ASSERT(has_value_);
    return storage_.value;
  }
  T value_or(T fallback) const { return has_value_ ? storage_.value : fallback; }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept : dummy(0) {}
    ~Storage() {}
    char dummy;
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// NewType<T, Tag> - strong typedef
// ============================================================================

template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : val_() {}
  constexpr explicit NewType(T v) noexcept : val_(v) {}
  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& o) const noexcept { return val_ == o.val_; }
  constexpr bool operator!=(const NewType& o) const noexcept { return val_ != o.val_; }
  constexpr bool operator<(const NewType& o) const noexcept { return val_ < o.val_; }

 private:
  T val_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

// ============================================================================
// FixedString<N> - inline, bounded string
// ============================================================================

struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

template <uint32_t Capacity>
class FixedString final {
  static_assert(Capacity > 0, "FixedString capacity must be > 0");

 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&lit)[N]) noexcept : size_(0) {  // NOLINT
    static_assert(N - 1 <= Capacity, "literal exceeds FixedString capacity");
    assign(TruncateToCapacity, lit);
  }

  FixedString(TruncateToCapacity_t, const char* s) noexcept : size_(0) { assign(TruncateToCapacity, s); }

  FixedString(TruncateToCapacity_t, const char* s, uint32_t len) noexcept : size_(0) {
    assign(TruncateToCapacity, s, len);
  }

  void assign(TruncateToCapacity_t, const char* s) noexcept {
    assign(TruncateToCapacity, s, (s == nullptr) ? 0U : static_cast<uint32_t>(std::strlen(s)));
  }

  void assign(TruncateToCapacity_t, const char* s, uint32_t len) noexcept {
    size_ = 0;
    if (s != nullptr) {
      size_ = (len > Capacity) ? Capacity : len;
      std::memcpy(buf_, s, size_);
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* s) const noexcept { return s != nullptr && std::strcmp(buf_, s) == 0; }
  bool operator!=(const char* s) const noexcept { return !(*this == s); }
  template <uint32_t M>
  bool operator==(const FixedString<M>& o) const noexcept {
    return size_ == o.size() && std::memcmp(buf_, o.c_str(), size_) == 0;
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_;
};

// ============================================================================
// FixedFunction<Sig, BufSize> - small-buffer type-erased callable
// ============================================================================

template <typename Sig, uint32_t BufSize = 4 * sizeof(void*)>
class FixedFunction;

template <typename Ret, typename... Args, uint32_t BufSize>
class FixedFunction<Ret(Args...), BufSize> final {
 public:
  FixedFunction() noexcept = default;
  FixedFunction(std::nullptr_t) noexcept {}  // NOLINT

  template <typename F, typename = typename std::enable_if<
                            !std::is_same<typename std::decay<F>::type, FixedFunction>::value>::type>
  FixedFunction(F&& f) {  // NOLINT
    using Fn = typename std::decay<F>::type;
    static_assert(sizeof(Fn) <= BufSize, "callable too large for FixedFunction buffer");
    static_assert(alignof(Fn) <= alignof(std::max_align_t), "callable over-aligned");
    ::new (static_cast<void*>(buf_)) Fn(std::forward<F>(f));
    invoke_ = [](void* p, Args... args) -> Ret { return (*static_cast<Fn*>(p))(std::forward<Args>(args)...); };
    ops_ = [](void* dst, void* src, bool destroy_only) {
      Fn* s = static_cast<Fn*>(src);
      if (!destroy_only) {
        ::new (dst) Fn(std::move(*s));
      }
      s->~Fn();
    };
  }

  FixedFunction(FixedFunction&& other) noexcept { MoveFrom(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      Reset();
      MoveFrom(other);
    }
    return *this;
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() { Reset(); }

  explicit operator bool() const noexcept { return invoke_ != nullptr; }

  Ret operator()(Args... args) const {
    SHP_ASSERT(invoke_ != nullptr);
    return invoke_(const_cast<void*>(static_cast<const void*>(buf_)), std::forward<Args>(args)...);
  }

 private:
  using InvokeFn = Ret (*)(void*, Args...);
  using OpsFn = void (*)(void* dst, void* src, bool destroy_only);

  void MoveFrom(FixedFunction& other) noexcept {
    if (other.invoke_ != nullptr) {
      other.ops_(buf_, other.buf_, false);
      invoke_ = other.invoke_;
      ops_ = other.ops_;
      other.invoke_ = nullptr;
      other.ops_ = nullptr;
    }
  }

  void Reset() noexcept {
    if (invoke_ != nullptr) {
      ops_(nullptr, buf_, true);
      invoke_ = nullptr;
      ops_ = nullptr;
    }
  }

  alignas(std::max_align_t) unsigned char buf_[BufSize]{};
  InvokeFn invoke_ = nullptr;
  OpsFn ops_ = nullptr;
};

// ============================================================================
// ScopeGuard - run a cleanup action on scope exit unless released
// ============================================================================

class ScopeGuard final {
 public:
  explicit ScopeGuard(FixedFunction<void()> fn) noexcept : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_ && fn_) {
      fn_();
    }
  }

  /// @brief Disarm the guard (commit point reached).
  void release() noexcept { active_ = false; }

 private:
  FixedFunction<void()> fn_;
  bool active_;
};

#define SHP_SCOPE_EXIT(...) \
  ::shp::ScopeGuard SHP_CONCAT(shp_scope_exit_, __LINE__)(::shp::FixedFunction<void()>([&]() { __VA_ARGS__; }))

}  // namespace shp

#endif  // SHP_VOCABULARY_HPP_
