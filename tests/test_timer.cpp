/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "shp/timer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

void CountTick(void* ctx) {
  static_cast<std::atomic<int>*>(ctx)->fetch_add(1);
}

}  // namespace

// ============================================================================
// Basic API Tests
// ============================================================================

TEST_CASE("TimerScheduler Add and Remove", "[timer]") {
  shp::TimerScheduler sched(4);

  auto result = sched.Add(100, [](void*) {}, nullptr);
  REQUIRE(result.has_value());
  REQUIRE(result.value().value() > 0);

  auto rm = sched.Remove(result.value());
  REQUIRE(rm.has_value());
}

TEST_CASE("TimerScheduler invalid period", "[timer]") {
  shp::TimerScheduler sched(4);
  auto result = sched.Add(0, [](void*) {}, nullptr);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == shp::TimerError::kInvalidPeriod);

  auto null_fn = sched.Add(100, nullptr, nullptr);
  REQUIRE(!null_fn.has_value());
  REQUIRE(null_fn.get_error() == shp::TimerError::kInvalidPeriod);
}

TEST_CASE("TimerScheduler slots full", "[timer]") {
  shp::TimerScheduler sched(2);
  REQUIRE(sched.Add(100, [](void*) {}).has_value());
  REQUIRE(sched.Add(100, [](void*) {}).has_value());
  auto r3 = sched.Add(100, [](void*) {});
  REQUIRE(!r3.has_value());
  REQUIRE(r3.get_error() == shp::TimerError::kSlotsFull);
}

TEST_CASE("TimerScheduler Start/Stop", "[timer]") {
  shp::TimerScheduler sched(4);
  auto start_result = sched.Start();
  REQUIRE(start_result.has_value());
  REQUIRE(sched.IsRunning());

  auto start2 = sched.Start();
  REQUIRE(!start2.has_value());
  REQUIRE(start2.get_error() == shp::TimerError::kAlreadyRunning);

  sched.Stop();
  REQUIRE(!sched.IsRunning());
}

TEST_CASE("TimerScheduler Stop without Start", "[timer]") {
  shp::TimerScheduler sched(4);
  sched.Stop();
  REQUIRE(!sched.IsRunning());
}

TEST_CASE("TimerScheduler fires callback", "[timer]") {
  std::atomic<int> counter{0};
  shp::TimerScheduler sched(4);

  REQUIRE(sched.Add(10, &CountTick, &counter).has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  sched.Stop();

  REQUIRE(counter.load() > 0);
}

TEST_CASE("TimerScheduler TaskCount", "[timer]") {
  shp::TimerScheduler sched(4);
  REQUIRE(sched.TaskCount() == 0);

  auto r1 = sched.Add(100, [](void*) {});
  REQUIRE(sched.TaskCount() == 1);

  auto r2 = sched.Add(200, [](void*) {});
  REQUIRE(r2.has_value());
  REQUIRE(sched.TaskCount() == 2);

  REQUIRE(sched.Remove(r1.value()).has_value());
  REQUIRE(sched.TaskCount() == 1);
}

TEST_CASE("TimerScheduler Remove twice", "[timer]") {
  shp::TimerScheduler sched(4);
  auto never = sched.Remove(shp::TimerTaskId(12345));
  REQUIRE(!never.has_value());
  REQUIRE(never.get_error() == shp::TimerError::kNotRunning);

  auto r1 = sched.Add(100, [](void*) {});
  REQUIRE(r1.has_value());
  REQUIRE(sched.Remove(r1.value()).has_value());
  REQUIRE(!sched.Remove(r1.value()).has_value());
}

TEST_CASE("TimerScheduler faster task fires more often", "[timer]") {
  std::atomic<int> fast{0};
  std::atomic<int> slow{0};
  shp::TimerScheduler sched(4);

  REQUIRE(sched.Add(10, &CountTick, &fast).has_value());
  REQUIRE(sched.Add(80, &CountTick, &slow).has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  sched.Stop();

  REQUIRE(slow.load() >= 1);
  REQUIRE(fast.load() > slow.load());
}

TEST_CASE("TimerScheduler Stop wakes a long sleep promptly", "[timer]") {
  shp::TimerScheduler sched(2);
  REQUIRE(sched.Add(60000, [](void*) {}).has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  const auto t0 = std::chrono::steady_clock::now();
  sched.Stop();
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  REQUIRE(elapsed < 1000);
}

TEST_CASE("TimerScheduler Add after Start is picked up", "[timer]") {
  std::atomic<int> counter{0};
  shp::TimerScheduler sched(4);
  REQUIRE(sched.Start().has_value());

  REQUIRE(sched.Add(10, &CountTick, &counter).has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  sched.Stop();

  REQUIRE(counter.load() > 0);
}

TEST_CASE("TimerScheduler callback executes outside mutex", "[timer]") {
  struct Ctx {
    shp::TimerScheduler* sched;
    std::atomic<bool> added{false};
  };
  shp::TimerScheduler sched(4);
  Ctx ctx;
  ctx.sched = &sched;

  // Add() from inside a callback would deadlock if the lock were held.
  REQUIRE(sched
              .Add(10,
                   [](void* p) {
                     auto* c = static_cast<Ctx*>(p);
                     if (!c->added.exchange(true)) {
                       (void)c->sched->Add(1000, [](void*) {});
                     }
                   },
                   &ctx)
              .has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  sched.Stop();

  REQUIRE(ctx.added.load());
  REQUIRE(sched.TaskCount() == 2);
}

TEST_CASE("TimerScheduler Remove during callback execution", "[timer]") {
  struct Ctx {
    shp::TimerScheduler* sched;
    shp::TimerTaskId self;
    std::atomic<int> fired{0};
  };
  shp::TimerScheduler sched(4);
  Ctx ctx;
  ctx.sched = &sched;

  auto id = sched.Add(10,
                      [](void* p) {
                        auto* c = static_cast<Ctx*>(p);
                        c->fired.fetch_add(1);
                        (void)c->sched->Remove(c->self);
                      },
                      &ctx);
  REQUIRE(id.has_value());
  ctx.self = id.value();

  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  sched.Stop();

  REQUIRE(ctx.fired.load() == 1);
  REQUIRE(sched.TaskCount() == 0);
}
