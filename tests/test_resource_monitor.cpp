/**
 * @file test_resource_monitor.cpp
 * @brief Tests for resource_monitor.hpp
 */

#include "shp/resource_monitor.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

class FixedSampler final : public shp::CpuSampler {
 public:
  explicit FixedSampler(double v) : value_(v) {}
  shp::optional<double> SampleCpuPercent(uint32_t /*budget_ms*/) override {
    calls_.fetch_add(1);
    return shp::optional<double>{value_};
  }
  const char* Name() const override { return "fixed"; }
  void Set(double v) { value_ = v; }
  int Calls() const { return calls_.load(); }

 private:
  double value_;
  std::atomic<int> calls_{0};
};

class FailingSampler final : public shp::CpuSampler {
 public:
  shp::optional<double> SampleCpuPercent(uint32_t /*budget_ms*/) override { return {}; }
  const char* Name() const override { return "failing"; }
};

/// Overruns any budget below its delay.
class SlowSampler final : public shp::CpuSampler {
 public:
  explicit SlowSampler(uint32_t delay_ms) : delay_ms_(delay_ms) {}
  shp::optional<double> SampleCpuPercent(uint32_t /*budget_ms*/) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    return shp::optional<double>{99.0};
  }
  const char* Name() const override { return "slow"; }

 private:
  uint32_t delay_ms_;
};

}  // namespace

// ============================================================================
// ResourceMonitor
// ============================================================================

TEST_CASE("ResourceMonitor: valid sample carries sampler value", "[monitor]") {
  FixedSampler s(42.5);
  shp::ResourceMonitor<> mon(&s, 90.0, 1000);
  auto snap = mon.Sample();
  REQUIRE(snap.valid);
  REQUIRE_THAT(snap.cpu_percent, WithinAbs(42.5, 1e-9));
  REQUIRE(snap.memory_percent >= 0.0);
  REQUIRE(snap.memory_percent <= 100.0);
  REQUIRE(snap.sampled_at_ms > 0);
}

TEST_CASE("ResourceMonitor: sampler failure is permissive", "[monitor]") {
  FailingSampler s;
  shp::ResourceMonitor<> mon(&s);
  auto snap = mon.Sample();
  REQUIRE_FALSE(snap.valid);
  REQUIRE(snap.cpu_percent == 0.0);
}

TEST_CASE("ResourceMonitor: null sampler is permissive", "[monitor]") {
  shp::ResourceMonitor<> mon(nullptr);
  auto snap = mon.Sample();
  REQUIRE_FALSE(snap.valid);
  REQUIRE(snap.cpu_percent == 0.0);
}

TEST_CASE("ResourceMonitor: budget overrun discards the value", "[monitor]") {
  SlowSampler s(80);
  shp::ResourceMonitor<> mon(&s, 90.0, 20);
  auto snap = mon.Sample();
  REQUIRE_FALSE(snap.valid);
  REQUIRE(snap.cpu_percent == 0.0);
}

TEST_CASE("ResourceMonitor: values are clamped", "[monitor]") {
  FixedSampler s(130.0);
  shp::ResourceMonitor<> mon(&s);
  REQUIRE(mon.Sample().cpu_percent == 100.0);
  s.Set(-5.0);
  REQUIRE(mon.Sample().cpu_percent == 0.0);
}

TEST_CASE("ResourceMonitor: history stats over a bounded window", "[monitor]") {
  FixedSampler s(10.0);
  shp::ResourceMonitor<4> mon(&s);
  REQUIRE(mon.Stats().samples == 0);

  (void)mon.Sample();
  s.Set(30.0);
  (void)mon.Sample();
  auto st = mon.Stats();
  REQUIRE(st.samples == 2);
  REQUIRE_THAT(st.avg_cpu_percent, WithinAbs(20.0, 1e-9));
  REQUIRE_THAT(st.max_cpu_percent, WithinAbs(30.0, 1e-9));

  s.Set(50.0);
  for (int i = 0; i < 6; ++i) {
    (void)mon.Sample();
  }
  st = mon.Stats();
  REQUIRE(st.samples == 4);
  REQUIRE_THAT(st.avg_cpu_percent, WithinAbs(50.0, 1e-9));
  REQUIRE_THAT(mon.LastSnapshot().cpu_percent, WithinAbs(50.0, 1e-9));
}

TEST_CASE("ResourceMonitor: accessors and SampleTick", "[monitor]") {
  FixedSampler s(5.0);
  shp::ResourceMonitor<> mon(&s, 75.0, 300);
  REQUIRE(mon.CpuThreshold() == 75.0);
  REQUIRE(mon.BudgetMs() == 300);

  shp::ResourceMonitor<>::SampleTick(&mon);
  shp::ResourceMonitor<>::SampleTick(nullptr);
  REQUIRE(s.Calls() == 1);
  REQUIRE(mon.Stats().samples == 1);
}

// ============================================================================
// Samplers
// ============================================================================

TEST_CASE("ProcStatSampler returns a percentage on Linux", "[monitor][proc]") {
  shp::ProcStatSampler s;
  auto first = s.SampleCpuPercent(200);
  REQUIRE(first.has_value());
  REQUIRE(first.value() >= 0.0);
  REQUIRE(first.value() <= 100.0);

  // Second call reuses the recent baseline.
  auto second = s.SampleCpuPercent(200);
  REQUIRE(second.has_value());
  REQUIRE(std::string(s.Name()) == "proc-stat");
}

TEST_CASE("ProcStatSampler: back-to-back calls still measure a full window", "[monitor][proc]") {
  shp::ProcStatSampler s;
  REQUIRE(s.SampleCpuPercent(1000).has_value());

  const auto t0 = std::chrono::steady_clock::now();
  auto v = s.SampleCpuPercent(1000);
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  REQUIRE(v.has_value());
  REQUIRE(elapsed >= static_cast<long long>(shp::ProcStatSampler::kWindowMs) - 5);
  REQUIRE(elapsed < 1000);
}

TEST_CASE("ProcStatSampler: a short budget caps the wait", "[monitor][proc]") {
  shp::ProcStatSampler s;
  REQUIRE(s.SampleCpuPercent(1000).has_value());

  const auto t0 = std::chrono::steady_clock::now();
  (void)s.SampleCpuPercent(40);
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  REQUIRE(elapsed < 40);
}

TEST_CASE("ProcStatSampler: busy CPU is never reported as idle", "[monitor][proc]") {
  std::atomic<bool> stop{false};
  std::vector<std::thread> spinners;
  const unsigned n = std::thread::hardware_concurrency() > 0U ? std::thread::hardware_concurrency() : 1U;
  for (unsigned i = 0; i < n; ++i) {
    spinners.emplace_back([&stop]() {
      volatile uint64_t x = 0;
      while (!stop.load(std::memory_order_relaxed))
        x = x + 1;
    });
  }

  shp::ProcStatSampler sampler;
  shp::ResourceMonitor<> mon(&sampler, 90.0, 1000);
  uint32_t idle_reports = 0;
  uint32_t invalid = 0;
  for (int i = 0; i < 10; ++i) {
    const shp::ResourceSnapshot snap = mon.Sample();
    if (!snap.valid)
      ++invalid;
    else if (snap.cpu_percent == 0.0)
      ++idle_reports;
  }

  stop.store(true);
  for (auto& t : spinners)
    t.join();

  REQUIRE(invalid == 0);
  REQUIRE(idle_reports == 0);
}

TEST_CASE("ProcStatSampler: tiny budget without history fails instead of reading 0%", "[monitor][proc]") {
  shp::ProcStatSampler s;
  auto v = s.SampleCpuPercent(0);
  if (v.has_value()) {
    // Only possible when a jiffy ticked between the two reads.
    REQUIRE(v.value() >= 0.0);
    REQUIRE(v.value() <= 100.0);
  }
  auto full = s.SampleCpuPercent(1000);
  REQUIRE(full.has_value());
}

TEST_CASE("ReadMemoryPercent reads /proc/meminfo", "[monitor][proc]") {
  const double mem = shp::ReadMemoryPercent();
  REQUIRE(mem > 0.0);
  REQUIRE(mem <= 100.0);
}

TEST_CASE("ParseCpuSummary: top format", "[monitor]") {
  const char* text =
      "top - 10:00:00 up 1 day,  2 users,  load average: 0.00, 0.01, 0.05\n"
      "Tasks: 100 total,   1 running,  99 sleeping\n"
      "%Cpu(s):  3.1 us,  1.0 sy,  0.0 ni, 95.4 id,  0.5 wa,  0.0 hi,  0.0 si,  0.0 st\n";
  auto v = shp::ParseCpuSummary(text);
  REQUIRE(v.has_value());
  REQUIRE_THAT(v.value(), WithinAbs(4.6, 1e-6));
}

TEST_CASE("ParseCpuSummary: BSD-style format", "[monitor]") {
  auto v = shp::ParseCpuSummary("Processes: 400 total\nCPU usage: 12.34% user, 5.67% sys, 81.99% idle\n");
  REQUIRE(v.has_value());
  REQUIRE_THAT(v.value(), WithinAbs(18.01, 1e-6));
}

TEST_CASE("ParseCpuSummary: no summary line", "[monitor]") {
  REQUIRE_FALSE(shp::ParseCpuSummary("").has_value());
  REQUIRE_FALSE(shp::ParseCpuSummary("Tasks: 1 total\nMem: 100 total\n").has_value());
}

TEST_CASE("CommandCpuSampler: custom command output is parsed", "[monitor][proc]") {
  const char* argv[] = {"/bin/echo", "%Cpu(s): 10.0 us, 0.0 sy, 0.0 ni, 75.0 id", nullptr};
  shp::CommandCpuSampler s(argv);
  auto v = s.SampleCpuPercent(2000);
  REQUIRE(v.has_value());
  REQUIRE_THAT(v.value(), WithinAbs(25.0, 1e-6));
  REQUIRE(std::string(s.Name()) == "/bin/echo");
}

TEST_CASE("CommandCpuSampler: command exceeding the budget fails", "[monitor][proc]") {
  const char* argv[] = {"/bin/sleep", "5", nullptr};
  shp::CommandCpuSampler s(argv);
  const auto t0 = std::chrono::steady_clock::now();
  auto v = s.SampleCpuPercent(100);
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  REQUIRE_FALSE(v.has_value());
  REQUIRE(elapsed < 2000);
}

TEST_CASE("CommandCpuSampler: missing command fails", "[monitor][proc]") {
  const char* argv[] = {"/nonexistent/top", nullptr};
  shp::CommandCpuSampler s(argv);
  REQUIRE_FALSE(s.SampleCpuPercent(500).has_value());
}
