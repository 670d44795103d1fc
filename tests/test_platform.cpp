/**
 * @file test_platform.cpp
 * @brief Tests for platform.hpp
 */

#include "shp/platform.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

TEST_CASE("SHP_ASSERT passes on true condition", "[platform]") {
  SHP_ASSERT(1 == 1);
  SHP_ASSERT(true);
}

TEST_CASE("Linux is detected", "[platform]") {
#if defined(SHP_PLATFORM_LINUX)
  SUCCEED("SHP_PLATFORM_LINUX defined");
#else
  FAIL("process supervision requires /proc");
#endif
}

TEST_CASE("Steady clock helpers are monotonic and consistent", "[platform]") {
  const uint64_t ms0 = shp::SteadyNowMs();
  const uint64_t ns0 = shp::SteadyNowNs();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const uint64_t ms1 = shp::SteadyNowMs();
  const uint64_t ns1 = shp::SteadyNowNs();
  REQUIRE(ms1 >= ms0 + 15);
  REQUIRE(ns1 > ns0);
  REQUIRE((ns1 - ns0) / 1000000ULL >= 15);
}

TEST_CASE("SHP_CONCAT pastes tokens", "[platform]") {
  int SHP_CONCAT(value_, 42) = 7;
  REQUIRE(value_42 == 7);
}
