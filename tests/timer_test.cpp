// =============================================================================
// timer_test.cpp
// =============================================================================
// Unit tests for the clocks and cancellable timers used by StrategyLoop:
// SimulationTimeProvider, SimulatedTimer, LiveTimer, time_utils.
// =============================================================================

#include "pmm/time/live_time_provider.hpp"
#include "pmm/time/live_timer.hpp"
#include "pmm/time/simulated_timer.hpp"
#include "pmm/time/simulation_time_provider.hpp"
#include "pmm/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <thread>

// -----------------------------------------------------------------------------
// 1. Simulation clock only moves when told to; negative deltas are ignored.
// -----------------------------------------------------------------------------
TEST(SimulationTimeProviderTest, AdvanceByAndAdvanceTime) {
  pmm::SimulationTimeProvider clock(1000);
  EXPECT_EQ(clock.now_ms(), 1000);

  clock.advance_by(250);
  EXPECT_EQ(clock.now_ms(), 1250);

  clock.advance_by(-50);
  EXPECT_EQ(clock.now_ms(), 1250);

  clock.advance_time(5000);
  EXPECT_EQ(clock.now_ms(), 5000);
}

// -----------------------------------------------------------------------------
// 2. SimulatedTimer advances the clock instead of blocking.
// -----------------------------------------------------------------------------
TEST(SimulatedTimerTest, SleepAdvancesClock) {
  pmm::SimulationTimeProvider clock;
  pmm::SimulatedTimer timer(clock);

  EXPECT_TRUE(timer.sleepFor(30000));
  EXPECT_TRUE(timer.sleepFor(5000));
  EXPECT_TRUE(timer.sleepFor(0));

  EXPECT_EQ(clock.now_ms(), 35000);
  EXPECT_EQ(timer.sleepCount(), 2);
  EXPECT_EQ(timer.totalSleptMs(), 35000);
}

// -----------------------------------------------------------------------------
// 3. Cancel is sticky; a hook that cancels mid-sleep makes that sleep
//    report false.
// -----------------------------------------------------------------------------
TEST(SimulatedTimerTest, CancelFromHookIsReported) {
  pmm::SimulationTimeProvider clock;
  pmm::SimulatedTimer* self = nullptr;
  pmm::SimulatedTimer timer(clock, [&self](std::int64_t) { self->cancel(); });
  self = &timer;

  EXPECT_FALSE(timer.sleepFor(1000));
  EXPECT_TRUE(timer.cancelled());
  EXPECT_EQ(clock.now_ms(), 1000);

  EXPECT_FALSE(timer.sleepFor(1000));
  EXPECT_EQ(clock.now_ms(), 1000);
}

// -----------------------------------------------------------------------------
// 4. LiveTimer sleeps the full interval when left alone.
// -----------------------------------------------------------------------------
TEST(LiveTimerTest, ShortSleepCompletes) {
  pmm::LiveTimer timer;
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(timer.sleepFor(20));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(15));
}

// -----------------------------------------------------------------------------
// 5. cancel() from another thread wakes a long sleep promptly.
// -----------------------------------------------------------------------------
TEST(LiveTimerTest, CancelWakesSleeper) {
  pmm::LiveTimer timer;
  bool result = true;
  auto start = std::chrono::steady_clock::now();

  std::thread sleeper([&timer, &result] { result = timer.sleepFor(60000); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  timer.cancel();
  sleeper.join();

  EXPECT_FALSE(result);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_FALSE(timer.sleepFor(10));
}

// -----------------------------------------------------------------------------
// 6. Helpers.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, MinutesToMsAndIsoFormat) {
  EXPECT_EQ(pmm::minutes_to_ms(60), 3600000);
  EXPECT_EQ(pmm::minutes_to_ms(0.5), 30000);
  EXPECT_EQ(pmm::format_iso8601(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(pmm::format_iso8601(1700000000123), "2023-11-14T22:13:20.123Z");
}

TEST(TimeUtilsTest, MinutesToMsSaturates) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  EXPECT_EQ(pmm::minutes_to_ms(1e300), kMax);
  EXPECT_EQ(pmm::minutes_to_ms(std::numeric_limits<double>::infinity()), kMax);
  EXPECT_EQ(pmm::minutes_to_ms(-1e300), kMin);
  EXPECT_EQ(pmm::minutes_to_ms(std::numeric_limits<double>::quiet_NaN()), 0);
  EXPECT_EQ(pmm::minutes_to_ms(525600), 31536000000);
}

TEST(LiveTimeProviderTest, ReturnsWallClock) {
  pmm::LiveTimeProvider clock;
  // Any time after 2020-01-01.
  EXPECT_GT(clock.now_ms(), 1577836800000);
}
