#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "gesture_slicer/logging.hpp"

namespace gesture_slicer {

class TimingCollectorTest : public ::testing::Test {
protected:
  void SetUp() override { TimingCollector::clear(); }
  void TearDown() override { TimingCollector::clear(); }
};

TEST_F(TimingCollectorTest, MergesRepeatedNamesInFirstSeenOrder) {
  TimingCollector::record("load_gesture_log", 100);
  TimingCollector::record("camera 1", 2000);
  TimingCollector::record("load_gesture_log", 50);

  auto totals = TimingCollector::totals();
  ASSERT_EQ(totals.size(), 2u);
  EXPECT_EQ(totals[0].name, "load_gesture_log");
  EXPECT_EQ(totals[0].calls, 2u);
  EXPECT_EQ(totals[0].microseconds, 150);
  EXPECT_EQ(totals[1].name, "camera 1");
  EXPECT_EQ(totals[1].calls, 1u);
}

TEST_F(TimingCollectorTest, ClearEmptiesCollector) {
  TimingCollector::record("plan", 10);
  TimingCollector::clear();
  EXPECT_TRUE(TimingCollector::totals().empty());
  /// Nothing to print, nothing to throw
  EXPECT_NO_THROW(TimingCollector::print_summary());
}

TEST_F(TimingCollectorTest, RecordsFromManyWorkers) {
  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([w] {
      for (int i = 0; i < 100; ++i) {
        TimingCollector::record(CAMERA_TIMING_PREFIX + std::to_string(w), 1);
      }
    });
  }
  for (auto &t : workers) {
    t.join();
  }

  auto totals = TimingCollector::totals();
  ASSERT_EQ(totals.size(), 4u);
  for (const auto &t : totals) {
    EXPECT_EQ(t.calls, 100u);
    EXPECT_EQ(t.microseconds, 100);
  }
  EXPECT_NO_THROW(TimingCollector::print_summary());
}

TEST_F(TimingCollectorTest, TimerMacrosRecordNamedPhase) {
  TIMER_START(index_frame_logs);
  TIMER_END(index_frame_logs);

  auto totals = TimingCollector::totals();
#if GESTURE_SLICER_ENABLE_TIMING
  ASSERT_EQ(totals.size(), 1u);
  EXPECT_EQ(totals[0].name, "index_frame_logs");
  EXPECT_GE(totals[0].microseconds, 0);
#else
  EXPECT_TRUE(totals.empty());
#endif
}

} // namespace gesture_slicer
