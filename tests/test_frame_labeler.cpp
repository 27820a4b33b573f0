#include <gtest/gtest.h>

#include "gesture_slicer/csv_table.hpp"
#include "gesture_slicer/frame_labeler.hpp"
#include "gesture_slicer/gesture_log.hpp"
#include "gesture_slicer/timestamp_index.hpp"

#include "test_support.hpp"

namespace gesture_slicer {

class FrameLabelerTest : public ::testing::Test {
protected:
  void SetUp() override {
    gestures_ = GestureEventLog::parse(
        CsvTable::parse("gesture_index,gesture_name,timestamp\n"
                        "0,wave,100\n"
                        "1,\"point, left\",101\n"),
        "mem", "7");
  }

  GestureEventLog gestures_;
  TimestampIndex index_{"mem", {{0, 99.5}, {1, 100.0}, {2, 100.5}, {4, 101.0}}};
};

TEST_F(FrameLabelerTest, LabelsEachFrameWithActiveGesture) {
  FrameLabeler labeler(gestures_);
  EXPECT_EQ(labeler.render(index_),
            "frame_index,timestamp,gesture_name\n"
            "0,1970-01-01 00:01:39.500000,none\n"
            "1,1970-01-01 00:01:40.000000,wave\n"
            "2,1970-01-01 00:01:40.500000,wave\n"
            "4,1970-01-01 00:01:41.000000,\"point, left\"\n");
}

TEST_F(FrameLabelerTest, WritesFileAndReportsFrameCount) {
  testing_support::ScratchDir dir;
  FrameLabeler labeler(gestures_);
  const std::string path = dir.file("webcam_1_labeled.csv");
  EXPECT_EQ(labeler.write(index_, path), 4u);
  EXPECT_EQ(testing_support::read_file(path), labeler.render(index_));
}

} // namespace gesture_slicer
