#include <gtest/gtest.h>

#include <stdexcept>

#include "gesture_slicer/frame_extractor.hpp"

namespace gesture_slicer {

class FrameExtractorTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::vector<FrameRecord> raw;
    for (int i = 0; i < 41; ++i) {
      raw.push_back({i, 100.0 + i * 0.25}); // 100.0 .. 110.0
    }
    index_ = std::make_shared<const TimestampIndex>("mem", raw);

    camera_.camera_id = "azure_depth";
    camera_.modality = CameraModality::AzureDepth;
  }

  static SegmentWindow window(double start, double end, bool accepted) {
    SegmentWindow w;
    w.effective_start = start;
    w.effective_end = end;
    w.accepted = accepted;
    return w;
  }

  std::shared_ptr<const TimestampIndex> index_;
  CameraStream camera_;
};

TEST_F(FrameExtractorTest, FindsFramesInsideWindow) {
  FrameExtractor extractor(camera_, index_);
  auto ex = extractor.extract(window(101.0, 102.0, true));
  EXPECT_EQ(ex.status, SegmentStatus::FramesFound);
  EXPECT_EQ(ex.modality, CameraModality::AzureDepth);
  EXPECT_EQ(ex.range.first_frame, 4);
  EXPECT_EQ(ex.range.last_frame, 8);
  EXPECT_EQ(ex.range.count, 5u);
}

TEST_F(FrameExtractorTest, WindowOutsideLogHasNoFrames) {
  FrameExtractor extractor(camera_, index_);
  auto ex = extractor.extract(window(200.0, 215.0, true));
  EXPECT_EQ(ex.status, SegmentStatus::NoFrames);
  EXPECT_TRUE(ex.range.empty());
}

TEST_F(FrameExtractorTest, PartialOverlapStillFindsFrames) {
  FrameExtractor extractor(camera_, index_);
  auto ex = extractor.extract(window(109.5, 124.5, true));
  EXPECT_EQ(ex.status, SegmentStatus::FramesFound);
  EXPECT_EQ(ex.range.count, 3u);
  EXPECT_EQ(ex.range.last_frame, 40);
}

TEST_F(FrameExtractorTest, RejectedWindowIsTooShortWithoutLookup) {
  FrameExtractor extractor(camera_, index_);
  auto ex = extractor.extract(window(101.0, 102.0, false));
  EXPECT_EQ(ex.status, SegmentStatus::TooShort);
  EXPECT_TRUE(ex.range.empty());
}

TEST_F(FrameExtractorTest, RequiresIndex) {
  EXPECT_THROW(FrameExtractor extractor(camera_, nullptr),
               std::invalid_argument);
}

} // namespace gesture_slicer
