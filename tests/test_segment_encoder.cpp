#include <gtest/gtest.h>

#include <initializer_list>
#include <set>

#include "gesture_slicer/segment_encoder.hpp"

namespace gesture_slicer {

namespace {

/// Hands out small gray frames for a fixed set of positions
class FakeSource : public FrameSource {
public:
  FakeSource(std::initializer_list<int64_t> available)
      : available_(available) {
    props_.width = 16;
    props_.height = 16;
    props_.frame_rate = 30.0;
    frame_ = av_frame_alloc();
    frame_->format = AV_PIX_FMT_GRAY8;
    frame_->width = 16;
    frame_->height = 16;
    av_frame_get_buffer(frame_, 0);
  }

  ~FakeSource() override { av_frame_free(&frame_); }

  const VideoProperties &properties() const override { return props_; }

  const AVFrame *frame_at(int64_t frame_index) override {
    if (!available_.count(frame_index))
      return nullptr;
    /// Reuse one buffer, like a decoder does
    if (av_frame_make_writable(frame_) < 0)
      return nullptr;
    frame_->pts = frame_index;
    return frame_;
  }

private:
  std::set<int64_t> available_;
  VideoProperties props_;
  AVFrame *frame_ = nullptr;
};

/// Records the pts of every frame it is given
class FakeSink : public FrameSink {
public:
  bool write(const AVFrame *frame) override {
    if (fail_after >= 0 && static_cast<int>(written.size()) >= fail_after)
      return false;
    written.push_back(frame->pts);
    return true;
  }

  bool finish() override {
    ++finish_calls;
    return finish_ok;
  }

  std::vector<int64_t> written;
  int fail_after = -1;
  bool finish_ok = true;
  int finish_calls = 0;
};

} // anonymous namespace

class SegmentEncoderTest : public ::testing::Test {
protected:
  SegmentEncoder encoder_{30.0};
};

TEST_F(SegmentEncoderTest, TargetFrameCountRoundsDuration) {
  EXPECT_EQ(target_frame_count(10.0, 30.0), 300);
  EXPECT_EQ(target_frame_count(7.5, 30.0), 225);
  EXPECT_EQ(target_frame_count(3.01, 30.0), 90);
}

TEST_F(SegmentEncoderTest, TargetFrameCountIsAtLeastOne) {
  EXPECT_EQ(target_frame_count(0.01, 30.0), 1);
  EXPECT_EQ(target_frame_count(0.0, 30.0), 1);
}

TEST_F(SegmentEncoderTest, DownsamplePicksEvenStride) {
  std::vector<int64_t> src = {10, 11, 12, 13, 14, 15, 16, 17, 18, 19};
  EXPECT_EQ(make_resample_plan(src, 5),
            (std::vector<int64_t>{10, 12, 14, 16, 18}));
}

TEST_F(SegmentEncoderTest, UpsampleRepeatsFrames) {
  EXPECT_EQ(make_resample_plan({1, 2}, 4), (std::vector<int64_t>{1, 1, 2, 2}));
}

TEST_F(SegmentEncoderTest, ResamplePlanIsMonotonic) {
  std::vector<int64_t> src;
  for (int64_t i = 0; i < 437; ++i) {
    src.push_back(1000 + i * 2);
  }
  auto plan = make_resample_plan(src, 300);
  ASSERT_EQ(plan.size(), 300u);
  EXPECT_EQ(plan.front(), src.front());
  for (size_t i = 1; i < plan.size(); ++i) {
    EXPECT_LE(plan[i - 1], plan[i]);
  }
}

TEST_F(SegmentEncoderTest, EmptySourceGivesEmptyPlan) {
  EXPECT_TRUE(make_resample_plan({}, 10).empty());
  EXPECT_TRUE(make_resample_plan({1, 2, 3}, 0).empty());
}

TEST_F(SegmentEncoderTest, EncoderPlanUsesTargetRate) {
  std::vector<int64_t> src(150);
  for (size_t i = 0; i < src.size(); ++i) {
    src[i] = static_cast<int64_t>(i);
  }
  EXPECT_EQ(encoder_.plan(src, 7.0).size(), 210u);
}

TEST_F(SegmentEncoderTest, SanitizesGestureNames) {
  EXPECT_EQ(sanitize_gesture_name("Wave Hand!"), "Wave_Hand");
  EXPECT_EQ(sanitize_gesture_name("a//b"), "a_b");
  EXPECT_EQ(sanitize_gesture_name("thumbs-up_2"), "thumbs-up_2");
  EXPECT_EQ(sanitize_gesture_name("  "), "gesture");
  EXPECT_EQ(sanitize_gesture_name(""), "gesture");
}

TEST_F(SegmentEncoderTest, BuildsIdsAndFilenames) {
  EXPECT_EQ(segment_id("7", "1", 3), "p7_cam1_seg003");
  EXPECT_EQ(segment_id("7", "1", 1234), "p7_cam1_seg1234");
  EXPECT_EQ(rejected_segment_id("7", "azure_depth", 12),
            "p7_camazure_depth_g12_rejected");
  EXPECT_EQ(segment_filename("7", "2", 10, "Wave Hand"),
            "p7_cam2_seg010_Wave_Hand.mp4");
}

TEST_F(SegmentEncoderTest, WritesEveryPlannedFrame) {
  FakeSource source({0, 1, 2});
  FakeSink sink;
  auto res = encoder_.encode({0, 1, 2}, source, sink);
  EXPECT_TRUE(res.ok) << res.error;
  EXPECT_EQ(res.frames_written, 3);
  EXPECT_EQ(res.frames_repeated, 0);
  EXPECT_EQ(sink.written, (std::vector<int64_t>{0, 1, 2}));
  EXPECT_EQ(sink.finish_calls, 1);
}

TEST_F(SegmentEncoderTest, RepeatsLastFrameOverGaps) {
  FakeSource source({0, 2});
  FakeSink sink;
  auto res = encoder_.encode({0, 1, 2}, source, sink);
  EXPECT_TRUE(res.ok) << res.error;
  EXPECT_EQ(res.frames_written, 3);
  EXPECT_EQ(res.frames_repeated, 1);
  EXPECT_EQ(sink.written, (std::vector<int64_t>{0, 0, 2}));
}

TEST_F(SegmentEncoderTest, BackfillsLeadingGapWithFirstFrame) {
  FakeSource source({2, 3});
  FakeSink sink;
  auto res = encoder_.encode({0, 1, 2, 3}, source, sink);
  EXPECT_TRUE(res.ok) << res.error;
  EXPECT_EQ(res.frames_written, 4);
  EXPECT_EQ(res.frames_repeated, 2);
  EXPECT_EQ(sink.written, (std::vector<int64_t>{2, 2, 2, 3}));
}

TEST_F(SegmentEncoderTest, FailsWhenNothingDecodes) {
  FakeSource source({});
  FakeSink sink;
  auto res = encoder_.encode({0, 1, 2}, source, sink);
  EXPECT_FALSE(res.ok);
  EXPECT_FALSE(res.error.empty());
  EXPECT_EQ(res.frames_written, 0);
  EXPECT_EQ(sink.finish_calls, 1);
}

TEST_F(SegmentEncoderTest, StopsOnSinkFailure) {
  FakeSource source({0, 1, 2, 3});
  FakeSink sink;
  sink.fail_after = 2;
  auto res = encoder_.encode({0, 1, 2, 3}, source, sink);
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.frames_written, 2);
  EXPECT_EQ(sink.finish_calls, 1);
}

TEST_F(SegmentEncoderTest, FinishFailureFailsClip) {
  FakeSource source({0});
  FakeSink sink;
  sink.finish_ok = false;
  auto res = encoder_.encode({0}, source, sink);
  EXPECT_FALSE(res.ok);
  EXPECT_EQ(res.frames_written, 1);
}

} // namespace gesture_slicer
