#include <gtest/gtest.h>

#include <filesystem>

#include "gesture_slicer/csv_table.hpp"
#include "gesture_slicer/errors.hpp"
#include "gesture_slicer/pipeline.hpp"

#include "test_support.hpp"

namespace gesture_slicer {

namespace fs = std::filesystem;

namespace {

/// Frame log with `frames` rows, 1/fps apart, starting at `t0`
std::string frame_log(double t0, double fps, int frames) {
  std::string text = "frame_index,timestamp\n";
  for (int i = 0; i < frames; ++i) {
    text += std::to_string(i) + "," + std::to_string(t0 + i / fps) + "\n";
  }
  return text;
}

} // anonymous namespace

// **---- Stats-only runs ----**

class PipelineStatsTest : public ::testing::Test {
protected:
  void SetUp() override {
    base_ = dir_.path().string();
    cfg_.participant_id = "7";
    cfg_.base_path = base_;
    cfg_.stats_only = true;
    cfg_.parallel_cameras = 1;

    /// wave: truncated to 7s; point: 1s left, too short;
    /// clap: full window, partly covered; snap: after the log ends
    testing_support::write_file(dir_.file("logs/auto_labels_7.csv"),
                                "gesture_index,gesture_name,timestamp\n"
                                "0,wave,1000\n"
                                "1,point,1012\n"
                                "2,clap,1018\n"
                                "3,snap,1100\n");
    testing_support::write_file(Layout::webcam_log(base_, "7", "1"),
                                frame_log(1000.0, 2.0, 61));
  }

  testing_support::ScratchDir dir_;
  std::string base_;
  PipelineConfig cfg_;
};

TEST_F(PipelineStatsTest, PlansEveryGestureForEveryCamera) {
  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  EXPECT_FALSE(result.cancelled);
  EXPECT_EQ(result.cameras_processed, 1u);
  EXPECT_EQ(result.stats.total, 4u);
  EXPECT_EQ(result.stats.accepted, 2u);
  EXPECT_EQ(result.stats.rejected, 2u);
  EXPECT_EQ(result.stats.rejected_by_reason["too_short"], 1u);
  EXPECT_EQ(result.stats.rejected_by_reason["no_frames"], 1u);
  EXPECT_EQ(pipeline.windows().size(), 4u);
}

TEST_F(PipelineStatsTest, RecordsCarrySegmentNumbering) {
  ParticipantPipeline pipeline(cfg_);
  pipeline.run();

  const auto &r = pipeline.manifest().records();
  ASSERT_EQ(r.size(), 4u);

  EXPECT_EQ(r[0].segment_id, "p7_cam1_seg000");
  EXPECT_EQ(r[0].filename, "p7_cam1_seg000_wave.mp4");
  EXPECT_TRUE(r[0].training_ready);
  EXPECT_DOUBLE_EQ(r[0].duration, 7.0);
  EXPECT_DOUBLE_EQ(r[0].training_duration, 7.0);
  EXPECT_EQ(r[0].frame_count, 210);
  EXPECT_TRUE(r[0].reading_time_excluded);

  EXPECT_EQ(r[1].segment_id, "p7_cam1_g1_rejected");
  EXPECT_EQ(r[1].reason, SegmentStatus::TooShort);
  EXPECT_DOUBLE_EQ(r[1].duration, 0.0);
  EXPECT_TRUE(r[1].filename.empty());
  EXPECT_TRUE(r[1].filepath.empty());

  /// Rejected windows do not consume a segment number
  EXPECT_EQ(r[2].segment_id, "p7_cam1_seg001");
  EXPECT_EQ(r[2].gesture_name, "clap");
  EXPECT_DOUBLE_EQ(r[2].start_time, 1023.0);
  EXPECT_DOUBLE_EQ(r[2].end_time, 1038.0);

  EXPECT_EQ(r[3].segment_id, "p7_cam1_g3_rejected");
  EXPECT_EQ(r[3].reason, SegmentStatus::NoFrames);
  EXPECT_DOUBLE_EQ(r[3].duration, 15.0);
  EXPECT_DOUBLE_EQ(r[3].training_duration, 0.0);
}

TEST_F(PipelineStatsTest, WritesManifestButNoClips) {
  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  EXPECT_EQ(result.manifest_path, Layout::manifest_path(base_, "7"));
  ASSERT_TRUE(fs::exists(result.manifest_path));
  auto table = CsvTable::parse(testing_support::read_file(result.manifest_path));
  EXPECT_EQ(table.header(), ManifestBuilder::columns());
  EXPECT_EQ(table.row_count(), 4u);

  EXPECT_FALSE(fs::exists(Layout::camera_output_dir(base_, "7", "1")));
}

TEST_F(PipelineStatsTest, RepeatedRunsWriteIdenticalManifests) {
  testing_support::write_file(Layout::webcam_log(base_, "7", "2"),
                              frame_log(1000.0, 2.0, 61));
  cfg_.parallel_cameras = 2;

  ParticipantPipeline first(cfg_);
  const std::string path = first.run().manifest_path;
  const std::string before = testing_support::read_file(path);

  ParticipantPipeline second(cfg_);
  second.run();
  EXPECT_EQ(testing_support::read_file(path), before);
}

TEST_F(PipelineStatsTest, CamerasAreOrderedAndExclusionsReported) {
  testing_support::write_file(Layout::webcam_log(base_, "7", "10"),
                              frame_log(1000.0, 2.0, 61));
  testing_support::write_file(Layout::webcam_log(base_, "7", "2"),
                              frame_log(1000.0, 2.0, 61));
  testing_support::write_file(Layout::webcam_log(base_, "7", "3"),
                              frame_log(1000.0, 2.0, 61));
  cfg_.excluded_cameras = {"3"};
  cfg_.parallel_cameras = 3;

  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  ASSERT_EQ(result.skipped.size(), 1u);
  EXPECT_EQ(result.skipped[0].camera_id, "3");
  EXPECT_EQ(result.skipped[0].reason, "excluded");

  const auto &r = pipeline.manifest().records();
  ASSERT_EQ(r.size(), 12u);
  EXPECT_EQ(r[0].camera_id, "1");
  EXPECT_EQ(r[4].camera_id, "2");
  EXPECT_EQ(r[8].camera_id, "10");
  for (size_t i = 0; i < r.size(); ++i) {
    EXPECT_EQ(r[i].gesture_order, i % 4);
  }
  EXPECT_EQ(r[9].segment_id, "p7_cam10_g1_rejected");
}

TEST_F(PipelineStatsTest, ZeroReadingCutoffIsReported) {
  cfg_.reading_cutoff = 0.0;
  ParticipantPipeline pipeline(cfg_);
  pipeline.run();
  EXPECT_FALSE(pipeline.manifest().records()[0].reading_time_excluded);
}

TEST_F(PipelineStatsTest, LabelsFrameLogsOnRequest) {
  cfg_.label_frames = true;
  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  EXPECT_EQ(result.labeled_logs, 1u);
  const std::string labeled =
      Layout::labeled_log(Layout::webcam_log(base_, "7", "1"));
  auto table = CsvTable::parse(testing_support::read_file(labeled));
  EXPECT_EQ(table.row_count(), 61u);
  EXPECT_EQ(table.rows()[0][2], "wave");
}

TEST_F(PipelineStatsTest, StopBeforeStartLeavesEmptyManifest) {
  RunControl control;
  control.request_stop();
  ParticipantPipeline pipeline(cfg_, &control);
  RunResult result = pipeline.run();

  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.stats.total, 0u);
  EXPECT_TRUE(fs::exists(result.manifest_path));
}

TEST_F(PipelineStatsTest, MissingGestureLogIsFatal) {
  fs::remove(dir_.file("logs/auto_labels_7.csv"));
  ParticipantPipeline pipeline(cfg_);
  EXPECT_THROW(pipeline.run(), MalformedLogError);
}

TEST_F(PipelineStatsTest, EmptyGestureLogIsFatal) {
  testing_support::write_file(dir_.file("logs/auto_labels_7.csv"),
                              "gesture_index,gesture_name,timestamp\n");
  ParticipantPipeline pipeline(cfg_);
  EXPECT_THROW(pipeline.run(), MalformedLogError);
}

TEST_F(PipelineStatsTest, CorruptFrameLogIsFatal) {
  testing_support::write_file(Layout::webcam_log(base_, "7", "1"),
                              "frame_index,value\n0,1\n");
  ParticipantPipeline pipeline(cfg_);
  EXPECT_THROW(pipeline.run(), MalformedLogError);
}

TEST_F(PipelineStatsTest, GestureClockOffsetShiftsWindows) {
  cfg_.gesture_clock_offset = 100.0;
  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  /// Every window now starts after the frame log ends
  EXPECT_EQ(result.stats.accepted, 0u);
  EXPECT_EQ(result.stats.rejected_by_reason["no_frames"], 3u);
}

TEST_F(PipelineStatsTest, CameraWithoutFramesDoesNotAffectOthers) {
  /// Camera 2 starts recording after the wave window has closed
  testing_support::write_file(Layout::webcam_log(base_, "7", "2"),
                              frame_log(1020.0, 2.0, 61));
  cfg_.parallel_cameras = 2;

  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  const auto &r = pipeline.manifest().records();
  ASSERT_EQ(r.size(), 8u);

  EXPECT_EQ(r[0].camera_id, "1");
  EXPECT_EQ(r[0].segment_id, "p7_cam1_seg000");
  EXPECT_TRUE(r[0].training_ready);

  EXPECT_EQ(r[4].camera_id, "2");
  EXPECT_EQ(r[4].gesture_name, "wave");
  EXPECT_EQ(r[4].reason, SegmentStatus::NoFrames);
  EXPECT_EQ(r[4].segment_id, "p7_cam2_g0_rejected");
  EXPECT_FALSE(r[4].training_ready);

  /// First window camera 2 covers still gets the first number
  EXPECT_EQ(r[6].gesture_name, "clap");
  EXPECT_TRUE(r[6].training_ready);
  EXPECT_EQ(r[6].segment_id, "p7_cam2_seg000");
  EXPECT_EQ(r[6].filename, "p7_cam2_seg000_clap.mp4");

  EXPECT_EQ(result.stats.per_camera["1"].accepted, 2u);
  EXPECT_EQ(result.stats.per_camera["2"].accepted, 1u);
  EXPECT_EQ(result.stats.rejected_by_reason["no_frames"], 3u);
}

TEST_F(PipelineStatsTest, RunningTwiceStartsFresh) {
  ParticipantPipeline pipeline(cfg_);
  RunResult first = pipeline.run();
  const std::string before = testing_support::read_file(first.manifest_path);

  RunResult second = pipeline.run();
  EXPECT_TRUE(second.skipped.empty());
  EXPECT_EQ(second.stats.total, 4u);
  EXPECT_EQ(second.stats.accepted, first.stats.accepted);
  EXPECT_EQ(pipeline.manifest().size(), 4u);
  EXPECT_EQ(testing_support::read_file(second.manifest_path), before);
}

// **---- Full runs ----**

class PipelineEncodeTest : public ::testing::Test {
protected:
  void SetUp() override {
    base_ = dir_.path().string();
    cfg_.participant_id = "7";
    cfg_.base_path = base_;
    cfg_.segment_duration = 10.0;
    cfg_.reading_cutoff = 5.0;
    cfg_.min_duration = 3.0;
    cfg_.target_frame_rate = 10.0;
    cfg_.parallel_cameras = 2;

    testing_support::write_file(dir_.file("logs/auto_labels_7.csv"),
                                "gesture_index,gesture_name,timestamp\n"
                                "0,wave,1000\n"
                                "1,thumbs up,1012\n");

    /// Camera 1 is a real 30s recording at 10 fps
    testing_support::write_file(Layout::webcam_log(base_, "7", "1"),
                                frame_log(1000.0, 10.0, 300));
    ASSERT_EQ(testing_support::write_ramp_video(
                  Layout::webcam_media(base_, "7", "1"), 64, 48, 10.0, 300),
              300);

    /// Camera 2 has a log but no recording
    testing_support::write_file(Layout::webcam_log(base_, "7", "2"),
                                frame_log(1000.0, 10.0, 300));

    /// Camera 3 has a recording that cannot be decoded
    testing_support::write_file(Layout::webcam_log(base_, "7", "3"),
                                frame_log(1000.0, 10.0, 300));
    testing_support::write_file(Layout::webcam_media(base_, "7", "3"),
                                "not a video");
  }

  testing_support::ScratchDir dir_;
  std::string base_;
  PipelineConfig cfg_;
};

TEST_F(PipelineEncodeTest, WritesNormalizedClips) {
  ParticipantPipeline pipeline(cfg_);
  pipeline.run();

  const auto &r = pipeline.manifest().records();
  ASSERT_EQ(r.size(), 4u);

  EXPECT_EQ(r[0].camera_id, "1");
  EXPECT_TRUE(r[0].training_ready);
  EXPECT_EQ(r[0].frame_count, 70);
  EXPECT_EQ(r[1].filename, "p7_cam1_seg001_thumbs_up.mp4");
  EXPECT_EQ(r[1].frame_count, 100);

  for (int i = 0; i < 2; ++i) {
    ASSERT_TRUE(fs::exists(r[i].filepath)) << r[i].filepath;
    VideoReader clip(r[i].filepath, CameraModality::Webcam);
    ASSERT_TRUE(clip.initialize());
    EXPECT_EQ(clip.properties().width, 64);
    EXPECT_NEAR(clip.properties().frame_rate, 10.0, 0.01);
    EXPECT_NE(clip.frame_at(r[i].frame_count - 1), nullptr);
    EXPECT_EQ(clip.frame_at(r[i].frame_count), nullptr);
  }
  EXPECT_EQ(fs::path(r[0].filepath).parent_path(),
            fs::path(Layout::camera_output_dir(base_, "7", "1")));
}

TEST_F(PipelineEncodeTest, MissingMediaSkipsCamera) {
  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  EXPECT_EQ(result.cameras_processed, 2u);
  ASSERT_FALSE(result.skipped.empty());
  EXPECT_EQ(result.skipped[0].camera_id, "2");
  EXPECT_EQ(result.skipped[0].reason, "missing media");
  for (const auto &rec : pipeline.manifest().records()) {
    EXPECT_NE(rec.camera_id, "2");
  }
}

TEST_F(PipelineEncodeTest, UndecodableMediaRejectsSegments) {
  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  const auto &r = pipeline.manifest().records();
  ASSERT_EQ(r.size(), 4u);
  EXPECT_EQ(r[2].camera_id, "3");
  EXPECT_EQ(r[2].reason, SegmentStatus::EncodeFailed);
  EXPECT_EQ(r[2].segment_id, "p7_cam3_g0_rejected");
  EXPECT_TRUE(r[2].filepath.empty());
  EXPECT_EQ(r[3].reason, SegmentStatus::EncodeFailed);
  EXPECT_EQ(result.stats.rejected_by_reason["encode_failed"], 2u);

  /// No partial clip is left behind
  EXPECT_FALSE(fs::exists(
      fs::path(Layout::camera_output_dir(base_, "7", "3")) /
      "p7_cam3_seg000_wave.mp4"));
}

TEST_F(PipelineEncodeTest, FailedClipDoesNotUseUpSegmentNumber) {
  /// A directory where the first clip should go makes its output unopenable
  const fs::path blocked =
      fs::path(Layout::camera_output_dir(base_, "7", "1")) /
      "p7_cam1_seg000_wave.mp4";
  testing_support::write_file((blocked / "keep").string(), "x");

  ParticipantPipeline pipeline(cfg_);
  RunResult result = pipeline.run();

  const auto &r = pipeline.manifest().records();
  ASSERT_EQ(r.size(), 4u);
  EXPECT_EQ(r[0].reason, SegmentStatus::EncodeFailed);
  EXPECT_EQ(r[0].segment_id, "p7_cam1_g0_rejected");
  EXPECT_TRUE(r[0].filepath.empty());

  EXPECT_TRUE(r[1].training_ready);
  EXPECT_EQ(r[1].segment_id, "p7_cam1_seg000");
  EXPECT_EQ(r[1].filename, "p7_cam1_seg000_thumbs_up.mp4");
  EXPECT_TRUE(fs::exists(r[1].filepath)) << r[1].filepath;

  /// The directory in the way is left alone
  EXPECT_TRUE(fs::is_directory(blocked));
  EXPECT_EQ(result.stats.per_camera["1"].accepted, 1u);
}

} // namespace gesture_slicer
