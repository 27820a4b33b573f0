/**
 * @file pipeline.cpp
 * @brief Participant run orchestration implementation
 *
 * @details Implements the ParticipantPipeline class:
 *
 *          - Shared, read-only inputs built once (gesture log, frame indices,
 *            windows)
 *
 *          - Work queue of cameras consumed by pinned worker threads
 *
 *          - Camera-prefixed logging
 *
 *          - Sequential summary output
 */

#include "gesture_slicer/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <map>
#include <system_error>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "gesture_slicer/frame_extractor.hpp"
#include "gesture_slicer/frame_labeler.hpp"
#include "gesture_slicer/logging.hpp"
#include "gesture_slicer/segment_encoder.hpp"
#include "gesture_slicer/segment_planner.hpp"
#include "gesture_slicer/system.hpp"
#include "gesture_slicer/video_io.hpp"

namespace gesture_slicer {

namespace fs = std::filesystem;

namespace {

std::string join_cpus(const std::vector<int> &cpus) {
  std::string list;
  for (size_t i = 0; i < cpus.size(); ++i) {
    if (i > 0)
      list += ",";
    list += std::to_string(cpus[i]);
  }
  return list;
}

long elapsed_us(std::chrono::high_resolution_clock::time_point since) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::high_resolution_clock::now() - since)
          .count());
}

} // anonymous namespace

ParticipantPipeline::ParticipantPipeline(const PipelineConfig &cfg,
                                         RunControl *control)
    : cfg_(cfg), control_(control) {}

// **---- Records ----**

SegmentRecord ParticipantPipeline::make_record(const CameraEntry &camera,
                                               size_t gesture_order,
                                               const GestureEvent &event,
                                               const SegmentWindow &window) const {
  SegmentRecord r;
  r.participant_id = cfg_.participant_id;
  r.camera_id = camera.stream.camera_id;
  r.camera_order = camera.order;
  r.gesture_order = gesture_order;
  r.gesture_name = event.gesture_name;
  r.gesture_index = event.gesture_index;
  r.gesture_time = event.onset_timestamp;
  r.start_time = window.effective_start;
  r.end_time = window.effective_end;
  r.duration = std::max(0.0, window.duration());
  r.reading_time_excluded = cfg_.reading_cutoff > 0.0;
  return r;
}

void ParticipantPipeline::accept(SegmentRecord &record, int segment_index,
                                 const std::string &out_dir) const {
  record.reason = SegmentStatus::Accepted;
  record.training_ready = true;
  record.training_duration = record.duration;
  record.segment_id =
      segment_id(record.participant_id, record.camera_id, segment_index);
  record.filename = segment_filename(record.participant_id, record.camera_id,
                                     segment_index, record.gesture_name);
  record.filepath = (fs::path(out_dir) / record.filename).string();
}

void ParticipantPipeline::reject(SegmentRecord &record,
                                 SegmentStatus reason) const {
  record.reason = reason;
  record.training_ready = false;
  record.training_duration = 0.0;
  if (reason == SegmentStatus::TooShort)
    record.duration = 0.0;
  record.segment_id = rejected_segment_id(
      record.participant_id, record.camera_id, record.gesture_index);
  record.filename.clear();
  record.filepath.clear();
}

// **---- Camera Processing ----**

bool ParticipantPipeline::process_camera(const CameraJob &job) {
  const CameraEntry &cam = *job.camera;
  const std::string &id = cam.stream.camera_id;
  const auto &events = gestures_.events();

  FrameExtractor extractor(cam.stream, job.index);
  SegmentEncoder encoder(cfg_.target_frame_rate);
  const std::string out_dir =
      Layout::camera_output_dir(cfg_.base_path, cfg_.participant_id, id);

  // **--- OPEN MEDIA ---**

  std::unique_ptr<VideoReader> reader;
  bool media_ok = false;
  if (!cfg_.stats_only) {
    fs::create_directories(out_dir);
    reader = std::make_unique<VideoReader>(cam.media_path, cam.stream.modality);
    media_ok = reader->initialize();
    if (media_ok) {
      const VideoProperties &p = reader->properties();
      LOG_INFO("[Camera {}] {} {}x{} @ {:.2f} fps ({})", id,
               modality_name(cam.stream.modality), p.width, p.height,
               p.frame_rate, cam.media_path);
    } else {
      LOG_ERROR("[Camera {}] Cannot decode {}; its segments will be rejected",
                id, cam.media_path);
    }
  } else {
    LOG_INFO("[Camera {}] Stats only, ~{:.2f} fps from frame log", id,
             job.index->estimated_frame_rate());
  }

  // **--- GESTURE LOOP ---**

  int segment_index = 0;
  int accepted = 0;
  for (size_t g = 0; g < events.size(); ++g) {
    if (stop_requested()) {
      LOG_WARN("[Camera {}] Stop requested; {} of {} gestures done", id, g,
               events.size());
      return false;
    }

    const SegmentWindow &w = windows_[g];
    SegmentRecord record = make_record(cam, g, events[g], w);
    const ExtractedRange ex = extractor.extract(w);

    if (ex.status != SegmentStatus::FramesFound) {
      reject(record, ex.status);
      LOG_INFO("[Camera {}] Gesture {} '{}': {}", id, record.gesture_index,
               record.gesture_name, status_name(ex.status));
      manifest_.append(std::move(record));
      continue;
    }

    const auto plan = encoder.plan(job.index->frame_indices(ex.range),
                                   record.duration);
    record.frame_count = static_cast<int64_t>(plan.size());
    /// Candidate number; only an accepted clip takes it
    accept(record, segment_index, out_dir);

    if (cfg_.stats_only) {
      ++segment_index;
      ++accepted;
      manifest_.append(std::move(record));
      continue;
    }

    EncodeResult res;
    if (media_ok) {
      const VideoProperties &p = reader->properties();
      VideoWriter writer(record.filepath, p.width, p.height,
                         cfg_.target_frame_rate);
      if (writer.initialize())
        res = encoder.encode(plan, *reader, writer);
      else
        res.error = "cannot open output clip";
    } else {
      res.error = "media could not be decoded";
    }

    if (res.ok) {
      record.frame_count = res.frames_written;
      ++segment_index;
      ++accepted;
      ++clips_written_;
      frames_written_ += res.frames_written;
      if (res.frames_repeated > 0) {
        LOG_WARN("[Camera {}] {}: {} slot(s) repeated an earlier frame", id,
                 record.filename, res.frames_repeated);
      }
      LOG_INFO("[Camera {}] {} ({} frames from {} source, {:.3f}s)", id,
               record.filename, res.frames_written, ex.range.count,
               record.duration);
    } else {
      LOG_ERROR("[Camera {}] Gesture {} '{}': encode failed: {}", id,
                record.gesture_index, record.gesture_name, res.error);
      /// Only a file this writer created; never a directory in the way
      std::error_code ec;
      if (fs::is_regular_file(record.filepath, ec))
        fs::remove(record.filepath, ec);
      record.frame_count = 0;
      reject(record, SegmentStatus::EncodeFailed);
    }
    manifest_.append(std::move(record));
  }

  LOG_SUCCESS("[Camera {}] Done: {}/{} segments training-ready", id, accepted,
              events.size());
  return true;
}

void ParticipantPipeline::camera_worker(int worker_id,
                                        const std::vector<int> &cpu_set,
                                        WorkQueue<CameraJob> &queue) {
  if (!cpu_set.empty()) {
    if (pin_thread_to_cpus(cpu_set)) {
      LOG_INFO("[Worker {}] Pinned to CPUs [{}]", worker_id,
               join_cpus(cpu_set));
    } else {
      LOG_WARN("[Worker {}] Failed to pin to CPUs", worker_id);
    }
  }

  CameraJob job;
  while (queue.pop(job)) {
    const std::string &id = job.camera->stream.camera_id;
    LOG_PHASE("[Camera {}] ----------------------------------------", id);
    auto start = std::chrono::high_resolution_clock::now();

    try {
      if (!process_camera(job)) {
        /// Cancelled: cameras still queued are not started
        queue.clear();
      }
    } catch (const std::exception &e) {
      /// Records already appended stay; the camera is reported as failed
      LOG_ERROR("[Camera {}] Aborted: {}", id, e.what());
      std::lock_guard<std::mutex> lock(failed_mutex_);
      failed_.push_back({id, std::string("failed: ") + e.what()});
    }

    TimingCollector::record(fmt::format("{}{}", CAMERA_TIMING_PREFIX, id),
                            elapsed_us(start));
  }
}

// **---- Frame Labels ----**

size_t ParticipantPipeline::label_frames(
    const std::vector<std::string> &logs,
    const std::vector<std::shared_ptr<const TimestampIndex>> &indices) const {
  FrameLabeler labeler(gestures_);
  size_t written = 0;
  for (size_t i = 0; i < logs.size(); ++i) {
    const std::string out = Layout::labeled_log(logs[i]);
    size_t frames = labeler.write(*indices[i], out);
    LOG_INFO("Labeled {} frames -> {}", frames, out);
    ++written;
  }
  return written;
}

// **---- Run ----**

RunResult ParticipantPipeline::run() {
  TimingCollector::clear();
  manifest_.reset();
  windows_.clear();
  {
    std::lock_guard<std::mutex> lock(failed_mutex_);
    failed_.clear();
  }
  clips_written_.store(0);
  frames_written_.store(0);
  auto run_start = std::chrono::high_resolution_clock::now();
  RunResult result;

  LOG_PHASE("================== GESTURE SLICER ==================");
  LOG_INFO("Participant: {}", cfg_.participant_id);
  LOG_INFO("Base path: {}", cfg_.base_path);
  LOG_INFO("Segment: {:.1f}s after {:.1f}s reading time (min {:.1f}s) @ {} fps",
           cfg_.segment_duration, cfg_.reading_cutoff, cfg_.min_duration,
           cfg_.target_frame_rate);
  if (cfg_.stats_only)
    LOG_INFO("Stats only: no media is decoded and no clip is written");

  // **--- PHASE 1: GESTURES ---**

  TIMER_START(load_gesture_log);
  gestures_ = GestureEventLog::load(cfg_.resolved_gesture_log(),
                                    cfg_.participant_id,
                                    cfg_.gesture_clock_offset);
  TIMER_END(load_gesture_log);
  LOG_INFO("Loaded {} gestures from {}", gestures_.size(),
           cfg_.resolved_gesture_log());

  // **--- PHASE 2: CAMERAS ---**

  TIMER_START(index_frame_logs);
  const CameraCatalog catalog = CameraCatalog::discover(cfg_);
  result.skipped = catalog.skipped();

  /// One index per log; the Azure modalities share theirs
  const std::vector<std::string> logs = catalog.timestamp_logs();
  std::vector<std::shared_ptr<const TimestampIndex>> indices;
  std::map<std::string, std::shared_ptr<const TimestampIndex>> by_log;
  for (const auto &log : logs) {
    auto index = std::make_shared<const TimestampIndex>(
        TimestampIndex::from_csv(log, cfg_.timestamp_tolerance));
    LOG_INFO("Indexed {}: {} frames, {} corrupted, {} clamped, ~{:.2f} fps",
             fs::path(log).filename().string(), index->size(),
             index->corrupted_frames(), index->clamped_frames(),
             index->estimated_frame_rate());
    indices.push_back(index);
    by_log[log] = std::move(index);
  }
  TIMER_END(index_frame_logs);

  if (cfg_.label_frames) {
    TIMER_START(label_frames);
    result.labeled_logs = label_frames(logs, indices);
    TIMER_END(label_frames);
  }

  // **--- PHASE 3: PLAN ---**

  windows_ = SegmentPlanner(PlannerSettings::from(cfg_)).plan(gestures_.events());
  size_t planned_ok = 0, truncated = 0;
  for (const auto &w : windows_) {
    planned_ok += w.accepted ? 1 : 0;
    truncated += w.truncated ? 1 : 0;
  }
  LOG_INFO("Planned {} windows: {} long enough, {} truncated by the next "
           "gesture",
           windows_.size(), planned_ok, truncated);

  // **--- PHASE 4: CAMERA WORKERS ---**

  const auto &cameras = catalog.cameras();
  result.cameras_processed = cameras.size();
  if (cameras.empty()) {
    LOG_WARN("No cameras to process for participant {}", cfg_.participant_id);
  } else {
    const int workers =
        calculate_camera_workers(cfg_.parallel_cameras, cameras.size());
    const auto cpus = get_available_cpus();

    /// Disjoint CPU sets, one per worker
    std::vector<std::vector<int>> cpu_sets(workers);
    const size_t per_worker =
        std::max<size_t>(1, cpus.size() / static_cast<size_t>(workers));
    for (int w = 0; w < workers; ++w) {
      const size_t first = static_cast<size_t>(w) * per_worker;
      const size_t last = std::min(cpus.size(), first + per_worker);
      for (size_t c = first; c < last; ++c) {
        cpu_sets[w].push_back(cpus[c]);
      }
    }

    LOG_PHASE("================== CAMERA WORKERS ==================");
    LOG_INFO("Cameras: {}", cameras.size());
    LOG_INFO("Workers: {}", workers);
    LOG_INFO("Available CPUs: {}", cpus.size());

    WorkQueue<CameraJob> queue;
    for (const auto &cam : cameras) {
      queue.push({&cam, by_log.at(cam.log_path)});
    }
    queue.finish();

    TIMER_START(cut_segments);
    std::vector<std::thread> threads;
    for (int w = 0; w < workers; ++w) {
      threads.emplace_back(&ParticipantPipeline::camera_worker, this, w,
                           std::cref(cpu_sets[w]), std::ref(queue));
    }
    for (auto &t : threads) {
      t.join();
    }
    TIMER_END(cut_segments);
  }

  // **--- PHASE 5: MANIFEST ---**

  manifest_.finalize();
  result.manifest_path =
      Layout::manifest_path(cfg_.base_path, cfg_.participant_id);
  manifest_.write_csv(result.manifest_path);
  LOG_SUCCESS("Wrote {} records to {}", manifest_.size(), result.manifest_path);

  result.skipped.insert(result.skipped.end(), failed_.begin(), failed_.end());
  result.stats = manifest_.stats();
  result.cancelled = stop_requested();

  const double wall_clock_sec = elapsed_us(run_start) / 1000000.0;
  print_run_summary(result, wall_clock_sec);
  return result;
}

void ParticipantPipeline::print_run_summary(const RunResult &result,
                                            double wall_clock_sec) const {
  manifest_.print_summary();

  fmt::print("{:<25} {:>25}\n", "Clips written:", clips_written_.load());
  fmt::print("{:<25} {:>25}\n", "Frames written:", frames_written_.load());
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:", format_time(wall_clock_sec));

  const auto distribution = gestures_.distribution();
  if (!distribution.empty()) {
    fmt::print("\n{:<30} {:>10}\n", "Gesture", "Events");
    fmt::print("{:-<30} {:-<10}\n", "", "");
    for (const auto &[name, count] : distribution) {
      fmt::print("{:<30} {:>10}\n", name, count);
    }
  }

  if (!result.skipped.empty()) {
    fmt::print(fg(fmt::color::yellow), "\nSkipped cameras:\n");
    for (const auto &s : result.skipped) {
      fmt::print(fg(fmt::color::yellow), "  - {} ({})\n", s.camera_id,
                 s.reason);
    }
  }
  if (result.cancelled) {
    fmt::print(fg(fmt::color::red),
               "\nRun was cancelled; the manifest covers finished work only\n");
  }
  std::fflush(stdout);

  TimingCollector::print_summary();
}

} // namespace gesture_slicer
