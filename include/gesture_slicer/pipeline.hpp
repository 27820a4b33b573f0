/**
 * @file pipeline.hpp
 * @brief Participant run orchestration
 *
 * @details The ParticipantPipeline class drives one participant end to end:
 *
 *          1. Load the gesture log
 *
 *          2. Discover cameras and index their frame logs
 *
 *          3. Optionally label every frame with its active gesture
 *
 *          4. Plan one window per gesture
 *
 *          5. Launch camera workers; each cuts its camera's clips in gesture
 *             order and appends a manifest record per gesture
 *
 *          6. Finalize and write training_summary.csv, print the summary
 *
 * @note Camera workers are pinned to disjoint CPU sets the way the batch
 *       streams are, and every worker log line is prefixed with its camera.
 */

#ifndef GESTURE_SLICER_PIPELINE_HPP
#define GESTURE_SLICER_PIPELINE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "camera_catalog.hpp"
#include "config.hpp"
#include "gesture_log.hpp"
#include "manifest.hpp"
#include "timestamp_index.hpp"
#include "types.hpp"
#include "work_queue.hpp"

namespace gesture_slicer {

/**
 * @class RunControl
 * @brief Cooperative cancellation flag shared with signal handlers.
 * @note Workers check it between gestures; finished clips are kept.
 */
class RunControl {
  std::atomic<bool> stop_{false};

public:
  void request_stop() { stop_.store(true, std::memory_order_relaxed); }
  bool stop_requested() const {
    return stop_.load(std::memory_order_relaxed);
  }
};

/**
 * @struct RunResult
 * @brief What a participant run produced.
 */
struct RunResult {
  ManifestStats stats;
  std::vector<SkippedCamera> skipped; //< Excluded, missing media, or failed
  std::string manifest_path;
  size_t cameras_processed = 0;
  size_t labeled_logs = 0;
  bool cancelled = false;
};

class ParticipantPipeline {
public:
  /**
   * @param cfg Validated configuration; must outlive the pipeline
   * @param control Optional cancellation flag
   */
  explicit ParticipantPipeline(const PipelineConfig &cfg,
                               RunControl *control = nullptr);

  /**
   * @brief Run the participant.
   * @note Each call starts from an empty manifest, so a pipeline can be run
   *       again after its inputs change.
   * @throws MalformedLogError for an unusable gesture or frame log
   * @throws std::system_error / std::filesystem::filesystem_error when the
   *         manifest cannot be written
   */
  RunResult run();

  const ManifestBuilder &manifest() const { return manifest_; }
  const std::vector<SegmentWindow> &windows() const { return windows_; }

private:
  /**
   * @struct CameraJob
   * @brief One unit of worker input.
   */
  struct CameraJob {
    const CameraEntry *camera = nullptr;
    std::shared_ptr<const TimestampIndex> index;
  };

  const PipelineConfig &cfg_;
  RunControl *control_;

  GestureEventLog gestures_;
  std::vector<SegmentWindow> windows_;
  ManifestBuilder manifest_;

  std::mutex failed_mutex_;
  std::vector<SkippedCamera> failed_; //< Cameras a worker had to abandon

  PaddedAtomic<int64_t> clips_written_;
  PaddedAtomic<int64_t> frames_written_;

  bool stop_requested() const {
    return control_ && control_->stop_requested();
  }

  /**
   * @brief Worker thread body: pin, then process cameras until the queue
   *        is drained.
   */
  void camera_worker(int worker_id, const std::vector<int> &cpu_set,
                     WorkQueue<CameraJob> &queue);

  /**
   * @brief Cut (or account, in stats-only mode) every gesture of a camera.
   * @return false when cancelled part way
   */
  bool process_camera(const CameraJob &job);

  /// Record fields common to every outcome
  SegmentRecord make_record(const CameraEntry &camera, size_t gesture_order,
                            const GestureEvent &event,
                            const SegmentWindow &window) const;

  void accept(SegmentRecord &record, int segment_index,
              const std::string &out_dir) const;
  void reject(SegmentRecord &record, SegmentStatus reason) const;

  size_t label_frames(const std::vector<std::string> &logs,
                      const std::vector<std::shared_ptr<const TimestampIndex>>
                          &indices) const;

  void print_run_summary(const RunResult &result, double wall_clock_sec) const;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_PIPELINE_HPP
