/**
 * @file timestamp_index.hpp
 * @brief Per-camera frame position to capture time index
 *
 * @details A TimestampIndex is built once per camera log and never modified.
 *          Construction cleans the raw rows so that frame indices are
 *          strictly increasing and timestamps non-decreasing:
 *
 *          - a row whose frame index does not advance is dropped
 *
 *          - a row whose timestamp goes back by more than the tolerance is
 *            dropped
 *
 *          - a row that goes back by at most the tolerance is kept with its
 *            timestamp clamped to the previous one
 *
 *          Dropped and unparsable rows are counted as corrupted frames.
 *
 * @note The three Azure Kinect modalities share one index (one capture clock),
 *       so the index is immutable and handed around by shared_ptr<const>.
 */

#ifndef GESTURE_SLICER_TIMESTAMP_INDEX_HPP
#define GESTURE_SLICER_TIMESTAMP_INDEX_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace gesture_slicer {

class TimestampIndex {
public:
  /**
   * @brief Build an index from raw log rows in file order.
   * @param source Log path or name, used in diagnostics
   * @param raw Rows as read from the log
   * @param tolerance Backwards jitter (seconds) that is clamped, not dropped
   * @param unparsable_rows Rows the reader already had to skip
   */
  TimestampIndex(std::string source, const std::vector<FrameRecord> &raw,
                 double tolerance = 0.0, size_t unparsable_rows = 0);

  /**
   * @brief Read and index a frame-timestamp CSV.
   *
   * @note Columns: frame_index (optional; row position when absent) and
   *       timestamp. Other columns are ignored.
   *
   * @throws MalformedLogError if the file is missing or empty, has no
   *         timestamp column, or has no usable row
   */
  static TimestampIndex from_csv(const std::string &path,
                                 double tolerance = 0.0);

  /**
   * @brief Frames whose timestamps fall in [start, end].
   * @note Two binary searches; an empty range is a normal result.
   */
  FrameRange frame_range_for_window(double start, double end) const;

  /**
   * @brief Frame indices of every cleaned record in a range, ascending.
   */
  std::vector<int64_t> frame_indices(const FrameRange &range) const;

  const std::vector<FrameRecord> &frames() const { return frames_; }
  const std::string &source() const { return source_; }

  size_t size() const { return frames_.size(); }
  bool empty() const { return frames_.empty(); }

  /// Rows dropped during cleaning plus unparsable rows
  size_t corrupted_frames() const { return corrupted_; }

  /// Rows whose timestamp was clamped forward to stay monotonic
  size_t clamped_frames() const { return clamped_; }

  double first_timestamp() const;
  double last_timestamp() const;

  /**
   * @brief Average capture rate over the cleaned span.
   * @return frames per second, or 0 when fewer than two frames or no span
   */
  double estimated_frame_rate() const;

private:
  std::string source_;
  std::vector<FrameRecord> frames_;
  size_t corrupted_ = 0;
  size_t clamped_ = 0;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_TIMESTAMP_INDEX_HPP
