/**
 * @file segment_encoder.hpp
 * @brief Frame-rate normalization and clip writing for one segment
 *
 * @details A segment's cleaned source frames are mapped onto a fixed number
 *          of output slots at the target rate, then pulled from a
 *          FrameSource and pushed into a FrameSink in slot order.
 *
 * @note Output slot k takes source frame src[floor(k * M / N)], M being the
 *       number of source frames and N the number of output frames, so
 *       frames are dropped (M > N) or duplicated (M < N) at an even stride.
 */

#ifndef GESTURE_SLICER_SEGMENT_ENCODER_HPP
#define GESTURE_SLICER_SEGMENT_ENCODER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "video_io.hpp"

namespace gesture_slicer {

/**
 * @brief Number of frames a clip of `duration` seconds has at `frame_rate`.
 * @return max(1, round(duration * frame_rate))
 */
int64_t target_frame_count(double duration, double frame_rate);

/**
 * @brief Container positions to emit, one per output slot.
 * @param source_frames Cleaned frame indices of the segment (M entries)
 * @param output_frames Number of output slots (N)
 * @return N frame indices; empty when source_frames is empty
 */
std::vector<int64_t> make_resample_plan(const std::vector<int64_t> &source_frames,
                                        int64_t output_frames);

/// Gesture name reduced to [A-Za-z0-9_-]; "gesture" when nothing remains
std::string sanitize_gesture_name(std::string_view name);

/// "p{pid}_cam{cam}_seg{idx:03d}"
std::string segment_id(const std::string &participant_id,
                       const std::string &camera_id, int segment_index);

/// "p{pid}_cam{cam}_g{gesture_index}_rejected"
std::string rejected_segment_id(const std::string &participant_id,
                                const std::string &camera_id,
                                int64_t gesture_index);

/// "p{pid}_cam{cam}_seg{idx:03d}_{sanitized gesture}.mp4"
std::string segment_filename(const std::string &participant_id,
                             const std::string &camera_id, int segment_index,
                             std::string_view gesture_name);

/**
 * @struct EncodeResult
 * @brief Outcome of one clip.
 */
struct EncodeResult {
  bool ok = false;
  int64_t frames_written = 0;
  int64_t frames_repeated = 0; //< Slots filled from an earlier frame
  std::string error;
};

/**
 * @class SegmentEncoder
 * @brief Drives one clip through a FrameSource and a FrameSink.
 *
 * @attention
 * `UNDECODABLE FRAMES`:
 *
 *            - A slot whose source frame cannot be decoded repeats the last
 *              frame written (leading slots take the first decodable
 *              frame), so the clip keeps its planned length
 *
 *            - A clip without a single decodable frame fails
 */
class SegmentEncoder {
public:
  explicit SegmentEncoder(double target_frame_rate)
      : target_frame_rate_(target_frame_rate) {}

  double target_frame_rate() const { return target_frame_rate_; }

  /**
   * @brief Resample plan for a segment of `duration` seconds.
   */
  std::vector<int64_t> plan(const std::vector<int64_t> &source_frames,
                            double duration) const {
    return make_resample_plan(source_frames,
                              target_frame_count(duration, target_frame_rate_));
  }

  /**
   * @brief Write every planned frame to `sink` and finish it.
   * @note The sink is finished even when writing fails part way.
   */
  EncodeResult encode(const std::vector<int64_t> &plan, FrameSource &source,
                      FrameSink &sink) const;

private:
  double target_frame_rate_;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_SEGMENT_ENCODER_HPP
