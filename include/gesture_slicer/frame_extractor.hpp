/**
 * @file frame_extractor.hpp
 * @brief Segment windows to concrete per-camera frame ranges
 *
 * @details One FrameExtractor exists per camera stream. It resolves the
 *          shared windows against that camera's own TimestampIndex, so a
 *          camera without frames in a window fails alone; the other cameras
 *          of the same gesture are unaffected.
 */

#ifndef GESTURE_SLICER_FRAME_EXTRACTOR_HPP
#define GESTURE_SLICER_FRAME_EXTRACTOR_HPP

#include <memory>

#include "timestamp_index.hpp"
#include "types.hpp"

namespace gesture_slicer {

/**
 * @struct ExtractedRange
 * @brief Frame range of one (camera, window) pair.
 * @note status is FramesFound, NoFrames or TooShort.
 */
struct ExtractedRange {
  CameraModality modality = CameraModality::Webcam;
  FrameRange range;
  SegmentStatus status = SegmentStatus::Planned;
};

class FrameExtractor {
public:
  FrameExtractor(CameraStream camera,
                 std::shared_ptr<const TimestampIndex> index);

  /**
   * @brief Resolve one window for this camera.
   * @note Rejected windows are passed through as TooShort without a lookup.
   */
  ExtractedRange extract(const SegmentWindow &window) const;

  const CameraStream &camera() const { return camera_; }
  const TimestampIndex &index() const { return *index_; }

private:
  CameraStream camera_;
  std::shared_ptr<const TimestampIndex> index_;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_FRAME_EXTRACTOR_HPP
