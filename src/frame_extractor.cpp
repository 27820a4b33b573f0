/**
 * @file frame_extractor.cpp
 * @brief Per-camera frame range lookup implementation
 */

#include "gesture_slicer/frame_extractor.hpp"

#include <stdexcept>

namespace gesture_slicer {

FrameExtractor::FrameExtractor(CameraStream camera,
                               std::shared_ptr<const TimestampIndex> index)
    : camera_(std::move(camera)), index_(std::move(index)) {
  if (!index_)
    throw std::invalid_argument("camera " + camera_.camera_id +
                                " has no timestamp index");
}

ExtractedRange FrameExtractor::extract(const SegmentWindow &window) const {
  ExtractedRange out;
  out.modality = camera_.modality;

  if (!window.accepted) {
    out.status = SegmentStatus::TooShort;
    return out;
  }

  out.range =
      index_->frame_range_for_window(window.effective_start, window.effective_end);
  out.status =
      out.range.empty() ? SegmentStatus::NoFrames : SegmentStatus::FramesFound;
  return out;
}

} // namespace gesture_slicer
