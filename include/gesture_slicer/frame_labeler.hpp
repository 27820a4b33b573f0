/**
 * @file frame_labeler.hpp
 * @brief Per-frame gesture labels for camera frame logs
 *
 * @details Each cleaned frame gets the name of the most recent gesture whose
 *          onset is at or before the frame time, or "none" before the first
 *          gesture. Output columns: frame_index, timestamp, gesture_name.
 */

#ifndef GESTURE_SLICER_FRAME_LABELER_HPP
#define GESTURE_SLICER_FRAME_LABELER_HPP

#include <string>

namespace gesture_slicer {

class GestureEventLog;
class TimestampIndex;

class FrameLabeler {
public:
  explicit FrameLabeler(const GestureEventLog &gestures)
      : gestures_(gestures) {}

  /// Labeled CSV text for one index
  std::string render(const TimestampIndex &index) const;

  /**
   * @brief Write render(index) to `path`.
   * @throws std::system_error when the file cannot be written
   * @return Number of labeled frames
   */
  size_t write(const TimestampIndex &index, const std::string &path) const;

private:
  const GestureEventLog &gestures_;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_FRAME_LABELER_HPP
