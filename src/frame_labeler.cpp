/**
 * @file frame_labeler.cpp
 * @brief Per-frame gesture labels implementation
 */

#include "gesture_slicer/frame_labeler.hpp"

#include <iterator>

#include <fmt/format.h>
#include <fmt/os.h>

#include "gesture_slicer/csv_table.hpp"
#include "gesture_slicer/gesture_log.hpp"
#include "gesture_slicer/timestamp.hpp"
#include "gesture_slicer/timestamp_index.hpp"

namespace gesture_slicer {

std::string FrameLabeler::render(const TimestampIndex &index) const {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  fmt::format_to(out, "frame_index,timestamp,gesture_name\n");
  for (const auto &f : index.frames()) {
    fmt::format_to(out, "{},{},{}\n", f.frame_index,
                   format_timestamp(f.timestamp),
                   csv_escape(gestures_.active_gesture(f.timestamp)));
  }
  return fmt::to_string(buf);
}

size_t FrameLabeler::write(const TimestampIndex &index,
                           const std::string &path) const {
  const std::string text = render(index);
  auto out = fmt::output_file(path);
  out.print("{}", text);
  out.close();
  return index.size();
}

} // namespace gesture_slicer
