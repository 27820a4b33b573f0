/**
 * @file segment_encoder.cpp
 * @brief Frame-rate normalization and clip writing implementation
 */

#include "gesture_slicer/segment_encoder.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

#include <fmt/core.h>

namespace gesture_slicer {

namespace {

bool keep_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_';
}

struct FrameDeleter {
  void operator()(AVFrame *f) const { av_frame_free(&f); }
};

} // anonymous namespace

int64_t target_frame_count(double duration, double frame_rate) {
  return std::max<int64_t>(1, std::llround(duration * frame_rate));
}

std::vector<int64_t>
make_resample_plan(const std::vector<int64_t> &source_frames,
                   int64_t output_frames) {
  std::vector<int64_t> plan;
  if (source_frames.empty() || output_frames <= 0)
    return plan;

  const int64_t m = static_cast<int64_t>(source_frames.size());
  plan.reserve(static_cast<size_t>(output_frames));
  for (int64_t k = 0; k < output_frames; ++k) {
    plan.push_back(source_frames[static_cast<size_t>(k * m / output_frames)]);
  }
  return plan;
}

std::string sanitize_gesture_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  bool in_run = false;
  for (char c : name) {
    if (keep_char(c)) {
      out.push_back(c);
      in_run = false;
    } else if (!in_run) {
      out.push_back('_');
      in_run = true;
    }
  }

  size_t first = out.find_first_not_of('_');
  if (first == std::string::npos)
    return "gesture";
  size_t last = out.find_last_not_of('_');
  return out.substr(first, last - first + 1);
}

std::string segment_id(const std::string &participant_id,
                       const std::string &camera_id, int segment_index) {
  return fmt::format("p{}_cam{}_seg{:03d}", participant_id, camera_id,
                     segment_index);
}

std::string rejected_segment_id(const std::string &participant_id,
                                const std::string &camera_id,
                                int64_t gesture_index) {
  return fmt::format("p{}_cam{}_g{}_rejected", participant_id, camera_id,
                     gesture_index);
}

std::string segment_filename(const std::string &participant_id,
                             const std::string &camera_id, int segment_index,
                             std::string_view gesture_name) {
  return fmt::format("{}_{}.mp4",
                     segment_id(participant_id, camera_id, segment_index),
                     sanitize_gesture_name(gesture_name));
}

EncodeResult SegmentEncoder::encode(const std::vector<int64_t> &plan,
                                    FrameSource &source,
                                    FrameSink &sink) const {
  EncodeResult result;
  std::unique_ptr<AVFrame, FrameDeleter> last;
  int64_t leading_gap = 0; //< Slots seen before the first decodable frame

  for (int64_t position : plan) {
    const AVFrame *f = source.frame_at(position);
    int64_t copies = 1;
    if (f) {
      /// Keep a reference; the source reuses its buffer on the next call
      last.reset(av_frame_clone(f));
      if (!last) {
        result.error = "out of memory cloning a decoded frame";
        break;
      }
      /// Leading slots are filled with the first decodable frame
      copies += leading_gap;
      result.frames_repeated += leading_gap;
      leading_gap = 0;
    } else if (last) {
      ++result.frames_repeated;
    } else {
      ++leading_gap;
      continue;
    }

    for (int64_t c = 0; c < copies && result.error.empty(); ++c) {
      if (!sink.write(last.get()))
        result.error = fmt::format("writing frame {} failed", position);
      else
        ++result.frames_written;
    }
    if (!result.error.empty())
      break;
  }

  const bool finished = sink.finish();

  if (result.error.empty()) {
    if (result.frames_written == 0)
      result.error = "no decodable frame in range";
    else if (!finished)
      result.error = "finalizing clip failed";
    else
      result.ok = true;
  }
  return result;
}

} // namespace gesture_slicer
