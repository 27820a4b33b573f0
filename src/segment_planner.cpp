/**
 * @file segment_planner.cpp
 * @brief Segment window planning implementation
 */

#include "gesture_slicer/segment_planner.hpp"

#include <algorithm>

#include "gesture_slicer/config.hpp"

namespace gesture_slicer {

PlannerSettings PlannerSettings::from(const PipelineConfig &cfg) {
  PlannerSettings s;
  s.segment_duration = cfg.segment_duration;
  s.reading_cutoff = cfg.reading_cutoff;
  s.min_duration = cfg.min_duration;
  return s;
}

std::vector<SegmentWindow>
SegmentPlanner::plan(const std::vector<GestureEvent> &events) const {
  std::vector<SegmentWindow> windows;
  windows.reserve(events.size());

  for (size_t i = 0; i < events.size(); ++i) {
    const double onset = events[i].onset_timestamp;

    SegmentWindow w;
    w.gesture_index = events[i].gesture_index;
    w.requested_start = onset + settings_.reading_cutoff;
    w.requested_end = w.requested_start + settings_.segment_duration;
    w.effective_start = w.requested_start;
    w.effective_end = w.requested_end;

    if (i + 1 < events.size()) {
      const double next_onset = events[i + 1].onset_timestamp;
      if (next_onset < w.requested_end) {
        w.effective_end = std::min(w.requested_end, next_onset);
        w.truncated = true;
      }
    }

    /// A next onset inside the reading phase leaves end < start: rejected
    w.accepted = w.effective_end >= w.effective_start &&
                 w.duration() + DURATION_EPSILON >= settings_.min_duration;
    windows.push_back(w);
  }
  return windows;
}

} // namespace gesture_slicer
