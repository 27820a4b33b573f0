/**
 * @file segment_planner.hpp
 * @brief Gesture onsets to non-overlapping training windows
 *
 * @details For gesture i with onset t_i:
 *
 *          1. start = t_i + reading_cutoff (the reading phase is dropped)
 *
 *          2. requested end = start + segment_duration
 *
 *          3. if t_{i+1} < requested end, the window ends at t_{i+1}; the
 *             later gesture always owns the boundary
 *
 *          4. windows shorter than min_duration (boundary inclusive) are
 *             rejected for every camera
 *
 *          Windows are planned independently; a rejected window never
 *          causes its predecessor to grow back.
 *
 * @note Every camera of a participant uses the same windows, so the planner
 *       runs once per run, before any camera is touched.
 */

#ifndef GESTURE_SLICER_SEGMENT_PLANNER_HPP
#define GESTURE_SLICER_SEGMENT_PLANNER_HPP

#include <vector>

#include "types.hpp"

namespace gesture_slicer {

struct PipelineConfig;

/**
 * @struct PlannerSettings
 * @brief The three durations the planner depends on, in seconds.
 */
struct PlannerSettings {
  double segment_duration = 15.0;
  double reading_cutoff = 5.0;
  double min_duration = 3.0;

  static PlannerSettings from(const PipelineConfig &cfg);
};

class SegmentPlanner {
public:
  explicit SegmentPlanner(PlannerSettings settings) : settings_(settings) {}

  /**
   * @brief Plan one window per event.
   * @param events Gesture events sorted by ascending onset
   * @return Windows in the same order as events
   */
  std::vector<SegmentWindow> plan(const std::vector<GestureEvent> &events) const;

  const PlannerSettings &settings() const { return settings_; }

private:
  PlannerSettings settings_;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_SEGMENT_PLANNER_HPP
