/**
 * @file config.hpp
 * @brief Run configuration built from environment variables
 *
 * @details Every tunable of a participant run lives in one PipelineConfig
 *          value. main() builds it once with PipelineConfig::from_env(),
 *          applies positional arguments, validates it and passes it by
 *          reference into the pipeline. Nothing below main() reads the
 *          environment.
 *
 * @note Environment variables:
 *
 *       - SEGMENT_DURATION_SEC, READING_TIME_CUTOFF_SEC,
 *         MIN_SEGMENT_DURATION_SEC, TARGET_FRAME_RATE
 *
 *       - BASE_PATH, GESTURE_LOG, STATS_ONLY, LABEL_FRAMES
 *
 *       - TIMESTAMP_TOLERANCE_SEC, GESTURE_CLOCK_OFFSET_SEC
 *
 *       - EXCLUDED_CAMERAS (comma separated ids), PARALLEL_CAMERAS
 */

#ifndef GESTURE_SLICER_CONFIG_HPP
#define GESTURE_SLICER_CONFIG_HPP

#include <cstdlib>
#include <string>
#include <vector>

namespace gesture_slicer {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Split a comma separated list, trimming blanks and dropping empties.
 */
std::vector<std::string> split_list(const std::string &list);

} // namespace Config

/**
 * @struct PipelineConfig
 * @brief Everything a participant run needs to know, fixed at startup.
 */
struct PipelineConfig {
  std::string participant_id;

  double segment_duration = 15.0;  //< Seconds of footage per gesture
  double reading_cutoff = 5.0;     //< Seconds after onset that are dropped
  double min_duration = 3.0;       //< Shorter windows are rejected
  double target_frame_rate = 30.0; //< Output clip rate

  std::string base_path = "dataset";
  std::string gesture_log_path; //< Empty = {base}/logs/auto_labels_{pid}.csv

  /// Plan and account segments without decoding or writing clips
  bool stats_only = false;

  /// Also write per-frame gesture labels next to each timestamp log
  bool label_frames = false;

  /// Backwards timestamp jitter accepted (and clamped) in frame logs
  double timestamp_tolerance = 0.0;

  /// Constant added to every gesture onset to align it with camera clocks
  double gesture_clock_offset = 0.0;

  std::vector<std::string> excluded_cameras;

  /// Camera worker threads (0 = auto from the CPUs available to us)
  int parallel_cameras = 0;

  /**
   * @brief Build a configuration from environment variables and defaults.
   */
  static PipelineConfig from_env();

  /**
   * @brief Reject values the planner cannot work with.
   * @throws std::invalid_argument naming the offending field
   */
  void validate() const;

  /// Gesture log location with the default applied
  std::string resolved_gesture_log() const;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_CONFIG_HPP
