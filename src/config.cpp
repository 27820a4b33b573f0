/**
 * @file config.cpp
 * @brief PipelineConfig construction and validation
 */

#include "gesture_slicer/config.hpp"

#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>

namespace gesture_slicer {

namespace Config {

std::vector<std::string> split_list(const std::string &list) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= list.size()) {
    size_t end = list.find(',', pos);
    if (end == std::string::npos)
      end = list.size();

    std::string item = list.substr(pos, end - pos);
    size_t first = item.find_first_not_of(" \t");
    size_t last = item.find_last_not_of(" \t");
    if (first != std::string::npos)
      items.push_back(item.substr(first, last - first + 1));

    pos = end + 1;
  }
  return items;
}

} // namespace Config

PipelineConfig PipelineConfig::from_env() {
  PipelineConfig cfg;
  cfg.segment_duration =
      Config::get_env_double("SEGMENT_DURATION_SEC", cfg.segment_duration);
  cfg.reading_cutoff =
      Config::get_env_double("READING_TIME_CUTOFF_SEC", cfg.reading_cutoff);
  cfg.min_duration =
      Config::get_env_double("MIN_SEGMENT_DURATION_SEC", cfg.min_duration);
  cfg.target_frame_rate =
      Config::get_env_double("TARGET_FRAME_RATE", cfg.target_frame_rate);
  cfg.base_path = Config::get_env_string("BASE_PATH", cfg.base_path);
  cfg.gesture_log_path = Config::get_env_string("GESTURE_LOG", "");
  cfg.stats_only = (Config::get_env_int("STATS_ONLY", 0) != 0);
  cfg.label_frames = (Config::get_env_int("LABEL_FRAMES", 0) != 0);
  cfg.timestamp_tolerance = Config::get_env_double("TIMESTAMP_TOLERANCE_SEC",
                                                   cfg.timestamp_tolerance);
  cfg.gesture_clock_offset = Config::get_env_double(
      "GESTURE_CLOCK_OFFSET_SEC", cfg.gesture_clock_offset);
  cfg.excluded_cameras =
      Config::split_list(Config::get_env_string("EXCLUDED_CAMERAS", ""));
  cfg.parallel_cameras = Config::get_env_int("PARALLEL_CAMERAS", 0);
  return cfg;
}

void PipelineConfig::validate() const {
  if (participant_id.empty())
    throw std::invalid_argument("participant id must not be empty");
  if (!(segment_duration > 0.0))
    throw std::invalid_argument(
        fmt::format("segment duration must be positive (got {})",
                    segment_duration));
  if (!(target_frame_rate > 0.0))
    throw std::invalid_argument(
        fmt::format("target frame rate must be positive (got {})",
                    target_frame_rate));
  if (reading_cutoff < 0.0)
    throw std::invalid_argument(fmt::format(
        "reading time cutoff must not be negative (got {})", reading_cutoff));
  if (min_duration < 0.0)
    throw std::invalid_argument(fmt::format(
        "minimum segment duration must not be negative (got {})",
        min_duration));
  if (timestamp_tolerance < 0.0)
    throw std::invalid_argument(
        fmt::format("timestamp tolerance must not be negative (got {})",
                    timestamp_tolerance));
  if (parallel_cameras < 0)
    throw std::invalid_argument(
        fmt::format("parallel cameras must not be negative (got {})",
                    parallel_cameras));
}

std::string PipelineConfig::resolved_gesture_log() const {
  if (!gesture_log_path.empty())
    return gesture_log_path;
  namespace fs = std::filesystem;
  return (fs::path(base_path) / "logs" /
          fmt::format("auto_labels_{}.csv", participant_id))
      .string();
}

} // namespace gesture_slicer
