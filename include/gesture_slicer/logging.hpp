/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase durations
 *
 * @note All logs use fmt::print and are flushed immediately so that camera
 *       worker output interleaves line by line.
 */

#ifndef GESTURE_SLICER_LOGGING_HPP
#define GESTURE_SLICER_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace gesture_slicer {

// **----- LOGGING CONFIGURATION -----**

#ifndef GESTURE_SLICER_ENABLE_LOGGING
#define GESTURE_SLICER_ENABLE_LOGGING 1
#endif

#ifndef GESTURE_SLICER_ENABLE_TIMING
#define GESTURE_SLICER_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if GESTURE_SLICER_ENABLE_LOGGING
/// One styled line, written and flushed under log_mutex
#define GESTURE_SLICER_LOG_LINE(style, format_str, ...)                        \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(gesture_slicer::log_mutex);               \
    fmt::print(style, format_str "\n", ##__VA_ARGS__);                         \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  GESTURE_SLICER_LOG_LINE(fmt::text_style(), "[INFO] " format_str,             \
                          ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  GESTURE_SLICER_LOG_LINE(fg(fmt::color::yellow), "[WARN] " format_str,        \
                          ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  GESTURE_SLICER_LOG_LINE(fg(fmt::color::red), "[ERROR] " format_str,          \
                          ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  GESTURE_SLICER_LOG_LINE(fg(fmt::color::cyan), format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  GESTURE_SLICER_LOG_LINE(fg(fmt::color::green), format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Phase or camera name
  long microseconds; //< Duration in microseconds
};

/**
 * @struct TimingTotal
 * @brief All records of one name folded together.
 */
struct TimingTotal {
  std::string name;
  size_t calls = 0;
  long microseconds = 0;
};

/// Prefix of the entries camera workers record ("camera 1", ...)
constexpr const char *CAMERA_TIMING_PREFIX = "camera ";

/**
 * @class TimingCollector
 * @brief Thread-safe collector for phase timings.
 * @note Camera workers record their own totals here; the pipeline prints the
 *       table once the run is over.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Entries merged by name, in first-recorded order.
   */
  static std::vector<TimingTotal> totals();

  /**
   * @brief Print run phases, then per-camera times and their sum.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   * @note Called at the start of every participant run.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if GESTURE_SLICER_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    gesture_slicer::TimingCollector::record(#name, timer_duration_##name);     \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace gesture_slicer

#endif // GESTURE_SLICER_LOGGING_HPP
