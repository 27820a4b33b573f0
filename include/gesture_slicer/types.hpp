/**
 * @file types.hpp
 * @brief Core data types and constants for Gesture Slicer
 *
 * @details Contains the data structures shared by every stage:
 *          - Camera modalities and stream descriptions
 *
 *          - Frame records and frame ranges
 *
 *          - Gesture events and planned segment windows
 *
 *          - Segment status and manifest records
 */

#ifndef GESTURE_SLICER_TYPES_HPP
#define GESTURE_SLICER_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace gesture_slicer {

// **----- CONSTANTS -----**

/**
 * @brief Size of the I/O buffer handed to FFmpeg for reading mapped media.
 */
constexpr size_t AVIO_BUFFER_SIZE = 256 * 1024; //< 256KB

/**
 * @brief CPU cache line size for alignment of per-thread counters.
 */
#ifndef GESTURE_SLICER_CACHE_LINE_SIZE
#define GESTURE_SLICER_CACHE_LINE_SIZE 64 //< Set by the build from a probe
#endif
constexpr size_t CACHE_LINE_SIZE = GESTURE_SLICER_CACHE_LINE_SIZE;

/**
 * @brief Tolerance used for boundary-inclusive comparisons of durations.
 * @note Durations are differences of epoch seconds; 1us is far below the
 *       frame period of any camera.
 */
constexpr double DURATION_EPSILON = 1e-6;

// **----- CAMERAS -----**

/**
 * @enum CameraModality
 * @brief Distinct video signal produced by a sensor.
 * @note The three Azure modalities share one capture clock (one timestamp
 *       log) but have independent media files.
 */
enum class CameraModality { Webcam, AzureColor, AzureDepth, AzureIr };

/// Lower-case name used in logs and camera ids ("webcam", "azure_color", ...)
const char *modality_name(CameraModality modality);

/// True for the modalities recorded by the Azure Kinect
inline bool is_azure(CameraModality modality) {
  return modality != CameraModality::Webcam;
}

/**
 * @struct Resolution
 * @brief Frame size in pixels (0x0 when the media was not probed).
 */
struct Resolution {
  int width = 0;
  int height = 0;
};

/**
 * @struct CameraStream
 * @brief One camera (or one Azure modality) of a participant recording.
 */
struct CameraStream {
  std::string camera_id;    //< "1", "2", ..., "azure_color", ...
  CameraModality modality = CameraModality::Webcam;
  double native_frame_rate = 0.0; //< Container rate, or estimated from log
  Resolution resolution;
};

// **----- FRAMES -----**

/**
 * @struct FrameRecord
 * @brief A single row of a camera frame-timestamp log after cleaning.
 */
struct FrameRecord {
  int64_t frame_index; //< Position of the frame in the media container
  double timestamp;    //< Capture time in seconds
};

/**
 * @struct FrameRange
 * @brief Inclusive range of cleaned frames that fall inside a time window.
 * @note first_position is the offset into the cleaned index; count is the
 *       number of cleaned records in the range (which may be fewer than
 *       last_frame - first_frame + 1 when corrupted rows were dropped).
 */
struct FrameRange {
  int64_t first_frame = 0;
  int64_t last_frame = -1;
  size_t first_position = 0;
  size_t count = 0;

  bool empty() const { return count == 0; }
};

// **----- GESTURES AND WINDOWS -----**

/**
 * @struct GestureEvent
 * @brief Labeled onset of one gesture.
 */
struct GestureEvent {
  std::string participant_id;
  int64_t gesture_index = 0; //< Unique key within the log
  std::string gesture_name;
  double onset_timestamp = 0.0; //< Seconds, after clock offset
  size_t row = 0;               //< 0-based data row in the source file
};

/**
 * @struct SegmentWindow
 * @brief Time window planned for one gesture, shared by all cameras.
 */
struct SegmentWindow {
  int64_t gesture_index = 0;
  double requested_start = 0.0;
  double requested_end = 0.0;
  double effective_start = 0.0;
  double effective_end = 0.0;
  bool truncated = false; //< Shortened by the next gesture's onset
  bool accepted = false;  //< Passed the minimum-duration filter

  double duration() const { return effective_end - effective_start; }
};

// **----- SEGMENT STATE -----**

/**
 * @enum SegmentStatus
 * @brief Lifecycle of one (camera, gesture) segment.
 *
 * @attention TRANSITIONS:
 *
 *   PLANNED -> FRAMES_FOUND -> ENCODED -> ACCEPTED
 *
 *   PLANNED -> NO_FRAMES -> REJECTED
 *
 *   PLANNED -> TOO_SHORT -> REJECTED
 *
 *   FRAMES_FOUND -> ENCODE_FAILED -> REJECTED
 */
enum class SegmentStatus {
  Planned,
  FramesFound,
  Encoded,
  Accepted,
  NoFrames,
  TooShort,
  EncodeFailed,
  Rejected
};

/// Name used in logs and the rejection-reason column
const char *status_name(SegmentStatus status);

/**
 * @struct SegmentRecord
 * @brief One manifest row. Immutable once appended to the manifest.
 */
struct SegmentRecord {
  std::string participant_id;
  std::string camera_id;
  size_t camera_order = 0;  //< Position of the camera in the catalog
  size_t gesture_order = 0; //< Position of the gesture in onset order
  std::string segment_id;
  std::string gesture_name;
  int64_t gesture_index = 0;
  double gesture_time = 0.0;
  double start_time = 0.0;
  double end_time = 0.0;
  double duration = 0.0;
  double training_duration = 0.0;
  bool reading_time_excluded = false;
  bool training_ready = false;
  SegmentStatus reason = SegmentStatus::Planned; //< Terminal cause
  int64_t frame_count = 0; //< Frames written (or planned in stats mode)
  std::string filename;
  std::string filepath;
};

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 * @note Used for per-run counters updated by several camera workers.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  PaddedAtomic() = default;
  explicit PaddedAtomic(T v) : value(v) {}

  T load(std::memory_order order = std::memory_order_seq_cst) const {
    return value.load(order);
  }
  void store(T v, std::memory_order order = std::memory_order_seq_cst) {
    value.store(v, order);
  }
  T operator++() { return ++value; }
  T operator++(int) { return value++; }
  PaddedAtomic &operator+=(T v) {
    value += v;
    return *this;
  }
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_TYPES_HPP
