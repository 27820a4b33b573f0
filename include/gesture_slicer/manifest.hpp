/**
 * @file manifest.hpp
 * @brief Per-run table of segment records and its CSV rendering
 *
 * @details Camera workers append one SegmentRecord per (camera, gesture)
 *          pair while they run. finalize() puts the records in a fixed
 *          order so the rendered training_summary.csv does not depend on
 *          worker scheduling.
 *
 * @attention THREAD MODEL:
 *            - append() may be called from any worker
 *
 *            - Everything else is meant for the coordinating thread once the
 *              workers have been joined
 */

#ifndef GESTURE_SLICER_MANIFEST_HPP
#define GESTURE_SLICER_MANIFEST_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace gesture_slicer {

/**
 * @struct CameraTally
 * @brief Accepted and rejected counts of one camera.
 */
struct CameraTally {
  size_t accepted = 0;
  size_t rejected = 0;
};

/**
 * @struct ManifestStats
 * @brief Aggregates over all records.
 */
struct ManifestStats {
  size_t total = 0;
  size_t accepted = 0;
  size_t rejected = 0;
  std::map<std::string, size_t> rejected_by_reason; //< Keyed by status name
  std::map<std::string, CameraTally> per_camera;
  double training_minutes = 0.0;
};

class ManifestBuilder {
public:
  /// Column names of training_summary.csv, in order
  static const std::vector<std::string> &columns();

  /**
   * @brief Add one record.
   * @throws std::logic_error after finalize()
   */
  void append(SegmentRecord record);

  /**
   * @brief Sort by (camera order, gesture order) and freeze the table.
   * @note Calling it twice is harmless.
   */
  void finalize();

  bool finalized() const;
  size_t size() const;

  /// Drop every record and reopen the table for a fresh run
  void reset();

  /// Records in their current order (final order after finalize())
  const std::vector<SegmentRecord> &records() const { return records_; }

  ManifestStats stats() const;

  /// CSV text with header, one line per record, '\n' line endings
  std::string render_csv() const;

  /**
   * @brief Write render_csv() to `path`, creating parent directories.
   * @throws std::system_error when the file cannot be written
   */
  void write_csv(const std::string &path) const;

  /// Totals and per-camera table on stdout
  void print_summary() const;

private:
  mutable std::mutex mutex_;
  std::vector<SegmentRecord> records_;
  bool finalized_ = false;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_MANIFEST_HPP
