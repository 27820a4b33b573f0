/**
 * @file gesture_log.hpp
 * @brief Parsed and validated gesture onset log of one participant
 *
 * @details The log is a CSV with columns gesture_index, gesture_name and
 *          timestamp (the labeling UI's Gesture_Index / Gesture / Timestamp
 *          headers are accepted too). Events are sorted by onset; timestamp
 *          order wins over row order and over gesture_index order, and any
 *          disagreement is reported as a data-quality warning.
 */

#ifndef GESTURE_SLICER_GESTURE_LOG_HPP
#define GESTURE_SLICER_GESTURE_LOG_HPP

#include <map>
#include <string>
#include <vector>

#include "types.hpp"

namespace gesture_slicer {

class CsvTable;

class GestureEventLog {
public:
  /**
   * @brief Load a gesture log from disk.
   * @param path CSV file
   * @param participant_id Copied into every event
   * @param clock_offset Seconds added to every onset
   * @throws MalformedLogError (see parse)
   */
  static GestureEventLog load(const std::string &path,
                              const std::string &participant_id,
                              double clock_offset = 0.0);

  /**
   * @brief Build a log from an already parsed table.
   * @throws MalformedLogError when a required column is missing, a
   *         timestamp or gesture index cannot be parsed, a gesture index
   *         repeats, or the table has no rows
   */
  static GestureEventLog parse(const CsvTable &table, const std::string &source,
                               const std::string &participant_id,
                               double clock_offset = 0.0);

  /// Events in ascending onset order
  const std::vector<GestureEvent> &events() const { return events_; }
  size_t size() const { return events_.size(); }

  /// False when the file rows were not already in onset order
  bool row_order_consistent() const { return row_order_consistent_; }

  /// False when ascending gesture_index does not match onset order
  bool index_order_consistent() const { return index_order_consistent_; }

  /// Number of events per gesture name
  std::map<std::string, size_t> distribution() const;

  /**
   * @brief Name of the gesture active at a given time.
   * @return Most recent gesture with onset <= t, or "none" before the first
   */
  const std::string &active_gesture(double t) const;

private:
  std::vector<GestureEvent> events_;
  bool row_order_consistent_ = true;
  bool index_order_consistent_ = true;
};

} // namespace gesture_slicer

#endif // GESTURE_SLICER_GESTURE_LOG_HPP
