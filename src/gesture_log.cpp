/**
 * @file gesture_log.cpp
 * @brief Gesture onset log implementation
 */

#include "gesture_slicer/gesture_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iterator>
#include <set>

#include <fmt/core.h>

#include "gesture_slicer/csv_table.hpp"
#include "gesture_slicer/errors.hpp"
#include "gesture_slicer/logging.hpp"
#include "gesture_slicer/timestamp.hpp"

namespace gesture_slicer {

namespace {

const std::string kNoGesture = "none";

bool parse_gesture_index(const std::string &text, int64_t &out) {
  size_t first = text.find_first_not_of(" \t\"");
  size_t last = text.find_last_not_of(" \t\"");
  if (first == std::string::npos)
    return false;
  std::string s = text.substr(first, last - first + 1);

  errno = 0;
  char *end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end != s.c_str() + s.size())
    return false;
  out = static_cast<int64_t>(v);
  return true;
}

std::string trimmed(const std::string &text) {
  size_t first = text.find_first_not_of(" \t");
  if (first == std::string::npos)
    return "";
  size_t last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

} // anonymous namespace

GestureEventLog GestureEventLog::load(const std::string &path,
                                      const std::string &participant_id,
                                      double clock_offset) {
  CsvTable table;
  if (!CsvTable::load(path, table))
    throw MalformedLogError(path, "gesture log is missing or empty");
  return parse(table, path, participant_id, clock_offset);
}

GestureEventLog GestureEventLog::parse(const CsvTable &table,
                                       const std::string &source,
                                       const std::string &participant_id,
                                       double clock_offset) {
  auto idx_col = table.column({"gesture_index"});
  auto name_col = table.column({"gesture_name", "gesture"});
  auto ts_col = table.column({"timestamp", "time"});
  if (!idx_col || !name_col || !ts_col) {
    throw MalformedLogError(
        source, "gesture log needs gesture_index, gesture_name and timestamp "
                "columns");
  }
  if (table.row_count() == 0)
    throw MalformedLogError(source, "gesture log has no events");

  GestureEventLog log;
  log.events_.reserve(table.row_count());
  std::set<int64_t> seen;

  for (size_t row = 0; row < table.row_count(); ++row) {
    const auto &fields = table.rows()[row];
    size_t needed = std::max({*idx_col, *name_col, *ts_col});
    if (needed >= fields.size()) {
      throw MalformedLogError(source,
                              fmt::format("row {} has too few fields", row + 1));
    }

    GestureEvent ev;
    ev.participant_id = participant_id;
    ev.row = row;
    ev.gesture_name = trimmed(fields[*name_col]);

    if (!parse_gesture_index(fields[*idx_col], ev.gesture_index)) {
      throw MalformedLogError(
          source, fmt::format("row {}: unparsable gesture_index '{}'", row + 1,
                              fields[*idx_col]));
    }
    if (!parse_timestamp(fields[*ts_col], ev.onset_timestamp)) {
      throw MalformedLogError(source,
                              fmt::format("row {}: unparsable timestamp '{}'",
                                          row + 1, fields[*ts_col]));
    }
    ev.onset_timestamp += clock_offset;

    if (!seen.insert(ev.gesture_index).second) {
      throw MalformedLogError(
          source,
          fmt::format("gesture_index {} appears more than once", ev.gesture_index));
    }
    log.events_.push_back(std::move(ev));
  }

  /// Timestamp order is authoritative; stable sort keeps row order for ties
  std::stable_sort(log.events_.begin(), log.events_.end(),
                   [](const GestureEvent &a, const GestureEvent &b) {
                     return a.onset_timestamp < b.onset_timestamp;
                   });

  for (size_t i = 0; i < log.events_.size(); ++i) {
    if (log.events_[i].row != i)
      log.row_order_consistent_ = false;
    if (i > 0 &&
        log.events_[i].gesture_index < log.events_[i - 1].gesture_index)
      log.index_order_consistent_ = false;
  }

  if (!log.row_order_consistent_) {
    LOG_WARN("{}: rows are not in timestamp order; using timestamp order",
             source);
  }
  if (!log.index_order_consistent_) {
    LOG_WARN("{}: gesture_index order disagrees with timestamp order", source);
  }
  return log;
}

std::map<std::string, size_t> GestureEventLog::distribution() const {
  std::map<std::string, size_t> counts;
  for (const auto &ev : events_) {
    ++counts[ev.gesture_name];
  }
  return counts;
}

const std::string &GestureEventLog::active_gesture(double t) const {
  auto it = std::upper_bound(
      events_.begin(), events_.end(), t,
      [](double v, const GestureEvent &ev) { return v < ev.onset_timestamp; });
  if (it == events_.begin())
    return kNoGesture;
  return std::prev(it)->gesture_name;
}

} // namespace gesture_slicer
