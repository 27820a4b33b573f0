/**
 * @file timestamp_index.cpp
 * @brief Per-camera timestamp index implementation
 */

#include "gesture_slicer/timestamp_index.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iterator>

#include "gesture_slicer/csv_table.hpp"
#include "gesture_slicer/errors.hpp"
#include "gesture_slicer/timestamp.hpp"

namespace gesture_slicer {

namespace {

bool parse_frame_index(const std::string &text, int64_t &out) {
  size_t first = text.find_first_not_of(" \t\"");
  size_t last = text.find_last_not_of(" \t\"");
  if (first == std::string::npos)
    return false;
  std::string s = text.substr(first, last - first + 1);

  errno = 0;
  char *end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end != s.c_str() + s.size() || v < 0)
    return false;
  out = static_cast<int64_t>(v);
  return true;
}

} // anonymous namespace

TimestampIndex::TimestampIndex(std::string source,
                               const std::vector<FrameRecord> &raw,
                               double tolerance, size_t unparsable_rows)
    : source_(std::move(source)), corrupted_(unparsable_rows) {
  frames_.reserve(raw.size());

  for (const auto &rec : raw) {
    if (frames_.empty()) {
      frames_.push_back(rec);
      continue;
    }

    const FrameRecord &prev = frames_.back();
    if (rec.frame_index <= prev.frame_index) {
      ++corrupted_;
      continue;
    }

    if (rec.timestamp < prev.timestamp) {
      if (prev.timestamp - rec.timestamp > tolerance) {
        ++corrupted_;
        continue;
      }
      frames_.push_back({rec.frame_index, prev.timestamp});
      ++clamped_;
      continue;
    }

    frames_.push_back(rec);
  }
}

TimestampIndex TimestampIndex::from_csv(const std::string &path,
                                        double tolerance) {
  CsvTable table;
  if (!CsvTable::load(path, table))
    throw MalformedLogError(path, "timestamp log is missing or empty");

  auto ts_col = table.column({"timestamp", "time"});
  if (!ts_col)
    throw MalformedLogError(path, "timestamp log has no timestamp column");
  auto idx_col = table.column({"frame_index", "frame"});

  std::vector<FrameRecord> raw;
  raw.reserve(table.row_count());
  size_t unparsable = 0;

  for (size_t row = 0; row < table.row_count(); ++row) {
    const auto &fields = table.rows()[row];

    double ts = 0.0;
    if (*ts_col >= fields.size() || !parse_timestamp(fields[*ts_col], ts)) {
      ++unparsable;
      continue;
    }

    int64_t frame = static_cast<int64_t>(row);
    if (idx_col &&
        (*idx_col >= fields.size() || !parse_frame_index(fields[*idx_col], frame))) {
      ++unparsable;
      continue;
    }
    raw.push_back({frame, ts});
  }

  TimestampIndex index(path, raw, tolerance, unparsable);
  if (index.empty())
    throw MalformedLogError(path, "timestamp log has no usable frame rows");
  return index;
}

FrameRange TimestampIndex::frame_range_for_window(double start,
                                                  double end) const {
  FrameRange range;
  if (frames_.empty() || end < start)
    return range;

  auto lo = std::lower_bound(
      frames_.begin(), frames_.end(), start,
      [](const FrameRecord &f, double t) { return f.timestamp < t; });
  auto hi = std::upper_bound(
      lo, frames_.end(), end,
      [](double t, const FrameRecord &f) { return t < f.timestamp; });

  if (lo == hi)
    return range;

  range.first_position = static_cast<size_t>(std::distance(frames_.begin(), lo));
  range.count = static_cast<size_t>(std::distance(lo, hi));
  range.first_frame = lo->frame_index;
  range.last_frame = std::prev(hi)->frame_index;
  return range;
}

std::vector<int64_t>
TimestampIndex::frame_indices(const FrameRange &range) const {
  std::vector<int64_t> out;
  if (range.empty() || range.first_position >= frames_.size())
    return out;

  size_t last = std::min(frames_.size(), range.first_position + range.count);
  out.reserve(last - range.first_position);
  for (size_t i = range.first_position; i < last; ++i) {
    out.push_back(frames_[i].frame_index);
  }
  return out;
}

double TimestampIndex::first_timestamp() const {
  return frames_.empty() ? 0.0 : frames_.front().timestamp;
}

double TimestampIndex::last_timestamp() const {
  return frames_.empty() ? 0.0 : frames_.back().timestamp;
}

double TimestampIndex::estimated_frame_rate() const {
  if (frames_.size() < 2)
    return 0.0;
  double span = frames_.back().timestamp - frames_.front().timestamp;
  return span > 0.0 ? static_cast<double>(frames_.size() - 1) / span : 0.0;
}

} // namespace gesture_slicer
