/**
 * @file manifest.cpp
 * @brief Segment record table implementation
 */

#include "gesture_slicer/manifest.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iterator>
#include <stdexcept>

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/os.h>

#include "gesture_slicer/csv_table.hpp"
#include "gesture_slicer/timestamp.hpp"

namespace gesture_slicer {

namespace {

const char *bool_text(bool v) { return v ? "true" : "false"; }

} // anonymous namespace

const std::vector<std::string> &ManifestBuilder::columns() {
  static const std::vector<std::string> names = {
      "participant_id", "camera_id",      "segment_id",
      "filename",       "filepath",       "start_time",
      "end_time",       "gesture_name",   "gesture_index",
      "gesture_time",   "duration_seconds", "training_duration",
      "reading_time_excluded", "training_ready"};
  return names;
}

void ManifestBuilder::append(SegmentRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finalized_)
    throw std::logic_error("manifest already finalized; cannot append " +
                           record.segment_id);
  records_.push_back(std::move(record));
}

void ManifestBuilder::finalize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finalized_)
    return;
  std::stable_sort(records_.begin(), records_.end(),
                   [](const SegmentRecord &a, const SegmentRecord &b) {
                     if (a.camera_order != b.camera_order)
                       return a.camera_order < b.camera_order;
                     return a.gesture_order < b.gesture_order;
                   });
  finalized_ = true;
}

bool ManifestBuilder::finalized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finalized_;
}

size_t ManifestBuilder::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

void ManifestBuilder::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  finalized_ = false;
}

ManifestStats ManifestBuilder::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ManifestStats s;
  s.total = records_.size();
  for (const auto &r : records_) {
    CameraTally &tally = s.per_camera[r.camera_id];
    if (r.training_ready) {
      ++s.accepted;
      ++tally.accepted;
      s.training_minutes += r.training_duration / 60.0;
    } else {
      ++s.rejected;
      ++tally.rejected;
      ++s.rejected_by_reason[status_name(r.reason)];
    }
  }
  return s;
}

std::string ManifestBuilder::render_csv() const {
  std::lock_guard<std::mutex> lock(mutex_);
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);

  const auto &cols = columns();
  for (size_t i = 0; i < cols.size(); ++i) {
    fmt::format_to(out, "{}{}", i ? "," : "", cols[i]);
  }
  fmt::format_to(out, "\n");

  for (const auto &r : records_) {
    fmt::format_to(out, "{},{},{},{},{},{},{},{},{},{},{:.3f},{:.3f},{},{}\n",
                   csv_escape(r.participant_id), csv_escape(r.camera_id),
                   csv_escape(r.segment_id), csv_escape(r.filename),
                   csv_escape(r.filepath), format_timestamp(r.start_time),
                   format_timestamp(r.end_time), csv_escape(r.gesture_name),
                   r.gesture_index, format_timestamp(r.gesture_time),
                   r.duration, r.training_duration,
                   bool_text(r.reading_time_excluded),
                   bool_text(r.training_ready));
  }
  return fmt::to_string(buf);
}

void ManifestBuilder::write_csv(const std::string &path) const {
  namespace fs = std::filesystem;
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty())
    fs::create_directories(parent);

  const std::string text = render_csv();
  auto out = fmt::output_file(path);
  out.print("{}", text);
  out.close();
}

void ManifestBuilder::print_summary() const {
  const ManifestStats s = stats();

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= SEGMENTATION SUMMARY =================\n");
  fmt::print("{:<25} {:>25}\n", "Total records:", s.total);
  fmt::print("{:<25} {:>25}\n", "Training-ready:", s.accepted);
  fmt::print("{:<25} {:>25}\n", "Rejected:", s.rejected);
  for (const auto &[reason, count] : s.rejected_by_reason) {
    fmt::print("{:<25} {:>25}\n", fmt::format("  {}:", reason), count);
  }
  fmt::print("{:<25} {:>21.2f}min\n", "Training footage:", s.training_minutes);

  if (!s.per_camera.empty()) {
    fmt::print("\n{:<20} {:>12} {:>12}\n", "Camera", "Accepted", "Rejected");
    fmt::print("{:-<20} {:-<12} {:-<12}\n", "", "", "");
    std::lock_guard<std::mutex> lock(mutex_);
    /// Keep catalog order rather than the map's alphabetical order
    std::vector<std::string> order;
    for (const auto &r : records_) {
      if (std::find(order.begin(), order.end(), r.camera_id) == order.end())
        order.push_back(r.camera_id);
    }
    for (const auto &cam : order) {
      const CameraTally &t = s.per_camera.at(cam);
      fmt::print("{:<20} {:>12} {:>12}\n", cam, t.accepted, t.rejected);
    }
  }

  fmt::print(fg(fmt::color::cyan),
             "========================================================\n");
  std::fflush(stdout);
}

} // namespace gesture_slicer
