/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 */

#include "gesture_slicer/logging.hpp"

#include <algorithm>
#include <iterator>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

namespace gesture_slicer {

namespace {

bool is_camera_entry(const std::string &name) {
  const std::string_view prefix(CAMERA_TIMING_PREFIX);
  return std::string_view(name).substr(0, prefix.size()) == prefix;
}

void print_row(const TimingTotal &t) {
  const double seconds = t.microseconds / 1000000.0;
  if (t.calls > 1) {
    fmt::print("{:<30} {:>12} [{:.2f}s] x{}\n", t.name, t.microseconds,
               seconds, t.calls);
  } else {
    fmt::print("{:<30} {:>12} [{:.2f}s]\n", t.name, t.microseconds, seconds);
  }
}

} // anonymous namespace

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

std::vector<TimingTotal> TimingCollector::totals() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  std::vector<TimingTotal> out;
  for (const auto &e : entries) {
    auto it = std::find_if(out.begin(), out.end(), [&](const TimingTotal &t) {
      return t.name == e.name;
    });
    if (it == out.end()) {
      out.push_back({e.name, 0, 0});
      it = std::prev(out.end());
    }
    ++it->calls;
    it->microseconds += e.microseconds;
  }
  return out;
}

void TimingCollector::print_summary() {
  const std::vector<TimingTotal> all = totals();
  if (all.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  long camera_us = 0;
  size_t cameras = 0;
  for (const auto &t : all) {
    if (is_camera_entry(t.name)) {
      camera_us += t.microseconds;
      ++cameras;
      continue;
    }
    print_row(t);
  }

  /// Summed over parallel workers; may exceed cut_segments
  if (cameras > 0) {
    fmt::print("\n");
    for (const auto &t : all) {
      if (is_camera_entry(t.name))
        print_row(t);
    }
    print_row({fmt::format("{} camera(s), summed", cameras), 1, camera_us});
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace gesture_slicer
