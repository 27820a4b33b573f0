/**
 * @file inspect_timestamps.cpp
 * @brief Frame-timestamp log diagnostic utility
 *
 * @details Loads one camera frame log through the same cleaning as the
 *          slicer and reports what it kept: frame count, time span,
 *          estimated capture rate, dropped and clamped rows, and the largest
 *          gaps between consecutive frames.
 *
 * @usage
 *   inspect_timestamps <webcam_N.csv> [--json]
 *
 * @note TIMESTAMP_TOLERANCE_SEC applies as in the slicer.
 */

#include <algorithm>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "gesture_slicer/config.hpp"
#include "gesture_slicer/errors.hpp"
#include "gesture_slicer/system.hpp"
#include "gesture_slicer/timestamp.hpp"
#include "gesture_slicer/timestamp_index.hpp"

using json = nlohmann::json;
using namespace gesture_slicer;

namespace {

constexpr size_t TOP_GAPS = 5;

/**
 * @struct Gap
 * @brief Time between two consecutive kept frames.
 */
struct Gap {
  int64_t after_frame;
  double seconds;
};

std::vector<Gap> largest_gaps(const TimestampIndex &index, size_t n) {
  std::vector<Gap> gaps;
  const auto &frames = index.frames();
  for (size_t i = 1; i < frames.size(); ++i) {
    gaps.push_back({frames[i - 1].frame_index,
                    frames[i].timestamp - frames[i - 1].timestamp});
  }
  const size_t keep = std::min(n, gaps.size());
  std::partial_sort(gaps.begin(), gaps.begin() + keep, gaps.end(),
                    [](const Gap &a, const Gap &b) { return a.seconds > b.seconds; });
  gaps.resize(keep);
  return gaps;
}

json to_json(const TimestampIndex &index, const std::vector<Gap> &gaps) {
  json report;
  report["source"] = index.source();
  report["frames"] = index.size();
  report["corrupted_frames"] = index.corrupted_frames();
  report["clamped_frames"] = index.clamped_frames();
  report["first_timestamp"] = index.first_timestamp();
  report["last_timestamp"] = index.last_timestamp();
  report["span_seconds"] = index.last_timestamp() - index.first_timestamp();
  report["estimated_frame_rate"] = index.estimated_frame_rate();
  report["largest_gaps"] = json::array();
  for (const auto &g : gaps) {
    report["largest_gaps"].push_back(
        {{"after_frame", g.after_frame}, {"seconds", g.seconds}});
  }
  return report;
}

void print_report(const TimestampIndex &index, const std::vector<Gap> &gaps) {
  const double span = index.last_timestamp() - index.first_timestamp();

  fmt::print(fg(fmt::color::cyan),
             "================ TIMESTAMP LOG REPORT ================\n");
  fmt::print("{:<25} {}\n", "Source:", index.source());
  fmt::print("{:<25} {:>25}\n", "Frames kept:", index.size());
  fmt::print("{:<25} {:>25}\n", "Corrupted rows:", index.corrupted_frames());
  fmt::print("{:<25} {:>25}\n", "Clamped rows:", index.clamped_frames());
  fmt::print("{:<25} {:>25}\n", "First frame:",
             format_timestamp(index.first_timestamp()));
  fmt::print("{:<25} {:>25}\n", "Last frame:",
             format_timestamp(index.last_timestamp()));
  fmt::print("{:<25} {:>25}\n", "Span:", format_time(span));
  fmt::print("{:<25} {:>22.2f}fps\n", "Estimated rate:",
             index.estimated_frame_rate());

  if (!gaps.empty()) {
    fmt::print("\n{:<20} {:>15}\n", "Gap after frame", "Seconds");
    fmt::print("{:-<20} {:-<15}\n", "", "");
    for (const auto &g : gaps) {
      fmt::print("{:<20} {:>15.3f}\n", g.after_frame, g.seconds);
    }
  }
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
}

} // anonymous namespace

int main(int argc, char **argv) {
  if (argc < 2 || argc > 3 ||
      (argc == 3 && std::string(argv[2]) != "--json")) {
    fmt::print(stderr, "Usage: {} <timestamp_log.csv> [--json]\n", argv[0]);
    return 1;
  }
  const bool as_json = (argc == 3);

  try {
    const double tolerance =
        Config::get_env_double("TIMESTAMP_TOLERANCE_SEC", 0.0);
    const TimestampIndex index = TimestampIndex::from_csv(argv[1], tolerance);
    const auto gaps = largest_gaps(index, TOP_GAPS);

    if (as_json)
      fmt::print("{}\n", to_json(index, gaps).dump(2));
    else
      print_report(index, gaps);
  } catch (const MalformedLogError &e) {
    fmt::print(stderr, "Malformed log: {}\n", e.what());
    return 1;
  } catch (const std::exception &e) {
    fmt::print(stderr, "{}\n", e.what());
    return 1;
  }
  return 0;
}
