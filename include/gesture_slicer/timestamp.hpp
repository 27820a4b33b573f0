/**
 * @file timestamp.hpp
 * @brief Parsing and rendering of log timestamps
 *
 * @details Camera and gesture logs carry either epoch seconds ("1712.25")
 *          or calendar timestamps ("2024-05-03 14:02:11.250113",
 *          "2024-05-03T13:02:11.250Z"). Both are converted to seconds since
 *          1970-01-01 on a naive wall clock: timezone suffixes are accepted
 *          but ignored, so logs written by different clocks are aligned with
 *          the configured gesture clock offset instead.
 */

#ifndef GESTURE_SLICER_TIMESTAMP_HPP
#define GESTURE_SLICER_TIMESTAMP_HPP

#include <string>
#include <string_view>

namespace gesture_slicer {

/**
 * @brief Parse an epoch-float or calendar timestamp.
 * @param text Field text (surrounding blanks and quotes are ignored)
 * @param seconds Output: seconds since 1970-01-01 00:00:00
 * @return false when the text is not a timestamp
 */
bool parse_timestamp(std::string_view text, double &seconds);

/**
 * @brief Render seconds as "YYYY-MM-DD HH:MM:SS.ffffff".
 * @note Microsecond precision, rounded to nearest.
 */
std::string format_timestamp(double seconds);

} // namespace gesture_slicer

#endif // GESTURE_SLICER_TIMESTAMP_HPP
