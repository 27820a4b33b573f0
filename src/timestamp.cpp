/**
 * @file timestamp.cpp
 * @brief Timestamp parsing and rendering implementation
 */

#include "gesture_slicer/timestamp.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

#include <fmt/core.h>

namespace gesture_slicer {

namespace {

/// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/// Inverse of days_from_civil
void civil_from_days(int64_t z, int64_t &y, unsigned &m, unsigned &d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y += (m <= 2);
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (std::isspace(static_cast<unsigned char>(s.front())) ||
                        s.front() == '"'))
    s.remove_prefix(1);
  while (!s.empty() && (std::isspace(static_cast<unsigned char>(s.back())) ||
                        s.back() == '"'))
    s.remove_suffix(1);
  return s;
}

/// Read exactly `n` digits at `pos`
bool read_digits(std::string_view s, size_t pos, size_t n, int &out) {
  if (pos + n > s.size())
    return false;
  int v = 0;
  for (size_t i = 0; i < n; ++i) {
    char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

bool is_timezone_suffix(std::string_view s) {
  if (s == "Z" || s == "z")
    return true;
  if (s.size() < 3 || (s[0] != '+' && s[0] != '-'))
    return false;
  for (size_t i = 1; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i])) && s[i] != ':')
      return false;
  }
  return true;
}

bool parse_calendar(std::string_view s, double &seconds) {
  int year, month, day, hour, minute, sec;
  if (!read_digits(s, 0, 4, year) || s[4] != '-' ||
      !read_digits(s, 5, 2, month) || s[7] != '-' ||
      !read_digits(s, 8, 2, day) || (s[10] != ' ' && s[10] != 'T') ||
      !read_digits(s, 11, 2, hour) || s[13] != ':' ||
      !read_digits(s, 14, 2, minute) || s[16] != ':' ||
      !read_digits(s, 17, 2, sec)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || sec > 60) {
    return false;
  }

  size_t pos = 19;
  double fraction = 0.0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    double scale = 0.1;
    size_t digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      fraction += (s[pos] - '0') * scale;
      scale /= 10.0;
      ++pos;
      ++digits;
    }
    if (digits == 0)
      return false;
  }

  if (pos < s.size() && !is_timezone_suffix(s.substr(pos)))
    return false;

  int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                 static_cast<unsigned>(day));
  seconds = static_cast<double>(days * 86400 + hour * 3600 + minute * 60 +
                                sec) +
            fraction;
  return true;
}

} // anonymous namespace

bool parse_timestamp(std::string_view text, double &seconds) {
  std::string_view s = trim(text);
  if (s.empty())
    return false;

  if (s.size() >= 19 && s[4] == '-' && s[7] == '-')
    return parse_calendar(s, seconds);

  /// Epoch seconds; the whole field must be consumed
  std::string buf(s);
  char *end = nullptr;
  double v = std::strtod(buf.c_str(), &end);
  if (end != buf.c_str() + buf.size() || !std::isfinite(v))
    return false;
  seconds = v;
  return true;
}

std::string format_timestamp(double seconds) {
  int64_t total_us = static_cast<int64_t>(std::llround(seconds * 1e6));
  int64_t total_s = total_us / 1000000;
  int64_t us = total_us % 1000000;
  if (us < 0) {
    us += 1000000;
    total_s -= 1;
  }
  int64_t days = total_s / 86400;
  int64_t rem = total_s % 86400;
  if (rem < 0) {
    rem += 86400;
    days -= 1;
  }

  int64_t y;
  unsigned m, d;
  civil_from_days(days, y, m, d);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:06d}", y, m,
                     d, rem / 3600, (rem % 3600) / 60, rem % 60, us);
}

} // namespace gesture_slicer
