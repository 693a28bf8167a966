#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "chatpack/common.hpp"

namespace chatpack {

inline constexpr int64_t kMsPerDay = 86400LL * 1000LL;

// Howard Hinnant's days_from_civil: proleptic Gregorian date to days since 1970-01-01.
inline int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline bool is_valid_date(int y, int m, int d) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12 || d < 1) {
    return false;
  }
  const int max_day = (m == 2 && is_leap_year(y)) ? 29 : kDays[m - 1];
  return d <= max_day;
}

inline std::optional<int64_t> make_timestamp_ms(int y, int mon, int d, int h, int mi, int s, int ms = 0) {
  if (!is_valid_date(y, mon, d) || h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 60 || ms < 0 ||
      ms > 999) {
    return std::nullopt;
  }
  const int64_t days = days_from_civil(y, static_cast<unsigned>(mon), static_cast<unsigned>(d));
  return days * kMsPerDay + (h * 3600LL + mi * 60LL + s) * 1000LL + ms;
}

// UTC, "YYYY-MM-DD HH:MM:SS".
inline std::string format_timestamp(int64_t ms) {
  int64_t secs = ms / 1000;
  if (ms < 0 && ms % 1000 != 0) {
    --secs;
  }
  const std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

namespace detail {

// Reads exactly `width` digits at `pos`.
inline bool read_fixed(const std::string& s, std::size_t& pos, std::size_t width, int& out) {
  if (pos + width > s.size()) {
    return false;
  }
  int v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    v = v * 10 + (c - '0');
  }
  out = v;
  pos += width;
  return true;
}

}  // namespace detail

// "YYYY-MM-DD" at UTC midnight.
inline std::optional<int64_t> parse_date(const std::string& raw) {
  const std::string s = trim(raw);
  std::size_t pos = 0;
  int y = 0, m = 0, d = 0;
  if (s.size() != 10 || !detail::read_fixed(s, pos, 4, y) || s[pos++] != '-' || !detail::read_fixed(s, pos, 2, m) ||
      s[pos++] != '-' || !detail::read_fixed(s, pos, 2, d)) {
    return std::nullopt;
  }
  return make_timestamp_ms(y, m, d, 0, 0, 0);
}

// ISO 8601 subset used by chat exports:
//   2024-01-15T10:30:00
//   2024-01-15 10:30:00.123
//   2024-06-23T01:48:40.585000+00:00
//   2024-06-23T01:48:40Z
// Offsets are applied; naive values are taken as UTC.
inline std::optional<int64_t> parse_iso8601(const std::string& raw) {
  const std::string s = trim(raw);
  std::size_t pos = 0;
  int y = 0, mon = 0, d = 0, h = 0, mi = 0, sec = 0;
  if (!detail::read_fixed(s, pos, 4, y) || pos >= s.size() || s[pos++] != '-' ||
      !detail::read_fixed(s, pos, 2, mon) || pos >= s.size() || s[pos++] != '-' ||
      !detail::read_fixed(s, pos, 2, d)) {
    return std::nullopt;
  }
  if (pos == s.size()) {
    return make_timestamp_ms(y, mon, d, 0, 0, 0);
  }
  if (s[pos] != 'T' && s[pos] != ' ') {
    return std::nullopt;
  }
  ++pos;
  if (!detail::read_fixed(s, pos, 2, h) || pos >= s.size() || s[pos++] != ':' || !detail::read_fixed(s, pos, 2, mi)) {
    return std::nullopt;
  }
  if (pos < s.size() && s[pos] == ':') {
    ++pos;
    if (!detail::read_fixed(s, pos, 2, sec)) {
      return std::nullopt;
    }
  }

  int ms = 0;
  if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
    ++pos;
    int digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (digits < 3) {
        ms = ms * 10 + (s[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (int i = digits; i < 3; ++i) {
      ms *= 10;
    }
  }

  int64_t offset_ms = 0;
  if (pos < s.size()) {
    const char sign = s[pos];
    if (sign == 'Z' || sign == 'z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!detail::read_fixed(s, pos, 2, oh)) {
        return std::nullopt;
      }
      if (pos < s.size() && s[pos] == ':') {
        ++pos;
      }
      if (pos < s.size() && !detail::read_fixed(s, pos, 2, om)) {
        return std::nullopt;
      }
      offset_ms = (oh * 3600LL + om * 60LL) * 1000LL;
      if (sign == '-') {
        offset_ms = -offset_ms;
      }
    }
  }
  if (pos != s.size()) {
    return std::nullopt;
  }

  const auto base = make_timestamp_ms(y, mon, d, h, mi, sec, ms);
  if (!base) {
    return std::nullopt;
  }
  return *base - offset_ms;
}

}  // namespace chatpack
