#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chatpack/datetime.hpp"

namespace chatpack {

// Closed set of WhatsApp date layouts. Time of day is read the same way for
// all of them: H:MM or H:MM:SS, optionally followed by AM/PM.
enum class DateLayout {
  kDayMonthYear,     // 15/01/2024, 14:05
  kMonthDayYear,     // 1/15/24, 2:05 PM
  kDayMonthYearDot,  // 15.01.24, 14:05
  kIsoDate,          // 2024-01-15, 14:05
};

inline const char* layout_name(DateLayout layout) {
  switch (layout) {
    case DateLayout::kDayMonthYear:
      return "DD/MM/YYYY";
    case DateLayout::kMonthDayYear:
      return "MM/DD/YYYY";
    case DateLayout::kDayMonthYearDot:
      return "DD.MM.YYYY";
    case DateLayout::kIsoDate:
    default:
      return "YYYY-MM-DD";
  }
}

// Raw pieces of a message header line, before the layout is known.
struct HeaderFields {
  int a{0};
  int b{0};
  int c{0};
  int a_digits{0};
  int c_digits{0};
  char sep{'/'};
  int hour{0};
  int minute{0};
  int second{0};
  bool has_meridiem{false};
  bool pm{false};
  bool bracketed{false};
  std::string rest;  // "Sender: text" or a system notice
};

namespace detail {

// U+200E / U+200F directional marks exported in front of some lines.
inline std::size_t skip_bidi_marks(const std::string& s, std::size_t pos) {
  while (pos + 2 < s.size() && static_cast<unsigned char>(s[pos]) == 0xE2 &&
         static_cast<unsigned char>(s[pos + 1]) == 0x80 &&
         (static_cast<unsigned char>(s[pos + 2]) == 0x8E || static_cast<unsigned char>(s[pos + 2]) == 0x8F)) {
    pos += 3;
  }
  return pos;
}

// Plain spaces plus U+00A0 and U+202F, which newer exports put before AM/PM.
inline std::size_t skip_header_spaces(const std::string& s, std::size_t pos) {
  for (;;) {
    if (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) {
      ++pos;
    } else if (pos + 1 < s.size() && static_cast<unsigned char>(s[pos]) == 0xC2 &&
               static_cast<unsigned char>(s[pos + 1]) == 0xA0) {
      pos += 2;
    } else if (pos + 2 < s.size() && static_cast<unsigned char>(s[pos]) == 0xE2 &&
               static_cast<unsigned char>(s[pos + 1]) == 0x80 && static_cast<unsigned char>(s[pos + 2]) == 0xAF) {
      pos += 3;
    } else {
      return pos;
    }
  }
}

inline int read_number(const std::string& s, std::size_t& pos, int max_digits, int& digits) {
  int v = 0;
  digits = 0;
  while (pos < s.size() && digits < max_digits && std::isdigit(static_cast<unsigned char>(s[pos]))) {
    v = v * 10 + (s[pos] - '0');
    ++pos;
    ++digits;
  }
  return v;
}

}  // namespace detail

inline std::optional<HeaderFields> split_header(const std::string& line) {
  HeaderFields h;
  std::size_t pos = detail::skip_bidi_marks(line, 0);
  if (pos < line.size() && line[pos] == '[') {
    h.bracketed = true;
    ++pos;
  }

  int digits = 0;
  h.a = detail::read_number(line, pos, 4, h.a_digits);
  if (h.a_digits == 0 || pos >= line.size()) {
    return std::nullopt;
  }
  h.sep = line[pos];
  if (h.sep != '/' && h.sep != '.' && h.sep != '-') {
    return std::nullopt;
  }
  ++pos;
  h.b = detail::read_number(line, pos, 2, digits);
  if (digits == 0 || pos >= line.size() || line[pos] != h.sep) {
    return std::nullopt;
  }
  ++pos;
  h.c = detail::read_number(line, pos, 4, h.c_digits);
  if (h.c_digits < 2 || (h.a_digits > 2 && h.c_digits > 2)) {
    return std::nullopt;
  }
  if (pos < line.size() && line[pos] == '.') {
    ++pos;
  }
  if (pos < line.size() && line[pos] == ',') {
    ++pos;
  }
  pos = detail::skip_header_spaces(line, pos);

  h.hour = detail::read_number(line, pos, 2, digits);
  if (digits == 0 || pos >= line.size() || line[pos] != ':') {
    return std::nullopt;
  }
  ++pos;
  h.minute = detail::read_number(line, pos, 2, digits);
  if (digits != 2) {
    return std::nullopt;
  }
  if (pos < line.size() && line[pos] == ':') {
    ++pos;
    h.second = detail::read_number(line, pos, 2, digits);
    if (digits != 2) {
      return std::nullopt;
    }
  }

  const std::size_t before_meridiem = pos;
  pos = detail::skip_header_spaces(line, pos);
  if (pos + 1 < line.size()) {
    const char m0 = static_cast<char>(std::tolower(static_cast<unsigned char>(line[pos])));
    const char m1 = static_cast<char>(std::tolower(static_cast<unsigned char>(line[pos + 1])));
    if ((m0 == 'a' || m0 == 'p') && m1 == 'm') {
      h.has_meridiem = true;
      h.pm = m0 == 'p';
      pos += 2;
    }
  }
  if (!h.has_meridiem) {
    pos = before_meridiem;
  }

  if (h.bracketed) {
    if (pos >= line.size() || line[pos] != ']') {
      return std::nullopt;
    }
    ++pos;
    pos = detail::skip_header_spaces(line, pos);
  } else {
    pos = detail::skip_header_spaces(line, pos);
    if (pos >= line.size() || line[pos] != '-') {
      return std::nullopt;
    }
    ++pos;
    pos = detail::skip_header_spaces(line, pos);
  }
  pos = detail::skip_bidi_marks(line, pos);
  h.rest = line.substr(pos);
  return h;
}

// Resolves the header's date and time under `layout`. nullopt when the fields
// do not form a valid date for that layout.
inline std::optional<int64_t> header_timestamp(const HeaderFields& h, DateLayout layout) {
  int year = 0, month = 0, day = 0;
  int year_digits = h.c_digits;
  switch (layout) {
    case DateLayout::kDayMonthYear:
      if (h.sep != '/') return std::nullopt;
      day = h.a, month = h.b, year = h.c;
      break;
    case DateLayout::kMonthDayYear:
      if (h.sep != '/') return std::nullopt;
      month = h.a, day = h.b, year = h.c;
      break;
    case DateLayout::kDayMonthYearDot:
      if (h.sep != '.') return std::nullopt;
      day = h.a, month = h.b, year = h.c;
      break;
    case DateLayout::kIsoDate:
      if (h.sep != '-' || h.a_digits != 4) return std::nullopt;
      year = h.a, month = h.b, day = h.c;
      year_digits = 4;
      break;
  }
  if (year_digits == 2) {
    year += 2000;
  } else if (year_digits != 4) {
    return std::nullopt;
  }

  int hour = h.hour;
  if (h.has_meridiem) {
    if (hour < 1 || hour > 12) {
      return std::nullopt;
    }
    if (h.pm && hour < 12) hour += 12;
    if (!h.pm && hour == 12) hour = 0;
  }
  return make_timestamp_ms(year, month, day, hour, h.minute, h.second);
}

// Picks the layout for a whole export from its leading lines.
//   '.' separator              -> DD.MM.YYYY
//   '-' with a 4-digit lead    -> YYYY-MM-DD
//   '/' first field > 12       -> day first (one vote)
//   '/' second field > 12      -> month first (one vote)
// Majority of votes wins. With no votes a 12-hour clock means month first,
// otherwise day first. Only the first kDetectHeaders header lines count.
// nullopt when no line looks like a header at all.
inline constexpr std::size_t kDetectHeaders = 100;

inline std::optional<DateLayout> detect_date_layout(const std::vector<std::string>& sample) {
  std::size_t dot = 0, iso = 0, slash = 0;
  std::size_t day_first = 0, month_first = 0, meridiem = 0;
  for (const auto& line : sample) {
    if (dot + iso + slash >= kDetectHeaders) {
      break;
    }
    const auto h = split_header(line);
    if (!h) {
      continue;
    }
    if (h->sep == '.') {
      ++dot;
    } else if (h->sep == '-' && h->a_digits == 4) {
      ++iso;
    } else if (h->sep == '/') {
      ++slash;
      if (h->a > 12 && h->b <= 12) ++day_first;
      if (h->b > 12 && h->a <= 12) ++month_first;
      if (h->has_meridiem) ++meridiem;
    }
  }

  if (dot == 0 && iso == 0 && slash == 0) {
    return std::nullopt;
  }
  if (dot >= iso && dot >= slash) {
    return DateLayout::kDayMonthYearDot;
  }
  if (iso >= slash) {
    return DateLayout::kIsoDate;
  }
  if (day_first != month_first) {
    return day_first > month_first ? DateLayout::kDayMonthYear : DateLayout::kMonthDayYear;
  }
  return meridiem * 2 > slash ? DateLayout::kMonthDayYear : DateLayout::kDayMonthYear;
}

}  // namespace chatpack
