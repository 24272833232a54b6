#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>  // std::snprintf
#include <string>
#include <string_view>

namespace xsbt {

// Utilities for working with trading-day integers.
//
// Convention:
//   a day is an integer of the form YYYYMMDD stored in a uint32_t.
//   Integer order equals calendar order, so days sort and compare directly.
//
// This header provides:
//   - Conversion between day integers and std::chrono::year_month_day
//   - Conversion to/from days since the Unix epoch (Arrow date32)
//   - Conversion between day integers and strings ("YYYY-MM-DD")

// Convert a YYYYMMDD day integer to std::chrono::year_month_day.
inline std::chrono::year_month_day day_to_ymd(uint32_t d) {
  using namespace std::chrono;
  int y        = static_cast<int>(d / 10000U);
  unsigned m   = static_cast<unsigned>((d / 100U) % 100U);
  unsigned dd  = static_cast<unsigned>(d % 100U);
  return year_month_day{year{y}, month{m}, day{dd}};
}

// Convert std::chrono::year_month_day back to an integer YYYYMMDD.
inline uint32_t ymd_to_day(const std::chrono::year_month_day& ymd) {
  int y        = static_cast<int>(ymd.year());
  unsigned m   = static_cast<unsigned>(ymd.month());
  unsigned dd  = static_cast<unsigned>(ymd.day());
  return static_cast<uint32_t>(y * 10000 + static_cast<int>(m * 100 + dd));
}

// True if the integer names a real calendar date.
inline bool is_valid_day(uint32_t d) {
  return d >= 10000101U && d <= 99991231U && day_to_ymd(d).ok();
}

// Days since 1970-01-01 (the Arrow date32 encoding) to YYYYMMDD.
inline uint32_t day_from_epoch_days(int64_t days) {
  using namespace std::chrono;
  sys_days sd{std::chrono::days{days}};
  return ymd_to_day(year_month_day{sd});
}

// YYYYMMDD to days since 1970-01-01.
inline int32_t day_to_epoch_days(uint32_t d) {
  using namespace std::chrono;
  sys_days sd{day_to_ymd(d)};
  return static_cast<int32_t>(sd.time_since_epoch().count());
}

// Floor a duration since the Unix epoch (UTC) to its calendar day.
template <class Duration>
inline uint32_t day_from_epoch_duration(Duration since_epoch) {
  using namespace std::chrono;
  auto d = floor<std::chrono::days>(since_epoch);
  return day_from_epoch_days(d.count());
}

// Convert a day integer (YYYYMMDD) to a string "YYYY-MM-DD".
inline std::string day_to_string(uint32_t d) {
  uint32_t y  = d / 10000U;
  uint32_t m  = (d / 100U) % 100U;
  uint32_t dd = d % 100U;

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u", y, m, dd);
  return std::string(buf);
}

// Parse the leading "YYYY-MM-DD" of a date or timestamp string.
//
// A time of day after the date is ignored, so the result is the date as
// written. Timestamp columns are floored to their UTC day, so a string is
// only accepted when its date is also its UTC date: no zone, "Z", or a
// zero offset ("+00:00", "-0000"). Any other offset returns false.
inline bool parse_day_string(std::string_view s, uint32_t& out) {
  if (s.size() < 10 || s[4] != '-' || s[7] != '-') return false;
  if (s.size() > 10) {
    const std::string_view rest = s.substr(10);
    const std::size_t sign = rest.find_last_of("+-");
    if (sign != std::string_view::npos) {
      for (char c : rest.substr(sign + 1)) {
        if (c != '0' && c != ':') return false;
      }
    }
  }
  uint32_t v = 0;
  for (int i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    const char c = s[static_cast<std::size_t>(i)];
    if (c < '0' || c > '9') return false;
    v = v * 10U + static_cast<uint32_t>(c - '0');
  }
  if (!is_valid_day(v)) return false;
  out = v;
  return true;
}

}  // namespace xsbt
