#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace oc {

// Wall-clock fields of a millisecond timestamp shifted by a fixed offset.
struct CalendarTime {
  int year{1970};
  int month{1};   // 1-12
  int day{1};     // 1-31
  int hour{0};
  int minute{0};
  int second{0};
};

inline CalendarTime toCalendar(std::int64_t timestampMs, std::int64_t offsetMs) {
  std::int64_t ms = timestampMs + offsetMs;
  std::int64_t secs = ms / 1000;
  if (ms % 1000 < 0) --secs;  // floor for pre-epoch values
  auto epoch = static_cast<std::time_t>(secs);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &epoch);
#else
  gmtime_r(&epoch, &tm);
#endif
  CalendarTime c;
  c.year = tm.tm_year + 1900;
  c.month = tm.tm_mon + 1;
  c.day = tm.tm_mday;
  c.hour = tm.tm_hour;
  c.minute = tm.tm_min;
  c.second = tm.tm_sec;
  return c;
}

inline const char* monthName(int month) {
  static const char* kNames[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                 "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  if (month < 1 || month > 12) return "";
  return kNames[month - 1];
}

} // namespace oc
