#ifndef FLOWEXEC_CORE_TIME_UTILS_HPP_
#define FLOWEXEC_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace flowexec::core {

using Clock = std::chrono::system_clock;

inline std::int64_t ToEpochMillis(Clock::time_point timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
      .count();
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
// Used by log lines and execution payloads. Returns "" if the calendar
// conversion fails.
inline std::string FormatUtcTimestamp(Clock::time_point timestamp) {
  const std::int64_t epoch_millis = ToEpochMillis(timestamp);
  const int millis = static_cast<int>((epoch_millis % 1000 + 1000) % 1000);
  const std::time_t epoch_seconds = Clock::to_time_t(timestamp);

  std::tm utc{};
#if defined(_WIN32)
  if (gmtime_s(&utc, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc) == nullptr) {
    return "";
  }
#endif

  char date_time[32];
  if (std::strftime(date_time, sizeof(date_time), "%Y-%m-%dT%H:%M:%S", &utc) == 0) {
    return "";
  }
  char formatted[48];
  std::snprintf(formatted, sizeof(formatted), "%s.%03dZ", date_time, millis);
  return formatted;
}

} // namespace flowexec::core

#endif // FLOWEXEC_CORE_TIME_UTILS_HPP_
