#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Millisecond clock used for every wire timestamp and duration. Injected as a
// std::function so tests can drive time by hand.
using Clock = std::function<std::int64_t()>;

inline std::int64_t EpochMillisUtc() {
  using clock = std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock::now().time_since_epoch())
      .count();
}

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

inline std::tm UtcTime(const std::time_t &tt) {
  std::tm tm{};
  gmtime_r(&tt, &tm);
  return tm;
}

inline std::string FormatTm(const std::tm &tm, const char *fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Produces a compact timestamp suitable for filenames: YYYYMMDD_HHMMSS
inline std::string TimestampForFile() {
  auto now = std::chrono::system_clock::now();
  std::time_t tt = std::chrono::system_clock::to_time_t(now);
  return FormatTm(LocalTime(tt), "%Y%m%d_%H%M%S");
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T10:20:30.123Z
inline std::string IsoTimestampUtc(std::int64_t epochMs) {
  const std::time_t tt = static_cast<std::time_t>(epochMs / 1000);
  std::ostringstream oss;
  oss << FormatTm(UtcTime(tt), "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << (epochMs % 1000) << 'Z';
  return oss.str();
}

} // namespace timeutil
