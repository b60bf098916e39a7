#ifndef S3MP_LIBSUPPORT_S3MP_TIME_H_
#define S3MP_LIBSUPPORT_S3MP_TIME_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace s3mp {

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

inline TimePoint
Now() {
  return Clock::now();
}

inline uint64_t
UsSince(const TimePoint& point) {
  using Us = std::chrono::microseconds;
  return std::chrono::duration_cast<Us>(Now() - point).count();
}

inline uint64_t
UsBetween(const TimePoint& before, const TimePoint& after) {
  using Us = std::chrono::microseconds;
  return std::chrono::duration_cast<Us>(after - before).count();
}

inline std::pair<float, std::string>
UsToPair(uint64_t us_) {
  auto us = static_cast<float>(us_);
  static const std::vector<std::string> suffixes = {"us", "ms", "s"};
  for (auto const& suffix : suffixes) {
    if (us < 1000) {
      return std::pair(us, suffix);
    }
    us /= 1000;
  }
  return std::pair(us, "s");
}

// Input: microseconds
// Output: scaled duration and units, e.g. UsToStr("{:.2f}{}", 1500) is 1.50ms
inline std::string
UsToStr(const std::string& fmt, uint64_t us_) {
  auto [val, unit] = UsToPair(us_);
  return fmt::format(fmt, val, unit);
}

// Input: Byte count
// Output: scaled count and units
inline std::string
BytesToStr(const std::string& fmt, uint64_t bytes_) {
  static const std::vector<std::string> suffixes = {"B",  "KB", "MB",
                                                    "GB", "TB", "PB"};
  auto bytes = static_cast<float>(bytes_);
  for (auto const& suffix : suffixes) {
    if (bytes < 1024.0) {
      return fmt::format(fmt, bytes, suffix);
    }
    bytes /= 1024;
  }
  return fmt::format(fmt, bytes, "PB");
}

/// Bytes per second over an interval in microseconds. A zero interval is
/// reported as zero throughput rather than infinity.
inline double
Throughput(uint64_t bytes, uint64_t us) {
  if (us == 0) {
    return 0.0;
  }
  return static_cast<double>(bytes) * 1e6 / static_cast<double>(us);
}

}  // namespace s3mp
#endif
