#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>

namespace netbatch::core::common::time {

using SystemTime = std::chrono::system_clock::time_point;

inline std::int64_t ToUnixMs(SystemTime tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
  return static_cast<std::int64_t>(ms.count());
}

inline std::int64_t NowUnixMs() { return ToUnixMs(std::chrono::system_clock::now()); }

inline std::tm ToUtcTm(SystemTime tp) {
  const auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  return tm;
}

inline std::string FormatIso8601Utc(SystemTime tp) {
  const std::tm tm = ToUtcTm(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

inline std::string NowIso8601Utc() { return FormatIso8601Utc(std::chrono::system_clock::now()); }

// Compact UTC stamp usable in file names: 20240131T235959Z.
inline std::string FormatCompactUtc(SystemTime tp) {
  const std::tm tm = ToUtcTm(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
  return oss.str();
}

inline void SleepMs(std::uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace netbatch::core::common::time
