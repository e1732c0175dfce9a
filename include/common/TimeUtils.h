#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace riskguard {
namespace common {

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// epoch ms -> "2026-10-19T08:30:00.123Z"
inline std::string toIso8601(long long epoch_ms) {
    const std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    const int millis = static_cast<int>(epoch_ms % 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, millis);
    return std::string(buf);
}

// UTC 날짜 키 "2026-10-19" (일일 손익 집계용)
inline std::string utcDayKey(long long epoch_ms) {
    return toIso8601(epoch_ms).substr(0, 10);
}

inline double secondsBetween(std::chrono::steady_clock::time_point from,
                             std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace common
} // namespace riskguard
