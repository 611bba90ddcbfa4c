// Clock helpers (UTC)
#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace sectionvault::infrastructure {

inline std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

inline std::string FormatUtc(std::chrono::system_clock::time_point tp, const char* format) {
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(tp));
    char buf[64];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

/// "2025-10-14"
inline std::string UtcDate(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    return FormatUtc(tp, "%Y-%m-%d");
}

/// "2025-10-14T15:30:45Z"
inline std::string UtcTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    return FormatUtc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

/// "2025-10-14T15-30-45", usable as a file name on every platform.
inline std::string FileSafeTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    return FormatUtc(tp, "%Y-%m-%dT%H-%M-%S");
}

} // namespace sectionvault::infrastructure
