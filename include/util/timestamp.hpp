#pragma once

#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <string>

namespace fv::util {

// ISO 8601 UTC with microseconds, e.g. 2026-10-19T10:15:00.123456Z
inline std::string isoTimestamp(const std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lldZ", date, static_cast<long long>(micros));
    return {out};
}

// Filesystem-safe UTC stamp used for incident directories, e.g. 20261019T101500_123456
inline std::string compactTimestamp(const std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char date[20];
    std::strftime(date, sizeof(date), "%Y%m%dT%H%M%S", &tm);

    char out[32];
    std::snprintf(out, sizeof(out), "%s_%06lld", date, static_cast<long long>(micros));
    return {out};
}

inline std::chrono::system_clock::time_point toSystemClock(const std::filesystem::file_time_type ft) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(ft));
}

} // namespace fv::util
