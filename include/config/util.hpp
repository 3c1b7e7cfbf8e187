#pragma once

#include "config/Config.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace fv::config {

inline uintmax_t parseMbOrGbToByte(const std::string& str) {
    if (str.empty()) throw ConfigError("Size string cannot be empty");

    std::string_view sv(str);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);

    // Assume MB if no suffix
    uintmax_t multiplier = 1024 * 1024;
    if (sv.ends_with("GB") || sv.ends_with("gb")) { multiplier *= 1024; sv.remove_suffix(2); }
    else if (sv.ends_with("MB") || sv.ends_with("mb")) sv.remove_suffix(2);
    else if (sv.ends_with('G') || sv.ends_with('g')) { multiplier *= 1024; sv.remove_suffix(1); }
    else if (sv.ends_with('M') || sv.ends_with('m')) sv.remove_suffix(1);

    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);

    // from_chars takes no sign, so "-5" and "+5" fail here along with "1.5" and "10x"
    uintmax_t value = 0;
    const auto [end, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec == std::errc::invalid_argument || end != sv.data() + sv.size())
        throw ConfigError("Invalid size: " + str);
    if (ec == std::errc::result_out_of_range || value > UINTMAX_MAX / multiplier)
        throw ConfigError("Size out of range: " + str);

    return value * multiplier;
}

inline std::string bytesToMbOrGbStr(const uintmax_t bytes) {
    if (bytes % (1024 * 1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024 * 1024)) + "GB";
    return std::to_string(bytes / (1024 * 1024)) + "MB";
}

inline spdlog::level::level_enum parseLogLevel(const std::string& str) {
    const auto lvl = spdlog::level::from_str(str);
    // from_str maps anything unrecognized to off
    if (lvl == spdlog::level::off && str != "off") throw ConfigError("Invalid log level: " + str);
    return lvl;
}

inline std::string logLevelToString(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}
