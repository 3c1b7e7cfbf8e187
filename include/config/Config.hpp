#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace fv::config {

constexpr static uintmax_t DEFAULT_MAX_FILE_SIZE_BYTES = 100 * 1024 * 1024; // 100MB

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class QuarantineMode { Move, Copy };

struct MonitoringConfig {
    std::vector<std::filesystem::path> watch_paths = {"/home", "/tmp"};
    std::vector<std::filesystem::path> excluded_paths = {"/proc", "/sys", "/dev", "/run", "/snap"};
    bool recursive = true;
    bool scan_existing_on_start = false;
};

struct QuarantineConfig {
    bool enabled = true;
    std::filesystem::path path = "/var/lib/file-validator/quarantine";
    QuarantineMode mode = QuarantineMode::Move;
};

struct DetectionConfig {
    bool calculate_hash = true;
    bool get_file_owner = true;
    uintmax_t max_file_size_bytes = DEFAULT_MAX_FILE_SIZE_BYTES;
    bool escalate_unknown = false;        // treat UNKNOWN on a known extension like a mismatch
    bool require_known_extension = false; // only inspect extensions some signature lists
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum validator  = spdlog::level::info;  // startup, shutdown, detections
    spdlog::level::level_enum detect     = spdlog::level::warn;  // unreadable files, skipped events
    spdlog::level::level_enum evidence   = spdlog::level::warn;  // hash or owner lookup failures
    spdlog::level::level_enum quarantine = spdlog::level::info;  // every relocation and rollback
    spdlog::level::level_enum watch      = spdlog::level::warn;  // inotify errors and watch limits
    spdlog::level::level_enum config     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/file-validator";
    bool console_output = true;
    bool log_unknown = false;
    LogLevelsConfig levels;
};

struct Config {
    MonitoringConfig monitoring;
    QuarantineConfig quarantine;
    LoggingConfig logging;
    DetectionConfig detection;

    // Normalizes paths and rejects inconsistent settings. Throws ConfigError.
    void validate();
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

std::string to_string(QuarantineMode mode);
QuarantineMode parseQuarantineMode(const std::string& str);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const MonitoringConfig& c);
void to_json(nlohmann::json& j, const QuarantineConfig& c);
void to_json(nlohmann::json& j, const DetectionConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace fv::config
