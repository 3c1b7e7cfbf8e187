#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace fv::config {

namespace fs = std::filesystem;

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("Config root must be a map");

    if (auto node = root["monitoring"]; node && !YAML::convert<MonitoringConfig>::decode(node, cfg.monitoring))
        throw ConfigError("'monitoring' section must be a map");
    if (auto node = root["quarantine"]; node && !YAML::convert<QuarantineConfig>::decode(node, cfg.quarantine))
        throw ConfigError("'quarantine' section must be a map");
    if (auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw ConfigError("'logging' section must be a map");
    if (auto node = root["detection"]; node && !YAML::convert<DetectionConfig>::decode(node, cfg.detection))
        throw ConfigError("'detection' section must be a map");

    return cfg;
}

fs::path normalize(const fs::path& p) {
    return fs::absolute(p).lexically_normal();
}

bool isUnder(const fs::path& path, const fs::path& root) {
    const auto rel = path.lexically_relative(root);
    return !rel.empty() && *rel.begin() != "..";
}

}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return decodeRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load config " + path.string() + ": " + e.what());
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse config: ") + e.what());
    }
}

void Config::validate() {
    if (monitoring.watch_paths.empty()) throw ConfigError("monitoring.watch_paths must list at least one path");
    if (detection.max_file_size_bytes == 0) throw ConfigError("detection.max_file_size_mb must be greater than zero");
    if (logging.log_dir.empty()) throw ConfigError("logging.log_dir cannot be empty");

    for (auto& p : monitoring.watch_paths) p = normalize(p);
    for (auto& p : monitoring.excluded_paths) p = normalize(p);

    if (!quarantine.enabled) return;

    if (quarantine.path.empty()) throw ConfigError("quarantine.path cannot be empty when quarantine is enabled");
    quarantine.path = normalize(quarantine.path);

    std::error_code ec;
    fs::create_directories(quarantine.path, ec);
    if (ec) throw ConfigError("Cannot create quarantine root " + quarantine.path.string() + ": " + ec.message());
    if (!fs::is_directory(quarantine.path)) throw ConfigError("Quarantine root is not a directory: " + quarantine.path.string());
    if (::access(quarantine.path.c_str(), W_OK | X_OK) != 0)
        throw ConfigError("Quarantine root is not writable: " + quarantine.path.string());

    fs::permissions(quarantine.path, fs::perms::owner_all, fs::perm_options::replace, ec);

    for (const auto& watched : monitoring.watch_paths)
        if (watched == quarantine.path || isUnder(watched, quarantine.path))
            throw ConfigError("Watch path " + watched.string() + " lies inside the quarantine root");

    // Quarantined files must never be fed back into the pipeline
    if (std::ranges::find(monitoring.excluded_paths, quarantine.path) == monitoring.excluded_paths.end())
        monitoring.excluded_paths.push_back(quarantine.path);
}

std::string to_string(const QuarantineMode mode) {
    switch (mode) {
        case QuarantineMode::Move: return "move";
        case QuarantineMode::Copy: return "copy";
    }
    return "unknown";
}

QuarantineMode parseQuarantineMode(const std::string& str) {
    if (str == "move") return QuarantineMode::Move;
    if (str == "copy") return QuarantineMode::Copy;
    throw ConfigError("Invalid quarantine mode: " + str);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"monitoring", c.monitoring},
        {"quarantine", c.quarantine},
        {"logging", c.logging},
        {"detection", c.detection}
    };
}

void to_json(nlohmann::json& j, const MonitoringConfig& c) {
    std::vector<std::string> watch, excluded;
    for (const auto& p : c.watch_paths) watch.push_back(p.string());
    for (const auto& p : c.excluded_paths) excluded.push_back(p.string());

    j = {
        {"watch_paths", watch},
        {"excluded_paths", excluded},
        {"recursive", c.recursive},
        {"scan_existing_on_start", c.scan_existing_on_start}
    };
}

void to_json(nlohmann::json& j, const QuarantineConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"path", c.path.string()},
        {"mode", to_string(c.mode)}
    };
}

void to_json(nlohmann::json& j, const DetectionConfig& c) {
    j = {
        {"calculate_hash", c.calculate_hash},
        {"get_file_owner", c.get_file_owner},
        {"max_file_size_bytes", c.max_file_size_bytes},
        {"escalate_unknown", c.escalate_unknown},
        {"require_known_extension", c.require_known_extension}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_output", c.console_output},
        {"log_unknown", c.log_unknown},
        {"console_log_level", logLevelToString(c.levels.console_log_level)},
        {"file_log_level", logLevelToString(c.levels.file_log_level)}
    };
}

} // namespace fv::config
