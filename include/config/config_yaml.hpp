#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fv::config;

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<MonitoringConfig> {
    static Node encode(const MonitoringConfig& rhs) {
        Node node;
        node["watch_paths"] = rhs.watch_paths;
        node["excluded_paths"] = rhs.excluded_paths;
        node["recursive"] = rhs.recursive;
        node["scan_existing_on_start"] = rhs.scan_existing_on_start;
        return node;
    }

    static bool decode(const Node& node, MonitoringConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["watch_paths"]) rhs.watch_paths = node["watch_paths"].as<std::vector<std::filesystem::path>>();
        if (node["excluded_paths"]) rhs.excluded_paths = node["excluded_paths"].as<std::vector<std::filesystem::path>>();
        rhs.recursive = node["recursive"].as<bool>(true);
        rhs.scan_existing_on_start = node["scan_existing_on_start"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<QuarantineConfig> {
    static Node encode(const QuarantineConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["path"] = rhs.path.string();
        node["mode"] = to_string(rhs.mode);
        return node;
    }

    static bool decode(const Node& node, QuarantineConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.path = node["path"].as<std::string>("/var/lib/file-validator/quarantine");
        if (node["mode"]) rhs.mode = parseQuarantineMode(node["mode"].as<std::string>());
        else if (node["keep_original"]) rhs.mode = node["keep_original"].as<bool>() ? QuarantineMode::Copy : QuarantineMode::Move;
        return true;
    }
};

template<>
struct convert<DetectionConfig> {
    static Node encode(const DetectionConfig& rhs) {
        Node node;
        node["calculate_hash"] = rhs.calculate_hash;
        node["get_file_owner"] = rhs.get_file_owner;
        node["max_file_size_mb"] = bytesToMbOrGbStr(rhs.max_file_size_bytes);
        node["escalate_unknown"] = rhs.escalate_unknown;
        node["require_known_extension"] = rhs.require_known_extension;
        return node;
    }

    static bool decode(const Node& node, DetectionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.calculate_hash = node["calculate_hash"].as<bool>(true);
        rhs.get_file_owner = node["get_file_owner"].as<bool>(true);
        rhs.max_file_size_bytes = parseMbOrGbToByte(node["max_file_size_mb"].as<std::string>("100"));
        rhs.escalate_unknown = node["escalate_unknown"].as<bool>(false);
        rhs.require_known_extension = node["require_known_extension"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["validator"]  = logLevelToString(rhs.validator);
        node["detect"]     = logLevelToString(rhs.detect);
        node["evidence"]   = logLevelToString(rhs.evidence);
        node["quarantine"] = logLevelToString(rhs.quarantine);
        node["watch"]      = logLevelToString(rhs.watch);
        node["config"]     = logLevelToString(rhs.config);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.validator = parseLogLevel(node["validator"].as<std::string>("info"));
        rhs.detect = parseLogLevel(node["detect"].as<std::string>("warn"));
        rhs.evidence = parseLogLevel(node["evidence"].as<std::string>("warn"));
        rhs.quarantine = parseLogLevel(node["quarantine"].as<std::string>("info"));
        rhs.watch = parseLogLevel(node["watch"].as<std::string>("warn"));
        rhs.config = parseLogLevel(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = logLevelToString(rhs.console_log_level);
        node["file_log_level"]    = logLevelToString(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLogLevel(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = parseLogLevel(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_output"] = rhs.console_output;
        node["log_unknown"] = rhs.log_unknown;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/file-validator");
        rhs.console_output = node["console_output"].as<bool>(true);
        rhs.log_unknown = node["log_unknown"].as<bool>(false);
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

} // namespace YAML
