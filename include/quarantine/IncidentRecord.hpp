#pragma once

#include "evidence/EvidenceCollector.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace fv::quarantine {

// Everything the caller knows about a mismatch when it asks for quarantine.
struct Detection {
    std::filesystem::path path;
    std::string claimed_extension;
    std::string actual_type;
    evidence::Evidence evidence;
    std::chrono::system_clock::time_point detected_at = std::chrono::system_clock::now();
};

struct IncidentRecord {
    std::string incident_id;
    std::string filepath;
    std::string filename;
    std::string claimed_extension;
    std::string actual_type;
    std::optional<std::string> file_hash_sha256;
    std::optional<std::string> file_owner;
    uintmax_t file_size_bytes = 0;
    std::optional<std::string> modified_time;
    std::string detection_time;
    std::string magic_number_hex;
    std::string quarantine_mode;
    std::string quarantine_path;
    std::string hostname;
    std::string username;

    IncidentRecord() = default;
    IncidentRecord(const std::string& id, const Detection& d);
};

void to_json(nlohmann::json& j, const IncidentRecord& r);
void from_json(const nlohmann::json& j, IncidentRecord& r);

}
