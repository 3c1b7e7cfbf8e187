#include "quarantine/IncidentRecord.hpp"
#include "util/system.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace fv::quarantine;

IncidentRecord::IncidentRecord(const std::string& id, const Detection& d)
    : incident_id(id),
      filepath(d.path.string()),
      filename(d.path.filename().string()),
      claimed_extension(d.claimed_extension),
      actual_type(d.actual_type),
      file_hash_sha256(d.evidence.sha256),
      file_owner(d.evidence.owner),
      file_size_bytes(d.evidence.size_bytes),
      detection_time(util::isoTimestamp(d.detected_at)),
      magic_number_hex(d.evidence.magic_hex),
      hostname(util::hostname()),
      username(util::processUser()) {
    if (d.evidence.modified_at) modified_time = util::isoTimestamp(*d.evidence.modified_at);
}

void fv::quarantine::to_json(nlohmann::json& j, const IncidentRecord& r) {
    j = {
        {"incident_id", r.incident_id},
        {"filepath", r.filepath},
        {"filename", r.filename},
        {"claimed_extension", r.claimed_extension},
        {"actual_type", r.actual_type},
        {"file_size_bytes", r.file_size_bytes},
        {"detection_time", r.detection_time},
        {"magic_number_hex", r.magic_number_hex},
        {"quarantine_mode", r.quarantine_mode},
        {"quarantine_path", r.quarantine_path},
        {"hostname", r.hostname},
        {"username", r.username}
    };

    j["file_hash_sha256"] = r.file_hash_sha256 ? nlohmann::json(*r.file_hash_sha256) : nlohmann::json(nullptr);
    j["file_owner"] = r.file_owner ? nlohmann::json(*r.file_owner) : nlohmann::json(nullptr);
    j["modified_time"] = r.modified_time ? nlohmann::json(*r.modified_time) : nlohmann::json(nullptr);
}

void fv::quarantine::from_json(const nlohmann::json& j, IncidentRecord& r) {
    j.at("incident_id").get_to(r.incident_id);
    j.at("filepath").get_to(r.filepath);
    j.at("filename").get_to(r.filename);
    j.at("claimed_extension").get_to(r.claimed_extension);
    j.at("actual_type").get_to(r.actual_type);
    j.at("file_size_bytes").get_to(r.file_size_bytes);
    j.at("detection_time").get_to(r.detection_time);
    j.at("magic_number_hex").get_to(r.magic_number_hex);
    r.quarantine_mode = j.value("quarantine_mode", "");
    r.quarantine_path = j.value("quarantine_path", "");
    r.hostname = j.value("hostname", "unknown");
    r.username = j.value("username", "unknown");

    const auto optString = [&j](const char* key) -> std::optional<std::string> {
        if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
        return j.at(key).get<std::string>();
    };
    r.file_hash_sha256 = optString("file_hash_sha256");
    r.file_owner = optString("file_owner");
    r.modified_time = optString("modified_time");
}
