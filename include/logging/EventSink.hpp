#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace spdlog { class logger; }

namespace fv::logging {

inline constexpr auto* EVENT_SOURCE = "file-validator";
inline constexpr auto* EVENT_VERSION = "1.1";

namespace event_type {
inline constexpr auto* EXTENSION_MISMATCH = "FILE_EXTENSION_MISMATCH";
inline constexpr auto* TYPE_UNKNOWN       = "FILE_TYPE_UNKNOWN";
inline constexpr auto* QUARANTINED        = "FILE_QUARANTINED";
inline constexpr auto* QUARANTINE_FAILED  = "FILE_QUARANTINE_FAILED";
inline constexpr auto* SYSTEM_START       = "SYSTEM_START";
inline constexpr auto* SYSTEM_STOP        = "SYSTEM_STOP";
}

enum class Severity { Info, Low, Medium, High, Critical };

std::string to_string(Severity s);

// One SIEM record. Rendered as a single-line JSON object.
struct SecurityEvent {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string event_type;
    Severity severity = Severity::Info;
    std::string source = EVENT_SOURCE;
    std::string version = EVENT_VERSION;
    std::string hostname;
    std::string username;
    nlohmann::json data = nlohmann::json::object();

    SecurityEvent() = default;
    SecurityEvent(std::string type, Severity sev, nlohmann::json payload);

    [[nodiscard]] nlohmann::json toJson() const;
};

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void emit(const SecurityEvent& event) = 0;
};

// Appends one JSON object per line to <log_dir>/events.json through a
// dedicated file-only spdlog logger.
class SpdlogEventSink : public EventSink {
public:
    explicit SpdlogEventSink(const std::filesystem::path& file, bool consoleSummary = true);
    ~SpdlogEventSink() override;

    void emit(const SecurityEvent& event) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool consoleSummary_;
    std::shared_ptr<spdlog::logger> logger_;
};

}
