#include "logging/EventSink.hpp"
#include "logging/LogRegistry.hpp"
#include "util/system.hpp"
#include "util/timestamp.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

using namespace fv::logging;

std::string fv::logging::to_string(const Severity s) {
    switch (s) {
        case Severity::Info: return "INFO";
        case Severity::Low: return "LOW";
        case Severity::Medium: return "MEDIUM";
        case Severity::High: return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

SecurityEvent::SecurityEvent(std::string type, const Severity sev, nlohmann::json payload)
    : event_type(std::move(type)),
      severity(sev),
      hostname(util::hostname()),
      username(util::processUser()),
      data(std::move(payload)) {}

nlohmann::json SecurityEvent::toJson() const {
    return {
        {"timestamp", util::isoTimestamp(timestamp)},
        {"event_type", event_type},
        {"severity", to_string(severity)},
        {"source", source},
        {"version", version},
        {"hostname", hostname},
        {"username", username},
        {"data", data}
    };
}

SpdlogEventSink::SpdlogEventSink(const std::filesystem::path& file, const bool consoleSummary)
    : path_(file), consoleSummary_(consoleSummary) {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_.string(), /*truncate=*/false);
    sink->set_pattern("%v");
    sink->set_level(spdlog::level::info);

    logger_ = std::make_shared<spdlog::logger>("siem", sink);
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::info);
}

SpdlogEventSink::~SpdlogEventSink() {
    if (logger_) logger_->flush();
}

void SpdlogEventSink::emit(const SecurityEvent& event) {
    // File names are not guaranteed to be UTF-8; never lose a record over one.
    logger_->info(event.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    if (!consoleSummary_ || !LogRegistry::isInitialized()) return;

    const auto where = event.data.value("filepath", event.data.value("original_path", std::string{}));
    if (event.severity >= Severity::High)
        LogRegistry::validator()->warn("[!] {}: {}", event.event_type, where.empty() ? "N/A" : where);
    else
        LogRegistry::validator()->info("[*] {}{}", event.event_type, where.empty() ? "" : ": " + where);
}
