#include "detect/FileValidator.hpp"
#include "logging/EventSink.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"
#include "util/hex.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace fv::detect;
using namespace fv::logging;
using namespace fv::quarantine;

namespace fs = std::filesystem;

namespace {

nlohmann::json optionalJson(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

}

std::string fv::detect::to_string(const Outcome o) {
    switch (o) {
        case Outcome::Skipped: return "skipped";
        case Outcome::Unreadable: return "unreadable";
        case Outcome::Match: return "match";
        case Outcome::Unknown: return "unknown";
        case Outcome::Mismatch: return "mismatch";
        case Outcome::Failed: return "failed";
    }
    return "unknown";
}

FileValidator::FileValidator(const config::Config& cfg,
                             const SignatureTable& table,
                             std::shared_ptr<EventSink> sink,
                             std::shared_ptr<evidence::OwnerResolver> owners)
    : cfg_(cfg),
      table_(table),
      classifier_(table),
      verdicts_(table),
      evidence_(cfg.detection, std::move(owners)),
      sink_(std::move(sink)) {
    if (!sink_) throw std::invalid_argument("FileValidator requires an event sink");
    if (cfg_.quarantine.enabled) quarantine_ = std::make_unique<QuarantineManager>(cfg_.quarantine);
}

EventOutcome FileValidator::handle(const types::FileEvent& event) {
    try {
        return process(event);
    } catch (const std::exception& e) {
        LogRegistry::validator()->error("[FileValidator] Error processing {}: {}", event.path.string(), e.what());
        EventOutcome outcome;
        outcome.outcome = Outcome::Failed;
        outcome.reason = e.what();
        return outcome;
    }
}

bool FileValidator::isExcluded(const fs::path& path) const {
    return std::ranges::any_of(cfg_.monitoring.excluded_paths, [&path](const fs::path& prefix) {
        return util::isSameOrUnder(path, prefix);
    });
}

EventOutcome FileValidator::process(const types::FileEvent& event) {
    EventOutcome outcome;
    const auto path = fs::absolute(event.path).lexically_normal();

    if (isExcluded(path)) {
        outcome.reason = "excluded path";
        return outcome;
    }

    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (ec || !fs::is_regular_file(st)) {
        outcome.reason = "not a regular file";
        return outcome;
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        LogRegistry::detect()->debug("[FileValidator] {} vanished before inspection: {}", path.string(), ec.message());
        outcome.reason = ec.message();
        return outcome;
    }

    if (size > cfg_.detection.max_file_size_bytes) {
        LogRegistry::detect()->debug("[FileValidator] Skipping {} ({} bytes exceeds limit)", path.string(), size);
        outcome.reason = "exceeds max file size";
        return outcome;
    }

    outcome.claimed_extension = VerdictEngine::claimedExtension(path);

    if (cfg_.detection.require_known_extension && !table_.isKnownExtension(outcome.claimed_extension)) {
        outcome.reason = "extension not inspected";
        return outcome;
    }

    const auto classification = classifier_.classifyFile(path);
    if (classification.unreadable()) {
        LogRegistry::detect()->warn("[FileValidator] Cannot read {}: {}", path.string(), classification.error);
        outcome.outcome = Outcome::Unreadable;
        outcome.reason = classification.error;
        return outcome;
    }

    outcome.content_type = classification.content_type;

    switch (verdicts_.evaluate(path, outcome.claimed_extension, classification.content_type)) {
        case Verdict::Match:
            LogRegistry::detect()->debug("[FileValidator] {} is a genuine {}", path.string(), classification.content_type);
            outcome.outcome = Outcome::Match;
            break;

        case Verdict::Unknown:
            if (cfg_.detection.escalate_unknown && !outcome.claimed_extension.empty()
                && table_.isKnownExtension(outcome.claimed_extension)) {
                reportMismatch(path, classification, outcome, true);
                break;
            }
            if (cfg_.logging.log_unknown) reportUnknown(path, classification, outcome.claimed_extension);
            outcome.outcome = Outcome::Unknown;
            break;

        case Verdict::Mismatch:
            reportMismatch(path, classification, outcome, false);
            break;
    }

    return outcome;
}

void FileValidator::reportMismatch(const fs::path& path,
                                   const ClassificationResult& classification,
                                   EventOutcome& outcome,
                                   const bool escalated) {
    Detection detection;
    detection.path = path;
    detection.claimed_extension = outcome.claimed_extension;
    detection.actual_type = classification.content_type;
    detection.evidence = classification.matched_pattern
                             ? evidence_.collect(path, classification.header, *classification.matched_pattern)
                             : evidence_.collect(path, classification.header);

    nlohmann::json data = {
        {"filepath", path.string()},
        {"filename", path.filename().string()},
        {"claimed_extension", detection.claimed_extension},
        {"actual_type", detection.actual_type},
        {"file_hash_sha256", optionalJson(detection.evidence.sha256)},
        {"file_owner", optionalJson(detection.evidence.owner)},
        {"file_size_bytes", detection.evidence.size_bytes},
        {"magic_number_hex", detection.evidence.magic_hex},
        {"detection_time", util::isoTimestamp(detection.detected_at)}
    };
    if (escalated) data["escalated_unknown"] = true;

    sink_->emit(SecurityEvent(event_type::EXTENSION_MISMATCH, Severity::High, std::move(data)));

    outcome.outcome = Outcome::Mismatch;

    if (!quarantine_) return;

    auto result = quarantine_->quarantine(detection);
    reportQuarantine(detection, result);
    outcome.quarantine = std::move(result);
}

void FileValidator::reportUnknown(const fs::path& path, const ClassificationResult& classification,
                                  const std::string& claimed) const {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);

    sink_->emit(SecurityEvent(event_type::TYPE_UNKNOWN, Severity::Low, {
        {"filepath", path.string()},
        {"filename", path.filename().string()},
        {"claimed_extension", claimed},
        {"file_size_bytes", ec ? 0 : size},
        {"magic_number_hex", util::toHex(classification.header, evidence::MAGIC_HEX_BYTES)},
        {"detection_time", util::isoTimestamp(std::chrono::system_clock::now())}
    }));
}

void FileValidator::reportQuarantine(const Detection& detection, const QuarantineResult& result) const {
    switch (result.state) {
        case IncidentState::Recorded:
            sink_->emit(SecurityEvent(event_type::QUARANTINED, Severity::Info, {
                {"incident_id", result.record->incident_id},
                {"original_path", detection.path.string()},
                {"quarantine_path", result.record->quarantine_path},
                {"file_hash", optionalJson(detection.evidence.sha256)},
                {"mode", result.record->quarantine_mode}
            }));
            break;

        case IncidentState::Duplicate:
            LogRegistry::quarantine()->info("[FileValidator] {} already handled by another event", detection.path.string());
            break;

        default:
            sink_->emit(SecurityEvent(event_type::QUARANTINE_FAILED, Severity::High, {
                {"original_path", detection.path.string()},
                {"error", result.error},
                {"actual_type", detection.actual_type}
            }));
            break;
    }
}
