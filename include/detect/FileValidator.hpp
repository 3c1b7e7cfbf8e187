#pragma once

#include "config/Config.hpp"
#include "detect/Classifier.hpp"
#include "detect/SignatureTable.hpp"
#include "detect/VerdictEngine.hpp"
#include "evidence/EvidenceCollector.hpp"
#include "quarantine/QuarantineManager.hpp"
#include "types/FileEvent.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace fv::logging { class EventSink; }

namespace fv::detect {

enum class Outcome { Skipped, Unreadable, Match, Unknown, Mismatch, Failed };

std::string to_string(Outcome o);

struct EventOutcome {
    Outcome outcome = Outcome::Skipped;
    std::string content_type = UNKNOWN_CONTENT_TYPE;
    std::string claimed_extension;
    std::string reason;   // why the event was skipped or failed
    std::optional<quarantine::QuarantineResult> quarantine;
};

/*
 * Per-event pipeline: skip rules, classification, verdict, then for a
 * mismatch evidence collection, a HIGH security event and quarantine.
 *
 * handle() isolates every failure to the event that caused it. Nothing thrown
 * while processing a file escapes to the caller.
 */
class FileValidator {
public:
    FileValidator(const config::Config& cfg,
                  const SignatureTable& table,
                  std::shared_ptr<logging::EventSink> sink,
                  std::shared_ptr<evidence::OwnerResolver> owners);

    EventOutcome handle(const types::FileEvent& event);

    [[nodiscard]] bool isExcluded(const std::filesystem::path& path) const;

    [[nodiscard]] quarantine::QuarantineManager* quarantineManager() const { return quarantine_.get(); }

private:
    config::Config cfg_;
    const SignatureTable& table_;
    Classifier classifier_;
    VerdictEngine verdicts_;
    evidence::EvidenceCollector evidence_;
    std::shared_ptr<logging::EventSink> sink_;
    std::unique_ptr<quarantine::QuarantineManager> quarantine_;

    EventOutcome process(const types::FileEvent& event);

    void reportMismatch(const std::filesystem::path& path,
                        const ClassificationResult& classification,
                        EventOutcome& outcome,
                        bool escalated);

    void reportUnknown(const std::filesystem::path& path, const ClassificationResult& classification,
                       const std::string& claimed) const;

    void reportQuarantine(const quarantine::Detection& detection, const quarantine::QuarantineResult& result) const;
};

}
