#include "core/Scanner.hpp"
#include "core/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"

using namespace fv::core;
using namespace fv::detect;
using namespace fv::logging;

ScanSummary Scanner::scan(const std::vector<std::filesystem::path>& roots) const {
    ScanSummary summary;
    const DirectoryWalker walker(recursive_);

    // Excluded trees (the quarantine root among them) are never entered, and a
    // stop request prunes whatever the walk has not reached yet.
    const auto filter = [this](const fs::directory_entry& e) {
        return !stopRequested() && !validator_.isExcluded(e.path());
    };

    for (const auto& root : roots) {
        if (summary.interrupted) break;
        LogRegistry::validator()->info("[Scanner] Scanning {}", root.string());

        for (const auto& entry : walker.walk(fs::absolute(root).lexically_normal(), filter)) {
            if (entry.is_directory) continue;

            if (stopRequested()) {
                LogRegistry::validator()->warn("[Scanner] Stop requested, abandoning scan of {}", root.string());
                summary.interrupted = true;
                break;
            }

            const auto outcome = validator_.handle({entry.path, types::FileEventKind::Created});
            ++summary.files;

            switch (outcome.outcome) {
                case Outcome::Skipped: ++summary.skipped; break;
                case Outcome::Match: ++summary.matches; break;
                case Outcome::Unknown: ++summary.unknown; break;
                case Outcome::Mismatch:
                    ++summary.mismatches;
                    if (outcome.quarantine && outcome.quarantine->recorded()) ++summary.quarantined;
                    break;
                case Outcome::Unreadable:
                case Outcome::Failed: ++summary.failed; break;
            }
        }
    }

    LogRegistry::validator()->info("[Scanner] {}{} files: {} match, {} mismatch ({} quarantined), {} unknown, {} skipped, {} failed",
                                   summary.interrupted ? "(interrupted) " : "", summary.files, summary.matches,
                                   summary.mismatches, summary.quarantined, summary.unknown, summary.skipped, summary.failed);
    return summary;
}
