#pragma once

#include "detect/FileValidator.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace fv::core {

struct ScanSummary {
    size_t files = 0;
    size_t matches = 0;
    size_t mismatches = 0;
    size_t unknown = 0;
    size_t skipped = 0;
    size_t failed = 0;   // unreadable or errored
    size_t quarantined = 0;
    bool interrupted = false;

    // Process exit status for --scan: 2 when anything was disguised, 1 when a
    // file could not be inspected or the scan was cut short, otherwise 0.
    [[nodiscard]] int exitStatus() const {
        if (mismatches > 0) return 2;
        if (failed > 0 || interrupted) return 1;
        return 0;
    }
};

// Feeds every regular file under the given roots through the validator once.
// shouldStop is polled before each file; once it returns true the scan ends
// with the counts gathered so far and interrupted set.
class Scanner {
public:
    using StopPredicate = std::function<bool()>;

    Scanner(detect::FileValidator& validator, bool recursive, StopPredicate shouldStop = nullptr)
        : validator_(validator), recursive_(recursive), shouldStop_(std::move(shouldStop)) {}

    ScanSummary scan(const std::vector<std::filesystem::path>& roots) const;

private:
    detect::FileValidator& validator_;
    bool recursive_;
    StopPredicate shouldStop_;

    [[nodiscard]] bool stopRequested() const { return shouldStop_ && shouldStop_(); }
};

}
