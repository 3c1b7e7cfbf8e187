#include "quarantine/QuarantineManager.hpp"
#include "crypto/Hash.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace fv::quarantine;
using namespace fv::logging;

namespace fs = std::filesystem;

namespace {

constexpr int MAX_ID_ATTEMPTS = 8;
constexpr auto* CLAIM_INCIDENT_PREFIX = "incident: ";
constexpr auto* CLAIM_PATH_PREFIX = "path: ";

bool isMissing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory;
}

// The incident a claim was published under, if it got that far.
std::optional<std::string> claimIncident(const fs::path& claimFile) {
    std::ifstream in(claimFile);
    std::string line;
    if (!in || !std::getline(in, line) || !line.starts_with(CLAIM_INCIDENT_PREFIX)) return std::nullopt;
    return line.substr(std::string_view(CLAIM_INCIDENT_PREFIX).size());
}

// Puts a moved file back at source without replacing anything created there since.
bool restoreMoved(const fs::path& dest, const fs::path& source, std::error_code& ec) {
    ec.clear();
    if (::renameat2(AT_FDCWD, dest.c_str(), AT_FDCWD, source.c_str(), RENAME_NOREPLACE) == 0) return true;

    const int err = errno;
    // EXDEV: the move was a copy across devices. EINVAL: no RENAME_NOREPLACE support.
    if (err != EXDEV && err != EINVAL) {
        ec.assign(err, std::generic_category());
        return false;
    }

    // copy_options::none fails rather than overwrite an existing file
    fs::copy_file(dest, source, fs::copy_options::none, ec);
    return !ec;
}

}

std::string fv::quarantine::to_string(const IncidentState s) {
    switch (s) {
        case IncidentState::New: return "NEW";
        case IncidentState::Relocating: return "RELOCATING";
        case IncidentState::Recorded: return "RECORDED";
        case IncidentState::Failed: return "FAILED";
        case IncidentState::Duplicate: return "DUPLICATE";
    }
    return "UNKNOWN";
}

QuarantineManager::QuarantineManager(const config::QuarantineConfig& cfg) : cfg_(cfg) {
    fs::create_directories(cfg_.path);
    fs::create_directories(claimsDir());
}

QuarantineResult QuarantineManager::quarantine(const Detection& detection) {
    QuarantineResult result;
    const auto& source = detection.path;

    std::error_code ec;
    const auto st = fs::symlink_status(source, ec);
    if (ec || !fs::exists(st)) {
        LogRegistry::quarantine()->info("[QuarantineManager] {} is already gone, nothing to quarantine", source.string());
        result.state = IncidentState::Duplicate;
        return result;
    }

    if (!fs::is_regular_file(st)) {
        result.state = IncidentState::Failed;
        result.error = "not a regular file";
        return result;
    }

    const auto size = fs::file_size(source, ec);
    const auto mtime = ec ? fs::file_time_type{} : fs::last_write_time(source, ec);
    if (ec) {
        result.state = isMissing(ec) ? IncidentState::Duplicate : IncidentState::Failed;
        result.error = ec.message();
        return result;
    }

    std::string claimError;
    const auto claimFile = claim(source, size, mtime, claimError);
    if (!claimFile) {
        if (claimError.empty()) {
            LogRegistry::quarantine()->info("[QuarantineManager] {} already claimed by another event", source.string());
            result.state = IncidentState::Duplicate;
        } else {
            result.state = IncidentState::Failed;
            result.error = claimError;
        }
        return result;
    }

    fs::path staging;
    std::string id;
    try {
        id = openStaging(staging);
    } catch (const std::exception& e) {
        releaseClaim(*claimFile);
        result.state = IncidentState::Failed;
        result.error = e.what();
        return result;
    }

    result.state = IncidentState::Relocating;
    const auto finalDir = cfg_.path / id;
    const auto dest = staging / payloadName(source);

    if (!relocate(source, dest, ec)) {
        rollback(id, source, dest, staging, *claimFile, false);
        if (isMissing(ec)) {
            result.state = IncidentState::Duplicate;
            return result;
        }
        result.state = IncidentState::Failed;
        result.error = "relocation failed: " + ec.message();
        LogRegistry::quarantine()->error("[QuarantineManager] Failed to relocate {}: {}", source.string(), ec.message());
        return result;
    }

    IncidentRecord record(id, detection);
    record.quarantine_mode = config::to_string(cfg_.mode);
    record.quarantine_path = (finalDir / dest.filename()).string();

    try {
        writeMetadata(staging, record);

        fs::rename(staging, finalDir);
    } catch (const std::exception& e) {
        result.state = IncidentState::Failed;
        result.error = e.what();
        if (const auto kept = rollback(id, source, dest, staging, *claimFile, true))
            result.error += "; original could not be restored and is kept at " + kept->string();
        LogRegistry::quarantine()->error("[QuarantineManager] Incident {} for {} rolled back: {}", id, source.string(), e.what());
        return result;
    }

    fs::permissions(record.quarantine_path, fs::perms::owner_read, fs::perm_options::replace, ec);
    if (ec) LogRegistry::quarantine()->warn("[QuarantineManager] Could not make {} read-only: {}", record.quarantine_path, ec.message());

    // The moved source is gone, so its claim has nothing left to guard. A copy
    // keeps its claim until the incident it points at is deleted.
    if (cfg_.mode == config::QuarantineMode::Move) releaseClaim(*claimFile);
    else bindClaim(*claimFile, source, id);

    LogRegistry::quarantine()->info("[QuarantineManager] {} -> {} ({})", source.string(), record.quarantine_path, record.quarantine_mode);

    result.state = IncidentState::Recorded;
    result.incident_dir = finalDir;
    result.record = std::move(record);
    return result;
}

size_t QuarantineManager::sweepStaleStaging() {
    size_t removed = 0;
    std::error_code ec;

    for (fs::directory_iterator it(cfg_.path, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        const bool staging = name.size() > 1 && name.front() == '.' && name.ends_with(STAGING_SUFFIX);
        const bool tmpFile = name.size() > 1 && name.front() == '.' && name.ends_with(".tmp");
        if (!staging && !tmpFile) continue;

        std::error_code rmEc;
        fs::remove_all(it->path(), rmEc);
        if (rmEc) {
            LogRegistry::quarantine()->warn("[QuarantineManager] Could not remove stale {}: {}", it->path().string(), rmEc.message());
            continue;
        }
        ++removed;
    }

    if (ec) LogRegistry::quarantine()->warn("[QuarantineManager] Sweep of {} stopped: {}", cfg_.path.string(), ec.message());
    if (removed) LogRegistry::quarantine()->info("[QuarantineManager] Removed {} stale staging entries", removed);

    return removed + pruneClaims();
}

size_t QuarantineManager::pruneClaims() {
    size_t removed = 0;
    std::error_code ec;

    for (fs::directory_iterator it(claimsDir(), ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        // dot files are half-written or retired claims
        const bool leftover = name.front() == '.' && (name.ends_with(".tmp") || name.ends_with(".stale"));
        if (!leftover && (it->path().extension() != ".claim" || !isStaleClaim(it->path(), true))) continue;

        std::error_code rmEc;
        if (fs::remove(it->path(), rmEc)) ++removed;
        else if (rmEc) LogRegistry::quarantine()->warn("[QuarantineManager] Could not prune claim {}: {}", it->path().string(), rmEc.message());
    }

    if (ec && !isMissing(ec)) LogRegistry::quarantine()->warn("[QuarantineManager] Claim sweep stopped: {}", ec.message());
    if (removed) LogRegistry::quarantine()->info("[QuarantineManager] Pruned {} stale claims", removed);
    return removed;
}

bool QuarantineManager::isStaleClaim(const fs::path& claimFile, const bool unboundIsStale) const {
    const auto incident = claimIncident(claimFile);
    if (!incident) return unboundIsStale;

    std::error_code ec;
    return !incident->empty() && !fs::exists(cfg_.path / *incident, ec) && !ec;
}

std::optional<fs::path> QuarantineManager::claim(const fs::path& source,
                                                 const uintmax_t size,
                                                 const fs::file_time_type mtime,
                                                 std::string& error) const {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
    const auto key = crypto::Hash::blake2b(source.string() + '|' + std::to_string(size) + '|' + std::to_string(ns));
    auto claimFile = claimsDir() / (key + ".claim");

    std::error_code ec;
    fs::create_directories(claimsDir(), ec);

    int fd = ::open(claimFile.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    int err = fd < 0 ? errno : 0;

    // A claim whose incident has been deleted no longer guards anything. Only
    // the event that wins the rename of the stale claim may claim again.
    if (fd < 0 && err == EEXIST && isStaleClaim(claimFile, false)) {
        const auto retired = claimsDir() / ("." + claimFile.filename().string() + "." + util::generate_random_suffix() + ".stale");
        fs::rename(claimFile, retired, ec);
        if (!ec) {
            LogRegistry::quarantine()->info("[QuarantineManager] Incident behind claim for {} is gone, claiming again", source.string());
            fs::remove(retired, ec);
            fd = ::open(claimFile.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
            err = fd < 0 ? errno : 0;
        }
    }

    if (fd < 0) {
        if (err != EEXIST) error = "claim failed: " + std::error_code(err, std::generic_category()).message();
        return std::nullopt;
    }

    const auto line = CLAIM_PATH_PREFIX + source.string() + "\n";
    if (::write(fd, line.data(), line.size()) < 0)
        LogRegistry::quarantine()->debug("[QuarantineManager] Could not annotate claim {}", claimFile.string());
    ::close(fd);

    return claimFile;
}

void QuarantineManager::bindClaim(const fs::path& claimFile, const fs::path& source, const std::string& id) const {
    try {
        util::writeFileAtomic(claimFile, CLAIM_INCIDENT_PREFIX + id + "\n" + CLAIM_PATH_PREFIX + source.string() + "\n");
    } catch (const std::exception& e) {
        // An unbound claim still dedupes until the next startup sweep.
        LogRegistry::quarantine()->warn("[QuarantineManager] Could not bind claim {} to {}: {}", claimFile.string(), id, e.what());
    }
}

void QuarantineManager::releaseClaim(const fs::path& claimFile) const {
    std::error_code ec;
    fs::remove(claimFile, ec);
    if (ec) LogRegistry::quarantine()->warn("[QuarantineManager] Could not release claim {}: {}", claimFile.string(), ec.message());
}

std::string QuarantineManager::openStaging(fs::path& staging) const {
    const auto now = std::chrono::system_clock::now();

    for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
        auto id = ids_.generate(now);
        staging = cfg_.path / ("." + id + STAGING_SUFFIX);

        if (fs::exists(cfg_.path / id)) continue;
        // create_directory reports false when the directory already exists
        if (fs::create_directory(staging)) return id;
    }

    throw std::runtime_error("could not allocate a unique incident id");
}

void QuarantineManager::writeMetadata(const fs::path& staging, const IncidentRecord& record) const {
    const auto json = nlohmann::json(record).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    util::writeFileAtomic(staging / METADATA_FILE, json + "\n");
}

bool QuarantineManager::relocate(const fs::path& source, const fs::path& dest, std::error_code& ec) const {
    ec.clear();

    if (cfg_.mode == config::QuarantineMode::Copy) {
        fs::copy_file(source, dest, fs::copy_options::none, ec);
        return !ec;
    }

    fs::rename(source, dest, ec);
    if (!ec) return true;
    if (ec != std::errc::cross_device_link) return false;

    LogRegistry::quarantine()->debug("[QuarantineManager] {} is on another device, copying", source.string());

    fs::copy_file(source, dest, fs::copy_options::none, ec);
    if (ec) return false;

    fs::remove(source, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(dest, cleanup);
        return false;
    }
    return true;
}

std::optional<fs::path> QuarantineManager::rollback(const std::string& id,
                                                    const fs::path& source,
                                                    const fs::path& dest,
                                                    const fs::path& staging,
                                                    const fs::path& claimFile,
                                                    const bool relocated) const {
    std::error_code ec;

    if (relocated && cfg_.mode == config::QuarantineMode::Move && fs::exists(dest, ec) && !restoreMoved(dest, source, ec)) {
        // Out of the sweep's reach, so the only copy survives a restart.
        const auto kept = cfg_.path / (id + UNRESTORED_SUFFIX);
        std::error_code keepEc;
        fs::rename(staging, kept, keepEc);
        const auto& where = keepEc ? staging : kept;

        LogRegistry::quarantine()->critical("[QuarantineManager] Could not restore {} (left at {}): {}",
                                            source.string(), (where / dest.filename()).string(), ec.message());
        releaseClaim(claimFile);
        return where / dest.filename();
    }

    fs::remove_all(staging, ec);
    if (ec) LogRegistry::quarantine()->warn("[QuarantineManager] Could not remove staging {}: {}", staging.string(), ec.message());

    releaseClaim(claimFile);
    return std::nullopt;
}

std::string QuarantineManager::payloadName(const fs::path& source) {
    auto name = source.filename().string();
    if (name == METADATA_FILE) name += ".quarantined";
    return name;
}
