#pragma once

#include "config/Config.hpp"
#include "crypto/IdGenerator.hpp"
#include "quarantine/IncidentRecord.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fv::quarantine {

enum class IncidentState { New, Relocating, Recorded, Failed, Duplicate };

std::string to_string(IncidentState s);

struct QuarantineResult {
    IncidentState state = IncidentState::New;
    std::optional<IncidentRecord> record;
    std::filesystem::path incident_dir;
    std::string error;

    [[nodiscard]] bool recorded() const { return state == IncidentState::Recorded; }
    [[nodiscard]] bool duplicate() const { return state == IncidentState::Duplicate; }
};

/*
 * Each incident is assembled in a hidden staging directory
 * (<root>/.<id>.partial) and published with a single rename to <root>/<id>,
 * so a crash never leaves a half-written incident under a final id.
 *
 * A claim marker under <root>/.claims, created with O_EXCL and keyed on the
 * source path, size and mtime, makes concurrent requests for the same file
 * produce exactly one incident. In copy mode the claim outlives the request
 * and names its incident; deleting the incident frees the claim.
 *
 * A moved file that cannot be put back after a failure is kept under
 * <root>/<id>.unrestored rather than deleted.
 */
class QuarantineManager {
public:
    static constexpr const auto* METADATA_FILE = "metadata.json";
    static constexpr const auto* CLAIMS_DIR = ".claims";
    static constexpr const auto* STAGING_SUFFIX = ".partial";
    static constexpr const auto* UNRESTORED_SUFFIX = ".unrestored";

    explicit QuarantineManager(const config::QuarantineConfig& cfg);
    virtual ~QuarantineManager() = default;

    QuarantineResult quarantine(const Detection& detection);

    // Removes staging directories left behind by an interrupted run, and
    // claims that no longer guard an incident. Returns the number removed.
    size_t sweepStaleStaging();

    [[nodiscard]] const std::filesystem::path& root() const { return cfg_.path; }
    [[nodiscard]] config::QuarantineMode mode() const { return cfg_.mode; }

protected:
    // Writes metadata.json into the staging directory. Throws on failure.
    virtual void writeMetadata(const std::filesystem::path& staging, const IncidentRecord& record) const;

private:
    config::QuarantineConfig cfg_;
    crypto::IdGenerator ids_;

    [[nodiscard]] std::filesystem::path claimsDir() const { return cfg_.path / CLAIMS_DIR; }

    std::optional<std::filesystem::path> claim(const std::filesystem::path& source,
                                               uintmax_t size,
                                               std::filesystem::file_time_type mtime,
                                               std::string& error) const;

    void releaseClaim(const std::filesystem::path& claimFile) const;
    void bindClaim(const std::filesystem::path& claimFile, const std::filesystem::path& source, const std::string& id) const;

    // Stale: bound to an incident that no longer exists, or unbound when unboundIsStale.
    [[nodiscard]] bool isStaleClaim(const std::filesystem::path& claimFile, bool unboundIsStale) const;
    size_t pruneClaims();

    // Creates a fresh staging directory; returns its id.
    std::string openStaging(std::filesystem::path& staging) const;

    // Moves or copies source to dest. Returns false with ec set on failure.
    bool relocate(const std::filesystem::path& source, const std::filesystem::path& dest, std::error_code& ec) const;

    // Undoes a partial incident. Returns where the file was left when a moved
    // file could not be put back.
    std::optional<std::filesystem::path> rollback(const std::string& id,
                                                  const std::filesystem::path& source,
                                                  const std::filesystem::path& dest,
                                                  const std::filesystem::path& staging,
                                                  const std::filesystem::path& claimFile,
                                                  bool relocated) const;

    static std::string payloadName(const std::filesystem::path& source);
};

}
