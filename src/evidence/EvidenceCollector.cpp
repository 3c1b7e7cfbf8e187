#include "evidence/EvidenceCollector.hpp"
#include "crypto/Hash.hpp"
#include "logging/LogRegistry.hpp"
#include "util/hex.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <system_error>

using namespace fv::evidence;
using namespace fv::logging;

namespace fs = std::filesystem;

EvidenceCollector::EvidenceCollector(const config::DetectionConfig& cfg, std::shared_ptr<OwnerResolver> owners)
    : cfg_(cfg), owners_(std::move(owners)) {}

Evidence EvidenceCollector::collect(const fs::path& path,
                                    const std::span<const uint8_t> header,
                                    const std::span<const uint8_t> matched) const {
    Evidence ev;

    if (!matched.empty()) ev.magic_hex = util::toHex(matched.data(), matched.size());
    else ev.magic_hex = util::toHex(header.data(), std::min(header.size(), MAGIC_HEX_BYTES));

    std::error_code ec;
    if (const auto size = fs::file_size(path, ec); !ec) ev.size_bytes = size;
    else LogRegistry::evidence()->warn("[EvidenceCollector] Size unavailable for {}: {}", path.string(), ec.message());

    if (const auto mtime = fs::last_write_time(path, ec); !ec) ev.modified_at = util::toSystemClock(mtime);

    if (cfg_.calculate_hash) {
        try {
            ev.sha256 = crypto::Hash::sha256(path, cfg_.max_file_size_bytes);
        } catch (const std::exception& e) {
            LogRegistry::evidence()->warn("[EvidenceCollector] Hash unavailable for {}: {}", path.string(), e.what());
            ev.sha256 = HASH_UNAVAILABLE;
        }
    }

    if (owners_) ev.owner = owners_->ownerOf(path);

    return ev;
}
