#pragma once

#include "config/Config.hpp"
#include "evidence/OwnerResolver.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace fv::evidence {

inline constexpr auto* HASH_UNAVAILABLE = "unavailable";
inline constexpr size_t MAGIC_HEX_BYTES = 16;

struct Evidence {
    std::optional<std::string> sha256;   // absent when hashing is disabled
    std::optional<std::string> owner;    // absent when owner lookup is disabled
    uintmax_t size_bytes = 0;
    std::optional<std::chrono::system_clock::time_point> modified_at;
    std::string magic_hex;

    [[nodiscard]] bool hashAvailable() const { return sha256 && *sha256 != HASH_UNAVAILABLE; }
};

class EvidenceCollector {
public:
    EvidenceCollector(const config::DetectionConfig& cfg, std::shared_ptr<OwnerResolver> owners);

    // Never throws for I/O trouble on the inspected file; missing pieces degrade.
    // magic_hex records the matched signature bytes when given, otherwise the
    // first MAGIC_HEX_BYTES of the header.
    [[nodiscard]] Evidence collect(const std::filesystem::path& path,
                                   std::span<const uint8_t> header,
                                   std::span<const uint8_t> matched = {}) const;

private:
    config::DetectionConfig cfg_;
    std::shared_ptr<OwnerResolver> owners_;
};

}
