#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace fv::detect {

inline constexpr auto* UNKNOWN_CONTENT_TYPE = "unknown";

// A fixed-position byte pattern. Wildcard positions are stored as -1.
struct MagicPattern {
    std::vector<int16_t> bytes;
    size_t offset = 0;
    int priority = 0;

    // "50 4B 03 04 ?? ??" style; whitespace between bytes is optional.
    static MagicPattern fromHex(std::string_view hex, size_t offset = 0, int priority = 0);

    // Literal bytes, e.g. "%PDF" or std::string_view("Rar!\x1a\x07", 6).
    static MagicPattern fromText(std::string_view text, size_t offset = 0, int priority = 0);

    MagicPattern& then(const MagicPattern& next);

    // Number of leading file bytes needed to evaluate this pattern.
    [[nodiscard]] size_t span() const { return offset + bytes.size(); }

    // Count of non-wildcard bytes, used to order overlapping patterns.
    [[nodiscard]] size_t specificity() const;

    [[nodiscard]] bool matches(std::span<const uint8_t> data) const;

    // The file bytes covered by this pattern. Only valid after a match.
    [[nodiscard]] std::vector<uint8_t> extract(std::span<const uint8_t> data) const;
};

struct Signature {
    std::string content_type;
    std::vector<MagicPattern> patterns;
    std::unordered_set<std::string> accepted_extensions; // normalized, "" means no extension

    [[nodiscard]] bool accepts(const std::string& extension) const {
        return accepted_extensions.contains(extension);
    }
};

}
