#pragma once

#include "detect/Signature.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace fv::detect {

// Immutable content-type table. Patterns from every signature are flattened
// into one list ordered by priority (high first), then specificity (more fixed
// bytes first), then declaration order.
class SignatureTable {
public:
    struct Entry {
        size_t signature;
        size_t pattern;
    };

    explicit SignatureTable(std::vector<Signature> signatures);

    // The table the daemon runs with.
    static SignatureTable builtin();

    [[nodiscard]] const std::vector<Signature>& signatures() const { return signatures_; }
    [[nodiscard]] const std::vector<Entry>& ordered() const { return ordered_; }

    [[nodiscard]] const Signature& signatureOf(const Entry& e) const { return signatures_[e.signature]; }
    [[nodiscard]] const MagicPattern& patternOf(const Entry& e) const { return signatures_[e.signature].patterns[e.pattern]; }

    [[nodiscard]] const Signature* find(const std::string& content_type) const;

    // Header length that lets every pattern be evaluated.
    [[nodiscard]] size_t requiredHeaderBytes() const { return required_bytes_; }

    [[nodiscard]] bool isKnownExtension(const std::string& extension) const {
        return known_extensions_.contains(extension);
    }

private:
    std::vector<Signature> signatures_;
    std::vector<Entry> ordered_;
    std::unordered_set<std::string> known_extensions_;
    size_t required_bytes_ = 0;
};

}
