#include "detect/Classifier.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <system_error>

using namespace fv::detect;
using namespace fv::logging;

ClassificationResult Classifier::classify(const std::span<const uint8_t> leading) const {
    ClassificationResult result;
    result.header.assign(leading.begin(), leading.end());

    if (leading.empty()) return result;

    for (const auto& entry : table_.ordered()) {
        const auto& pattern = table_.patternOf(entry);
        if (!pattern.matches(leading)) continue;

        result.status = ClassificationStatus::Identified;
        result.content_type = table_.signatureOf(entry).content_type;
        result.matched_pattern = pattern.extract(leading);
        return result;
    }

    return result;
}

ClassificationResult Classifier::classifyFile(const std::filesystem::path& path) const {
    std::vector<uint8_t> header;
    try {
        header = util::readFilePrefix(path, table_.requiredHeaderBytes());
    } catch (const std::system_error& e) {
        LogRegistry::detect()->debug("[Classifier] Cannot read {}: {}", path.string(), e.what());
        ClassificationResult result;
        result.status = ClassificationStatus::Unreadable;
        result.error = e.what();
        return result;
    }

    return classify(header);
}
