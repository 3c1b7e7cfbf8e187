#include "detect/VerdictEngine.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>

using namespace fv::detect;
using namespace fv::logging;

std::string fv::detect::to_string(const Verdict v) {
    switch (v) {
        case Verdict::Match: return "MATCH";
        case Verdict::Mismatch: return "MISMATCH";
        case Verdict::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string VerdictEngine::normalizeExtension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    std::string out(ext);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string VerdictEngine::claimedExtension(const std::filesystem::path& path) {
    return normalizeExtension(path.extension().string());
}

Verdict VerdictEngine::evaluate(const std::filesystem::path& file_path,
                                const std::string_view claimed_extension,
                                const std::string& content_type) const {
    if (content_type == UNKNOWN_CONTENT_TYPE) return Verdict::Unknown;

    const auto* sig = table_.find(content_type);
    if (!sig) {
        LogRegistry::detect()->warn("[VerdictEngine] No signature registered for content type '{}' ({})",
                                    content_type, file_path.string());
        return Verdict::Unknown;
    }

    return sig->accepts(normalizeExtension(claimed_extension)) ? Verdict::Match : Verdict::Mismatch;
}
