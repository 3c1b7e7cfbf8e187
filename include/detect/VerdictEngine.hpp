#pragma once

#include "detect/SignatureTable.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fv::detect {

enum class Verdict { Match, Mismatch, Unknown };

std::string to_string(Verdict v);

class VerdictEngine {
public:
    explicit VerdictEngine(const SignatureTable& table) : table_(table) {}

    // Lower-cases and strips one leading dot. "" stays "" (no extension declared).
    static std::string normalizeExtension(std::string_view ext);

    // Normalized last extension of the file name: "a.tar.gz" -> "gz", ".bashrc" -> "".
    static std::string claimedExtension(const std::filesystem::path& path);

    [[nodiscard]] Verdict evaluate(const std::filesystem::path& file_path,
                                   std::string_view claimed_extension,
                                   const std::string& content_type) const;

private:
    const SignatureTable& table_;
};

}
