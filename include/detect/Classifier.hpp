#pragma once

#include "detect/SignatureTable.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fv::detect {

enum class ClassificationStatus { Identified, Unknown, Unreadable };

struct ClassificationResult {
    ClassificationStatus status = ClassificationStatus::Unknown;
    std::string content_type = UNKNOWN_CONTENT_TYPE;
    std::optional<std::vector<uint8_t>> matched_pattern;
    std::vector<uint8_t> header;   // leading bytes that were inspected
    std::string error;             // set when Unreadable

    [[nodiscard]] bool identified() const { return status == ClassificationStatus::Identified; }
    [[nodiscard]] bool unreadable() const { return status == ClassificationStatus::Unreadable; }
};

class Classifier {
public:
    explicit Classifier(const SignatureTable& table) : table_(table) {}

    [[nodiscard]] ClassificationResult classify(std::span<const uint8_t> leading) const;

    // Reads at most requiredHeaderBytes() from the file and classifies them.
    // Read failures come back as Unreadable, never as an exception.
    [[nodiscard]] ClassificationResult classifyFile(const std::filesystem::path& path) const;

    [[nodiscard]] const SignatureTable& table() const { return table_; }

private:
    const SignatureTable& table_;
};

}
