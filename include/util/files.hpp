#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fv::util {

// Reads up to maxBytes from the start of a regular file. Throws
// std::system_error on open/read failure (ENOENT, EACCES, EISDIR...).
std::vector<uint8_t> readFilePrefix(const std::filesystem::path& path, size_t maxBytes);

std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temporary file, fsyncs, then renames over the target.
void writeFileAtomic(const std::filesystem::path& path, const std::string& contents);

std::string generate_random_suffix(size_t length = 8);

// True if path equals prefix or lies beneath it, compared component-wise.
bool isSameOrUnder(const std::filesystem::path& path, const std::filesystem::path& prefix);

}
