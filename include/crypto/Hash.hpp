#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>

namespace fv::crypto {

class Hash {
public:
    // Streams the file through SHA-256. Throws std::runtime_error if the file
    // cannot be read or holds more than maxBytes.
    static std::string sha256(const std::filesystem::path& filepath,
                              uintmax_t maxBytes = std::numeric_limits<uintmax_t>::max());

    // Unkeyed BLAKE2b of an in-memory buffer, hex encoded.
    static std::string blake2b(std::string_view data);
};

}
