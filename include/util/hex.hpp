#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fv::util {

inline std::string toHex(const uint8_t* data, const size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string toHex(const std::vector<uint8_t>& bytes, const size_t maxBytes = SIZE_MAX) {
    return toHex(bytes.data(), std::min(bytes.size(), maxBytes));
}

}
