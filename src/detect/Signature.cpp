#include "detect/Signature.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace fv::detect;

namespace {

int hexNibble(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

MagicPattern MagicPattern::fromHex(const std::string_view hex, const size_t offset, const int priority) {
    MagicPattern p;
    p.offset = offset;
    p.priority = priority;

    size_t i = 0;
    while (i < hex.size()) {
        if (std::isspace(static_cast<unsigned char>(hex[i]))) { ++i; continue; }
        if (i + 1 >= hex.size()) throw std::invalid_argument("Odd-length hex pattern: " + std::string(hex));

        if (hex[i] == '?' && hex[i + 1] == '?') p.bytes.push_back(-1);
        else {
            const int hi = hexNibble(hex[i]), lo = hexNibble(hex[i + 1]);
            if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid hex pattern: " + std::string(hex));
            p.bytes.push_back(static_cast<int16_t>((hi << 4) | lo));
        }
        i += 2;
    }

    if (p.bytes.empty()) throw std::invalid_argument("Empty magic pattern");
    return p;
}

MagicPattern MagicPattern::fromText(const std::string_view text, const size_t offset, const int priority) {
    if (text.empty()) throw std::invalid_argument("Empty magic pattern");

    MagicPattern p;
    p.offset = offset;
    p.priority = priority;
    p.bytes.reserve(text.size());
    for (const char c : text) p.bytes.push_back(static_cast<int16_t>(static_cast<unsigned char>(c)));
    return p;
}

MagicPattern& MagicPattern::then(const MagicPattern& next) {
    if (next.offset < span()) throw std::invalid_argument("Chained pattern overlaps its predecessor");
    bytes.insert(bytes.end(), next.offset - span(), -1);
    bytes.insert(bytes.end(), next.bytes.begin(), next.bytes.end());
    return *this;
}

size_t MagicPattern::specificity() const {
    return static_cast<size_t>(std::ranges::count_if(bytes, [](const int16_t b) { return b >= 0; }));
}

bool MagicPattern::matches(const std::span<const uint8_t> data) const {
    if (data.size() < span()) return false;
    for (size_t i = 0; i < bytes.size(); ++i)
        if (bytes[i] >= 0 && data[offset + i] != static_cast<uint8_t>(bytes[i])) return false;
    return true;
}

std::vector<uint8_t> MagicPattern::extract(const std::span<const uint8_t> data) const {
    if (data.size() < span()) return {};
    return {data.begin() + static_cast<std::ptrdiff_t>(offset), data.begin() + static_cast<std::ptrdiff_t>(span())};
}
