#pragma once

#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fv::crypto {

// ---------- Alphabet: Crockford Base32 (no I, L, O, U), filesystem safe
static inline constexpr char kBase32Crockford[] =
    "0123456789ABCDEFGHJKMNPQRSTVWXYZ"; // [0..31]

enum class Case { Upper, Lower };

// ---------- Small helper: sodium init (thread-safe, idempotent)
inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

inline std::string b32_crockford_encode(const uint8_t* data, size_t len, Case out_case = Case::Upper) {
    if (len == 0) return {};
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            const uint8_t idx = (buffer >> bits) & 0x1F;
            out.push_back(kBase32Crockford[idx]);
        }
    }
    if (bits > 0) {
        const uint8_t idx = (buffer << (5 - bits)) & 0x1F;
        out.push_back(kBase32Crockford[idx]);
    }
    if (out_case == Case::Lower) {
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    }
    return out;
}

struct IdOptions {
    // Random bytes after the timestamp. 5 bytes => 40 bits => 8 chars.
    size_t random_bytes = 5;

    char separator = '_';

    Case out_case = Case::Upper;
};

// Incident ids: "<UTC timestamp with microseconds><sep><random body>", so two
// detections inside the same microsecond still get distinct directories.
class IdGenerator {
public:
    explicit IdGenerator(const IdOptions& opt = {}) : options_(opt) {
        ensure_sodium_init();
        if (options_.random_bytes == 0) throw std::invalid_argument("random_bytes must be > 0");
        if (options_.separator == ' ' || options_.separator == '\0' || options_.separator == '\n' || options_.separator == '/')
            throw std::invalid_argument("bad separator");
    }

    [[nodiscard]] std::string generate(std::chrono::system_clock::time_point at) const;

    [[nodiscard]] std::string random_body() const {
        std::vector<uint8_t> buf(options_.random_bytes);
        randombytes_buf(buf.data(), buf.size());
        return b32_crockford_encode(buf.data(), buf.size(), options_.out_case);
    }

    [[nodiscard]] const IdOptions& options() const { return options_; }

private:
    IdOptions options_;
};

}
