#include "crypto/Hash.hpp"
#include "crypto/IdGenerator.hpp"
#include "util/hex.hpp"

#include <sodium.h>
#include <fstream>
#include <stdexcept>

using namespace fv::crypto;

std::string Hash::sha256(const std::filesystem::path& filepath, const uintmax_t maxBytes) {
    ensure_sodium_init();

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    uintmax_t total = 0;
    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        const auto n = file.gcount();
        if (n <= 0) break;

        total += static_cast<uintmax_t>(n);
        if (total > maxBytes)
            throw std::runtime_error("File grew past the hashing limit: " + filepath.string());

        crypto_hash_sha256_update(&state, reinterpret_cast<unsigned char*>(buffer), static_cast<unsigned long long>(n));
    }

    if (file.bad()) throw std::runtime_error("Read error while hashing: " + filepath.string());

    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&state, hash);

    return util::toHex(hash, sizeof(hash));
}

std::string Hash::blake2b(const std::string_view data) {
    ensure_sodium_init();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    crypto_generichash(hash, hash_len,
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       /*key=*/nullptr, 0);

    return util::toHex(hash, hash_len);
}
