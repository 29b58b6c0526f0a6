#include "ferry/crypto/crypto.hpp"

#include <sodium.h>

namespace ferry::crypto {

bool init() {
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

void random_bytes(std::span<uint8_t> output) {
    randombytes_buf(output.data(), output.size());
}

bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool is_all_zero(std::span<const uint8_t> data) {
    return sodium_is_zero(data.data(), data.size()) == 1;
}

Sha256Digest sha256(std::span<const uint8_t> data) {
    Sha256Digest digest;
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

}  // namespace ferry::crypto
