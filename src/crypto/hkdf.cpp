#include "ferry/crypto/hkdf.hpp"

#include <sodium.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace ferry::crypto {

namespace {
constexpr size_t HASH_LEN = 32;  // SHA-256 output length

// Helper to compute HMAC-SHA256 using libsodium's crypto_auth_hmacsha256
void hmac_sha256_impl(const uint8_t* key, size_t key_len,
                       const uint8_t* message, size_t message_len,
                       uint8_t* out) {
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key, key_len);
    crypto_auth_hmacsha256_update(&state, message, message_len);
    crypto_auth_hmacsha256_final(&state, out);
}
}  // namespace

HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message) {
    HmacDigest digest;
    hmac_sha256_impl(key.data(), key.size(), message.data(), message.size(), digest.data());
    return digest;
}

HmacDigest hkdf_extract(std::span<const uint8_t> salt, std::span<const uint8_t> ikm) {
    HmacDigest prk;

    // If salt is empty, use a string of zeros as the salt
    if (salt.empty()) {
        std::array<uint8_t, HASH_LEN> zero_salt{};
        hmac_sha256_impl(zero_salt.data(), zero_salt.size(),
                         ikm.data(), ikm.size(), prk.data());
    } else {
        hmac_sha256_impl(salt.data(), salt.size(),
                         ikm.data(), ikm.size(), prk.data());
    }

    return prk;
}

void hkdf_expand(std::span<const uint8_t> prk,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> output) {
    if (output.size() > 255 * HASH_LEN) {
        throw std::invalid_argument("HKDF output too long");
    }

    size_t n = (output.size() + HASH_LEN - 1) / HASH_LEN;
    std::array<uint8_t, HASH_LEN> t_prev{};
    size_t t_prev_len = 0;
    size_t output_pos = 0;

    for (size_t i = 1; i <= n; ++i) {
        // T(i) = HMAC(PRK, T(i-1) || info || i)
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state, prk.data(), prk.size());

        if (t_prev_len > 0) {
            crypto_auth_hmacsha256_update(&state, t_prev.data(), t_prev_len);
        }

        if (!info.empty()) {
            crypto_auth_hmacsha256_update(&state, info.data(), info.size());
        }

        uint8_t counter = static_cast<uint8_t>(i);
        crypto_auth_hmacsha256_update(&state, &counter, 1);

        crypto_auth_hmacsha256_final(&state, t_prev.data());
        t_prev_len = HASH_LEN;

        // Copy to output
        size_t to_copy = std::min<size_t>(HASH_LEN, output.size() - output_pos);
        std::memcpy(output.data() + output_pos, t_prev.data(), to_copy);
        output_pos += to_copy;
    }

    secure_zero(t_prev.data(), t_prev.size());
}

void hkdf(std::span<const uint8_t> salt,
          std::span<const uint8_t> ikm,
          std::span<const uint8_t> info,
          std::span<uint8_t> output) {
    auto prk = hkdf_extract(salt, ikm);
    hkdf_expand(prk, info, output);
    secure_zero(prk.data(), prk.size());
}

std::string default_session_info(std::string_view session_id) {
    constexpr std::string_view prefix = "ferry/v1/session:";
    std::string info;
    info.reserve(prefix.size() + session_id.size());
    info.append(prefix);
    info.append(session_id);
    return info;
}

std::optional<SymmetricKey> derive_session_key(const SharedSecret& shared_secret,
                                               std::string_view session_id,
                                               const PublicKey& public_key_a,
                                               const PublicKey& public_key_b,
                                               std::span<const uint8_t> info) {
    const bool a_first = std::lexicographical_compare(
        public_key_a.begin(), public_key_a.end(),
        public_key_b.begin(), public_key_b.end()) || public_key_a == public_key_b;
    const PublicKey& first = a_first ? public_key_a : public_key_b;
    const PublicKey& second = a_first ? public_key_b : public_key_a;

    // salt = SHA-256(first || second || session_id)
    std::vector<uint8_t> salt_input;
    salt_input.reserve(first.size() + second.size() + session_id.size());
    salt_input.insert(salt_input.end(), first.begin(), first.end());
    salt_input.insert(salt_input.end(), second.begin(), second.end());
    salt_input.insert(salt_input.end(), session_id.begin(), session_id.end());
    auto salt = sha256(salt_input);

    std::string default_info;
    if (info.empty()) {
        default_info = default_session_info(session_id);
        info = std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(default_info.data()), default_info.size());
    }

    SymmetricKey key;
    hkdf(salt, shared_secret, info, key);

    if (is_all_zero(key)) {
        return std::nullopt;
    }
    return key;
}

}  // namespace ferry::crypto
