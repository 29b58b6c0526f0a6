#include "ferry/crypto/aead.hpp"

#include <sodium.h>
#include <algorithm>

#include "ferry/common/errors.hpp"

namespace ferry::crypto {

std::vector<uint8_t> AeadResult::combined() const {
    std::vector<uint8_t> out;
    out.reserve(ciphertext.size() + tag.size());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
}

std::optional<AeadResult> AeadResult::from_combined(std::span<const uint8_t> payload,
                                                    const Nonce& iv) {
    if (payload.size() < AEAD_TAG_SIZE) {
        return std::nullopt;
    }

    AeadResult result;
    const size_t ct_len = payload.size() - AEAD_TAG_SIZE;
    result.ciphertext.assign(payload.begin(), payload.begin() + ct_len);
    std::copy(payload.begin() + ct_len, payload.end(), result.tag.begin());
    result.iv = iv;
    return result;
}

void encrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> plaintext,
                      std::span<const uint8_t> additional_data,
                      std::span<uint8_t> ciphertext_out,
                      AuthTag& tag_out) {
    unsigned long long tag_len;
    crypto_aead_chacha20poly1305_ietf_encrypt_detached(
        ciphertext_out.data(),
        tag_out.data(), &tag_len,
        plaintext.data(), plaintext.size(),
        additional_data.data(), additional_data.size(),
        nullptr,  // nsec
        nonce.data(),
        key.data()
    );
}

bool decrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> ciphertext,
                      const AuthTag& tag,
                      std::span<const uint8_t> additional_data,
                      std::span<uint8_t> plaintext_out) {
    return crypto_aead_chacha20poly1305_ietf_decrypt_detached(
        plaintext_out.data(),
        nullptr,  // nsec
        ciphertext.data(), ciphertext.size(),
        tag.data(),
        additional_data.data(), additional_data.size(),
        nonce.data(),
        key.data()
    ) == 0;
}

Nonce generate_iv() {
    Nonce iv;
    do {
        random_bytes(iv);
    } while (is_all_zero(iv));
    return iv;
}

AeadResult seal(const SymmetricKey& key,
                const Nonce& iv,
                std::span<const uint8_t> aad,
                std::span<const uint8_t> plaintext) {
    if (is_all_zero(key)) {
        throw CryptoException("encryption key cannot be all zeros");
    }
    if (is_all_zero(iv)) {
        throw CryptoException("IV cannot be all zeros");
    }
    if (plaintext.empty()) {
        throw CryptoException("plaintext cannot be empty");
    }

    AeadResult result;
    result.ciphertext.resize(plaintext.size());
    result.iv = iv;
    encrypt_detached(key, iv, plaintext, aad, result.ciphertext, result.tag);
    return result;
}

std::vector<uint8_t> open(const SymmetricKey& key,
                          std::span<const uint8_t> aad,
                          const AeadResult& encrypted) {
    if (is_all_zero(key)) {
        throw CryptoException("decryption key cannot be all zeros");
    }
    if (is_all_zero(encrypted.iv)) {
        throw CryptoException("IV cannot be all zeros");
    }
    if (encrypted.ciphertext.empty()) {
        throw CryptoException("ciphertext cannot be empty");
    }

    std::vector<uint8_t> plaintext(encrypted.ciphertext.size());
    if (!decrypt_detached(key, encrypted.iv, encrypted.ciphertext, encrypted.tag, aad, plaintext)) {
        secure_zero(plaintext.data(), plaintext.size());
        throw CryptoException("authentication failed");
    }
    return plaintext;
}

}  // namespace ferry::crypto
