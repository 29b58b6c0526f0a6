#pragma once

#include <optional>
#include <span>
#include <vector>
#include "crypto.hpp"

namespace ferry::crypto {

// Output of one AEAD encryption; the three fields travel together
struct AeadResult {
    std::vector<uint8_t> ciphertext;
    AuthTag tag{};
    Nonce iv{};

    // ciphertext || tag, as carried in a frame payload
    [[nodiscard]] std::vector<uint8_t> combined() const;

    // Split a frame payload (ciphertext || tag) back into a result.
    // Returns nullopt if the payload is shorter than a tag.
    static std::optional<AeadResult> from_combined(std::span<const uint8_t> payload,
                                                   const Nonce& iv);

    bool operator==(const AeadResult&) const = default;
};

// ChaCha20-Poly1305 (IETF) detached encryption, no input validation
void encrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> plaintext,
                      std::span<const uint8_t> additional_data,
                      std::span<uint8_t> ciphertext_out,
                      AuthTag& tag_out);

// ChaCha20-Poly1305 (IETF) detached decryption
// Returns false on authentication failure
bool decrypt_detached(const SymmetricKey& key,
                      const Nonce& nonce,
                      std::span<const uint8_t> ciphertext,
                      const AuthTag& tag,
                      std::span<const uint8_t> additional_data,
                      std::span<uint8_t> plaintext_out);

// Random 12-byte IV
Nonce generate_iv();

// Validated AEAD encryption.
// Throws CryptoException for an all-zero key or IV, or empty plaintext.
AeadResult seal(const SymmetricKey& key,
                const Nonce& iv,
                std::span<const uint8_t> aad,
                std::span<const uint8_t> plaintext);

// Validated AEAD decryption.
// Throws CryptoException for invalid inputs or when authentication fails.
std::vector<uint8_t> open(const SymmetricKey& key,
                          std::span<const uint8_t> aad,
                          const AeadResult& encrypted);

}  // namespace ferry::crypto
