#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include "crypto.hpp"

namespace ferry::crypto {

// HMAC-SHA256
HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message);

// HKDF-SHA256 Extract
// Returns PRK (pseudorandom key)
HmacDigest hkdf_extract(std::span<const uint8_t> salt, std::span<const uint8_t> ikm);

// HKDF-SHA256 Expand
// Derives output key material from PRK
void hkdf_expand(std::span<const uint8_t> prk,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> output);

// Combined HKDF Extract and Expand
void hkdf(std::span<const uint8_t> salt,
          std::span<const uint8_t> ikm,
          std::span<const uint8_t> info,
          std::span<uint8_t> output);

// Default HKDF info for a session: "ferry/v1/session:<session_id>"
std::string default_session_info(std::string_view session_id);

// Derive the 32-byte session key.
//
// The two public keys are put in lexicographic order before they enter the
// salt, so both peers get the same key whichever side calls this "local":
//   salt = SHA-256(min(a, b) || max(a, b) || session_id)
//   key  = HKDF-SHA256(salt, shared_secret, info)
// An empty info selects default_session_info(session_id).
// Returns nullopt if the output is all zeros.
std::optional<SymmetricKey> derive_session_key(const SharedSecret& shared_secret,
                                               std::string_view session_id,
                                               const PublicKey& public_key_a,
                                               const PublicKey& public_key_b,
                                               std::span<const uint8_t> info = {});

}  // namespace ferry::crypto
