#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "ferry/crypto/aead.hpp"
#include "ferry/crypto/x25519.hpp"
#include "ferry/utils/time.hpp"

namespace ferry::session {

struct KeyManagerStats {
    size_t active_sessions = 0;
    size_t ephemeral_key_pairs = 0;
    size_t derived_keys = 0;
    size_t pending_rotations = 0;
};

// Age and use count of a session's current symmetric key
struct KeyUsage {
    std::chrono::milliseconds age{0};
    uint64_t uses = 0;
    bool rotation_pending = false;
};

// Per-session key storage.
//
// Private and symmetric keys never leave the manager; callers get public keys
// and AEAD results only. All key bytes are zeroed when an entry is removed.
// Thread-safe: one mutex guards the whole registry.
class KeyManager {
public:
    explicit KeyManager(utils::NowFn now_fn = utils::steady_now());
    ~KeyManager();

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    // Create (or replace) the ephemeral key pair for a session
    crypto::PublicKey generate_ephemeral_key_pair(const std::string& session_id);

    [[nodiscard]] std::optional<crypto::PublicKey> public_key(const std::string& session_id) const;

    // X25519 with the stored private key, then session key derivation.
    // Throws CryptoException for an unknown session or a rejected peer key.
    void complete_key_exchange(const std::string& session_id,
                               const crypto::PublicKey& remote_public_key,
                               std::span<const uint8_t> info = {});

    // Derive a session key from an externally computed shared secret and store it.
    // Throws CryptoException if derivation yields an unusable key.
    void derive_and_store_symmetric_key(const std::string& session_id,
                                        const crypto::SharedSecret& shared_secret,
                                        const crypto::PublicKey& public_key_a,
                                        const crypto::PublicKey& public_key_b,
                                        std::span<const uint8_t> info = {});

    // Key rotation.
    //
    // Both peers call begin_key_rotation, exchange the returned public keys and
    // call complete_key_rotation with the peer's. The old key stays in use until
    // then; afterwards it is zeroed and the use count restarts.
    [[nodiscard]] bool should_rotate_key(const std::string& session_id,
                                         std::chrono::milliseconds max_age,
                                         uint64_t max_uses) const;

    // Throws CryptoException if the session has no symmetric key
    crypto::PublicKey begin_key_rotation(const std::string& session_id);

    // Throws CryptoException if no rotation was begun or the peer key is rejected;
    // the pending rotation is then discarded and the old key kept
    void complete_key_rotation(const std::string& session_id,
                               const crypto::PublicKey& remote_public_key,
                               std::span<const uint8_t> info = {});

    [[nodiscard]] std::optional<KeyUsage> key_usage(const std::string& session_id) const;

    [[nodiscard]] bool has_session(const std::string& session_id) const;
    [[nodiscard]] bool has_symmetric_key(const std::string& session_id) const;

    // Throws CryptoException if the session has no symmetric key
    crypto::AeadResult encrypt_with_session_key(const std::string& session_id,
                                                std::span<const uint8_t> plaintext,
                                                std::span<const uint8_t> aad);

    std::vector<uint8_t> decrypt_with_session_key(const std::string& session_id,
                                                  const crypto::AeadResult& encrypted,
                                                  std::span<const uint8_t> aad);

    // Returns false if the session was unknown
    bool end_session(const std::string& session_id);

    // Returns the number of sessions ended
    size_t end_all_sessions();

    // End sessions created more than max_age ago; returns their ids
    std::vector<std::string> cleanup_expired_sessions(std::chrono::milliseconds max_age);

    [[nodiscard]] std::vector<std::string> active_sessions() const;
    [[nodiscard]] KeyManagerStats get_stats() const;

private:
    struct KeyEntry {
        std::optional<crypto::X25519KeyPair> key_pair;
        std::optional<crypto::SymmetricKey> symmetric_key;
        std::optional<crypto::X25519KeyPair> rotation_key_pair;
        utils::TimePoint created_at;
        utils::TimePoint key_installed_at;
        uint64_t key_uses = 0;

        ~KeyEntry();
    };

    KeyEntry& require_key(const std::string& session_id);
    void install_key(KeyEntry& entry, crypto::SymmetricKey& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, KeyEntry> entries_;
    utils::NowFn now_fn_;
};

}  // namespace ferry::session
