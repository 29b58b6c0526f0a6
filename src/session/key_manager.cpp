#include "ferry/session/key_manager.hpp"

#include <spdlog/spdlog.h>

#include "ferry/common/errors.hpp"
#include "ferry/crypto/hkdf.hpp"

namespace ferry::session {

KeyManager::KeyEntry::~KeyEntry() {
    if (key_pair) {
        crypto::wipe(*key_pair);
    }
    if (symmetric_key) {
        crypto::secure_zero(symmetric_key->data(), symmetric_key->size());
    }
    if (rotation_key_pair) {
        crypto::wipe(*rotation_key_pair);
    }
}

KeyManager::KeyManager(utils::NowFn now_fn)
    : now_fn_(std::move(now_fn)) {}

KeyManager::~KeyManager() {
    end_all_sessions();
}

crypto::PublicKey KeyManager::generate_ephemeral_key_pair(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& entry = entries_[session_id];
    if (entry.key_pair) {
        crypto::wipe(*entry.key_pair);
    }
    if (entry.symmetric_key) {
        crypto::secure_zero(entry.symmetric_key->data(), entry.symmetric_key->size());
        entry.symmetric_key.reset();
    }
    if (entry.rotation_key_pair) {
        crypto::wipe(*entry.rotation_key_pair);
        entry.rotation_key_pair.reset();
    }
    entry.key_pair = crypto::generate_keypair();
    entry.created_at = now_fn_();

    spdlog::debug("Generated ephemeral key pair for session {}", session_id);
    return entry.key_pair->public_key;
}

std::optional<crypto::PublicKey> KeyManager::public_key(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end() || !it->second.key_pair) {
        return std::nullopt;
    }
    return it->second.key_pair->public_key;
}

void KeyManager::complete_key_exchange(const std::string& session_id,
                                       const crypto::PublicKey& remote_public_key,
                                       std::span<const uint8_t> info) {
    if (crypto::is_all_zero(remote_public_key)) {
        throw CryptoException("remote public key is all zeros");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end() || !it->second.key_pair) {
        throw CryptoException("no key pair for session: " + session_id);
    }
    auto& entry = it->second;

    auto shared = crypto::key_exchange(entry.key_pair->secret_key, remote_public_key);
    if (!shared) {
        throw CryptoException("key exchange failed for session: " + session_id);
    }

    auto key = crypto::derive_session_key(*shared, session_id,
                                          entry.key_pair->public_key, remote_public_key, info);
    crypto::secure_zero(shared->data(), shared->size());
    if (!key) {
        throw CryptoException("session key derivation failed for session: " + session_id);
    }

    install_key(entry, *key);
    spdlog::debug("Derived session key for session {}", session_id);
}

void KeyManager::derive_and_store_symmetric_key(const std::string& session_id,
                                                const crypto::SharedSecret& shared_secret,
                                                const crypto::PublicKey& public_key_a,
                                                const crypto::PublicKey& public_key_b,
                                                std::span<const uint8_t> info) {
    auto key = crypto::derive_session_key(shared_secret, session_id, public_key_a, public_key_b, info);
    if (!key) {
        throw CryptoException("session key derivation failed for session: " + session_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(session_id);
    if (inserted) {
        it->second.created_at = now_fn_();
    }
    install_key(it->second, *key);
}

// Caller holds mutex_; zeroes the source key
void KeyManager::install_key(KeyEntry& entry, crypto::SymmetricKey& key) {
    if (entry.symmetric_key) {
        crypto::secure_zero(entry.symmetric_key->data(), entry.symmetric_key->size());
    }
    entry.symmetric_key = key;
    entry.key_installed_at = now_fn_();
    entry.key_uses = 0;
    crypto::secure_zero(key.data(), key.size());
}

bool KeyManager::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(session_id) != 0;
}

bool KeyManager::has_symmetric_key(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_id);
    return it != entries_.end() && it->second.symmetric_key.has_value();
}

KeyManager::KeyEntry& KeyManager::require_key(const std::string& session_id) {
    auto it = entries_.find(session_id);
    if (it == entries_.end() || !it->second.symmetric_key) {
        throw CryptoException("no symmetric key found for session: " + session_id);
    }
    return it->second;
}

crypto::AeadResult KeyManager::encrypt_with_session_key(const std::string& session_id,
                                                        std::span<const uint8_t> plaintext,
                                                        std::span<const uint8_t> aad) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = require_key(session_id);
    auto sealed = crypto::seal(*entry.symmetric_key, crypto::generate_iv(), aad, plaintext);
    ++entry.key_uses;
    return sealed;
}

std::vector<uint8_t> KeyManager::decrypt_with_session_key(const std::string& session_id,
                                                          const crypto::AeadResult& encrypted,
                                                          std::span<const uint8_t> aad) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& entry = require_key(session_id);
    return crypto::open(*entry.symmetric_key, aad, encrypted);
}

bool KeyManager::should_rotate_key(const std::string& session_id,
                                   std::chrono::milliseconds max_age,
                                   uint64_t max_uses) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end() || !it->second.symmetric_key) {
        return false;
    }
    const auto& entry = it->second;
    return now_fn_() - entry.key_installed_at > max_age || entry.key_uses > max_uses;
}

crypto::PublicKey KeyManager::begin_key_rotation(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = require_key(session_id);
    if (entry.rotation_key_pair) {
        crypto::wipe(*entry.rotation_key_pair);
    }
    entry.rotation_key_pair = crypto::generate_keypair();

    spdlog::info("Key rotation started for session {}", session_id);
    return entry.rotation_key_pair->public_key;
}

void KeyManager::complete_key_rotation(const std::string& session_id,
                                       const crypto::PublicKey& remote_public_key,
                                       std::span<const uint8_t> info) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = require_key(session_id);
    if (!entry.rotation_key_pair) {
        throw CryptoException("no key rotation in progress for session: " + session_id);
    }

    crypto::X25519KeyPair next_pair = *entry.rotation_key_pair;
    crypto::wipe(*entry.rotation_key_pair);
    entry.rotation_key_pair.reset();

    std::optional<crypto::SharedSecret> shared;
    if (!crypto::is_all_zero(remote_public_key)) {
        shared = crypto::key_exchange(next_pair.secret_key, remote_public_key);
    }
    if (!shared) {
        crypto::wipe(next_pair);
        throw CryptoException("key rotation exchange failed for session: " + session_id);
    }

    auto key = crypto::derive_session_key(*shared, session_id, next_pair.public_key,
                                          remote_public_key, info);
    crypto::secure_zero(shared->data(), shared->size());
    if (!key) {
        crypto::wipe(next_pair);
        throw CryptoException("rotated key derivation failed for session: " + session_id);
    }

    install_key(entry, *key);
    if (entry.key_pair) {
        crypto::wipe(*entry.key_pair);
    }
    entry.key_pair = next_pair;
    crypto::wipe(next_pair);

    spdlog::info("Key rotation completed for session {}", session_id);
}

std::optional<KeyUsage> KeyManager::key_usage(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end() || !it->second.symmetric_key) {
        return std::nullopt;
    }
    const auto& entry = it->second;
    return KeyUsage{
        .age = std::chrono::duration_cast<std::chrono::milliseconds>(now_fn_() - entry.key_installed_at),
        .uses = entry.key_uses,
        .rotation_pending = entry.rotation_key_pair.has_value(),
    };
}

bool KeyManager::end_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    // KeyEntry destructor zeroes the key bytes
    if (entries_.erase(session_id) == 0) {
        return false;
    }
    spdlog::debug("Ended key session {}", session_id);
    return true;
}

size_t KeyManager::end_all_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t count = entries_.size();
    entries_.clear();
    return count;
}

std::vector<std::string> KeyManager::cleanup_expired_sessions(std::chrono::milliseconds max_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = now_fn_() - max_age;

    std::vector<std::string> expired;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.created_at < cutoff) {
            expired.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (!expired.empty()) {
        spdlog::info("Cleaned up {} expired key sessions", expired.size());
    }
    return expired;
}

std::vector<std::string> KeyManager::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

KeyManagerStats KeyManager::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    KeyManagerStats stats;
    stats.active_sessions = entries_.size();
    for (const auto& [id, entry] : entries_) {
        if (entry.key_pair) ++stats.ephemeral_key_pairs;
        if (entry.symmetric_key) ++stats.derived_keys;
        if (entry.rotation_key_pair) ++stats.pending_rotations;
    }
    return stats;
}

}  // namespace ferry::session
