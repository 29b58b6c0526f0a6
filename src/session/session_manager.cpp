#include "ferry/session/session_manager.hpp"

#include <spdlog/spdlog.h>

#include "ferry/common/errors.hpp"

namespace ferry::session {

namespace {

constexpr std::string_view VERIFY_PLAINTEXT = "ok";

std::string verification_aad(const std::string& session_id) {
    return "ferry/verify:" + session_id;
}

std::span<const uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

}  // namespace

const char* event_type_to_string(SessionEventType type) {
    switch (type) {
        case SessionEventType::SESSION_CREATED: return "session_created";
        case SessionEventType::HANDSHAKE_COMPLETED: return "handshake_completed";
        case SessionEventType::SESSION_ENDED: return "session_ended";
    }
    return "unknown";
}

SecureSessionManager::SecureSessionManager(utils::NowFn now_fn)
    : keys_(now_fn), now_fn_(std::move(now_fn)) {}

SecureSessionManager::~SecureSessionManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
    keys_.end_all_sessions();
}

void SecureSessionManager::set_event_callback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    event_callback_ = std::move(callback);
}

SessionInfo SecureSessionManager::create_session(const std::string& session_id,
                                                 const std::string& device_id) {
    SessionInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(session_id) != 0) {
            throw CryptoException("session already exists: " + session_id);
        }

        SessionRecord record;
        record.device_id = device_id;
        record.local_public_key = keys_.generate_ephemeral_key_pair(session_id);
        record.created_at = now_fn_();

        info.session_id = session_id;
        info.device_id = device_id;
        info.local_public_key = record.local_public_key;
        info.created_at = record.created_at;

        sessions_.emplace(session_id, std::move(record));
        queue_event(SessionEventType::SESSION_CREATED, session_id, device_id);
    }

    spdlog::info("Created session {} for device {}", session_id, device_id);
    deliver_events();
    return info;
}

void SecureSessionManager::complete_handshake(const std::string& session_id,
                                              const crypto::PublicKey& remote_public_key,
                                              std::span<const uint8_t> info) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            throw CryptoException("session not found: " + session_id);
        }

        keys_.complete_key_exchange(session_id, remote_public_key, info);

        auto& record = it->second;
        record.remote_public_key = remote_public_key;
        record.handshake_complete = true;
        queue_event(SessionEventType::HANDSHAKE_COMPLETED, session_id, record.device_id);
    }

    spdlog::info("Handshake completed for session {}", session_id);
    deliver_events();
}

std::optional<SessionInfo> SecureSessionManager::get_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }

    const auto& record = it->second;
    SessionInfo info;
    info.session_id = session_id;
    info.device_id = record.device_id;
    info.local_public_key = record.local_public_key;
    info.remote_public_key = record.remote_public_key;
    info.handshake_complete = record.handshake_complete;
    info.created_at = record.created_at;
    return info;
}

crypto::PublicKey SecureSessionManager::local_public_key(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw CryptoException("session not found: " + session_id);
    }
    return it->second.local_public_key;
}

void SecureSessionManager::require_complete(const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw CryptoException("session not found: " + session_id);
    }
    if (!it->second.handshake_complete) {
        throw CryptoException("handshake not complete for session: " + session_id);
    }
}

crypto::AeadResult SecureSessionManager::encrypt(const std::string& session_id,
                                                 std::span<const uint8_t> plaintext,
                                                 std::span<const uint8_t> aad) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_complete(session_id);
    return keys_.encrypt_with_session_key(session_id, plaintext, aad);
}

std::vector<uint8_t> SecureSessionManager::decrypt(const std::string& session_id,
                                                   const crypto::AeadResult& encrypted,
                                                   std::span<const uint8_t> aad) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_complete(session_id);
    return keys_.decrypt_with_session_key(session_id, encrypted, aad);
}

crypto::AeadResult SecureSessionManager::generate_verification_payload(const std::string& session_id) {
    const auto aad = verification_aad(session_id);
    return encrypt(session_id, as_bytes(VERIFY_PLAINTEXT), as_bytes(aad));
}

bool SecureSessionManager::verify_incoming_payload(const std::string& session_id,
                                                   const crypto::AeadResult& payload) {
    const auto aad = verification_aad(session_id);

    std::lock_guard<std::mutex> lock(mutex_);
    require_complete(session_id);

    std::vector<uint8_t> plaintext;
    try {
        plaintext = keys_.decrypt_with_session_key(session_id, payload, as_bytes(aad));
    } catch (const CryptoException& e) {
        spdlog::warn("Verification payload rejected for session {}: {}", session_id, e.what());
        return false;
    }

    const auto expected = as_bytes(VERIFY_PLAINTEXT);
    return plaintext.size() == expected.size() &&
           crypto::constant_time_compare(plaintext, expected);
}

crypto::Sha256Digest SecureSessionManager::hash(std::span<const uint8_t> data) {
    return crypto::sha256(data);
}

bool SecureSessionManager::end_session(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }

        const std::string device_id = it->second.device_id;
        keys_.end_session(session_id);
        sessions_.erase(it);
        queue_event(SessionEventType::SESSION_ENDED, session_id, device_id);
    }

    spdlog::info("Ended session {}", session_id);
    deliver_events();
    return true;
}

void SecureSessionManager::end_all_sessions() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : sessions_) {
            keys_.end_session(id);
            queue_event(SessionEventType::SESSION_ENDED, id, record.device_id);
        }
        sessions_.clear();
    }
    deliver_events();
}

std::vector<std::string> SecureSessionManager::cleanup_expired_sessions(std::chrono::milliseconds max_age) {
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto cutoff = now_fn_() - max_age;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.created_at < cutoff) {
                expired.push_back(it->first);
                keys_.end_session(it->first);
                queue_event(SessionEventType::SESSION_ENDED, it->first, it->second.device_id);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!expired.empty()) {
        spdlog::info("Cleaned up {} expired sessions", expired.size());
    }
    deliver_events();
    return expired;
}

size_t SecureSessionManager::active_session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SecureSessionManager::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, record] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

SessionStats SecureSessionManager::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionStats stats;
    stats.active_sessions = sessions_.size();
    for (const auto& [id, record] : sessions_) {
        if (record.handshake_complete) ++stats.handshake_complete;
    }
    stats.keys = keys_.get_stats();
    return stats;
}

// Caller holds mutex_
void SecureSessionManager::queue_event(SessionEventType type, const std::string& session_id,
                                       const std::string& device_id) {
    pending_events_.push_back(SessionEvent{type, session_id, device_id});
}

void SecureSessionManager::deliver_events() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delivering_) {
        // The active deliverer drains what we queued
        return;
    }
    delivering_ = true;

    while (!pending_events_.empty()) {
        SessionEvent event = std::move(pending_events_.front());
        pending_events_.pop_front();
        auto callback = event_callback_;
        lock.unlock();

        if (callback) {
            try {
                callback(event);
            } catch (...) {
                lock.lock();
                delivering_ = false;
                throw;
            }
        }
        lock.lock();
    }

    delivering_ = false;
}

}  // namespace ferry::session
