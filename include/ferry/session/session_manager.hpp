#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "ferry/crypto/aead.hpp"
#include "ferry/session/key_manager.hpp"
#include "ferry/utils/time.hpp"

namespace ferry::session {

enum class SessionEventType {
    SESSION_CREATED,
    HANDSHAKE_COMPLETED,
    SESSION_ENDED
};

struct SessionEvent {
    SessionEventType type;
    std::string session_id;
    std::string device_id;
};

// Snapshot of a session; holds no secret material
struct SessionInfo {
    std::string session_id;
    std::string device_id;
    crypto::PublicKey local_public_key{};
    std::optional<crypto::PublicKey> remote_public_key;
    bool handshake_complete = false;
    utils::TimePoint created_at;
};

struct SessionStats {
    size_t active_sessions = 0;
    size_t handshake_complete = 0;
    KeyManagerStats keys;
};

const char* event_type_to_string(SessionEventType type);

// Registry of secure sessions keyed by session id.
//
// Each session owns an ephemeral key pair from creation and a symmetric key
// once the handshake completes. Encryption is only available on completed
// sessions. Events are delivered in transition order, never with the
// registry lock held, so callbacks may call back into the manager.
class SecureSessionManager {
public:
    using EventCallback = std::function<void(const SessionEvent&)>;

    explicit SecureSessionManager(utils::NowFn now_fn = utils::steady_now());
    ~SecureSessionManager();

    SecureSessionManager(const SecureSessionManager&) = delete;
    SecureSessionManager& operator=(const SecureSessionManager&) = delete;

    void set_event_callback(EventCallback callback);

    // Register a session with a fresh ephemeral key pair.
    // Throws CryptoException if the id is already registered.
    SessionInfo create_session(const std::string& session_id, const std::string& device_id);

    // Install the peer key and derive the session key.
    // Throws CryptoException if the session does not exist or derivation fails.
    void complete_handshake(const std::string& session_id,
                            const crypto::PublicKey& remote_public_key,
                            std::span<const uint8_t> info = {});

    [[nodiscard]] std::optional<SessionInfo> get_session(const std::string& session_id) const;

    // Throws CryptoException if the session does not exist
    [[nodiscard]] crypto::PublicKey local_public_key(const std::string& session_id) const;

    // Throw CryptoException for unknown or incomplete sessions and on
    // authentication failure
    crypto::AeadResult encrypt(const std::string& session_id,
                               std::span<const uint8_t> plaintext,
                               std::span<const uint8_t> aad);
    std::vector<uint8_t> decrypt(const std::string& session_id,
                                 const crypto::AeadResult& encrypted,
                                 std::span<const uint8_t> aad);

    // Post-handshake confirmation that both sides hold the same key
    crypto::AeadResult generate_verification_payload(const std::string& session_id);
    bool verify_incoming_payload(const std::string& session_id, const crypto::AeadResult& payload);

    static crypto::Sha256Digest hash(std::span<const uint8_t> data);

    // Ending an unknown session is a no-op and returns false
    bool end_session(const std::string& session_id);
    void end_all_sessions();

    // End sessions older than max_age; returns their ids
    std::vector<std::string> cleanup_expired_sessions(std::chrono::milliseconds max_age);

    [[nodiscard]] size_t active_session_count() const;
    [[nodiscard]] std::vector<std::string> active_sessions() const;
    [[nodiscard]] SessionStats get_stats() const;

private:
    struct SessionRecord {
        std::string device_id;
        crypto::PublicKey local_public_key{};
        std::optional<crypto::PublicKey> remote_public_key;
        bool handshake_complete = false;
        utils::TimePoint created_at;
    };

    void require_complete(const std::string& session_id) const;
    void queue_event(SessionEventType type, const std::string& session_id,
                     const std::string& device_id);
    void deliver_events();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
    KeyManager keys_;
    utils::NowFn now_fn_;

    EventCallback event_callback_;
    std::deque<SessionEvent> pending_events_;
    bool delivering_ = false;
};

}  // namespace ferry::session
