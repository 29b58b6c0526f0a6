#pragma once

#include <functional>
#include <optional>
#include <string>

#include "ferry/handshake/handshake_protocol.hpp"
#include "ferry/packet/frame.hpp"
#include "ferry/session/session_manager.hpp"
#include "ferry/utils/time.hpp"

namespace ferry::handshake {

// Handshake state
enum class HandshakeState {
    IDLE,
    DISCOVERY,      // Sent discovery, waiting for the peer's
    KEY_EXCHANGE,   // Sent our public key, waiting for the peer's
    VERIFICATION,   // Sent our confirmation, waiting for the peer's
    CONNECTED,      // Handshake completed successfully
    FAILED          // Handshake failed
};

// Handshake failure reason
enum class HandshakeError {
    NONE,
    INCOMPATIBLE_PEER,
    INVALID_MESSAGE,
    KEY_EXCHANGE_FAILED,
    VERIFICATION_FAILED,
    CANCELLED,
    TIMEOUT
};

const char* state_to_string(HandshakeState state);
const char* error_to_string(HandshakeError error);

// Drives one session's handshake over control frames:
//   discovery -> key_exchange -> verification -> connected
//
// Both peers call start() with the same session id. Any failure ends the
// partially established session and sends a cancel frame to the peer.
class Handshake {
public:
    using SendCallback = std::function<void(const packet::ControlFrame& frame)>;

    Handshake(const HandshakeProtocol& protocol,
              session::SecureSessionManager& sessions,
              utils::NowFn now_fn = utils::steady_now());

    // Ends the session if the handshake is still in progress. The peer is
    // not notified; call cancel() first for that.
    ~Handshake();

    Handshake(const Handshake&) = delete;
    Handshake& operator=(const Handshake&) = delete;

    // Set callback for sending control frames
    void set_send_callback(SendCallback callback);

    // Create the session and send our discovery payload.
    // Throws HandshakeException if already started.
    void start(const std::string& session_id);

    // Process an incoming control frame.
    // Returns true once the handshake is CONNECTED.
    // Throws DiscoveryException or HandshakeException on failure.
    bool process_frame(const packet::ControlFrame& frame);

    // Abort locally and notify the peer
    void cancel();

    // Throws TimeoutException if the handshake has not finished in time
    void check_timeout();

    // Get current state
    [[nodiscard]] HandshakeState state() const { return state_; }

    // Get last error
    [[nodiscard]] HandshakeError last_error() const { return last_error_; }

    [[nodiscard]] const std::string& session_id() const { return session_id_; }

    // Discovery payload received from the peer
    [[nodiscard]] const std::optional<DiscoveryPayload>& peer() const { return peer_; }

private:
    void handle_discovery(const packet::ControlFrame& frame);
    void handle_key_exchange(const packet::ControlFrame& frame);
    void handle_verification(const packet::ControlFrame& frame);

    packet::ControlFrame make_frame(packet::ControlSubtype subtype, std::vector<uint8_t> payload) const;
    void send(const packet::ControlFrame& frame);
    void transition(HandshakeState next);
    [[nodiscard]] bool in_progress() const;

    // Moves to FAILED, ends the session, optionally notifies the peer
    void abort(HandshakeError error, bool notify_peer);

    template <typename E>
    [[noreturn]] void fail(HandshakeError error, const std::string& message);

    const HandshakeProtocol& protocol_;
    session::SecureSessionManager& sessions_;
    utils::NowFn now_fn_;
    SendCallback send_callback_;

    HandshakeState state_{HandshakeState::IDLE};
    HandshakeError last_error_{HandshakeError::NONE};
    std::string session_id_;
    std::optional<DiscoveryPayload> peer_;
    utils::TimePoint started_at_;
};

}  // namespace ferry::handshake
