#include "ferry/handshake/handshake.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

#include "ferry/common/errors.hpp"

namespace ferry::handshake {

const char* state_to_string(HandshakeState state) {
    switch (state) {
        case HandshakeState::IDLE: return "idle";
        case HandshakeState::DISCOVERY: return "discovery";
        case HandshakeState::KEY_EXCHANGE: return "key_exchange";
        case HandshakeState::VERIFICATION: return "verification";
        case HandshakeState::CONNECTED: return "connected";
        case HandshakeState::FAILED: return "failed";
    }
    return "unknown";
}

const char* error_to_string(HandshakeError error) {
    switch (error) {
        case HandshakeError::NONE: return "none";
        case HandshakeError::INCOMPATIBLE_PEER: return "incompatible_peer";
        case HandshakeError::INVALID_MESSAGE: return "invalid_message";
        case HandshakeError::KEY_EXCHANGE_FAILED: return "key_exchange_failed";
        case HandshakeError::VERIFICATION_FAILED: return "verification_failed";
        case HandshakeError::CANCELLED: return "cancelled";
        case HandshakeError::TIMEOUT: return "timeout";
    }
    return "unknown";
}

Handshake::Handshake(const HandshakeProtocol& protocol,
                     session::SecureSessionManager& sessions,
                     utils::NowFn now_fn)
    : protocol_(protocol), sessions_(sessions), now_fn_(std::move(now_fn)) {}

Handshake::~Handshake() {
    if (!in_progress()) {
        return;
    }
    try {
        sessions_.end_session(session_id_);
        spdlog::debug("Handshake {} dropped in state {}", session_id_, state_to_string(state_));
    } catch (const std::exception& e) {
        spdlog::error("Ending session {} on handshake teardown failed: {}", session_id_, e.what());
    }
}

bool Handshake::in_progress() const {
    return state_ == HandshakeState::DISCOVERY ||
           state_ == HandshakeState::KEY_EXCHANGE ||
           state_ == HandshakeState::VERIFICATION;
}

template <typename E>
void Handshake::fail(HandshakeError error, const std::string& message) {
    spdlog::error("Handshake {} failed ({}): {}", session_id_, error_to_string(error), message);
    abort(error, true);
    throw E(message);
}

void Handshake::set_send_callback(SendCallback callback) {
    send_callback_ = std::move(callback);
}

void Handshake::start(const std::string& session_id) {
    if (state_ != HandshakeState::IDLE) {
        throw HandshakeException("handshake already started for session " + session_id_);
    }

    session_id_ = session_id;
    started_at_ = now_fn_();
    sessions_.create_session(session_id_, protocol_.device_id());

    transition(HandshakeState::DISCOVERY);
    send(make_frame(packet::ControlSubtype::DISCOVERY,
                    protocol_.create_discovery_payload().to_bytes()));
}

bool Handshake::process_frame(const packet::ControlFrame& frame) {
    if (state_ == HandshakeState::FAILED) {
        return false;
    }

    if (frame.subtype == packet::ControlSubtype::CANCEL) {
        if (state_ != HandshakeState::IDLE) {
            spdlog::warn("Peer cancelled handshake for session {}", session_id_);
            abort(HandshakeError::CANCELLED, false);
        }
        return false;
    }

    if (state_ == HandshakeState::CONNECTED) {
        spdlog::debug("Ignoring {} frame on connected session {}",
                      packet::subtype_to_string(frame.subtype), session_id_);
        return true;
    }

    if (state_ == HandshakeState::IDLE) {
        throw HandshakeException("handshake frame received before start()");
    }

    const auto digest = crypto::sha256(frame.payload);
    if (!crypto::constant_time_compare(digest, frame.chunk_hash)) {
        fail<HandshakeException>(HandshakeError::INVALID_MESSAGE,
                                 "handshake frame hash mismatch");
    }

    switch (frame.subtype) {
        case packet::ControlSubtype::DISCOVERY:
            handle_discovery(frame);
            break;
        case packet::ControlSubtype::KEY_EXCHANGE:
            handle_key_exchange(frame);
            break;
        case packet::ControlSubtype::VERIFICATION:
            handle_verification(frame);
            break;
        default:
            fail<HandshakeException>(HandshakeError::INVALID_MESSAGE,
                                     std::string("unexpected ") +
                                     packet::subtype_to_string(frame.subtype) +
                                     " frame during handshake");
    }

    return state_ == HandshakeState::CONNECTED;
}

void Handshake::handle_discovery(const packet::ControlFrame& frame) {
    if (state_ != HandshakeState::DISCOVERY) {
        fail<HandshakeException>(HandshakeError::INVALID_MESSAGE,
                                 std::string("discovery frame in state ") + state_to_string(state_));
    }

    DiscoveryPayload payload;
    try {
        payload = DiscoveryPayload::from_bytes(frame.payload);
    } catch (const DiscoveryException& e) {
        fail<DiscoveryException>(HandshakeError::INVALID_MESSAGE, e.what());
    }

    if (auto reason = protocol_.check_discovery_payload(payload)) {
        fail<DiscoveryException>(HandshakeError::INCOMPATIBLE_PEER,
                                 "peer " + payload.device_id + " rejected: " + *reason);
    }

    spdlog::info("Accepted discovery from {} (protocol v{})",
                 payload.device_id, payload.protocol_version);
    peer_ = std::move(payload);

    const auto public_key = sessions_.local_public_key(session_id_);
    transition(HandshakeState::KEY_EXCHANGE);
    send(make_frame(packet::ControlSubtype::KEY_EXCHANGE,
                    std::vector<uint8_t>(public_key.begin(), public_key.end())));
}

void Handshake::handle_key_exchange(const packet::ControlFrame& frame) {
    if (state_ != HandshakeState::KEY_EXCHANGE) {
        fail<HandshakeException>(HandshakeError::INVALID_MESSAGE,
                                 std::string("key exchange frame in state ") + state_to_string(state_));
    }
    if (frame.payload.size() != crypto::X25519_PUBLIC_KEY_SIZE) {
        fail<HandshakeException>(HandshakeError::KEY_EXCHANGE_FAILED,
                                 "public key must be 32 bytes, got " +
                                 std::to_string(frame.payload.size()));
    }

    crypto::PublicKey remote;
    std::copy(frame.payload.begin(), frame.payload.end(), remote.begin());

    try {
        sessions_.complete_handshake(session_id_, remote);
    } catch (const CryptoException& e) {
        fail<HandshakeException>(HandshakeError::KEY_EXCHANGE_FAILED, e.what());
    }

    const auto verification = sessions_.generate_verification_payload(session_id_);
    auto out = make_frame(packet::ControlSubtype::VERIFICATION, verification.combined());
    out.iv = verification.iv;

    transition(HandshakeState::VERIFICATION);
    send(out);
}

void Handshake::handle_verification(const packet::ControlFrame& frame) {
    if (state_ != HandshakeState::VERIFICATION) {
        fail<HandshakeException>(HandshakeError::INVALID_MESSAGE,
                                 std::string("verification frame in state ") + state_to_string(state_));
    }

    auto payload = crypto::AeadResult::from_combined(frame.payload, frame.iv);
    if (!payload || !sessions_.verify_incoming_payload(session_id_, *payload)) {
        fail<HandshakeException>(HandshakeError::VERIFICATION_FAILED,
                                 "peer verification failed");
    }

    transition(HandshakeState::CONNECTED);
    spdlog::info("Session {} connected to {}", session_id_, peer_ ? peer_->device_id : "?");
}

void Handshake::cancel() {
    if (state_ == HandshakeState::IDLE || state_ == HandshakeState::FAILED) {
        return;
    }
    abort(HandshakeError::CANCELLED, true);
}

void Handshake::check_timeout() {
    if (!in_progress()) {
        return;
    }

    if (now_fn_() - started_at_ >= protocol_.config().handshake_timeout) {
        fail<TimeoutException>(HandshakeError::TIMEOUT,
                               "handshake timed out in state " + std::string(state_to_string(state_)));
    }
}

packet::ControlFrame Handshake::make_frame(packet::ControlSubtype subtype,
                                           std::vector<uint8_t> payload) const {
    packet::ControlFrame frame;
    frame.subtype = subtype;
    frame.chunk_hash = crypto::sha256(payload);
    frame.payload = std::move(payload);
    return frame;
}

void Handshake::send(const packet::ControlFrame& frame) {
    if (send_callback_) {
        send_callback_(frame);
    }
}

void Handshake::transition(HandshakeState next) {
    spdlog::debug("Handshake {}: {} -> {}", session_id_, state_to_string(state_), state_to_string(next));
    state_ = next;
}

void Handshake::abort(HandshakeError error, bool notify_peer) {
    last_error_ = error;
    transition(HandshakeState::FAILED);
    sessions_.end_session(session_id_);

    if (notify_peer) {
        send(make_frame(packet::ControlSubtype::CANCEL, {}));
    }
}

}  // namespace ferry::handshake
