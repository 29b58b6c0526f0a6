#include "ferry/handshake/handshake_protocol.hpp"

#include <algorithm>
#include <limits>
#include <nlohmann/json.hpp>

#include "ferry/common/errors.hpp"
#include "ferry/crypto/hkdf.hpp"

namespace ferry::handshake {

namespace {

bool has_capability(const Capabilities& caps, const std::string& name) {
    auto it = caps.find(name);
    return it != caps.end() && it->second;
}

}  // namespace

std::vector<uint8_t> DiscoveryPayload::to_bytes() const {
    nlohmann::json j;
    j["deviceId"] = device_id;
    j["capabilities"] = capabilities;
    j["protocolVersion"] = protocol_version;
    j["timestamp"] = timestamp_ms;

    const std::string text = j.dump();
    return {text.begin(), text.end()};
}

DiscoveryPayload DiscoveryPayload::from_bytes(std::span<const uint8_t> data) {
    const auto j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw DiscoveryException("discovery payload is not a JSON object");
    }

    DiscoveryPayload payload;
    try {
        payload.device_id = j.at("deviceId").get<std::string>();
        const auto& version = j.at("protocolVersion");
        if (!version.is_number_unsigned() || version.get<uint64_t>() == 0 ||
            version.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            throw DiscoveryException("protocol version must be a positive integer");
        }
        payload.protocol_version = version.get<uint32_t>();
        payload.timestamp_ms = j.value("timestamp", int64_t{0});

        for (const auto& [name, value] : j.at("capabilities").items()) {
            // Non-boolean capability values are reserved for later versions
            if (value.is_boolean()) {
                payload.capabilities[name] = value.get<bool>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw DiscoveryException(std::string("invalid discovery payload: ") + e.what());
    }

    if (payload.device_id.empty()) {
        throw DiscoveryException("discovery payload has an empty device id");
    }
    return payload;
}

HandshakeProtocol::HandshakeProtocol(std::string device_id,
                                     Capabilities capabilities,
                                     HandshakeConfig config,
                                     utils::WallNowFn wall_now)
    : device_id_(std::move(device_id)),
      capabilities_(std::move(capabilities)),
      config_(std::move(config)),
      wall_now_(std::move(wall_now)) {}

DiscoveryPayload HandshakeProtocol::create_discovery_payload() const {
    return DiscoveryPayload{
        .device_id = device_id_,
        .capabilities = capabilities_,
        .protocol_version = config_.protocol_version,
        .timestamp_ms = wall_now_(),
    };
}

bool HandshakeProtocol::process_discovery_payload(const DiscoveryPayload& payload) const {
    return !check_discovery_payload(payload).has_value();
}

std::optional<std::string> HandshakeProtocol::check_discovery_payload(const DiscoveryPayload& payload) const {
    for (const auto& required : config_.required_capabilities) {
        if (!has_capability(payload.capabilities, required)) {
            return "missing required capability: " + required;
        }
    }

    if (config_.require_transport &&
        !has_capability(payload.capabilities, CAP_WIFI_AWARE) &&
        !has_capability(payload.capabilities, CAP_BLUETOOTH) &&
        !has_capability(payload.capabilities, CAP_LAN)) {
        return std::string("no supported transport");
    }

    if (payload.protocol_version < config_.min_protocol_version) {
        return "protocol version " + std::to_string(payload.protocol_version) +
               " below minimum " + std::to_string(config_.min_protocol_version);
    }

    if (config_.max_payload_age.count() > 0) {
        const int64_t now = wall_now_();
        const int64_t skew = payload.timestamp_ms > now ? payload.timestamp_ms - now
                                                        : now - payload.timestamp_ms;
        if (skew > config_.max_payload_age.count()) {
            return "discovery payload timestamp is " + std::to_string(skew) + " ms " +
                   (payload.timestamp_ms > now ? "ahead" : "old");
        }
    }

    return std::nullopt;
}

KeyExchangeResult HandshakeProtocol::perform_key_exchange() const {
    KeyExchangeResult result;
    if (!crypto::init()) {
        result.error = "crypto library initialization failed";
        return result;
    }

    result.local_key_pair = crypto::generate_keypair();
    result.is_success = true;
    return result;
}

KeyDerivationResult HandshakeProtocol::complete_key_exchange(const std::string& session_id,
                                                             std::span<const uint8_t> local_public_key,
                                                             std::span<const uint8_t> remote_public_key,
                                                             const crypto::X25519KeyPair& local_key_pair) const {
    KeyDerivationResult result;

    if (local_public_key.size() != crypto::X25519_PUBLIC_KEY_SIZE) {
        result.error = "local public key must be 32 bytes";
        return result;
    }
    if (remote_public_key.size() != crypto::X25519_PUBLIC_KEY_SIZE) {
        result.error = "remote public key must be 32 bytes";
        return result;
    }
    if (crypto::is_all_zero(remote_public_key)) {
        result.error = "remote public key is all zeros";
        return result;
    }

    crypto::PublicKey local_pk;
    crypto::PublicKey remote_pk;
    std::copy(local_public_key.begin(), local_public_key.end(), local_pk.begin());
    std::copy(remote_public_key.begin(), remote_public_key.end(), remote_pk.begin());

    auto shared = crypto::key_exchange(local_key_pair.secret_key, remote_pk);
    if (!shared) {
        result.error = "shared secret computation failed";
        return result;
    }

    result.derived_key = crypto::derive_session_key(*shared, session_id, local_pk, remote_pk);
    crypto::secure_zero(shared->data(), shared->size());

    if (!result.derived_key) {
        result.error = "session key derivation failed";
        return result;
    }

    result.is_success = true;
    return result;
}

}  // namespace ferry::handshake
