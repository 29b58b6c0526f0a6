#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ferry/crypto/crypto.hpp"
#include "ferry/crypto/x25519.hpp"
#include "ferry/utils/time.hpp"

namespace ferry::handshake {

constexpr uint32_t PROTOCOL_VERSION = 1;

// Capability names
inline constexpr const char* CAP_ENCRYPTION = "encryption";
inline constexpr const char* CAP_WIFI_AWARE = "wifi_aware";
inline constexpr const char* CAP_BLUETOOTH = "bluetooth";
inline constexpr const char* CAP_LAN = "lan";

using Capabilities = std::map<std::string, bool>;

// Handshake configuration
struct HandshakeConfig {
    std::vector<std::string> required_capabilities{CAP_ENCRYPTION};
    bool require_transport = true;                 // At least one of wifi_aware/bluetooth/lan
    uint32_t protocol_version = PROTOCOL_VERSION;  // Version we advertise
    uint32_t min_protocol_version = PROTOCOL_VERSION;
    std::chrono::milliseconds max_payload_age{30000};  // Zero disables the age check
    std::chrono::milliseconds handshake_timeout{30000};
};

// First message each peer sends; carried as JSON
struct DiscoveryPayload {
    std::string device_id;
    Capabilities capabilities;
    uint32_t protocol_version = PROTOCOL_VERSION;
    int64_t timestamp_ms = 0;

    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    // Throws DiscoveryException on malformed JSON or missing fields
    static DiscoveryPayload from_bytes(std::span<const uint8_t> data);

    bool operator==(const DiscoveryPayload&) const = default;
};

struct KeyExchangeResult {
    bool is_success = false;
    std::optional<crypto::X25519KeyPair> local_key_pair;
    std::string error;
};

struct KeyDerivationResult {
    bool is_success = false;
    std::optional<crypto::SymmetricKey> derived_key;
    std::string error;
};

// Stateless handshake operations: discovery payloads, ephemeral keys and
// session key derivation. The Handshake class drives these over frames.
class HandshakeProtocol {
public:
    HandshakeProtocol(std::string device_id,
                      Capabilities capabilities,
                      HandshakeConfig config = {},
                      utils::WallNowFn wall_now = utils::system_now_ms());

    [[nodiscard]] DiscoveryPayload create_discovery_payload() const;

    // True if the peer satisfies our capability and version policy
    [[nodiscard]] bool process_discovery_payload(const DiscoveryPayload& payload) const;

    // Reason the payload is unacceptable, or nullopt if it is accepted
    [[nodiscard]] std::optional<std::string> check_discovery_payload(const DiscoveryPayload& payload) const;

    [[nodiscard]] KeyExchangeResult perform_key_exchange() const;

    // X25519 + HKDF. Either order of the two public keys yields the same key.
    [[nodiscard]] KeyDerivationResult complete_key_exchange(const std::string& session_id,
                                                            std::span<const uint8_t> local_public_key,
                                                            std::span<const uint8_t> remote_public_key,
                                                            const crypto::X25519KeyPair& local_key_pair) const;

    [[nodiscard]] const std::string& device_id() const { return device_id_; }
    [[nodiscard]] const HandshakeConfig& config() const { return config_; }

private:
    std::string device_id_;
    Capabilities capabilities_;
    HandshakeConfig config_;
    utils::WallNowFn wall_now_;
};

}  // namespace ferry::handshake
