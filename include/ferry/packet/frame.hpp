#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

#include "ferry/crypto/crypto.hpp"

namespace ferry::packet {

// Frame types
enum class FrameType : uint8_t {
    CONTROL = 0x00,
    DATA = 0x01
};

// Control frame subtypes
enum class ControlSubtype : uint8_t {
    DISCOVERY = 0x00,     // Discovery payload (JSON)
    KEY_EXCHANGE = 0x01,  // Ephemeral X25519 public key
    ACK = 0x02,           // Encoded AckFrame
    VERIFICATION = 0x03,  // Encrypted confirmation under the session key
    CANCEL = 0x04         // Abort the handshake or transfer
};

using ChunkHash = crypto::Sha256Digest;

constexpr size_t FIXED_FIELDS_SIZE = 4 + 8 + 4 + crypto::AEAD_NONCE_SIZE + crypto::SHA256_SIZE;
constexpr size_t DATA_HEADER_SIZE = 1 + FIXED_FIELDS_SIZE;      // 61
constexpr size_t CONTROL_HEADER_SIZE = 2 + FIXED_FIELDS_SIZE;   // 62
constexpr size_t MAX_PAYLOAD_SIZE = 10 * 1024 * 1024;

// Control frame
struct ControlFrame {
    ControlSubtype subtype = ControlSubtype::DISCOVERY;
    uint32_t transfer_id = 0;
    uint64_t offset = 0;
    crypto::Nonce iv{};
    ChunkHash chunk_hash{};
    std::vector<uint8_t> payload;

    bool operator==(const ControlFrame&) const = default;
};

// Data frame; payload is ciphertext || tag
struct DataFrame {
    uint32_t transfer_id = 0;
    uint64_t offset = 0;
    crypto::Nonce iv{};
    ChunkHash chunk_hash{};
    std::vector<uint8_t> payload;

    bool operator==(const DataFrame&) const = default;
};

using ProtocolFrame = std::variant<ControlFrame, DataFrame>;

// Acknowledgment carried as the payload of an ACK control frame
struct AckFrame {
    static constexpr size_t SIZE = 16;  // transfer_id(4) + offset(8) + length(4)
    uint32_t transfer_id = 0;
    uint64_t offset = 0;
    uint32_t length = 0;

    bool operator==(const AckFrame&) const = default;
};

// Get frame type from variant
FrameType get_frame_type(const ProtocolFrame& frame);

// Payload length of either alternative
uint32_t payload_length(const ProtocolFrame& frame);

// Serialize a frame to its wire form.
// Throws MalformedFrame if the payload exceeds MAX_PAYLOAD_SIZE.
std::vector<uint8_t> encode(const ProtocolFrame& frame);

// Parse a complete frame.
// Throws MalformedFrame on a short buffer, an unknown tag, or a length mismatch.
ProtocolFrame decode(std::span<const uint8_t> data);

std::array<uint8_t, AckFrame::SIZE> encode_ack(const AckFrame& ack);
AckFrame decode_ack(std::span<const uint8_t> data);

// Build an ACK control frame
ControlFrame make_ack_frame(const AckFrame& ack);

// Associated data binding a chunk to its transfer and byte offset
std::array<uint8_t, 12> chunk_aad(uint32_t transfer_id, uint64_t offset);

const char* subtype_to_string(ControlSubtype subtype);

// Big-endian helpers
void write_u32(std::vector<uint8_t>& out, uint32_t value);
void write_u64(std::vector<uint8_t>& out, uint64_t value);
uint32_t read_u32(std::span<const uint8_t> data);
uint64_t read_u64(std::span<const uint8_t> data);

}  // namespace ferry::packet
