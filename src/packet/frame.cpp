#include "ferry/packet/frame.hpp"

#include <algorithm>
#include <string>

#include "ferry/common/errors.hpp"

namespace ferry::packet {

namespace {

// Fields shared by both alternatives, after the tag bytes
template <typename F>
void write_common(std::vector<uint8_t>& out, const F& frame) {
    write_u32(out, frame.transfer_id);
    write_u64(out, frame.offset);
    write_u32(out, static_cast<uint32_t>(frame.payload.size()));
    out.insert(out.end(), frame.iv.begin(), frame.iv.end());
    out.insert(out.end(), frame.chunk_hash.begin(), frame.chunk_hash.end());
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
}

template <typename F>
F read_common(std::span<const uint8_t> data) {
    // data starts right after the tag bytes
    F frame;
    frame.transfer_id = read_u32(data.subspan(0, 4));
    frame.offset = read_u64(data.subspan(4, 8));
    const uint32_t length = read_u32(data.subspan(12, 4));

    if (length > MAX_PAYLOAD_SIZE) {
        throw MalformedFrame("payload length " + std::to_string(length) + " exceeds maximum");
    }

    auto rest = data.subspan(16);
    std::copy_n(rest.begin(), crypto::AEAD_NONCE_SIZE, frame.iv.begin());
    rest = rest.subspan(crypto::AEAD_NONCE_SIZE);
    std::copy_n(rest.begin(), crypto::SHA256_SIZE, frame.chunk_hash.begin());
    rest = rest.subspan(crypto::SHA256_SIZE);

    if (rest.size() != length) {
        throw MalformedFrame("payload length " + std::to_string(length) +
                             " does not match remaining " + std::to_string(rest.size()) +
                             " bytes");
    }
    frame.payload.assign(rest.begin(), rest.end());
    return frame;
}

}  // namespace

void write_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void write_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

uint32_t read_u32(std::span<const uint8_t> data) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

uint64_t read_u64(std::span<const uint8_t> data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

FrameType get_frame_type(const ProtocolFrame& frame) {
    return std::visit([](const auto& f) -> FrameType {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, ControlFrame>) {
            return FrameType::CONTROL;
        } else {
            return FrameType::DATA;
        }
    }, frame);
}

uint32_t payload_length(const ProtocolFrame& frame) {
    return std::visit([](const auto& f) {
        return static_cast<uint32_t>(f.payload.size());
    }, frame);
}

std::vector<uint8_t> encode(const ProtocolFrame& frame) {
    const size_t length = std::visit([](const auto& f) { return f.payload.size(); }, frame);
    if (length > MAX_PAYLOAD_SIZE) {
        throw MalformedFrame("payload exceeds maximum frame size");
    }

    std::vector<uint8_t> out;
    out.reserve(CONTROL_HEADER_SIZE + length);
    out.push_back(static_cast<uint8_t>(get_frame_type(frame)));

    std::visit([&out](const auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, ControlFrame>) {
            out.push_back(static_cast<uint8_t>(f.subtype));
        }
        write_common(out, f);
    }, frame);

    return out;
}

ProtocolFrame decode(std::span<const uint8_t> data) {
    if (data.empty()) {
        throw MalformedFrame("empty frame");
    }

    switch (data[0]) {
        case static_cast<uint8_t>(FrameType::DATA): {
            if (data.size() < DATA_HEADER_SIZE) {
                throw MalformedFrame("data frame shorter than header");
            }
            return read_common<DataFrame>(data.subspan(1));
        }
        case static_cast<uint8_t>(FrameType::CONTROL): {
            if (data.size() < CONTROL_HEADER_SIZE) {
                throw MalformedFrame("control frame shorter than header");
            }
            const uint8_t subtype = data[1];
            if (subtype > static_cast<uint8_t>(ControlSubtype::CANCEL)) {
                throw MalformedFrame("unknown control subtype " + std::to_string(subtype));
            }
            auto frame = read_common<ControlFrame>(data.subspan(2));
            frame.subtype = static_cast<ControlSubtype>(subtype);
            return frame;
        }
        default:
            throw MalformedFrame("unknown frame type " + std::to_string(data[0]));
    }
}

std::array<uint8_t, AckFrame::SIZE> encode_ack(const AckFrame& ack) {
    std::vector<uint8_t> buf;
    buf.reserve(AckFrame::SIZE);
    write_u32(buf, ack.transfer_id);
    write_u64(buf, ack.offset);
    write_u32(buf, ack.length);

    std::array<uint8_t, AckFrame::SIZE> out;
    std::copy(buf.begin(), buf.end(), out.begin());
    return out;
}

AckFrame decode_ack(std::span<const uint8_t> data) {
    if (data.size() != AckFrame::SIZE) {
        throw MalformedFrame("ack payload must be " + std::to_string(AckFrame::SIZE) + " bytes");
    }

    AckFrame ack;
    ack.transfer_id = read_u32(data.subspan(0, 4));
    ack.offset = read_u64(data.subspan(4, 8));
    ack.length = read_u32(data.subspan(12, 4));
    return ack;
}

ControlFrame make_ack_frame(const AckFrame& ack) {
    ControlFrame frame;
    frame.subtype = ControlSubtype::ACK;
    frame.transfer_id = ack.transfer_id;
    frame.offset = ack.offset;
    const auto bytes = encode_ack(ack);
    frame.payload.assign(bytes.begin(), bytes.end());
    return frame;
}

std::array<uint8_t, 12> chunk_aad(uint32_t transfer_id, uint64_t offset) {
    std::vector<uint8_t> buf;
    buf.reserve(12);
    write_u32(buf, transfer_id);
    write_u64(buf, offset);

    std::array<uint8_t, 12> aad;
    std::copy(buf.begin(), buf.end(), aad.begin());
    return aad;
}

const char* subtype_to_string(ControlSubtype subtype) {
    switch (subtype) {
        case ControlSubtype::DISCOVERY: return "discovery";
        case ControlSubtype::KEY_EXCHANGE: return "key_exchange";
        case ControlSubtype::ACK: return "ack";
        case ControlSubtype::VERIFICATION: return "verification";
        case ControlSubtype::CANCEL: return "cancel";
    }
    return "unknown";
}

}  // namespace ferry::packet
