#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "ferry/packet/frame.hpp"
#include "ferry/utils/time.hpp"

namespace ferry::reliability {

constexpr size_t DEFAULT_WINDOW_SIZE = 4;
constexpr size_t MAX_WINDOW_SIZE = 16;
constexpr size_t DEFAULT_CHUNK_SIZE = 256 * 1024;
// Largest plaintext chunk whose ciphertext || tag still fits in one data frame
constexpr size_t MAX_CHUNK_SIZE = packet::MAX_PAYLOAD_SIZE - crypto::AEAD_TAG_SIZE;

// Reliability configuration
struct ReliabilityConfig {
    size_t window_size = DEFAULT_WINDOW_SIZE;      // Max unacknowledged chunks in flight
    size_t chunk_size = DEFAULT_CHUNK_SIZE;        // Plaintext bytes per chunk
    std::chrono::milliseconds ack_timeout{5000};   // Time before a chunk is resent
    uint32_t max_retries = 3;                      // Retransmissions per chunk before failing
};

struct TransferStats {
    size_t total_chunks = 0;
    size_t acked_chunks = 0;
    size_t in_flight_chunks = 0;
    size_t failed_chunks = 0;
    size_t window_size = 0;
    uint64_t window_start = 0;   // Sequence number of the oldest unacknowledged chunk
    uint64_t retransmits = 0;
};

struct ReliabilityCallbacks {
    std::function<void(const packet::ProtocolFrame& frame)> on_frame_send;
    std::function<void(const packet::AckFrame& ack)> on_ack_received;
    std::function<void(uint32_t transfer_id, uint64_t offset)> on_chunk_delivered;
};

// Sliding-window sender for data frames.
//
// Tracks every chunk by (transfer_id, offset). A chunk is in flight from
// send_chunk() until a matching ack arrives, and is resent after
// ack_timeout up to max_retries times. Callbacks run after window state is
// updated, so they may send further chunks. Not thread-safe: one writer per
// instance.
class ReliabilityProtocol {
public:
    // Throws std::invalid_argument for a chunk size outside [1, MAX_CHUNK_SIZE]
    // or a window outside [1, MAX_WINDOW_SIZE]
    ReliabilityProtocol(const ReliabilityConfig& config,
                        ReliabilityCallbacks callbacks,
                        utils::NowFn now_fn = utils::steady_now());

    // Declare the number of chunks a transfer will send
    void expect_chunks(uint32_t transfer_id, size_t total_chunks);

    // True if another chunk fits in the window
    [[nodiscard]] bool can_send() const;

    // Frame and send a chunk; payload is ciphertext || tag.
    // Returns false (nothing sent) if the window is full or the chunk is
    // already in flight or acknowledged. Throws MalformedFrame, with nothing
    // tracked, if the payload does not fit in a frame.
    bool send_chunk(uint32_t transfer_id,
                    uint64_t offset,
                    std::vector<uint8_t> payload,
                    const crypto::Nonce& iv,
                    const packet::ChunkHash& hash);

    // Match an ack by (transfer_id, offset, length).
    // Returns false for unknown or duplicate acks, which change nothing. A late
    // ack for a chunk that already exhausted its retries still delivers it.
    bool process_ack(const packet::AckFrame& ack);

    // Resend chunks unacknowledged for ack_timeout; returns the number resent.
    // Throws TransferException if any chunk exhausted its retries.
    size_t retransmit_expired();

    [[nodiscard]] TransferStats get_stats() const;
    [[nodiscard]] TransferStats get_stats(uint32_t transfer_id) const;

    // Every known transfer has all its chunks acknowledged
    [[nodiscard]] bool is_complete() const;
    [[nodiscard]] bool is_transfer_complete(uint32_t transfer_id) const;

    [[nodiscard]] const ReliabilityConfig& config() const { return config_; }

    // Forget a transfer's chunks and declared total; nothing of it is resent.
    // Returns the number of chunks that were still in flight.
    size_t cancel_transfer(uint32_t transfer_id);

    // Drop all state
    void reset();

private:
    enum class ChunkStatus { IN_FLIGHT, ACKED, FAILED };

    struct ChunkState {
        uint64_t sequence;
        packet::DataFrame frame;     // Payload released once acknowledged
        uint32_t payload_length{0};
        ChunkStatus status{ChunkStatus::IN_FLIGHT};
        uint32_t retry_count{0};
        utils::TimePoint last_sent;
    };

    using ChunkKey = std::pair<uint32_t, uint64_t>;

    TransferStats collect_stats(std::optional<uint32_t> transfer_id) const;

    ReliabilityConfig config_;
    ReliabilityCallbacks callbacks_;
    utils::NowFn now_fn_;

    std::map<ChunkKey, ChunkState> chunks_;
    std::map<uint32_t, size_t> expected_;
    size_t in_flight_{0};
    uint64_t next_sequence_{0};
    uint64_t total_retransmits_{0};
};

}  // namespace ferry::reliability
