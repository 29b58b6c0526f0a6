#include "ferry/reliability/reliability.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string>

#include "ferry/common/errors.hpp"

namespace ferry::reliability {

ReliabilityProtocol::ReliabilityProtocol(const ReliabilityConfig& config,
                                         ReliabilityCallbacks callbacks,
                                         utils::NowFn now_fn)
    : config_(config),
      callbacks_(std::move(callbacks)),
      now_fn_(std::move(now_fn)) {
    if (config_.window_size == 0 || config_.window_size > MAX_WINDOW_SIZE) {
        throw std::invalid_argument("window size must be between 1 and " +
                                    std::to_string(MAX_WINDOW_SIZE));
    }
    if (config_.chunk_size == 0 || config_.chunk_size > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk size must be between 1 and " +
                                    std::to_string(MAX_CHUNK_SIZE));
    }
}

void ReliabilityProtocol::expect_chunks(uint32_t transfer_id, size_t total_chunks) {
    expected_[transfer_id] = total_chunks;
}

bool ReliabilityProtocol::can_send() const {
    return in_flight_ < config_.window_size;
}

bool ReliabilityProtocol::send_chunk(uint32_t transfer_id,
                                     uint64_t offset,
                                     std::vector<uint8_t> payload,
                                     const crypto::Nonce& iv,
                                     const packet::ChunkHash& hash) {
    if (payload.size() > packet::MAX_PAYLOAD_SIZE) {
        throw MalformedFrame("chunk payload of " + std::to_string(payload.size()) +
                             " bytes exceeds the frame limit");
    }
    if (!can_send()) {
        return false;
    }

    const ChunkKey key{transfer_id, offset};
    auto it = chunks_.find(key);
    if (it != chunks_.end() && it->second.status != ChunkStatus::FAILED) {
        return false;
    }

    ChunkState state;
    state.sequence = next_sequence_++;
    state.frame.transfer_id = transfer_id;
    state.frame.offset = offset;
    state.frame.iv = iv;
    state.frame.chunk_hash = hash;
    state.payload_length = static_cast<uint32_t>(payload.size());
    state.frame.payload = std::move(payload);
    state.last_sent = now_fn_();

    auto& stored = chunks_.insert_or_assign(key, std::move(state)).first->second;
    ++in_flight_;

    spdlog::trace("Sending chunk transfer={} offset={} seq={}", transfer_id, offset, stored.sequence);
    if (callbacks_.on_frame_send) {
        callbacks_.on_frame_send(packet::ProtocolFrame{stored.frame});
    }
    return true;
}

bool ReliabilityProtocol::process_ack(const packet::AckFrame& ack) {
    auto it = chunks_.find(ChunkKey{ack.transfer_id, ack.offset});
    if (it == chunks_.end() || it->second.payload_length != ack.length) {
        spdlog::warn("Ignoring unknown ack transfer={} offset={} length={}",
                     ack.transfer_id, ack.offset, ack.length);
        return false;
    }

    auto& chunk = it->second;
    switch (chunk.status) {
        case ChunkStatus::ACKED:
            spdlog::debug("Duplicate ack transfer={} offset={}", ack.transfer_id, ack.offset);
            return false;
        case ChunkStatus::IN_FLIGHT:
            --in_flight_;
            break;
        case ChunkStatus::FAILED:
            spdlog::info("Late ack for failed chunk transfer={} offset={}", ack.transfer_id, ack.offset);
            break;
    }

    chunk.status = ChunkStatus::ACKED;
    chunk.frame.payload = {};

    if (callbacks_.on_chunk_delivered) {
        callbacks_.on_chunk_delivered(ack.transfer_id, ack.offset);
    }
    if (callbacks_.on_ack_received) {
        callbacks_.on_ack_received(ack);
    }
    return true;
}

size_t ReliabilityProtocol::retransmit_expired() {
    const auto now = now_fn_();
    std::vector<packet::DataFrame> to_resend;
    size_t failed = 0;

    for (auto& [key, chunk] : chunks_) {
        if (chunk.status != ChunkStatus::IN_FLIGHT) {
            continue;
        }
        if (now - chunk.last_sent < config_.ack_timeout) {
            continue;
        }

        if (chunk.retry_count >= config_.max_retries) {
            // Max retries exceeded
            chunk.status = ChunkStatus::FAILED;
            --in_flight_;
            ++failed;
            spdlog::error("Chunk transfer={} offset={} failed after {} retries",
                          key.first, key.second, chunk.retry_count);
            continue;
        }

        chunk.last_sent = now;
        ++chunk.retry_count;
        ++total_retransmits_;
        to_resend.push_back(chunk.frame);
        spdlog::debug("Retransmitting chunk transfer={} offset={} attempt {}",
                      key.first, key.second, chunk.retry_count);
    }

    if (callbacks_.on_frame_send) {
        for (auto& frame : to_resend) {
            callbacks_.on_frame_send(packet::ProtocolFrame{std::move(frame)});
        }
    }

    if (failed > 0) {
        throw TransferException(std::to_string(failed) +
                                " chunk(s) exceeded the retry budget of " +
                                std::to_string(config_.max_retries));
    }
    return to_resend.size();
}

TransferStats ReliabilityProtocol::collect_stats(std::optional<uint32_t> transfer_id) const {
    TransferStats stats;
    stats.window_size = config_.window_size;
    stats.retransmits = total_retransmits_;
    stats.window_start = next_sequence_;

    std::map<uint32_t, size_t> tracked;
    for (const auto& [key, chunk] : chunks_) {
        if (transfer_id && key.first != *transfer_id) {
            continue;
        }
        ++tracked[key.first];
        switch (chunk.status) {
            case ChunkStatus::IN_FLIGHT:
                ++stats.in_flight_chunks;
                stats.window_start = std::min(stats.window_start, chunk.sequence);
                break;
            case ChunkStatus::ACKED:
                ++stats.acked_chunks;
                break;
            case ChunkStatus::FAILED:
                ++stats.failed_chunks;
                break;
        }
    }

    for (const auto& [id, expected] : expected_) {
        if (transfer_id && id != *transfer_id) {
            continue;
        }
        tracked.try_emplace(id, 0);
    }

    for (const auto& [id, count] : tracked) {
        auto it = expected_.find(id);
        const size_t declared = it != expected_.end() ? it->second : 0;
        stats.total_chunks += std::max(declared, count);
    }
    return stats;
}

TransferStats ReliabilityProtocol::get_stats() const {
    return collect_stats(std::nullopt);
}

TransferStats ReliabilityProtocol::get_stats(uint32_t transfer_id) const {
    return collect_stats(transfer_id);
}

bool ReliabilityProtocol::is_transfer_complete(uint32_t transfer_id) const {
    const auto stats = get_stats(transfer_id);
    return stats.total_chunks > 0 && stats.acked_chunks == stats.total_chunks;
}

bool ReliabilityProtocol::is_complete() const {
    const auto stats = get_stats();
    return stats.total_chunks > 0 && stats.acked_chunks == stats.total_chunks;
}

size_t ReliabilityProtocol::cancel_transfer(uint32_t transfer_id) {
    size_t dropped = 0;
    auto it = chunks_.lower_bound(ChunkKey{transfer_id, 0});
    while (it != chunks_.end() && it->first.first == transfer_id) {
        if (it->second.status == ChunkStatus::IN_FLIGHT) {
            --in_flight_;
            ++dropped;
        }
        it = chunks_.erase(it);
    }
    expected_.erase(transfer_id);

    spdlog::info("Cancelled transfer {} with {} chunk(s) in flight", transfer_id, dropped);
    return dropped;
}

void ReliabilityProtocol::reset() {
    chunks_.clear();
    expected_.clear();
    in_flight_ = 0;
    next_sequence_ = 0;
    total_retransmits_ = 0;
}

}  // namespace ferry::reliability
