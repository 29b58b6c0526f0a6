#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <span>
#include <string>
#include <utility>

#include "ferry/packet/frame.hpp"
#include "ferry/session/session_manager.hpp"
#include "ferry/transfer/resume_store.hpp"

namespace ferry::transfer {

// Receiving side of a transfer: authenticates, verifies and acknowledges
// data frames, handing plaintext to a writer.
class FileReceiver {
public:
    using ChunkWriter = std::function<void(uint64_t offset, std::span<const uint8_t> data)>;
    using FrameSink = std::function<void(const packet::ProtocolFrame& frame)>;

    FileReceiver(std::string session_id,
                 session::SecureSessionManager& sessions,
                 ChunkWriter writer,
                 FrameSink send_frame);

    // Record received chunks of file_id in the store
    void attach_resume_store(ResumeStore& store, std::string file_id, uint64_t chunk_size);

    // Throws CryptoException if authentication fails (including a frame
    // moved to another offset or transfer), TransferException if the
    // plaintext does not match the frame's chunk hash.
    void handle_data_frame(const packet::DataFrame& frame);

    [[nodiscard]] bool has_chunk(uint32_t transfer_id, uint64_t offset) const;
    [[nodiscard]] size_t chunks_received() const { return received_.size(); }
    [[nodiscard]] uint64_t bytes_received() const { return bytes_received_; }

private:
    void send_ack(const packet::DataFrame& frame);

    std::string session_id_;
    session::SecureSessionManager& sessions_;
    ChunkWriter writer_;
    FrameSink send_frame_;

    ResumeStore* resume_store_{nullptr};
    std::string file_id_;
    uint64_t chunk_size_{0};

    std::set<std::pair<uint32_t, uint64_t>> received_;
    uint64_t bytes_received_{0};
};

}  // namespace ferry::transfer
