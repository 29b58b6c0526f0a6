#pragma once

#include <cstdint>
#include <deque>
#include <set>
#include <string>

#include "ferry/reliability/reliability.hpp"
#include "ferry/session/session_manager.hpp"
#include "ferry/transfer/chunker.hpp"
#include "ferry/transfer/resume_store.hpp"

namespace ferry::transfer {

// Streams one file through the reliability window.
//
// Each chunk is encrypted under the session key with chunk_aad(transfer_id,
// offset) and hashed in plaintext. Wire on_chunk_delivered() to the
// reliability protocol's delivery callback so the window keeps refilling.
class FileSender {
public:
    FileSender(Chunker& chunker,
               uint32_t transfer_id,
               std::string session_id,
               session::SecureSessionManager& sessions,
               reliability::ReliabilityProtocol& reliability,
               ResumeStore* resume_store = nullptr);

    // Queue every chunk index not in skip and declare the count to the window.
    // Clears a previous pause or cancel.
    void start(const std::set<uint64_t>& skip = {});

    // Send queued chunks until the window is full; returns how many were sent.
    // Throws CryptoException if the session cannot encrypt.
    size_t pump();

    // Record progress for a delivered chunk and refill the window
    void on_chunk_delivered(uint32_t transfer_id, uint64_t offset);

    // Stop sending new chunks. Chunks already in flight are still
    // acknowledged and recorded. Marks the resume record PAUSED.
    void pause();

    // Continue after pause(); marks the record IN_PROGRESS and refills the
    // window. Returns how many chunks were sent.
    size_t resume();

    // Drop the queue and every in-flight chunk of this transfer and mark the
    // resume record CANCELLED. The transfer cannot be resumed afterwards.
    void cancel();

    // Every queued chunk has been acknowledged
    [[nodiscard]] bool is_finished() const;
    [[nodiscard]] bool is_paused() const { return paused_; }
    [[nodiscard]] bool is_cancelled() const { return cancelled_; }

    [[nodiscard]] size_t queued_count() const { return queue_.size(); }
    [[nodiscard]] size_t delivered_count() const { return delivered_; }
    [[nodiscard]] uint32_t transfer_id() const { return transfer_id_; }

private:
    Chunker& chunker_;
    uint32_t transfer_id_;
    std::string session_id_;
    session::SecureSessionManager& sessions_;
    reliability::ReliabilityProtocol& reliability_;
    ResumeStore* resume_store_;

    std::deque<uint64_t> queue_;
    size_t expected_{0};
    size_t delivered_{0};
    bool paused_{false};
    bool cancelled_{false};
};

}  // namespace ferry::transfer
