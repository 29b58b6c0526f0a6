#include "ferry/transfer/file_sender.hpp"

#include <spdlog/spdlog.h>

#include "ferry/packet/frame.hpp"

namespace ferry::transfer {

FileSender::FileSender(Chunker& chunker,
                       uint32_t transfer_id,
                       std::string session_id,
                       session::SecureSessionManager& sessions,
                       reliability::ReliabilityProtocol& reliability,
                       ResumeStore* resume_store)
    : chunker_(chunker),
      transfer_id_(transfer_id),
      session_id_(std::move(session_id)),
      sessions_(sessions),
      reliability_(reliability),
      resume_store_(resume_store) {}

void FileSender::start(const std::set<uint64_t>& skip) {
    queue_.clear();
    delivered_ = 0;
    paused_ = false;
    cancelled_ = false;

    const uint64_t count = chunker_.get_chunk_count();
    for (uint64_t i = 0; i < count; ++i) {
        if (skip.count(i) == 0) {
            queue_.push_back(i);
        }
    }
    expected_ = queue_.size();
    reliability_.expect_chunks(transfer_id_, expected_);

    spdlog::info("Sending {} of {} chunks of {} (transfer {})",
                 expected_, count, chunker_.file_id(), transfer_id_);
}

size_t FileSender::pump() {
    if (paused_ || cancelled_) {
        return 0;
    }

    size_t sent = 0;
    while (!queue_.empty() && reliability_.can_send()) {
        const uint64_t index = queue_.front();
        queue_.pop_front();

        auto chunk = chunker_.get_chunk(index);
        if (!chunk) {
            continue;
        }

        const auto aad = packet::chunk_aad(transfer_id_, chunk->offset);
        const auto hash = session::SecureSessionManager::hash(chunk->data);
        auto encrypted = sessions_.encrypt(session_id_, chunk->data, aad);

        if (!reliability_.send_chunk(transfer_id_, chunk->offset, encrypted.combined(),
                                     encrypted.iv, hash)) {
            // Window closed while a callback ran; retry on the next pump
            queue_.push_front(index);
            break;
        }
        ++sent;
    }
    return sent;
}

void FileSender::on_chunk_delivered(uint32_t transfer_id, uint64_t offset) {
    if (transfer_id != transfer_id_) {
        return;
    }

    ++delivered_;
    if (resume_store_) {
        resume_store_->mark_chunk_completed(session_id_, chunker_.file_id(),
                                            offset / chunker_.chunk_size());
    }
    pump();
}

void FileSender::pause() {
    if (paused_ || cancelled_) {
        return;
    }
    paused_ = true;
    if (resume_store_) {
        resume_store_->update_status(session_id_, TransferStatus::PAUSED);
    }
    spdlog::info("Transfer {} paused with {} chunks queued", transfer_id_, queue_.size());
}

size_t FileSender::resume() {
    if (!paused_ || cancelled_) {
        return 0;
    }
    paused_ = false;
    if (resume_store_) {
        resume_store_->update_status(session_id_, TransferStatus::IN_PROGRESS);
    }
    spdlog::info("Transfer {} resumed", transfer_id_);
    return pump();
}

void FileSender::cancel() {
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    paused_ = false;
    queue_.clear();
    const size_t dropped = reliability_.cancel_transfer(transfer_id_);
    if (resume_store_) {
        resume_store_->update_status(session_id_, TransferStatus::CANCELLED);
    }
    spdlog::info("Transfer {} cancelled ({} chunks were in flight)", transfer_id_, dropped);
}

bool FileSender::is_finished() const {
    return !cancelled_ && queue_.empty() && delivered_ >= expected_;
}

}  // namespace ferry::transfer
