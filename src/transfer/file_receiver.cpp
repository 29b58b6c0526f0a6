#include "ferry/transfer/file_receiver.hpp"

#include <spdlog/spdlog.h>

#include "ferry/common/errors.hpp"

namespace ferry::transfer {

FileReceiver::FileReceiver(std::string session_id,
                           session::SecureSessionManager& sessions,
                           ChunkWriter writer,
                           FrameSink send_frame)
    : session_id_(std::move(session_id)),
      sessions_(sessions),
      writer_(std::move(writer)),
      send_frame_(std::move(send_frame)) {}

void FileReceiver::attach_resume_store(ResumeStore& store, std::string file_id, uint64_t chunk_size) {
    resume_store_ = &store;
    file_id_ = std::move(file_id);
    chunk_size_ = chunk_size;
}

void FileReceiver::handle_data_frame(const packet::DataFrame& frame) {
    auto encrypted = crypto::AeadResult::from_combined(frame.payload, frame.iv);
    if (!encrypted) {
        throw CryptoException("data frame payload shorter than an authentication tag");
    }

    const auto aad = packet::chunk_aad(frame.transfer_id, frame.offset);
    auto plaintext = sessions_.decrypt(session_id_, *encrypted, aad);

    const auto digest = session::SecureSessionManager::hash(plaintext);
    if (!crypto::constant_time_compare(digest, frame.chunk_hash)) {
        throw TransferException("chunk hash mismatch at transfer " +
                                std::to_string(frame.transfer_id) + " offset " +
                                std::to_string(frame.offset));
    }

    const auto key = std::make_pair(frame.transfer_id, frame.offset);
    if (received_.count(key) != 0) {
        spdlog::warn("Duplicate chunk transfer={} offset={}, re-acknowledging",
                     frame.transfer_id, frame.offset);
        send_ack(frame);
        return;
    }

    if (writer_) {
        writer_(frame.offset, plaintext);
    }
    received_.insert(key);
    bytes_received_ += plaintext.size();

    if (resume_store_ && chunk_size_ > 0) {
        resume_store_->mark_chunk_completed(session_id_, file_id_, frame.offset / chunk_size_);
    }

    send_ack(frame);
}

bool FileReceiver::has_chunk(uint32_t transfer_id, uint64_t offset) const {
    return received_.count(std::make_pair(transfer_id, offset)) != 0;
}

void FileReceiver::send_ack(const packet::DataFrame& frame) {
    if (!send_frame_) {
        return;
    }
    packet::AckFrame ack{
        .transfer_id = frame.transfer_id,
        .offset = frame.offset,
        .length = static_cast<uint32_t>(frame.payload.size()),
    };
    send_frame_(packet::ProtocolFrame{packet::make_ack_frame(ack)});
}

}  // namespace ferry::transfer
