#include "ferry/transfer/chunker.hpp"

#include <algorithm>
#include <stdexcept>

#include "ferry/common/errors.hpp"

namespace ferry::transfer {

Chunker::Chunker(const std::filesystem::path& path,
                 std::string file_id,
                 uint64_t chunk_size,
                 utils::WallNowFn wall_now)
    : path_(path),
      file_id_(std::move(file_id)),
      chunk_size_(chunk_size),
      wall_now_(std::move(wall_now)) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    std::error_code ec;
    file_size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw TransferException("cannot stat " + path_.string() + ": " + ec.message());
    }

    stream_.open(path_, std::ios::binary);
    if (!stream_) {
        throw TransferException("cannot open " + path_.string());
    }
}

uint64_t Chunker::get_chunk_count() const {
    return (file_size_ + chunk_size_ - 1) / chunk_size_;
}

std::optional<FileChunk> Chunker::get_chunk(uint64_t index) {
    const uint64_t count = get_chunk_count();
    if (index >= count) {
        return std::nullopt;
    }

    const uint64_t offset = index * chunk_size_;
    const uint64_t length = std::min(chunk_size_, file_size_ - offset);

    FileChunk chunk;
    chunk.file_id = file_id_;
    chunk.chunk_index = index;
    chunk.offset = offset;
    chunk.is_last_chunk = index + 1 == count;
    chunk.timestamp_ms = wall_now_();
    chunk.data.resize(length);

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(stream_.gcount()) != length) {
        throw TransferException("short read of chunk " + std::to_string(index) +
                                " from " + path_.string());
    }
    return chunk;
}

std::vector<FileChunk> Chunker::get_all_chunks() {
    std::vector<FileChunk> chunks;
    const uint64_t count = get_chunk_count();
    chunks.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        chunks.push_back(std::move(*get_chunk(i)));
    }
    return chunks;
}

}  // namespace ferry::transfer
