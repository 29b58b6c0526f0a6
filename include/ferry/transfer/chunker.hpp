#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "ferry/utils/time.hpp"

namespace ferry::transfer {

// One fixed-size span of a file, produced on demand
struct FileChunk {
    std::string file_id;
    uint64_t chunk_index = 0;
    uint64_t offset = 0;
    std::vector<uint8_t> data;
    bool is_last_chunk = false;
    int64_t timestamp_ms = 0;
};

// Random-access reader that splits a file into chunk_size pieces.
// The last chunk holds the remainder (or a full chunk if the size divides evenly).
class Chunker {
public:
    // Throws TransferException if the file cannot be opened,
    // std::invalid_argument if chunk_size is zero
    Chunker(const std::filesystem::path& path,
            std::string file_id,
            uint64_t chunk_size,
            utils::WallNowFn wall_now = utils::system_now_ms());

    // ceil(file_size / chunk_size)
    [[nodiscard]] uint64_t get_chunk_count() const;

    // nullopt for an index past the end.
    // Throws TransferException if the file cannot be read.
    std::optional<FileChunk> get_chunk(uint64_t index);

    std::vector<FileChunk> get_all_chunks();

    [[nodiscard]] uint64_t file_size() const { return file_size_; }
    [[nodiscard]] uint64_t chunk_size() const { return chunk_size_; }
    [[nodiscard]] const std::string& file_id() const { return file_id_; }

private:
    std::filesystem::path path_;
    std::string file_id_;
    uint64_t chunk_size_;
    uint64_t file_size_{0};
    std::ifstream stream_;
    utils::WallNowFn wall_now_;
};

}  // namespace ferry::transfer
