#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ferry/transfer/transfer_state.hpp"
#include "ferry/utils/time.hpp"

namespace ferry::transfer {

// Persists resume records as one JSON document per session under a directory.
//
// Writes go through a temporary file and a rename, so a crash leaves either
// the old or the new record. Thread-safe.
class ResumeStore {
public:
    // Creates the directory if needed; throws TransferException on failure
    explicit ResumeStore(std::filesystem::path directory,
                         utils::WallNowFn wall_now = utils::system_now_ms());

    // Throws TransferException if the record cannot be written
    void save_transfer_state(const TransferState& state);

    // nullopt if missing or unreadable
    std::optional<TransferState> load_transfer_state(const std::string& session_id);

    // Returns false if there was nothing to delete
    bool delete_transfer_state(const std::string& session_id);

    // Every readable record; unreadable ones are skipped with a warning
    std::vector<TransferState> get_all_transfer_states();

    // Remove records created more than max_age ago; returns how many went
    size_t cleanup_old_states(std::chrono::milliseconds max_age);

    // Add a chunk index to a file's completed set and persist.
    // Throws TransferException if the session or file is unknown.
    void mark_chunk_completed(const std::string& session_id,
                              const std::string& file_id,
                              uint64_t chunk_index);

    // A record exists for the file and its status is not terminal
    bool is_resumable(const std::string& session_id, const std::string& file_id);

    // Indices in [0, total_chunks) not yet completed, ascending
    std::vector<uint64_t> missing_chunks(const std::string& session_id,
                                         const std::string& file_id,
                                         uint64_t total_chunks);

    // Throws TransferException if the session is unknown
    void update_status(const std::string& session_id, TransferStatus status);

    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path path_for(const std::string& session_id) const;
    std::optional<TransferState> read_locked(const std::string& session_id) const;
    void write_locked(const TransferState& state) const;

    std::filesystem::path directory_;
    utils::WallNowFn wall_now_;
    mutable std::mutex mutex_;
};

}  // namespace ferry::transfer
