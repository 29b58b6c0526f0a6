#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace ferry::transfer {

enum class TransferStatus {
    PENDING,
    IN_PROGRESS,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* status_to_string(TransferStatus status);

// Unknown names map to PENDING
TransferStatus string_to_status(const std::string& str);

// Completed and cancelled transfers cannot be resumed
bool is_terminal(TransferStatus status);

// Progress of one file inside a transfer
struct FileTransferState {
    std::string file_id;
    std::string file_name;
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    uint64_t transferred_size = 0;
    std::set<uint64_t> completed_chunks;
    int64_t created_at_ms = 0;
    int64_t last_updated_ms = 0;

    [[nodiscard]] uint64_t total_chunks() const;

    // Bytes covered by completed_chunks, the last chunk clamped to total_size
    [[nodiscard]] uint64_t completed_bytes() const;

    // Percentage in [0, 100]
    [[nodiscard]] double progress_percent() const;

    [[nodiscard]] bool is_complete() const;

    bool operator==(const FileTransferState&) const = default;
};

// Resume record for one session
struct TransferState {
    std::string session_id;
    std::string sender_id;
    std::string receiver_id;
    std::vector<FileTransferState> file_states;
    TransferStatus status = TransferStatus::PENDING;
    int64_t created_at_ms = 0;
    int64_t last_updated_ms = 0;
    std::map<std::string, std::string> metadata;

    [[nodiscard]] FileTransferState* find_file(const std::string& file_id);
    [[nodiscard]] const FileTransferState* find_file(const std::string& file_id) const;

    bool operator==(const TransferState&) const = default;
};

void to_json(nlohmann::json& j, const FileTransferState& state);
void from_json(const nlohmann::json& j, FileTransferState& state);
void to_json(nlohmann::json& j, const TransferState& state);
void from_json(const nlohmann::json& j, TransferState& state);

}  // namespace ferry::transfer
