#include "ferry/transfer/transfer_state.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace ferry::transfer {

const char* status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::IN_PROGRESS: return "in_progress";
        case TransferStatus::PAUSED: return "paused";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "pending";
}

TransferStatus string_to_status(const std::string& str) {
    if (str == "in_progress") return TransferStatus::IN_PROGRESS;
    if (str == "paused") return TransferStatus::PAUSED;
    if (str == "completed") return TransferStatus::COMPLETED;
    if (str == "failed") return TransferStatus::FAILED;
    if (str == "cancelled") return TransferStatus::CANCELLED;
    return TransferStatus::PENDING;
}

bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED || status == TransferStatus::CANCELLED;
}

uint64_t FileTransferState::total_chunks() const {
    if (chunk_size == 0) {
        return 0;
    }
    return (total_size + chunk_size - 1) / chunk_size;
}

uint64_t FileTransferState::completed_bytes() const {
    uint64_t bytes = 0;
    for (uint64_t index : completed_chunks) {
        const uint64_t start = index * chunk_size;
        if (start >= total_size) {
            continue;
        }
        bytes += std::min(chunk_size, total_size - start);
    }
    return bytes;
}

double FileTransferState::progress_percent() const {
    if (total_size == 0) {
        return 0.0;
    }
    return static_cast<double>(transferred_size) * 100.0 / static_cast<double>(total_size);
}

bool FileTransferState::is_complete() const {
    return total_chunks() > 0 && completed_chunks.size() >= total_chunks();
}

FileTransferState* TransferState::find_file(const std::string& file_id) {
    auto it = std::find_if(file_states.begin(), file_states.end(),
                           [&](const FileTransferState& f) { return f.file_id == file_id; });
    return it == file_states.end() ? nullptr : &*it;
}

const FileTransferState* TransferState::find_file(const std::string& file_id) const {
    auto it = std::find_if(file_states.begin(), file_states.end(),
                           [&](const FileTransferState& f) { return f.file_id == file_id; });
    return it == file_states.end() ? nullptr : &*it;
}

void to_json(nlohmann::json& j, const FileTransferState& state) {
    j = nlohmann::json{
        {"file_id", state.file_id},
        {"file_name", state.file_name},
        {"total_size", state.total_size},
        {"chunk_size", state.chunk_size},
        {"transferred_size", state.transferred_size},
        {"completed_chunks", state.completed_chunks},
        {"created_at_ms", state.created_at_ms},
        {"last_updated_ms", state.last_updated_ms},
    };
}

// Unknown keys are ignored and optional ones default, so older records stay readable
void from_json(const nlohmann::json& j, FileTransferState& state) {
    j.at("file_id").get_to(state.file_id);
    state.file_name = j.value("file_name", std::string{});
    j.at("total_size").get_to(state.total_size);
    state.chunk_size = j.value("chunk_size", uint64_t{0});
    state.completed_chunks = j.value("completed_chunks", std::set<uint64_t>{});
    state.transferred_size = j.value("transferred_size", uint64_t{0});
    state.created_at_ms = j.value("created_at_ms", int64_t{0});
    state.last_updated_ms = j.value("last_updated_ms", state.created_at_ms);
}

void to_json(nlohmann::json& j, const TransferState& state) {
    j = nlohmann::json{
        {"session_id", state.session_id},
        {"sender_id", state.sender_id},
        {"receiver_id", state.receiver_id},
        {"file_states", state.file_states},
        {"status", status_to_string(state.status)},
        {"created_at_ms", state.created_at_ms},
        {"last_updated_ms", state.last_updated_ms},
        {"metadata", state.metadata},
    };
}

void from_json(const nlohmann::json& j, TransferState& state) {
    j.at("session_id").get_to(state.session_id);
    state.sender_id = j.value("sender_id", std::string{});
    state.receiver_id = j.value("receiver_id", std::string{});
    state.file_states = j.value("file_states", std::vector<FileTransferState>{});
    state.status = string_to_status(j.value("status", std::string{"pending"}));
    state.created_at_ms = j.value("created_at_ms", int64_t{0});
    state.last_updated_ms = j.value("last_updated_ms", state.created_at_ms);
    state.metadata = j.value("metadata", std::map<std::string, std::string>{});
}

}  // namespace ferry::transfer
