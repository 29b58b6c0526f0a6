#include "ferry/transfer/resume_store.hpp"

#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>

#include "ferry/common/errors.hpp"

namespace ferry::transfer {

namespace {

constexpr const char* RECORD_EXTENSION = ".json";

}  // namespace

ResumeStore::ResumeStore(std::filesystem::path directory, utils::WallNowFn wall_now)
    : directory_(std::move(directory)), wall_now_(std::move(wall_now)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw TransferException("cannot create resume directory " + directory_.string() +
                                ": " + ec.message());
    }
}

std::filesystem::path ResumeStore::path_for(const std::string& session_id) const {
    if (session_id.empty() || session_id.find_first_of("/\\") != std::string::npos ||
        session_id == "." || session_id == "..") {
        throw TransferException("invalid session id for resume record: '" + session_id + "'");
    }
    return directory_ / (session_id + RECORD_EXTENSION);
}

std::optional<TransferState> ResumeStore::read_locked(const std::string& session_id) const {
    const auto path = path_for(session_id);
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    try {
        const auto j = nlohmann::json::parse(in);
        return j.get<TransferState>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unreadable resume record {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

void ResumeStore::write_locked(const TransferState& state) const {
    const auto path = path_for(state.session_id);
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw TransferException("cannot write resume record " + tmp.string());
        }
        out << nlohmann::json(state).dump(2);
        out.flush();
        if (!out) {
            throw TransferException("failed writing resume record " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw TransferException("cannot replace resume record " + path.string());
    }
    spdlog::debug("Saved resume record for session {}", state.session_id);
}

void ResumeStore::save_transfer_state(const TransferState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_locked(state);
}

std::optional<TransferState> ResumeStore::load_transfer_state(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_locked(session_id);
}

bool ResumeStore::delete_transfer_state(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const bool removed = std::filesystem::remove(path_for(session_id), ec);
    if (ec) {
        throw TransferException("cannot delete resume record for " + session_id + ": " + ec.message());
    }
    return removed;
}

std::vector<TransferState> ResumeStore::get_all_transfer_states() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferState> states;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != RECORD_EXTENSION) {
            continue;
        }
        if (auto state = read_locked(entry.path().stem().string())) {
            states.push_back(std::move(*state));
        }
    }
    if (ec) {
        spdlog::warn("Cannot list resume directory {}: {}", directory_.string(), ec.message());
    }
    return states;
}

size_t ResumeStore::cleanup_old_states(std::chrono::milliseconds max_age) {
    const int64_t cutoff = wall_now_() - max_age.count();
    size_t removed = 0;

    for (const auto& state : get_all_transfer_states()) {
        if (state.created_at_ms < cutoff && delete_transfer_state(state.session_id)) {
            ++removed;
        }
    }

    if (removed > 0) {
        spdlog::info("Removed {} resume records older than {} ms", removed, max_age.count());
    }
    return removed;
}

void ResumeStore::mark_chunk_completed(const std::string& session_id,
                                       const std::string& file_id,
                                       uint64_t chunk_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = read_locked(session_id);
    if (!state) {
        throw TransferException("no resume record for session " + session_id);
    }

    auto* file = state->find_file(file_id);
    if (!file) {
        throw TransferException("no file " + file_id + " in session " + session_id);
    }
    if (file->chunk_size > 0 && chunk_index >= file->total_chunks()) {
        throw TransferException("chunk index " + std::to_string(chunk_index) +
                                " out of range for file " + file_id);
    }

    if (!file->completed_chunks.insert(chunk_index).second) {
        return;
    }

    const int64_t now = wall_now_();
    file->transferred_size = file->completed_bytes();
    file->last_updated_ms = now;
    state->last_updated_ms = now;
    if (state->status == TransferStatus::PENDING) {
        state->status = TransferStatus::IN_PROGRESS;
    }
    write_locked(*state);
}

bool ResumeStore::is_resumable(const std::string& session_id, const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = read_locked(session_id);
    return state && !is_terminal(state->status) && state->find_file(file_id) != nullptr;
}

std::vector<uint64_t> ResumeStore::missing_chunks(const std::string& session_id,
                                                  const std::string& file_id,
                                                  uint64_t total_chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = read_locked(session_id);
    const FileTransferState* file = state ? state->find_file(file_id) : nullptr;

    std::vector<uint64_t> missing;
    for (uint64_t i = 0; i < total_chunks; ++i) {
        if (!file || file->completed_chunks.count(i) == 0) {
            missing.push_back(i);
        }
    }
    return missing;
}

void ResumeStore::update_status(const std::string& session_id, TransferStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = read_locked(session_id);
    if (!state) {
        throw TransferException("no resume record for session " + session_id);
    }
    state->status = status;
    state->last_updated_ms = wall_now_();
    write_locked(*state);
    spdlog::info("Transfer {} is now {}", session_id, status_to_string(status));
}

}  // namespace ferry::transfer
