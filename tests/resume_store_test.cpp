#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "ferry/common/errors.hpp"
#include "ferry/crypto/crypto.hpp"
#include "ferry/transfer/resume_store.hpp"
#include "ferry/transfer/transfer_state.hpp"

namespace ferry::transfer {
namespace {

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

class ResumeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("ferry_resume_") + info->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    utils::WallNowFn clock_fn() {
        return [this] { return now_ms_; };
    }

    TransferState make_state(const std::string& session_id, uint64_t size = 1000,
                             uint64_t chunk_size = 256) {
        TransferState state;
        state.session_id = session_id;
        state.sender_id = "alice";
        state.receiver_id = "bob";
        state.created_at_ms = now_ms_;
        state.last_updated_ms = now_ms_;
        state.metadata["origin"] = "test";
        FileTransferState file;
        file.file_id = "file-1";
        file.file_name = "report.pdf";
        file.total_size = size;
        file.chunk_size = chunk_size;
        file.created_at_ms = now_ms_;
        file.last_updated_ms = now_ms_;
        state.file_states.push_back(file);
        return state;
    }

    std::filesystem::path dir_;
    int64_t now_ms_ = 1'700'000'000'000;
};

TEST_F(ResumeStoreTest, CreatesDirectory) {
    ResumeStore store(dir_ / "nested", clock_fn());
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "nested"));
}

TEST_F(ResumeStoreTest, SaveLoadAcrossInstances) {
    auto state = make_state("s1");
    {
        ResumeStore store(dir_, clock_fn());
        store.save_transfer_state(state);
    }

    ResumeStore reopened(dir_, clock_fn());
    auto loaded = reopened.load_transfer_state("s1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, state);
}

TEST_F(ResumeStoreTest, MissingRecordIsNullopt) {
    ResumeStore store(dir_, clock_fn());
    EXPECT_FALSE(store.load_transfer_state("nobody").has_value());
}

TEST_F(ResumeStoreTest, RejectsPathLikeSessionIds) {
    ResumeStore store(dir_, clock_fn());

    EXPECT_THROW(store.save_transfer_state(make_state("../escape")), TransferException);
    EXPECT_THROW(store.load_transfer_state(""), TransferException);
    EXPECT_THROW(store.load_transfer_state(".."), TransferException);
}

TEST_F(ResumeStoreTest, DeleteTransferState) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("s1"));

    EXPECT_TRUE(store.delete_transfer_state("s1"));
    EXPECT_FALSE(store.delete_transfer_state("s1"));
    EXPECT_FALSE(store.load_transfer_state("s1").has_value());
}

TEST_F(ResumeStoreTest, MarkChunkCompletedIsMonotonic) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("s1"));

    now_ms_ += 500;
    store.mark_chunk_completed("s1", "file-1", 2);
    store.mark_chunk_completed("s1", "file-1", 0);
    store.mark_chunk_completed("s1", "file-1", 2);

    auto loaded = store.load_transfer_state("s1");
    ASSERT_TRUE(loaded.has_value());
    const auto* file = loaded->find_file("file-1");
    ASSERT_NE(file, nullptr);
    EXPECT_THAT(file->completed_chunks, ElementsAre(0u, 2u));
    EXPECT_EQ(file->transferred_size, 512u);
    EXPECT_EQ(file->last_updated_ms, now_ms_);
    EXPECT_EQ(loaded->status, TransferStatus::IN_PROGRESS);
}

TEST_F(ResumeStoreTest, MarkLastChunkCountsRemainder) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("s1"));

    store.mark_chunk_completed("s1", "file-1", 3);

    auto loaded = store.load_transfer_state("s1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->find_file("file-1")->transferred_size, 1000u - 768u);
}

TEST_F(ResumeStoreTest, MarkChunkCompletedRejectsUnknownTargets) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("s1"));

    EXPECT_THROW(store.mark_chunk_completed("missing", "file-1", 0), TransferException);
    EXPECT_THROW(store.mark_chunk_completed("s1", "other-file", 0), TransferException);
    EXPECT_THROW(store.mark_chunk_completed("s1", "file-1", 4), TransferException);
}

TEST_F(ResumeStoreTest, MissingChunks) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("s1"));
    store.mark_chunk_completed("s1", "file-1", 1);
    store.mark_chunk_completed("s1", "file-1", 3);

    EXPECT_THAT(store.missing_chunks("s1", "file-1", 4), ElementsAre(0u, 2u));
    EXPECT_THAT(store.missing_chunks("unknown", "file-1", 2), ElementsAre(0u, 1u));
}

TEST_F(ResumeStoreTest, TerminalTransfersAreNotResumable) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("s1"));

    EXPECT_TRUE(store.is_resumable("s1", "file-1"));
    EXPECT_FALSE(store.is_resumable("s1", "other-file"));
    EXPECT_FALSE(store.is_resumable("missing", "file-1"));

    store.update_status("s1", TransferStatus::PAUSED);
    EXPECT_TRUE(store.is_resumable("s1", "file-1"));
    store.update_status("s1", TransferStatus::FAILED);
    EXPECT_TRUE(store.is_resumable("s1", "file-1"));

    store.update_status("s1", TransferStatus::COMPLETED);
    EXPECT_FALSE(store.is_resumable("s1", "file-1"));

    store.update_status("s1", TransferStatus::CANCELLED);
    EXPECT_FALSE(store.is_resumable("s1", "file-1"));
}

TEST_F(ResumeStoreTest, UpdateStatusOfUnknownSessionThrows) {
    ResumeStore store(dir_, clock_fn());
    EXPECT_THROW(store.update_status("missing", TransferStatus::COMPLETED), TransferException);
}

TEST_F(ResumeStoreTest, CleanupOldStates) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("old"));
    now_ms_ += 3'600'000;
    store.save_transfer_state(make_state("fresh"));
    now_ms_ += 60'000;

    EXPECT_EQ(store.cleanup_old_states(std::chrono::minutes(30)), 1u);

    EXPECT_FALSE(store.load_transfer_state("old").has_value());
    EXPECT_TRUE(store.load_transfer_state("fresh").has_value());
}

TEST_F(ResumeStoreTest, UnreadableRecordSkipped) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("good"));
    {
        std::ofstream out(dir_ / "broken.json");
        out << "{ this is not json";
    }
    {
        std::ofstream out(dir_ / "notes.txt");
        out << "ignored";
    }

    EXPECT_FALSE(store.load_transfer_state("broken").has_value());

    auto all = store.get_all_transfer_states();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].session_id, "good");
}

TEST_F(ResumeStoreTest, ListsAllStates) {
    ResumeStore store(dir_, clock_fn());
    store.save_transfer_state(make_state("a"));
    store.save_transfer_state(make_state("b"));

    std::vector<std::string> ids;
    for (const auto& state : store.get_all_transfer_states()) {
        ids.push_back(state.session_id);
    }
    EXPECT_THAT(ids, UnorderedElementsAre("a", "b"));
}

TEST_F(ResumeStoreTest, OlderRecordWithoutOptionalFieldsLoads) {
    ResumeStore store(dir_, clock_fn());
    {
        std::ofstream out(dir_ / "legacy.json");
        out << R"({"session_id":"legacy","status":"in_progress","unknown_field":true,)"
            << R"("file_states":[{"file_id":"f","total_size":10,"future":[1,2]}]})";
    }

    auto loaded = store.load_transfer_state("legacy");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, TransferStatus::IN_PROGRESS);
    ASSERT_EQ(loaded->file_states.size(), 1u);
    EXPECT_EQ(loaded->file_states[0].total_size, 10u);
    EXPECT_TRUE(loaded->file_states[0].completed_chunks.empty());
    EXPECT_TRUE(loaded->metadata.empty());
}

TEST_F(ResumeStoreTest, FileStateProgress) {
    FileTransferState file;
    file.total_size = 1000;
    file.chunk_size = 256;
    EXPECT_EQ(file.total_chunks(), 4u);
    EXPECT_FALSE(file.is_complete());

    file.completed_chunks = {0, 1, 2, 3};
    file.transferred_size = file.completed_bytes();
    EXPECT_EQ(file.transferred_size, 1000u);
    EXPECT_TRUE(file.is_complete());
    EXPECT_DOUBLE_EQ(file.progress_percent(), 100.0);
}

TEST_F(ResumeStoreTest, StatusNames) {
    for (auto status : {TransferStatus::PENDING, TransferStatus::IN_PROGRESS, TransferStatus::PAUSED,
                        TransferStatus::COMPLETED, TransferStatus::FAILED, TransferStatus::CANCELLED}) {
        EXPECT_EQ(string_to_status(status_to_string(status)), status);
    }
    EXPECT_EQ(string_to_status("bogus"), TransferStatus::PENDING);
}

}  // namespace
}  // namespace ferry::transfer
