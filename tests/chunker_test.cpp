#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ferry/common/errors.hpp"
#include "ferry/crypto/crypto.hpp"
#include "ferry/transfer/chunker.hpp"

namespace ferry::transfer {
namespace {

class ChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("ferry_chunker_") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, size_t size) {
        content_.resize(size);
        crypto::random_bytes(content_);
        const auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content_.data()),
                  static_cast<std::streamsize>(content_.size()));
        return path;
    }

    static utils::WallNowFn fixed_clock() {
        return [] { return int64_t{42}; };
    }

    std::filesystem::path dir_;
    std::vector<uint8_t> content_;
};

TEST_F(ChunkerTest, ChunkCountRoundsUp) {
    EXPECT_EQ(Chunker(write_file("a", 1000), "a", 256).get_chunk_count(), 4u);
    EXPECT_EQ(Chunker(write_file("b", 1024), "b", 256).get_chunk_count(), 4u);
    EXPECT_EQ(Chunker(write_file("c", 1), "c", 256).get_chunk_count(), 1u);
    EXPECT_EQ(Chunker(write_file("d", 0), "d", 256).get_chunk_count(), 0u);
}

TEST_F(ChunkerTest, ChunksCoverFile) {
    Chunker chunker(write_file("file.bin", 1000), "file-1", 256, fixed_clock());

    auto chunks = chunker.get_all_chunks();
    ASSERT_EQ(chunks.size(), 4u);

    std::vector<uint8_t> joined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].chunk_index, i);
        EXPECT_EQ(chunks[i].offset, i * 256);
        EXPECT_EQ(chunks[i].file_id, "file-1");
        EXPECT_EQ(chunks[i].timestamp_ms, 42);
        EXPECT_EQ(chunks[i].is_last_chunk, i == 3);
        joined.insert(joined.end(), chunks[i].data.begin(), chunks[i].data.end());
    }
    EXPECT_EQ(chunks[3].data.size(), 1000u - 768u);
    EXPECT_EQ(joined, content_);
}

TEST_F(ChunkerTest, EvenlyDivisibleLastChunkIsFull) {
    Chunker chunker(write_file("even.bin", 512), "even", 256);

    auto last = chunker.get_chunk(1);
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last->is_last_chunk);
    EXPECT_EQ(last->data.size(), 256u);
}

TEST_F(ChunkerTest, RandomAccess) {
    Chunker chunker(write_file("random.bin", 1000), "r", 100);

    auto c7 = chunker.get_chunk(7);
    auto c2 = chunker.get_chunk(2);
    ASSERT_TRUE(c7 && c2);
    EXPECT_TRUE(std::equal(c7->data.begin(), c7->data.end(), content_.begin() + 700));
    EXPECT_TRUE(std::equal(c2->data.begin(), c2->data.end(), content_.begin() + 200));
}

TEST_F(ChunkerTest, OutOfRangeIndexIsNullopt) {
    Chunker chunker(write_file("small.bin", 300), "s", 256);

    EXPECT_TRUE(chunker.get_chunk(1).has_value());
    EXPECT_FALSE(chunker.get_chunk(2).has_value());
    EXPECT_FALSE(chunker.get_chunk(1000).has_value());
}

TEST_F(ChunkerTest, MissingFileThrows) {
    EXPECT_THROW(Chunker(dir_ / "does-not-exist", "x", 256), TransferException);
}

TEST_F(ChunkerTest, ZeroChunkSizeThrows) {
    EXPECT_THROW(Chunker(write_file("z", 10), "z", 0), std::invalid_argument);
}

TEST_F(ChunkerTest, Accessors) {
    Chunker chunker(write_file("acc.bin", 777), "acc", 128);

    EXPECT_EQ(chunker.file_size(), 777u);
    EXPECT_EQ(chunker.chunk_size(), 128u);
    EXPECT_EQ(chunker.file_id(), "acc");
}

}  // namespace
}  // namespace ferry::transfer
