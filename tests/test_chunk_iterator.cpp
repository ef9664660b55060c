#include <gtest/gtest.h>
#include "getchunk/chunk/ChunkIterator.hpp"
#include "getchunk/core/Config.hpp"
#include "getchunk/core/Errors.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <vector>

using namespace getchunk;
using getchunk::testing::ScriptedSource;
using getchunk::testing::ample_memory;
using getchunk::testing::make_pattern;
using getchunk::testing::write_file;

class ChunkIteratorTest : public ::testing::Test {
protected:
    std::string temp_file;
    std::vector<uint8_t> data;

    void SetUp() override {
        temp_file = make_unique_storage_file("iterator_test");
        data = make_pattern(960 * 1024);
        write_file(temp_file, data);
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_file)) {
            std::filesystem::remove(temp_file);
        }
    }
};

TEST_F(ChunkIteratorTest, RangeForReassemblesFile) {
    ChunkIterator chunks(temp_file);
    std::vector<uint8_t> rebuilt;
    for (const auto& chunk : chunks) {
        rebuilt.insert(rebuilt.end(), chunk.begin(), chunk.end());
    }
    EXPECT_EQ(rebuilt, data);
    EXPECT_TRUE(chunks.is_read_complete());
    EXPECT_TRUE(chunks.finished());
}

TEST_F(ChunkIteratorTest, BytesModeChunksAreUniform) {
    ChunkIterator chunks(temp_file);
    chunks.set_mode(SizingMode::fixed_bytes(150 * 1024));

    std::vector<size_t> sizes;
    while (auto chunk = chunks.next()) {
        sizes.push_back(chunk->size());
    }
    ASSERT_EQ(sizes.size(), 7u);
    for (size_t i = 0; i + 1 < sizes.size(); ++i) {
        EXPECT_EQ(sizes[i], 150u * 1024);
    }
    EXPECT_EQ(sizes.back(), 60u * 1024);
}

TEST_F(ChunkIteratorTest, PercentModeChunksAreUniform) {
    ChunkIterator chunks(temp_file);
    chunks.set_mode(SizingMode::percentage(15.0));

    std::vector<size_t> sizes;
    while (auto chunk = chunks.next()) {
        sizes.push_back(chunk->size());
    }
    ASSERT_GT(sizes.size(), 1u);
    for (size_t i = 0; i + 1 < sizes.size(); ++i) {
        EXPECT_EQ(sizes[i], 144u * 1024);
    }
}

TEST_F(ChunkIteratorTest, FluentConfiguration) {
    ChunkIterator chunks(temp_file);
    chunks.set_start_position(1000).set_mode(SizingMode::fixed_bytes(10));
    auto first = chunks.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, std::vector<uint8_t>(data.begin() + 1000, data.begin() + 1010));
}

TEST_F(ChunkIteratorTest, NextAfterEndStaysEmpty) {
    ChunkIterator chunks(std::make_unique<ChunkCursor>(from_string("xyz"), ample_memory()));
    chunks.set_mode(SizingMode::fixed_bytes(2));
    EXPECT_EQ(chunks.next()->size(), 2u);
    EXPECT_EQ(chunks.next()->size(), 1u);
    EXPECT_FALSE(chunks.next().has_value());
    EXPECT_FALSE(chunks.next().has_value());
}

TEST_F(ChunkIteratorTest, FailureThrowsAndEndsIteration) {
    auto source = std::make_unique<ScriptedSource>(10000, std::vector<std::chrono::milliseconds>{}, 1);
    ChunkIterator chunks(std::make_unique<ChunkCursor>(std::move(source), ample_memory()));
    chunks.set_mode(SizingMode::fixed_bytes(100));

    EXPECT_TRUE(chunks.next().has_value());
    EXPECT_THROW(chunks.next(), IoError);
    EXPECT_TRUE(chunks.finished());
    EXPECT_FALSE(chunks.is_read_complete());
    EXPECT_FALSE(chunks.next().has_value());
}

TEST_F(ChunkIteratorTest, MissingFileIsConfigurationError) {
    EXPECT_THROW(ChunkIterator("/nonexistent/getchunk/file.bin"), ConfigurationError);
}
