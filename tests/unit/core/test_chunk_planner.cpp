/**
 * @file test_chunk_planner.cpp
 * @brief Unit tests for the multipart part layout
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/chunk_planner.h>

#include <limits>

namespace kcenon::resumable_upload::test {

class ChunkPlannerTest : public ::testing::Test {};

TEST_F(ChunkPlannerTest, Plan_ExactMultiple) {
    auto parts = plan_chunks(4096, 1024);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts.value().size(), 4u);

    for (std::size_t i = 0; i < parts.value().size(); ++i) {
        EXPECT_EQ(parts.value()[i].part_number, static_cast<int32_t>(i + 1));
        EXPECT_EQ(parts.value()[i].size(), 1024);
    }
}

TEST_F(ChunkPlannerTest, Plan_LastPartHoldsRemainder) {
    auto parts = plan_chunks(25'000'000, 8'000'000);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts.value().size(), 4u);

    EXPECT_EQ(parts.value()[0], (part_range{1, 0, 8'000'000}));
    EXPECT_EQ(parts.value()[1], (part_range{2, 8'000'000, 16'000'000}));
    EXPECT_EQ(parts.value()[2], (part_range{3, 16'000'000, 24'000'000}));
    EXPECT_EQ(parts.value()[3], (part_range{4, 24'000'000, 25'000'000}));
    EXPECT_EQ(parts.value()[3].size(), 1'000'000);
}

TEST_F(ChunkPlannerTest, Plan_RangesCoverFileWithoutGaps) {
    const int64_t file_size = 1'000'003;
    auto parts = plan_chunks(file_size, 65'536);
    ASSERT_TRUE(parts.has_value());

    int64_t expected_start = 0;
    int64_t covered = 0;
    for (const auto& part : parts.value()) {
        EXPECT_EQ(part.start_byte, expected_start);
        EXPECT_GT(part.size(), 0);
        EXPECT_LE(part.size(), 65'536);
        expected_start = part.end_byte;
        covered += part.size();
    }
    EXPECT_EQ(expected_start, file_size);
    EXPECT_EQ(covered, file_size);
}

TEST_F(ChunkPlannerTest, Plan_SmallerThanOneChunk) {
    auto parts = plan_chunks(10, 1024);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts.value().size(), 1u);
    EXPECT_EQ(parts.value()[0], (part_range{1, 0, 10}));
}

TEST_F(ChunkPlannerTest, Plan_EmptyFile) {
    auto parts = plan_chunks(0, 1024);
    ASSERT_TRUE(parts.has_value());
    EXPECT_TRUE(parts.value().empty());
}

TEST_F(ChunkPlannerTest, Plan_InvalidChunkSize) {
    auto zero = plan_chunks(100, 0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, error_code::invalid_input);

    auto negative = plan_chunks(100, -5);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, error_code::invalid_input);
}

TEST_F(ChunkPlannerTest, Plan_NegativeFileSize) {
    auto parts = plan_chunks(-1, 1024);
    ASSERT_FALSE(parts.has_value());
    EXPECT_EQ(parts.error().code, error_code::invalid_input);
}

TEST_F(ChunkPlannerTest, Plan_HugeChunkSizeCoversFile) {
    constexpr auto max_size = std::numeric_limits<int64_t>::max();

    auto parts = plan_chunks(10, max_size);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts.value().size(), 1u);
    EXPECT_EQ(parts.value()[0], (part_range{1, 0, 10}));

    auto full = plan_chunks(max_size, max_size - 1);
    ASSERT_TRUE(full.has_value());
    ASSERT_EQ(full.value().size(), 2u);
    EXPECT_EQ(full.value()[1], (part_range{2, max_size - 1, max_size}));
}

TEST_F(ChunkPlannerTest, Plan_TooManyPartsRejected) {
    auto parts = plan_chunks(3'000'000'000LL, 1);
    ASSERT_FALSE(parts.has_value());
    EXPECT_EQ(parts.error().code, error_code::invalid_input);
}

TEST_F(ChunkPlannerTest, TotalChunks_NoOverflow) {
    constexpr auto max_size = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(calculate_total_chunks(10, max_size), 1);
    EXPECT_EQ(calculate_total_chunks(max_size, max_size), 1);
    EXPECT_EQ(calculate_total_chunks(3'000'000'000LL, 1), 0);
    EXPECT_EQ(calculate_total_chunks(std::numeric_limits<int32_t>::max(), 1),
              std::numeric_limits<int32_t>::max());
}

TEST_F(ChunkPlannerTest, TotalChunks) {
    EXPECT_EQ(calculate_total_chunks(25'000'000, 8'000'000), 4);
    EXPECT_EQ(calculate_total_chunks(8'000'000, 8'000'000), 1);
    EXPECT_EQ(calculate_total_chunks(8'000'001, 8'000'000), 2);
    EXPECT_EQ(calculate_total_chunks(0, 1024), 0);
    EXPECT_EQ(calculate_total_chunks(100, 0), 0);
    EXPECT_EQ(calculate_total_chunks(-100, 1024), 0);
}

TEST_F(ChunkPlannerTest, OptimalChunkSize_SmallFileUsesConfigured) {
    EXPECT_EQ(optimal_chunk_size(50LL * 1024 * 1024), chunk_sizes::default_chunk_size);
    EXPECT_EQ(optimal_chunk_size(chunk_sizes::medium_file_threshold),
              chunk_sizes::default_chunk_size);
    EXPECT_EQ(optimal_chunk_size(1024, 4096), 4096);
}

TEST_F(ChunkPlannerTest, OptimalChunkSize_MediumFile) {
    EXPECT_EQ(optimal_chunk_size(chunk_sizes::medium_file_threshold + 1),
              chunk_sizes::medium_chunk_size);
    EXPECT_EQ(optimal_chunk_size(500LL * 1024 * 1024, 20LL * 1024 * 1024),
              20LL * 1024 * 1024);
}

TEST_F(ChunkPlannerTest, OptimalChunkSize_LargeFile) {
    EXPECT_EQ(optimal_chunk_size(chunk_sizes::large_file_threshold + 1),
              chunk_sizes::large_chunk_size);
    EXPECT_EQ(optimal_chunk_size(4LL * 1024 * 1024 * 1024, 64LL * 1024 * 1024),
              64LL * 1024 * 1024);
}

}  // namespace kcenon::resumable_upload::test
