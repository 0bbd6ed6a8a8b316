/**
 * @file test_upload_source.cpp
 * @brief Unit tests for file and memory upload sources
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/upload_source.h>

#include <filesystem>
#include <fstream>
#include <numeric>
#include <random>

namespace kcenon::resumable_upload::test {

class UploadSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("upload_source_test_" + std::to_string(rd()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::string& name, const std::vector<uint8_t>& data)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        return path;
    }

    static auto sequence(std::size_t size) -> std::vector<uint8_t> {
        std::vector<uint8_t> data(size);
        std::iota(data.begin(), data.end(), static_cast<uint8_t>(0));
        return data;
    }

    std::filesystem::path test_dir_;
};

// Memory source

TEST_F(UploadSourceTest, Memory_Metadata) {
    memory_upload_source source("lecture.mp4", sequence(1000));
    EXPECT_EQ(source.name(), "lecture.mp4");
    EXPECT_EQ(source.size(), 1000);
    EXPECT_EQ(source.mime_type(), "video/mp4");
}

TEST_F(UploadSourceTest, Memory_ExplicitMimeType) {
    memory_upload_source source("lecture.mp4", sequence(10), "application/x-custom");
    EXPECT_EQ(source.mime_type(), "application/x-custom");
}

TEST_F(UploadSourceTest, Memory_ReadRange) {
    auto data = sequence(256);
    memory_upload_source source("data.bin", data);

    auto slice = source.read(100, 50);
    ASSERT_TRUE(slice.has_value());
    ASSERT_EQ(slice.value().size(), 50u);
    EXPECT_EQ(slice.value().front(), 100);
    EXPECT_EQ(slice.value().back(), 149);

    auto empty = source.read(256, 0);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(UploadSourceTest, Memory_ReadOutOfRange) {
    memory_upload_source source("data.bin", sequence(100));

    for (auto [offset, length] : {std::pair<int64_t, int64_t>{90, 20}, {-1, 10}, {0, -1}}) {
        auto result = source.read(offset, length);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, error_code::invalid_input);
    }
}

// File source

TEST_F(UploadSourceTest, File_OpenAndRead) {
    auto data = sequence(4096);
    auto path = write_file("take1.mov", data);

    auto source = file_upload_source::open(path);
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source.value()->name(), "take1.mov");
    EXPECT_EQ(source.value()->size(), 4096);
    EXPECT_EQ(source.value()->mime_type(), "video/quicktime");
    EXPECT_EQ(source.value()->path(), path);

    auto slice = source.value()->read(4000, 96);
    ASSERT_TRUE(slice.has_value());
    EXPECT_EQ(slice.value(), std::vector<uint8_t>(data.begin() + 4000, data.end()));
}

TEST_F(UploadSourceTest, File_MissingFile) {
    auto source = file_upload_source::open(test_dir_ / "absent.mp4");
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_not_found);
}

TEST_F(UploadSourceTest, File_DirectoryIsNotASource) {
    auto source = file_upload_source::open(test_dir_);
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_not_found);
}

TEST_F(UploadSourceTest, File_ReadPastEnd) {
    auto path = write_file("short.bin", sequence(10));
    auto source = file_upload_source::open(path);
    ASSERT_TRUE(source.has_value());

    auto result = source.value()->read(5, 10);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_input);
}

TEST_F(UploadSourceTest, File_TruncatedAfterOpen) {
    auto path = write_file("shrinking.bin", sequence(1000));
    auto source = file_upload_source::open(path);
    ASSERT_TRUE(source.has_value());

    std::filesystem::resize_file(path, 100);

    auto result = source.value()->read(500, 100);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_read_error);
}

// MIME lookup

TEST_F(UploadSourceTest, MimeTypeFromName) {
    EXPECT_EQ(mime_type_from_name("a.MP4"), "video/mp4");
    EXPECT_EQ(mime_type_from_name("song.mp3"), "audio/mpeg");
    EXPECT_EQ(mime_type_from_name("notes.txt"), "text/plain");
    EXPECT_EQ(mime_type_from_name("archive.tar.xyz"), "application/octet-stream");
    EXPECT_EQ(mime_type_from_name("README"), "application/octet-stream");
    EXPECT_EQ(mime_type_from_name("trailing."), "application/octet-stream");
}

}  // namespace kcenon::resumable_upload::test
