/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and file path masking
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::resumable_upload::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_filenames);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_paths);
    EXPECT_TRUE(config.mask_filenames);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input = "Reading /home/user/videos/interview.mp4";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePath) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/home/user/videos/interview.mp4");

    // Directory masked, file name kept
    EXPECT_NE(result.find("interview.mp4"), std::string::npos);
    EXPECT_EQ(result.find("/home/"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePathWithFilename) {
    sensitive_info_masker masker(masking_config::all_masked());

    auto result = masker.mask_path("/home/user/videos/interview.mp4");

    EXPECT_NE(result.find("inte"), std::string::npos);
    EXPECT_NE(result.find(".mp4"), std::string::npos);
    EXPECT_EQ(result.find("interview"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, ShortFilenameKept) {
    sensitive_info_masker masker(masking_config::all_masked());
    EXPECT_EQ(masker.mask_filename("a.mp4"), "a.mp4");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask("cannot read /data/uploads/clip.mov: EIO");

    EXPECT_EQ(result.find("/data/uploads"), std::string::npos);
    EXPECT_NE(result.find("clip.mov"), std::string::npos);
    EXPECT_NE(result.find("cannot read"), std::string::npos);
}

// =============================================================================
// Upload Log Context Tests
// =============================================================================

class UploadLogContextTest : public ::testing::Test {};

TEST_F(UploadLogContextTest, EmptyContextToJson) {
    upload_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(UploadLogContextTest, FieldsToJson) {
    upload_log_context ctx;
    ctx.session_id = "abc";
    ctx.file_name = "clip.mp4";
    ctx.file_size = 4000;
    ctx.part_number = 2;
    ctx.total_parts = 4;
    ctx.attempt = 3;
    ctx.status = "uploading";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"session_id\":\"abc\""), std::string::npos);
    EXPECT_NE(json.find("\"file_name\":\"clip.mp4\""), std::string::npos);
    EXPECT_NE(json.find("\"file_size\":4000"), std::string::npos);
    EXPECT_NE(json.find("\"part_number\":2"), std::string::npos);
    EXPECT_NE(json.find("\"total_parts\":4"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":3"), std::string::npos);
    EXPECT_NE(json.find("\"status\":\"uploading\""), std::string::npos);
    EXPECT_EQ(json.find("bytes_uploaded"), std::string::npos);
}

TEST_F(UploadLogContextTest, ProgressPercentPrecision) {
    upload_log_context ctx;
    ctx.progress_percent = 33.3333;
    EXPECT_NE(ctx.to_json().find("\"progress_percent\":33.33"), std::string::npos);
}

TEST_F(UploadLogContextTest, JsonEscaping) {
    upload_log_context ctx;
    ctx.error_message = "bad \"etag\"\n";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("bad \\\"etag\\\"\\n"), std::string::npos);
}

TEST_F(UploadLogContextTest, JsonWithMasking) {
    sensitive_info_masker masker(masking_config::all_masked());
    upload_log_context ctx;
    ctx.file_name = "confidential.mp4";

    auto json = ctx.to_json(&masker);
    EXPECT_EQ(json.find("confidential"), std::string::npos);
    EXPECT_NE(json.find("conf"), std::string::npos);
}

// =============================================================================
// Upload Logger Tests
// =============================================================================

class UploadLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = get_logger().get_level();
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(previous_level_);
        get_logger().set_output_format(log_output_format::text);
        get_logger().set_masking_config(masking_config::none());
    }

    log_level previous_level_ = log_level::info;
};

TEST_F(UploadLoggerTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(UploadLoggerTest, CallbackReceivesRecord) {
    std::vector<std::string> messages;
    std::vector<std::string> categories;
    get_logger().set_callback(
        [&](log_level, std::string_view category, std::string_view message,
            const upload_log_context*) {
            categories.emplace_back(category);
            messages.emplace_back(message);
        });

    RU_LOG_INFO(log_category::coordinator, "status pending -> uploading");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "status pending -> uploading");
    EXPECT_EQ(categories[0], "resumable_upload.coordinator");
}

TEST_F(UploadLoggerTest, CallbackReceivesContext) {
    std::optional<int32_t> part;
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const upload_log_context* ctx) {
            if (ctx) {
                part = ctx->part_number;
            }
        });

    upload_log_context ctx;
    ctx.part_number = 5;
    RU_LOG_WARN_CTX(log_category::executor, "retrying", ctx);

    EXPECT_EQ(part, 5);
}

TEST_F(UploadLoggerTest, LevelFiltering) {
    int calls = 0;
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const upload_log_context*) {
            ++calls;
        });
    get_logger().set_level(log_level::warn);

    RU_LOG_DEBUG(log_category::store, "hidden");
    RU_LOG_INFO(log_category::store, "hidden");
    RU_LOG_WARN(log_category::store, "shown");
    RU_LOG_ERROR(log_category::store, "shown");

    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
}

TEST_F(UploadLoggerTest, OutputFormatAndMasking) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_masking_config(masking_config::all_masked());
    get_logger().set_level(log_level::fatal);
    // Filtered out, must not throw with masking enabled
    RU_LOG_INFO(log_category::manager, "reading /tmp/uploads/file.bin");
}

}  // namespace kcenon::resumable_upload::test
