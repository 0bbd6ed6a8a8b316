/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result and session_id
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/session_id.h>
#include <kcenon/resumable_upload/core/types.h>

#include <set>
#include <string>
#include <unordered_set>

namespace kcenon::resumable_upload::test {

// =============================================================================
// Error code tests
// =============================================================================

class UploadErrorCodeTest : public ::testing::Test {};

TEST_F(UploadErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::success), 0);
    EXPECT_EQ(static_cast<int>(error_code::invalid_input), -100);
    EXPECT_EQ(static_cast<int>(error_code::upload_init_failed), -120);
    EXPECT_EQ(static_cast<int>(error_code::session_not_found), -140);
    EXPECT_EQ(static_cast<int>(error_code::network_error), -160);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(UploadErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::chunk_upload_failed), "chunk upload failed");
    EXPECT_STREQ(to_string(error_code::invalid_transition), "invalid transition");
    EXPECT_STREQ(to_string(error_code::session_expired), "session expired");
}

TEST_F(UploadErrorCodeTest, Categories) {
    EXPECT_TRUE(is_input_error(error_code::validation_error));
    EXPECT_FALSE(is_input_error(error_code::upload_init_failed));

    EXPECT_TRUE(is_lifecycle_error(error_code::upload_complete_failed));
    EXPECT_TRUE(is_lifecycle_error(error_code::invalid_transition));
    EXPECT_FALSE(is_lifecycle_error(error_code::store_corrupted));

    EXPECT_TRUE(is_store_error(error_code::store_write_error));
    EXPECT_FALSE(is_store_error(error_code::network_error));

    EXPECT_TRUE(is_network_error(error_code::rate_limited));
    EXPECT_TRUE(is_network_error(error_code::invalid_response));
    EXPECT_FALSE(is_network_error(error_code::internal_error));
}

TEST_F(UploadErrorCodeTest, IsRetryable) {
    EXPECT_TRUE(is_retryable(error_code::network_error));
    EXPECT_TRUE(is_retryable(error_code::request_timeout));
    EXPECT_TRUE(is_retryable(error_code::rate_limited));
    EXPECT_TRUE(is_retryable(error_code::backend_unavailable));
    EXPECT_TRUE(is_retryable(error_code::conflict));

    EXPECT_FALSE(is_retryable(error_code::backend_rejected));
    EXPECT_FALSE(is_retryable(error_code::not_found));
    EXPECT_FALSE(is_retryable(error_code::duplicate_part));
    EXPECT_FALSE(is_retryable(error_code::invalid_input));
    EXPECT_FALSE(is_retryable(error_code::upload_init_failed));
}

// =============================================================================
// Error and result tests
// =============================================================================

class UploadErrorTest : public ::testing::Test {};

TEST_F(UploadErrorTest, DefaultIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(UploadErrorTest, CodeOnlyUsesDefaultMessage) {
    error err(error_code::request_timeout);
    EXPECT_EQ(err.message, "request timeout");
    EXPECT_TRUE(err.retryable);
    EXPECT_TRUE(static_cast<bool>(err));
}

TEST_F(UploadErrorTest, ChunkFailedCarriesPart) {
    auto err = error::chunk_failed(7, true, "socket closed");
    EXPECT_EQ(err.code, error_code::chunk_upload_failed);
    EXPECT_EQ(err.part_number, 7);
    EXPECT_TRUE(err.retryable);
    EXPECT_EQ(err.message, "socket closed");

    auto fatal = error::chunk_failed(2, false, "rejected");
    EXPECT_FALSE(fatal.retryable);
}

TEST_F(UploadErrorTest, ResultHoldsValue) {
    result<int> r(42);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(UploadErrorTest, ResultHoldsError) {
    result<int> r(unexpected{error{error_code::not_found, "gone"}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::not_found);
    EXPECT_EQ(r.error().message, "gone");
}

TEST_F(UploadErrorTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed(unexpected{error{error_code::internal_error}});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::internal_error);
}

// =============================================================================
// Session id tests
// =============================================================================

class SessionIdTest : public ::testing::Test {};

TEST_F(SessionIdTest, DefaultConstructionIsNull) {
    session_id id;
    EXPECT_TRUE(id.is_null());
}

TEST_F(SessionIdTest, GenerateIsNotNull) {
    auto id = session_id::generate();
    EXPECT_FALSE(id.is_null());

    // RFC 4122 version 4
    EXPECT_EQ(id.bytes[6] & 0xF0, 0x40);
    EXPECT_EQ(id.bytes[8] & 0xC0, 0x80);
}

TEST_F(SessionIdTest, GenerateUniqueness) {
    std::set<session_id> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(session_id::generate());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(SessionIdTest, ToStringFormat) {
    auto str = session_id::generate().to_string();
    ASSERT_EQ(str.size(), 36u);
    EXPECT_EQ(str[8], '-');
    EXPECT_EQ(str[13], '-');
    EXPECT_EQ(str[18], '-');
    EXPECT_EQ(str[23], '-');
}

TEST_F(SessionIdTest, FromStringRoundTrip) {
    auto id = session_id::generate();
    auto parsed = session_id::from_string(id.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST_F(SessionIdTest, FromStringWithoutDashes) {
    auto parsed = session_id::from_string("0123456789abcdef0123456789ABCDEF");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->bytes[0], 0x01);
    EXPECT_EQ(parsed->bytes[15], 0xEF);
}

TEST_F(SessionIdTest, FromStringInvalid) {
    EXPECT_FALSE(session_id::from_string("").has_value());
    EXPECT_FALSE(session_id::from_string("not-a-uuid").has_value());
    EXPECT_FALSE(session_id::from_string("0123456789abcdef0123456789abcdeg").has_value());
    EXPECT_FALSE(session_id::from_string("0123456789abcdef").has_value());
}

TEST_F(SessionIdTest, UseInUnorderedSet) {
    std::unordered_set<session_id> ids;
    auto a = session_id::generate();
    auto b = session_id::generate();
    ids.insert(a);
    ids.insert(b);
    ids.insert(a);
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_TRUE(ids.count(b) > 0);
}

}  // namespace kcenon::resumable_upload::test
