/**
 * @file test_transfer_executor.cpp
 * @brief Unit tests for retrying multipart operations
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/transfer/transfer_executor.h>

#include "test_fixtures.h"

namespace kcenon::resumable_upload::test {

class TransferExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<fake_upload_backend>();

        retry_policy policy;
        policy.max_attempts = 3;
        policy.initial_delay = std::chrono::milliseconds(0);
        policy.max_delay = std::chrono::milliseconds(0);
        policy.use_jitter = false;
        policy.sleeper = [](std::chrono::milliseconds) {};

        executor_ = std::make_unique<transfer_executor>(backend_,
                                                        executor_config::uniform(policy));
        session_ = upload_session("project-7", "uploads/clip.mp4", "clip.mp4",
                                  3000, "video/mp4", 1024);
    }

    auto initiate_target() -> upload_target {
        auto response = executor_->initiate(session_);
        EXPECT_TRUE(response.has_value());
        session_.remote_upload_id = response.value().upload_id;
        return transfer_executor::target_for(session_);
    }

    std::shared_ptr<fake_upload_backend> backend_;
    std::unique_ptr<transfer_executor> executor_;
    upload_session session_;
    std::vector<uint8_t> bytes_ = make_test_data(1024);
};

TEST_F(TransferExecutorTest, TargetForSession) {
    session_.remote_upload_id = "upload-9";
    auto target = transfer_executor::target_for(session_);
    EXPECT_EQ(target.upload_id, "upload-9");
    EXPECT_EQ(target.storage_key, "uploads/clip.mp4");
    EXPECT_EQ(target.project_id, "project-7");
}

TEST_F(TransferExecutorTest, Initiate_SendsSessionMetadata) {
    auto response = executor_->initiate(session_);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value().upload_id, "upload-1");

    auto request = backend_->last_initiate();
    EXPECT_EQ(request.project_id, "project-7");
    EXPECT_EQ(request.file_name, "clip.mp4");
    EXPECT_EQ(request.file_size, 3000);
    EXPECT_EQ(request.mime_type, "video/mp4");
}

TEST_F(TransferExecutorTest, Initiate_RetriesThenReportsInitFailure) {
    backend_->fail_initiate(error_code::backend_unavailable, 5);

    auto response = executor_->initiate(session_);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::upload_init_failed);
    EXPECT_EQ(backend_->initiate_calls(), 3);
}

TEST_F(TransferExecutorTest, Initiate_RejectedIsNotRetried) {
    backend_->fail_initiate(error_code::backend_rejected);

    auto response = executor_->initiate(session_);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::upload_init_failed);
    EXPECT_EQ(backend_->initiate_calls(), 1);
}

TEST_F(TransferExecutorTest, UploadPart_ReturnsReceipt) {
    auto target = initiate_target();

    auto receipt = executor_->upload_part(target, 1, bytes_);
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt.value().part_number, 1);
    EXPECT_EQ(receipt.value().size, 1024);
    EXPECT_EQ(receipt.value().etag, checksum::md5_hex(bytes_).value());
}

TEST_F(TransferExecutorTest, UploadPart_RequiresInitiatedTarget) {
    auto receipt = executor_->upload_part(upload_target{}, 1, bytes_);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::chunk_upload_failed);
    EXPECT_FALSE(receipt.error().retryable);
    EXPECT_EQ(backend_->upload_calls(), 0);
}

TEST_F(TransferExecutorTest, UploadPart_TransientFailureRecovers) {
    auto target = initiate_target();
    backend_->fail_part(2, error_code::request_timeout, 2);

    auto receipt = executor_->upload_part(target, 2, bytes_);
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(backend_->attempts(2), 3);
}

TEST_F(TransferExecutorTest, UploadPart_ExhaustedRetriesStayRetryable) {
    auto target = initiate_target();
    backend_->fail_part(2, error_code::network_error, 10);

    auto receipt = executor_->upload_part(target, 2, bytes_);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::chunk_upload_failed);
    EXPECT_EQ(receipt.error().part_number, 2);
    EXPECT_TRUE(receipt.error().retryable);
    EXPECT_EQ(backend_->attempts(2), 3);
}

TEST_F(TransferExecutorTest, UploadPart_RejectedIsFatal) {
    auto target = initiate_target();
    backend_->fail_part(3, error_code::backend_rejected);

    auto receipt = executor_->upload_part(target, 3, bytes_);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_FALSE(receipt.error().retryable);
    EXPECT_EQ(receipt.error().part_number, 3);
    EXPECT_EQ(backend_->attempts(3), 1);
}

TEST_F(TransferExecutorTest, UploadPart_DuplicateAdoptsListedReceipt) {
    auto target = initiate_target();
    auto first = executor_->upload_part(target, 1, bytes_);
    ASSERT_TRUE(first.has_value());

    backend_->fail_part(1, error_code::duplicate_part);
    auto again = executor_->upload_part(target, 1, bytes_);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value().etag, first.value().etag);
    EXPECT_EQ(backend_->list_calls(), 1);
}

TEST_F(TransferExecutorTest, UploadPart_DuplicateNotListedIsRetried) {
    auto target = initiate_target();
    backend_->fail_part(1, error_code::duplicate_part);

    auto receipt = executor_->upload_part(target, 1, bytes_);
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(backend_->attempts(1), 2);
}

TEST_F(TransferExecutorTest, ListParts_SortedAndDeduplicated) {
    auto target = initiate_target();
    ASSERT_TRUE(executor_->upload_part(target, 3, bytes_).has_value());
    ASSERT_TRUE(executor_->upload_part(target, 1, bytes_).has_value());

    auto listed = executor_->list_uploaded_parts(target);
    ASSERT_TRUE(listed.has_value());
    ASSERT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(listed.value()[0].part_number, 1);
    EXPECT_EQ(listed.value()[1].part_number, 3);
}

TEST_F(TransferExecutorTest, ListParts_RetriesTransientFailure) {
    auto target = initiate_target();
    backend_->fail_list(error_code::rate_limited);

    auto listed = executor_->list_uploaded_parts(target);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(backend_->list_calls(), 2);
}

TEST_F(TransferExecutorTest, Complete_SortsParts) {
    auto target = initiate_target();
    std::vector<completed_part> parts;
    for (int32_t n : {3, 1, 2}) {
        auto receipt = executor_->upload_part(target, n, bytes_);
        ASSERT_TRUE(receipt.has_value());
        parts.push_back(completed_part{n, receipt.value().etag});
    }

    ASSERT_TRUE(executor_->complete(target, parts).has_value());

    auto stored = backend_->upload(target.upload_id);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->completed);
    ASSERT_EQ(stored->completed_with.size(), 3u);
    EXPECT_EQ(stored->completed_with[0].part_number, 1);
    EXPECT_EQ(stored->completed_with[2].part_number, 3);
}

TEST_F(TransferExecutorTest, Complete_MissingPartReported) {
    auto target = initiate_target();
    auto result = executor_->complete(target, {completed_part{1, "nope"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::upload_complete_failed);
    EXPECT_NE(result.error().message.find("missing parts"), std::string::npos);
    EXPECT_EQ(backend_->complete_calls(), 1);
}

TEST_F(TransferExecutorTest, Complete_EtagMismatchReported) {
    auto target = initiate_target();
    ASSERT_TRUE(executor_->upload_part(target, 1, bytes_).has_value());

    auto result = executor_->complete(target, {completed_part{1, "wrong"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("etag mismatch"), std::string::npos);
}

TEST_F(TransferExecutorTest, Abort_MarksUploadAborted) {
    auto target = initiate_target();
    ASSERT_TRUE(executor_->abort(target).has_value());

    auto stored = backend_->upload(target.upload_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->aborted);
}

TEST_F(TransferExecutorTest, Abort_UnknownUploadIsAlreadyGone) {
    auto result = executor_->abort(upload_target{"upload-404", "k", "p"});
    EXPECT_TRUE(result.has_value());
}

TEST_F(TransferExecutorTest, Abort_WithoutRemoteUploadIsNoop) {
    EXPECT_TRUE(executor_->abort(upload_target{}).has_value());
    EXPECT_EQ(backend_->abort_calls(), 0);
}

TEST_F(TransferExecutorTest, Abort_FailureReported) {
    auto target = initiate_target();
    backend_->fail_abort(error_code::backend_rejected);

    auto result = executor_->abort(target);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::upload_cancel_failed);
}

TEST_F(TransferExecutorTest, NullBackend) {
    transfer_executor executor(nullptr, executor_config{});
    auto response = executor.initiate(session_);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::not_initialized);
}

}  // namespace kcenon::resumable_upload::test
