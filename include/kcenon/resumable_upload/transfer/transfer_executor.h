/**
 * @file transfer_executor.h
 * @brief Backend operations with retry and upload-level error mapping
 */

#ifndef KCENON_RESUMABLE_UPLOAD_TRANSFER_TRANSFER_EXECUTOR_H
#define KCENON_RESUMABLE_UPLOAD_TRANSFER_TRANSFER_EXECUTOR_H

#include <kcenon/resumable_upload/core/upload_session.h>
#include <kcenon/resumable_upload/transfer/retry_policy.h>
#include <kcenon/resumable_upload/transfer/upload_backend.h>

#include <memory>
#include <span>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Retry policies per backend operation
 */
struct executor_config {
    retry_policy initiate_retry;
    retry_policy part_retry;
    retry_policy list_retry;
    retry_policy complete_retry;
    retry_policy abort_retry;

    /**
     * @brief Apply the same policy to every operation
     */
    [[nodiscard]] static auto uniform(const retry_policy& policy) -> executor_config {
        return executor_config{policy, policy, policy, policy, policy};
    }
};

/**
 * @brief Issues multipart-upload calls against an upload_backend
 *
 * Every operation is retried according to its policy and the final failure
 * is mapped onto the upload error taxonomy:
 * - initiate          -> upload_init_failed
 * - upload_part       -> chunk_upload_failed{part_number, retryable}
 * - complete          -> upload_complete_failed
 * - list_uploaded_parts keeps the transport code
 * - abort             -> upload_cancel_failed, except "already gone"
 *
 * The executor holds no per-session state and may be shared by sessions.
 */
class transfer_executor {
public:
    transfer_executor(std::shared_ptr<upload_backend> backend, executor_config config);

    /**
     * @brief Addressing information for a session's remote upload
     */
    [[nodiscard]] static auto target_for(const upload_session& session) -> upload_target;

    /**
     * @brief Start a multipart upload for a session
     */
    [[nodiscard]] auto initiate(const upload_session& session) -> result<initiate_response>;

    /**
     * @brief Upload one part
     *
     * A duplicate-part rejection is resolved by listing the remote parts; if
     * the part is present it is reported as uploaded.
     */
    [[nodiscard]] auto upload_part(const upload_target& target,
                                   int32_t part_number,
                                   std::span<const uint8_t> bytes) -> result<part_receipt>;

    /**
     * @brief Parts the backend already holds, sorted by part number
     */
    [[nodiscard]] auto list_uploaded_parts(const upload_target& target)
        -> result<std::vector<part_receipt>>;

    /**
     * @brief Complete the upload with parts sorted ascending by part number
     */
    [[nodiscard]] auto complete(const upload_target& target,
                                std::vector<completed_part> parts) -> result<void>;

    /**
     * @brief Abort the remote upload, best effort
     *
     * An upload the backend no longer knows about counts as aborted.
     */
    [[nodiscard]] auto abort(const upload_target& target) -> result<void>;

    [[nodiscard]] auto config() const -> const executor_config&;

private:
    std::shared_ptr<upload_backend> backend_;
    executor_config config_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_TRANSFER_TRANSFER_EXECUTOR_H
