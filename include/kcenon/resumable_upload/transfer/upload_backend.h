/**
 * @file upload_backend.h
 * @brief Interface to the remote multipart-upload API
 */

#ifndef KCENON_RESUMABLE_UPLOAD_TRANSFER_UPLOAD_BACKEND_H
#define KCENON_RESUMABLE_UPLOAD_TRANSFER_UPLOAD_BACKEND_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Parameters of initiate-upload
 */
struct initiate_request {
    std::string project_id;
    std::string storage_key;
    std::string file_name;
    int64_t file_size = 0;
    std::string mime_type;
};

/**
 * @brief Result of initiate-upload
 */
struct initiate_response {
    std::string upload_id;

    /// Object key chosen by the backend, when it differs from the request
    std::optional<std::string> storage_key;

    /// Part size the backend wants; the session is re-planned with it
    std::optional<int64_t> chunk_size;

    /// Presigned URL per part, index 0 is part 1
    std::vector<std::string> part_urls;
};

/**
 * @brief Addresses one initiated multipart upload
 */
struct upload_target {
    std::string upload_id;
    std::string storage_key;
    std::string project_id;
};

/**
 * @brief A part as acknowledged or listed by the backend
 */
struct part_receipt {
    int32_t part_number = 0;
    std::string etag;
    int64_t size = 0;
};

/**
 * @brief Part reference sent with complete-upload
 */
struct completed_part {
    int32_t part_number = 0;
    std::string etag;
};

/**
 * @brief Remote multipart-upload API
 *
 * Implementations perform a single attempt per call and report failures
 * with transport-level codes (network_error, request_timeout, rate_limited,
 * backend_unavailable, backend_rejected, conflict, not_found,
 * duplicate_part, etag_mismatch, missing_parts). Retries and mapping onto
 * the upload error taxonomy are done by transfer_executor.
 *
 * All methods may be called concurrently.
 */
class upload_backend {
public:
    virtual ~upload_backend() = default;

    [[nodiscard]] virtual auto initiate_upload(const initiate_request& request)
        -> result<initiate_response> = 0;

    [[nodiscard]] virtual auto upload_part(const upload_target& target,
                                           int32_t part_number,
                                           std::span<const uint8_t> bytes)
        -> result<part_receipt> = 0;

    [[nodiscard]] virtual auto list_parts(const upload_target& target)
        -> result<std::vector<part_receipt>> = 0;

    [[nodiscard]] virtual auto complete_upload(const upload_target& target,
                                               const std::vector<completed_part>& parts)
        -> result<void> = 0;

    [[nodiscard]] virtual auto abort_upload(const upload_target& target)
        -> result<void> = 0;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_TRANSFER_UPLOAD_BACKEND_H
