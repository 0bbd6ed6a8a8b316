/**
 * @file upload_session.h
 * @brief Upload session record and its status state machine
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_SESSION_H
#define KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_SESSION_H

#include <kcenon/resumable_upload/core/session_id.h>
#include <kcenon/resumable_upload/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Lifecycle status of an upload session
 *
 * pending -> uploading <-> paused, uploading -> completed, and any
 * non-terminal status -> failed or cancelled.
 */
enum class upload_status {
    pending,
    uploading,
    paused,
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr auto to_string(upload_status status) noexcept -> const char* {
    switch (status) {
        case upload_status::pending: return "pending";
        case upload_status::uploading: return "uploading";
        case upload_status::paused: return "paused";
        case upload_status::completed: return "completed";
        case upload_status::failed: return "failed";
        case upload_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Parse a status name written by to_string()
 */
[[nodiscard]] auto upload_status_from_string(const std::string& name)
    -> std::optional<upload_status>;

[[nodiscard]] constexpr auto is_terminal(upload_status status) noexcept -> bool {
    return status == upload_status::completed ||
           status == upload_status::failed ||
           status == upload_status::cancelled;
}

/**
 * @brief Check if a status change is allowed
 *
 * Re-asserting the current status of a non-terminal session is allowed so
 * that part progress can be merged without a transition.
 */
[[nodiscard]] constexpr auto can_transition(upload_status from, upload_status to) noexcept
    -> bool {
    if (is_terminal(from)) {
        return false;
    }
    if (from == to) {
        return true;
    }
    if (to == upload_status::failed || to == upload_status::cancelled) {
        return true;
    }

    switch (from) {
        case upload_status::pending:
            return to == upload_status::uploading;
        case upload_status::uploading:
            return to == upload_status::paused || to == upload_status::completed;
        case upload_status::paused:
            return to == upload_status::uploading;
        default:
            return false;
    }
}

/**
 * @brief A part confirmed by the backend
 */
struct uploaded_part {
    int32_t part_number = 0;
    std::string etag;
    int64_t size = 0;
    std::chrono::system_clock::time_point completed_at;

    [[nodiscard]] auto matches(const uploaded_part& other) const -> bool {
        return part_number == other.part_number && etag == other.etag &&
               size == other.size;
    }
};

/**
 * @brief One upload attempt for one file
 */
struct upload_session {
    session_id id;
    std::string project_id;
    std::string storage_key;
    std::string file_name;
    int64_t file_size = 0;
    std::string mime_type;
    int64_t chunk_size = 0;
    int32_t total_chunks = 0;
    upload_status status = upload_status::pending;

    /// Confirmed parts, at most one entry per part number
    std::vector<uploaded_part> parts;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point last_activity;

    /// Set once the backend has initiated the multipart upload
    std::optional<std::string> remote_upload_id;

    /// Last observed error, cleared when the failing operation succeeds
    std::optional<std::string> error;
    std::optional<int32_t> error_part;

    upload_session() = default;

    /**
     * @brief Create a pending session for a file
     *
     * Generates a new id and derives total_chunks from the sizes.
     */
    upload_session(std::string project, std::string key, std::string name,
                   int64_t size, std::string mime, int64_t part_size);

    [[nodiscard]] auto has_part(int32_t part_number) const -> bool;
    [[nodiscard]] auto find_part(int32_t part_number) const -> const uploaded_part*;
    [[nodiscard]] auto uploaded_count() const -> int32_t;
    [[nodiscard]] auto uploaded_bytes() const -> int64_t;

    /**
     * @brief Part numbers in 1..total_chunks not yet confirmed, ascending
     */
    [[nodiscard]] auto missing_parts() const -> std::vector<int32_t>;

    [[nodiscard]] auto is_complete() const -> bool {
        return total_chunks == uploaded_count() && missing_parts().empty();
    }
};

/**
 * @brief Merge patch applied by session_store::update
 *
 * Unset fields leave the stored value untouched.
 */
struct session_patch {
    std::optional<upload_status> status;

    /// Rejected if the stored session already has a different id
    std::optional<std::string> remote_upload_id;
    std::optional<std::string> storage_key;

    /// Re-plan before any part is uploaded (backend-selected part size)
    std::optional<int64_t> chunk_size;

    /// Parts to add or replace by part number
    std::vector<uploaded_part> add_parts;

    /// Replaces the whole part set (resume reconciliation)
    std::optional<std::vector<uploaded_part>> replace_parts;

    std::optional<std::string> error;
    std::optional<int32_t> error_part;
    bool clear_error = false;

    [[nodiscard]] static auto with_status(upload_status s) -> session_patch {
        session_patch patch;
        patch.status = s;
        return patch;
    }
};

/**
 * @brief Apply a patch to a session in memory
 *
 * Enforces the status state machine, remote id immutability, part number
 * bounds and uniqueness. Refreshes last_activity on success.
 *
 * @return invalid_transition for a disallowed status change or an attempt
 *         to modify a terminal session, invalid_input for bad part data
 */
[[nodiscard]] auto apply_patch(upload_session& session, const session_patch& patch)
    -> result<void>;

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_SESSION_H
