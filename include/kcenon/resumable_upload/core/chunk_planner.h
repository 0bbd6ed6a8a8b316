/**
 * @file chunk_planner.h
 * @brief Splits a file size into the ordered byte ranges of a multipart upload
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_PLANNER_H
#define KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_PLANNER_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief One part of a multipart upload
 *
 * Covers the half-open byte range [start_byte, end_byte).
 */
struct part_range {
    int32_t part_number = 0;
    int64_t start_byte = 0;
    int64_t end_byte = 0;

    [[nodiscard]] auto size() const noexcept -> int64_t {
        return end_byte - start_byte;
    }

    [[nodiscard]] auto operator==(const part_range& other) const -> bool = default;
};

/**
 * @brief Part size defaults and size classes
 */
struct chunk_sizes {
    /// Default part size (8MB)
    static constexpr int64_t default_chunk_size = 8LL * 1024 * 1024;

    /// Part size used for files larger than medium_file_threshold (16MB)
    static constexpr int64_t medium_chunk_size = 16LL * 1024 * 1024;

    /// Part size used for files larger than large_file_threshold (32MB)
    static constexpr int64_t large_chunk_size = 32LL * 1024 * 1024;

    static constexpr int64_t medium_file_threshold = 100LL * 1024 * 1024;
    static constexpr int64_t large_file_threshold = 1024LL * 1024 * 1024;
};

/**
 * @brief Compute the part layout for a file
 *
 * Parts are numbered from 1, contiguous and non-overlapping, and together
 * cover [0, file_size). Only the last part may be shorter than chunk_size.
 * A zero-byte file yields an empty plan. The result depends only on the
 * arguments, so a session reloaded from storage re-plans identically.
 *
 * @param file_size Total size in bytes
 * @param chunk_size Part size in bytes
 * @return Ordered parts, or invalid_input if chunk_size <= 0, file_size < 0
 *         or the part count does not fit int32_t
 */
[[nodiscard]] auto plan_chunks(int64_t file_size, int64_t chunk_size)
    -> result<std::vector<part_range>>;

/**
 * @brief Number of parts needed, ceil(file_size / chunk_size)
 *
 * Returns 0 when either argument is out of range or the count does not fit
 * int32_t.
 */
[[nodiscard]] auto calculate_total_chunks(int64_t file_size, int64_t chunk_size) noexcept
    -> int32_t;

/**
 * @brief Pick a larger part size for large files
 *
 * Keeps the part count of multi-gigabyte uploads bounded. Files up to
 * 100MB keep the configured size.
 */
[[nodiscard]] auto optimal_chunk_size(int64_t file_size,
                                      int64_t configured = chunk_sizes::default_chunk_size) noexcept
    -> int64_t;

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_CHUNK_PLANNER_H
