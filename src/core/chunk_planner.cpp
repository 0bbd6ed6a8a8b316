/**
 * @file chunk_planner.cpp
 * @brief Implementation of the multipart part layout
 */

#include <kcenon/resumable_upload/core/chunk_planner.h>

#include <algorithm>
#include <limits>
#include <string>

namespace kcenon::resumable_upload {

namespace {

// ceil(file_size / chunk_size) without forming file_size + chunk_size
auto part_count(int64_t file_size, int64_t chunk_size) noexcept -> int64_t {
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

}  // namespace

auto plan_chunks(int64_t file_size, int64_t chunk_size)
    -> result<std::vector<part_range>> {
    if (chunk_size <= 0) {
        return unexpected(error{error_code::invalid_input,
            "chunk size must be positive (got " + std::to_string(chunk_size) + ")"});
    }
    if (file_size < 0) {
        return unexpected(error{error_code::invalid_input,
            "file size must not be negative (got " + std::to_string(file_size) + ")"});
    }

    auto count = part_count(file_size, chunk_size);
    if (count > std::numeric_limits<int32_t>::max()) {
        return unexpected(error{error_code::invalid_input,
            "file of " + std::to_string(file_size) + " bytes needs " + std::to_string(count) +
            " parts of " + std::to_string(chunk_size) + " bytes, more than a plan can number"});
    }
    auto total = static_cast<int32_t>(count);

    std::vector<part_range> parts;
    parts.reserve(static_cast<std::size_t>(total));

    int64_t start = 0;
    for (int32_t index = 0; index < total; ++index) {
        int64_t end = start + std::min(chunk_size, file_size - start);
        parts.push_back(part_range{index + 1, start, end});
        start = end;
    }

    return parts;
}

auto calculate_total_chunks(int64_t file_size, int64_t chunk_size) noexcept -> int32_t {
    if (chunk_size <= 0 || file_size <= 0) return 0;
    auto count = part_count(file_size, chunk_size);
    if (count > std::numeric_limits<int32_t>::max()) return 0;
    return static_cast<int32_t>(count);
}

auto optimal_chunk_size(int64_t file_size, int64_t configured) noexcept -> int64_t {
    if (file_size > chunk_sizes::large_file_threshold) {
        return std::max(configured, chunk_sizes::large_chunk_size);
    }
    if (file_size > chunk_sizes::medium_file_threshold) {
        return std::max(configured, chunk_sizes::medium_chunk_size);
    }
    return configured;
}

}  // namespace kcenon::resumable_upload
