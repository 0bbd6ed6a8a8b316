/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/resumable_upload/core/upload_session.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::resumable_upload::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<uint8_t>;

/**
 * @brief Build a session with the first uploaded_count parts confirmed
 *
 * Completion times are spread over the last minute so throughput has a
 * window to work with.
 */
auto make_session(int64_t file_size, int64_t chunk_size, int32_t uploaded_count)
    -> upload_session;

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Fresh empty directory under the base directory
     */
    auto create_directory(const std::string& name) -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_;
    bool owns_dir_ = false;
};

/**
 * @brief Format bytes as human-readable string (e.g., "1.50 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;
}  // namespace sizes

}  // namespace kcenon::resumable_upload::benchmark

#endif  // KCENON_RESUMABLE_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
