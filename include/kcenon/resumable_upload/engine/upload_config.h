/**
 * @file upload_config.h
 * @brief Configuration of the upload engine
 */

#ifndef KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_CONFIG_H
#define KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_CONFIG_H

#include <kcenon/resumable_upload/core/chunk_planner.h>
#include <kcenon/resumable_upload/core/types.h>
#include <kcenon/resumable_upload/engine/event_channel.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Engine-wide settings
 *
 * Defaults: 8 MiB parts, 3 parts in flight per session, 3 attempts per
 * backend call with 1 s base delay, 30 s request timeout, 24 h expiry.
 */
struct upload_engine_config {
    // Planning
    int64_t chunk_size = chunk_sizes::default_chunk_size;
    bool adaptive_chunk_size = false;

    // Scheduling
    std::size_t max_concurrent_parts = 3;
    int32_t requeue_budget = 3;
    std::size_t worker_count = 0;  // 0 = hardware concurrency

    // Retry and timeout
    std::size_t max_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_max_delay{10000};
    bool retry_jitter = true;
    std::chrono::milliseconds request_timeout{30000};

    // Sessions
    std::filesystem::path store_directory;
    std::chrono::seconds session_expiry{24 * 60 * 60};

    // Progress and events
    std::chrono::milliseconds throughput_window{30000};
    delivery_mode events = delivery_mode::background;

    // HTTP backend
    std::string api_base_url;
    std::map<std::string, std::string> api_headers;
    bool send_content_md5 = true;

    upload_engine_config();

    /**
     * @brief Check the settings
     * @return invalid_configuration describing the first bad setting
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_CONFIG_H
