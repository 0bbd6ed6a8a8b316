/**
 * @file resumable_upload.h
 * @brief Main header for the resumable_upload library
 * @version 0.1.0
 *
 * Include this header to access the whole upload engine.
 *
 * @code
 * #include <kcenon/resumable_upload/resumable_upload.h>
 *
 * using namespace kcenon::resumable_upload;
 *
 * auto manager = upload_manager::builder()
 *     .with_api_base_url("https://api.example.com/upload")
 *     .build();
 *
 * auto source = file_upload_source::open("/path/to/video.mp4");
 * auto id = manager.value().start(source.value(), "project-1", "videos/video.mp4");
 * @endcode
 */

#ifndef KCENON_RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H
#define KCENON_RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/resumable_upload/core/types.h"
#include "kcenon/resumable_upload/core/session_id.h"
#include "kcenon/resumable_upload/core/chunk_planner.h"
#include "kcenon/resumable_upload/core/upload_session.h"
#include "kcenon/resumable_upload/core/upload_source.h"
#include "kcenon/resumable_upload/core/checksum.h"

// Storage
#include "kcenon/resumable_upload/storage/session_store.h"

// Transfer
#include "kcenon/resumable_upload/transfer/upload_backend.h"
#include "kcenon/resumable_upload/transfer/http_client.h"
#include "kcenon/resumable_upload/transfer/http_upload_backend.h"
#include "kcenon/resumable_upload/transfer/retry_policy.h"
#include "kcenon/resumable_upload/transfer/transfer_executor.h"

// Adapters
#include "kcenon/resumable_upload/adapters/task_pool_adapter.h"

// Engine
#include "kcenon/resumable_upload/engine/upload_events.h"
#include "kcenon/resumable_upload/engine/event_channel.h"
#include "kcenon/resumable_upload/engine/progress_reporter.h"
#include "kcenon/resumable_upload/engine/upload_config.h"
#include "kcenon/resumable_upload/engine/upload_coordinator.h"
#include "kcenon/resumable_upload/engine/upload_manager.h"

namespace kcenon::resumable_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H
