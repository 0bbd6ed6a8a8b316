/**
 * @file upload_config.cpp
 * @brief Engine configuration defaults and validation
 */

#include "kcenon/resumable_upload/engine/upload_config.h"

#include "kcenon/resumable_upload/storage/session_store.h"

namespace kcenon::resumable_upload {

upload_engine_config::upload_engine_config()
    : store_directory(session_store_config().directory) {}

auto upload_engine_config::validate() const -> result<void> {
    if (chunk_size <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "chunk_size must be positive"}};
    }
    if (max_concurrent_parts == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "max_concurrent_parts must be at least 1"}};
    }
    if (max_attempts == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "max_attempts must be at least 1"}};
    }
    if (requeue_budget < 0) {
        return unexpected{error{error_code::invalid_configuration,
            "requeue_budget must not be negative"}};
    }
    if (retry_base_delay.count() < 0 || retry_max_delay < retry_base_delay) {
        return unexpected{error{error_code::invalid_configuration,
            "retry delays must satisfy 0 <= base <= max"}};
    }
    if (request_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "request_timeout must be positive"}};
    }
    if (store_directory.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "store_directory must be set"}};
    }
    if (session_expiry.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "session_expiry must be positive"}};
    }
    return {};
}

}  // namespace kcenon::resumable_upload
