/**
 * @file types.h
 * @brief Core type definitions for resumable_upload
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_TYPES_H
#define KCENON_RESUMABLE_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::resumable_upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Input errors (-100 to -119)
    invalid_input = -100,
    invalid_configuration = -101,
    validation_error = -102,
    file_not_found = -103,
    file_read_error = -104,

    // Upload lifecycle errors (-120 to -139)
    upload_init_failed = -120,
    chunk_upload_failed = -121,
    upload_complete_failed = -122,
    upload_cancel_failed = -123,
    session_expired = -124,
    invalid_transition = -125,

    // Session store errors (-140 to -159)
    session_not_found = -140,
    store_read_error = -141,
    store_write_error = -142,
    store_corrupted = -143,

    // Network and backend errors (-160 to -179)
    network_error = -160,
    request_timeout = -161,
    rate_limited = -162,
    backend_unavailable = -163,
    backend_rejected = -164,
    duplicate_part = -165,
    conflict = -166,
    not_found = -167,
    etag_mismatch = -168,
    missing_parts = -169,
    invalid_response = -170,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_input:
            return "invalid input";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::validation_error:
            return "validation error";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::upload_init_failed:
            return "upload init failed";
        case error_code::chunk_upload_failed:
            return "chunk upload failed";
        case error_code::upload_complete_failed:
            return "upload complete failed";
        case error_code::upload_cancel_failed:
            return "upload cancel failed";
        case error_code::session_expired:
            return "session expired";
        case error_code::invalid_transition:
            return "invalid transition";
        case error_code::session_not_found:
            return "session not found";
        case error_code::store_read_error:
            return "store read error";
        case error_code::store_write_error:
            return "store write error";
        case error_code::store_corrupted:
            return "store corrupted";
        case error_code::network_error:
            return "network error";
        case error_code::request_timeout:
            return "request timeout";
        case error_code::rate_limited:
            return "rate limited";
        case error_code::backend_unavailable:
            return "backend unavailable";
        case error_code::backend_rejected:
            return "backend rejected";
        case error_code::duplicate_part:
            return "duplicate part";
        case error_code::conflict:
            return "conflict";
        case error_code::not_found:
            return "not found";
        case error_code::etag_mismatch:
            return "etag mismatch";
        case error_code::missing_parts:
            return "missing parts";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if an error code denotes a transient transport failure
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::network_error:
        case error_code::request_timeout:
        case error_code::rate_limited:
        case error_code::backend_unavailable:
        case error_code::conflict:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr auto is_input_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v > -120;
}

[[nodiscard]] constexpr auto is_lifecycle_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -120 && v > -140;
}

[[nodiscard]] constexpr auto is_store_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -140 && v > -160;
}

[[nodiscard]] constexpr auto is_network_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -160 && v > -180;
}

/**
 * @brief Error type with code, message and optional part context
 *
 * part_number and retryable are only meaningful for chunk_upload_failed.
 */
struct error {
    error_code code;
    std::string message;
    std::optional<int32_t> part_number;
    /// Session the error belongs to, when one was already created
    std::optional<std::string> session;
    bool retryable = false;

    error() : code(error_code::success) {}
    explicit error(error_code c)
        : code(c), message(to_string(c)), retryable(is_retryable(c)) {}
    error(error_code c, std::string msg)
        : code(c), message(std::move(msg)), retryable(is_retryable(c)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Create a ChunkUploadFailed error for one part
     */
    [[nodiscard]] static auto chunk_failed(int32_t part, bool can_retry,
                                           std::string msg) -> error {
        error e(error_code::chunk_upload_failed, std::move(msg));
        e.part_number = part;
        e.retryable = can_retry;
        return e;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_TYPES_H
