/**
 * @file http_client.h
 * @brief HTTP client abstraction used by the upload API backend
 *
 * The concrete client wraps the network_system HTTP client. Tests and
 * embedders can provide their own http_client_interface.
 */

#ifndef KCENON_RESUMABLE_UPLOAD_TRANSFER_HTTP_CLIENT_H
#define KCENON_RESUMABLE_UPLOAD_TRANSFER_HTTP_CLIENT_H

#include "kcenon/resumable_upload/core/types.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::resumable_upload {

// ============================================================================
// HTTP Response
// ============================================================================

/**
 * @brief HTTP response returned by http_client_interface
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string>;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const noexcept -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief Map a non-2xx HTTP status to an error code
 *
 * 408 request_timeout, 409 conflict, 429 rate_limited, 404 not_found,
 * 5xx backend_unavailable, any other status backend_rejected.
 */
[[nodiscard]] auto error_code_for_status(int status_code) noexcept -> error_code;

// ============================================================================
// HTTP Client Interface
// ============================================================================

/**
 * @brief HTTP operations needed by the upload API backend
 *
 * A transport failure (no response) is returned as an error. Any response,
 * including 4xx and 5xx, is returned as a value.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto get(
        const std::string& url,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief HTTP client backed by network_system
 *
 * When the library is built without network_system every request fails
 * with network_error and is_available() returns false.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class http_client : public http_client_interface {
public:
    /**
     * @brief Construct HTTP client with timeout
     * @param timeout Per-request timeout, independent of retry backoff
     */
    explicit http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~http_client() override;

    http_client(const http_client&) = delete;
    auto operator=(const http_client&) -> http_client& = delete;
    http_client(http_client&&) noexcept;
    auto operator=(http_client&&) noexcept -> http_client&;

    [[nodiscard]] auto get(
        const std::string& url,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network_system is linked in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create an HTTP client
 */
[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client>;

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_TRANSFER_HTTP_CLIENT_H
