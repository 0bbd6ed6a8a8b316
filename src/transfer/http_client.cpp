/**
 * @file http_client.cpp
 * @brief network_system-backed HTTP client
 */

#include "kcenon/resumable_upload/transfer/http_client.h"

#include <algorithm>
#include <cctype>

#include "kcenon/resumable_upload/config/feature_flags.h"
#include "kcenon/resumable_upload/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::resumable_upload {

// ============================================================================
// http_response / status mapping
// ============================================================================

auto http_response::get_header(const std::string& key) const
    -> std::optional<std::string> {
    auto it = headers.find(key);
    if (it != headers.end()) {
        return it->second;
    }

    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };

    auto lower_key = lower(key);
    for (const auto& [k, v] : headers) {
        if (lower(k) == lower_key) {
            return v;
        }
    }

    return std::nullopt;
}

auto error_code_for_status(int status_code) noexcept -> error_code {
    if (status_code >= 200 && status_code < 300) {
        return error_code::success;
    }
    switch (status_code) {
        case 404: return error_code::not_found;
        case 408: return error_code::request_timeout;
        case 409: return error_code::conflict;
        case 429: return error_code::rate_limited;
        default: break;
    }
    if (status_code >= 500 && status_code < 600) {
        return error_code::backend_unavailable;
    }
    return error_code::backend_rejected;
}

// ============================================================================
// Implementation
// ============================================================================

struct http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename Response>
    static auto to_result(Response&& response, const char* method,
                          const std::string& url) -> result<http_response> {
        if (response.is_err()) {
            RU_LOG_DEBUG(log_category::http,
                std::string("HTTP ") + method + " failed: " + url);
            return unexpected{error{error_code::network_error,
                std::string("HTTP ") + method + " request failed"}};
        }
        return convert_response(response.value());
    }
#endif
};

#if !KCENON_WITH_NETWORK_SYSTEM
namespace {

auto unavailable() -> unexpected {
    return unexpected{error{error_code::network_error,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
}

}  // namespace
#endif

// ============================================================================
// Constructor / Destructor
// ============================================================================

http_client::http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
auto http_client::operator=(http_client&&) noexcept -> http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto http_client::get(
    const std::string& url,
    const std::map<std::string, std::string>& query,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not initialized"}};
    }
    return impl::to_result(impl_->client->get(url, query, headers), "GET", url);
#else
    (void)url;
    (void)query;
    (void)headers;
    return unavailable();
#endif
}

auto http_client::post(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not initialized"}};
    }
    return impl::to_result(impl_->client->post(url, body, headers), "POST", url);
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable();
#endif
}

auto http_client::put(
    const std::string& url,
    const std::vector<uint8_t>& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not initialized"}};
    }
    std::string body_str(body.begin(), body.end());
    return impl::to_result(impl_->client->put(url, body_str, headers), "PUT", url);
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable();
#endif
}

auto http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client> {
    return std::make_shared<http_client>(timeout);
}

}  // namespace kcenon::resumable_upload
