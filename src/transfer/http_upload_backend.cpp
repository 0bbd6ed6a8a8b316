/**
 * @file http_upload_backend.cpp
 * @brief JSON/HTTP implementation of upload_backend
 */

#include "kcenon/resumable_upload/transfer/http_upload_backend.h"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <unordered_map>

#include "kcenon/resumable_upload/core/checksum.h"
#include "kcenon/resumable_upload/core/json_utils.h"
#include "kcenon/resumable_upload/core/logging.h"

namespace kcenon::resumable_upload {

namespace {

auto trim_trailing_slash(std::string url) -> std::string {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

auto url_encode(const std::string& s) -> std::string {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

/**
 * @brief Unwrap the optional {"data": {...}} envelope
 */
auto payload_of(const json::value& root) -> const json::value& {
    if (const auto* data = root.find("data"); data != nullptr && data->is_object()) {
        return *data;
    }
    return root;
}

/**
 * @brief Build an error from a non-2xx response
 *
 * A machine-readable "code" in the body refines the status mapping.
 */
auto error_from_response(const http_response& response, const std::string& operation)
    -> error {
    auto code = error_code_for_status(response.status_code);
    std::string detail;

    auto parsed = json::parse(response.get_body_string());
    if (parsed.has_value() && parsed.value().is_object()) {
        const auto& body = parsed.value();
        if (auto msg = body.get_string("message")) {
            detail = *msg;
        } else if (auto err = body.get_string("error")) {
            detail = *err;
        }

        if (auto remote_code = body.get_string("code")) {
            if (*remote_code == "missing_parts" || *remote_code == "MissingParts") {
                code = error_code::missing_parts;
            } else if (*remote_code == "etag_mismatch" || *remote_code == "InvalidPart") {
                code = error_code::etag_mismatch;
            } else if (*remote_code == "duplicate_part" || *remote_code == "DuplicatePart") {
                code = error_code::duplicate_part;
            }
        }
    }

    std::ostringstream oss;
    oss << operation << " failed with HTTP " << response.status_code;
    if (!detail.empty()) {
        oss << ": " << detail;
    }
    return error{code, oss.str()};
}

auto target_body(const upload_target& target) -> std::string {
    std::ostringstream oss;
    oss << "{\"key\":" << json::quote(target.storage_key)
        << ",\"uploadId\":" << json::quote(target.upload_id) << "}";
    return oss.str();
}

}  // namespace

auto normalize_etag(const std::string& etag) -> std::string {
    std::string out;
    out.reserve(etag.size());
    std::copy_if(etag.begin(), etag.end(), std::back_inserter(out),
                 [](char c) { return c != '"'; });
    return out;
}

// ============================================================================
// Implementation
// ============================================================================

class http_upload_backend::impl {
public:
    impl(http_backend_config cfg, std::shared_ptr<http_client_interface> client)
        : config_(std::move(cfg)), client_(std::move(client)) {
        config_.base_url = trim_trailing_slash(config_.base_url);
    }

    auto endpoint(const std::string& name) const -> std::string {
        return config_.base_url + "/" + name;
    }

    auto json_headers() const -> std::map<std::string, std::string> {
        auto headers = config_.headers;
        headers["Content-Type"] = "application/json";
        headers["Accept"] = "application/json";
        return headers;
    }

    /**
     * @brief POST a JSON body and parse the JSON reply
     */
    auto post_json(const std::string& name, const std::string& body)
        -> result<json::value> {
        if (!client_) {
            return unexpected{error{error_code::not_initialized,
                "HTTP client not configured"}};
        }

        auto response = client_->post(endpoint(name), body, json_headers());
        if (!response.has_value()) {
            return unexpected{response.error()};
        }
        if (!response.value().is_success()) {
            return unexpected{error_from_response(response.value(), name)};
        }

        auto text = response.value().get_body_string();
        if (text.empty()) {
            return json::value{};
        }
        return json::parse(text);
    }

    void remember_urls(const std::string& upload_id, std::vector<std::string> urls) {
        if (urls.empty()) {
            return;
        }
        std::lock_guard lock(mutex_);
        part_urls_[upload_id] = std::move(urls);
    }

    void forget_urls(const std::string& upload_id) {
        std::lock_guard lock(mutex_);
        part_urls_.erase(upload_id);
    }

    auto cached_url(const std::string& upload_id, int32_t part_number) const
        -> std::optional<std::string> {
        std::lock_guard lock(mutex_);
        auto it = part_urls_.find(upload_id);
        if (it == part_urls_.end() || part_number < 1 ||
            static_cast<std::size_t>(part_number) > it->second.size()) {
            return std::nullopt;
        }
        const auto& url = it->second[static_cast<std::size_t>(part_number - 1)];
        if (url.empty()) {
            return std::nullopt;
        }
        return url;
    }

    /**
     * @brief Ask the API for fresh presigned URLs of an existing upload
     */
    void refresh_urls(const upload_target& target) {
        std::ostringstream body;
        body << "{\"projectId\":" << json::quote(target.project_id)
             << ",\"s3Key\":" << json::quote(target.storage_key) << "}";

        auto reply = post_json("get-upload-details", body.str());
        if (!reply.has_value()) {
            RU_LOG_DEBUG(log_category::http,
                "get-upload-details unavailable: " + reply.error().message);
            return;
        }

        remember_urls(target.upload_id, parse_urls(payload_of(reply.value())));
    }

    struct part_destination {
        std::string url;
        bool presigned = false;
    };

    auto part_url(const upload_target& target, int32_t part_number) -> part_destination {
        if (auto url = cached_url(target.upload_id, part_number)) {
            return {*url, true};
        }

        refresh_urls(target);
        if (auto url = cached_url(target.upload_id, part_number)) {
            return {*url, true};
        }

        return {endpoint("part") + "?uploadId=" + url_encode(target.upload_id) +
                    "&partNumber=" + std::to_string(part_number),
                false};
    }

    static auto parse_urls(const json::value& payload) -> std::vector<std::string> {
        std::vector<std::string> urls;
        if (const auto* list = payload.find("presignedUrls"); list != nullptr && list->is_array()) {
            urls.reserve(list->items().size());
            for (const auto& item : list->items()) {
                urls.push_back(item.as_string().value_or(""));
            }
        }
        return urls;
    }

    http_backend_config config_;
    std::shared_ptr<http_client_interface> client_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> part_urls_;
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

http_upload_backend::http_upload_backend(http_backend_config config,
                                         std::shared_ptr<http_client_interface> client)
    : impl_(std::make_unique<impl>(std::move(config), std::move(client))) {}

http_upload_backend::~http_upload_backend() = default;

auto http_upload_backend::config() const -> const http_backend_config& {
    return impl_->config_;
}

// ============================================================================
// Operations
// ============================================================================

auto http_upload_backend::initiate_upload(const initiate_request& request)
    -> result<initiate_response> {
    std::ostringstream body;
    body << "{\"fileName\":" << json::quote(request.file_name)
         << ",\"fileSize\":" << request.file_size
         << ",\"projectId\":" << json::quote(request.project_id)
         << ",\"storageKey\":" << json::quote(request.storage_key)
         << ",\"mimeType\":" << json::quote(request.mime_type) << "}";

    auto reply = impl_->post_json("initiate", body.str());
    if (!reply.has_value()) {
        return unexpected{reply.error()};
    }

    const auto& payload = payload_of(reply.value());
    auto upload_id = payload.get_string("uploadId");
    if (!upload_id || upload_id->empty()) {
        return unexpected{error{error_code::invalid_response,
            "initiate response has no uploadId"}};
    }

    initiate_response response;
    response.upload_id = *upload_id;
    if (auto key = payload.get_string("key"); key && !key->empty()) {
        response.storage_key = *key;
    }
    if (auto chunk = payload.get_int64("chunkSize"); chunk && *chunk > 0) {
        response.chunk_size = *chunk;
    }
    response.part_urls = impl::parse_urls(payload);

    impl_->remember_urls(response.upload_id, response.part_urls);

    RU_LOG_DEBUG(log_category::http,
        "Initiated upload " + response.upload_id + " with " +
        std::to_string(response.part_urls.size()) + " presigned URLs");

    return response;
}

auto http_upload_backend::upload_part(const upload_target& target,
                                      int32_t part_number,
                                      std::span<const uint8_t> bytes)
    -> result<part_receipt> {
    if (!impl_->client_) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not configured"}};
    }

    auto destination = impl_->part_url(target, part_number);

    // Presigned URLs carry their own auth; the API endpoint needs ours
    std::map<std::string, std::string> headers;
    if (!destination.presigned) {
        headers = impl_->config_.headers;
    }
    headers["Content-Type"] = "application/octet-stream";
    if (impl_->config_.send_content_md5) {
        auto md5 = checksum::md5_base64(bytes);
        if (!md5.has_value()) {
            return unexpected{md5.error()};
        }
        headers["Content-MD5"] = md5.value();
    }

    std::vector<uint8_t> body(bytes.begin(), bytes.end());

    auto response = impl_->client_->put(destination.url, body, headers);
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        auto err = error_from_response(response.value(),
            "upload part " + std::to_string(part_number));
        if (err.code == error_code::conflict) {
            err.code = error_code::duplicate_part;
            err.retryable = false;
        }
        return unexpected{err};
    }

    auto etag = response.value().get_header("ETag");
    if (!etag || normalize_etag(*etag).empty()) {
        return unexpected{error{error_code::invalid_response,
            "no ETag in response for part " + std::to_string(part_number)}};
    }

    part_receipt receipt;
    receipt.part_number = part_number;
    receipt.etag = normalize_etag(*etag);
    receipt.size = static_cast<int64_t>(bytes.size());
    return receipt;
}

auto http_upload_backend::list_parts(const upload_target& target)
    -> result<std::vector<part_receipt>> {
    auto reply = impl_->post_json("list-parts", target_body(target));
    if (!reply.has_value()) {
        return unexpected{reply.error()};
    }

    std::vector<part_receipt> parts;
    const auto& payload = payload_of(reply.value());
    const auto* list = payload.find("parts");
    if (list == nullptr || list->is_null()) {
        return parts;
    }
    if (!list->is_array()) {
        return unexpected{error{error_code::invalid_response,
            "list-parts response has malformed parts"}};
    }

    for (const auto& item : list->items()) {
        auto number = item.get_int64("partNumber");
        auto etag = item.get_string("etag");
        if (!number || !etag) {
            return unexpected{error{error_code::invalid_response,
                "list-parts entry missing partNumber or etag"}};
        }
        part_receipt receipt;
        receipt.part_number = static_cast<int32_t>(*number);
        receipt.etag = normalize_etag(*etag);
        receipt.size = item.get_int64("size").value_or(0);
        parts.push_back(std::move(receipt));
    }

    std::sort(parts.begin(), parts.end(),
              [](const part_receipt& a, const part_receipt& b) {
                  return a.part_number < b.part_number;
              });
    return parts;
}

auto http_upload_backend::complete_upload(const upload_target& target,
                                          const std::vector<completed_part>& parts)
    -> result<void> {
    std::ostringstream body;
    body << "{\"key\":" << json::quote(target.storage_key)
         << ",\"uploadId\":" << json::quote(target.upload_id)
         << ",\"parts\":[";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            body << ",";
        }
        body << "{\"partNumber\":" << parts[i].part_number
             << ",\"etag\":" << json::quote(parts[i].etag) << "}";
    }
    body << "]}";

    auto reply = impl_->post_json("complete", body.str());
    if (!reply.has_value()) {
        return unexpected{reply.error()};
    }

    impl_->forget_urls(target.upload_id);
    return {};
}

auto http_upload_backend::abort_upload(const upload_target& target) -> result<void> {
    auto reply = impl_->post_json("abort", target_body(target));
    if (!reply.has_value()) {
        return unexpected{reply.error()};
    }

    impl_->forget_urls(target.upload_id);
    return {};
}

}  // namespace kcenon::resumable_upload
