/**
 * @file http_upload_backend.h
 * @brief upload_backend speaking the JSON multipart-upload API over HTTP
 */

#ifndef KCENON_RESUMABLE_UPLOAD_TRANSFER_HTTP_UPLOAD_BACKEND_H
#define KCENON_RESUMABLE_UPLOAD_TRANSFER_HTTP_UPLOAD_BACKEND_H

#include <kcenon/resumable_upload/transfer/http_client.h>
#include <kcenon/resumable_upload/transfer/upload_backend.h>

#include <map>
#include <memory>
#include <string>

namespace kcenon::resumable_upload {

/**
 * @brief Configuration for http_upload_backend
 */
struct http_backend_config {
    /// API base URL, e.g. "https://api.example.com/upload"
    std::string base_url;

    /// Extra headers sent with every API request (authorization, cookies)
    std::map<std::string, std::string> headers;

    /// Send a Content-MD5 header with each part
    bool send_content_md5 = true;
};

/**
 * @brief HTTP implementation of upload_backend
 *
 * Endpoints, relative to base_url:
 * - POST initiate         {fileName, fileSize, projectId, storageKey, mimeType}
 * - PUT  <presigned url>  part bytes, ETag response header
 * - POST list-parts       {key, uploadId}
 * - POST complete         {key, uploadId, parts[{partNumber, etag}]}
 * - POST abort            {key, uploadId}
 * - POST get-upload-details {projectId, s3Key}, to refresh presigned URLs
 *
 * Presigned part URLs returned by initiate are cached per upload id. When
 * no URL is known for a part (for example after a process restart) the
 * backend asks get-upload-details; if that yields nothing it falls back to
 * PUT {base}/part?uploadId=..&partNumber=..
 */
class http_upload_backend : public upload_backend {
public:
    http_upload_backend(http_backend_config config,
                        std::shared_ptr<http_client_interface> client);
    ~http_upload_backend() override;

    http_upload_backend(const http_upload_backend&) = delete;
    auto operator=(const http_upload_backend&) -> http_upload_backend& = delete;

    [[nodiscard]] auto initiate_upload(const initiate_request& request)
        -> result<initiate_response> override;

    [[nodiscard]] auto upload_part(const upload_target& target,
                                   int32_t part_number,
                                   std::span<const uint8_t> bytes)
        -> result<part_receipt> override;

    [[nodiscard]] auto list_parts(const upload_target& target)
        -> result<std::vector<part_receipt>> override;

    [[nodiscard]] auto complete_upload(const upload_target& target,
                                       const std::vector<completed_part>& parts)
        -> result<void> override;

    [[nodiscard]] auto abort_upload(const upload_target& target)
        -> result<void> override;

    [[nodiscard]] auto config() const -> const http_backend_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Strip surrounding and embedded double quotes from an ETag value
 */
[[nodiscard]] auto normalize_etag(const std::string& etag) -> std::string;

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_TRANSFER_HTTP_UPLOAD_BACKEND_H
