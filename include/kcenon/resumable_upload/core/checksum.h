/**
 * @file checksum.h
 * @brief Part digests for upload integrity headers
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_CHECKSUM_H
#define KCENON_RESUMABLE_UPLOAD_CORE_CHECKSUM_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Digest helpers backed by OpenSSL EVP
 *
 * Object stores compute a part's ETag as the hex MD5 of its bytes and accept
 * a base64 MD5 in the Content-MD5 request header.
 */
class checksum {
public:
    /**
     * @brief Raw MD5 digest of data
     */
    [[nodiscard]] static auto md5(std::span<const uint8_t> data)
        -> result<std::vector<uint8_t>>;

    /**
     * @brief Lowercase hex MD5 of data
     */
    [[nodiscard]] static auto md5_hex(std::span<const uint8_t> data)
        -> result<std::string>;

    /**
     * @brief Base64 MD5 of data, as sent in Content-MD5
     */
    [[nodiscard]] static auto md5_base64(std::span<const uint8_t> data)
        -> result<std::string>;

    /**
     * @brief Base64-encode arbitrary bytes
     */
    [[nodiscard]] static auto base64_encode(std::span<const uint8_t> data) -> std::string;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_CHECKSUM_H
