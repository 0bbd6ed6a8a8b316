/**
 * @file checksum.cpp
 * @brief OpenSSL-backed part digests
 */

#include <kcenon/resumable_upload/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace kcenon::resumable_upload {

namespace {

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

}  // namespace

auto checksum::md5(std::span<const uint8_t> data) -> result<std::vector<uint8_t>> {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_md5(), nullptr) != 1) {
        return unexpected(error{error_code::internal_error,
            "MD5 digest failed: " + get_openssl_error()});
    }

    digest.resize(digest_len);
    return digest;
}

auto checksum::md5_hex(std::span<const uint8_t> data) -> result<std::string> {
    auto digest = md5(data);
    if (!digest) {
        return unexpected(digest.error());
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : digest.value()) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

auto checksum::md5_base64(std::span<const uint8_t> data) -> result<std::string> {
    auto digest = md5(data);
    if (!digest) {
        return unexpected(digest.error());
    }
    return base64_encode(digest.value());
}

auto checksum::base64_encode(std::span<const uint8_t> data) -> std::string {
    if (data.empty()) {
        return {};
    }

    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

}  // namespace kcenon::resumable_upload
