/**
 * @file upload_source.h
 * @brief Byte sources that parts are read from
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_SOURCE_H
#define KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_SOURCE_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Random-access source of the bytes being uploaded
 *
 * read() is called concurrently from worker threads for distinct ranges.
 */
class upload_source {
public:
    virtual ~upload_source() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
    [[nodiscard]] virtual auto size() const -> int64_t = 0;
    [[nodiscard]] virtual auto mime_type() const -> std::string = 0;

    /**
     * @brief Read [offset, offset + length) from the source
     * @return Bytes read, or file_read_error / invalid_input
     */
    [[nodiscard]] virtual auto read(int64_t offset, int64_t length)
        -> result<std::vector<uint8_t>> = 0;
};

/**
 * @brief Source backed by a file on disk
 */
class file_upload_source : public upload_source {
public:
    /**
     * @brief Open a file source
     * @param path File to upload
     * @param mime_type Content type; derived from the extension when empty
     * @return Source, or file_not_found if path is not a regular file
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path,
                                   std::string mime_type = {})
        -> result<std::shared_ptr<file_upload_source>>;

    file_upload_source(std::filesystem::path path, int64_t size, std::string mime_type);

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto size() const -> int64_t override;
    [[nodiscard]] auto mime_type() const -> std::string override;
    [[nodiscard]] auto read(int64_t offset, int64_t length)
        -> result<std::vector<uint8_t>> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
    int64_t size_;
    std::string mime_type_;
};

/**
 * @brief Source backed by an in-memory buffer
 */
class memory_upload_source : public upload_source {
public:
    memory_upload_source(std::string name, std::vector<uint8_t> data,
                         std::string mime_type = {});

    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto size() const -> int64_t override;
    [[nodiscard]] auto mime_type() const -> std::string override;
    [[nodiscard]] auto read(int64_t offset, int64_t length)
        -> result<std::vector<uint8_t>> override;

private:
    std::string name_;
    std::vector<uint8_t> data_;
    std::string mime_type_;
};

/**
 * @brief Guess a MIME type from a file name's extension
 * @return "application/octet-stream" when unknown
 */
[[nodiscard]] auto mime_type_from_name(const std::string& file_name) -> std::string;

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_UPLOAD_SOURCE_H
