/**
 * @file upload_source.cpp
 * @brief File and memory upload sources
 */

#include <kcenon/resumable_upload/core/upload_source.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace kcenon::resumable_upload {

namespace {

auto check_range(int64_t offset, int64_t length, int64_t total) -> result<void> {
    if (offset < 0 || length < 0 || offset + length > total) {
        return unexpected(error{error_code::invalid_input,
            "read range [" + std::to_string(offset) + ", " +
            std::to_string(offset + length) + ") outside source of " +
            std::to_string(total) + " bytes"});
    }
    return {};
}

}  // namespace

// ============================================================================
// file_upload_source
// ============================================================================

auto file_upload_source::open(const std::filesystem::path& path, std::string mime_type)
    -> result<std::shared_ptr<file_upload_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error{error_code::file_not_found,
            "not a regular file: " + path.string()});
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
            "cannot stat " + path.string() + ": " + ec.message()});
    }

    if (mime_type.empty()) {
        mime_type = mime_type_from_name(path.filename().string());
    }

    return std::make_shared<file_upload_source>(
        path, static_cast<int64_t>(size), std::move(mime_type));
}

file_upload_source::file_upload_source(std::filesystem::path path, int64_t size,
                                       std::string mime_type)
    : path_(std::move(path)), size_(size), mime_type_(std::move(mime_type)) {}

auto file_upload_source::name() const -> std::string {
    return path_.filename().string();
}

auto file_upload_source::size() const -> int64_t {
    return size_;
}

auto file_upload_source::mime_type() const -> std::string {
    return mime_type_;
}

auto file_upload_source::read(int64_t offset, int64_t length)
    -> result<std::vector<uint8_t>> {
    auto range = check_range(offset, length, size_);
    if (!range) {
        return unexpected(range.error());
    }

    // One stream per call so concurrent part reads never share a file position
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
            "cannot open " + path_.string()});
    }

    std::vector<uint8_t> buffer(static_cast<std::size_t>(length));
    file.seekg(offset);
    file.read(reinterpret_cast<char*>(buffer.data()), length);

    if (file.gcount() != length) {
        return unexpected(error{error_code::file_read_error,
            "short read at offset " + std::to_string(offset) + " of " + path_.string()});
    }

    return buffer;
}

// ============================================================================
// memory_upload_source
// ============================================================================

memory_upload_source::memory_upload_source(std::string name, std::vector<uint8_t> data,
                                           std::string mime_type)
    : name_(std::move(name)), data_(std::move(data)), mime_type_(std::move(mime_type)) {
    if (mime_type_.empty()) {
        mime_type_ = mime_type_from_name(name_);
    }
}

auto memory_upload_source::name() const -> std::string {
    return name_;
}

auto memory_upload_source::size() const -> int64_t {
    return static_cast<int64_t>(data_.size());
}

auto memory_upload_source::mime_type() const -> std::string {
    return mime_type_;
}

auto memory_upload_source::read(int64_t offset, int64_t length)
    -> result<std::vector<uint8_t>> {
    auto range = check_range(offset, length, size());
    if (!range) {
        return unexpected(range.error());
    }

    auto first = data_.begin() + offset;
    return std::vector<uint8_t>(first, first + length);
}

// ============================================================================
// MIME type lookup
// ============================================================================

auto mime_type_from_name(const std::string& file_name) -> std::string {
    static const std::unordered_map<std::string, std::string> types{
        {"mp4", "video/mp4"},
        {"m4v", "video/x-m4v"},
        {"mov", "video/quicktime"},
        {"webm", "video/webm"},
        {"mkv", "video/x-matroska"},
        {"avi", "video/x-msvideo"},
        {"mp3", "audio/mpeg"},
        {"m4a", "audio/mp4"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"flac", "audio/flac"},
        {"aac", "audio/aac"},
        {"json", "application/json"},
        {"txt", "text/plain"},
    };

    auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return "application/octet-stream";
    }

    std::string ext = file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

}  // namespace kcenon::resumable_upload
