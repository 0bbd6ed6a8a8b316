/**
 * @file session_store.cpp
 * @brief File-backed session store
 */

#include <kcenon/resumable_upload/storage/session_store.h>
#include <kcenon/resumable_upload/core/chunk_planner.h>
#include <kcenon/resumable_upload/core/json_utils.h>
#include <kcenon/resumable_upload/core/logging.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>

namespace kcenon::resumable_upload {

// ============================================================================
// session_store_config implementation
// ============================================================================

session_store_config::session_store_config()
    : directory(std::filesystem::temp_directory_path() / "resumable_upload_sessions")
    , session_ttl(86400) {
}

session_store_config::session_store_config(std::filesystem::path dir)
    : directory(std::move(dir))
    , session_ttl(86400) {
}

// ============================================================================
// JSON serialization
// ============================================================================

namespace {

constexpr int record_version = 1;
constexpr const char* record_extension = ".json";

auto time_point_to_int64(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto int64_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

auto corrupted(const std::string& what) -> unexpected {
    return unexpected(error{error_code::store_corrupted, what});
}

auto record_path(const std::filesystem::path& dir, const session_id& id)
    -> std::filesystem::path {
    return dir / (id.to_string() + record_extension);
}

}  // namespace

auto session_to_json(const upload_session& session) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"version\": " << record_version << ",\n";
    oss << "  \"id\": \"" << session.id.to_string() << "\",\n";
    oss << "  \"project_id\": " << json::quote(session.project_id) << ",\n";
    oss << "  \"storage_key\": " << json::quote(session.storage_key) << ",\n";
    oss << "  \"file_name\": " << json::quote(session.file_name) << ",\n";
    oss << "  \"file_size\": " << session.file_size << ",\n";
    oss << "  \"mime_type\": " << json::quote(session.mime_type) << ",\n";
    oss << "  \"chunk_size\": " << session.chunk_size << ",\n";
    oss << "  \"total_chunks\": " << session.total_chunks << ",\n";
    oss << "  \"status\": \"" << to_string(session.status) << "\",\n";
    oss << "  \"remote_upload_id\": "
        << (session.remote_upload_id ? json::quote(*session.remote_upload_id) : "null")
        << ",\n";
    oss << "  \"error\": "
        << (session.error ? json::quote(*session.error) : "null") << ",\n";
    oss << "  \"error_part\": "
        << (session.error_part ? std::to_string(*session.error_part) : "null") << ",\n";
    oss << "  \"started_at\": " << time_point_to_int64(session.started_at) << ",\n";
    oss << "  \"last_activity\": " << time_point_to_int64(session.last_activity) << ",\n";
    oss << "  \"parts\": [";
    for (std::size_t i = 0; i < session.parts.size(); ++i) {
        const auto& p = session.parts[i];
        oss << (i == 0 ? "\n" : ",\n");
        oss << "    {\"part_number\": " << p.part_number
            << ", \"etag\": " << json::quote(p.etag)
            << ", \"size\": " << p.size
            << ", \"completed_at\": " << time_point_to_int64(p.completed_at) << "}";
    }
    oss << (session.parts.empty() ? "]\n" : "\n  ]\n");
    oss << "}";
    return oss.str();
}

auto session_from_json(const std::string& text) -> result<upload_session> {
    auto parsed = json::parse(text);
    if (!parsed) {
        return corrupted(parsed.error().message);
    }
    const auto& doc = parsed.value();
    if (!doc.is_object()) {
        return corrupted("record is not an object");
    }

    upload_session session;

    auto id_str = doc.get_string("id");
    if (!id_str) {
        return corrupted("missing id field");
    }
    auto id = session_id::from_string(*id_str);
    if (!id) {
        return corrupted("invalid session id");
    }
    session.id = *id;

    auto status_str = doc.get_string("status");
    auto status = status_str ? upload_status_from_string(*status_str) : std::nullopt;
    if (!status) {
        return corrupted("invalid status");
    }
    session.status = *status;

    auto file_size = doc.get_int64("file_size");
    auto chunk_size = doc.get_int64("chunk_size");
    auto total_chunks = doc.get_int64("total_chunks");
    auto started = doc.get_int64("started_at");
    auto activity = doc.get_int64("last_activity");
    if (!file_size || !chunk_size || !total_chunks || !started || !activity) {
        return corrupted("invalid numeric field");
    }

    session.project_id = doc.get_string("project_id").value_or("");
    session.storage_key = doc.get_string("storage_key").value_or("");
    session.file_name = doc.get_string("file_name").value_or("");
    session.mime_type = doc.get_string("mime_type").value_or("");
    session.file_size = *file_size;
    session.chunk_size = *chunk_size;
    session.total_chunks = static_cast<int32_t>(*total_chunks);
    session.started_at = int64_to_time_point(*started);
    session.last_activity = int64_to_time_point(*activity);
    session.remote_upload_id = doc.get_string("remote_upload_id");
    session.error = doc.get_string("error");
    if (auto part = doc.get_int64("error_part")) {
        session.error_part = static_cast<int32_t>(*part);
    }

    if (session.total_chunks != calculate_total_chunks(session.file_size, session.chunk_size)) {
        return corrupted("total_chunks does not match file and chunk size");
    }

    const auto* parts = doc.find("parts");
    if (!parts || !parts->is_array()) {
        return corrupted("missing parts array");
    }
    for (const auto& item : parts->items()) {
        auto number = item.get_int64("part_number");
        auto size = item.get_int64("size");
        auto etag = item.get_string("etag");
        if (!number || !size || !etag) {
            return corrupted("invalid part entry");
        }
        if (*number < 1 || *number > session.total_chunks ||
            session.has_part(static_cast<int32_t>(*number))) {
            return corrupted("part number out of range or duplicated");
        }
        uploaded_part part;
        part.part_number = static_cast<int32_t>(*number);
        part.etag = *etag;
        part.size = *size;
        part.completed_at = int64_to_time_point(item.get_int64("completed_at").value_or(0));
        session.parts.push_back(std::move(part));
    }

    return session;
}

// ============================================================================
// session_store::impl
// ============================================================================

class session_store::impl {
public:
    explicit impl(const session_store_config& cfg)
        : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            RU_LOG_ERROR(log_category::store,
                "Failed to create session directory: " + config_.directory.string() +
                " (" + ec.message() + ")");
        }
        load_directory();
    }

    auto create(const upload_session& session) -> result<upload_session> {
        if (session.id.is_null()) {
            return unexpected(error{error_code::invalid_input, "session id is null"});
        }
        if (session.chunk_size <= 0 || session.file_size < 0) {
            return unexpected(error{error_code::invalid_input,
                "session has invalid file or chunk size"});
        }
        if (session.total_chunks !=
            calculate_total_chunks(session.file_size, session.chunk_size)) {
            return unexpected(error{error_code::invalid_input,
                "total_chunks does not match file and chunk size"});
        }

        std::unique_lock lock(mutex_);

        if (cache_.count(session.id) > 0) {
            return unexpected(error{error_code::invalid_input,
                "session already exists: " + session.id.to_string()});
        }

        auto written = write_record(session);
        if (!written) {
            return unexpected(written.error());
        }
        cache_[session.id] = session;

        RU_LOG_DEBUG(log_category::store,
            "Created session " + session.id.to_string() + " for " + session.file_name +
            " (" + std::to_string(session.total_chunks) + " parts)");
        return session;
    }

    auto get(const session_id& id) -> result<upload_session> {
        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(id);
            if (it != cache_.end()) {
                return it->second;
            }
        }

        // Records written by another store instance since we loaded
        auto loaded = read_record(record_path(config_.directory, id));
        if (!loaded) {
            if (loaded.error().code == error_code::file_not_found) {
                return unexpected(error{error_code::session_not_found,
                    "no session " + id.to_string()});
            }
            return loaded;
        }

        std::unique_lock lock(mutex_);
        auto it = cache_.emplace(id, loaded.value()).first;
        return it->second;
    }

    auto update(const session_id& id, const session_patch& patch)
        -> result<upload_session> {
        auto current = get(id);
        if (!current) {
            return current;
        }

        std::unique_lock lock(mutex_);

        auto it = cache_.find(id);
        if (it == cache_.end()) {
            return unexpected(error{error_code::session_not_found,
                "session removed concurrently: " + id.to_string()});
        }

        upload_session merged = it->second;
        auto applied = apply_patch(merged, patch);
        if (!applied) {
            RU_LOG_DEBUG(log_category::store,
                "Rejected update for " + id.to_string() + ": " + applied.error().message);
            return unexpected(applied.error());
        }

        auto written = write_record(merged);
        if (!written) {
            return unexpected(written.error());
        }

        if (patch.status && *patch.status != it->second.status) {
            RU_LOG_DEBUG(log_category::store,
                "Session " + id.to_string() + ": " + to_string(it->second.status) +
                " -> " + to_string(*patch.status));
        }

        it->second = merged;
        return merged;
    }

    auto remove(const session_id& id) -> result<void> {
        std::unique_lock lock(mutex_);

        cache_.erase(id);

        auto path = record_path(config_.directory, id);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            RU_LOG_ERROR(log_category::store,
                "Failed to delete session record: " + path.string() +
                " (" + ec.message() + ")");
            return unexpected(error{error_code::store_write_error,
                "failed to delete session record: " + ec.message()});
        }

        RU_LOG_DEBUG(log_category::store, "Deleted session " + id.to_string());
        return {};
    }

    auto contains(const session_id& id) const -> bool {
        std::shared_lock lock(mutex_);
        if (cache_.count(id) > 0) {
            return true;
        }
        return std::filesystem::exists(record_path(config_.directory, id));
    }

    template <typename Pred>
    auto select(Pred pred) const -> std::vector<upload_session> {
        std::shared_lock lock(mutex_);
        std::vector<upload_session> out;
        for (const auto& [id, session] : cache_) {
            if (pred(session)) {
                out.push_back(session);
            }
        }
        std::sort(out.begin(), out.end(),
            [](const upload_session& a, const upload_session& b) {
                return a.started_at < b.started_at;
            });
        return out;
    }

    auto info() const -> store_info {
        std::shared_lock lock(mutex_);
        store_info result;
        result.total_sessions = cache_.size();
        for (const auto& [id, session] : cache_) {
            result.total_bytes += session.file_size;
        }
        return result;
    }

    auto clear() -> result<void> {
        std::unique_lock lock(mutex_);

        for (const auto& [id, session] : cache_) {
            std::error_code ec;
            std::filesystem::remove(record_path(config_.directory, id), ec);
            if (ec) {
                return unexpected(error{error_code::store_write_error,
                    "failed to delete session record: " + ec.message()});
            }
        }
        cache_.clear();

        RU_LOG_INFO(log_category::store, "Cleared all session records");
        return {};
    }

    auto config() const -> const session_store_config& {
        return config_;
    }

private:
    void load_directory() {
        std::error_code ec;
        if (!std::filesystem::exists(config_.directory, ec)) {
            return;
        }

        std::size_t loaded = 0;
        for (const auto& entry : std::filesystem::directory_iterator(config_.directory, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != record_extension) {
                continue;
            }
            auto record = read_record(entry.path());
            if (!record) {
                RU_LOG_WARN(log_category::store,
                    "Skipping unreadable session record " + entry.path().string() +
                    ": " + record.error().message);
                continue;
            }
            cache_[record.value().id] = record.value();
            ++loaded;
        }

        if (loaded > 0) {
            RU_LOG_INFO(log_category::store,
                "Loaded " + std::to_string(loaded) + " session records from " +
                config_.directory.string());
        }
    }

    auto read_record(const std::filesystem::path& path) const -> result<upload_session> {
        if (!std::filesystem::exists(path)) {
            return unexpected(error{error_code::file_not_found, "record not found"});
        }

        std::ifstream file(path);
        if (!file) {
            return unexpected(error{error_code::store_read_error,
                "failed to open session record: " + path.string()});
        }

        std::ostringstream oss;
        oss << file.rdbuf();
        return session_from_json(oss.str());
    }

    auto write_record(const upload_session& session) -> result<void> {
        auto path = record_path(config_.directory, session.id);
        auto tmp_path = path;
        tmp_path += ".tmp";

        {
            std::ofstream file(tmp_path, std::ios::trunc);
            if (!file) {
                RU_LOG_ERROR(log_category::store,
                    "Failed to open session record for writing: " + tmp_path.string());
                return unexpected(error{error_code::store_write_error,
                    "failed to open session record for writing"});
            }
            file << session_to_json(session);
            file.flush();
            if (!file) {
                RU_LOG_ERROR(log_category::store,
                    "Failed to write session record: " + tmp_path.string());
                return unexpected(error{error_code::store_write_error,
                    "failed to write session record"});
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            std::filesystem::remove(tmp_path, ec);
            return unexpected(error{error_code::store_write_error,
                "failed to replace session record: " + path.string()});
        }
        return {};
    }

    session_store_config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<session_id, upload_session> cache_;
};

// ============================================================================
// session_store public interface
// ============================================================================

session_store::session_store(const session_store_config& config)
    : impl_(std::make_unique<impl>(config)) {}

session_store::~session_store() = default;

session_store::session_store(session_store&&) noexcept = default;
auto session_store::operator=(session_store&&) noexcept -> session_store& = default;

auto session_store::create(const upload_session& session) -> result<upload_session> {
    return impl_->create(session);
}

auto session_store::get(const session_id& id) -> result<upload_session> {
    return impl_->get(id);
}

auto session_store::update(const session_id& id, const session_patch& patch)
    -> result<upload_session> {
    return impl_->update(id, patch);
}

auto session_store::remove(const session_id& id) -> result<void> {
    return impl_->remove(id);
}

auto session_store::contains(const session_id& id) const -> bool {
    return impl_->contains(id);
}

auto session_store::list_expired(std::chrono::seconds max_age,
                                 std::chrono::system_clock::time_point now) const
    -> std::vector<session_id> {
    auto cutoff = now - max_age;
    std::vector<session_id> ids;
    for (const auto& session : impl_->select(
             [cutoff](const upload_session& s) { return s.last_activity < cutoff; })) {
        ids.push_back(session.id);
    }
    return ids;
}

auto session_store::list_expired() const -> std::vector<session_id> {
    return list_expired(impl_->config().session_ttl);
}

auto session_store::list_all() const -> std::vector<upload_session> {
    return impl_->select([](const upload_session&) { return true; });
}

auto session_store::list_by_status(upload_status status) const
    -> std::vector<upload_session> {
    return impl_->select(
        [status](const upload_session& s) { return s.status == status; });
}

auto session_store::find_by_project(const std::string& project_id) const
    -> result<upload_session> {
    auto matches = impl_->select(
        [&project_id](const upload_session& s) { return s.project_id == project_id; });
    if (matches.empty()) {
        return unexpected(error{error_code::session_not_found,
            "no session for project " + project_id});
    }
    return *std::max_element(matches.begin(), matches.end(),
        [](const upload_session& a, const upload_session& b) {
            return a.last_activity < b.last_activity;
        });
}

auto session_store::info() const -> store_info {
    return impl_->info();
}

auto session_store::clear() -> result<void> {
    return impl_->clear();
}

auto session_store::config() const -> const session_store_config& {
    return impl_->config();
}

}  // namespace kcenon::resumable_upload
