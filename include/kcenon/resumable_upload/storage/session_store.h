/**
 * @file session_store.h
 * @brief Durable store of upload session records
 */

#ifndef KCENON_RESUMABLE_UPLOAD_STORAGE_SESSION_STORE_H
#define KCENON_RESUMABLE_UPLOAD_STORAGE_SESSION_STORE_H

#include <kcenon/resumable_upload/core/types.h>
#include <kcenon/resumable_upload/core/upload_session.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Configuration for session_store
 */
struct session_store_config {
    /// Directory holding one JSON record per session
    std::filesystem::path directory;

    /// Default age after which a record is reported by list_expired()
    std::chrono::seconds session_ttl{86400};

    session_store_config();
    explicit session_store_config(std::filesystem::path dir);
};

/**
 * @brief Aggregate information about the stored records
 */
struct store_info {
    std::size_t total_sessions = 0;
    int64_t total_bytes = 0;
};

/**
 * @brief Key-value store of upload sessions keyed by session id
 *
 * Every record is written to its own file by write-then-rename, so a record
 * on disk is always either the old or the new version. Operations on one
 * record are atomic with respect to each other. The store performs no
 * network I/O.
 *
 * @code
 * session_store store(session_store_config{"/var/lib/uploads"});
 * auto created = store.create(session);
 * auto updated = store.update(session.id,
 *     session_patch::with_status(upload_status::paused));
 * @endcode
 */
class session_store {
public:
    explicit session_store(const session_store_config& config);
    ~session_store();

    session_store(const session_store&) = delete;
    auto operator=(const session_store&) -> session_store& = delete;
    session_store(session_store&&) noexcept;
    auto operator=(session_store&&) noexcept -> session_store&;

    // ========================================================================
    // Record access
    // ========================================================================

    /**
     * @brief Persist a new session
     * @return The stored session, or invalid_input for a duplicate id or
     *         inconsistent sizes
     */
    [[nodiscard]] auto create(const upload_session& session) -> result<upload_session>;

    /**
     * @brief Load a session
     * @return Session, or session_not_found
     */
    [[nodiscard]] auto get(const session_id& id) -> result<upload_session>;

    /**
     * @brief Merge a patch into a stored session
     *
     * Unset patch fields keep their stored values. A patch that breaks the
     * status state machine fails with invalid_transition and changes nothing.
     *
     * @return The merged session
     */
    [[nodiscard]] auto update(const session_id& id, const session_patch& patch)
        -> result<upload_session>;

    /**
     * @brief Delete a session; deleting an absent session succeeds
     */
    [[nodiscard]] auto remove(const session_id& id) -> result<void>;

    [[nodiscard]] auto contains(const session_id& id) const -> bool;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Sessions whose last activity is older than max_age
     * @param max_age Inactivity threshold
     * @param now Reference time
     */
    [[nodiscard]] auto list_expired(
        std::chrono::seconds max_age,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const
        -> std::vector<session_id>;

    /**
     * @brief Sessions older than the configured session_ttl
     */
    [[nodiscard]] auto list_expired() const -> std::vector<session_id>;

    [[nodiscard]] auto list_all() const -> std::vector<upload_session>;
    [[nodiscard]] auto list_by_status(upload_status status) const
        -> std::vector<upload_session>;

    /**
     * @brief Most recently active session for a project, if any
     */
    [[nodiscard]] auto find_by_project(const std::string& project_id) const
        -> result<upload_session>;

    [[nodiscard]] auto info() const -> store_info;

    /**
     * @brief Delete every record
     */
    [[nodiscard]] auto clear() -> result<void>;

    [[nodiscard]] auto config() const -> const session_store_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Serialize a session record to JSON
 */
[[nodiscard]] auto session_to_json(const upload_session& session) -> std::string;

/**
 * @brief Parse a session record written by session_to_json()
 * @return Session, or store_corrupted
 */
[[nodiscard]] auto session_from_json(const std::string& text) -> result<upload_session>;

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_STORAGE_SESSION_STORE_H
