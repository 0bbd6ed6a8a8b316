/**
 * @file upload_events.h
 * @brief Closed command and event protocol between controllers and the engine
 */

#ifndef KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_EVENTS_H
#define KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_EVENTS_H

#include <kcenon/resumable_upload/core/upload_session.h>
#include <kcenon/resumable_upload/core/upload_source.h>
#include <kcenon/resumable_upload/engine/progress_reporter.h>

#include <memory>
#include <optional>
#include <string_view>
#include <variant>

namespace kcenon::resumable_upload {

// ============================================================================
// Events
// ============================================================================

/**
 * @brief Aggregate progress after a part was recorded
 */
struct progress_event {
    session_id id;
    progress_metrics metrics;
};

/**
 * @brief One part confirmed by the backend
 */
struct chunk_completed_event {
    session_id id;
    int32_t part_number = 0;
    std::string etag;
    int64_t size = 0;
};

/**
 * @brief A part-level or session-level failure
 */
struct error_event {
    session_id id;
    struct error err;

    /// True when the error ended the session
    bool fatal = false;
};

/**
 * @brief Session status transition
 */
struct status_changed_event {
    session_id id;
    upload_status from = upload_status::pending;
    upload_status to = upload_status::pending;
};

using upload_event =
    std::variant<progress_event, chunk_completed_event, error_event, status_changed_event>;

/**
 * @brief Wire-style name of an event: "progress", "chunk-completed",
 *        "error" or "status-changed"
 */
[[nodiscard]] auto event_type_name(const upload_event& event) -> std::string_view;

/**
 * @brief Session an event belongs to
 */
[[nodiscard]] auto event_session(const upload_event& event) -> const session_id&;

// ============================================================================
// Commands
// ============================================================================

struct start_command {
    std::shared_ptr<upload_source> source;
    std::string project_id;
    std::string storage_key;
};

struct pause_command {
    session_id id;
};

struct resume_command {
    session_id id;

    /// Needed when the session was restored after a restart
    std::shared_ptr<upload_source> source;
};

struct cancel_command {
    session_id id;
};

struct query_progress_command {
    session_id id;
};

using upload_command = std::variant<start_command, pause_command, resume_command,
                                    cancel_command, query_progress_command>;

/**
 * @brief Reply to a dispatched command
 *
 * start fills id, query_progress fills progress, the others fill neither.
 */
struct command_reply {
    std::optional<session_id> id;
    std::optional<progress_snapshot> progress;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_EVENTS_H
