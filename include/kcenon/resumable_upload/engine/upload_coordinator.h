/**
 * @file upload_coordinator.h
 * @brief Lifecycle of one upload session
 */

#ifndef KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_COORDINATOR_H
#define KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_COORDINATOR_H

#include <kcenon/resumable_upload/adapters/task_pool_adapter.h>
#include <kcenon/resumable_upload/core/chunk_planner.h>
#include <kcenon/resumable_upload/core/upload_session.h>
#include <kcenon/resumable_upload/core/upload_source.h>
#include <kcenon/resumable_upload/engine/event_channel.h>
#include <kcenon/resumable_upload/engine/progress_reporter.h>
#include <kcenon/resumable_upload/storage/session_store.h>
#include <kcenon/resumable_upload/transfer/transfer_executor.h>

#include <chrono>
#include <memory>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Scheduling limits of a coordinator
 */
struct coordinator_options {
    /// Parts of this session uploading at the same time
    std::size_t max_concurrent_parts = 3;

    /// Times a part may be requeued after the executor gave up on it
    int32_t requeue_budget = 3;

    /// Trailing window for throughput
    std::chrono::milliseconds throughput_window{30000};
};

/**
 * @brief Collaborators shared by all coordinators of a manager
 */
struct coordinator_services {
    std::shared_ptr<session_store> store;
    std::shared_ptr<transfer_executor> executor;
    std::shared_ptr<adapters::upload_task_pool> pool;
    std::shared_ptr<event_channel> events;
};

/**
 * @brief Outcome of comparing local part records with the backend listing
 */
struct reconcile_result {
    /// Parts confirmed by both sides or known only to the backend
    std::vector<uploaded_part> parts;

    /// Parts to upload again, ascending
    std::vector<int32_t> requeued;
};

/**
 * @brief Reconcile local part records with the backend listing
 *
 * The backend is authoritative: a local part absent remotely, or whose etag
 * or size differs from the remote record, is requeued. A remote part unknown
 * locally is adopted when its size matches the plan.
 */
[[nodiscard]] auto reconcile_parts(const std::vector<part_range>& plan,
                                   const std::vector<uploaded_part>& local,
                                   const std::vector<part_receipt>& remote,
                                   std::chrono::system_clock::time_point now =
                                       std::chrono::system_clock::now())
    -> reconcile_result;

/**
 * @brief State machine driving one session
 *
 * States: pending -> uploading <-> paused, uploading -> completed, any
 * non-terminal state -> failed or cancelled.
 *
 * The coordinator is the only writer of its session record. Every status
 * transition is persisted before the matching status-changed event is
 * published. Part uploads run on the shared task pool, at most
 * max_concurrent_parts at a time; results arriving after the session left
 * uploading through cancel or expiry are discarded.
 *
 * @note Thread-safe. Commands may be issued from any thread.
 */
class upload_coordinator : public std::enable_shared_from_this<upload_coordinator> {
public:
    upload_coordinator(upload_session session,
                       std::shared_ptr<upload_source> source,
                       coordinator_services services,
                       coordinator_options options = {});
    ~upload_coordinator();

    upload_coordinator(const upload_coordinator&) = delete;
    auto operator=(const upload_coordinator&) -> upload_coordinator& = delete;

    /**
     * @brief pending -> uploading
     *
     * Initiates the remote upload unless the session already has one, then
     * starts dispatching parts. Returns upload_init_failed (session failed)
     * when initiate gives up.
     *
     * @param source Source to read from when none was given at construction
     */
    [[nodiscard]] auto start(std::shared_ptr<upload_source> source = nullptr)
        -> result<void>;

    /**
     * @brief Stop dispatching; the session becomes paused once in-flight
     *        parts settle
     */
    [[nodiscard]] auto pause() -> result<void>;

    /**
     * @brief paused -> uploading after reconciling with the backend
     * @param source Replacement source after a restart; its name and size
     *        must match the session
     */
    [[nodiscard]] auto resume(std::shared_ptr<upload_source> source = nullptr)
        -> result<void>;

    /**
     * @brief Any non-terminal state -> cancelled; aborts the remote upload
     *        once, whatever the abort outcome
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Force a stale session to failed and abort its remote upload
     */
    [[nodiscard]] auto expire() -> result<void>;

    /**
     * @brief Record that a session found uploading after a restart is paused
     */
    [[nodiscard]] auto mark_interrupted() -> result<void>;

    [[nodiscard]] auto get_progress() const -> progress_snapshot;

    [[nodiscard]] auto session() const -> upload_session;

    [[nodiscard]] auto id() const -> const session_id&;

    [[nodiscard]] auto status() const -> upload_status;

    /**
     * @brief Wait until no work is outstanding and the session is not uploading
     * @return false on timeout
     */
    auto wait(std::chrono::milliseconds timeout) const -> bool;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_COORDINATOR_H
