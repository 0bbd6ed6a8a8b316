/**
 * @file upload_manager.h
 * @brief Registry of upload sessions and the controller-facing API
 */

#ifndef KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_MANAGER_H
#define KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_MANAGER_H

#include <kcenon/resumable_upload/adapters/task_pool_adapter.h>
#include <kcenon/resumable_upload/core/upload_source.h>
#include <kcenon/resumable_upload/engine/event_channel.h>
#include <kcenon/resumable_upload/engine/progress_reporter.h>
#include <kcenon/resumable_upload/engine/upload_config.h>
#include <kcenon/resumable_upload/engine/upload_events.h>
#include <kcenon/resumable_upload/transfer/retry_policy.h>
#include <kcenon/resumable_upload/transfer/upload_backend.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Entry point of the upload engine
 *
 * Owns one upload_coordinator per active session, the session store, the
 * transfer executor and the event channel. Sessions are independent; they
 * share only the task pool.
 *
 * @code
 * auto manager = upload_manager::builder()
 *     .with_api_base_url("https://api.example.com/upload")
 *     .with_store_directory("/var/lib/uploads")
 *     .build();
 * if (!manager) return;
 *
 * auto sub = manager.value().subscribe([](const upload_event& e) {
 *     // update UI
 * });
 * auto source = file_upload_source::open("/data/interview.mp4");
 * auto id = manager.value().start(source.value(), "project-42", "media/interview.mp4");
 * @endcode
 */
class upload_manager {
public:
    /**
     * @brief Builder for upload_manager
     */
    class builder {
    public:
        builder();

        auto with_config(upload_engine_config config) -> builder&;
        auto with_chunk_size(int64_t size) -> builder&;
        auto with_adaptive_chunk_size(bool enable) -> builder&;
        auto with_max_concurrent_parts(std::size_t count) -> builder&;
        auto with_max_attempts(std::size_t attempts) -> builder&;
        auto with_worker_count(std::size_t count) -> builder&;
        auto with_retry_delay(std::chrono::milliseconds base,
                              std::chrono::milliseconds max) -> builder&;
        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_store_directory(std::filesystem::path dir) -> builder&;
        auto with_session_expiry(std::chrono::seconds expiry) -> builder&;
        auto with_api_base_url(std::string url) -> builder&;
        auto with_api_header(std::string name, std::string value) -> builder&;
        auto with_event_delivery(delivery_mode mode) -> builder&;

        /**
         * @brief Use a custom backend instead of the HTTP backend
         */
        auto with_backend(std::shared_ptr<upload_backend> backend) -> builder&;

        /**
         * @brief Use a custom task pool instead of task_pool_factory
         */
        auto with_task_pool(std::shared_ptr<adapters::upload_task_pool> pool) -> builder&;

        /**
         * @brief Replace the wait between retries (tests)
         */
        auto with_retry_sleeper(std::function<void(std::chrono::milliseconds)> sleeper)
            -> builder&;

        /**
         * @brief Validate the configuration and create the manager
         */
        [[nodiscard]] auto build() -> result<upload_manager>;

    private:
        upload_engine_config config_;
        std::shared_ptr<upload_backend> backend_;
        std::shared_ptr<adapters::upload_task_pool> pool_;
        std::function<void(std::chrono::milliseconds)> sleeper_;
    };

    upload_manager(const upload_manager&) = delete;
    auto operator=(const upload_manager&) -> upload_manager& = delete;
    upload_manager(upload_manager&&) noexcept;
    auto operator=(upload_manager&&) noexcept -> upload_manager&;
    ~upload_manager();

    // ========================================================================
    // Commands
    // ========================================================================

    /**
     * @brief Create a session for a source and start uploading it
     * @return The new session id, or the initiate failure. A session that
     *         was persisted before failing is named in error::session.
     */
    [[nodiscard]] auto start(std::shared_ptr<upload_source> source,
                             const std::string& project_id,
                             const std::string& storage_key) -> result<session_id>;

    [[nodiscard]] auto pause(const session_id& id) -> result<void>;

    /**
     * @brief Resume a paused session
     *
     * Sessions not loaded yet are restored from the store first. After a
     * restart the source must be supplied again; its name and size must
     * match the session. A restored pending session is started instead.
     */
    [[nodiscard]] auto resume(const session_id& id,
                              std::shared_ptr<upload_source> source = nullptr)
        -> result<void>;

    [[nodiscard]] auto cancel(const session_id& id) -> result<void>;

    [[nodiscard]] auto get_progress(const session_id& id) const -> result<progress_snapshot>;

    /**
     * @brief Run a command from the closed command protocol
     */
    [[nodiscard]] auto dispatch(const upload_command& command) -> result<command_reply>;

    // ========================================================================
    // Events
    // ========================================================================

    [[nodiscard]] auto subscribe(event_listener listener) -> subscription_id;
    auto unsubscribe(subscription_id id) -> bool;

    /**
     * @brief Block until all events published so far were delivered
     */
    void flush_events();

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * @brief Load a stored session; one found uploading becomes paused
     */
    [[nodiscard]] auto restore(const session_id& id) -> result<upload_session>;

    /**
     * @brief Restore every non-terminal stored session
     */
    [[nodiscard]] auto restore_all() -> std::vector<session_id>;

    /**
     * @brief Expire sessions without activity for longer than max_age
     *
     * Non-terminal sessions fail with session_expired and their remote
     * uploads are aborted. Terminal records are deleted.
     *
     * @return Number of sessions expired or deleted
     */
    [[nodiscard]] auto sweep_expired(
        std::chrono::seconds max_age,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
        -> result<std::size_t>;

    /**
     * @brief sweep_expired with the configured session expiry
     */
    [[nodiscard]] auto sweep_expired() -> result<std::size_t>;

    [[nodiscard]] auto list_sessions() const -> std::vector<upload_session>;

    [[nodiscard]] auto get_session(const session_id& id) const -> result<upload_session>;

    /**
     * @brief Wait until a session has no outstanding work and is not uploading
     * @return false on timeout or unknown session
     */
    auto wait(const session_id& id, std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Number of sessions held in memory
     *
     * Ended sessions are released when the next session is started or
     * loaded, so this stays close to the number of live uploads.
     */
    [[nodiscard]] auto loaded_sessions() const -> std::size_t;

    [[nodiscard]] auto config() const -> const upload_engine_config&;

private:
    upload_manager(upload_engine_config config,
                   std::shared_ptr<upload_backend> backend,
                   std::shared_ptr<adapters::upload_task_pool> pool,
                   std::function<void(std::chrono::milliseconds)> sleeper);

    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_ENGINE_UPLOAD_MANAGER_H
