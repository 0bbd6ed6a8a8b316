/**
 * @file upload_manager.cpp
 * @brief Session registry and command handling
 */

#include "kcenon/resumable_upload/engine/upload_manager.h"

#include <shared_mutex>
#include <unordered_map>

#include "kcenon/resumable_upload/core/chunk_planner.h"
#include "kcenon/resumable_upload/core/logging.h"
#include "kcenon/resumable_upload/engine/upload_coordinator.h"
#include "kcenon/resumable_upload/storage/session_store.h"
#include "kcenon/resumable_upload/transfer/http_client.h"
#include "kcenon/resumable_upload/transfer/http_upload_backend.h"
#include "kcenon/resumable_upload/transfer/transfer_executor.h"

namespace kcenon::resumable_upload {

// ============================================================================
// Implementation
// ============================================================================

class upload_manager::impl {
public:
    impl(upload_engine_config cfg,
         std::shared_ptr<upload_backend> backend,
         std::shared_ptr<adapters::upload_task_pool> task_pool,
         std::function<void(std::chrono::milliseconds)> sleeper)
        : config(std::move(cfg)),
          events(std::make_shared<event_channel>(config.events)),
          pool(std::move(task_pool)),
          reporter(config.throughput_window) {
        get_logger().initialize();

        session_store_config store_config(config.store_directory);
        store_config.session_ttl = config.session_expiry;
        store = std::make_shared<session_store>(store_config);

        retry_policy policy;
        policy.max_attempts = config.max_attempts;
        policy.initial_delay = config.retry_base_delay;
        policy.max_delay = config.retry_max_delay;
        policy.use_jitter = config.retry_jitter;
        policy.sleeper = std::move(sleeper);
        executor = std::make_shared<transfer_executor>(
            std::move(backend), executor_config::uniform(policy));
    }

    ~impl() {
        std::vector<std::shared_ptr<upload_coordinator>> active;
        {
            std::unique_lock lock(registry_mutex);
            for (auto& [id, coordinator] : coordinators) {
                active.push_back(coordinator);
            }
        }

        // Uploading sessions are left paused so they can be resumed later
        auto budget = config.request_timeout * static_cast<int64_t>(config.max_attempts + 1);
        for (auto& coordinator : active) {
            if (coordinator->status() == upload_status::uploading) {
                auto paused = coordinator->pause();
                if (!paused) {
                    RU_LOG_DEBUG(log_category::manager,
                        "shutdown pause of " + coordinator->id().to_string() +
                        ": " + paused.error().message);
                }
            }
            if (!coordinator->wait(budget)) {
                RU_LOG_WARN(log_category::manager,
                    "session " + coordinator->id().to_string() +
                    " still busy at shutdown");
            }
        }
        events->flush();
    }

    auto services() const -> coordinator_services {
        return coordinator_services{store, executor, pool, events};
    }

    auto options() const -> coordinator_options {
        coordinator_options opts;
        opts.max_concurrent_parts = config.max_concurrent_parts;
        opts.requeue_budget = config.requeue_budget;
        opts.throughput_window = config.throughput_window;
        return opts;
    }

    auto find(const session_id& id) const -> std::shared_ptr<upload_coordinator> {
        std::shared_lock lock(registry_mutex);
        auto it = coordinators.find(id);
        return it != coordinators.end() ? it->second : nullptr;
    }

    /**
     * @brief Registered coordinator, or a new one built from the stored record
     */
    auto acquire(const session_id& id) -> result<std::shared_ptr<upload_coordinator>> {
        if (auto existing = find(id)) {
            return existing;
        }

        auto stored = store->get(id);
        if (!stored.has_value()) {
            return unexpected{stored.error()};
        }

        auto created = std::make_shared<upload_coordinator>(
            std::move(stored).value(), nullptr, services(), options());

        std::shared_ptr<upload_coordinator> coordinator;
        std::vector<std::shared_ptr<upload_coordinator>> finished;
        {
            std::unique_lock lock(registry_mutex);
            finished = prune_finished_locked();
            coordinator = coordinators.try_emplace(id, created).first->second;
        }

        if (coordinator == created) {
            auto interrupted = coordinator->mark_interrupted();
            if (!interrupted) {
                RU_LOG_WARN(log_category::manager,
                    "restore of " + id.to_string() + ": " + interrupted.error().message);
            }
            RU_LOG_INFO(log_category::manager,
                "restored session " + id.to_string() + " as " +
                to_string(coordinator->status()));
        }
        return coordinator;
    }

    /**
     * @brief Take ended sessions with no work left out of the registry
     *
     * Their records stay in the store, which answers later queries. The
     * removed coordinators are returned so they are destroyed after the
     * registry lock is released.
     */
    auto prune_finished_locked() -> std::vector<std::shared_ptr<upload_coordinator>> {
        std::vector<std::shared_ptr<upload_coordinator>> finished;
        for (auto it = coordinators.begin(); it != coordinators.end();) {
            const auto& coordinator = it->second;
            if (is_terminal(coordinator->status()) &&
                coordinator->wait(std::chrono::milliseconds(0))) {
                finished.push_back(std::move(it->second));
                it = coordinators.erase(it);
            } else {
                ++it;
            }
        }
        return finished;
    }

    void forget(const session_id& id) {
        std::unique_lock lock(registry_mutex);
        coordinators.erase(id);
    }

    upload_engine_config config;
    std::shared_ptr<event_channel> events;
    std::shared_ptr<session_store> store;
    std::shared_ptr<transfer_executor> executor;
    std::shared_ptr<adapters::upload_task_pool> pool;
    progress_reporter reporter;

    mutable std::shared_mutex registry_mutex;
    std::unordered_map<session_id, std::shared_ptr<upload_coordinator>> coordinators;
};

// ============================================================================
// Builder
// ============================================================================

upload_manager::builder::builder() = default;

auto upload_manager::builder::with_config(upload_engine_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto upload_manager::builder::with_chunk_size(int64_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto upload_manager::builder::with_adaptive_chunk_size(bool enable) -> builder& {
    config_.adaptive_chunk_size = enable;
    return *this;
}

auto upload_manager::builder::with_max_concurrent_parts(std::size_t count) -> builder& {
    config_.max_concurrent_parts = count;
    return *this;
}

auto upload_manager::builder::with_max_attempts(std::size_t attempts) -> builder& {
    config_.max_attempts = attempts;
    return *this;
}

auto upload_manager::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto upload_manager::builder::with_retry_delay(std::chrono::milliseconds base,
                                               std::chrono::milliseconds max) -> builder& {
    config_.retry_base_delay = base;
    config_.retry_max_delay = max;
    return *this;
}

auto upload_manager::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto upload_manager::builder::with_store_directory(std::filesystem::path dir) -> builder& {
    config_.store_directory = std::move(dir);
    return *this;
}

auto upload_manager::builder::with_session_expiry(std::chrono::seconds expiry) -> builder& {
    config_.session_expiry = expiry;
    return *this;
}

auto upload_manager::builder::with_api_base_url(std::string url) -> builder& {
    config_.api_base_url = std::move(url);
    return *this;
}

auto upload_manager::builder::with_api_header(std::string name, std::string value)
    -> builder& {
    config_.api_headers[std::move(name)] = std::move(value);
    return *this;
}

auto upload_manager::builder::with_event_delivery(delivery_mode mode) -> builder& {
    config_.events = mode;
    return *this;
}

auto upload_manager::builder::with_backend(std::shared_ptr<upload_backend> backend)
    -> builder& {
    backend_ = std::move(backend);
    return *this;
}

auto upload_manager::builder::with_task_pool(
    std::shared_ptr<adapters::upload_task_pool> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_manager::builder::with_retry_sleeper(
    std::function<void(std::chrono::milliseconds)> sleeper) -> builder& {
    sleeper_ = std::move(sleeper);
    return *this;
}

auto upload_manager::builder::build() -> result<upload_manager> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    auto backend = backend_;
    if (!backend) {
        if (config_.api_base_url.empty()) {
            return unexpected{error{error_code::invalid_configuration,
                "api_base_url is required without a custom backend"}};
        }
        http_backend_config http_config;
        http_config.base_url = config_.api_base_url;
        http_config.headers = config_.api_headers;
        http_config.send_content_md5 = config_.send_content_md5;
        backend = std::make_shared<http_upload_backend>(
            std::move(http_config), make_http_client(config_.request_timeout));
    }

    auto pool = pool_ ? pool_ : adapters::task_pool_factory::create(config_.worker_count);

    return upload_manager(config_, std::move(backend), std::move(pool), sleeper_);
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

upload_manager::upload_manager(upload_engine_config config,
                               std::shared_ptr<upload_backend> backend,
                               std::shared_ptr<adapters::upload_task_pool> pool,
                               std::function<void(std::chrono::milliseconds)> sleeper)
    : impl_(std::make_unique<impl>(std::move(config), std::move(backend),
                                   std::move(pool), std::move(sleeper))) {}

upload_manager::upload_manager(upload_manager&&) noexcept = default;
auto upload_manager::operator=(upload_manager&&) noexcept -> upload_manager& = default;
upload_manager::~upload_manager() = default;

// ============================================================================
// Commands
// ============================================================================

auto upload_manager::start(std::shared_ptr<upload_source> source,
                           const std::string& project_id,
                           const std::string& storage_key) -> result<session_id> {
    if (!source) {
        return unexpected{error{error_code::invalid_input, "source is null"}};
    }

    const auto& config = impl_->config;
    auto size = source->size();
    auto chunk = config.adaptive_chunk_size ? optimal_chunk_size(size, config.chunk_size)
                                            : config.chunk_size;

    auto plan = plan_chunks(size, chunk);
    if (!plan.has_value()) {
        return unexpected{plan.error()};
    }

    upload_session session(project_id, storage_key, source->name(), size,
                           source->mime_type(), chunk);
    auto created = impl_->store->create(session);
    if (!created.has_value()) {
        return unexpected{created.error()};
    }

    auto coordinator = std::make_shared<upload_coordinator>(
        session, std::move(source), impl_->services(), impl_->options());
    std::vector<std::shared_ptr<upload_coordinator>> finished;
    {
        std::unique_lock lock(impl_->registry_mutex);
        finished = impl_->prune_finished_locked();
        impl_->coordinators.emplace(session.id, coordinator);
    }

    upload_log_context ctx;
    ctx.session_id = session.id.to_string();
    ctx.file_name = session.file_name;
    ctx.file_size = static_cast<uint64_t>(session.file_size);
    ctx.total_parts = session.total_chunks;
    RU_LOG_INFO_CTX(log_category::manager, "starting upload", ctx);

    auto started = coordinator->start();
    if (!started) {
        // The failed record stays in the store under this id
        auto err = started.error();
        err.session = session.id.to_string();
        return unexpected{std::move(err)};
    }
    return session.id;
}

auto upload_manager::pause(const session_id& id) -> result<void> {
    auto coordinator = impl_->acquire(id);
    if (!coordinator.has_value()) {
        return unexpected{coordinator.error()};
    }
    return coordinator.value()->pause();
}

auto upload_manager::resume(const session_id& id, std::shared_ptr<upload_source> source)
    -> result<void> {
    auto coordinator = impl_->acquire(id);
    if (!coordinator.has_value()) {
        return unexpected{coordinator.error()};
    }
    if (coordinator.value()->status() == upload_status::pending) {
        return coordinator.value()->start(std::move(source));
    }
    return coordinator.value()->resume(std::move(source));
}

auto upload_manager::cancel(const session_id& id) -> result<void> {
    auto coordinator = impl_->acquire(id);
    if (!coordinator.has_value()) {
        return unexpected{coordinator.error()};
    }
    return coordinator.value()->cancel();
}

auto upload_manager::get_progress(const session_id& id) const -> result<progress_snapshot> {
    if (auto coordinator = impl_->find(id)) {
        return coordinator->get_progress();
    }
    auto stored = impl_->store->get(id);
    if (!stored.has_value()) {
        return unexpected{stored.error()};
    }
    return impl_->reporter.snapshot(stored.value());
}

auto upload_manager::dispatch(const upload_command& command) -> result<command_reply> {
    struct handler {
        upload_manager& self;

        auto operator()(const start_command& cmd) const -> result<command_reply> {
            auto id = self.start(cmd.source, cmd.project_id, cmd.storage_key);
            if (!id.has_value()) {
                return unexpected{id.error()};
            }
            command_reply reply;
            reply.id = id.value();
            return reply;
        }

        auto operator()(const pause_command& cmd) const -> result<command_reply> {
            return wrap(self.pause(cmd.id));
        }

        auto operator()(const resume_command& cmd) const -> result<command_reply> {
            return wrap(self.resume(cmd.id, cmd.source));
        }

        auto operator()(const cancel_command& cmd) const -> result<command_reply> {
            return wrap(self.cancel(cmd.id));
        }

        auto operator()(const query_progress_command& cmd) const -> result<command_reply> {
            auto progress = self.get_progress(cmd.id);
            if (!progress.has_value()) {
                return unexpected{progress.error()};
            }
            command_reply reply;
            reply.progress = progress.value();
            return reply;
        }

        static auto wrap(const result<void>& outcome) -> result<command_reply> {
            if (!outcome) {
                return unexpected{outcome.error()};
            }
            return command_reply{};
        }
    };

    return std::visit(handler{*this}, command);
}

// ============================================================================
// Events
// ============================================================================

auto upload_manager::subscribe(event_listener listener) -> subscription_id {
    return impl_->events->subscribe(std::move(listener));
}

auto upload_manager::unsubscribe(subscription_id id) -> bool {
    return impl_->events->unsubscribe(id);
}

void upload_manager::flush_events() {
    impl_->events->flush();
}

// ============================================================================
// Persistence
// ============================================================================

auto upload_manager::restore(const session_id& id) -> result<upload_session> {
    auto coordinator = impl_->acquire(id);
    if (!coordinator.has_value()) {
        return unexpected{coordinator.error()};
    }
    return coordinator.value()->session();
}

auto upload_manager::restore_all() -> std::vector<session_id> {
    std::vector<session_id> restored;
    for (const auto& session : impl_->store->list_all()) {
        if (is_terminal(session.status)) {
            continue;
        }
        auto loaded = restore(session.id);
        if (loaded.has_value()) {
            restored.push_back(session.id);
        } else {
            RU_LOG_WARN(log_category::manager,
                "cannot restore " + session.id.to_string() + ": " +
                loaded.error().message);
        }
    }
    return restored;
}

auto upload_manager::sweep_expired(std::chrono::seconds max_age,
                                   std::chrono::system_clock::time_point now)
    -> result<std::size_t> {
    std::size_t swept = 0;

    for (const auto& id : impl_->store->list_expired(max_age, now)) {
        auto coordinator = impl_->acquire(id);
        if (!coordinator.has_value()) {
            RU_LOG_WARN(log_category::manager,
                "sweep skipped " + id.to_string() + ": " + coordinator.error().message);
            continue;
        }

        if (is_terminal(coordinator.value()->status())) {
            impl_->forget(id);
            auto removed = impl_->store->remove(id);
            if (!removed) {
                RU_LOG_WARN(log_category::manager,
                    "sweep could not delete " + id.to_string() + ": " +
                    removed.error().message);
                continue;
            }
            ++swept;
            continue;
        }

        auto expired = coordinator.value()->expire();
        if (!expired) {
            RU_LOG_WARN(log_category::manager,
                "sweep could not expire " + id.to_string() + ": " +
                expired.error().message);
            continue;
        }
        ++swept;
    }

    if (swept > 0) {
        RU_LOG_INFO(log_category::manager,
            "sweep expired " + std::to_string(swept) + " sessions");
    }
    return swept;
}

auto upload_manager::sweep_expired() -> result<std::size_t> {
    return sweep_expired(impl_->config.session_expiry);
}

auto upload_manager::list_sessions() const -> std::vector<upload_session> {
    return impl_->store->list_all();
}

auto upload_manager::get_session(const session_id& id) const -> result<upload_session> {
    if (auto coordinator = impl_->find(id)) {
        return coordinator->session();
    }
    return impl_->store->get(id);
}

auto upload_manager::wait(const session_id& id, std::chrono::milliseconds timeout) const
    -> bool {
    if (auto coordinator = impl_->find(id)) {
        return coordinator->wait(timeout);
    }
    // Ended sessions leave the registry; their stored record is final
    auto stored = impl_->store->get(id);
    return stored.has_value() && is_terminal(stored.value().status);
}

auto upload_manager::loaded_sessions() const -> std::size_t {
    std::shared_lock lock(impl_->registry_mutex);
    return impl_->coordinators.size();
}

auto upload_manager::config() const -> const upload_engine_config& {
    return impl_->config;
}

}  // namespace kcenon::resumable_upload
