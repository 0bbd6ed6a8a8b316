/**
 * @file upload_coordinator.cpp
 * @brief Per-session upload state machine
 */

#include "kcenon/resumable_upload/engine/upload_coordinator.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>

#include "kcenon/resumable_upload/core/logging.h"

namespace kcenon::resumable_upload {

// ============================================================================
// Reconciliation
// ============================================================================

auto reconcile_parts(const std::vector<part_range>& plan,
                     const std::vector<uploaded_part>& local,
                     const std::vector<part_receipt>& remote,
                     std::chrono::system_clock::time_point now) -> reconcile_result {
    std::map<int32_t, const part_receipt*> remote_parts;
    for (const auto& receipt : remote) {
        remote_parts[receipt.part_number] = &receipt;
    }

    reconcile_result out;
    for (const auto& range : plan) {
        auto remote_it = remote_parts.find(range.part_number);
        if (remote_it == remote_parts.end()) {
            out.requeued.push_back(range.part_number);
            continue;
        }

        const auto& receipt = *remote_it->second;
        // Listings without sizes are taken at the planned size
        auto remote_size = receipt.size > 0 ? receipt.size : range.size();
        if (remote_size != range.size() || receipt.etag.empty()) {
            out.requeued.push_back(range.part_number);
            continue;
        }

        auto local_it = std::find_if(local.begin(), local.end(),
            [&range](const uploaded_part& p) { return p.part_number == range.part_number; });

        if (local_it == local.end()) {
            out.parts.push_back(uploaded_part{range.part_number, receipt.etag, remote_size, now});
        } else if (local_it->etag == receipt.etag && local_it->size == remote_size) {
            out.parts.push_back(*local_it);
        } else {
            out.requeued.push_back(range.part_number);
        }
    }
    return out;
}

// ============================================================================
// Implementation
// ============================================================================

class upload_coordinator::impl {
public:
    struct actions {
        std::vector<part_range> dispatch;
        bool complete = false;
    };

    impl(upload_coordinator* owner, upload_session session,
         std::shared_ptr<upload_source> source, coordinator_services services,
         coordinator_options options)
        : owner_(owner),
          session_(std::move(session)),
          source_(std::move(source)),
          services_(std::move(services)),
          options_(options),
          reporter_(options.throughput_window) {
        if (options_.max_concurrent_parts == 0) {
            options_.max_concurrent_parts = 1;
        }
        owner_key_ = session_.id.to_string();
    }

    ~impl() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return idle_locked(); });
    }

    // ========================================================================
    // Helpers (mutex_ held)
    // ========================================================================

    auto idle_locked() const -> bool {
        return in_flight_.empty() && !initiating_ && !completing_ && !reconciling_;
    }

    auto log_context_locked() const -> upload_log_context {
        upload_log_context ctx;
        ctx.session_id = owner_key_;
        ctx.file_name = session_.file_name;
        ctx.file_size = static_cast<uint64_t>(session_.file_size);
        ctx.bytes_uploaded = static_cast<uint64_t>(session_.uploaded_bytes());
        ctx.total_parts = session_.total_chunks;
        ctx.status = to_string(session_.status);
        return ctx;
    }

    void publish_locked(upload_event event) {
        if (services_.events) {
            services_.events->publish(std::move(event));
        }
    }

    /**
     * @brief Apply a patch to the working copy and mirror it to the store
     *
     * A patch the state machine rejects changes nothing. A store failure is
     * reported but the in-memory session keeps the change.
     */
    auto commit_locked(const session_patch& patch) -> result<void> {
        upload_session next = session_;
        auto applied = apply_patch(next, patch);
        if (!applied) {
            return applied;
        }

        if (services_.store) {
            auto stored = services_.store->update(session_.id, patch);
            if (!stored.has_value()) {
                auto ctx = log_context_locked();
                ctx.error_message = stored.error().message;
                RU_LOG_WARN_CTX(log_category::coordinator,
                    "failed to persist session change", ctx);
                publish_locked(error_event{session_.id, stored.error(), false});
            }
        }

        session_ = std::move(next);
        if (is_terminal(session_.status)) {
            // Nothing reads the file again once the session has ended
            source_.reset();
        }
        return {};
    }

    auto transition_locked(upload_status to, session_patch patch = {}) -> result<void> {
        auto from = session_.status;
        patch.status = to;

        auto committed = commit_locked(patch);
        if (!committed) {
            return committed;
        }

        auto ctx = log_context_locked();
        RU_LOG_INFO_CTX(log_category::coordinator,
            std::string("status ") + to_string(from) + " -> " + to_string(to), ctx);

        publish_locked(status_changed_event{session_.id, from, to});
        cv_.notify_all();
        return {};
    }

    void fail_locked(const error& err) {
        pending_.clear();
        pausing_ = false;

        session_patch patch;
        patch.error = err.message;
        patch.error_part = err.part_number;

        patch.status = upload_status::failed;

        auto from = session_.status;
        auto committed = commit_locked(patch);
        if (!committed) {
            RU_LOG_ERROR(log_category::coordinator,
                "cannot fail session " + owner_key_ + ": " + committed.error().message);
            return;
        }

        auto ctx = log_context_locked();
        ctx.part_number = err.part_number;
        ctx.error_message = err.message;
        RU_LOG_ERROR_CTX(log_category::coordinator, "upload failed", ctx);

        publish_locked(error_event{session_.id, err, true});
        publish_locked(status_changed_event{session_.id, from, upload_status::failed});
        cv_.notify_all();
    }

    auto ensure_plan_locked() -> result<void> {
        auto plan = plan_chunks(session_.file_size, session_.chunk_size);
        if (!plan.has_value()) {
            return unexpected{plan.error()};
        }
        plan_ = std::move(plan).value();
        return {};
    }

    void queue_missing_locked() {
        pending_.clear();
        requeues_.clear();
        stalled_.clear();
        for (auto part : session_.missing_parts()) {
            if (in_flight_.count(part) == 0) {
                pending_.push_back(part);
            }
        }
    }

    /**
     * @brief Decide what to do next after any state change
     */
    auto next_actions_locked() -> actions {
        actions next;
        if (session_.status != upload_status::uploading || completing_) {
            return next;
        }

        if (pausing_) {
            if (in_flight_.empty()) {
                pausing_ = false;
                auto paused = transition_locked(upload_status::paused);
                if (!paused) {
                    fail_locked(paused.error());
                }
            }
            return next;
        }

        if (pending_.empty() && in_flight_.empty() && stalled_.empty() &&
            !session_.is_complete()) {
            queue_missing_locked();
        }

        while (in_flight_.size() < options_.max_concurrent_parts && !pending_.empty()) {
            auto part = pending_.front();
            pending_.pop_front();
            if (session_.has_part(part) || part < 1 ||
                static_cast<std::size_t>(part) > plan_.size()) {
                continue;
            }
            in_flight_.insert(part);
            next.dispatch.push_back(plan_[static_cast<std::size_t>(part - 1)]);
        }

        if (in_flight_.empty() && pending_.empty()) {
            if (session_.is_complete()) {
                completing_ = true;
                next.complete = true;
            } else if (!stalled_.empty()) {
                auto part = *stalled_.begin();
                fail_locked(error::chunk_failed(part, false,
                    "part " + std::to_string(part) + " exhausted its retry budget"));
            }
        }
        return next;
    }

    // ========================================================================
    // Work outside the lock
    // ========================================================================

    /**
     * @brief Carry out actions decided under the lock
     *
     * A pool that runs tasks inline calls back into run() from the finished
     * part. Those nested calls only queue their actions on the outermost
     * run() of the thread, which drains them in a loop, so the stack stays
     * flat however many parts the session has.
     */
    void run(actions next) {
        struct deferred {
            impl* self;
            std::shared_ptr<upload_coordinator> keep;
            actions work;
        };
        thread_local std::deque<deferred>* backlog = nullptr;

        auto keep = owner_->weak_from_this().lock();
        if (backlog != nullptr) {
            backlog->push_back(deferred{this, std::move(keep), std::move(next)});
            return;
        }

        std::deque<deferred> local;
        local.push_back(deferred{this, std::move(keep), std::move(next)});

        struct backlog_scope {
            std::deque<deferred>*& slot;
            explicit backlog_scope(std::deque<deferred>*& s, std::deque<deferred>* list)
                : slot(s) { slot = list; }
            ~backlog_scope() { slot = nullptr; }
        } scope(backlog, &local);

        while (!local.empty()) {
            auto item = std::move(local.front());
            local.pop_front();
            item.self->execute(item.work);
        }
    }

    void execute(const actions& next) {
        for (const auto& range : next.dispatch) {
            auto keep = owner_->weak_from_this().lock();
            auto task = [this, keep, range] { upload_one(range); };
            if (services_.pool) {
                // Completion is observed through in_flight_, not the future
                auto queued = services_.pool->submit_for(std::move(task), owner_key_);
                (void)queued;
            } else {
                task();
            }
        }
        if (next.complete) {
            finish();
        }
    }

    void upload_one(const part_range& range) {
        upload_target target;
        std::shared_ptr<upload_source> source;
        {
            std::lock_guard lock(mutex_);
            if (is_terminal(session_.status)) {
                in_flight_.erase(range.part_number);
                cv_.notify_all();
                return;
            }
            target = transfer_executor::target_for(session_);
            source = source_;
        }

        result<part_receipt> outcome;
        if (!source) {
            outcome = unexpected{error::chunk_failed(range.part_number, false,
                "no source to read from")};
        } else {
            auto bytes = source->read(range.start_byte, range.size());
            if (!bytes.has_value()) {
                outcome = unexpected{error::chunk_failed(range.part_number, false,
                    "read failed: " + bytes.error().message)};
            } else if (static_cast<int64_t>(bytes.value().size()) != range.size()) {
                outcome = unexpected{error::chunk_failed(range.part_number, false,
                    "short read for part " + std::to_string(range.part_number))};
            } else {
                outcome = services_.executor->upload_part(
                    target, range.part_number, bytes.value());
                if (outcome.has_value() && outcome.value().size <= 0) {
                    outcome.value().size = range.size();
                }
            }
        }
        source.reset();

        on_part_result(range.part_number, outcome);
    }

    void on_part_result(int32_t part, const result<part_receipt>& outcome) {
        actions next;
        {
            std::lock_guard lock(mutex_);
            in_flight_.erase(part);

            if (is_terminal(session_.status)) {
                // Cancelled or expired while the call was in flight
                cv_.notify_all();
                return;
            }

            if (outcome.has_value()) {
                record_part_locked(part, outcome.value());
            } else {
                handle_part_error_locked(part, outcome.error());
            }

            next = next_actions_locked();
            cv_.notify_all();
        }
        run(next);
    }

    void record_part_locked(int32_t part, const part_receipt& receipt) {
        session_patch patch;
        patch.add_parts.push_back(uploaded_part{
            part, receipt.etag, receipt.size, std::chrono::system_clock::now()});
        if (session_.error_part && *session_.error_part == part) {
            patch.clear_error = true;
        }

        auto committed = commit_locked(patch);
        if (!committed) {
            fail_locked(committed.error());
            return;
        }
        requeues_.erase(part);

        auto ctx = log_context_locked();
        ctx.part_number = part;
        RU_LOG_DEBUG_CTX(log_category::coordinator, "part uploaded", ctx);

        publish_locked(chunk_completed_event{session_.id, part, receipt.etag, receipt.size});
        publish_locked(progress_event{session_.id, reporter_.snapshot(session_).metrics});
    }

    void handle_part_error_locked(int32_t part, const error& err) {
        if (!err.retryable) {
            fail_locked(err);
            return;
        }

        publish_locked(error_event{session_.id, err, false});

        session_patch patch;
        patch.error = err.message;
        patch.error_part = part;
        auto committed = commit_locked(patch);
        if (!committed) {
            RU_LOG_DEBUG(log_category::coordinator,
                "part error not recorded: " + committed.error().message);
        }

        auto& count = requeues_[part];
        auto ctx = log_context_locked();
        ctx.part_number = part;
        ctx.attempt = static_cast<uint32_t>(count + 1);
        ctx.error_message = err.message;

        if (count < options_.requeue_budget) {
            ++count;
            pending_.push_back(part);
            RU_LOG_WARN_CTX(log_category::coordinator, "part requeued", ctx);
        } else {
            stalled_.insert(part);
            RU_LOG_ERROR_CTX(log_category::coordinator, "part gave up", ctx);
        }
    }

    void finish() {
        upload_target target;
        std::vector<completed_part> parts;
        {
            std::lock_guard lock(mutex_);
            target = transfer_executor::target_for(session_);
            parts.reserve(session_.parts.size());
            for (const auto& p : session_.parts) {
                parts.push_back(completed_part{p.part_number, p.etag});
            }
        }

        auto done = services_.executor->complete(target, std::move(parts));

        std::lock_guard lock(mutex_);
        completing_ = false;
        if (is_terminal(session_.status)) {
            cv_.notify_all();
            return;
        }

        if (!done) {
            fail_locked(done.error());
            return;
        }

        session_patch patch;
        patch.clear_error = true;
        auto completed = transition_locked(upload_status::completed, patch);
        if (!completed) {
            fail_locked(completed.error());
        }
        cv_.notify_all();
    }

    void abort_remote(const upload_target& target) {
        auto aborted = services_.executor->abort(target);
        if (!aborted) {
            RU_LOG_WARN(log_category::coordinator,
                "abort of " + target.upload_id + " failed: " + aborted.error().message);
        }
    }

    /**
     * @brief Claim the one abort call of this session
     */
    auto claim_abort_locked() -> bool {
        if (abort_issued_ || !session_.remote_upload_id) {
            return false;
        }
        abort_issued_ = true;
        return true;
    }

    auto validate_source_locked(const std::shared_ptr<upload_source>& source) const
        -> result<void> {
        if (source->name() != session_.file_name || source->size() != session_.file_size) {
            return unexpected{error{error_code::validation_error,
                "file does not match the session (expected " + session_.file_name +
                ", " + std::to_string(session_.file_size) + " bytes)"}};
        }
        return {};
    }

    upload_coordinator* owner_;
    std::string owner_key_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    upload_session session_;
    std::shared_ptr<upload_source> source_;
    coordinator_services services_;
    coordinator_options options_;
    progress_reporter reporter_;

    std::vector<part_range> plan_;
    std::deque<int32_t> pending_;
    std::set<int32_t> in_flight_;
    std::map<int32_t, int32_t> requeues_;
    std::set<int32_t> stalled_;

    bool pausing_ = false;
    bool initiating_ = false;
    bool completing_ = false;
    bool reconciling_ = false;
    bool abort_issued_ = false;
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

upload_coordinator::upload_coordinator(upload_session session,
                                       std::shared_ptr<upload_source> source,
                                       coordinator_services services,
                                       coordinator_options options)
    : impl_(std::make_unique<impl>(this, std::move(session), std::move(source),
                                   std::move(services), options)) {}

upload_coordinator::~upload_coordinator() = default;

// ============================================================================
// Commands
// ============================================================================

auto upload_coordinator::start(std::shared_ptr<upload_source> source) -> result<void> {
    std::unique_lock lock(impl_->mutex_);
    auto& s = *impl_;

    if (s.session_.status != upload_status::pending || s.initiating_) {
        return unexpected{error{error_code::invalid_transition,
            std::string("cannot start a session that is ") + to_string(s.session_.status)}};
    }
    if (source) {
        auto valid = s.validate_source_locked(source);
        if (!valid) {
            return valid;
        }
        s.source_ = std::move(source);
    }
    if (!s.source_) {
        return unexpected{error{error_code::invalid_input, "no source to upload"}};
    }

    session_patch patch;

    if (!s.session_.remote_upload_id) {
        s.initiating_ = true;
        auto snapshot = s.session_;
        lock.unlock();

        auto initiated = s.services_.executor->initiate(snapshot);

        lock.lock();
        s.initiating_ = false;
        s.cv_.notify_all();

        if (s.session_.status != upload_status::pending) {
            // Cancelled or expired while initiating; release the new upload
            bool release = initiated.has_value() && !s.abort_issued_;
            s.abort_issued_ = s.abort_issued_ || release;
            auto status = s.session_.status;
            lock.unlock();
            if (release) {
                upload_target target = transfer_executor::target_for(snapshot);
                target.upload_id = initiated.value().upload_id;
                if (initiated.value().storage_key) {
                    target.storage_key = *initiated.value().storage_key;
                }
                s.abort_remote(target);
            }
            return unexpected{error{error_code::invalid_transition,
                std::string("session became ") + to_string(status) + " while starting"}};
        }

        if (!initiated.has_value()) {
            s.fail_locked(initiated.error());
            return unexpected{initiated.error()};
        }

        const auto& response = initiated.value();
        patch.remote_upload_id = response.upload_id;
        if (response.storage_key) {
            patch.storage_key = *response.storage_key;
        }
        if (response.chunk_size && *response.chunk_size != s.session_.chunk_size) {
            patch.chunk_size = *response.chunk_size;
        }
    }

    auto started = s.transition_locked(upload_status::uploading, patch);
    if (!started) {
        s.fail_locked(started.error());
        return started;
    }

    auto planned = s.ensure_plan_locked();
    if (!planned) {
        s.fail_locked(planned.error());
        return planned;
    }
    s.queue_missing_locked();

    auto next = s.next_actions_locked();
    lock.unlock();
    s.run(next);
    return {};
}

auto upload_coordinator::pause() -> result<void> {
    std::unique_lock lock(impl_->mutex_);
    auto& s = *impl_;

    if (s.session_.status != upload_status::uploading) {
        return unexpected{error{error_code::invalid_transition,
            std::string("cannot pause a session that is ") + to_string(s.session_.status)}};
    }
    if (s.completing_) {
        return unexpected{error{error_code::invalid_transition,
            "upload is being completed"}};
    }

    s.pausing_ = true;
    RU_LOG_DEBUG(log_category::coordinator,
        "pause requested for " + s.owner_key_ + " with " +
        std::to_string(s.in_flight_.size()) + " parts in flight");

    auto next = s.next_actions_locked();
    lock.unlock();
    s.run(next);
    return {};
}

auto upload_coordinator::resume(std::shared_ptr<upload_source> source) -> result<void> {
    std::unique_lock lock(impl_->mutex_);
    auto& s = *impl_;

    if (s.session_.status != upload_status::paused || s.reconciling_) {
        return unexpected{error{error_code::invalid_transition,
            std::string("cannot resume a session that is ") + to_string(s.session_.status)}};
    }
    if (source) {
        auto valid = s.validate_source_locked(source);
        if (!valid) {
            return valid;
        }
        s.source_ = std::move(source);
    }
    if (!s.source_) {
        return unexpected{error{error_code::validation_error,
            "the file must be supplied again to resume this session"}};
    }

    auto planned = s.ensure_plan_locked();
    if (!planned) {
        return planned;
    }

    s.reconciling_ = true;
    auto target = transfer_executor::target_for(s.session_);
    lock.unlock();

    auto listed = s.services_.executor->list_uploaded_parts(target);

    lock.lock();
    s.reconciling_ = false;
    s.cv_.notify_all();

    if (s.session_.status != upload_status::paused) {
        return unexpected{error{error_code::invalid_transition,
            std::string("session became ") + to_string(s.session_.status) + " while resuming"}};
    }
    if (!listed.has_value()) {
        s.publish_locked(error_event{s.session_.id, listed.error(), false});
        return unexpected{listed.error()};
    }

    auto reconciled = reconcile_parts(s.plan_, s.session_.parts, listed.value());
    if (!reconciled.requeued.empty()) {
        RU_LOG_INFO(log_category::coordinator,
            "resume of " + s.owner_key_ + " requeues " +
            std::to_string(reconciled.requeued.size()) + " parts");
    }

    session_patch patch;
    patch.replace_parts = std::move(reconciled.parts);
    patch.clear_error = true;

    auto resumed = s.transition_locked(upload_status::uploading, patch);
    if (!resumed) {
        return resumed;
    }
    s.queue_missing_locked();

    auto next = s.next_actions_locked();
    lock.unlock();
    s.run(next);
    return {};
}

auto upload_coordinator::cancel() -> result<void> {
    std::unique_lock lock(impl_->mutex_);
    auto& s = *impl_;

    if (is_terminal(s.session_.status)) {
        return unexpected{error{error_code::invalid_transition,
            std::string("cannot cancel a session that is ") + to_string(s.session_.status)}};
    }

    s.pending_.clear();
    s.pausing_ = false;

    auto cancelled = s.transition_locked(upload_status::cancelled);
    if (!cancelled) {
        return cancelled;
    }

    bool release = s.claim_abort_locked();
    auto target = transfer_executor::target_for(s.session_);
    lock.unlock();

    if (release) {
        s.abort_remote(target);
    }
    return {};
}

auto upload_coordinator::expire() -> result<void> {
    std::unique_lock lock(impl_->mutex_);
    auto& s = *impl_;

    if (is_terminal(s.session_.status)) {
        return unexpected{error{error_code::invalid_transition,
            std::string("cannot expire a session that is ") + to_string(s.session_.status)}};
    }

    s.fail_locked(error{error_code::session_expired,
        "session expired after inactivity"});

    bool release = s.claim_abort_locked();
    auto target = transfer_executor::target_for(s.session_);
    lock.unlock();

    if (release) {
        s.abort_remote(target);
    }
    return {};
}

auto upload_coordinator::mark_interrupted() -> result<void> {
    std::lock_guard lock(impl_->mutex_);
    auto& s = *impl_;

    if (s.session_.status != upload_status::uploading) {
        return {};
    }
    if (!s.in_flight_.empty()) {
        return unexpected{error{error_code::invalid_transition,
            "session has parts in flight"}};
    }
    return s.transition_locked(upload_status::paused);
}

// ============================================================================
// Queries
// ============================================================================

auto upload_coordinator::get_progress() const -> progress_snapshot {
    std::lock_guard lock(impl_->mutex_);
    return impl_->reporter_.snapshot(impl_->session_);
}

auto upload_coordinator::session() const -> upload_session {
    std::lock_guard lock(impl_->mutex_);
    return impl_->session_;
}

auto upload_coordinator::id() const -> const session_id& {
    // The id never changes after construction
    return impl_->session_.id;
}

auto upload_coordinator::status() const -> upload_status {
    std::lock_guard lock(impl_->mutex_);
    return impl_->session_.status;
}

auto upload_coordinator::wait(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock lock(impl_->mutex_);
    return impl_->cv_.wait_for(lock, timeout, [this] {
        return impl_->idle_locked() && !impl_->pausing_ &&
               impl_->session_.status != upload_status::uploading;
    });
}

}  // namespace kcenon::resumable_upload
