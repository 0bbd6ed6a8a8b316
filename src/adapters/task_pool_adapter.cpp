// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.cpp
 * @brief Task pool implementations for part uploads
 */

#include "kcenon/resumable_upload/adapters/task_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::resumable_upload::adapters {

namespace {

auto default_workers(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

/**
 * @brief Wrap a task so it fulfils a promise and releases its owner slot
 */
auto make_tracked(std::function<void()> task,
                  std::shared_ptr<std::promise<void>> promise,
                  owner_tracker* tracker,
                  std::string owner) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise), tracker,
            owner = std::move(owner)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        if (tracker != nullptr) {
            tracker->release(owner);
        }
    };
}

}  // namespace

// ============================================================================
// owner_tracker
// ============================================================================

void owner_tracker::acquire(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[owner];
}

void owner_tracker::release(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(owner);
    if (it == counts_.end()) {
        return;
    }
    if (it->second <= 1) {
        counts_.erase(it);
    } else {
        --it->second;
    }
}

size_t owner_tracker::count(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(owner);
    return it != counts_.end() ? it->second : 0;
}

// ============================================================================
// thread_system_task_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief thread_system job running one upload task
 */
class upload_job : public kcenon::thread::job {
public:
    explicit upload_job(std::function<void()> func)
        : job("upload_task"), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_task_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    size_t worker_count{0};
    owner_tracker tracker;

    auto enqueue(std::function<void()> task, owner_tracker* owners,
                 const std::string& owner) -> std::future<void> {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        pool->enqueue(std::make_unique<upload_job>(
            make_tracked(std::move(task), std::move(promise), owners, owner)));
        return future;
    }
};

thread_system_task_pool::thread_system_task_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_task_pool::~thread_system_task_pool() = default;

std::shared_ptr<thread_system_task_pool> thread_system_task_pool::create(
    size_t worker_count, const std::string& pool_name) {
    worker_count = default_workers(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_task_pool>(std::move(pool), worker_count);
}

std::future<void> thread_system_task_pool::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), nullptr, {});
}

std::future<void> thread_system_task_pool::submit_for(std::function<void()> task,
                                                      const std::string& owner) {
    pimpl_->tracker.acquire(owner);
    return pimpl_->enqueue(std::move(task), &pimpl_->tracker, owner);
}

size_t thread_system_task_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_task_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_task_pool::outstanding(const std::string& owner) const {
    return pimpl_->tracker.count(owner);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_task_pool
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_task_pool::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    owner_tracker tracker;
};

network_task_pool::network_task_pool(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
}

network_task_pool::~network_task_pool() = default;

std::shared_ptr<network_task_pool> network_task_pool::create(size_t worker_count) {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        default_workers(worker_count));
    return std::make_shared<network_task_pool>(std::move(pool));
}

std::future<void> network_task_pool::submit(std::function<void()> task) {
    return pimpl_->pool->submit(std::move(task));
}

std::future<void> network_task_pool::submit_for(std::function<void()> task,
                                                const std::string& owner) {
    pimpl_->tracker.acquire(owner);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto queued = pimpl_->pool->submit(
        make_tracked(std::move(task), std::move(promise), &pimpl_->tracker, owner));
    (void)queued;
    return future;
}

size_t network_task_pool::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_task_pool::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_task_pool::outstanding(const std::string& owner) const {
    return pimpl_->tracker.count(owner);
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_task_pool
// ============================================================================

async_task_pool::async_task_pool() = default;

async_task_pool::~async_task_pool() = default;

std::future<void> async_task_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

std::future<void> async_task_pool::submit_for(std::function<void()> task,
                                              const std::string& owner) {
    tracker_.acquire(owner);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // The returned future of a detached thread would block in its destructor
    std::thread(make_tracked(std::move(task), std::move(promise), &tracker_, owner))
        .detach();
    return future;
}

size_t async_task_pool::worker_count() const {
    return default_workers(0);
}

bool async_task_pool::is_running() const { return true; }

size_t async_task_pool::outstanding(const std::string& owner) const {
    return tracker_.count(owner);
}

// ============================================================================
// inline_task_pool
// ============================================================================

std::future<void> inline_task_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    make_tracked(std::move(task), std::move(promise), nullptr, {})();
    executed_.fetch_add(1, std::memory_order_relaxed);
    return future;
}

std::future<void> inline_task_pool::submit_for(std::function<void()> task,
                                               const std::string& owner) {
    tracker_.acquire(owner);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    make_tracked(std::move(task), std::move(promise), &tracker_, owner)();
    executed_.fetch_add(1, std::memory_order_relaxed);
    return future;
}

size_t inline_task_pool::outstanding(const std::string& owner) const {
    return tracker_.count(owner);
}

// ============================================================================
// task_pool_factory
// ============================================================================

std::shared_ptr<upload_task_pool> task_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_task_pool::create(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    (void)pool_name;
    return network_task_pool::create(worker_count);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_task_pool>();
#endif
}

}  // namespace kcenon::resumable_upload::adapters
