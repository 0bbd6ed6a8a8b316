// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.h
 * @brief Execution substrate for part uploads
 *
 * Part uploads of every session run on a shared task pool. The pool is
 * selected at build time:
 * - thread_system's thread_pool (KCENON_WITH_THREAD_SYSTEM)
 * - network_system's basic_thread_pool (KCENON_WITH_NETWORK_SYSTEM)
 * - std::async otherwise
 *
 * inline_task_pool runs tasks on the caller's thread and is meant for
 * deterministic tests.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "kcenon/resumable_upload/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::resumable_upload::adapters {

/**
 * @brief Task pool used by upload coordinators
 *
 * Tasks can be tagged with an owner (a session id) so the number of
 * outstanding tasks per session can be observed.
 */
class upload_task_pool {
public:
    virtual ~upload_task_pool() = default;

    /**
     * @brief Submit a task for execution
     * @return Future for the task completion; an exception thrown by the
     *         task is stored in it
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task on behalf of an owner
     * @param task The task to execute
     * @param owner Owner key, usually a session id string
     */
    virtual std::future<void> submit_for(std::function<void()> task,
                                         const std::string& owner) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted for an owner that have not finished yet
     */
    [[nodiscard]] virtual size_t outstanding(const std::string& owner) const = 0;
};

/**
 * @brief Per-owner counter of outstanding tasks
 */
class owner_tracker {
public:
    void acquire(const std::string& owner);
    void release(const std::string& owner);
    [[nodiscard]] size_t count(const std::string& owner) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief upload_task_pool over thread_system's thread_pool
 *
 * @note Thread-safe.
 */
class thread_system_task_pool : public upload_task_pool {
public:
    explicit thread_system_task_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        size_t worker_count = 0);

    ~thread_system_task_pool() override;

    thread_system_task_pool(const thread_system_task_pool&) = delete;
    thread_system_task_pool& operator=(const thread_system_task_pool&) = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_task_pool> create(
        size_t worker_count = 0,
        const std::string& pool_name = "resumable_upload_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_for(std::function<void()> task,
                                 const std::string& owner) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t outstanding(const std::string& owner) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief upload_task_pool over network_system's thread_pool_interface
 *
 * Lets part uploads share the pool already used by network_system.
 */
class network_task_pool : public upload_task_pool {
public:
    explicit network_task_pool(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool);

    ~network_task_pool() override;

    network_task_pool(const network_task_pool&) = delete;
    network_task_pool& operator=(const network_task_pool&) = delete;

    [[nodiscard]] static std::shared_ptr<network_task_pool> create(size_t worker_count = 0);

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_for(std::function<void()> task,
                                 const std::string& owner) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t outstanding(const std::string& owner) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback pool that runs each submission on its own detached thread
 */
class async_task_pool : public upload_task_pool {
public:
    async_task_pool();
    ~async_task_pool() override;

    async_task_pool(const async_task_pool&) = delete;
    async_task_pool& operator=(const async_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_for(std::function<void()> task,
                                 const std::string& owner) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t outstanding(const std::string& owner) const override;

private:
    owner_tracker tracker_;
};

/**
 * @brief Runs each task to completion inside submit()
 *
 * Used by tests that need a deterministic, single-threaded schedule.
 */
class inline_task_pool : public upload_task_pool {
public:
    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_for(std::function<void()> task,
                                 const std::string& owner) override;

    [[nodiscard]] size_t worker_count() const override { return 1; }
    [[nodiscard]] bool is_running() const override { return true; }
    [[nodiscard]] size_t outstanding(const std::string& owner) const override;

    [[nodiscard]] size_t executed() const noexcept {
        return executed_.load(std::memory_order_relaxed);
    }

private:
    owner_tracker tracker_;
    std::atomic<size_t> executed_{0};
};

/**
 * @brief Selects the best available pool
 *
 * Priority: thread_system, then network_system, then std::async.
 */
class task_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_task_pool> create(
        size_t worker_count = 0,
        const std::string& pool_name = "resumable_upload_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::resumable_upload::adapters
