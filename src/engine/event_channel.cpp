/**
 * @file event_channel.cpp
 * @brief Ordered event delivery
 */

#include "kcenon/resumable_upload/engine/event_channel.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "kcenon/resumable_upload/core/logging.h"

namespace kcenon::resumable_upload {

// ============================================================================
// Event helpers
// ============================================================================

auto event_type_name(const upload_event& event) -> std::string_view {
    struct namer {
        auto operator()(const progress_event&) const -> std::string_view { return "progress"; }
        auto operator()(const chunk_completed_event&) const -> std::string_view {
            return "chunk-completed";
        }
        auto operator()(const error_event&) const -> std::string_view { return "error"; }
        auto operator()(const status_changed_event&) const -> std::string_view {
            return "status-changed";
        }
    };
    return std::visit(namer{}, event);
}

auto event_session(const upload_event& event) -> const session_id& {
    return std::visit([](const auto& e) -> const session_id& { return e.id; }, event);
}

// ============================================================================
// Implementation
// ============================================================================

class event_channel::impl {
public:
    using listener_ptr = std::shared_ptr<const event_listener>;

    struct envelope {
        upload_event event;
        std::vector<listener_ptr> recipients;
    };

    explicit impl(delivery_mode m) : mode(m) {
        if (mode == delivery_mode::background) {
            worker = std::thread([this] { run(); });
        }
    }

    ~impl() {
        {
            std::lock_guard lock(queue_mutex);
            stopping = true;
        }
        queue_cv.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
    }

    auto recipients() const -> std::vector<listener_ptr> {
        std::lock_guard lock(listener_mutex);
        std::vector<listener_ptr> out;
        out.reserve(listeners.size());
        for (const auto& [id, listener] : listeners) {
            out.push_back(listener);
        }
        return out;
    }

    static void deliver(const envelope& item) {
        for (const auto& listener : item.recipients) {
            try {
                (*listener)(item.event);
            } catch (const std::exception& e) {
                RU_LOG_WARN(log_category::channel,
                    std::string("listener threw on ") +
                    std::string(event_type_name(item.event)) + " event: " + e.what());
            }
        }
    }

    void run() {
        std::unique_lock lock(queue_mutex);
        while (true) {
            queue_cv.wait(lock, [this] { return stopping || !queue.empty(); });
            if (queue.empty()) {
                // stopping with nothing left to deliver
                break;
            }

            auto item = std::move(queue.front());
            queue.pop_front();
            delivering = true;
            lock.unlock();

            deliver(item);

            lock.lock();
            delivering = false;
            if (queue.empty()) {
                idle_cv.notify_all();
            }
        }
        idle_cv.notify_all();
    }

    delivery_mode mode;

    mutable std::mutex listener_mutex;
    std::map<subscription_id, listener_ptr> listeners;
    subscription_id next_id = 1;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::condition_variable idle_cv;
    std::deque<envelope> queue;
    bool delivering = false;
    bool stopping = false;

    // Serializes inline delivery so publish order is kept
    std::mutex inline_mutex;

    std::thread worker;
};

// ============================================================================
// event_channel
// ============================================================================

event_channel::event_channel(delivery_mode mode)
    : impl_(std::make_unique<impl>(mode)) {}

event_channel::~event_channel() = default;

auto event_channel::subscribe(event_listener listener) -> subscription_id {
    std::lock_guard lock(impl_->listener_mutex);
    auto id = impl_->next_id++;
    impl_->listeners.emplace(
        id, std::make_shared<const event_listener>(std::move(listener)));
    RU_LOG_DEBUG(log_category::channel, "listener " + std::to_string(id) + " attached");
    return id;
}

auto event_channel::unsubscribe(subscription_id id) -> bool {
    std::lock_guard lock(impl_->listener_mutex);
    auto erased = impl_->listeners.erase(id) > 0;
    if (erased) {
        RU_LOG_DEBUG(log_category::channel, "listener " + std::to_string(id) + " detached");
    }
    return erased;
}

void event_channel::publish(upload_event event) {
    impl::envelope item{std::move(event), impl_->recipients()};

    if (impl_->mode == delivery_mode::synchronous) {
        std::lock_guard lock(impl_->inline_mutex);
        impl::deliver(item);
        return;
    }

    {
        std::lock_guard lock(impl_->queue_mutex);
        impl_->queue.push_back(std::move(item));
    }
    impl_->queue_cv.notify_one();
}

void event_channel::flush() {
    if (impl_->mode == delivery_mode::synchronous) {
        return;
    }
    if (std::this_thread::get_id() == impl_->worker.get_id()) {
        // Called from a listener; waiting here would never finish
        return;
    }
    std::unique_lock lock(impl_->queue_mutex);
    impl_->idle_cv.wait(lock, [this] {
        return (impl_->queue.empty() && !impl_->delivering) || impl_->stopping;
    });
}

auto event_channel::listener_count() const -> std::size_t {
    std::lock_guard lock(impl_->listener_mutex);
    return impl_->listeners.size();
}

auto event_channel::mode() const noexcept -> delivery_mode {
    return impl_->mode;
}

}  // namespace kcenon::resumable_upload
