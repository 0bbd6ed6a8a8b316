/**
 * @file event_channel.h
 * @brief Broadcast of upload events to subscribed listeners
 */

#ifndef KCENON_RESUMABLE_UPLOAD_ENGINE_EVENT_CHANNEL_H
#define KCENON_RESUMABLE_UPLOAD_ENGINE_EVENT_CHANNEL_H

#include <kcenon/resumable_upload/engine/upload_events.h>

#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::resumable_upload {

using event_listener = std::function<void(const upload_event&)>;
using subscription_id = uint64_t;

/**
 * @brief How published events reach listeners
 */
enum class delivery_mode {
    /// A dedicated thread delivers events in publish order
    background,
    /// publish() delivers before returning; listeners must not call back
    /// into the engine
    synchronous
};

/**
 * @brief Event broadcast with explicit subscribe/unsubscribe
 *
 * The recipients of an event are fixed when it is published: a listener
 * attached later never sees it, a listener detached later still receives
 * it. Events are delivered in publish order.
 *
 * @note Thread-safe.
 */
class event_channel {
public:
    explicit event_channel(delivery_mode mode = delivery_mode::background);
    ~event_channel();

    event_channel(const event_channel&) = delete;
    auto operator=(const event_channel&) -> event_channel& = delete;

    [[nodiscard]] auto subscribe(event_listener listener) -> subscription_id;

    /**
     * @return false if the id is unknown
     */
    auto unsubscribe(subscription_id id) -> bool;

    void publish(upload_event event);

    /**
     * @brief Block until every event published so far has been delivered
     */
    void flush();

    [[nodiscard]] auto listener_count() const -> std::size_t;

    [[nodiscard]] auto mode() const noexcept -> delivery_mode;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_ENGINE_EVENT_CHANNEL_H
