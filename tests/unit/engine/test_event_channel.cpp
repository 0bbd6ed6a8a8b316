/**
 * @file test_event_channel.cpp
 * @brief Unit tests for ordered event delivery
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/engine/event_channel.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::resumable_upload::test {

namespace {

auto chunk_event(const session_id& id, int32_t part) -> upload_event {
    return chunk_completed_event{id, part, "etag", 1024};
}

}  // namespace

// =============================================================================
// Event helpers
// =============================================================================

class UploadEventsTest : public ::testing::Test {};

TEST_F(UploadEventsTest, TypeNames) {
    auto id = session_id::generate();
    EXPECT_EQ(event_type_name(progress_event{id, {}}), "progress");
    EXPECT_EQ(event_type_name(chunk_event(id, 1)), "chunk-completed");
    EXPECT_EQ(event_type_name(error_event{id, error{error_code::network_error}, false}), "error");
    EXPECT_EQ(event_type_name(status_changed_event{id, upload_status::pending,
                                                   upload_status::uploading}),
              "status-changed");
}

TEST_F(UploadEventsTest, SessionOfEvent) {
    auto id = session_id::generate();
    EXPECT_EQ(event_session(chunk_event(id, 3)), id);
    EXPECT_EQ(event_session(error_event{id, error{}, true}), id);
}

// =============================================================================
// Channel
// =============================================================================

class EventChannelTest : public ::testing::TestWithParam<delivery_mode> {
protected:
    void SetUp() override {
        channel_ = std::make_unique<event_channel>(GetParam());
    }

    auto recording_listener(std::vector<int32_t>& sink) -> event_listener {
        return [this, &sink](const upload_event& event) {
            if (const auto* chunk = std::get_if<chunk_completed_event>(&event)) {
                std::lock_guard lock(mutex_);
                sink.push_back(chunk->part_number);
            }
        };
    }

    std::unique_ptr<event_channel> channel_;
    std::mutex mutex_;
    session_id id_ = session_id::generate();
};

TEST_P(EventChannelTest, DeliversInPublishOrder) {
    std::vector<int32_t> received;
    (void)channel_->subscribe(recording_listener(received));

    for (int32_t part = 1; part <= 100; ++part) {
        channel_->publish(chunk_event(id_, part));
    }
    channel_->flush();

    ASSERT_EQ(received.size(), 100u);
    for (int32_t i = 0; i < 100; ++i) {
        EXPECT_EQ(received[static_cast<std::size_t>(i)], i + 1);
    }
}

TEST_P(EventChannelTest, EveryListenerReceivesEvents) {
    std::vector<int32_t> first;
    std::vector<int32_t> second;
    (void)channel_->subscribe(recording_listener(first));
    (void)channel_->subscribe(recording_listener(second));
    EXPECT_EQ(channel_->listener_count(), 2u);

    channel_->publish(chunk_event(id_, 1));
    channel_->flush();

    EXPECT_EQ(first, (std::vector<int32_t>{1}));
    EXPECT_EQ(second, (std::vector<int32_t>{1}));
}

TEST_P(EventChannelTest, UnsubscribeStopsDelivery) {
    std::vector<int32_t> received;
    auto sub = channel_->subscribe(recording_listener(received));

    channel_->publish(chunk_event(id_, 1));
    channel_->flush();
    EXPECT_TRUE(channel_->unsubscribe(sub));
    EXPECT_FALSE(channel_->unsubscribe(sub));

    channel_->publish(chunk_event(id_, 2));
    channel_->flush();

    EXPECT_EQ(received, (std::vector<int32_t>{1}));
    EXPECT_EQ(channel_->listener_count(), 0u);
}

TEST_P(EventChannelTest, ThrowingListenerDoesNotStopOthers) {
    std::vector<int32_t> received;
    (void)channel_->subscribe([](const upload_event&) {
        throw std::runtime_error("listener bug");
    });
    (void)channel_->subscribe(recording_listener(received));

    channel_->publish(chunk_event(id_, 1));
    channel_->publish(chunk_event(id_, 2));
    channel_->flush();

    EXPECT_EQ(received, (std::vector<int32_t>{1, 2}));
}

TEST_P(EventChannelTest, ConcurrentPublishersDeliverEverything) {
    std::atomic<int> count{0};
    (void)channel_->subscribe([&count](const upload_event&) { ++count; });

    std::vector<std::thread> publishers;
    for (int t = 0; t < 4; ++t) {
        publishers.emplace_back([this, t] {
            for (int i = 0; i < 50; ++i) {
                channel_->publish(chunk_event(id_, t * 50 + i));
            }
        });
    }
    for (auto& p : publishers) {
        p.join();
    }
    channel_->flush();

    EXPECT_EQ(count.load(), 200);
}

TEST_P(EventChannelTest, PublishWithoutListeners) {
    channel_->publish(chunk_event(id_, 1));
    channel_->flush();
    EXPECT_EQ(channel_->mode(), GetParam());
}

INSTANTIATE_TEST_SUITE_P(DeliveryModes, EventChannelTest,
                         ::testing::Values(delivery_mode::background,
                                           delivery_mode::synchronous));

class BackgroundEventChannelTest : public ::testing::Test {};

TEST_F(BackgroundEventChannelTest, DeliversOffPublisherThread) {
    event_channel channel(delivery_mode::background);
    std::thread::id delivered_on;
    (void)channel.subscribe([&delivered_on](const upload_event&) {
        delivered_on = std::this_thread::get_id();
    });

    channel.publish(chunk_event(session_id::generate(), 1));
    channel.flush();

    EXPECT_NE(delivered_on, std::this_thread::get_id());
}

TEST_F(BackgroundEventChannelTest, DestructionDrainsQueue) {
    std::atomic<int> count{0};
    {
        event_channel channel(delivery_mode::background);
        (void)channel.subscribe([&count](const upload_event&) { ++count; });
        for (int i = 0; i < 20; ++i) {
            channel.publish(chunk_event(session_id::generate(), i + 1));
        }
    }
    EXPECT_EQ(count.load(), 20);
}

TEST_F(BackgroundEventChannelTest, FlushFromListenerDoesNotDeadlock) {
    event_channel channel(delivery_mode::background);
    std::atomic<bool> done{false};
    (void)channel.subscribe([&](const upload_event&) {
        channel.flush();
        done = true;
    });

    channel.publish(chunk_event(session_id::generate(), 1));
    channel.flush();
    EXPECT_TRUE(done.load());
}

}  // namespace kcenon::resumable_upload::test
