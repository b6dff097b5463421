#include "packfetch/event_queue.hpp"

#include <thread>

#include <gtest/gtest.h>

using namespace packfetch;

namespace {

SessionEvent eventOf(EventKind kind, std::string resource_id = {}) {
    SessionEvent event;
    event.kind = kind;
    event.resource_id = std::move(resource_id);
    return event;
}

} // namespace

TEST(EventQueueTest, DeliversInOrder) {
    EventQueue queue;
    queue.push(eventOf(EventKind::Progress, "a"));
    queue.push(eventOf(EventKind::Progress, "b"));
    queue.push(eventOf(EventKind::Completed));
    EXPECT_EQ(queue.size(), 3u);

    EXPECT_EQ(queue.tryPop()->resource_id, "a");
    EXPECT_EQ(queue.pop(std::chrono::milliseconds(10))->resource_id, "b");
    EXPECT_EQ(queue.tryPop()->kind, EventKind::Completed);
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(EventQueueTest, PopTimesOutWhenEmpty) {
    EventQueue queue;
    EXPECT_FALSE(queue.pop(std::chrono::milliseconds(5)).has_value());
}

TEST(EventQueueTest, PopWakesForAnotherThreadsPush) {
    EventQueue queue;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(eventOf(EventKind::Paused));
    });
    const auto event = queue.pop(std::chrono::seconds(5));
    producer.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EventKind::Paused);
}

TEST(EventQueueTest, CloseDrainsThenStopsAcceptingEvents) {
    EventQueue queue;
    queue.push(eventOf(EventKind::Progress));
    queue.close();
    queue.push(eventOf(EventKind::Completed));

    EXPECT_TRUE(queue.closed());
    EXPECT_TRUE(queue.pop(std::chrono::milliseconds(5)).has_value());
    EXPECT_FALSE(queue.pop(std::chrono::seconds(5)).has_value());
}

TEST(EventQueueTest, KindsHaveStableNames) {
    EXPECT_EQ(toString(EventKind::QuotaWarning), "quotaWarning");
    EXPECT_EQ(toString(EventKind::ResumeOffered), "resumeOffered");
    EXPECT_EQ(toString(EventKind::Cancelled), "cancelled");
}
