#include <gtest/gtest.h>
#include "lexsync/events/components.hpp"
#include "lexsync/events/event_bus.hpp"
#include "lexsync/events/log.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lexsync::events;

// Test event types
struct PingEvent {
    int value;
    std::string message;
};

struct OtherEvent {
    double data;
};

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    int received_value = 0;

    auto sub = bus.subscribe<PingEvent>([&](const PingEvent& e) {
        handler_called = true;
        received_value = e.value;
    });

    bus.emit(PingEvent{42, "ping"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_value, 42);
    EXPECT_TRUE(sub.active());
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;
    int count = 0;

    auto a = bus.subscribe<PingEvent>([&](const PingEvent&) { count++; });
    auto b = bus.subscribe<PingEvent>([&](const PingEvent&) { count++; });
    auto c = bus.subscribe<PingEvent>([&](const PingEvent&) { count++; });

    bus.emit(PingEvent{1, "ping"});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;
    int ping_count = 0;
    int other_count = 0;

    auto a = bus.subscribe<PingEvent>([&](const PingEvent&) { ping_count++; });
    auto b = bus.subscribe<OtherEvent>([&](const OtherEvent&) { other_count++; });

    bus.emit(PingEvent{1, "ping"});
    bus.emit(OtherEvent{3.14});
    bus.emit(PingEvent{2, "ping"});

    EXPECT_EQ(ping_count, 2);
    EXPECT_EQ(other_count, 1);
}

TEST(EventBus, UnsubscribeThroughHandle) {
    EventBus bus;
    int count = 0;
    auto sub = bus.subscribe<PingEvent>([&](const PingEvent&) { count++; });

    bus.emit(PingEvent{1, "ping"});
    EXPECT_EQ(count, 1);

    sub.unsubscribe();
    EXPECT_FALSE(sub.active());

    bus.emit(PingEvent{2, "ping"});
    EXPECT_EQ(count, 1);

    // second call is a no-op
    sub.unsubscribe();
}

TEST(EventBus, MovedHandleOwnsTheSubscription) {
    EventBus bus;
    int count = 0;
    auto first = bus.subscribe<PingEvent>([&](const PingEvent&) { count++; });
    Subscription second = std::move(first);

    EXPECT_FALSE(first.active());
    first.unsubscribe();
    bus.emit(PingEvent{1, "ping"});
    EXPECT_EQ(count, 1);

    second.unsubscribe();
    bus.emit(PingEvent{2, "ping"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandleOutlivingBusIsHarmless) {
    Subscription sub;
    {
        EventBus bus;
        sub = bus.subscribe<PingEvent>([](const PingEvent&) {});
    }
    EXPECT_NO_THROW(sub.unsubscribe());
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int count = 0;

    auto a = bus.subscribe<PingEvent>([](const PingEvent&) { throw std::runtime_error("boom"); });
    auto b = bus.subscribe<PingEvent>([&](const PingEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(PingEvent{1, "ping"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;
    int count = 0;
    Subscription sub;
    sub = bus.subscribe<PingEvent>([&](const PingEvent&) {
        count++;
        sub.unsubscribe();
    });

    bus.emit(PingEvent{1, "ping"});
    bus.emit(PingEvent{2, "ping"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(PingEvent{1, "ping"}));
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};
    std::vector<Subscription> subs(10);

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count, &subs, i]() {
            subs[i] = bus.subscribe<PingEvent>([&count](const PingEvent&) { count++; });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bus.emit(PingEvent{42, "ping"});
    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    auto sub = bus.subscribe<PingEvent>([&count](const PingEvent& e) { count += e.value; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() { bus.emit(PingEvent{1, "ping"}); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 100);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;
    EXPECT_EQ(bus.subscriber_count<PingEvent>(), 0u);

    auto first = bus.subscribe<PingEvent>([](const PingEvent&) {});
    EXPECT_EQ(bus.subscriber_count<PingEvent>(), 1u);

    auto second = bus.subscribe<PingEvent>([](const PingEvent&) {});
    EXPECT_EQ(bus.subscriber_count<PingEvent>(), 2u);

    first.unsubscribe();
    EXPECT_EQ(bus.subscriber_count<PingEvent>(), 1u);
}

TEST(PublishLog, StampsAndForwardsEntry) {
    EventBus bus;
    std::vector<LogEntryEvent> entries;
    auto sub = bus.subscribe<LogEntryEvent>([&](const LogEntryEvent& e) { entries.push_back(e); });

    publish_log(bus, LogLevel::Warning, "Session timed out", std::string("idle for 10 ms"));
    publish_log(bus, LogLevel::Success, "Sent: a.txt");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::Warning);
    EXPECT_EQ(entries[0].message, "Session timed out");
    ASSERT_TRUE(entries[0].detail.has_value());
    EXPECT_EQ(*entries[0].detail, "idle for 10 ms");
    EXPECT_GT(entries[0].timestamp, 0);
    EXPECT_FALSE(entries[1].detail.has_value());
}

TEST(LoggerComponent, DetachesOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<LogEntryEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<ConnectionStateChangedEvent>(), 1u);
        EXPECT_NO_THROW(publish_log(bus, LogLevel::Info, "hello"));
    }
    EXPECT_EQ(bus.subscriber_count<LogEntryEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SyncStatusChangedEvent>(), 0u);
}
