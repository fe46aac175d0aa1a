// =============================================================================
// Unit tests for EventBus (src/event_bus.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "event_bus.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace retina;

// ---------------------------------------------------------------------------
// Basic subscribe + publish
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscribeAndPublish) {
    EventBus bus;
    int received = 0;
    std::string template_id;

    auto sub = bus.subscribe<MatchEvent>([&](const MatchEvent& e) {
        received++;
        template_id = e.template_id;
    });

    MatchEvent ev;
    ev.tick = 7;
    ev.matched = true;
    ev.template_id = "open_door";
    ev.confidence = 1.0f;
    bus.publish(ev);

    EXPECT_EQ(received, 1);
    EXPECT_EQ(template_id, "open_door");
}

// ---------------------------------------------------------------------------
// Several subscribers see the same event
// ---------------------------------------------------------------------------
TEST(EventBusTest, MultipleSubscribers) {
    EventBus bus;
    int a = 0, b = 0;
    auto sa = bus.subscribe<DispatchEvent>([&](const DispatchEvent&) { a++; });
    auto sb = bus.subscribe<DispatchEvent>([&](const DispatchEvent&) { b++; });

    bus.publish(DispatchEvent{});
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);
}

// ---------------------------------------------------------------------------
// RAII unsubscribe, release(), moves
// ---------------------------------------------------------------------------
TEST(EventBusTest, UnsubscribeOnHandleDestruction) {
    EventBus bus;
    int count = 0;
    {
        auto sub = bus.subscribe<SessionStateEvent>([&](const SessionStateEvent&) { count++; });
        bus.publish(SessionStateEvent{});
        EXPECT_TRUE(bus.has_subscribers<SessionStateEvent>());
    }
    bus.publish(SessionStateEvent{});
    EXPECT_EQ(count, 1);
    EXPECT_FALSE(bus.has_subscribers<SessionStateEvent>());
}

TEST(EventBusTest, ReleaseKeepsSubscription) {
    EventBus bus;
    int count = 0;
    {
        auto sub = bus.subscribe<DispatchEvent>([&](const DispatchEvent&) { count++; });
        sub.release();
    }
    bus.publish(DispatchEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBusTest, HandleMoveKeepsSubscription) {
    EventBus bus;
    int count = 0;
    SubscriptionHandle outer;
    {
        auto inner = bus.subscribe<MatchEvent>([&](const MatchEvent&) { count++; });
        outer = std::move(inner);
    }
    bus.publish(MatchEvent{});
    EXPECT_EQ(count, 1);

    outer = SubscriptionHandle();
    bus.publish(MatchEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// Types are routed independently
// ---------------------------------------------------------------------------
TEST(EventBusTest, EventTypeIsolation) {
    EventBus bus;
    int matches = 0, dispatches = 0;
    auto s1 = bus.subscribe<MatchEvent>([&](const MatchEvent&) { matches++; });
    auto s2 = bus.subscribe<DispatchEvent>([&](const DispatchEvent&) { dispatches++; });

    bus.publish(MatchEvent{});
    EXPECT_EQ(matches, 1);
    EXPECT_EQ(dispatches, 0);
}

// ---------------------------------------------------------------------------
// Subscriber counts and publishing from inside a handler
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscriberCount) {
    EventBus bus;
    EXPECT_EQ(bus.subscriber_count<DispatchEvent>(), 0u);
    auto a = bus.subscribe<DispatchEvent>([](const DispatchEvent&) {});
    auto b = bus.subscribe<DispatchEvent>([](const DispatchEvent&) {});
    EXPECT_EQ(bus.subscriber_count<DispatchEvent>(), 2u);
    EXPECT_EQ(bus.subscriber_count<MatchEvent>(), 0u);
    a = SubscriptionHandle();
    EXPECT_EQ(bus.subscriber_count<DispatchEvent>(), 1u);
}

TEST(EventBusTest, HandlerMayPublish) {
    EventBus bus;
    int dispatches = 0;
    auto d = bus.subscribe<DispatchEvent>([&](const DispatchEvent& e) {
        dispatches++;
        EXPECT_EQ(e.label, "press,176");
    });
    auto m = bus.subscribe<MatchEvent>([&](const MatchEvent& e) {
        DispatchEvent out;
        out.label = e.template_id;
        bus.publish(out);
    });

    MatchEvent ev;
    ev.template_id = "press,176";
    bus.publish(ev);
    EXPECT_EQ(dispatches, 1);
}

// ---------------------------------------------------------------------------
// A throwing handler does not stop the others
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandlerExceptionIsCaught) {
    EventBus bus;
    int good = 0;
    auto s1 = bus.subscribe<DispatchEvent>([](const DispatchEvent&) {
        throw std::runtime_error("boom");
    });
    auto s2 = bus.subscribe<DispatchEvent>([&](const DispatchEvent&) { good++; });

    EXPECT_NO_THROW(bus.publish(DispatchEvent{}));
    EXPECT_EQ(good, 1);
}

// ---------------------------------------------------------------------------
// Publishing from several threads
// ---------------------------------------------------------------------------
TEST(EventBusTest, ConcurrentPublish) {
    EventBus bus;
    std::atomic<int> count{0};
    auto sub = bus.subscribe<MatchEvent>([&](const MatchEvent&) { count++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&bus]() {
            for (int i = 0; i < 250; ++i) bus.publish(MatchEvent{});
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(count.load(), 1000);
}
