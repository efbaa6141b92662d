#include <gtest/gtest.h>
#include "tandem/events/event_bus.hpp"
#include "tandem/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tandem::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::string received_session;

    bus.subscribe<SessionCreatedEvent>([&](const SessionCreatedEvent& e) {
        handler_called = true;
        received_session = e.session_id;
    });

    bus.emit(SessionCreatedEvent{"ABC234", "host-1", 1000});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_session, "ABC234");
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<SessionEndedEvent>([&](const SessionEndedEvent&) { count++; });
    bus.subscribe<SessionEndedEvent>([&](const SessionEndedEvent&) { count++; });
    bus.subscribe<SessionEndedEvent>([&](const SessionEndedEvent&) { count++; });

    bus.emit(SessionEndedEvent{"ABC234", tandem::sync::EndReason::HostEnded});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int joined = 0;
    int disconnected = 0;

    bus.subscribe<PeerJoinedEvent>([&](const PeerJoinedEvent&) { joined++; });
    bus.subscribe<PeerDisconnectedEvent>([&](const PeerDisconnectedEvent&) { disconnected++; });

    bus.emit(PeerJoinedEvent{"S1", "u1"});
    bus.emit(PeerDisconnectedEvent{"S1", "u1"});
    bus.emit(PeerJoinedEvent{"S1", "u1", tandem::sync::PeerRole::Client, true});

    EXPECT_EQ(joined, 2);
    EXPECT_EQ(disconnected, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<OffsetChangedEvent>([&](const OffsetChangedEvent&) { count++; });

    bus.emit(OffsetChangedEvent{"S1", 10, 10});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<OffsetChangedEvent>(id);

    bus.emit(OffsetChangedEvent{"S1", 20, 20});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(SessionCreatedEvent{"S1", "host"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int count = 0;

    bus.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent&) {
        throw std::runtime_error("subscriber failure");
    });
    bus.subscribe<SessionCreatedEvent>([&](const SessionCreatedEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(SessionCreatedEvent{"S1", "host"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMaySubscribeWhileEmitting) {
    EventBus bus;
    int late = 0;

    bus.subscribe<SessionCreatedEvent>([&](const SessionCreatedEvent&) {
        bus.subscribe<SessionEndedEvent>([&](const SessionEndedEvent&) { late++; });
    });

    bus.emit(SessionCreatedEvent{"S1", "host"});
    bus.emit(SessionEndedEvent{"S1"});

    EXPECT_EQ(late, 1);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<PeerJoinedEvent>([&count](const PeerJoinedEvent&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    bus.emit(PeerJoinedEvent{"S1", "u1"});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<OffsetChangedEvent>([&count](const OffsetChangedEvent& e) {
        count += static_cast<int>(e.applied_ms);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(OffsetChangedEvent{"S1", 1, 1});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 100);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<SessionCreatedEvent>(), 0u);

    auto id1 = bus.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<SessionCreatedEvent>(), 1u);

    bus.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<SessionCreatedEvent>(), 2u);

    bus.unsubscribe<SessionCreatedEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<SessionCreatedEvent>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent&) {});
    bus.subscribe<SessionEndedEvent>([](const SessionEndedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<SessionCreatedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SessionEndedEvent>(), 0u);
}
