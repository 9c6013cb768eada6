#include <gtest/gtest.h>
#include "dtx/events/event_bus.hpp"
#include "dtx/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dtx::events;
using dtx::transfer::SessionState;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::uint64_t received_session = 0;
    bus.subscribe<TransferStartedEvent>([&](const TransferStartedEvent& e) {
        received_session = e.session_id;
    });

    TransferStartedEvent started;
    started.session_id = 7;
    started.remote_path = "DCIM";
    bus.emit(started);

    EXPECT_EQ(received_session, 7u);
}

TEST(EventBus, DeliversOnlyMatchingType) {
    EventBus bus;

    int progress_count = 0;
    int finished_count = 0;
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { progress_count++; });
    bus.subscribe<TransferFinishedEvent>([&](const TransferFinishedEvent&) { finished_count++; });

    bus.emit(TransferProgressEvent{});
    bus.emit(TransferProgressEvent{});
    bus.emit(TransferFinishedEvent{});
    bus.emit(SizeProbedEvent{});

    EXPECT_EQ(progress_count, 2);
    EXPECT_EQ(finished_count, 1);
}

TEST(EventBus, HandlersRunInSubscriptionOrder) {
    EventBus bus;

    std::vector<int> order;
    bus.subscribe<SessionStateChangedEvent>([&](const SessionStateChangedEvent&) { order.push_back(1); });
    bus.subscribe<SessionStateChangedEvent>([&](const SessionStateChangedEvent&) { order.push_back(2); });
    bus.subscribe<SessionStateChangedEvent>([&](const SessionStateChangedEvent&) { order.push_back(3); });

    bus.emit(SessionStateChangedEvent{1, SessionState::Idle, SessionState::Probing});

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<TransferFinishedEvent>([&](const TransferFinishedEvent&) { count++; });

    bus.emit(TransferFinishedEvent{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<TransferFinishedEvent>(id);

    bus.emit(TransferFinishedEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(TransferFinishedEvent{}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<TransferProgressEvent>([](const TransferProgressEvent&) {
        throw std::runtime_error("renderer failed");
    });
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(TransferProgressEvent{}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;

    int count = 0;
    size_t id = 0;
    id = bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent&) {
        count++;
        bus.unsubscribe<TransferProgressEvent>(id);
    });

    bus.emit(TransferProgressEvent{});
    bus.emit(TransferProgressEvent{});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<TransferProgressEvent>(), 0u);
}

TEST(EventBus, ConcurrentSubscribe) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<TransferStartedEvent>([&count](const TransferStartedEvent&) {
                count++;
            });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bus.emit(TransferStartedEvent{});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<TransferProgressEvent>([&bytes](const TransferProgressEvent& e) {
        bytes += e.progress.bytes_transferred;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            TransferProgressEvent event;
            event.progress.bytes_transferred = 2;
            bus.emit(event);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes, 100u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<TransferFinishedEvent>(), 0u);

    auto id = bus.subscribe<TransferFinishedEvent>([](const TransferFinishedEvent&) {});
    bus.subscribe<TransferFinishedEvent>([](const TransferFinishedEvent&) {});
    bus.subscribe<SizeProbedEvent>([](const SizeProbedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<TransferFinishedEvent>(), 2u);

    bus.unsubscribe<TransferFinishedEvent>(id);
    EXPECT_EQ(bus.subscriber_count<TransferFinishedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<TransferFinishedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SizeProbedEvent>(), 0u);
}
