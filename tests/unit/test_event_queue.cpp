#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/event_queue.hpp"

namespace {

using toolpilot::runtime::EventQueue;

struct Tagged {
    int producer;
    int sequence;
};

TEST(EventQueueTest, PopsInPushOrder) {
    EventQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);
    EXPECT_EQ(queue.size(), 3u);

    EXPECT_EQ(queue.try_pop().value(), 1);
    EXPECT_EQ(queue.wait_pop().value(), 2);
    EXPECT_EQ(queue.drain(), (std::vector<int>{3}));
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(EventQueueTest, WaitPopUntilTimesOutWhenEmpty) {
    EventQueue<std::string> queue;
    const auto started = std::chrono::steady_clock::now();
    auto event = queue.wait_pop_until(started + std::chrono::milliseconds(50));
    EXPECT_FALSE(event.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(50));
}

TEST(EventQueueTest, WaitPopUntilWakesOnPush) {
    EventQueue<std::string> queue;
    std::thread producer([&queue] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push("exit");
    });
    auto event = queue.wait_pop_until(std::chrono::steady_clock::now() + std::chrono::seconds(5));
    producer.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event.value(), "exit");
}

TEST(EventQueueTest, KeepsPerProducerOrderWithoutLoss) {
    constexpr int kProducers = 4;
    constexpr int kEventsPerProducer = 500;
    EventQueue<Tagged> queue;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < kEventsPerProducer; ++i) {
                queue.push(Tagged{p, i});
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    std::vector<int> next(kProducers, 0);
    int total = 0;
    while (auto event = queue.try_pop()) {
        EXPECT_EQ(event->sequence, next[event->producer]);
        next[event->producer] = event->sequence + 1;
        ++total;
    }
    EXPECT_EQ(total, kProducers * kEventsPerProducer);
}

}  // namespace
