#include <gtest/gtest.h>
#include "atx/concurrency/thread_safe_queue.hpp"

#include <chrono>
#include <thread>
#include <vector>

using atx::concurrency::ThreadSafeQueue;

TEST(ThreadSafeQueue, PushAndPopInOrder) {
    ThreadSafeQueue<int> queue;

    queue.push(1);
    queue.push(2);

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 1);

    auto second = queue.try_pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 2);

    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(ThreadSafeQueue, PushLatestDropsStaleItems) {
    ThreadSafeQueue<int> queue;

    queue.push(1);
    queue.push(2);
    queue.push_latest(3);

    EXPECT_EQ(queue.size(), 1u);
    auto item = queue.try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item.value(), 3);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto item = queue.pop_for(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(item.has_value());
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 40);
}

TEST(ThreadSafeQueue, ShutdownDrainsThenReturnsEmpty) {
    ThreadSafeQueue<int> queue;
    queue.push(7);
    queue.shutdown();

    auto remaining = queue.pop();
    ASSERT_TRUE(remaining.has_value());
    EXPECT_EQ(remaining.value(), 7);

    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, ShutdownWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;
    std::optional<int> received = 0;

    std::thread consumer([&]() { received = queue.pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    EXPECT_FALSE(received.has_value());
}

TEST(ThreadSafeQueue, ManyProducersOneConsumer) {
    ThreadSafeQueue<int> queue;
    const int per_producer = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&queue, per_producer]() {
            for (int i = 0; i < per_producer; ++i) {
                queue.push(1);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    int total = 0;
    while (auto item = queue.try_pop()) {
        total += *item;
    }
    EXPECT_EQ(total, 4 * per_producer);
}
