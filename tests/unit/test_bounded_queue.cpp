#include <gtest/gtest.h>
#include "queue/bounded_queue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tether;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, PushPopSingleItem) {
    BoundedQueue<int> queue(16);

    EXPECT_TRUE(queue.try_push(42));

    auto result = queue.try_pop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(BoundedQueueTest, PopFromEmptyReturnsNullopt) {
    BoundedQueue<int> queue(16);

    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(BoundedQueueTest, FIFOOrdering) {
    BoundedQueue<int> queue(16);

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(queue.try_push(int{i}));
    }

    for (int i = 0; i < 10; ++i) {
        auto result = queue.try_pop();
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, i);
    }
}

TEST(BoundedQueueTest, PushFailsWhenFull) {
    BoundedQueue<int> queue(3);

    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_TRUE(queue.try_push(3));
    EXPECT_TRUE(queue.is_full());

    EXPECT_FALSE(queue.try_push(4));
    EXPECT_EQ(queue.size(), 3u);
}

TEST(BoundedQueueTest, FailedPushLeavesValueIntact) {
    BoundedQueue<std::string> queue(1);
    EXPECT_TRUE(queue.try_push(std::string("first")));

    std::string value = "second";
    EXPECT_FALSE(queue.try_push(std::move(value)));
    EXPECT_EQ(value, "second");
}

TEST(BoundedQueueTest, PushSucceedsAfterPop) {
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_FALSE(queue.try_push(3));

    EXPECT_TRUE(queue.try_pop().has_value());

    EXPECT_TRUE(queue.try_push(3));
}

TEST(BoundedQueueTest, ZeroCapacityIsUnbounded) {
    BoundedQueue<int> queue(0);

    for (int i = 0; i < 10000; ++i) {
        ASSERT_TRUE(queue.try_push(int{i}));
    }
    EXPECT_FALSE(queue.is_full());
    EXPECT_EQ(queue.size(), 10000u);
}

TEST(BoundedQueueTest, PopForTimesOut) {
    BoundedQueue<int> queue(4);

    auto start = std::chrono::steady_clock::now();
    auto result = queue.pop_for(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.has_value());
    EXPECT_GE(elapsed, 45ms);
}

TEST(BoundedQueueTest, PopForWakesOnPush) {
    BoundedQueue<int> queue(4);

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(20ms);
        EXPECT_TRUE(queue.try_push(7));
    });

    auto result = queue.pop_for(2s);
    producer.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer) {
    BoundedQueue<int> queue(4);

    std::thread closer([&queue]() {
        std::this_thread::sleep_for(20ms);
        queue.close();
    });

    auto result = queue.pop();
    closer.join();

    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(queue.is_closed());
}

TEST(BoundedQueueTest, CloseRejectsPushButDrainsRemaining) {
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));

    queue.close();

    EXPECT_FALSE(queue.try_push(3));
    EXPECT_EQ(queue.pop().value_or(-1), 1);
    EXPECT_EQ(queue.pop_for(10ms).value_or(-1), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueueTest, PopListenerFiresAfterEachPop) {
    BoundedQueue<int> queue(4);
    int pops = 0;
    queue.set_pop_listener([&pops]() { ++pops; });

    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_EQ(pops, 0);

    (void)queue.try_pop();
    (void)queue.pop_for(10ms);
    (void)queue.try_pop();  // Empty, no pop

    EXPECT_EQ(pops, 2);
}

TEST(BoundedQueueTest, PopListenerMayPushAgain) {
    BoundedQueue<int> queue(1);
    int refills = 0;
    queue.set_pop_listener([&]() {
        if (refills < 3) {
            ++refills;
            EXPECT_TRUE(queue.try_push(100 + refills));
        }
    });

    EXPECT_TRUE(queue.try_push(100));
    std::vector<int> seen;
    while (auto v = queue.try_pop()) {
        seen.push_back(*v);
    }

    EXPECT_EQ(seen, (std::vector<int>{100, 101, 102, 103}));
}

TEST(BoundedQueueTest, MoveOnlyType) {
    BoundedQueue<std::unique_ptr<int>> queue(4);

    EXPECT_TRUE(queue.try_push(std::make_unique<int>(42)));

    auto result = queue.try_pop();
    ASSERT_TRUE(result.has_value());
    ASSERT_NE(*result, nullptr);
    EXPECT_EQ(**result, 42);
}

TEST(BoundedQueueTest, ConcurrentProducerConsumer) {
    BoundedQueue<int> queue(64);
    constexpr int kCount = 100000;
    std::atomic<bool> producer_done{false};

    std::thread producer([&]() {
        for (int i = 0; i < kCount; ++i) {
            int value = i;
            while (!queue.try_push(std::move(value))) {
                std::this_thread::yield();
            }
        }
        producer_done = true;
    });

    std::vector<int> received;
    received.reserve(kCount);
    while (received.size() < static_cast<std::size_t>(kCount)) {
        if (auto v = queue.pop_for(1s)) {
            received.push_back(*v);
        } else if (producer_done) {
            break;
        }
    }

    producer.join();

    ASSERT_EQ(received.size(), static_cast<std::size_t>(kCount));
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(received[i], i) << "Mismatch at index " << i;
    }
}
