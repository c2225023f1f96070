/**
 * @file test_work_queue.cpp
 * @brief BoundedWorkQueue capacity, ordering and close semantics
 */

#include "discovery/work_queue.h"

#include <gtest/gtest.h>
#include <thread>

using zonelink::discovery::BoundedWorkQueue;
using namespace std::chrono_literals;

TEST(BoundedWorkQueueTest, PreservesFifoOrder) {
    BoundedWorkQueue<int> queue(4);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_TRUE(queue.tryPush(3));
    EXPECT_EQ(queue.size(), 3u);

    EXPECT_EQ(queue.pop(10ms).value_or(-1), 1);
    EXPECT_EQ(queue.pop(10ms).value_or(-1), 2);
    EXPECT_EQ(queue.pop(10ms).value_or(-1), 3);
    EXPECT_FALSE(queue.pop(10ms).has_value());
}

TEST(BoundedWorkQueueTest, TryPushFailsWhenFull) {
    BoundedWorkQueue<int> queue(2);
    EXPECT_EQ(queue.capacity(), 2u);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_FALSE(queue.tryPush(3));
    EXPECT_FALSE(queue.push(3, 20ms));
}

TEST(BoundedWorkQueueTest, BlockingPushWaitsForSpace) {
    BoundedWorkQueue<int> queue(1);
    ASSERT_TRUE(queue.tryPush(1));

    std::thread consumer([&]() {
        std::this_thread::sleep_for(30ms);
        queue.pop(100ms);
    });
    EXPECT_TRUE(queue.push(2, 1000ms));
    consumer.join();
    EXPECT_EQ(queue.pop(10ms).value_or(-1), 2);
}

TEST(BoundedWorkQueueTest, CloseDrainsThenReportsEmpty) {
    BoundedWorkQueue<int> queue(4);
    queue.tryPush(7);
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.tryPush(8));
    EXPECT_EQ(queue.pop(10ms).value_or(-1), 7);
    EXPECT_FALSE(queue.pop(10ms).has_value());
}

TEST(BoundedWorkQueueTest, CloseWakesBlockedConsumer) {
    BoundedWorkQueue<int> queue(4);
    std::thread consumer([&]() { EXPECT_FALSE(queue.pop(5000ms).has_value()); });
    std::this_thread::sleep_for(20ms);
    auto start = std::chrono::steady_clock::now();
    queue.close();
    consumer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);
}
