#include <thread>

#include <gtest/gtest.h>

#include <gelfmover/utils/bounded_queue.hpp>
#include <gelfmover/utils/worker_pool.hpp>

#include "helpers.hpp"

using namespace gelfmover;
using namespace std::chrono_literals;


TEST(BoundedQueueTest, TryPushFailsWhenFull) {
    auto queue = utils::BoundedQueue<int>(2);
    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_EQ(queue.size(), 2);

    EXPECT_EQ(queue.pop().value_or(-1), 1);
    EXPECT_TRUE(queue.try_push(3));
}


TEST(BoundedQueueTest, PushWaitsForRoom) {
    auto queue = utils::BoundedQueue<int>(1);
    ASSERT_TRUE(queue.try_push(1));

    auto pushed = std::atomic<bool>(false);
    auto producer = std::jthread([&] {
        EXPECT_TRUE(queue.push(2));
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(queue.pop().value_or(-1), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop().value_or(-1), 2);
}


TEST(BoundedQueueTest, CloseDrainsThenEnds) {
    auto queue = utils::BoundedQueue<int>(4);
    ASSERT_TRUE(queue.try_push(1));
    ASSERT_TRUE(queue.try_push(2));
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.pop().value_or(-1), 1);
    EXPECT_EQ(queue.pop().value_or(-1), 2);
    EXPECT_FALSE(queue.pop().has_value());
}


TEST(BoundedQueueTest, CloseWakesBlockedConsumer) {
    auto queue = utils::BoundedQueue<int>(1);
    auto consumer = std::jthread([&] { EXPECT_FALSE(queue.pop().has_value()); });
    std::this_thread::sleep_for(20ms);
    queue.close();
}


TEST(WorkerPoolTest, ProcessesEveryItemThenJoins) {
    auto queue = std::make_shared<utils::BoundedQueue<int>>(64);
    auto sum = std::atomic<int>(0);
    auto pool = utils::WorkerPool<int>("TestPool", 4, queue, [&](int &&item) { sum += item; });
    EXPECT_EQ(pool.size(), 4);

    for (auto i = 1; i <= 10; ++i) {
        ASSERT_TRUE(queue->push(std::move(i)));
    }
    pool.join();
    EXPECT_EQ(sum.load(), 55);
    EXPECT_TRUE(queue->closed());
}


TEST(WorkerPoolTest, SurvivesThrowingHandler) {
    auto queue = std::make_shared<utils::BoundedQueue<int>>(8);
    auto handled = std::atomic<int>(0);
    auto pool = utils::WorkerPool<int>("TestPool", 1, queue, [&](int &&item) {
        ++handled;
        if (item == 1) {
            throw std::runtime_error("boom");
        }
    });

    ASSERT_TRUE(queue->push(1));
    ASSERT_TRUE(queue->push(2));
    pool.join();
    EXPECT_EQ(handled.load(), 2);
}
