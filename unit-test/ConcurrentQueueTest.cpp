#include <chrono>
#include <climits>
#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

TEST(ConcurrentQueueTest, HigherPriorityFirstThenFifo) {
    concurrent_queue<string> queue;
    queue.push("a");
    queue.push("b");
    queue.push("urgent", 5);
    queue.push("c");

    EXPECT_EQ(*queue.pop(), "urgent");
    EXPECT_EQ(*queue.pop(), "a");
    EXPECT_EQ(*queue.pop(), "b");
    EXPECT_EQ(*queue.pop(), "c");
}

TEST(ConcurrentQueueTest, ExtremePriorities) {
    concurrent_queue<string> queue;
    queue.push("lowest", INT_MIN);
    queue.push("normal");
    queue.push("highest", INT_MAX);
    queue.push("lowest again", INT_MIN);

    EXPECT_EQ(*queue.pop(), "highest");
    EXPECT_EQ(*queue.pop(), "normal");
    EXPECT_EQ(*queue.pop(), "lowest");
    EXPECT_EQ(*queue.pop(), "lowest again");
}

TEST(ConcurrentQueueTest, CapacityAndClose) {
    concurrent_queue<int> queue(2);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.size(), 2u);

    auto removed = queue.remove_if([](int value) { return value == 1; });
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], 1);

    queue.close();
    EXPECT_FALSE(queue.push(4));
    EXPECT_EQ(*queue.pop(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ConcurrentQueueTest, CloseWakesBlockedReader) {
    concurrent_queue<int> queue;
    thread reader([&] { EXPECT_FALSE(queue.pop().has_value()); });
    this_thread::sleep_for(chrono::milliseconds(20));
    queue.close();
    reader.join();
}
