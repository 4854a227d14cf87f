#include <gtest/gtest.h>
#include "../../src/store/memory_counter_store.h"
#include <thread>
#include <vector>

using namespace WaitingRoom;

class InMemoryCounterStoreTest : public ::testing::Test {
protected:
    InMemoryCounterStore store_;
};

TEST_F(InMemoryCounterStoreTest, AbsentKeyHasNoValue) {
    auto value = store_.Get("serving_counter");
    ASSERT_TRUE(value.ok());
    EXPECT_FALSE(value->has_value());
}

TEST_F(InMemoryCounterStoreTest, SetReturnsPreviousValue) {
    auto first = store_.Set("queue_counter", 5);
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(first->has_value());

    auto second = store_.Set("queue_counter", 0);
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(second->has_value());
    EXPECT_EQ(**second, 5);

    EXPECT_EQ(**store_.Get("queue_counter"), 0);
}

TEST_F(InMemoryCounterStoreTest, IncrByStartsFromZero) {
    auto value = store_.IncrBy("serving_counter", 10);
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(*value, 10);
    EXPECT_EQ(*store_.IncrBy("serving_counter", 3), 13);
}

TEST_F(InMemoryCounterStoreTest, SetIfGreaterNeverLowers) {
    EXPECT_EQ(*store_.SetIfGreater("max_queue_position_expired", 10), 10);
    EXPECT_EQ(*store_.SetIfGreater("max_queue_position_expired", 7), 10);
    EXPECT_EQ(*store_.SetIfGreater("max_queue_position_expired", 12), 12);
    EXPECT_EQ(**store_.Get("max_queue_position_expired"), 12);
}

TEST_F(InMemoryCounterStoreTest, ConcurrentIncrementsAreAtomic) {
    constexpr int kThreads = 8;
    constexpr int kIncrements = 1000;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this]() {
            for (int j = 0; j < kIncrements; ++j) {
                ASSERT_TRUE(store_.IncrBy("token_counter", 1).ok());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(**store_.Get("token_counter"), kThreads * kIncrements);
    EXPECT_EQ(store_.Size(), 1u);
}

TEST_F(InMemoryCounterStoreTest, ConcurrentMaxSetKeepsTheLargest) {
    std::vector<std::thread> threads;
    for (int i = 1; i <= 16; ++i) {
        threads.emplace_back([this, i]() {
            ASSERT_TRUE(store_.SetIfGreater("max_queue_position_expired", i * 10).ok());
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(**store_.Get("max_queue_position_expired"), 160);
}
