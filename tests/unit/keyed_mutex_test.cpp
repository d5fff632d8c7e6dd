#include "common/keyed_mutex.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace hearth;

TEST(KeyedMutexTest, EntriesAreDroppedWhenReleased) {
    KeyedMutex locks;
    for (int i = 0; i < 500; ++i) {
        auto section = locks.lock("plugin_" + std::to_string(i));
        EXPECT_TRUE(section.owns_lock());
        EXPECT_EQ(locks.size(), 1u);
    }
    EXPECT_EQ(locks.size(), 0u);
}

TEST(KeyedMutexTest, SameKeyIsExclusiveOtherKeysAreNot) {
    KeyedMutex locks;
    auto held = locks.lock("lights");

    auto busy = locks.try_lock("lights");
    EXPECT_FALSE(busy.owns_lock());
    auto other = locks.try_lock("scenes");
    EXPECT_TRUE(other.owns_lock());
    EXPECT_EQ(locks.size(), 2u);

    busy.unlock();
    other.unlock();
    EXPECT_EQ(locks.size(), 1u);

    held.unlock();
    EXPECT_EQ(locks.size(), 0u);
    EXPECT_TRUE(locks.try_lock("lights").owns_lock());
}

TEST(KeyedMutexTest, WaiterKeepsTheEntryAlive) {
    KeyedMutex locks;
    auto held = locks.lock("lights");

    std::atomic<bool> entered{false};
    std::thread waiter([&] {
        auto section = locks.lock("lights");
        entered = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(entered.load());
    // Released by the holder, still waited on
    held.unlock();
    waiter.join();
    EXPECT_TRUE(entered.load());
    EXPECT_EQ(locks.size(), 0u);
}

TEST(KeyedMutexTest, MovedSectionReleasesOnce) {
    KeyedMutex locks;
    {
        auto first = locks.lock("lights");
        KeyedMutex::Section second = std::move(first);
        EXPECT_FALSE(first.owns_lock());
        EXPECT_TRUE(second.owns_lock());
        EXPECT_EQ(locks.size(), 1u);
    }
    EXPECT_EQ(locks.size(), 0u);
}
