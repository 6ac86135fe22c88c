#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "cancellation_signal.hpp"

namespace {

using namespace std::chrono_literals;

TEST(CancellationSignalTest, StartsUnset) {
    CancellationSignal signal;
    EXPECT_FALSE(signal.is_set());
    EXPECT_FALSE(signal.wait_for(1ms));
}

TEST(CancellationSignalTest, OnlyFirstSetTransitions) {
    CancellationSignal signal;
    EXPECT_TRUE(signal.set());
    EXPECT_FALSE(signal.set());
    EXPECT_TRUE(signal.is_set());
    EXPECT_TRUE(signal.wait_for(0ms));
}

TEST(CancellationSignalTest, WakesAllWaiters) {
    CancellationSignal signal;
    std::atomic<int> woken{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; i++) {
        waiters.emplace_back([&] {
            signal.wait();
            woken++;
        });
    }
    std::this_thread::sleep_for(10ms);
    EXPECT_EQ(woken.load(), 0);

    signal.set();
    for (auto& t : waiters) {
        t.join();
    }
    EXPECT_EQ(woken.load(), 4);
}

TEST(CancellationSignalTest, ConcurrentSettersTransitionOnce) {
    CancellationSignal signal;
    std::atomic<int> transitions{0};
    std::vector<std::thread> setters;
    for (int i = 0; i < 8; i++) {
        setters.emplace_back([&] {
            if (signal.set()) transitions++;
        });
    }
    for (auto& t : setters) {
        t.join();
    }
    EXPECT_EQ(transitions.load(), 1);
}

}  // namespace
