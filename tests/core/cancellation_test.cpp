#include "harvest/core/cancellation.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using harvest::CancellationToken;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, StartsUncancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.sleep_for(0ms));
    EXPECT_TRUE(token.sleep_for(5ms));
}

TEST(CancellationTokenTest, SleepReturnsFalseOnceCancelled) {
    CancellationToken token;
    token.request_cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_FALSE(token.sleep_for(0ms));
    EXPECT_FALSE(token.sleep_for(10s));
}

TEST(CancellationTokenTest, CancelWakesSleeper) {
    CancellationToken token;
    const auto started = std::chrono::steady_clock::now();

    std::thread canceller([&token] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    const bool completed = token.sleep_for(30s);
    canceller.join();

    EXPECT_FALSE(completed);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(CancellationTokenTest, SignalStyleRequestIsObservedBySleeper) {
    CancellationToken token;
    const auto started = std::chrono::steady_clock::now();

    std::thread requester([&token] {
        std::this_thread::sleep_for(20ms);
        token.request_cancel();   // no notification, sleeper must poll
    });
    const bool completed = token.sleep_for(30s);
    requester.join();

    EXPECT_FALSE(completed);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}
