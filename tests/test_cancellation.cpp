#include <gtest/gtest.h>
#include "cancellation.hpp"
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace robot;

TEST(CancellationTokenTest, FirstReasonWins) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    token.request_cancel("power button pressed");
    token.request_cancel("received SIGINT");
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(token.reason(), "power button pressed");
}

TEST(CancellationTokenTest, WaitForTimesOut) {
    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

// A waiter wakes as soon as another thread cancels
TEST(CancellationTokenTest, WaitWakesOnCancel) {
    CancellationToken token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.request_cancel("done");
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    token.wait();
    canceller.join();
}

// Test SIGTERM reaching the installed token
TEST(SignalHandlerTest, SignalCancelsInstalledToken) {
    CancellationToken token;
    install_signal_handlers(token);
    std::raise(SIGTERM);
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(2)));
    EXPECT_EQ(token.reason(), "received SIGTERM");
    release_signal_handlers(token);
}

// A released token can be destroyed; later signals only get logged
TEST(SignalHandlerTest, ReleasedTokenIsNotSignalled) {
    auto token = std::make_unique<CancellationToken>();
    install_signal_handlers(*token);
    release_signal_handlers(*token);
    token.reset();

    CancellationToken other;
    std::raise(SIGINT);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(other.is_cancelled());
}

// Releasing a token that is not the target leaves routing alone
TEST(SignalHandlerTest, ReleaseOfOtherTokenKeepsTarget) {
    CancellationToken token;
    CancellationToken stale;
    install_signal_handlers(token);
    release_signal_handlers(stale);
    std::raise(SIGINT);
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(2)));
    release_signal_handlers(token);
}
