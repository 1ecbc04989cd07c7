#include <gtest/gtest.h>
#include "blocking.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace robot;
using std::chrono::milliseconds;

namespace {

BlockPolicy short_policy()
{
    BlockPolicy p;
    p.timeout = milliseconds(200);
    p.poll = milliseconds(10);
    p.debounce = milliseconds(5);
    return p;
}

long long elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

TEST(BlockOnTest, IdleReturnsImmediately) {
    CancellationToken token;
    int timeouts = 0;
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(block_on([] { return false; }, [&] { ++timeouts; }, short_policy(), token));
    EXPECT_LT(elapsed_ms(start), 100);
    EXPECT_EQ(timeouts, 0);
}

// Stuck predicate: give up after the timeout and run the fallback once
TEST(BlockOnTest, BusyTimesOutAndRunsFallbackOnce) {
    CancellationToken token;
    int timeouts = 0;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(block_on([] { return true; }, [&] { ++timeouts; }, short_policy(), token));
    EXPECT_GE(elapsed_ms(start), 200);
    EXPECT_LT(elapsed_ms(start), 2000);
    EXPECT_EQ(timeouts, 1);
}

// A single stale "idle" reading is not trusted
TEST(BlockOnTest, DebounceIgnoresSingleGlitch) {
    CancellationToken token;
    int calls = 0;
    auto busy = [&] {
        ++calls;
        return calls != 1 && calls < 6;
    };
    EXPECT_TRUE(block_on(busy, nullptr, short_policy(), token));
    EXPECT_GE(calls, 7);
}

TEST(BlockOnTest, FinishesWhenWorkCompletes) {
    CancellationToken token;
    std::atomic<bool> moving{true};
    std::thread robot([&] {
        std::this_thread::sleep_for(milliseconds(60));
        moving = false;
    });
    EXPECT_TRUE(block_on([&] { return moving.load(); }, nullptr, short_policy(), token));
    robot.join();
}

TEST(BlockOnTest, CancellationThrows) {
    CancellationToken token;
    token.request_cancel("stopped");
    EXPECT_THROW(block_on([] { return true; }, nullptr, short_policy(), token), Cancelled);
}
