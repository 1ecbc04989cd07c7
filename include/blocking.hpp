#pragma once
#include "cancellation.hpp"
#include <chrono>
#include <functional>

namespace robot
{

    struct BlockPolicy
    {
        std::chrono::milliseconds timeout{10000};
        std::chrono::milliseconds poll{100};
        std::chrono::milliseconds debounce{50}; // re-check before trusting a "done"
    };

    // Wait while `busy()` is true. Returns true once it reads false twice,
    // `debounce` apart. After `timeout`, runs `on_timeout` once and returns
    // false. Throws Cancelled if the token fires while waiting.
    bool block_on(const std::function<bool()> &busy, const std::function<void()> &on_timeout,
                  const BlockPolicy &policy, const CancellationToken &token);

} // namespace robot
