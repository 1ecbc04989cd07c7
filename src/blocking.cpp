#include "blocking.hpp"
#include "errors.hpp"

namespace robot
{

    bool block_on(const std::function<bool()> &busy, const std::function<void()> &on_timeout,
                  const BlockPolicy &policy, const CancellationToken &token)
    {
        const auto start = std::chrono::steady_clock::now();
        while (true)
        {
            if (!busy())
            {
                if (token.wait_for(policy.debounce))
                    throw Cancelled("cancelled while waiting: " + token.reason());
                if (!busy())
                    return true;
            }

            const auto elapsed = std::chrono::steady_clock::now() - start;
            if (token.wait_for(policy.poll))
                throw Cancelled("cancelled while waiting: " + token.reason());
            if (elapsed > policy.timeout)
            {
                if (on_timeout)
                    on_timeout();
                return false;
            }
        }
    }

} // namespace robot
