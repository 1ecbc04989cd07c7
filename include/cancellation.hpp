#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace robot
{

    // Process-wide cooperative stop request. Set by the status worker when the
    // robot ends the program, or by SIGINT/SIGTERM; checked by every loop.
    class CancellationToken
    {
    public:
        CancellationToken() = default;

        // First reason wins; later requests are ignored.
        void request_cancel(const std::string &reason);
        bool is_cancelled() const;
        std::string reason() const;

        // Sleep up to `d`; returns true if cancelled before or during the wait.
        bool wait_for(std::chrono::milliseconds d) const;

        // Block until cancelled.
        void wait() const;

    private:
        std::atomic<bool> cancelled_{false};
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
        std::string reason_;

        CancellationToken(const CancellationToken &) = delete;
        CancellationToken &operator=(const CancellationToken &) = delete;
    };

    // Route SIGINT/SIGTERM into `token` until release_signal_handlers(token);
    // a later call replaces the target.
    void install_signal_handlers(CancellationToken &token);

    // Stop routing signals into `token` if it is the current target. Once this
    // returns no signal delivery is using `token`, so it may be destroyed.
    void release_signal_handlers(CancellationToken &token);

} // namespace robot
