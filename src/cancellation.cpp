#include "cancellation.hpp"

#include <csignal>
#include <iostream>
#include <mutex>
#include <thread>

namespace robot
{

    namespace
    {
        // Held while a signal is delivered so a released token is never touched
        std::mutex g_target_mutex;
        CancellationToken *g_signal_target = nullptr;
        std::atomic<int> g_pending_signal{0};
        std::once_flag g_watcher_once;

        void on_signal(int signum)
        {
            // Only lock-free atomics here; the watcher thread does the rest.
            g_pending_signal.store(signum);
        }

        void signal_watcher()
        {
            while (true)
            {
                int sig = g_pending_signal.exchange(0);
                if (sig != 0)
                {
                    std::string name = sig == SIGINT ? "SIGINT" : sig == SIGTERM ? "SIGTERM" : std::to_string(sig);
                    std::cerr << "[Signal] Received signal " << name << " (" << sig << ")\n";
                    std::lock_guard<std::mutex> lock(g_target_mutex);
                    if (g_signal_target)
                        g_signal_target->request_cancel("received " + name);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
    } // namespace

    void CancellationToken::request_cancel(const std::string &reason)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_)
                return;
            reason_ = reason;
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool CancellationToken::is_cancelled() const { return cancelled_; }

    std::string CancellationToken::reason() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    bool CancellationToken::wait_for(std::chrono::milliseconds d) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, d, [this]
                            { return cancelled_.load(); });
    }

    void CancellationToken::wait() const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]
                 { return cancelled_.load(); });
    }

    void install_signal_handlers(CancellationToken &token)
    {
        {
            std::lock_guard<std::mutex> lock(g_target_mutex);
            g_signal_target = &token;
        }
        std::call_once(g_watcher_once, []
                       {
                           std::thread(signal_watcher).detach();
                           std::signal(SIGINT, on_signal);
                           std::signal(SIGTERM, on_signal);
                       });
    }

    void release_signal_handlers(CancellationToken &token)
    {
        std::lock_guard<std::mutex> lock(g_target_mutex);
        if (g_signal_target == &token)
            g_signal_target = nullptr;
    }

} // namespace robot
