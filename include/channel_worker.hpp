#pragma once
#include "cancellation.hpp"
#include "client_config.hpp"
#include "connection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace robot
{

    using ConnectionFactory = std::function<std::unique_ptr<ws::Connection>()>;

    // Factory producing real WebSocket connections.
    ConnectionFactory websocket_connection_factory();

    // One persistent connection to one robot channel plus the background loop
    // that keeps it alive.
    //
    // The loop is the only place that reconnects: if a send/receive failed it
    // closes the connection, while disconnected it retries, and while connected
    // it runs duty_cycle() and sleeps cycle_period().
    class ChannelWorker
    {
    public:
        ChannelWorker(std::string name, std::string uri, std::unique_ptr<ws::Connection> conn,
                      const ClientConfig &cfg, CancellationToken &token);
        virtual ~ChannelWorker();

        // Initial connection. Returns false (reason in last_error()) on failure;
        // the caller decides whether that is fatal.
        [[nodiscard]] bool connect(int timeout_ms);

        void start();
        void stop();
        bool is_running() const { return running_; }

        // Throw Disconnected on any transport failure and mark the connection
        // for reset. No retry.
        void send(const std::string &payload, bool is_binary);

        // Throws ReceiveError on any transport failure and marks the connection
        // for reset.
        std::string receive();

        void close();
        bool is_connected() const;
        bool needs_reset() const { return needs_reset_; }

        const std::string &name() const { return name_; }
        const std::string &uri() const { return uri_; }
        std::string last_error() const;

        // One loop iteration without the trailing sleep. The background thread
        // calls this; tests drive it directly.
        void run_once();

    protected:
        virtual void duty_cycle() = 0;
        virtual std::chrono::milliseconds cycle_period() const = 0;

        // Connection was closed after a failure, or a reconnect attempt failed.
        virtual void on_disconnected() {}
        virtual void on_reconnect_failed() {}

        // Interruptible sleep; returns false if the worker was stopped meanwhile.
        bool sleep_for(std::chrono::milliseconds d);

        const ClientConfig &config() const { return config_; }
        CancellationToken &token() { return token_; }

    private:
        void loop();
        bool reconnect();

        std::string name_;
        std::string uri_;
        ClientConfig config_;
        CancellationToken &token_;

        std::unique_ptr<ws::Connection> conn_;
        mutable std::mutex conn_mutex_;
        std::atomic<bool> needs_reset_{false};
        bool reported_outage_ = false;

        std::atomic<bool> running_{false};
        std::mutex sleep_mutex_;
        std::condition_variable sleep_cv_;
        std::thread thread_;

        ChannelWorker(const ChannelWorker &) = delete;
        ChannelWorker &operator=(const ChannelWorker &) = delete;
    };

} // namespace robot
