#include "channel_worker.hpp"
#include "errors.hpp"
#include "websocket_client.hpp"
#include <iostream>

namespace robot
{

    ConnectionFactory websocket_connection_factory()
    {
        return []
        { return std::make_unique<ws::WebSocketClient>(); };
    }

    ChannelWorker::ChannelWorker(std::string name, std::string uri, std::unique_ptr<ws::Connection> conn,
                                 const ClientConfig &cfg, CancellationToken &token)
        : name_(std::move(name)), uri_(std::move(uri)), config_(cfg), token_(token), conn_(std::move(conn))
    {
    }

    ChannelWorker::~ChannelWorker()
    {
        stop();
        close();
    }

    bool ChannelWorker::connect(int timeout_ms)
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        needs_reset_ = false;
        return conn_->open(uri_, timeout_ms);
    }

    void ChannelWorker::start()
    {
        if (running_.exchange(true))
            return;
        thread_ = std::thread(&ChannelWorker::loop, this);
    }

    void ChannelWorker::stop()
    {
        {
            std::lock_guard<std::mutex> lock(sleep_mutex_);
            running_ = false;
        }
        sleep_cv_.notify_all();
        if (thread_.joinable())
            thread_.join();
    }

    void ChannelWorker::send(const std::string &payload, bool is_binary)
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (needs_reset_ || !conn_->is_open())
            throw Disconnected(name_ + ": not connected to robot");
        if (!conn_->send(payload, is_binary ? ws::Opcode::Binary : ws::Opcode::Text))
        {
            needs_reset_ = true;
            throw Disconnected(name_ + ": error sending data to robot, apparently disconnected, will try to reconnect; error: '" +
                               conn_->last_error() + "'");
        }
    }

    std::string ChannelWorker::receive()
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (needs_reset_ || !conn_->is_open())
            throw ReceiveError(name_ + ": not connected to robot");
        std::string data;
        if (!conn_->receive(data))
        {
            needs_reset_ = true;
            throw ReceiveError(name_ + ": error receiving data from robot, apparently disconnected, will try to reconnect; error: '" +
                               conn_->last_error() + "'");
        }
        return data;
    }

    void ChannelWorker::close()
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (conn_->is_open())
            conn_->close();
    }

    bool ChannelWorker::is_connected() const
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return !needs_reset_ && conn_->is_open();
    }

    std::string ChannelWorker::last_error() const
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return conn_->last_error();
    }

    bool ChannelWorker::reconnect()
    {
        if (!reported_outage_ || config_.verbose)
            std::cerr << "[" << name_ << "] reconnecting\n";
        reported_outage_ = true;

        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!conn_->open(uri_, config_.connect_timeout_ms))
        {
            if (config_.verbose)
                std::cerr << "[" << name_ << "] reconnect failed: " << conn_->last_error() << "\n";
            return false;
        }
        std::cerr << "[" << name_ << "] reconnected to " << uri_ << "\n";
        reported_outage_ = false;
        return true;
    }

    void ChannelWorker::run_once()
    {
        if (needs_reset_)
        {
            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                if (conn_->is_open())
                    conn_->close();
                needs_reset_ = false;
            }
            on_disconnected();
        }

        bool open;
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            open = conn_->is_open();
        }
        if (!open)
        {
            if (!reconnect())
            {
                on_reconnect_failed();
                return;
            }
        }

        try
        {
            duty_cycle();
        }
        catch (const AimError &e)
        {
            // Transport errors already marked the connection for reset.
            std::cerr << "[" << name_ << "] " << e.what() << "\n";
        }
    }

    void ChannelWorker::loop()
    {
        while (running_ && !token_.is_cancelled())
        {
            run_once();
            auto period = is_connected() ? cycle_period() : std::chrono::milliseconds(config_.reconnect_interval_ms);
            if (!sleep_for(period))
                break;
        }
    }

    bool ChannelWorker::sleep_for(std::chrono::milliseconds d)
    {
        std::unique_lock<std::mutex> lock(sleep_mutex_);
        sleep_cv_.wait_for(lock, d, [this]
                           { return !running_; });
        return running_;
    }

} // namespace robot
