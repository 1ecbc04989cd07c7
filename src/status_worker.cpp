#include "status_worker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>

namespace robot
{

    StatusWorker::StatusWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                               CancellationToken &token)
        : ChannelWorker(std::string(cfg.channel_prefix) + channels::kStatus, std::move(uri), std::move(conn), cfg, token),
          shadow_(cfg.shadow_hold_snapshots),
          empty_(std::make_shared<const StatusSnapshot>(empty_snapshot())),
          current_(empty_)
    {
    }

    StatusWorker::~StatusWorker() { stop(); }

    std::chrono::milliseconds StatusWorker::cycle_period() const
    {
        return std::chrono::milliseconds(config().status_period_ms);
    }

    std::shared_ptr<const StatusSnapshot> StatusWorker::snapshot() const
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        return current_;
    }

    uint64_t StatusWorker::sequence() const
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        return sequence_;
    }

    bool StatusWorker::wait_for_fresh(int count, std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(snapshot_mutex_);
        const uint64_t target = sequence_ + static_cast<uint64_t>(count);
        while (sequence_ < target)
        {
            if (token().is_cancelled())
                return false;
            // Short slices so cancellation is noticed without a second cv.
            auto slice = std::min(deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(50));
            snapshot_cv_.wait_until(lock, slice);
            if (std::chrono::steady_clock::now() >= deadline && sequence_ < target)
                return false;
        }
        return true;
    }

    bool StatusWorker::wait_for_first(std::chrono::milliseconds timeout)
    {
        const bool forever = timeout.count() <= 0;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::unique_lock<std::mutex> lock(snapshot_mutex_);
        while (current_->empty)
        {
            if (token().is_cancelled())
                return false;
            auto slice = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
            if (!forever)
            {
                if (std::chrono::steady_clock::now() >= deadline)
                    return false;
                slice = std::min(slice, deadline);
            }
            snapshot_cv_.wait_until(lock, slice);
        }
        return true;
    }

    void StatusWorker::on_screen_pressed(Callback cb)
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        pressed_callbacks_.push_back(std::move(cb));
    }

    void StatusWorker::on_screen_released(Callback cb)
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        released_callbacks_.push_back(std::move(cb));
    }

    void StatusWorker::on_crash(Callback cb)
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        crash_callbacks_.push_back(std::move(cb));
    }

    void StatusWorker::on_status(Callback cb)
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        status_callbacks_.push_back(std::move(cb));
    }

    void StatusWorker::poll_once()
    {
        std::string payload;
        try
        {
            send(std::string(1, static_cast<char>(constants::kStatusProbe)), true);
            payload = receive();
        }
        catch (const AimError &e)
        {
            record_loss(e.what(), false);
            return;
        }

        StatusSnapshot decoded;
        std::string error;
        if (!decode_snapshot(payload, decoded, &error))
        {
            record_loss("could not decode status packet: " + error, false);
            return;
        }

        losses_ = 0;
        decoded.robot.flags = shadow_.apply(decoded.robot.flags);
        auto snap = std::make_shared<const StatusSnapshot>(std::move(decoded));
        publish(snap, true);
        run_edge_detectors(*snap);
    }

    void StatusWorker::record_loss(const std::string &why, bool quiet)
    {
        int lost = ++losses_;
        if (!quiet || config().verbose)
            std::cerr << "[Status] lost a status packet, counter: " << lost << " (" << why << ")\n";

        if (lost > config().status_loss_limit && !snapshot()->empty)
        {
            std::cerr << "[Status] " << lost << " consecutive packets lost, robot state is now unknown\n";
            publish(empty_, false);
        }
    }

    void StatusWorker::publish(std::shared_ptr<const StatusSnapshot> snap, bool fresh)
    {
        {
            std::lock_guard<std::mutex> lock(snapshot_mutex_);
            current_ = std::move(snap);
            if (fresh)
                ++sequence_;
        }
        snapshot_cv_.notify_all();
    }

    void StatusWorker::fire(const std::vector<Callback> &callbacks)
    {
        for (const auto &cb : callbacks)
        {
            try
            {
                cb();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Status] callback failed: " << e.what() << "\n";
            }
        }
    }

    void StatusWorker::run_edge_detectors(const StatusSnapshot &snap)
    {
        std::vector<Callback> status_cbs, crash_cbs, pressed_cbs, released_cbs;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            status_cbs = status_callbacks_;
            crash_cbs = crash_callbacks_;
            pressed_cbs = pressed_callbacks_;
            released_cbs = released_callbacks_;
        }

        fire(status_cbs);

        if (snap.has_flag(flags::kCrashed))
            fire(crash_cbs);

        const bool pressed = snap.touch_pressed();
        if (pressed && !last_pressed_)
            fire(pressed_cbs);
        else if (!pressed && last_pressed_)
            fire(released_cbs);
        last_pressed_ = pressed;

        if (snap.has_flag(flags::kPowerButton))
        {
            std::cerr << "[Status] detected power button press, exiting program\n";
            token().request_cancel("power button pressed");
        }

        const bool was_active = program_active_;
        program_active_ = snap.has_flag(flags::kProgramActive);
        if (was_active && !program_active_)
        {
            std::cerr << "[Status] program is no longer active on the robot, exiting program\n";
            token().request_cancel("program no longer active on robot");
        }
    }

} // namespace robot
