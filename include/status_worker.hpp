#pragma once
#include "channel_worker.hpp"
#include "shadow_flags.hpp"
#include "status_snapshot.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace robot
{

    // Polls the status channel, publishes the latest snapshot and fires
    // edge-triggered callbacks.
    class StatusWorker final : public ChannelWorker
    {
    public:
        using Callback = std::function<void()>;

        StatusWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                     CancellationToken &token);
        ~StatusWorker() override;

        // Latest snapshot; never null. Valid for as long as the caller holds it.
        std::shared_ptr<const StatusSnapshot> snapshot() const;

        // Number of fresh snapshots published so far.
        uint64_t sequence() const;

        // Block until `count` more fresh snapshots have been published.
        // Returns false on timeout or cancellation.
        bool wait_for_fresh(int count, std::chrono::milliseconds timeout);

        // Block until a non-empty snapshot is available. timeout 0 = no limit.
        bool wait_for_first(std::chrono::milliseconds timeout);

        int packets_lost() const { return losses_; }

        ShadowFlags &shadow() { return shadow_; }
        const ShadowFlags &shadow() const { return shadow_; }

        // Callbacks run on the status thread.
        void on_screen_pressed(Callback cb);
        void on_screen_released(Callback cb);
        void on_crash(Callback cb);
        void on_status(Callback cb);

        // One probe/receive/decode/publish cycle.
        void poll_once();

    protected:
        void duty_cycle() override { poll_once(); }
        std::chrono::milliseconds cycle_period() const override;
        void on_reconnect_failed() override { record_loss("status channel disconnected", true); }

    private:
        void record_loss(const std::string &why, bool quiet);
        void publish(std::shared_ptr<const StatusSnapshot> snap, bool fresh);
        void run_edge_detectors(const StatusSnapshot &snap);
        void fire(const std::vector<Callback> &callbacks);

        ShadowFlags shadow_;
        std::shared_ptr<const StatusSnapshot> empty_;

        mutable std::mutex snapshot_mutex_;
        std::condition_variable snapshot_cv_;
        std::shared_ptr<const StatusSnapshot> current_;
        uint64_t sequence_ = 0;

        std::atomic<int> losses_{0};
        bool last_pressed_ = false;
        bool program_active_ = false;

        std::mutex callback_mutex_;
        std::vector<Callback> pressed_callbacks_;
        std::vector<Callback> released_callbacks_;
        std::vector<Callback> crash_callbacks_;
        std::vector<Callback> status_callbacks_;
    };

} // namespace robot
