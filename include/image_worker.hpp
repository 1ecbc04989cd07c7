#pragma once
#include "channel_worker.hpp"
#include <array>
#include <memory>

namespace robot
{

    // Camera stream receiver with a two-slot frame store.
    //
    // The worker thread is the only writer: it fills the slot that is not
    // current and then flips the index. Readers load the index and take a
    // reference to that slot without locking.
    class ImageWorker final : public ChannelWorker
    {
    public:
        using Frame = std::shared_ptr<const std::string>;

        ImageWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                    CancellationToken &token);
        ~ImageWorker() override;

        // Both throw Disconnected if the control byte cannot be sent.
        void start_stream();
        void stop_stream();
        bool is_streaming() const { return streaming_; }

        // Frame in the current slot; the sentinel until a frame has arrived.
        Frame current_frame() const;

        // Start the stream if needed and wait up to `wait` for a frame.
        // Throws NoImage if only the sentinel is available by then.
        std::string get_image(std::chrono::milliseconds wait);

        static bool is_sentinel(const std::string &frame) { return frame.size() == 1 && frame[0] == '\0'; }

        // Receive one frame into the back slot and flip.
        void receive_frame();

    protected:
        void duty_cycle() override;
        std::chrono::milliseconds cycle_period() const override;
        void on_disconnected() override { streaming_ = false; }
        void on_reconnect_failed() override { streaming_ = false; }

    private:
        void store(Frame frame);

        std::array<Frame, 2> slots_;
        std::atomic<int> current_{0};
        std::atomic<bool> streaming_{false};
    };

} // namespace robot
