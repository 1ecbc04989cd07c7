#include "image_worker.hpp"
#include "errors.hpp"
#include <iostream>

namespace robot
{

    namespace
    {
        const ImageWorker::Frame &sentinel_frame()
        {
            static const ImageWorker::Frame kSentinel = std::make_shared<const std::string>(1, '\0');
            return kSentinel;
        }
    } // namespace

    ImageWorker::ImageWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                             CancellationToken &token)
        : ChannelWorker(std::string(cfg.channel_prefix) + channels::kImage, std::move(uri), std::move(conn), cfg, token)
    {
        slots_[0] = sentinel_frame();
        slots_[1] = sentinel_frame();
    }

    ImageWorker::~ImageWorker()
    {
        stop();
        if (streaming_ && is_connected())
        {
            try
            {
                stop_stream();
            }
            catch (const AimError &e)
            {
                std::cerr << "[" << name() << "] could not stop stream: " << e.what() << "\n";
            }
        }
    }

    void ImageWorker::start_stream()
    {
        // The loop only receives once the start byte is out.
        send(std::string(1, static_cast<char>(constants::kImageStreamStart)), true);
        streaming_ = true;
    }

    void ImageWorker::stop_stream()
    {
        streaming_ = false;
        send(std::string(1, static_cast<char>(constants::kImageStreamStop)), true);
    }

    ImageWorker::Frame ImageWorker::current_frame() const
    {
        return std::atomic_load(&slots_[current_.load()]);
    }

    void ImageWorker::store(Frame frame)
    {
        const int next = 1 - current_.load();
        std::atomic_store(&slots_[next], std::move(frame));
        current_.store(next);
    }

    void ImageWorker::receive_frame()
    {
        try
        {
            store(std::make_shared<const std::string>(receive()));
        }
        catch (const ReceiveError &e)
        {
            if (config().verbose)
                std::cerr << "[" << name() << "] " << e.what() << "\n";
            store(sentinel_frame());
        }
    }

    void ImageWorker::duty_cycle()
    {
        if (streaming_)
            receive_frame();
    }

    std::chrono::milliseconds ImageWorker::cycle_period() const
    {
        if (streaming_)
            return std::chrono::milliseconds(0);
        return std::chrono::milliseconds(config().image_idle_period_ms);
    }

    std::string ImageWorker::get_image(std::chrono::milliseconds wait)
    {
        if (!streaming_)
            start_stream();

        auto deadline = std::chrono::steady_clock::now() + wait;
        Frame frame = current_frame();
        while (is_sentinel(*frame) && std::chrono::steady_clock::now() < deadline)
        {
            if (token().wait_for(std::chrono::milliseconds(10)))
                throw Cancelled("cancelled while waiting for a camera image");
            frame = current_frame();
        }
        if (is_sentinel(*frame))
            throw NoImage("no image was received");
        return *frame;
    }

} // namespace robot
