#pragma once
#include "channel_worker.hpp"
#include <cstdint>
#include <string>

namespace robot
{

    enum class AudioFormat : uint8_t
    {
        Wav = 0,
        Mp3 = 1
    };

    // 64-byte header followed by the raw file:
    //   [0] format, [1] volume, [2..3] reserved,
    //   [4..7] data length (LE), [8..11] chunk index (LE),
    //   [12..31] reserved, [32..63] file name (truncated, zero padded).
    // Throws InvalidSoundFile if the result would exceed the robot's limit.
    std::string build_audio_payload(AudioFormat format, const std::string &data, int volume,
                                    const std::string &filename, uint32_t chunk_index = 0);

    // Read a local .wav/.mp3 file, check it and wrap it for upload.
    // Throws InvalidSoundFile.
    std::string load_sound_file(const std::string &path, int volume);

    // Upload channel: one binary message per call, no response.
    class AudioWorker final : public ChannelWorker
    {
    public:
        AudioWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                    CancellationToken &token);
        ~AudioWorker() override;

        // Throws Disconnected.
        void send_audio(const std::string &payload) { send(payload, true); }

    protected:
        void duty_cycle() override {}
        std::chrono::milliseconds cycle_period() const override;
    };

} // namespace robot
