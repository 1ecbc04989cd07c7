#include "audio_worker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>

namespace robot
{

    namespace
    {
        void put_le32(std::string &buf, size_t offset, uint32_t v)
        {
            buf[offset + 0] = static_cast<char>(v & 0xFF);
            buf[offset + 1] = static_cast<char>((v >> 8) & 0xFF);
            buf[offset + 2] = static_cast<char>((v >> 16) & 0xFF);
            buf[offset + 3] = static_cast<char>((v >> 24) & 0xFF);
        }

        std::string base_name(const std::string &path)
        {
            auto slash = path.find_last_of("/\\");
            return slash == std::string::npos ? path : path.substr(slash + 1);
        }

        std::string extension_of(const std::string &name)
        {
            auto dot = name.find_last_of('.');
            if (dot == std::string::npos)
                return "";
            std::string ext = name.substr(dot);
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        void check_wav(const std::string &data, const std::string &name)
        {
            if (data.size() < 24 || data.compare(0, 4, "RIFF") != 0 || data.compare(8, 4, "WAVE") != 0)
                throw InvalidSoundFile("file extension was .wav but " + name + " does not appear to actually be a WAVE file");
            unsigned channels = static_cast<unsigned char>(data[22]) | (static_cast<unsigned char>(data[23]) << 8);
            if (channels > 2)
                throw InvalidSoundFile("only mono or stereo is supported, detected " + std::to_string(channels) + " channels");
            if (channels == 2)
                std::cerr << "[Sound] " << name << " is stereo; mono is recommended\n";
        }
    } // namespace

    std::string build_audio_payload(AudioFormat format, const std::string &data, int volume,
                                    const std::string &filename, uint32_t chunk_index)
    {
        const size_t total = constants::kAudioHeaderBytes + data.size();
        if (total > constants::kSoundMaxBytes)
            throw InvalidSoundFile("sound of " + std::to_string(data.size()) + " bytes is too big; max size allowed is " +
                                   std::to_string(constants::kSoundMaxBytes - constants::kAudioHeaderBytes) + " bytes");

        std::string payload(constants::kAudioHeaderBytes, '\0');
        payload[0] = static_cast<char>(format);
        payload[1] = static_cast<char>(std::clamp(volume, 0, 100));
        put_le32(payload, 4, static_cast<uint32_t>(data.size()));
        put_le32(payload, 8, chunk_index);
        const std::string name = filename.substr(0, 32);
        std::copy(name.begin(), name.end(), payload.begin() + 32);
        payload += data;
        return payload;
    }

    std::string load_sound_file(const std::string &path, int volume)
    {
        const std::string name = base_name(path);
        const std::string ext = extension_of(name);
        AudioFormat format;
        if (ext == ".wav")
            format = AudioFormat::Wav;
        else if (ext == ".mp3")
            format = AudioFormat::Mp3;
        else
            throw InvalidSoundFile("extension is " + (ext.empty() ? std::string("empty") : ext) +
                                   "; expected extension to be wav or mp3");

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw InvalidSoundFile("file " + path + " was not found");
        std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        if (format == AudioFormat::Wav)
            check_wav(data, name);
        return build_audio_payload(format, data, volume, name);
    }

    AudioWorker::AudioWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                             CancellationToken &token)
        : ChannelWorker(std::string(cfg.channel_prefix) + channels::kAudio, std::move(uri), std::move(conn), cfg, token)
    {
    }

    AudioWorker::~AudioWorker() { stop(); }

    std::chrono::milliseconds AudioWorker::cycle_period() const
    {
        return std::chrono::milliseconds(config().idle_period_ms);
    }

} // namespace robot
