#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace robot {

// Fixed protocol values of the robot firmware
namespace constants {
    constexpr uint8_t kStatusProbe = 1;       // byte sent on the status channel to request a snapshot
    constexpr uint8_t kImageStreamStart = 1;
    constexpr uint8_t kImageStreamStop = 0;
    constexpr std::size_t kSoundMaxBytes = 255 * 1024;
    constexpr std::size_t kAudioHeaderBytes = 64;
    constexpr int kDriveVelocityMaxMmps = 200;
    constexpr int kTurnVelocityMaxDps = 180;
} // namespace constants

// Channel endpoint names; the URI is scheme://host/<prefix><name>
namespace channels {
    constexpr const char* kStatus = "status";
    constexpr const char* kImage = "img";
    constexpr const char* kCommand = "cmd";
    constexpr const char* kAudio = "audio";
} // namespace channels

// Client configuration
struct ClientConfig {
    std::string host;                 // empty = take Settings::default_host()
    std::string scheme{"ws"};         // "ws" or "wss"
    std::string channel_prefix{"ws_"}; // firmware serves ws_status, ws_img, ws_cmd, ws_audio

    // Transport
    int connect_timeout_ms{4000};     // connect, handshake and every later send/receive
    int reconnect_interval_ms{500};   // pause between failed reconnect attempts

    // Worker cadence
    int status_period_ms{50};         // status poll period
    int status_loss_limit{5};         // consecutive losses tolerated before the snapshot is reset
    int idle_period_ms{200};          // command/audio loop period
    int image_idle_period_ms{50};     // image loop period while not streaming

    // Waits
    int image_wait_ms{500};           // how long get_camera_image() waits for the first frame
    int block_timeout_ms{10000};      // motion wait before the stop fallback
    int block_poll_ms{100};
    int block_debounce_ms{50};
    int first_status_timeout_ms{0};   // 0 = wait forever for the first snapshot

    // Shadow flags: snapshots an unconfirmed override is held for
    int shadow_hold_snapshots{10};

    bool throw_on_rejected{false};    // throw CommandRejected instead of logging
    bool verbose{false};

    // Load overrides from a JSON settings file ({"connection":{...},"client":{...}})
    [[nodiscard]] bool load_from_file(const std::string& path);

    [[nodiscard]] bool validate() const noexcept;

    // scheme://host/<prefix><channel>
    std::string uri_for(const std::string& resolved_host, const std::string& channel) const;
};

// Settings file reader. Only the default host is consumed by the client.
class Settings {
public:
    // Path from AIMLINK_SETTINGS, else ./settings.json
    Settings();
    explicit Settings(const std::string& path);

    // AIMLINK_HOST, else connection.host from the file, else "localhost"
    std::string default_host() const;

    bool loaded() const { return loaded_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::string host_;
    bool loaded_{false};
};

} // namespace robot
