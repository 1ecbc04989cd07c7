#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace robot
{

    // Bits of robot.flags
    namespace flags
    {
        constexpr uint32_t kSoundPlaying = 1u << 0;
        constexpr uint32_t kMoveActive = 1u << 1;
        constexpr uint32_t kImuCalibrating = 1u << 3;
        constexpr uint32_t kTurnActive = 1u << 4;
        constexpr uint32_t kMoving = 1u << 5;
        constexpr uint32_t kCrashed = 1u << 6;
        constexpr uint32_t kShake = 1u << 8;
        constexpr uint32_t kPowerButton = 1u << 9;
        constexpr uint32_t kProgramActive = 1u << 10;
        constexpr uint32_t kSoundDownloading = 1u << 16;

        // robot.touch_flags
        constexpr uint32_t kTouchPressed = 0x0001;
    } // namespace flags

    struct Vec3
    {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    struct ControllerState
    {
        uint32_t flags = 0;
        int stick_x = 0;
        int stick_y = 0;
        int battery = 0;
    };

    struct RobotState
    {
        uint32_t flags = 0;
        int battery = 0;
        uint32_t touch_flags = 0;
        double touch_x = 0.0;
        double touch_y = 0.0;
        double robot_x = 0.0;
        double robot_y = 0.0;
        double roll = 0.0;
        double pitch = 0.0;
        double yaw = 0.0;
        double heading = 0.0;
        double rotation = 0.0;
        Vec3 acceleration;
        Vec3 gyro_rate;
        int screen_row = 1;
        int screen_column = 1;
    };

    // One raw AI vision detection as reported by the robot. Only the fields
    // relevant to `type` carry meaning; the rest stay zero.
    struct RawDetection
    {
        uint32_t type = 0;
        int id = 0;
        int origin_x = 0;
        int origin_y = 0;
        int width = 0;
        int height = 0;
        int angle = 0; // color/code objects, hundredths of a degree
        int score = 0; // model objects
        std::array<int, 4> corners_x{{0, 0, 0, 0}}; // tag objects
        std::array<int, 4> corners_y{{0, 0, 0, 0}};
    };

    struct VisionState
    {
        // Class table entries with a higher index are dropped
        static constexpr int kMaxClassnames = 256;

        std::vector<std::string> classnames; // indexed by model object id
        std::vector<RawDetection> objects;
    };

    // Immutable once published. Readers hold a shared_ptr to a snapshot that
    // is never modified again.
    struct StatusSnapshot
    {
        ControllerState controller;
        RobotState robot;
        VisionState vision;
        bool empty = false; // true only for the canonical empty snapshot

        bool has_flag(uint32_t bit) const { return (robot.flags & bit) != 0; }
        bool touch_pressed() const { return (robot.touch_flags & flags::kTouchPressed) != 0; }
    };

    // Zeroed state used at startup and after the status channel has been lost.
    StatusSnapshot empty_snapshot();

    // Decode one status payload. On failure returns false and describes the
    // problem in `error` (if given); `out` is then unspecified.
    bool decode_snapshot(const std::string &payload, StatusSnapshot &out, std::string *error = nullptr);

    // "0x1A2B" or "1A2B" -> 0x1A2B. Returns false on anything else.
    bool parse_hex_flags(const std::string &text, uint32_t &out);

} // namespace robot
