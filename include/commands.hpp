#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace robot
{

    // One request on the command channel: {"cmd_id": id, <params>...}.
    struct Command
    {
        std::string id;
        nlohmann::json params = nlohmann::json::object();

        nlohmann::json to_json() const;
        // Compact JSON text as sent on the wire.
        std::string to_wire() const;
    };

    struct Rgb
    {
        int r = 0;
        int g = 0;
        int b = 0;
        bool transparent = false;

        // 0xRRGGBB
        static Rgb from_hex(uint32_t value, bool transparent = false)
        {
            return Rgb{static_cast<int>((value >> 16) & 0xFF), static_cast<int>((value >> 8) & 0xFF),
                       static_cast<int>(value & 0xFF), transparent};
        }
    };

    namespace colors
    {
        constexpr uint32_t kBlack = 0x000000;
        constexpr uint32_t kWhite = 0xFFFFFF;
        constexpr uint32_t kRed = 0xFF0000;
        constexpr uint32_t kGreen = 0x00FF00;
        constexpr uint32_t kBlue = 0x001871;
        constexpr uint32_t kYellow = 0xFFFF00;
        constexpr uint32_t kOrange = 0xFF8500;
        constexpr uint32_t kPurple = 0xFF00FF;
        constexpr uint32_t kCyan = 0x00FFFF;
    } // namespace colors

    enum class StackingType : int
    {
        Off = 0
    };

    enum class KickType
    {
        Soft,
        Medium,
        Hard
    };

    // Builders for every command the robot understands. Pure values; nothing
    // is sent until the Command is handed to RobotClient::send.
    namespace commands
    {
        Command program_init();

        // Motion
        Command drive(double angle, int speed, StackingType stacking = StackingType::Off);
        Command drive_for(double distance, double angle, int drive_speed, int turn_speed, double final_heading = 0,
                          StackingType stacking = StackingType::Off);
        Command turn(int turn_rate, StackingType stacking = StackingType::Off);
        Command turn_to(double heading, int turn_rate, StackingType stacking = StackingType::Off);
        Command turn_for(double angle, int turn_rate, StackingType stacking = StackingType::Off);
        Command spin_wheels(int vel1, int vel2, int vel3);
        Command set_pose(double x, double y);

        // Screen
        Command lcd_print(const std::string &text);
        Command lcd_print_at(const std::string &text, int x, int y, bool opaque = true);
        Command lcd_set_cursor(int row, int col);
        Command lcd_set_origin(int x, int y);
        Command lcd_next_row();
        Command lcd_clear_row(int row, const Rgb &color);
        Command lcd_clear_screen(const Rgb &color);
        Command lcd_set_font(const std::string &fontname);
        Command lcd_set_pen_width(int width);
        Command lcd_set_pen_color(const Rgb &color);
        Command lcd_set_fill_color(const Rgb &color);
        Command lcd_draw_line(int x1, int y1, int x2, int y2);
        Command lcd_draw_rectangle(int x, int y, int width, int height, const Rgb &fill);
        Command lcd_draw_circle(int x, int y, int radius, const Rgb &fill);
        Command lcd_draw_pixel(int x, int y);
        Command lcd_draw_image_from_file(const std::string &filename, int x, int y);
        Command lcd_set_clip_region(int x, int y, int width, int height);
        Command show_emoji(int emoji, int look = 0);
        Command hide_emoji();
        Command show_aivision();
        Command hide_aivision();

        // Inertial sensor and kicker
        Command imu_calibrate();
        Command imu_set_crash_threshold(int sensitivity);
        Command kick(KickType type);

        // Sound
        Command play_sound(const std::string &name, int volume);
        Command play_file(const std::string &name, int volume);
        Command play_note(int note, int octave, int duration_ms, int volume);
        Command stop_sound();

        // LEDs: led is "light1".."light6" or "all"
        Command light_set(const std::string &led, const Rgb &color);

        // AI vision
        Command color_description(int id, int red, int green, int blue, double hangle, double hdsat);
        Command code_description(int id, int c1, int c2, int c3 = -1, int c4 = -1, int c5 = -1);
        Command tag_detection(bool enable);
        Command color_detection(bool enable, bool merge = false);
        Command model_detection(bool enable);
    } // namespace commands

} // namespace robot
