#include "commands.hpp"
#include <cctype>

namespace robot
{

    using json = nlohmann::json;

    json Command::to_json() const
    {
        json j = params.is_object() ? params : json::object();
        j["cmd_id"] = id;
        return j;
    }

    std::string Command::to_wire() const { return to_json().dump(); }

    namespace commands
    {

        namespace
        {
            Command make(const char *id, json params = json::object())
            {
                return Command{id, std::move(params)};
            }

            json rgb(const Rgb &c) { return json{{"r", c.r}, {"g", c.g}, {"b", c.b}}; }

            json rgb_t(const Rgb &c)
            {
                json j = rgb(c);
                j["b_transparency"] = c.transparent;
                return j;
            }

            json merged(json base, const json &extra)
            {
                base.update(extra);
                return base;
            }
        } // namespace

        Command program_init() { return make("program_init"); }

        Command drive(double angle, int speed, StackingType stacking)
        {
            return make("drive", {{"angle", angle}, {"speed", speed}, {"stacking_type", static_cast<int>(stacking)}});
        }

        Command drive_for(double distance, double angle, int drive_speed, int turn_speed, double final_heading,
                          StackingType stacking)
        {
            return make("drive_for", {{"distance", distance},
                                      {"angle", angle},
                                      {"final_heading", final_heading},
                                      {"drive_speed", drive_speed},
                                      {"turn_speed", turn_speed},
                                      {"stacking_type", static_cast<int>(stacking)}});
        }

        Command turn(int turn_rate, StackingType stacking)
        {
            return make("turn", {{"turn_rate", turn_rate}, {"stacking_type", static_cast<int>(stacking)}});
        }

        Command turn_to(double heading, int turn_rate, StackingType stacking)
        {
            return make("turn_to",
                        {{"heading", heading}, {"turn_rate", turn_rate}, {"stacking_type", static_cast<int>(stacking)}});
        }

        Command turn_for(double angle, int turn_rate, StackingType stacking)
        {
            return make("turn_for",
                        {{"angle", angle}, {"turn_rate", turn_rate}, {"stacking_type", static_cast<int>(stacking)}});
        }

        Command spin_wheels(int vel1, int vel2, int vel3)
        {
            return make("spin_wheels", {{"vel1", vel1}, {"vel2", vel2}, {"vel3", vel3}});
        }

        Command set_pose(double x, double y) { return make("set_pose", {{"x", x}, {"y", y}}); }

        Command lcd_print(const std::string &text) { return make("lcd_print", {{"string", text}}); }

        Command lcd_print_at(const std::string &text, int x, int y, bool opaque)
        {
            return make("lcd_print_at", {{"x", x}, {"y", y}, {"string", text}, {"b_opaque", opaque}});
        }

        Command lcd_set_cursor(int row, int col) { return make("lcd_set_cursor", {{"row", row}, {"col", col}}); }

        Command lcd_set_origin(int x, int y) { return make("lcd_set_origin", {{"x", x}, {"y", y}}); }

        Command lcd_next_row() { return make("lcd_next_row"); }

        Command lcd_clear_row(int row, const Rgb &color)
        {
            return make("lcd_clear_row", merged({{"number", row}}, rgb(color)));
        }

        Command lcd_clear_screen(const Rgb &color) { return make("lcd_clear_screen", rgb(color)); }

        Command lcd_set_font(const std::string &fontname)
        {
            std::string lowered = fontname;
            for (auto &c : lowered)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return make("lcd_set_font", {{"fontname", lowered}});
        }

        Command lcd_set_pen_width(int width) { return make("lcd_set_pen_width", {{"width", width}}); }

        Command lcd_set_pen_color(const Rgb &color) { return make("lcd_set_pen_color", rgb(color)); }

        Command lcd_set_fill_color(const Rgb &color) { return make("lcd_set_fill_color", rgb_t(color)); }

        Command lcd_draw_line(int x1, int y1, int x2, int y2)
        {
            return make("lcd_draw_line", {{"x1", x1}, {"y1", y1}, {"x2", x2}, {"y2", y2}});
        }

        Command lcd_draw_rectangle(int x, int y, int width, int height, const Rgb &fill)
        {
            return make("lcd_draw_rectangle",
                        merged({{"x", x}, {"y", y}, {"width", width}, {"height", height}}, rgb_t(fill)));
        }

        Command lcd_draw_circle(int x, int y, int radius, const Rgb &fill)
        {
            return make("lcd_draw_circle", merged({{"x", x}, {"y", y}, {"radius", radius}}, rgb_t(fill)));
        }

        Command lcd_draw_pixel(int x, int y) { return make("lcd_draw_pixel", {{"x", x}, {"y", y}}); }

        Command lcd_draw_image_from_file(const std::string &filename, int x, int y)
        {
            return make("lcd_draw_image_from_file", {{"filename", filename}, {"x", x}, {"y", y}});
        }

        Command lcd_set_clip_region(int x, int y, int width, int height)
        {
            return make("lcd_set_clip_region", {{"x", x}, {"y", y}, {"width", width}, {"height", height}});
        }

        Command show_emoji(int emoji, int look) { return make("show_emoji", {{"name", emoji}, {"look", look}}); }

        Command hide_emoji() { return make("hide_emoji"); }

        Command show_aivision() { return make("show_aivision"); }

        Command hide_aivision() { return make("hide_aivision"); }

        Command imu_calibrate() { return make("imu_calibrate"); }

        Command imu_set_crash_threshold(int sensitivity)
        {
            return make("imu_set_crash_threshold", {{"sensitivity", sensitivity}});
        }

        Command kick(KickType type)
        {
            switch (type)
            {
            case KickType::Soft:
                return make("kick_soft");
            case KickType::Medium:
                return make("kick_medium");
            case KickType::Hard:
                return make("kick_hard");
            }
            return make("kick_medium");
        }

        Command play_sound(const std::string &name, int volume)
        {
            return make("play_sound", {{"name", name}, {"volume", volume}});
        }

        Command play_file(const std::string &name, int volume)
        {
            return make("play_file", {{"name", name}, {"volume", volume}});
        }

        Command play_note(int note, int octave, int duration_ms, int volume)
        {
            return make("play_note", {{"note", note}, {"octave", octave}, {"duration", duration_ms}, {"volume", volume}});
        }

        Command stop_sound() { return make("stop_sound"); }

        Command light_set(const std::string &led, const Rgb &color)
        {
            json params = json::object();
            params[led] = rgb(color);
            return make("light_set", std::move(params));
        }

        Command color_description(int id, int red, int green, int blue, double hangle, double hdsat)
        {
            return make("color_description", {{"id", id},
                                              {"red", red},
                                              {"green", green},
                                              {"blue", blue},
                                              {"hangle", hangle},
                                              {"hdsat", hdsat}});
        }

        Command code_description(int id, int c1, int c2, int c3, int c4, int c5)
        {
            return make("code_description",
                        {{"id", id}, {"c1", c1}, {"c2", c2}, {"c3", c3}, {"c4", c4}, {"c5", c5}});
        }

        Command tag_detection(bool enable) { return make("tag_detection", {{"b_enable", enable}}); }

        Command color_detection(bool enable, bool merge)
        {
            return make("color_detection", {{"b_enable", enable}, {"b_merge", merge}});
        }

        Command model_detection(bool enable) { return make("model_detection", {{"b_enable", enable}}); }

    } // namespace commands

} // namespace robot
