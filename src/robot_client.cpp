#include "robot_client.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace robot
{

    namespace
    {
        constexpr double kPi = 3.14159265358979323846;

        double round2(double v) { return std::round(v * 100.0) / 100.0; }

        double radians(double degrees) { return degrees * kPi / 180.0; }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        // Explicit argument, then the config file, then the settings/environment default
        std::string resolve_host(const std::string &host, const ClientConfig &cfg)
        {
            if (!host.empty())
                return host;
            if (!cfg.host.empty())
                return cfg.host;
            return Settings().default_host();
        }
    } // namespace

    std::pair<int, int> parse_note(const std::string &note)
    {
        if (note.size() != 2 && note.size() != 3)
            throw std::invalid_argument("invalid note string: '" + note + "'");

        int value;
        switch (std::tolower(static_cast<unsigned char>(note[0])))
        {
        case 'c':
            value = 0;
            break;
        case 'd':
            value = 2;
            break;
        case 'e':
            value = 4;
            break;
        case 'f':
            value = 5;
            break;
        case 'g':
            value = 7;
            break;
        case 'a':
            value = 9;
            break;
        case 'b':
            value = 11;
            break;
        default:
            throw std::invalid_argument("invalid note string: '" + note + "'");
        }

        const char octave_char = note.back();
        if (octave_char < '5' || octave_char > '8')
            throw std::invalid_argument("invalid note string: '" + note + "'");

        if (note.size() == 3)
        {
            const char accidental = note[1];
            if (accidental == '#')
            {
                if (value < 11)
                    ++value;
            }
            else if (accidental == 'b')
            {
                if (value > 0)
                    --value;
            }
            else
                throw std::invalid_argument("invalid note string: '" + note + "'");
        }
        return {value, octave_char - '5'};
    }

    RobotClient::RobotClient(const std::string &host, const ClientConfig &cfg, ConnectionFactory factory)
        : host_(resolve_host(host, cfg)), config_(cfg)
    {
        if (!config_.validate())
            throw std::invalid_argument("invalid client configuration");

        std::cerr << "[Robot] Connecting to " << host_ << "\n";

        status_ = std::make_unique<StatusWorker>(config_.uri_for(host_, channels::kStatus), factory(), config_, token_);
        image_ = std::make_unique<ImageWorker>(config_.uri_for(host_, channels::kImage), factory(), config_, token_);
        command_ = std::make_unique<CommandWorker>(config_.uri_for(host_, channels::kCommand), factory(), config_,
                                                   token_, status_->shadow());
        audio_ = std::make_unique<AudioWorker>(config_.uri_for(host_, channels::kAudio), factory(), config_, token_);

        connect_or_die(*status_);
        connect_or_die(*image_);
        connect_or_die(*command_);
        connect_or_die(*audio_);

        status_->start();
        image_->start();
        command_->start();
        audio_->start();

        send(commands::program_init());

        // Heading and position offsets need a real snapshot.
        if (!status_->wait_for_first(std::chrono::milliseconds(config_.first_status_timeout_ms)))
        {
            if (token_.is_cancelled())
                throw Cancelled("cancelled before the first status: " + token_.reason());
            throw Disconnected("no status received from robot at " + host_);
        }
        reset_heading();
    }

    RobotClient::~RobotClient()
    {
        release_signal_handlers(token_);
        status_->stop();
        image_->stop();
        command_->stop();
        audio_->stop();
    }

    void RobotClient::connect_or_die(ChannelWorker &worker)
    {
        if (worker.connect(config_.connect_timeout_ms))
            return;
        fatal("Could not connect to " + worker.uri() + " (reason: " + worker.last_error() + "). Verify that \"" + host_ +
              "\" is the correct IP/hostname of the robot and that it is connected to the same network "
              "(AP mode is 192.168.4.1)");
    }

    CommandResult RobotClient::send(const Command &cmd)
    {
        CommandResult result = command_->send(cmd);
        if (result.status == CommandStatus::Rejected && config_.throw_on_rejected)
            throw CommandRejected(cmd.id, result.reason);
        return result;
    }

    void RobotClient::send_audio(const std::string &payload) { audio_->send_audio(payload); }

    int RobotClient::to_drive_speed(double velocity, DriveUnits units) const
    {
        if (units == DriveUnits::Percent)
            return static_cast<int>(std::min(velocity, 100.0) * 2);
        return static_cast<int>(std::min(velocity, static_cast<double>(constants::kDriveVelocityMaxMmps)));
    }

    int RobotClient::to_turn_speed(double velocity, TurnUnits units) const
    {
        if (units == TurnUnits::Percent)
            return static_cast<int>(std::min(velocity, 100.0) * 1.8);
        return static_cast<int>(std::min(velocity, static_cast<double>(constants::kTurnVelocityMaxDps)));
    }

    void RobotClient::set_move_velocity(double velocity, DriveUnits units)
    {
        if (velocity < 0)
            throw std::invalid_argument("velocity must be a positive number");
        drive_speed_ = to_drive_speed(velocity, units);
    }

    void RobotClient::set_turn_velocity(double velocity, TurnUnits units)
    {
        if (velocity < 0)
            throw std::invalid_argument("velocity must be a positive number");
        turn_speed_ = to_turn_speed(velocity, units);
    }

    bool RobotClient::wait_until_idle(bool (RobotClient::*busy)() const, const char *what)
    {
        BlockPolicy policy;
        policy.timeout = std::chrono::milliseconds(config_.block_timeout_ms);
        policy.poll = std::chrono::milliseconds(config_.block_poll_ms);
        policy.debounce = std::chrono::milliseconds(config_.block_debounce_ms);
        return block_on([this, busy]
                        { return (this->*busy)(); },
                        [this, what]
                        {
                            std::cerr << "[Robot] " << what << " wait timed out, stopping\n";
                            stop_all_movement();
                        },
                        policy, token_);
    }

    void RobotClient::move_at(double angle, std::optional<double> velocity, DriveUnits units)
    {
        const int speed = velocity ? to_drive_speed(*velocity, units) : drive_speed_.load();
        send(commands::drive(angle, speed));
    }

    void RobotClient::move_for(double distance, double angle, std::optional<double> velocity, DriveUnits units,
                               bool wait)
    {
        int speed = velocity ? to_drive_speed(*velocity, units) : drive_speed_.load();
        if (speed < 0)
        {
            speed = -speed;
            distance = -distance;
        }
        send(commands::drive_for(distance, angle, speed, turn_speed_));
        if (wait)
            wait_until_idle(&RobotClient::is_move_active, "is_move_active");
    }

    void RobotClient::move_with_vectors(double forwards, double rightwards, double rotation)
    {
        const double x = std::clamp(rightwards, -100.0, 100.0) * 2.0;
        const double y = std::clamp(forwards, -100.0, 100.0) * 2.0;
        const double r = std::clamp(rotation, -100.0, 100.0) * 1.8;

        const double w1 = (0.5 * x) + (0.866 * y) + r;
        const double w2 = (0.5 * x) - (0.866 * y) + r;
        const double w3 = r - x;
        spin_wheels(static_cast<int>(w1), static_cast<int>(w2), static_cast<int>(w3));
    }

    void RobotClient::turn(TurnDirection direction, std::optional<double> velocity, TurnUnits units)
    {
        int rate = velocity ? to_turn_speed(*velocity, units) : turn_speed_.load();
        if (direction == TurnDirection::Left)
            rate = -rate;
        send(commands::turn(rate));
    }

    void RobotClient::turn_for(TurnDirection direction, double angle, std::optional<double> velocity, TurnUnits units,
                               bool wait)
    {
        const int rate = velocity ? to_turn_speed(*velocity, units) : turn_speed_.load();
        if (direction == TurnDirection::Left)
            angle = -angle;
        send(commands::turn_for(angle, rate));
        if (wait)
            wait_until_idle(&RobotClient::is_turn_active, "is_turn_active");
    }

    void RobotClient::turn_to(double heading, std::optional<double> velocity, TurnUnits units, bool wait)
    {
        if (!(heading > -360.0 && heading < 360.0))
            throw std::invalid_argument("heading must be between -360 and 360");
        const int rate = std::abs(velocity ? to_turn_speed(*velocity, units) : turn_speed_.load());
        const double target = std::fmod(heading_offset_ + heading, 360.0);
        send(commands::turn_to(target, rate));
        if (wait)
            wait_until_idle(&RobotClient::is_turn_active, "is_turn_active");
    }

    void RobotClient::spin_wheels(int velocity1, int velocity2, int velocity3)
    {
        send(commands::spin_wheels(velocity1, velocity2, velocity3));
    }

    void RobotClient::stop_all_movement()
    {
        move_at(0, 0.0);
        turn(TurnDirection::Right, 0.0);
        ShadowFlags &shadow = status_->shadow();
        shadow.cancel(ShadowFlag::MoveActive);
        shadow.cancel(ShadowFlag::TurnActive);
        shadow.request_clear(ShadowFlag::Moving);
    }

    void RobotClient::set_xy_position(double x, double y)
    {
        const double offset = -radians(heading_offset_);
        const double origin_x = x * std::cos(offset) - y * std::sin(offset);
        const double origin_y = y * std::cos(offset) + x * std::sin(offset);
        send(commands::set_pose(origin_x, origin_y));

        // The first snapshot after set_pose may predate it.
        if (!status_->wait_for_fresh(2, std::chrono::milliseconds(config_.block_timeout_ms)))
        {
            if (token_.is_cancelled())
                throw Cancelled("cancelled while waiting for position update: " + token_.reason());
            std::cerr << "[Robot] no status update after set_pose\n";
        }
    }

    double RobotClient::x_position() const
    {
        auto snap = status();
        const double offset = -radians(heading_offset_);
        return snap->robot.robot_x * std::cos(offset) + snap->robot.robot_y * std::sin(offset);
    }

    double RobotClient::y_position() const
    {
        auto snap = status();
        const double offset = -radians(heading_offset_);
        return snap->robot.robot_y * std::cos(offset) - snap->robot.robot_x * std::sin(offset);
    }

    bool RobotClient::is_move_active() const
    {
        if (status_->shadow().pending_set(ShadowFlag::MoveActive))
            return true;
        return status()->has_flag(flags::kMoveActive);
    }

    bool RobotClient::is_turn_active() const
    {
        if (status_->shadow().pending_set(ShadowFlag::TurnActive))
            return true;
        return status()->has_flag(flags::kTurnActive);
    }

    bool RobotClient::is_stopped() const
    {
        const ShadowFlags &shadow = status_->shadow();
        if (shadow.pending_clear(ShadowFlag::Moving))
            return true;
        if (shadow.pending_set(ShadowFlag::Moving))
            return false;
        return !status()->has_flag(flags::kMoving);
    }

    bool RobotClient::holds_object(const std::vector<std::string> &classnames, int min_y)
    {
        for (const auto &obj : get_data(vision::objects::kAllModels))
        {
            const double cx = obj.origin_x + obj.width / 2.0;
            if (std::find(classnames.begin(), classnames.end(), obj.classname()) == classnames.end())
                continue;
            if (cx > kicker_window::kMinCenterX && cx < kicker_window::kMaxCenterX && obj.origin_y > min_y)
                return true;
        }
        return false;
    }

    bool RobotClient::has_any_barrel() { return holds_object({"BlueBarrel", "OrangeBarrel"}, kicker_window::kBarrelMinY); }

    bool RobotClient::has_blue_barrel() { return holds_object({"BlueBarrel"}, kicker_window::kBarrelMinY); }

    bool RobotClient::has_orange_barrel() { return holds_object({"OrangeBarrel"}, kicker_window::kBarrelMinY); }

    bool RobotClient::has_sports_ball() { return holds_object({"SportsBall"}, kicker_window::kBallMinY); }

    void RobotClient::calibrate_imu() { send(commands::imu_calibrate()); }

    bool RobotClient::is_calibrating() const
    {
        if (status_->shadow().pending_set(ShadowFlag::ImuCalibrating))
            return true;
        return status()->has_flag(flags::kImuCalibrating);
    }

    void RobotClient::set_crash_sensitivity(int sensitivity) { send(commands::imu_set_crash_threshold(sensitivity)); }

    void RobotClient::set_heading(double heading) { heading_offset_ = status()->robot.heading - heading; }

    void RobotClient::set_rotation(double rotation) { rotation_offset_ = status()->robot.rotation - rotation; }

    double RobotClient::heading() const
    {
        double h = round2(std::fmod(status()->robot.heading - heading_offset_, 360.0));
        if (h < 0)
            h += 360.0;
        return h;
    }

    double RobotClient::rotation() const { return round2(status()->robot.rotation - rotation_offset_); }

    double RobotClient::roll() const { return round2(status()->robot.roll); }

    double RobotClient::pitch() const { return round2(status()->robot.pitch); }

    double RobotClient::yaw() const { return round2(status()->robot.yaw); }

    double RobotClient::acceleration(Axis axis) const
    {
        const Vec3 &a = status()->robot.acceleration;
        return axis == Axis::X ? a.x : axis == Axis::Y ? a.y : a.z;
    }

    double RobotClient::turn_rate(Axis axis) const
    {
        const Vec3 &g = status()->robot.gyro_rate;
        return axis == Axis::X ? g.x : axis == Axis::Y ? g.y : g.z;
    }

    void RobotClient::show_file(const std::string &filename, int x, int y)
    {
        const std::string ext = filename.size() >= 3 ? lower(filename.substr(filename.size() - 3)) : filename;
        if (ext != "bmp" && ext != "png")
            throw InvalidImageFile("extension is " + ext + "; expected extension to be bmp or png");
        send(commands::lcd_draw_image_from_file(filename, x, y));
    }

    void RobotClient::kick(KickType type) { send(commands::kick(type)); }

    void RobotClient::mark_sound_active()
    {
        status_->shadow().request_set(ShadowFlag::SoundPlaying);
        status_->shadow().request_set(ShadowFlag::SoundDownloading);
    }

    void RobotClient::play_sound(const std::string &name, int volume) { send(commands::play_sound(lower(name), volume)); }

    void RobotClient::play_file(const std::string &name, int volume) { send(commands::play_file(name, volume)); }

    void RobotClient::play_note(const std::string &note, int duration_ms, int volume)
    {
        const auto parsed = parse_note(note);
        send(commands::play_note(parsed.first, parsed.second, std::min(duration_ms, 4000), std::clamp(volume, 0, 100)));
        mark_sound_active();
    }

    void RobotClient::play_local_file(const std::string &path, int volume)
    {
        send_audio(load_sound_file(path, volume));
        mark_sound_active();
    }

    void RobotClient::stop_sound() { send(commands::stop_sound()); }

    bool RobotClient::sound_active() const
    {
        const ShadowFlags &shadow = status_->shadow();
        if (shadow.pending_set(ShadowFlag::SoundPlaying) || shadow.pending_set(ShadowFlag::SoundDownloading))
            return true;
        auto snap = status();
        return snap->has_flag(flags::kSoundPlaying) || snap->has_flag(flags::kSoundDownloading);
    }

    void RobotClient::led_on(int index, const Rgb &color)
    {
        const std::string led = (index >= 0 && index < 6) ? "light" + std::to_string(index + 1) : "all";
        send(commands::light_set(led, color));
    }

    std::vector<vision::DetectedObject> RobotClient::get_data(const vision::Descriptor &desc, int count)
    {
        return vision_.get_data(status()->vision, desc, count);
    }

    std::vector<vision::DetectedObject> RobotClient::get_data(const std::vector<vision::Descriptor> &descs, int count)
    {
        return vision_.get_data(status()->vision, descs, count);
    }

    std::string RobotClient::get_camera_image()
    {
        return image_->get_image(std::chrono::milliseconds(config_.image_wait_ms));
    }

    void RobotClient::tag_detection(bool enable) { send(commands::tag_detection(enable)); }

    void RobotClient::color_detection(bool enable, bool merge) { send(commands::color_detection(enable, merge)); }

    void RobotClient::model_detection(bool enable) { send(commands::model_detection(enable)); }

    void RobotClient::color_description(const vision::ColorDescription &desc)
    {
        send(commands::color_description(desc.id, desc.red, desc.green, desc.blue, desc.hangle, desc.hdsat));
    }

    void RobotClient::code_description(const vision::CodeDescription &desc)
    {
        const auto &ids = desc.color_ids;
        if (ids.size() < 2 || ids.size() > 5)
            throw std::invalid_argument("a color code needs two to five colors");
        auto at = [&ids](size_t i)
        { return i < ids.size() ? ids[i] : -1; };
        send(commands::code_description(desc.id, at(0), at(1), at(2), at(3), at(4)));
    }

} // namespace robot
