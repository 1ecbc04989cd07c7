#pragma once
#include "audio_worker.hpp"
#include "blocking.hpp"
#include "cancellation.hpp"
#include "client_config.hpp"
#include "command_worker.hpp"
#include "commands.hpp"
#include "image_worker.hpp"
#include "perception.hpp"
#include "status_worker.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace robot
{

    enum class TurnDirection
    {
        Left,
        Right
    };

    enum class DriveUnits
    {
        Percent, // 0..100 -> 0..200 mm/s
        Mmps
    };

    enum class TurnUnits
    {
        Percent, // 0..100 -> 0..180 deg/s
        Dps
    };

    enum class Axis
    {
        X, // forward / roll
        Y, // rightward / pitch
        Z  // downward / yaw
    };

    // Kicker window in camera pixels: an object inside it is held by the robot.
    namespace kicker_window
    {
        constexpr double kMinCenterX = 120.0;
        constexpr double kMaxCenterX = 200.0;
        constexpr int kBarrelMinY = 160;
        constexpr int kBallMinY = 170;
    } // namespace kicker_window

    constexpr int kAllLeds = -1;

    // Client for one robot: owns the four channel workers and exposes motion,
    // sensing, sound, LED and vision operations on top of them.
    class RobotClient
    {
    public:
        // Connects every channel; terminates the process if any of them cannot
        // be reached. An empty host falls back to cfg.host, then to
        // Settings::default_host(). Returns once the first status snapshot
        // has arrived.
        explicit RobotClient(const std::string &host = "", const ClientConfig &cfg = ClientConfig(),
                             ConnectionFactory factory = websocket_connection_factory());
        ~RobotClient();

        const std::string &host() const { return host_; }
        const ClientConfig &config() const { return config_; }
        CancellationToken &token() { return token_; }

        // Latest status snapshot.
        std::shared_ptr<const StatusSnapshot> status() const { return status_->snapshot(); }

        // Send a command and wait for its response. A rejected command is
        // logged, or thrown as CommandRejected when throw_on_rejected is set.
        CommandResult send(const Command &cmd);
        void send_audio(const std::string &payload);

        // Callbacks run on the status thread.
        void on_screen_pressed(StatusWorker::Callback cb) { status_->on_screen_pressed(std::move(cb)); }
        void on_screen_released(StatusWorker::Callback cb) { status_->on_screen_released(std::move(cb)); }
        void on_crash(StatusWorker::Callback cb) { status_->on_crash(std::move(cb)); }
        void on_status(StatusWorker::Callback cb) { status_->on_status(std::move(cb)); }

        // ---- Motion ----
        void set_move_velocity(double velocity, DriveUnits units = DriveUnits::Percent);
        void set_turn_velocity(double velocity, TurnUnits units = TurnUnits::Percent);
        int move_velocity() const { return drive_speed_; }
        int turn_velocity() const { return turn_speed_; }

        void move_at(double angle, std::optional<double> velocity = std::nullopt, DriveUnits units = DriveUnits::Percent);
        void move_for(double distance, double angle, std::optional<double> velocity = std::nullopt,
                      DriveUnits units = DriveUnits::Percent, bool wait = true);
        void move_with_vectors(double forwards, double rightwards, double rotation);
        void turn(TurnDirection direction, std::optional<double> velocity = std::nullopt,
                  TurnUnits units = TurnUnits::Percent);
        void turn_for(TurnDirection direction, double angle, std::optional<double> velocity = std::nullopt,
                      TurnUnits units = TurnUnits::Percent, bool wait = true);
        void turn_to(double heading, std::optional<double> velocity = std::nullopt,
                     TurnUnits units = TurnUnits::Percent, bool wait = true);
        void spin_wheels(int velocity1, int velocity2, int velocity3);
        void stop_all_movement();
        void set_xy_position(double x, double y);

        double x_position() const;
        double y_position() const;
        bool is_move_active() const;
        bool is_turn_active() const;
        bool is_stopped() const;
        int battery_capacity() const { return status()->robot.battery; }

        bool has_any_barrel();
        bool has_blue_barrel();
        bool has_orange_barrel();
        bool has_sports_ball();

        // ---- Inertial ----
        void calibrate_imu();
        bool is_calibrating() const;
        void set_crash_sensitivity(int sensitivity);
        void set_heading(double heading);
        void reset_heading() { set_heading(0.0); }
        void set_rotation(double rotation);
        void reset_rotation() { set_rotation(0.0); }
        double heading() const;
        double rotation() const;
        double roll() const;
        double pitch() const;
        double yaw() const;
        double acceleration(Axis axis) const;
        double turn_rate(Axis axis) const;

        // ---- Screen ----
        bool screen_pressing() const { return status()->touch_pressed(); }
        double touch_x() const { return status()->robot.touch_x; }
        double touch_y() const { return status()->robot.touch_y; }
        int screen_row() const { return status()->robot.screen_row; }
        int screen_column() const { return status()->robot.screen_column; }
        // Throws InvalidImageFile unless the name ends in bmp or png.
        void show_file(const std::string &filename, int x, int y);

        // ---- Kicker ----
        void kick(KickType type);
        void place() { kick(KickType::Soft); }

        // ---- Sound ----
        void play_sound(const std::string &name, int volume = 50);
        void play_file(const std::string &name, int volume = 50);
        // note: "C5".."B8" with optional '#' or 'b' ("F#6").
        void play_note(const std::string &note, int duration_ms = 750, int volume = 50);
        void play_local_file(const std::string &path, int volume = 100);
        void stop_sound();
        bool sound_active() const;

        // ---- LEDs ----
        // index 0..5, anything else (kAllLeds) means all six.
        void led_on(int index, const Rgb &color);
        void led_off(int index) { led_on(index, Rgb{}); }

        // ---- Vision ----
        std::vector<vision::DetectedObject> get_data(const vision::Descriptor &desc,
                                                     int count = vision::PerceptionPipeline::kDefaultObjects);
        std::vector<vision::DetectedObject> get_data(const std::vector<vision::Descriptor> &descs,
                                                     int count = vision::PerceptionPipeline::kDefaultObjects);
        std::optional<vision::DetectedObject> largest_object() const { return vision_.largest_object(); }
        int object_count() const { return vision_.object_count(); }
        // Starts the stream on first use. Throws NoImage if no frame arrives in time.
        std::string get_camera_image();
        void tag_detection(bool enable);
        void color_detection(bool enable, bool merge = false);
        void model_detection(bool enable);
        void color_description(const vision::ColorDescription &desc);
        void code_description(const vision::CodeDescription &desc);

        StatusWorker &status_worker() { return *status_; }
        ImageWorker &image_worker() { return *image_; }
        CommandWorker &command_worker() { return *command_; }
        AudioWorker &audio_worker() { return *audio_; }

    private:
        void connect_or_die(ChannelWorker &worker);
        bool wait_until_idle(bool (RobotClient::*busy)() const, const char *what);
        void mark_sound_active();
        int to_drive_speed(double velocity, DriveUnits units) const;
        int to_turn_speed(double velocity, TurnUnits units) const;
        bool holds_object(const std::vector<std::string> &classnames, int min_y);

        std::string host_;
        ClientConfig config_;
        CancellationToken token_;

        std::unique_ptr<StatusWorker> status_;
        std::unique_ptr<ImageWorker> image_;
        std::unique_ptr<CommandWorker> command_;
        std::unique_ptr<AudioWorker> audio_;
        vision::PerceptionPipeline vision_;

        std::atomic<int> drive_speed_{100}; // mm/s
        std::atomic<int> turn_speed_{75};   // deg/s
        std::atomic<double> heading_offset_{0.0};
        std::atomic<double> rotation_offset_{0.0};

        RobotClient(const RobotClient &) = delete;
        RobotClient &operator=(const RobotClient &) = delete;
    };

    // Parse a note name into (note 0..11, octave 0..3). Throws std::invalid_argument.
    std::pair<int, int> parse_note(const std::string &note);

} // namespace robot
