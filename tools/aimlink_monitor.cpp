// aimlink_monitor.cpp
// Connects to a robot and prints its live state until Ctrl-C or until the
// program is ended from the robot.
// Usage: aimlink_monitor [--host <addr>] [--config <settings.json>] [--snapshot <file.jpg>] [--verbose]

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include "../include/errors.hpp"
#include "../include/robot_client.hpp"

namespace
{
    void print_state(robot::RobotClient &client)
    {
        auto snap = client.status();
        auto objects = client.get_data(vision::objects::kAllObjects, vision::PerceptionPipeline::kMaxObjects);
        std::cout << std::fixed << std::setprecision(1)
                  << "battery " << snap->robot.battery << "%"
                  << "  heading " << client.heading()
                  << "  x " << client.x_position() << " y " << client.y_position()
                  << "  flags 0x" << std::hex << snap->robot.flags << std::dec
                  << (client.is_stopped() ? "  stopped" : "  moving")
                  << "  objects " << objects.size();
        if (auto largest = client.largest_object())
        {
            std::cout << " (largest id " << largest->id;
            if (!largest->classname().empty())
                std::cout << " " << largest->classname();
            std::cout << " bearing " << largest->bearing << ")";
        }
        std::cout << "\n";
    }
} // namespace

int main(int argc, char **argv)
{
    std::string host;
    std::string config_path;
    std::string snapshot_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc)
        {
            host = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--snapshot" && i + 1 < argc)
        {
            snapshot_path = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cout << "aimlink_monitor options:\n"
                      << "  --host <addr>         Robot address (default: AIMLINK_HOST or settings.json)\n"
                      << "  --config <path>       Settings file with connection/client sections\n"
                      << "  --snapshot <file>     Save one camera frame and exit\n"
                      << "  --verbose             Trace every command and reconnect attempt\n"
                      << "  --help                Show this help\n\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << " (try --help)\n";
            return 2;
        }
    }

    robot::ClientConfig cfg;
    if (!config_path.empty() && !cfg.load_from_file(config_path))
    {
        std::cerr << "[Config] Invalid settings in " << config_path << "\n";
        return 2;
    }
    cfg.verbose = cfg.verbose || verbose;

    try
    {
        robot::RobotClient client(host, cfg);
        robot::install_signal_handlers(client.token());

        if (!snapshot_path.empty())
        {
            std::string image = client.get_camera_image();
            std::ofstream out(snapshot_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                std::cerr << "Failed to open " << snapshot_path << " for writing\n";
                return 2;
            }
            out.write(image.data(), static_cast<std::streamsize>(image.size()));
            std::cout << "Saved " << image.size() << " bytes to " << snapshot_path << "\n";
            return 0;
        }

        client.on_crash([]
                        { std::cout << "crash detected\n"; });
        client.on_screen_pressed([&client]
                                 { std::cout << "screen pressed at " << client.touch_x() << "," << client.touch_y() << "\n"; });

        while (!client.token().wait_for(std::chrono::milliseconds(500)))
            print_state(client);

        std::cout << "Stopping: " << client.token().reason() << "\n";
    }
    catch (const robot::AimError &e)
    {
        std::cerr << "[Robot] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
