#include "command_worker.hpp"
#include "errors.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace robot
{

    using json = nlohmann::json;

    const char *status_name(CommandStatus status)
    {
        switch (status)
        {
        case CommandStatus::Complete:
            return "complete";
        case CommandStatus::InProgress:
            return "in_progress";
        case CommandStatus::Rejected:
            return "error";
        case CommandStatus::Unknown:
            return "cmd_unknown";
        case CommandStatus::Malformed:
            return "malformed";
        }
        return "unknown";
    }

    CommandWorker::CommandWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                                 CancellationToken &token, ShadowFlags &shadow)
        : ChannelWorker(std::string(cfg.channel_prefix) + channels::kCommand, std::move(uri), std::move(conn), cfg, token),
          shadow_(shadow)
    {
    }

    CommandWorker::~CommandWorker() { stop(); }

    std::chrono::milliseconds CommandWorker::cycle_period() const
    {
        return std::chrono::milliseconds(config().idle_period_ms);
    }

    bool CommandWorker::is_move_command(const std::string &cmd_id)
    {
        return cmd_id == "drive" || cmd_id == "drive_for";
    }

    bool CommandWorker::is_turn_command(const std::string &cmd_id)
    {
        return cmd_id == "turn" || cmd_id == "turn_for" || cmd_id == "turn_to";
    }

    CommandResult CommandWorker::send(const Command &cmd)
    {
        std::lock_guard<std::mutex> lock(command_mutex_);
        if (config().verbose)
            std::cerr << "[Command] >>> " << cmd.to_wire() << "\n";

        // Binary frame carrying JSON text, as the firmware expects.
        ChannelWorker::send(cmd.to_wire(), true);

        std::string response;
        try
        {
            response = receive();
        }
        catch (const ReceiveError &e)
        {
            throw Disconnected("robot got disconnected after sending cmd_id: " + cmd.id + " (" + e.what() + ")");
        }

        if (config().verbose)
            std::cerr << "[Command] <<< " << response << "\n";
        return interpret(cmd.id, response);
    }

    CommandResult CommandWorker::interpret(const std::string &cmd_id, const std::string &response)
    {
        CommandResult result;
        result.cmd_id = cmd_id;

        json j;
        try
        {
            j = json::parse(response);
        }
        catch (const json::parse_error &e)
        {
            std::cerr << "[Command] " << cmd_id << " Error: could not parse response: '" << e.what() << "'\n";
            result.status = CommandStatus::Malformed;
            result.reason = e.what();
            return result;
        }
        if (!j.is_object())
        {
            std::cerr << "[Command] " << cmd_id << " Error: response is not a JSON object\n";
            result.status = CommandStatus::Malformed;
            result.reason = "response is not a JSON object";
            return result;
        }

        auto id_it = j.find("cmd_id");
        auto status_it = j.find("status");
        if ((id_it != j.end() && !id_it->is_string()) || (status_it != j.end() && !status_it->is_string()))
        {
            std::cerr << "[Command] " << cmd_id << " Error: cmd_id and status must be strings\n";
            result.status = CommandStatus::Malformed;
            result.reason = "cmd_id and status must be strings";
            return result;
        }
        const std::string reply_id = id_it != j.end() ? id_it->get<std::string>() : std::string();
        const std::string status = status_it != j.end() ? status_it->get<std::string>() : std::string();

        if (reply_id == "cmd_unknown")
        {
            std::cerr << "[Command] robot: did not recognize command: " << cmd_id << "\n";
            result.status = CommandStatus::Unknown;
            return result;
        }

        if (status == "error")
        {
            result.status = CommandStatus::Rejected;
            auto info = j.find("error_info");
            result.reason = (info != j.end() && info->is_string()) ? info->get<std::string>() : "no reason given";
            std::cerr << "[Command] robot: error processing " << cmd_id << ", reason: " << result.reason << "\n";
            return result;
        }

        if (status == "complete")
            result.status = CommandStatus::Complete;
        else if (status == "in_progress")
            result.status = CommandStatus::InProgress;
        else
        {
            result.status = CommandStatus::Malformed;
            result.reason = "unexpected status '" + status + "'";
            std::cerr << "[Command] " << cmd_id << " Error: " << result.reason << "\n";
            return result;
        }

        if (is_move_command(reply_id))
            shadow_.request_set(ShadowFlag::MoveActive);
        if (is_turn_command(reply_id))
            shadow_.request_set(ShadowFlag::TurnActive);
        if (is_move_command(reply_id) || is_turn_command(reply_id))
            shadow_.request_set(ShadowFlag::Moving);
        if (reply_id == "imu_calibrate")
            shadow_.request_set(ShadowFlag::ImuCalibrating);

        return result;
    }

} // namespace robot
