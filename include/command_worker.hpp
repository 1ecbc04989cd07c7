#pragma once
#include "channel_worker.hpp"
#include "commands.hpp"
#include "shadow_flags.hpp"
#include <mutex>

namespace robot
{

    enum class CommandStatus
    {
        Complete,
        InProgress,
        Rejected,  // robot answered status "error"
        Unknown,   // robot did not recognise the cmd_id
        Malformed  // response could not be parsed
    };

    struct CommandResult
    {
        CommandStatus status = CommandStatus::Complete;
        std::string cmd_id;
        std::string reason; // robot's error_info or the parse error

        bool accepted() const { return status == CommandStatus::Complete || status == CommandStatus::InProgress; }
    };

    const char *status_name(CommandStatus status);

    // Request/response channel. One command in flight at a time; the loop only
    // keeps the connection alive.
    class CommandWorker final : public ChannelWorker
    {
    public:
        CommandWorker(std::string uri, std::unique_ptr<ws::Connection> conn, const ClientConfig &cfg,
                      CancellationToken &token, ShadowFlags &shadow);
        ~CommandWorker() override;

        // Send and block for the correlated response. Accepted motion and
        // calibration commands raise the matching shadow flags. Throws
        // Disconnected if the transport fails at any point; never retries.
        CommandResult send(const Command &cmd);

        static bool is_move_command(const std::string &cmd_id);
        static bool is_turn_command(const std::string &cmd_id);

    protected:
        void duty_cycle() override {}
        std::chrono::milliseconds cycle_period() const override;

    private:
        CommandResult interpret(const std::string &cmd_id, const std::string &response);

        ShadowFlags &shadow_;
        std::mutex command_mutex_;
    };

} // namespace robot
