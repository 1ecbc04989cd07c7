#pragma once
#include <stdexcept>
#include <string>

namespace robot
{

    class AimError : public std::runtime_error
    {
    public:
        explicit AimError(const std::string &what) : std::runtime_error(what) {}
    };

    // Transport lost while a caller was sending or waiting on a reply.
    class Disconnected : public AimError
    {
    public:
        using AimError::AimError;
    };

    // No camera frame arrived within the image wait.
    class NoImage : public AimError
    {
    public:
        using AimError::AimError;
    };

    // Receive failed inside a worker loop. Absorbed by the owning worker.
    class ReceiveError : public AimError
    {
    public:
        using AimError::AimError;
    };

    class InvalidSoundFile : public AimError
    {
    public:
        using AimError::AimError;
    };

    class InvalidImageFile : public AimError
    {
    public:
        using AimError::AimError;
    };

    // The robot answered a command with status "error".
    class CommandRejected : public AimError
    {
    public:
        CommandRejected(const std::string &cmd_id, const std::string &reason)
            : AimError("robot rejected " + cmd_id + ": " + reason), cmd_id_(cmd_id), reason_(reason) {}
        const std::string &cmd_id() const { return cmd_id_; }
        const std::string &reason() const { return reason_; }

    private:
        std::string cmd_id_;
        std::string reason_;
    };

    // The program was cancelled while a call was waiting.
    class Cancelled : public AimError
    {
    public:
        using AimError::AimError;
    };

    // Log and terminate the process. Used when the robot cannot be reached at all.
    [[noreturn]] void fatal(const std::string &msg);

} // namespace robot
