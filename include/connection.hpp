#pragma once
#include <string>
#include <cstdint>

namespace ws
{

    // WebSocket frame opcodes (RFC 6455, 5.2)
    enum class Opcode : uint8_t
    {
        Continuation = 0x0,
        Text = 0x1,
        Binary = 0x2,
        Close = 0x8,
        Ping = 0x9,
        Pong = 0xA
    };

    // One persistent message connection to one endpoint.
    // Every operation reports failure by returning false; the reason is
    // available from last_error() until the next call.
    class Connection
    {
    public:
        virtual ~Connection() = default;

        // timeout_ms applies to connect, handshake and every later read/write.
        virtual bool open(const std::string &uri, int timeout_ms) = 0;

        // Send one complete message.
        virtual bool send(const std::string &payload, Opcode opcode) = 0;

        // Block for one complete text or binary message.
        virtual bool receive(std::string &out) = 0;

        virtual void close() = 0;
        virtual bool is_open() const = 0;
        virtual const std::string &last_error() const = 0;
    };

} // namespace ws
