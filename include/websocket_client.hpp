#pragma once
#include "connection.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace ws
{

    struct Uri
    {
        std::string scheme; // "ws" or "wss"
        std::string host;
        uint16_t port = 80;
        std::string path = "/";
        bool tls = false;
    };

    // Parse scheme://host[:port][/path]. Returns false for anything else.
    bool parse_uri(const std::string &uri, Uri &out);

    struct FrameHeader
    {
        bool fin = true;
        Opcode opcode = Opcode::Binary;
        bool masked = false;
        uint64_t payload_len = 0;
        size_t header_len = 0; // bytes including extended length and mask key
        unsigned char mask[4] = {0, 0, 0, 0};
    };

    // Build one complete client frame (FIN set, payload masked with mask_key).
    std::string encode_frame(Opcode opcode, const std::string &payload, const unsigned char mask_key[4]);

    // Decode a frame header from the start of data.
    // Returns false if len is too short to hold the whole header.
    bool decode_frame_header(const unsigned char *data, size_t len, FrameHeader &out);

    // RFC 6455 client over POSIX sockets, with OpenSSL for wss://.
    class WebSocketClient : public Connection
    {
    public:
        // Largest reassembled message accepted from the peer.
        static constexpr uint64_t kMaxMessageBytes = 16u * 1024u * 1024u;

        WebSocketClient() = default;
        ~WebSocketClient() override;

        bool open(const std::string &uri, int timeout_ms) override;
        bool send(const std::string &payload, Opcode opcode) override;
        bool receive(std::string &out) override;
        void close() override;
        bool is_open() const override { return open_; }
        const std::string &last_error() const override { return last_error_; }

    private:
        bool handshake(const Uri &uri);
        bool send_frame(Opcode opcode, const std::string &payload);
        bool write_all(const char *data, size_t len);
        bool read_exact(char *out, size_t len);
        long raw_read(char *buf, size_t len);
        bool fail(const std::string &msg);
        void release();

        int fd_ = -1;
        SSL_CTX *ctx_ = nullptr;
        SSL *ssl_ = nullptr;
        bool open_ = false;
        bool debug_ = false;
        std::string label_;
        std::string rx_buffer_; // bytes read past the handshake response
        std::string last_error_;

        WebSocketClient(const WebSocketClient &) = delete;
        WebSocketClient &operator=(const WebSocketClient &) = delete;
    };

} // namespace ws
