#include "websocket_client.hpp"
#include "crypto.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <iostream>

namespace
{

    static bool set_timeouts(int fd, int timeout_ms)
    {
        if (timeout_ms <= 0)
            return true;
        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
            return false;
        if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0)
            return false;
        return true;
    }

    static int connect_with_timeout(int fd, const struct sockaddr *addr, socklen_t addrlen, int timeout_ms)
    {
        if (timeout_ms <= 0)
        {
            return ::connect(fd, addr, addrlen);
        }
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0)
            return -1;
        if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
            return -1;

        int rc = ::connect(fd, addr, addrlen);
        if (rc == 0)
        {
            fcntl(fd, F_SETFL, flags);
            return 0;
        }
        if (errno != EINPROGRESS && errno != EALREADY)
        {
            fcntl(fd, F_SETFL, flags);
            return -1;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int prc = poll(&pfd, 1, timeout_ms);
        if (prc <= 0)
        {
            if (prc == 0)
                errno = ETIMEDOUT;
            fcntl(fd, F_SETFL, flags);
            return -1;
        }
        int soerr = 0;
        socklen_t slen = sizeof(soerr);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0)
        {
            fcntl(fd, F_SETFL, flags);
            return -1;
        }
        if (soerr != 0)
        {
            errno = soerr;
            fcntl(fd, F_SETFL, flags);
            return -1;
        }
        fcntl(fd, F_SETFL, flags);
        return 0;
    }

    static std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::string trim(const std::string &s)
    {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos)
            return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    // Returns the value of header `name` (lowercase) or empty.
    static std::string find_header(const std::string &head, const std::string &name)
    {
        std::istringstream iss(head);
        std::string line;
        while (std::getline(iss, line))
        {
            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            if (lower(trim(line.substr(0, colon))) == name)
                return trim(line.substr(colon + 1));
        }
        return {};
    }

    static const char *opcode_name(ws::Opcode op)
    {
        switch (op)
        {
        case ws::Opcode::Continuation: return "CONT";
        case ws::Opcode::Text: return "TEXT";
        case ws::Opcode::Binary: return "BINARY";
        case ws::Opcode::Close: return "CLOSE";
        case ws::Opcode::Ping: return "PING";
        case ws::Opcode::Pong: return "PONG";
        }
        return "?";
    }

} // namespace

namespace ws
{

    bool parse_uri(const std::string &uri, Uri &out)
    {
        size_t sep = uri.find("://");
        if (sep == std::string::npos)
            return false;
        Uri u;
        u.scheme = lower(uri.substr(0, sep));
        if (u.scheme == "ws")
        {
            u.tls = false;
            u.port = 80;
        }
        else if (u.scheme == "wss")
        {
            u.tls = true;
            u.port = 443;
        }
        else
        {
            return false;
        }

        std::string rest = uri.substr(sep + 3);
        size_t slash = rest.find('/');
        std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
        u.path = slash == std::string::npos ? "/" : rest.substr(slash);
        if (authority.empty())
            return false;

        size_t colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']') == std::string::npos)
        {
            std::string port = authority.substr(colon + 1);
            if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos)
                return false;
            long p = std::strtol(port.c_str(), nullptr, 10);
            if (p <= 0 || p > 65535)
                return false;
            u.port = static_cast<uint16_t>(p);
            authority = authority.substr(0, colon);
        }
        if (authority.size() > 2 && authority.front() == '[' && authority.back() == ']')
            authority = authority.substr(1, authority.size() - 2);
        if (authority.empty())
            return false;
        u.host = authority;
        out = u;
        return true;
    }

    std::string encode_frame(Opcode opcode, const std::string &payload, const unsigned char mask_key[4])
    {
        std::string frame;
        frame.reserve(payload.size() + 14);
        frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));

        uint64_t len = payload.size();
        if (len < 126)
        {
            frame.push_back(static_cast<char>(0x80 | len));
        }
        else if (len <= 0xFFFF)
        {
            frame.push_back(static_cast<char>(0x80 | 126));
            frame.push_back(static_cast<char>((len >> 8) & 0xFF));
            frame.push_back(static_cast<char>(len & 0xFF));
        }
        else
        {
            frame.push_back(static_cast<char>(0x80 | 127));
            for (int shift = 56; shift >= 0; shift -= 8)
                frame.push_back(static_cast<char>((len >> shift) & 0xFF));
        }

        frame.append(reinterpret_cast<const char *>(mask_key), 4);
        for (size_t i = 0; i < payload.size(); ++i)
            frame.push_back(static_cast<char>(payload[i] ^ mask_key[i % 4]));
        return frame;
    }

    bool decode_frame_header(const unsigned char *data, size_t len, FrameHeader &out)
    {
        if (len < 2)
            return false;
        FrameHeader h;
        h.fin = (data[0] & 0x80) != 0;
        h.opcode = static_cast<Opcode>(data[0] & 0x0F);
        h.masked = (data[1] & 0x80) != 0;
        uint64_t plen = data[1] & 0x7F;
        size_t pos = 2;
        if (plen == 126)
        {
            if (len < pos + 2)
                return false;
            plen = (static_cast<uint64_t>(data[2]) << 8) | data[3];
            pos += 2;
        }
        else if (plen == 127)
        {
            if (len < pos + 8)
                return false;
            plen = 0;
            for (int i = 0; i < 8; ++i)
                plen = (plen << 8) | data[2 + i];
            pos += 8;
        }
        if (h.masked)
        {
            if (len < pos + 4)
                return false;
            std::memcpy(h.mask, data + pos, 4);
            pos += 4;
        }
        h.payload_len = plen;
        h.header_len = pos;
        out = h;
        return true;
    }

    WebSocketClient::~WebSocketClient()
    {
        close();
    }

    bool WebSocketClient::fail(const std::string &msg)
    {
        last_error_ = msg;
        if (debug_)
            std::cerr << "[WebSocket] " << label_ << ": " << msg << "\n";
        release();
        return false;
    }

    void WebSocketClient::release()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
        rx_buffer_.clear();
        open_ = false;
    }

    bool WebSocketClient::open(const std::string &uri, int timeout_ms)
    {
        release();
        last_error_.clear();
        const char *dbg_env = std::getenv("AIMLINK_WS_DEBUG");
        debug_ = dbg_env && *dbg_env;
        label_ = uri;

        Uri u;
        if (!parse_uri(uri, u))
        {
            last_error_ = "invalid uri: " + uri;
            return false;
        }

        // Resolve host
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo *res = nullptr;
        std::string port_str = std::to_string(u.port);
        int rc = getaddrinfo(u.host.c_str(), port_str.c_str(), &hints, &res);
        if (rc != 0)
        {
            last_error_ = std::string("getaddrinfo: ") + gai_strerror(rc);
            return false;
        }

        int fd = -1;
        for (struct addrinfo *p = res; p != nullptr; p = p->ai_next)
        {
            fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
            if (fd < 0)
                continue;
            if (!set_timeouts(fd, timeout_ms))
            {
                last_error_ = "setsockopt timeouts failed";
                ::close(fd);
                fd = -1;
                continue;
            }
            if (connect_with_timeout(fd, p->ai_addr, p->ai_addrlen, timeout_ms) == 0)
            {
                break;
            }
            char addrbuf[128] = {};
            if (p->ai_family == AF_INET)
            {
                struct sockaddr_in *sin = reinterpret_cast<struct sockaddr_in *>(p->ai_addr);
                inet_ntop(AF_INET, &sin->sin_addr, addrbuf, sizeof(addrbuf));
            }
            else if (p->ai_family == AF_INET6)
            {
                struct sockaddr_in6 *sin6 = reinterpret_cast<struct sockaddr_in6 *>(p->ai_addr);
                inet_ntop(AF_INET6, &sin6->sin6_addr, addrbuf, sizeof(addrbuf));
            }
            last_error_ = std::string("connect failed to ") + addrbuf + ": " + std::strerror(errno);
            ::close(fd);
            fd = -1;
        }
        freeaddrinfo(res);

        if (fd < 0)
        {
            if (last_error_.empty())
                last_error_ = "could not connect";
            return false;
        }
        fd_ = fd;

        if (u.tls)
        {
            SSL_load_error_strings();
            OpenSSL_add_ssl_algorithms();
            ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ctx_)
                return fail("OpenSSL: SSL_CTX_new failed");
            ssl_ = SSL_new(ctx_);
            if (!ssl_)
                return fail("OpenSSL: SSL_new failed");
            if (!SSL_set_fd(ssl_, fd_))
                return fail("OpenSSL: SSL_set_fd failed");
            if (!SSL_set_tlsext_host_name(ssl_, u.host.c_str()))
            {
                unsigned long err = ERR_get_error();
                char buf[256];
                ERR_error_string_n(err, buf, sizeof(buf));
                std::cerr << "[WebSocket] SSL_set_tlsext_host_name warning: " << buf << "\n";
            }
            if (SSL_connect(ssl_) != 1)
            {
                unsigned long err = ERR_get_error();
                char buf[256];
                ERR_error_string_n(err, buf, sizeof(buf));
                return fail(std::string("SSL_connect failed: ") + buf);
            }
        }

        if (!handshake(u))
            return false;
        open_ = true;
        return true;
    }

    bool WebSocketClient::handshake(const Uri &u)
    {
        std::string nonce = crypto::random_bytes(16);
        if (nonce.empty())
            return fail("RAND_bytes failed");
        std::string key = crypto::base64_encode(reinterpret_cast<const unsigned char *>(nonce.data()), nonce.size());

        std::ostringstream oss;
        oss << "GET " << u.path << " HTTP/1.1\r\n";
        oss << "Host: " << u.host << ":" << u.port << "\r\n";
        oss << "User-Agent: aimlink/1.0\r\n";
        oss << "Upgrade: websocket\r\n";
        oss << "Connection: Upgrade\r\n";
        oss << "Sec-WebSocket-Key: " << key << "\r\n";
        oss << "Sec-WebSocket-Version: 13\r\n\r\n";
        std::string req = oss.str();
        if (debug_)
            std::cerr << "[WebSocket] >>> Request:\n" << req;
        if (!write_all(req.data(), req.size()))
            return false;

        std::string resp;
        char buf[1024];
        size_t end = std::string::npos;
        while ((end = resp.find("\r\n\r\n")) == std::string::npos)
        {
            if (resp.size() > 16 * 1024)
                return fail("handshake response too large");
            long n = raw_read(buf, sizeof(buf));
            if (n <= 0)
            {
                if (last_error_.empty())
                    last_error_ = "connection closed during handshake";
                return fail(last_error_);
            }
            resp.append(buf, buf + n);
        }
        std::string head = resp.substr(0, end + 2);
        rx_buffer_ = resp.substr(end + 4);
        if (debug_)
            std::cerr << "[WebSocket] <<< Response:\n" << head << "\n";

        size_t line_end = head.find("\r\n");
        std::string status = head.substr(0, line_end);
        int code = 0;
        size_t sp1 = status.find(' ');
        if (sp1 != std::string::npos)
            code = std::atoi(status.c_str() + sp1 + 1);
        if (code != 101)
            return fail("handshake rejected: " + status);

        std::string accept = find_header(head, "sec-websocket-accept");
        if (accept != crypto::websocket_accept_key(key))
            return fail("handshake failed: bad Sec-WebSocket-Accept");
        return true;
    }

    long WebSocketClient::raw_read(char *buf, size_t len)
    {
        if (ssl_)
        {
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n <= 0)
            {
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN)
                    last_error_ = "connection closed by peer";
                else if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    last_error_ = "SSL read timeout";
                else
                    last_error_ = "SSL_read failed";
                return -1;
            }
            return n;
        }
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n == 0)
        {
            last_error_ = "connection closed by peer";
            return -1;
        }
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                last_error_ = "recv timeout";
            else
                last_error_ = std::string("recv failed: ") + std::strerror(errno);
            return -1;
        }
        return static_cast<long>(n);
    }

    bool WebSocketClient::read_exact(char *out, size_t len)
    {
        size_t got = std::min(len, rx_buffer_.size());
        if (got > 0)
        {
            std::memcpy(out, rx_buffer_.data(), got);
            rx_buffer_.erase(0, got);
        }
        while (got < len)
        {
            long n = raw_read(out + got, len - got);
            if (n <= 0)
                return fail(last_error_);
            got += static_cast<size_t>(n);
        }
        return true;
    }

    bool WebSocketClient::write_all(const char *data, size_t len)
    {
        while (len > 0)
        {
            long sent = 0;
            if (ssl_)
            {
                sent = SSL_write(ssl_, data, static_cast<int>(len));
                if (sent <= 0)
                    return fail("SSL_write failed");
            }
            else
            {
                sent = ::send(fd_, data, len, MSG_NOSIGNAL);
                if (sent < 0)
                    return fail(std::string("send failed: ") + std::strerror(errno));
            }
            data += sent;
            len -= static_cast<size_t>(sent);
        }
        return true;
    }

    bool WebSocketClient::send_frame(Opcode opcode, const std::string &payload)
    {
        std::string mask = crypto::random_bytes(4);
        if (mask.size() != 4)
            return fail("RAND_bytes failed");
        std::string frame = encode_frame(opcode, payload, reinterpret_cast<const unsigned char *>(mask.data()));
        if (debug_)
        {
            std::cerr << "[WebSocket] >>> " << label_ << " " << opcode_name(opcode) << " len=" << payload.size();
            if (payload.size() <= 32)
                std::cerr << " " << crypto::to_hex(reinterpret_cast<const unsigned char *>(payload.data()), payload.size());
            std::cerr << "\n";
        }
        return write_all(frame.data(), frame.size());
    }

    bool WebSocketClient::send(const std::string &payload, Opcode opcode)
    {
        if (!open_)
        {
            last_error_ = "not connected";
            return false;
        }
        return send_frame(opcode, payload);
    }

    bool WebSocketClient::receive(std::string &out)
    {
        if (!open_)
        {
            last_error_ = "not connected";
            return false;
        }
        std::string message;
        bool in_message = false;
        while (true)
        {
            unsigned char head[14];
            if (!read_exact(reinterpret_cast<char *>(head), 2))
                return false;
            size_t need = 2;
            uint8_t len7 = head[1] & 0x7F;
            if (len7 == 126)
                need += 2;
            else if (len7 == 127)
                need += 8;
            if (head[1] & 0x80)
                need += 4;
            if (need > 2 && !read_exact(reinterpret_cast<char *>(head + 2), need - 2))
                return false;

            FrameHeader h;
            if (!decode_frame_header(head, need, h))
                return fail("malformed frame header");
            if (h.payload_len > kMaxMessageBytes || message.size() + h.payload_len > kMaxMessageBytes)
                return fail("message too large");

            std::string payload(static_cast<size_t>(h.payload_len), '\0');
            if (h.payload_len > 0 && !read_exact(&payload[0], payload.size()))
                return false;
            if (h.masked)
            {
                for (size_t i = 0; i < payload.size(); ++i)
                    payload[i] = static_cast<char>(payload[i] ^ h.mask[i % 4]);
            }
            if (debug_)
                std::cerr << "[WebSocket] <<< " << label_ << " " << opcode_name(h.opcode) << " len=" << payload.size() << "\n";

            switch (h.opcode)
            {
            case Opcode::Ping:
                if (!send_frame(Opcode::Pong, payload))
                    return false;
                continue;
            case Opcode::Pong:
                continue;
            case Opcode::Close:
            {
                int code = payload.size() >= 2
                               ? (static_cast<unsigned char>(payload[0]) << 8) | static_cast<unsigned char>(payload[1])
                               : 1005;
                // Echo the close frame; the connection is gone either way.
                std::string mask = crypto::random_bytes(4);
                if (mask.size() == 4)
                {
                    std::string frame = encode_frame(Opcode::Close, payload.substr(0, 2),
                                                     reinterpret_cast<const unsigned char *>(mask.data()));
                    if (ssl_)
                        SSL_write(ssl_, frame.data(), static_cast<int>(frame.size()));
                    else
                        ::send(fd_, frame.data(), frame.size(), MSG_NOSIGNAL);
                }
                return fail("connection closed by peer (code " + std::to_string(code) + ")");
            }
            case Opcode::Text:
            case Opcode::Binary:
                if (in_message)
                    return fail("new message started before previous one finished");
                if (h.fin)
                {
                    out.swap(payload);
                    return true;
                }
                message.swap(payload);
                in_message = true;
                continue;
            case Opcode::Continuation:
                if (!in_message)
                    return fail("continuation frame without a message");
                message += payload;
                if (h.fin)
                {
                    out.swap(message);
                    return true;
                }
                continue;
            }
            return fail("unknown opcode " + std::to_string(static_cast<int>(h.opcode)));
        }
    }

    void WebSocketClient::close()
    {
        if (open_ && fd_ >= 0)
        {
            std::string mask = crypto::random_bytes(4);
            if (mask.size() == 4)
            {
                // 1000 = normal closure
                std::string code("\x03\xE8", 2);
                std::string frame = encode_frame(Opcode::Close, code, reinterpret_cast<const unsigned char *>(mask.data()));
                if (ssl_)
                    SSL_write(ssl_, frame.data(), static_cast<int>(frame.size()));
                else
                    ::send(fd_, frame.data(), frame.size(), MSG_NOSIGNAL);
            }
        }
        release();
    }

} // namespace ws
