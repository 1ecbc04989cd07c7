#pragma once
#include <cstddef>
#include <string>

namespace crypto {

// Standard Base64 (with padding) of a byte buffer.
std::string base64_encode(const unsigned char* data, size_t len);
// Base64 of the SHA-1 digest of data
std::string sha1_base64(const std::string& data);
// Cryptographically random bytes from the OpenSSL RNG.
// On error, returns empty string.
std::string random_bytes(size_t count);
// Sec-WebSocket-Accept value expected for a given Sec-WebSocket-Key (RFC 6455, 4.2.2)
std::string websocket_accept_key(const std::string& client_key);
// Lowercase hex, used for frame tracing
std::string to_hex(const unsigned char* data, size_t len);

} // namespace crypto
