#include "crypto.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <vector>

namespace crypto {

static const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return oss.str();
}

std::string base64_encode(const unsigned char* data, size_t len) {
    if (len == 0) return {};
    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL
    std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), data, static_cast<int>(len));
    if (n < 0) return {};
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
}

std::string sha1_base64(const std::string& data)
{
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string random_bytes(size_t count)
{
    std::string out(count, '\0');
    if (count == 0) return out;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&out[0]), static_cast<int>(count)) != 1)
        return std::string();
    return out;
}

std::string websocket_accept_key(const std::string& client_key)
{
    return sha1_base64(client_key + kWebSocketGuid);
}

} // namespace crypto
