#include "digest.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

static std::string to_hex(const unsigned char* data, size_t n) {
    std::ostringstream ss;
    for (size_t i = 0; i < n; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

static std::string sha256_raw(const void* data, size_t n) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data, n);
    SHA256_Final(hash, &ctx);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256_hex(const std::string& data) {
    return sha256_raw(data.data(), data.size());
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_raw(data.data(), data.size());
}

std::string random_hex(size_t nbytes) {
    std::vector<unsigned char> buf(nbytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return "";
    }
    return to_hex(buf.data(), buf.size());
}
