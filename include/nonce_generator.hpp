#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/rand.h>

namespace bhumi {

class NonceGenerator {
public:
    // Per-connection handshake nonce sent in HELLO.
    static uint32_t generate_nonce() {
        unsigned char buffer[4];
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            throw std::runtime_error("CSPRNG Failure - Entropy Exhausted");
        }
        return (static_cast<uint32_t>(buffer[0]) << 24) |
               (static_cast<uint32_t>(buffer[1]) << 16) |
               (static_cast<uint32_t>(buffer[2]) << 8) |
               static_cast<uint32_t>(buffer[3]);
    }

    // Random hex token, used for relay identifiers when none is configured.
    static std::string generate_token(size_t bytes = 16) {
        unsigned char buffer[64];
        if (bytes > sizeof(buffer)) bytes = sizeof(buffer);
        if (RAND_bytes(buffer, static_cast<int>(bytes)) != 1) {
            throw std::runtime_error("CSPRNG Failure - Entropy Exhausted");
        }

        std::stringstream ss;
        for (size_t i = 0; i < bytes; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)buffer[i];
        }
        return ss.str();
    }
};

}
