#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

namespace bhumi {

using Bytes = std::vector<uint8_t>;

// Ed25519 public key; the only addressing unit the relay knows about.
using Id52 = std::array<uint8_t, 32>;
using Preimage = std::array<uint8_t, 32>;
using Commit = std::array<uint8_t, 32>;
using Signature = std::array<uint8_t, 64>;

using ConnectionHandle = uint64_t;
using CorrelationId = uint32_t;

// SEND_RESULT status codes as they appear on the wire.
enum class SendStatus : uint8_t {
    OK = 0,
    RECIPIENT_OFFLINE = 1,
    INVALID_CAPABILITY = 2,
    RECIPIENT_TIMEOUT = 3,
    RECIPIENT_DISCONNECTED = 4
};

struct SendOutcome {
    SendStatus status = SendStatus::OK;
    Bytes payload;

    static SendOutcome success(Bytes payload) { return {SendStatus::OK, std::move(payload)}; }
    static SendOutcome failure(SendStatus status) { return {status, {}}; }
};

inline const char* status_to_string(SendStatus status) {
    switch (status) {
        case SendStatus::OK: return "ok";
        case SendStatus::RECIPIENT_OFFLINE: return "recipient_offline";
        case SendStatus::INVALID_CAPABILITY: return "invalid_capability";
        case SendStatus::RECIPIENT_TIMEOUT: return "recipient_timeout";
        case SendStatus::RECIPIENT_DISCONNECTED: return "recipient_disconnected";
        default: return "unknown";
    }
}

// Hash for the fixed-size key arrays. Keys are hashes or random values already,
// so the leading bytes are uniformly distributed.
struct KeyHash {
    template<size_t N>
    size_t operator()(const std::array<uint8_t, N>& key) const noexcept {
        static_assert(N >= sizeof(size_t));
        size_t h;
        std::memcpy(&h, key.data(), sizeof(h));
        return h;
    }
};

inline std::string to_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

template<size_t N>
std::string to_hex(const std::array<uint8_t, N>& key) {
    return to_hex(key.data(), N);
}

// Short identity prefix used in log lines; full identities never reach the logs.
inline std::string short_id(const Id52& id) {
    return to_hex(id.data(), 6);
}

}
