#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "frame_codec.hpp"
#include "types.hpp"

namespace bhumi {

// Raised when a frame's payload does not match its message layout.
class MessageError : public std::runtime_error {
public:
    explicit MessageError(const std::string& what) : std::runtime_error(what) {}
};

constexpr uint8_t PROTOCOL_VERSION = 1;

struct Hello {
    uint8_t version = PROTOCOL_VERSION;
    uint32_t nonce = 0;
    uint32_t max_payload_size = 0;

    Bytes encode() const;
    static Hello decode(const Bytes& data);
};

// A response the device produced earlier and re-uploads so that a sender
// retrying against this relay can be answered from cache.
struct RecentResponse {
    Preimage preimage{};
    Bytes response;
};

struct IAm {
    Id52 id52{};
    Signature signature{};  // Sign(nonce || id52)
    std::vector<Commit> commits;
    std::vector<RecentResponse> recent_responses;

    Bytes encode() const;
    static IAm decode(const Bytes& data);
};

struct SendRequest {
    Id52 to_id52{};
    Preimage preimage{};
    Bytes payload;

    Bytes encode() const;
    static SendRequest decode(const Bytes& data);
};

struct Deliver {
    CorrelationId correlation_id = 0;
    Bytes payload;

    Bytes encode() const;
    static Deliver decode(const Bytes& data);
};

struct Ack {
    CorrelationId correlation_id = 0;
    Bytes payload;

    Bytes encode() const;
    static Ack decode(const Bytes& data);
};

struct SendResult {
    SendStatus status = SendStatus::OK;
    Bytes payload;

    Bytes encode() const;
    static SendResult decode(const Bytes& data);
};

struct UpdateCommits {
    std::vector<Commit> commits;

    Bytes encode() const;
    static UpdateCommits decode(const Bytes& data);
};

struct PresenceRecord {
    Id52 id52{};
    uint64_t issued_at = 0;  // unix seconds
    uint32_t ttl = 0;        // seconds
    std::string relay_id;
    Signature signature{};

    // Bytes covered by the signature: every field before it, in wire order.
    Bytes signed_bytes() const;
    Bytes encode() const;
    static PresenceRecord decode(const Bytes& data);

    uint64_t expires_at() const { return issued_at + ttl; }
};

// Frame helpers for the messages the relay emits.
Frame make_frame(MessageType type, Bytes payload);
inline Frame make_keepalive() { return Frame{MessageType::KEEPALIVE, {}}; }

}
