#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>

#include "connection_registry.hpp"
#include "identity_verifier.hpp"
#include "messages.hpp"
#include "peer_transport.hpp"
#include "types.hpp"

namespace bhumi {

enum class PresenceVerdict {
    ACCEPTED,
    STALE,
    BAD_SIGNATURE,
    EXPIRED,
    FROM_FUTURE,
    TTL_TOO_LONG
};

const char* presence_verdict_to_string(PresenceVerdict verdict);

// Best-effort store and epidemic spread of signed presence records.
// Records are stored and forwarded exactly as signed; the relay never
// rewrites TTL or issuer.
class PresenceService {
public:
    struct Options {
        uint32_t max_ttl = 3600;
        uint64_t max_clock_skew = 60;
        size_t fanout_records = 16;
        size_t fanout_peers = 4;
    };

    struct GossipStats {
        size_t records = 0;
        size_t device_targets = 0;
        size_t peer_targets = 0;
    };

    // `transport` may be null for a standalone relay.
    PresenceService(const IdentityVerifier& verifier,
                    ConnectionRegistry& registry,
                    PeerTransport* transport,
                    Options options);
    ~PresenceService();

    PresenceService(const PresenceService&) = delete;
    PresenceService& operator=(const PresenceService&) = delete;

    // `now` is unix seconds.
    PresenceVerdict accept(const PresenceRecord& record, uint64_t now);

    // Drops records whose issued_at + ttl <= now. Returns the number removed.
    size_t expire(uint64_t now);

    GossipStats gossip_round(uint64_t now);

    std::optional<PresenceRecord> lookup(const Id52& id52) const;
    size_t size() const;

    static uint64_t unix_now();

private:
    std::vector<PresenceRecord> sample_live(uint64_t now);

    const IdentityVerifier& verifier_;
    ConnectionRegistry& registry_;
    PeerTransport* transport_;
    Options options_;

    std::unordered_map<Id52, PresenceRecord, KeyHash> records_;
    mutable std::mutex mutex_;

    std::mt19937 rng_;
    std::mutex rng_mutex_;
};

}
