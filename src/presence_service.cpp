#include "presence_service.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <variant>

namespace bhumi {

const char* presence_verdict_to_string(PresenceVerdict verdict) {
    switch (verdict) {
        case PresenceVerdict::ACCEPTED: return "accepted";
        case PresenceVerdict::STALE: return "stale";
        case PresenceVerdict::BAD_SIGNATURE: return "bad_signature";
        case PresenceVerdict::EXPIRED: return "expired";
        case PresenceVerdict::FROM_FUTURE: return "from_future";
        case PresenceVerdict::TTL_TOO_LONG: return "ttl_too_long";
        default: return "unknown";
    }
}

PresenceService::PresenceService(const IdentityVerifier& verifier,
                                 ConnectionRegistry& registry,
                                 PeerTransport* transport,
                                 Options options)
    : verifier_(verifier)
    , registry_(registry)
    , transport_(transport)
    , options_(options)
    , rng_(std::random_device{}()) {
    if (transport_) {
        transport_->set_message_handler([this](const Bytes& payload) {
            try {
                accept(PresenceRecord::decode(payload), unix_now());
            } catch (const MessageError& e) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::PRESENCE,
                                   "internal", std::string("Malformed gossip from peer: ") + e.what());
            }
        });
    }
}

PresenceService::~PresenceService() {
    if (transport_) {
        transport_->set_message_handler(nullptr);
    }
}

uint64_t PresenceService::unix_now() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

PresenceVerdict PresenceService::accept(const PresenceRecord& record, uint64_t now) {
    PresenceVerdict verdict = PresenceVerdict::ACCEPTED;

    if (record.ttl > options_.max_ttl) {
        verdict = PresenceVerdict::TTL_TOO_LONG;
    } else if (record.issued_at > now + options_.max_clock_skew) {
        verdict = PresenceVerdict::FROM_FUTURE;
    } else if (record.expires_at() <= now) {
        verdict = PresenceVerdict::EXPIRED;
    } else if (!verifier_.verify(record.id52, record.signed_bytes(), record.signature)) {
        verdict = PresenceVerdict::BAD_SIGNATURE;
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(record.id52);
        if (it != records_.end() && it->second.issued_at >= record.issued_at) {
            verdict = PresenceVerdict::STALE;
        } else {
            records_[record.id52] = record;
        }
    }

    auto& metrics = MetricsRegistry::instance();
    if (verdict == PresenceVerdict::ACCEPTED) {
        metrics.increment_counter("presence_accepted_total");
    } else {
        metrics.increment_counter(std::string("presence_rejected_") + presence_verdict_to_string(verdict) + "_total");
        if (verdict == PresenceVerdict::BAD_SIGNATURE) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::PRESENCE,
                               "internal", "Presence record for " + short_id(record.id52) + " failed verification");
        }
    }
    return verdict;
}

size_t PresenceService::expire(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end(); ) {
        if (it->second.expires_at() <= now) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<PresenceRecord> PresenceService::sample_live(uint64_t now) {
    std::vector<PresenceRecord> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            if (record.expires_at() > now) {
                live.push_back(record);
            }
        }
    }

    if (live.size() > options_.fanout_records) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::shuffle(live.begin(), live.end(), rng_);
        live.resize(options_.fanout_records);
    }
    return live;
}

// One push round: a random subset of live records to a random subset of
// targets drawn from bound devices and peer relays.
PresenceService::GossipStats PresenceService::gossip_round(uint64_t now) {
    GossipStats stats;

    auto records = sample_live(now);
    if (records.empty()) {
        return stats;
    }

    using Target = std::variant<ConnectionRegistry::ConnectionPtr, std::string>;
    std::vector<Target> targets;
    for (auto& conn : registry_.bound_connections()) {
        targets.emplace_back(std::move(conn));
    }
    if (transport_) {
        for (auto& peer : transport_->peers()) {
            targets.emplace_back(std::move(peer));
        }
    }

    if (targets.size() > options_.fanout_peers) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::shuffle(targets.begin(), targets.end(), rng_);
        targets.resize(options_.fanout_peers);
    }
    if (targets.empty()) {
        return stats;
    }

    std::vector<Bytes> encoded;
    encoded.reserve(records.size());
    for (const auto& r : records) {
        encoded.push_back(r.encode());
    }
    stats.records = records.size();

    for (const auto& target : targets) {
        size_t delivered = 0;
        if (auto conn = std::get_if<ConnectionRegistry::ConnectionPtr>(&target)) {
            for (const auto& payload : encoded) {
                if (!(*conn)->send_frame(make_frame(MessageType::PRESENCE, payload))) break;
                ++delivered;
            }
            if (delivered > 0) ++stats.device_targets;
        } else {
            const auto& peer = std::get<std::string>(target);
            for (const auto& payload : encoded) {
                if (!transport_->publish(peer, payload)) break;
                ++delivered;
            }
            if (delivered > 0) ++stats.peer_targets;
        }
    }

    MetricsRegistry::instance().increment_counter("gossip_rounds_total");
    return stats;
}

std::optional<PresenceRecord> PresenceService::lookup(const Id52& id52) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id52);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PresenceService::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}
