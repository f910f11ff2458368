#pragma once

#include <array>
#include <chrono>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "messages.hpp"
#include "types.hpp"

namespace bhumi {

// Global, preimage-keyed cache of responses produced by recipients. Lets a
// sender retry a SEND without the recipient being contacted twice.
// Expired entries are never returned; they are dropped on access and by sweep().
class ResponseCache {
public:
    using Clock = std::chrono::steady_clock;
    static constexpr size_t SHARD_COUNT = 32;

    explicit ResponseCache(size_t max_entries = 100000);

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Returns the live entry for the preimage and evicts it.
    std::optional<Bytes> take(const Preimage& preimage, Clock::time_point now = Clock::now());

    // Returns the live entry without evicting it.
    std::optional<Bytes> peek(const Preimage& preimage, Clock::time_point now = Clock::now());

    void store(const Preimage& preimage, Bytes response, std::chrono::seconds ttl,
               Clock::time_point now = Clock::now());

    /**
     * Loads responses re-uploaded by a recipient in I_AM. Each identity owns a
     * single upload slot: entries from its previous upload are evicted first,
     * and at most `max_entries` of the new ones are kept.
     * @return number of entries stored.
     */
    size_t store_uploaded(const Id52& uploader, const std::vector<RecentResponse>& responses,
                          size_t max_entries, std::chrono::seconds ttl,
                          Clock::time_point now = Clock::now());

    // Drops every expired entry and any upload slot left empty. Returns the
    // number of entries removed.
    size_t sweep(Clock::time_point now = Clock::now());

    size_t size() const;
    size_t upload_slot_count();

private:
    struct Entry {
        Bytes response;
        Clock::time_point expires_at;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<Preimage, Entry, KeyHash> entries;
    };

    Shard& shard_for(const Preimage& preimage);
    void insert_locked(Shard& shard, const Preimage& preimage, Entry entry);

    size_t max_entries_per_shard_;
    std::array<Shard, SHARD_COUNT> shards_;

    std::mutex uploads_mutex_;
    std::unordered_map<Id52, std::vector<Preimage>, KeyHash> uploads_;
};

}
