#include "response_cache.hpp"
#include "metrics.hpp"

#include <algorithm>

namespace bhumi {

ResponseCache::ResponseCache(size_t max_entries)
    : max_entries_per_shard_(std::max<size_t>(1, max_entries / SHARD_COUNT)) {}

ResponseCache::Shard& ResponseCache::shard_for(const Preimage& preimage) {
    return shards_[KeyHash{}(preimage) % SHARD_COUNT];
}

std::optional<Bytes> ResponseCache::take(const Preimage& preimage, Clock::time_point now) {
    auto& shard = shard_for(preimage);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(preimage);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }

    Entry entry = std::move(it->second);
    shard.entries.erase(it);
    if (entry.expires_at <= now) {
        return std::nullopt;
    }
    return std::move(entry.response);
}

std::optional<Bytes> ResponseCache::peek(const Preimage& preimage, Clock::time_point now) {
    auto& shard = shard_for(preimage);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(preimage);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    if (it->second.expires_at <= now) {
        shard.entries.erase(it);
        return std::nullopt;
    }
    return it->second.response;
}

// Caller holds shard.mutex.
void ResponseCache::insert_locked(Shard& shard, const Preimage& preimage, Entry entry) {
    auto existing = shard.entries.find(preimage);
    if (existing != shard.entries.end()) {
        existing->second = std::move(entry);
        return;
    }

    if (shard.entries.size() >= max_entries_per_shard_) {
        // Evict whichever entry would expire first.
        auto victim = std::min_element(shard.entries.begin(), shard.entries.end(),
            [](const auto& a, const auto& b) { return a.second.expires_at < b.second.expires_at; });
        if (victim != shard.entries.end()) {
            shard.entries.erase(victim);
            MetricsRegistry::instance().increment_counter("cache_evicted_capacity_total");
        }
    }
    shard.entries.emplace(preimage, std::move(entry));
}

void ResponseCache::store(const Preimage& preimage, Bytes response, std::chrono::seconds ttl,
                          Clock::time_point now) {
    auto& shard = shard_for(preimage);
    std::lock_guard<std::mutex> lock(shard.mutex);
    insert_locked(shard, preimage, Entry{std::move(response), now + ttl});
}

size_t ResponseCache::store_uploaded(const Id52& uploader, const std::vector<RecentResponse>& responses,
                                     size_t max_entries, std::chrono::seconds ttl,
                                     Clock::time_point now) {
    std::vector<Preimage> previous;
    std::vector<Preimage> current;
    current.reserve(std::min(responses.size(), max_entries));
    for (const auto& rr : responses) {
        if (current.size() >= max_entries) break;
        current.push_back(rr.preimage);
    }

    {
        std::lock_guard<std::mutex> lock(uploads_mutex_);
        auto& slot = uploads_[uploader];
        previous.swap(slot);
        if (current.empty()) {
            uploads_.erase(uploader);
        } else {
            slot = current;
        }
    }

    for (const auto& preimage : previous) {
        auto& shard = shard_for(preimage);
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.entries.erase(preimage);
    }

    for (size_t i = 0; i < current.size(); ++i) {
        auto& shard = shard_for(responses[i].preimage);
        std::lock_guard<std::mutex> lock(shard.mutex);
        insert_locked(shard, responses[i].preimage, Entry{responses[i].response, now + ttl});
    }
    return current.size();
}

size_t ResponseCache::sweep(Clock::time_point now) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end(); ) {
            if (it->second.expires_at <= now) {
                it = shard.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    // Forget upload slots whose entries have all expired or been taken.
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    for (auto slot = uploads_.begin(); slot != uploads_.end(); ) {
        auto& preimages = slot->second;
        preimages.erase(std::remove_if(preimages.begin(), preimages.end(),
            [this](const Preimage& preimage) {
                auto& shard = shard_for(preimage);
                std::lock_guard<std::mutex> shard_lock(shard.mutex);
                return shard.entries.find(preimage) == shard.entries.end();
            }), preimages.end());

        if (preimages.empty()) {
            slot = uploads_.erase(slot);
        } else {
            ++slot;
        }
    }
    return removed;
}

size_t ResponseCache::upload_slot_count() {
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    return uploads_.size();
}

size_t ResponseCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

}
