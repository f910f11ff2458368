#include "capability_store.hpp"
#include "identity_verifier.hpp"
#include "security_logger.hpp"

#include <algorithm>

namespace bhumi {

CapabilityStore::CapabilityStore(size_t max_commits_per_identity)
    : max_commits_(max_commits_per_identity) {}

CapabilityStore::Shard& CapabilityStore::shard_for(const Id52& id52) {
    return shards_[KeyHash{}(id52) % SHARD_COUNT];
}

const CapabilityStore::Shard& CapabilityStore::shard_for(const Id52& id52) const {
    return shards_[KeyHash{}(id52) % SHARD_COUNT];
}

size_t CapabilityStore::install(const Id52& id52, const std::vector<Commit>& commits,
                                ConnectionHandle owner) {
    CommitSet fresh;
    fresh.owner = owner;
    fresh.commits.reserve(std::min(commits.size(), max_commits_));
    for (const auto& c : commits) {
        if (fresh.commits.size() >= max_commits_) break;
        fresh.commits.insert(c);
    }

    if (commits.size() > max_commits_) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::PROTOCOL_VIOLATION,
                           "internal", "Commit set for " + short_id(id52) + " truncated to " + std::to_string(max_commits_));
    }

    size_t kept = fresh.commits.size();
    auto& shard = shard_for(id52);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.sets[id52] = std::move(fresh);
    return kept;
}

size_t CapabilityStore::add(const Id52& id52, const std::vector<Commit>& commits, ConnectionHandle owner) {
    auto& shard = shard_for(id52);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto [it, created] = shard.sets.try_emplace(id52);
    if (created) {
        it->second.owner = owner;
    }
    auto& set = it->second.commits;

    size_t added = 0;
    for (const auto& c : commits) {
        if (set.size() >= max_commits_) break;
        if (set.insert(c).second) ++added;
    }
    return added;
}

bool CapabilityStore::try_consume(const Id52& id52, const Preimage& preimage) {
    const Commit commit = commit_of(preimage);

    auto& shard = shard_for(id52);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.sets.find(id52);
    if (it == shard.sets.end()) {
        return false;
    }
    return it->second.commits.erase(commit) > 0;
}

void CapabilityStore::remove(const Id52& id52) {
    auto& shard = shard_for(id52);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.sets.erase(id52);
}

bool CapabilityStore::remove_owned(const Id52& id52, ConnectionHandle owner) {
    auto& shard = shard_for(id52);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.sets.find(id52);
    if (it == shard.sets.end() || it->second.owner != owner) {
        return false;
    }
    shard.sets.erase(it);
    return true;
}

size_t CapabilityStore::commit_count(const Id52& id52) const {
    const auto& shard = shard_for(id52);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.sets.find(id52);
    return it == shard.sets.end() ? 0 : it->second.commits.size();
}

size_t CapabilityStore::identity_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.sets.size();
    }
    return total;
}

}
