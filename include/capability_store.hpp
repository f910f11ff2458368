#pragma once

#include <array>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace bhumi {

// Per-identity sets of unconsumed admission commits.
// Sharded by identity; all operations on one identity are serialized by its
// shard lock, which makes try_consume linearizable per recipient.
class CapabilityStore {
public:
    static constexpr size_t SHARD_COUNT = 32;

    explicit CapabilityStore(size_t max_commits_per_identity = 1024);

    CapabilityStore(const CapabilityStore&) = delete;
    CapabilityStore& operator=(const CapabilityStore&) = delete;

    // Replaces the identity's commit set wholesale and records the connection
    // that owns it. Returns the number kept.
    size_t install(const Id52& id52, const std::vector<Commit>& commits, ConnectionHandle owner = 0);

    // Adds commits to the identity's set, creating it for `owner` if absent.
    // Returns the number added.
    size_t add(const Id52& id52, const std::vector<Commit>& commits, ConnectionHandle owner = 0);

    // Hashes the preimage and removes the matching commit if present.
    bool try_consume(const Id52& id52, const Preimage& preimage);

    void remove(const Id52& id52);

    // Drops the identity's set only while `owner` still owns it. A newer
    // install from another connection survives a late release of the old one.
    bool remove_owned(const Id52& id52, ConnectionHandle owner);

    size_t commit_count(const Id52& id52) const;
    size_t identity_count() const;

private:
    struct CommitSet {
        std::unordered_set<Commit, KeyHash> commits;
        ConnectionHandle owner = 0;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<Id52, CommitSet, KeyHash> sets;
    };

    Shard& shard_for(const Id52& id52);
    const Shard& shard_for(const Id52& id52) const;

    size_t max_commits_;
    std::array<Shard, SHARD_COUNT> shards_;
};

}
