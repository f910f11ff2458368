#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "capability_store.hpp"
#include "connection_registry.hpp"
#include "messages.hpp"
#include "response_cache.hpp"
#include "types.hpp"

namespace net = boost::asio;

namespace bhumi {

// Runs a SEND through admission, delivery and completion.
//
// A forwarded SEND waits in the pending table keyed by correlation id until
// exactly one of: ACK from the recipient connection, recipient unbind, or the
// deadline. Whoever removes the entry from its shard resolves it; every later
// attempt finds nothing and is ignored.
class SendOrchestrator {
public:
    using Completion = std::function<void(SendOutcome)>;
    static constexpr size_t SHARD_COUNT = 16;

    SendOrchestrator(net::io_context& ioc,
                     ConnectionRegistry& registry,
                     CapabilityStore& capabilities,
                     ResponseCache& cache,
                     std::chrono::milliseconds send_timeout,
                     std::chrono::seconds cache_ttl);

    SendOrchestrator(const SendOrchestrator&) = delete;
    SendOrchestrator& operator=(const SendOrchestrator&) = delete;

    // `completion` runs exactly once, possibly on another thread.
    void send(const SendRequest& request, Completion completion);

    // Returns true when the ACK resolved a pending send.
    bool on_ack(ConnectionHandle from, const Ack& ack);

    // Fails every pending send addressed to `recipient` with
    // RECIPIENT_DISCONNECTED. Returns the number resolved.
    size_t fail_pending_for(ConnectionHandle recipient);

    size_t pending_count() const;

private:
    struct PendingSend {
        ConnectionHandle recipient = 0;
        Preimage preimage{};
        Completion completion;
        std::shared_ptr<net::steady_timer> timer;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<CorrelationId, PendingSend> pending;
    };

    Shard& shard_for(CorrelationId id) { return shards_[id % SHARD_COUNT]; }

    CorrelationId insert_pending(PendingSend entry);
    void on_timeout(CorrelationId id);
    void finish(PendingSend& entry, SendOutcome outcome);
    static void complete(const Completion& completion, SendOutcome outcome);

    net::io_context& ioc_;
    ConnectionRegistry& registry_;
    CapabilityStore& capabilities_;
    ResponseCache& cache_;
    std::chrono::milliseconds send_timeout_;
    std::chrono::seconds cache_ttl_;

    std::atomic<CorrelationId> next_id_{1};
    std::array<Shard, SHARD_COUNT> shards_;
};

}
