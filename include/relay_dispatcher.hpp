#pragma once

#include <chrono>
#include <memory>

#include "capability_store.hpp"
#include "connection.hpp"
#include "connection_registry.hpp"
#include "frame_codec.hpp"
#include "messages.hpp"
#include "presence_service.hpp"
#include "response_cache.hpp"
#include "send_orchestrator.hpp"
#include "server_config.hpp"

namespace bhumi {

// Per-connection protocol state machine shared by every relay session.
// Sessions own the transport; the dispatcher decides what each frame means.
class RelayDispatcher {
public:
    using ConnectionPtr = std::shared_ptr<Connection>;

    RelayDispatcher(const ServerConfig& config,
                    ConnectionRegistry& registry,
                    CapabilityStore& capabilities,
                    ResponseCache& cache,
                    SendOrchestrator& orchestrator,
                    PresenceService& presence);

    RelayDispatcher(const RelayDispatcher&) = delete;
    RelayDispatcher& operator=(const RelayDispatcher&) = delete;

    // Registers the connection and greets it with HELLO.
    ConnectionHandle on_open(const ConnectionPtr& conn);

    /**
     * Handles one inbound frame.
     * @return false when the connection must be closed (protocol violation,
     *         malformed payload or failed authentication).
     */
    bool on_frame(const ConnectionPtr& conn, const Frame& frame);

    void on_close(const ConnectionPtr& conn);

private:
    bool handle_i_am(const ConnectionPtr& conn, const Bytes& payload);
    bool handle_update_commits(const ConnectionPtr& conn, const Bytes& payload);
    bool handle_send(const ConnectionPtr& conn, const Bytes& payload);
    bool handle_ack(const ConnectionPtr& conn, const Bytes& payload);
    bool handle_presence(const ConnectionPtr& conn, const Bytes& payload);

    bool reject(const ConnectionPtr& conn, const std::string& reason);

    ConnectionRegistry& registry_;
    CapabilityStore& capabilities_;
    ResponseCache& cache_;
    SendOrchestrator& orchestrator_;
    PresenceService& presence_;

    size_t max_payload_size_;
    size_t max_recent_responses_;
    std::chrono::seconds cache_ttl_;
};

}
