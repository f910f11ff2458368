#include "relay_dispatcher.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace bhumi {

RelayDispatcher::RelayDispatcher(const ServerConfig& config,
                                 ConnectionRegistry& registry,
                                 CapabilityStore& capabilities,
                                 ResponseCache& cache,
                                 SendOrchestrator& orchestrator,
                                 PresenceService& presence)
    : registry_(registry)
    , capabilities_(capabilities)
    , cache_(cache)
    , orchestrator_(orchestrator)
    , presence_(presence)
    , max_payload_size_(config.max_payload_size)
    , max_recent_responses_(config.max_recent_responses)
    , cache_ttl_(config.cache_ttl_sec) {
    // Commits belong to the connection that installed them; they go when it goes.
    registry_.add_unbind_listener([this](ConnectionHandle handle, const std::optional<Id52>& released) {
        if (released) {
            capabilities_.remove_owned(*released, handle);
        }
    });
}

ConnectionHandle RelayDispatcher::on_open(const ConnectionPtr& conn) {
    ConnectionHandle handle = registry_.register_connection(conn);

    Hello hello;
    hello.nonce = conn->nonce();
    hello.max_payload_size = static_cast<uint32_t>(max_payload_size_);
    conn->send_frame(make_frame(MessageType::HELLO, hello.encode()));
    return handle;
}

void RelayDispatcher::on_close(const ConnectionPtr& conn) {
    registry_.unbind(conn->handle());
}

bool RelayDispatcher::reject(const ConnectionPtr& conn, const std::string& reason) {
    MetricsRegistry::instance().increment_counter("protocol_violations_total");
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::PROTOCOL_VIOLATION,
                       conn->remote_address(), reason);
    return false;
}

bool RelayDispatcher::on_frame(const ConnectionPtr& conn, const Frame& frame) {
    MetricsRegistry::instance().increment_counter("frames_received_total");

    try {
        switch (frame.type) {
            case MessageType::I_AM:
                return handle_i_am(conn, frame.payload);
            case MessageType::UPDATE_COMMITS:
                return handle_update_commits(conn, frame.payload);
            case MessageType::SEND:
                return handle_send(conn, frame.payload);
            case MessageType::ACK:
                return handle_ack(conn, frame.payload);
            case MessageType::PRESENCE:
                return handle_presence(conn, frame.payload);
            case MessageType::KEEPALIVE:
                return true;
            case MessageType::HELLO:
            case MessageType::DELIVER:
            case MessageType::SEND_RESULT:
                return reject(conn, std::string("Client sent relay-only message ") + message_type_to_string(frame.type));
        }
    } catch (const MessageError& e) {
        return reject(conn, std::string("Malformed ") + message_type_to_string(frame.type) + ": " + e.what());
    }
    return reject(conn, "Unhandled message type");
}

bool RelayDispatcher::handle_i_am(const ConnectionPtr& conn, const Bytes& payload) {
    IAm msg = IAm::decode(payload);

    auto result = registry_.bind(conn->handle(), msg.id52, msg.signature);
    if (result == ConnectionRegistry::BindResult::BAD_SIGNATURE) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                           conn->remote_address(), "I_AM signature rejected for " + short_id(msg.id52));
        return false;
    }
    if (result != ConnectionRegistry::BindResult::BOUND) {
        return reject(conn, "I_AM on unregistered connection");
    }

    size_t kept = capabilities_.install(msg.id52, msg.commits, conn->handle());
    size_t cached = cache_.store_uploaded(msg.id52, msg.recent_responses, max_recent_responses_, cache_ttl_);

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::AUTH_SUCCESS,
                       conn->remote_address(),
                       "Bound " + short_id(msg.id52) + " commits=" + std::to_string(kept) +
                       " cached=" + std::to_string(cached));
    return true;
}

bool RelayDispatcher::handle_update_commits(const ConnectionPtr& conn, const Bytes& payload) {
    UpdateCommits msg = UpdateCommits::decode(payload);

    auto identity = registry_.identity_of(conn->handle());
    if (!identity) {
        return reject(conn, "UPDATE_COMMITS before I_AM");
    }
    capabilities_.add(*identity, msg.commits, conn->handle());
    return true;
}

bool RelayDispatcher::handle_send(const ConnectionPtr& conn, const Bytes& payload) {
    SendRequest msg = SendRequest::decode(payload);

    // Senders may stay anonymous; only the recipient needs a binding.
    if (msg.payload.size() > max_payload_size_) {
        return reject(conn, "SEND payload exceeds " + std::to_string(max_payload_size_) + " bytes");
    }

    std::weak_ptr<Connection> weak_sender = conn;
    orchestrator_.send(msg, [weak_sender](SendOutcome outcome) {
        auto sender = weak_sender.lock();
        if (!sender) return;

        SendResult result{outcome.status, std::move(outcome.payload)};
        if (!sender->send_frame(make_frame(MessageType::SEND_RESULT, result.encode()))) {
            MetricsRegistry::instance().increment_counter("send_result_dropped_total");
        }
    });
    return true;
}

bool RelayDispatcher::handle_ack(const ConnectionPtr& conn, const Bytes& payload) {
    Ack msg = Ack::decode(payload);
    if (!orchestrator_.on_ack(conn->handle(), msg)) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::DELIVERY,
                           conn->remote_address(), "Ignored late or foreign ACK " + std::to_string(msg.correlation_id));
    }
    return true;
}

// Presence is best effort: an unacceptable record is dropped, the link stays up.
bool RelayDispatcher::handle_presence(const ConnectionPtr& conn, const Bytes& payload) {
    PresenceRecord record = PresenceRecord::decode(payload);
    presence_.accept(record, PresenceService::unix_now());
    return true;
}

}
