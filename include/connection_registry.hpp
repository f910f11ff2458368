#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "connection.hpp"
#include "identity_verifier.hpp"
#include "types.hpp"

namespace bhumi {

// Tracks live connections and the identity each one has proven.
// At most one connection is authoritative for an identity at any time.
class ConnectionRegistry {
public:
    using ConnectionPtr = std::shared_ptr<Connection>;
    using WeakConnectionPtr = std::weak_ptr<Connection>;

    // Fired outside the registry lock whenever a handle stops being the
    // authoritative binding of its identity (disconnect, displacement or
    // re-bind to another identity). `released` carries the identity when no
    // connection is bound to it any more.
    using UnbindListener = std::function<void(ConnectionHandle handle, const std::optional<Id52>& released)>;

    enum class BindResult {
        BOUND,
        BAD_SIGNATURE,
        UNKNOWN_HANDLE
    };

    explicit ConnectionRegistry(std::shared_ptr<const IdentityVerifier> verifier);
    ~ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    void add_unbind_listener(UnbindListener listener);

    // Assigns a fresh handle and handshake nonce to the connection.
    ConnectionHandle register_connection(const ConnectionPtr& connection);

    /**
     * Verifies `signature` over nonce || id52 and makes the handle the
     * authoritative binding for id52. A previous holder of the identity is
     * displaced and closed.
     */
    BindResult bind(ConnectionHandle handle, const Id52& id52, const Signature& signature);

    // Forgets the handle. Idempotent.
    void unbind(ConnectionHandle handle);

    // Returns the authoritative live connection for id52, if any.
    ConnectionPtr lookup(const Id52& id52) const;

    std::optional<Id52> identity_of(ConnectionHandle handle) const;

    ConnectionPtr connection(ConnectionHandle handle) const;

    // True while the handle is the authoritative binding of an identity.
    bool is_live(ConnectionHandle handle) const;

    std::vector<ConnectionPtr> bound_connections() const;

    size_t connection_count() const;
    size_t bound_count() const;
    size_t connection_count_for_ip(const std::string& ip_address) const;

    // Admission accounting at accept time.
    bool increment_ip_count(const std::string& ip, size_t per_ip_limit, size_t global_limit);
    void decrement_ip_count(const std::string& ip);

    void close_all_connections();

private:
    struct Entry {
        WeakConnectionPtr connection;
        std::optional<Id52> identity;
    };

    struct Release {
        ConnectionHandle handle;
        std::optional<Id52> released;
    };

    void notify(const std::vector<Release>& releases);

    std::shared_ptr<const IdentityVerifier> verifier_;
    std::atomic<ConnectionHandle> next_handle_{1};

    std::unordered_map<ConnectionHandle, Entry> connections_;
    std::unordered_map<Id52, ConnectionHandle, KeyHash> identities_;
    std::unordered_map<std::string, size_t> ip_counts_;
    size_t admitted_ = 0;
    mutable std::shared_mutex connections_mutex_;

    std::vector<UnbindListener> listeners_;
    std::mutex listeners_mutex_;
};

}
