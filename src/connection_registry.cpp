#include "connection_registry.hpp"
#include "metrics.hpp"
#include "nonce_generator.hpp"
#include "security_logger.hpp"

#include <mutex>

namespace bhumi {

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<const IdentityVerifier> verifier)
    : verifier_(std::move(verifier)) {
}

void ConnectionRegistry::add_unbind_listener(UnbindListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void ConnectionRegistry::notify(const std::vector<Release>& releases) {
    if (releases.empty()) return;

    std::vector<UnbindListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& r : releases) {
        for (const auto& listener : listeners) {
            listener(r.handle, r.released);
        }
    }
}

ConnectionHandle ConnectionRegistry::register_connection(const ConnectionPtr& connection) {
    ConnectionHandle handle = next_handle_.fetch_add(1);
    connection->set_handle(handle);
    connection->set_nonce(NonceGenerator::generate_nonce());

    std::unique_lock lock(connections_mutex_);
    connections_[handle] = Entry{connection, std::nullopt};
    return handle;
}

ConnectionRegistry::BindResult ConnectionRegistry::bind(ConnectionHandle handle, const Id52& id52,
                                                        const Signature& signature) {
    ConnectionPtr conn = connection(handle);
    if (!conn) {
        return BindResult::UNKNOWN_HANDLE;
    }

    if (!verifier_->verify(id52, handshake_message(conn->nonce(), id52), signature)) {
        MetricsRegistry::instance().increment_counter("auth_failure_total");
        return BindResult::BAD_SIGNATURE;
    }

    std::vector<Release> releases;
    ConnectionPtr displaced;
    {
        std::unique_lock lock(connections_mutex_);
        auto self = connections_.find(handle);
        if (self == connections_.end()) {
            return BindResult::UNKNOWN_HANDLE;
        }

        // Same connection moving to another identity: give up the old one.
        if (self->second.identity && *self->second.identity != id52) {
            const Id52 previous = *self->second.identity;
            auto it = identities_.find(previous);
            if (it != identities_.end() && it->second == handle) {
                identities_.erase(it);
                MetricsRegistry::instance().decrement_gauge("bound_identities");
            }
            self->second.identity.reset();
            releases.push_back({handle, previous});
        }

        auto holder = identities_.find(id52);
        if (holder == identities_.end()) {
            identities_.emplace(id52, handle);
            MetricsRegistry::instance().increment_gauge("bound_identities");
        } else if (holder->second != handle) {
            ConnectionHandle old_handle = holder->second;
            holder->second = handle;

            auto old = connections_.find(old_handle);
            if (old != connections_.end()) {
                old->second.identity.reset();
                displaced = old->second.connection.lock();
            }
            releases.push_back({old_handle, std::nullopt});
        }
        self->second.identity = id52;
    }

    if (displaced) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::IDENTITY_DISPLACED,
                           displaced->remote_address(), "Identity " + short_id(id52) + " re-bound elsewhere");
        MetricsRegistry::instance().increment_counter("identity_displaced_total");
        displaced->close();
    }

    notify(releases);
    return BindResult::BOUND;
}

// Removes the handle and, when it was authoritative, the identity binding.
void ConnectionRegistry::unbind(ConnectionHandle handle) {
    std::vector<Release> releases;
    {
        std::unique_lock lock(connections_mutex_);
        auto it = connections_.find(handle);
        if (it == connections_.end()) {
            return;
        }

        std::optional<Id52> released;
        if (it->second.identity) {
            auto id_it = identities_.find(*it->second.identity);
            if (id_it != identities_.end() && id_it->second == handle) {
                identities_.erase(id_it);
                released = *it->second.identity;
                MetricsRegistry::instance().decrement_gauge("bound_identities");
            }
        }
        connections_.erase(it);
        releases.push_back({handle, released});
    }

    notify(releases);
}

ConnectionRegistry::ConnectionPtr ConnectionRegistry::lookup(const Id52& id52) const {
    std::shared_lock lock(connections_mutex_);
    auto it = identities_.find(id52);
    if (it == identities_.end()) {
        return nullptr;
    }
    auto conn_it = connections_.find(it->second);
    if (conn_it == connections_.end()) {
        return nullptr;
    }

    auto conn = conn_it->second.connection.lock();
    if (conn && !conn->is_open()) {
        return nullptr;
    }
    return conn;
}

std::optional<Id52> ConnectionRegistry::identity_of(ConnectionHandle handle) const {
    std::shared_lock lock(connections_mutex_);
    auto it = connections_.find(handle);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second.identity;
}

ConnectionRegistry::ConnectionPtr ConnectionRegistry::connection(ConnectionHandle handle) const {
    std::shared_lock lock(connections_mutex_);
    auto it = connections_.find(handle);
    if (it == connections_.end()) {
        return nullptr;
    }
    return it->second.connection.lock();
}

bool ConnectionRegistry::is_live(ConnectionHandle handle) const {
    std::shared_lock lock(connections_mutex_);
    auto it = connections_.find(handle);
    if (it == connections_.end() || !it->second.identity) {
        return false;
    }
    auto conn = it->second.connection.lock();
    return conn && conn->is_open();
}

std::vector<ConnectionRegistry::ConnectionPtr> ConnectionRegistry::bound_connections() const {
    std::vector<ConnectionPtr> result;
    std::shared_lock lock(connections_mutex_);
    result.reserve(identities_.size());
    for (const auto& [id, handle] : identities_) {
        auto it = connections_.find(handle);
        if (it == connections_.end()) continue;
        if (auto conn = it->second.connection.lock()) {
            result.push_back(std::move(conn));
        }
    }
    return result;
}

size_t ConnectionRegistry::connection_count() const {
    std::shared_lock lock(connections_mutex_);
    return connections_.size();
}

size_t ConnectionRegistry::bound_count() const {
    std::shared_lock lock(connections_mutex_);
    return identities_.size();
}

size_t ConnectionRegistry::connection_count_for_ip(const std::string& ip_address) const {
    std::shared_lock lock(connections_mutex_);
    auto it = ip_counts_.find(ip_address);
    if (it != ip_counts_.end()) {
        return it->second;
    }
    return 0;
}

bool ConnectionRegistry::increment_ip_count(const std::string& ip, size_t per_ip_limit, size_t global_limit) {
    std::unique_lock lock(connections_mutex_);
    if (admitted_ >= global_limit) {
        MetricsRegistry::instance().increment_counter("connection_rejected_global_limit_total");
        return false;
    }

    size_t& count = ip_counts_[ip];
    if (count >= per_ip_limit) {
        if (count == 0) ip_counts_.erase(ip);
        MetricsRegistry::instance().increment_counter("connection_rejected_limit_total");
        return false;
    }

    ++count;
    ++admitted_;
    MetricsRegistry::instance().increment_gauge("active_connections");
    return true;
}

void ConnectionRegistry::decrement_ip_count(const std::string& ip) {
    std::unique_lock lock(connections_mutex_);
    auto it = ip_counts_.find(ip);
    if (it == ip_counts_.end()) {
        return;
    }
    if (it->second > 0) {
        it->second--;
        if (admitted_ > 0) admitted_--;
        MetricsRegistry::instance().decrement_gauge("active_connections");
    }
    if (it->second == 0) {
        ip_counts_.erase(it);
    }
}

// Closes every tracked connection. Teardown continues through each session's
// close path, which calls unbind().
void ConnectionRegistry::close_all_connections() {
    std::vector<ConnectionPtr> active;
    {
        std::shared_lock lock(connections_mutex_);
        for (const auto& [handle, entry] : connections_) {
            if (auto conn = entry.connection.lock()) {
                active.push_back(std::move(conn));
            }
        }
    }

    for (const auto& conn : active) {
        try {
            conn->close();
        } catch (const std::exception& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SYSTEM,
                               conn->remote_address(), std::string("Close failed: ") + e.what());
        }
    }
}

}
