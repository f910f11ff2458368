#include "handlers/health_handler.hpp"
#include <openssl/crypto.h>

namespace bhumi {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["tls"] = config_.enable_tls;

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

json::object HealthHandler::collect_stats() const {
    json::object stats;
    stats["connections"] = static_cast<int64_t>(services_.registry.connection_count());
    stats["bound_identities"] = static_cast<int64_t>(services_.registry.bound_count());
    stats["identities_with_commits"] = static_cast<int64_t>(services_.capabilities.identity_count());
    stats["pending_sends"] = static_cast<int64_t>(services_.orchestrator.pending_count());
    stats["cache_entries"] = static_cast<int64_t>(services_.cache.size());
    stats["presence_records"] = static_cast<int64_t>(services_.presence.size());
    return stats;
}

http::response<http::string_body> HealthHandler::handle_stats(const http::request<http::string_body>& req) {
    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(collect_stats());
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    auto& metrics = MetricsRegistry::instance();
    metrics.set_gauge("cache_entries", static_cast<double>(services_.cache.size()));
    metrics.set_gauge("presence_records", static_cast<double>(services_.presence.size()));

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = metrics.collect_prometheus();
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) const {
    // If no token is configured, remote admin access is disabled.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided(auth_it->value());
    return provided.size() == config_.admin_token.size() &&
           CRYPTO_memcmp(provided.data(), config_.admin_token.data(), provided.size()) == 0;
}

}
