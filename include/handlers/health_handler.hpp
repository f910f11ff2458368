#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "capability_store.hpp"
#include "connection_registry.hpp"
#include "presence_service.hpp"
#include "response_cache.hpp"
#include "send_orchestrator.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace bhumi {

// Read-only views of the relay services exposed on the admin port.
struct RelayServices {
    const ConnectionRegistry& registry;
    const CapabilityStore& capabilities;
    const ResponseCache& cache;
    const SendOrchestrator& orchestrator;
    const PresenceService& presence;
};

class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, const RelayServices& services)
        : config_(config), services_(services) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_stats(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_metrics(unsigned version);

    json::object collect_stats() const;

    // Token check for /stats and /metrics from non-loopback peers.
    bool verify_admin_request(const http::request<http::string_body>& req) const;

private:
    const ServerConfig& config_;
    const RelayServices& services_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set(http::field::server, "bhumi-relay");
        res.set("X-Content-Type-Options", "nosniff");
        res.set("Cache-Control", "no-store");
    }
};

}
