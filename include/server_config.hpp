#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace bhumi {


// Relay configuration. Defaults are usable for local development; every field
// that matters in deployment can be overridden from the environment.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8443;
    uint16_t admin_port = 9090;  // 0 disables the admin HTTP endpoint
    std::string admin_address = "127.0.0.1";
    std::string redis_url = "";  // empty runs the relay standalone
    std::string relay_id = "";   // generated at startup when empty
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection & Resource Management ---
    size_t max_frame_size = 1024 * 1024;  // 1MB, covers I_AM with commits and uploads
    uint32_t max_payload_size = 64 * 1024;  // advertised in HELLO, enforced on SEND
    size_t max_connections_per_ip = 10;
    size_t max_global_connections = 100000;
    int connection_timeout_sec = 120;
    int keepalive_interval_sec = 30;

    // --- Admission & Delivery ---
    int send_timeout_sec = 30;
    size_t max_commits_per_identity = 1024;

    // --- Response Cache ---
    int cache_ttl_sec = 300;
    int cache_sweep_interval_sec = 60;
    size_t max_cache_entries = 100000;
    size_t max_recent_responses = 64;  // per I_AM upload

    // --- Presence & Gossip ---
    int gossip_interval_sec = 15;
    size_t gossip_fanout_records = 16;
    size_t gossip_fanout_peers = 4;
    uint32_t presence_max_ttl = 3600;
    int presence_max_clock_skew_sec = 60;
    int relay_heartbeat_ttl_sec = 45;

    // --- Secrets ---
    std::string admin_token = ""; // Used for privileged stats/metrics access
};

}
