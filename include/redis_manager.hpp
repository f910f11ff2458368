#pragma once

#include <string>
#include <functional>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <vector>
#include <sw/redis++/redis++.h>
#include "peer_transport.hpp"

namespace bhumi {

struct ServerConfig;

// Redis-backed relay discovery and gossip distribution.
// Each relay keeps a heartbeat key `relay:<id>` alive, finds peers by scanning
// for the others, and receives gossip on its own `gossip:<id>` channel.
class RedisManager : public PeerTransport {
public:
    static constexpr const char* HEARTBEAT_PREFIX = "relay:";
    static constexpr const char* GOSSIP_PREFIX = "gossip:";

    RedisManager(const ServerConfig& config, const std::string& relay_id);
    ~RedisManager();

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    // --- PeerTransport ---
    std::vector<std::string> peers() override;
    bool publish(const std::string& peer_id, const Bytes& payload) override;
    void set_message_handler(MessageHandler handler) override;

    // Refreshes this relay's heartbeat key. Called on a timer from main.
    bool heartbeat();

    // Connection health check.
    bool is_connected() const { return connected_; }

    const std::string& relay_id() const { return relay_id_; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::unique_ptr<sw::redis::Subscriber> subscriber_;
    std::string relay_id_;
    int heartbeat_ttl_sec_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread subscriber_thread_;
    mutable std::mutex subscriber_mutex_;

    MessageHandler handler_;
    std::mutex handler_mutex_;

    void subscriber_loop();
    void dispatch(const std::string& msg);
};

}
