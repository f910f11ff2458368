#include "redis_manager.hpp"
#include "server_config.hpp"
#include "security_logger.hpp"
#include <iostream>
#include <chrono>
#include <iterator>
#include <unordered_set>

namespace bhumi {

RedisManager::RedisManager(const ServerConfig& config, const std::string& relay_id)
    : relay_id_(relay_id), heartbeat_ttl_sec_(config.relay_heartbeat_ttl_sec) {
    try {
        // Initialize the Redis client using the provided connection string. The
        // socket timeout lets the subscriber notice shutdown between messages.
        sw::redis::ConnectionOptions opts(config.redis_url);
        opts.socket_timeout = std::chrono::seconds(1);
        redis_ = std::make_unique<sw::redis::Redis>(opts);
        redis_->ping();
        connected_ = true;

        heartbeat();

        running_ = true;
        subscriber_thread_ = std::thread(&RedisManager::subscriber_loop, this);

        std::cout << "[*] Redis connected: " << config.redis_url << " (relay " << relay_id_ << ")\n";
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis connection failed, running standalone: " << e.what() << "\n";
        connected_ = false;
    }
}

RedisManager::~RedisManager() {
    running_ = false;
    if (subscriber_thread_.joinable()) {
        subscriber_thread_.join();
    }

    if (connected_) {
        try {
            redis_->del(HEARTBEAT_PREFIX + relay_id_);
        } catch (const std::exception& e) {
            std::cerr << "[!] Redis heartbeat cleanup failed: " << e.what() << "\n";
        }
    }
}

bool RedisManager::heartbeat() {
    if (!connected_) return false;
    try {
        redis_->set(HEARTBEAT_PREFIX + relay_id_, "1", std::chrono::seconds(heartbeat_ttl_sec_));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis heartbeat failed: " << e.what() << "\n";
        return false;
    }
}

// Live relays are those whose heartbeat key has not expired.
std::vector<std::string> RedisManager::peers() {
    std::vector<std::string> result;
    if (!connected_) return result;

    try {
        const std::string prefix = HEARTBEAT_PREFIX;
        std::unordered_set<std::string> keys;
        long long cursor = 0;
        do {
            cursor = redis_->scan(cursor, prefix + "*", 100, std::inserter(keys, keys.begin()));
        } while (cursor != 0);

        for (const auto& key : keys) {
            std::string id = key.substr(prefix.size());
            if (!id.empty() && id != relay_id_) {
                result.push_back(std::move(id));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis peer scan failed: " << e.what() << "\n";
        result.clear();
    }
    return result;
}

// Publishes an encoded record on the peer's gossip channel.
bool RedisManager::publish(const std::string& peer_id, const Bytes& payload) {
    if (!connected_) return false;
    try {
        std::string msg(payload.begin(), payload.end());
        redis_->publish(GOSSIP_PREFIX + peer_id, msg);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis publish failed: " << e.what() << "\n";
        return false;
    }
}

void RedisManager::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

void RedisManager::dispatch(const std::string& msg) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }
    if (handler) {
        handler(Bytes(msg.begin(), msg.end()));
    }
}

// Subscriber loop responsible for gossip addressed to this relay.
void RedisManager::subscriber_loop() {
    if (!connected_) return;

    const std::string own_channel = GOSSIP_PREFIX + relay_id_;

    while (running_) {
        try {
            {
                std::lock_guard<std::mutex> lock(subscriber_mutex_);
                subscriber_ = std::make_unique<sw::redis::Subscriber>(redis_->subscriber());

                subscriber_->on_message([this, own_channel](std::string channel, std::string msg) {
                    if (channel == own_channel) {
                        dispatch(msg);
                    }
                });
                subscriber_->subscribe(own_channel);
            }

            while (running_) {
                try {
                    subscriber_->consume();
                } catch (const sw::redis::TimeoutError&) {
                    continue;
                }
            }
        } catch (const std::exception& e) {
            if (running_) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SYSTEM,
                                   "internal", std::string("Redis subscriber error (reconnecting): ") + e.what());
                std::this_thread::sleep_for(std::chrono::seconds(2));
            }
        }
    }
}

}
