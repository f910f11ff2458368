#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/post.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <functional>
#include <algorithm>
#include <type_traits>
#include <cstdlib>

#include "server_config.hpp"
#include "capability_store.hpp"
#include "connection_registry.hpp"
#include "response_cache.hpp"
#include "send_orchestrator.hpp"
#include "presence_service.hpp"
#include "relay_dispatcher.hpp"
#include "relay_session.hpp"
#include "redis_manager.hpp"
#include "http_session.hpp"
#include "nonce_generator.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace bhumi {

void open_acceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint) {
    beast::error_code ec;

    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
    }

    acceptor.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind " + endpoint.address().to_string() + ":" +
                                 std::to_string(endpoint.port()) + ": " + ec.message());
    }

    acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

// Accepts device connections and hands each to a RelaySession.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ConnectionRegistry& registry,
        RelayDispatcher& dispatcher
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , registry_(registry)
        , dispatcher_(dispatcher)
    {
        open_acceptor(acceptor_, endpoint);
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ConnectionRegistry& registry_;
    RelayDispatcher& dispatcher_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }

        if (ec) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED, "internal", "Accept error: " + ec.message());
        } else {
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            std::string remote_ip = ep_ec ? "unknown" : ep.address().to_string();

            // Enforce per-IP and global connection limits BEFORE creating the session
            if (!registry_.increment_ip_count(remote_ip, config_.max_connections_per_ip, config_.max_global_connections)) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                  remote_ip, "Connection limit reached");
                // Socket will be closed when it goes out of scope here
            } else {
                // Decrements the IP count when the session is destroyed
                auto guard = std::shared_ptr<void>(nullptr, [self_ref = shared_from_this(), remote_ip](void*) {
                    self_ref->registry_.decrement_ip_count(remote_ip);
                });

                std::shared_ptr<RelaySession> session;
                if (config_.enable_tls) {
                    session = std::make_shared<RelaySession>(
                        beast::ssl_stream<beast::tcp_stream>(beast::tcp_stream(std::move(socket)), ssl_ctx_),
                        dispatcher_,
                        config_);
                } else {
                    session = std::make_shared<RelaySession>(
                        beast::tcp_stream(std::move(socket)),
                        dispatcher_,
                        config_);
                }
                session->set_conn_guard(std::move(guard));
                session->run();
            }
        }

        do_accept();
    }
};

// Accepts connections on the admin port.
class AdminListener : public std::enable_shared_from_this<AdminListener> {
public:
    AdminListener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        const RelayServices& services
    )
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , services_(services)
    {
        open_acceptor(acceptor_, endpoint);
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    const ServerConfig& config_;
    const RelayServices& services_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                if (ec == net::error::operation_aborted) return;
                if (!ec) {
                    std::make_shared<HttpSession>(
                        beast::tcp_stream(std::move(socket)),
                        self->config_,
                        self->services_)->run();
                }
                self->do_accept();
            });
    }
};

// Re-arms itself every `interval` until cancelled.
class PeriodicTask {
public:
    PeriodicTask(net::io_context& ioc, std::chrono::seconds interval, std::function<void()> task)
        : timer_(net::make_strand(ioc)), interval_(interval), task_(std::move(task)) {}

    void start() {
        timer_.expires_after(interval_);
        timer_.async_wait([this](beast::error_code ec) {
            if (ec || stopped_) return;
            try {
                task_();
            } catch (const std::exception& e) {
                SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::SYSTEM,
                                   "internal", std::string("Periodic task failed: ") + e.what());
            }
            start();
        });
    }

    void stop() {
        net::post(timer_.get_executor(), [this]() {
            stopped_ = true;
            timer_.cancel();
        });
    }

private:
    net::steady_timer timer_;
    std::chrono::seconds interval_;
    std::function<void()> task_;
    bool stopped_ = false;
};

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

// Applies BHUMI_* environment overrides on top of the defaults and CLI.
void apply_env_overrides(bhumi::ServerConfig& config) {
    auto env_int = [](const char* name, auto& field) {
        if (const char* e = std::getenv(name)) {
            field = static_cast<std::remove_reference_t<decltype(field)>>(std::stoll(e));
        }
    };
    auto env_str = [](const char* name, std::string& field) {
        if (const char* e = std::getenv(name)) {
            field = e;
        }
    };

    env_int("BHUMI_PORT", config.port);
    env_str("BHUMI_ADDR", config.address);
    env_int("BHUMI_ADMIN_PORT", config.admin_port);
    env_str("BHUMI_ADMIN_ADDR", config.admin_address);
    env_str("BHUMI_ADMIN_TOKEN", config.admin_token);
    env_str("BHUMI_REDIS_URL", config.redis_url);
    env_str("BHUMI_RELAY_ID", config.relay_id);
    env_int("BHUMI_THREADS", config.thread_count);

    env_str("BHUMI_TLS_CERT", config.cert_path);
    env_str("BHUMI_TLS_KEY", config.key_path);

    env_int("BHUMI_SEND_TIMEOUT_SEC", config.send_timeout_sec);
    env_int("BHUMI_CACHE_TTL_SEC", config.cache_ttl_sec);
    env_int("BHUMI_CACHE_SWEEP_SEC", config.cache_sweep_interval_sec);
    env_int("BHUMI_MAX_CACHE_ENTRIES", config.max_cache_entries);
    env_int("BHUMI_MAX_PAYLOAD", config.max_payload_size);
    env_int("BHUMI_MAX_FRAME", config.max_frame_size);
    env_int("BHUMI_MAX_COMMITS", config.max_commits_per_identity);
    env_int("BHUMI_MAX_CONNS_PER_IP", config.max_connections_per_ip);
    env_int("BHUMI_MAX_CONNS", config.max_global_connections);
    env_int("BHUMI_KEEPALIVE_SEC", config.keepalive_interval_sec);
    env_int("BHUMI_CONNECTION_TIMEOUT_SEC", config.connection_timeout_sec);
    env_int("BHUMI_GOSSIP_INTERVAL_SEC", config.gossip_interval_sec);
    env_int("BHUMI_PRESENCE_MAX_TTL", config.presence_max_ttl);
}

int main(int argc, char* argv[]) {
    using bhumi::SecurityLogger;
    try {
        bhumi::ServerConfig config;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--tls") {
                config.enable_tls = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --tls          Enable TLS (BHUMI_TLS_CERT / BHUMI_TLS_KEY)\n"
                          << "  --no-tls, -n   Disable TLS (for local development)\n"
                          << "  --help, -h     Show this help\n";
                return 0;
            } else {
                try {
                    config.port = static_cast<uint16_t>(std::stoi(arg));
                } catch (const std::exception&) {
                    std::cerr << "[!] Invalid argument: " << arg << "\n";
                    return 1;
                }
            }
        }

        // --- Environment Variable Overrides ---
        apply_env_overrides(config);

        if (config.relay_id.empty()) {
            config.relay_id = bhumi::NonceGenerator::generate_token(8);
        }

        if (config.thread_count <= 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls) {
            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Or use --no-tls for development without TLS.\n";
                return 1;
            }
        }

        std::cout << "\nBHUMI RELAY " << config.relay_id << "\n"
                  << (config.enable_tls ? "  TLS 1.2+/1.3 encrypted transport\n"
                                        : "  TLS DISABLED (development mode)\n")
                  << "  listening on " << config.address << ":" << config.port << "\n\n";

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        // --- Relay services ---
        auto verifier = std::make_shared<bhumi::Ed25519Verifier>();
        bhumi::ConnectionRegistry registry(verifier);
        bhumi::CapabilityStore capabilities(config.max_commits_per_identity);
        bhumi::ResponseCache cache(config.max_cache_entries);

        std::unique_ptr<bhumi::RedisManager> redis;
        bhumi::PeerTransport* transport = nullptr;
        if (!config.redis_url.empty()) {
            redis = std::make_unique<bhumi::RedisManager>(config, config.relay_id);
            if (redis->is_connected()) {
                transport = redis.get();
            }
        }

        bhumi::SendOrchestrator orchestrator(
            ioc, registry, capabilities, cache,
            std::chrono::seconds(config.send_timeout_sec),
            std::chrono::seconds(config.cache_ttl_sec));

        bhumi::PresenceService::Options presence_opts;
        presence_opts.max_ttl = config.presence_max_ttl;
        presence_opts.max_clock_skew = static_cast<uint64_t>(config.presence_max_clock_skew_sec);
        presence_opts.fanout_records = config.gossip_fanout_records;
        presence_opts.fanout_peers = config.gossip_fanout_peers;
        bhumi::PresenceService presence(*verifier, registry, transport, presence_opts);

        bhumi::RelayDispatcher dispatcher(config, registry, capabilities, cache, orchestrator, presence);

        bhumi::RelayServices services{registry, capabilities, cache, orchestrator, presence};

        // --- Periodic maintenance ---
        bhumi::PeriodicTask sweep_task(ioc, std::chrono::seconds(config.cache_sweep_interval_sec), [&]() {
            size_t expired = cache.sweep();
            size_t stale = presence.expire(bhumi::PresenceService::unix_now());
            if (expired > 0 || stale > 0) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SYSTEM, "internal",
                                   "Swept " + std::to_string(expired) + " cache entries, " +
                                   std::to_string(stale) + " presence records");
            }
        });
        sweep_task.start();

        bhumi::PeriodicTask gossip_task(ioc, std::chrono::seconds(config.gossip_interval_sec), [&]() {
            presence.gossip_round(bhumi::PresenceService::unix_now());
        });
        gossip_task.start();

        int heartbeat_sec = std::max(1, config.relay_heartbeat_ttl_sec / 3);
        bhumi::PeriodicTask heartbeat_task(ioc, std::chrono::seconds(heartbeat_sec), [&]() {
            if (redis && !redis->heartbeat()) {
                bhumi::MetricsRegistry::instance().increment_counter("redis_heartbeat_failures_total");
            }
        });
        if (transport) {
            heartbeat_task.start();
        }

        auto listener = std::make_shared<bhumi::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            registry,
            dispatcher
        );
        listener->run();

        std::shared_ptr<bhumi::AdminListener> admin;
        if (config.admin_port != 0) {
            admin = std::make_shared<bhumi::AdminListener>(
                ioc,
                tcp::endpoint{net::ip::make_address(config.admin_address), config.admin_port},
                config,
                services);
            admin->run();
        }

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SYSTEM, "internal",
                           std::string("Relay started") + (transport ? " with peer gossip" : " standalone"));

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SYSTEM, "internal", "Initiating graceful shutdown");
                sweep_task.stop();
                gossip_task.stop();
                heartbeat_task.stop();
                listener->stop();
                if (admin) admin->stop();
                registry.close_all_connections();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
