#pragma once

#include "connection.hpp"
#include "frame_codec.hpp"
#include "server_config.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <queue>
#include <string>
#include <variant>

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace bhumi {

class RelayDispatcher;

// One device connection: framed binary protocol over TCP, optionally TLS.
// All socket work runs on the session's strand; send_frame() and close() may
// be called from any thread.
class RelaySession : public Connection, public std::enable_shared_from_this<RelaySession> {
public:
    explicit RelaySession(
        beast::ssl_stream<beast::tcp_stream>&& stream,
        RelayDispatcher& dispatcher,
        const ServerConfig& config
    );

    explicit RelaySession(
        beast::tcp_stream&& stream,
        RelayDispatcher& dispatcher,
        const ServerConfig& config
    );

    ~RelaySession() override;

    RelaySession(const RelaySession&) = delete;
    RelaySession& operator=(const RelaySession&) = delete;

    // Performs the TLS handshake when enabled, then greets and starts reading.
    void run();

    // --- Connection ---
    bool send_frame(Frame frame) override;
    void close() override;
    std::string remote_address() const override { return remote_addr_; }
    bool is_open() const override { return open_; }

    // Released when the session is destroyed; used for per-IP accounting.
    void set_conn_guard(std::shared_ptr<void> guard) { conn_guard_ = std::move(guard); }

    net::any_io_executor get_executor();

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;

    bool is_tls_;
    std::string remote_addr_;

    RelayDispatcher& dispatcher_;
    const ServerConfig& config_;

    std::atomic<bool> open_{true};
    std::atomic<bool> close_triggered_{false};
    bool started_ = false;

    std::array<uint8_t, 16384> read_buffer_;
    FrameDecoder decoder_;

    std::queue<std::shared_ptr<Bytes>> write_queue_;
    bool is_writing_ = false;

    std::shared_ptr<void> conn_guard_;

    std::shared_ptr<net::steady_timer> keepalive_timer_;
    std::chrono::steady_clock::time_point last_inbound_;
    std::chrono::steady_clock::time_point last_outbound_;

    void on_handshake(beast::error_code ec);
    void start();

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    void do_close();
    void trigger_close_handler();

    void start_keepalive();
    void tick_keepalive();
};

}
