#include "relay_session.hpp"
#include "relay_dispatcher.hpp"
#include "security_logger.hpp"
#include "messages.hpp"
#include "metrics.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/post.hpp>

namespace bhumi {

namespace {

template<class Socket>
std::string endpoint_address(Socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return ep.address().to_string();
}

}

RelaySession::RelaySession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    RelayDispatcher& dispatcher,
    const ServerConfig& config
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , dispatcher_(dispatcher)
    , config_(config)
    , decoder_(config.max_frame_size)
{
    auto& tls = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
    remote_addr_ = endpoint_address(beast::get_lowest_layer(tls).socket());
    last_inbound_ = last_outbound_ = std::chrono::steady_clock::now();
}

// Plaintext constructor (development or behind a TLS-terminating proxy)
RelaySession::RelaySession(
    beast::tcp_stream&& stream,
    RelayDispatcher& dispatcher,
    const ServerConfig& config
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , dispatcher_(dispatcher)
    , config_(config)
    , decoder_(config.max_frame_size)
{
    auto& plain = std::get<beast::tcp_stream>(stream_);
    remote_addr_ = endpoint_address(plain.socket());
    last_inbound_ = last_outbound_ = std::chrono::steady_clock::now();
}

RelaySession::~RelaySession() {
    open_ = false;
}

// Utility to get the appropriate executor from the variant stream
net::any_io_executor RelaySession::get_executor() {
    if (is_tls_) {
        return std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).get_executor();
    } else {
        return std::get<beast::tcp_stream>(stream_).get_executor();
    }
}

// Hops onto the session strand before touching the stream.
void RelaySession::run() {
    net::dispatch(get_executor(), [self = shared_from_this()]() {
        if (!self->is_tls_) {
            self->start();
            return;
        }

        auto& tls = std::get<beast::ssl_stream<beast::tcp_stream>>(self->stream_);
        beast::get_lowest_layer(tls).expires_after(std::chrono::seconds(15));
        tls.async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    });
}

void RelaySession::on_handshake(beast::error_code ec) {
    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::WARNING,
                           SecurityLogger::EventType::CONNECTION_REJECTED,
                           remote_addr_,
                           "TLS handshake failed: " + ec.message());
        open_ = false;
        return;
    }

    auto& tls = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
    beast::get_lowest_layer(tls).expires_never();
    start();
}

void RelaySession::start() {
    if (!open_) return;

    started_ = true;
    SecurityLogger::log(SecurityLogger::Level::INFO,
                       SecurityLogger::EventType::CONNECTION_ACCEPTED,
                       remote_addr_,
                       is_tls_ ? "TLS session opened" : "Plain session opened");

    dispatcher_.on_open(shared_from_this());
    start_keepalive();
    do_read();
}

// Async read loop
void RelaySession::do_read() {
    auto self = shared_from_this();
    auto buffer = net::buffer(read_buffer_);

    if (is_tls_) {
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_read_some(
            buffer,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        std::get<beast::tcp_stream>(stream_).async_read_some(
            buffer,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

// Feeds inbound bytes to the decoder and dispatches every complete frame.
void RelaySession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec != net::error::eof && ec != net::error::operation_aborted && open_) {
            SecurityLogger::log(SecurityLogger::Level::INFO,
                               SecurityLogger::EventType::CONNECTION_CLOSED,
                               remote_addr_,
                               "Read error: " + ec.message());
        }
        open_ = false;
        trigger_close_handler();
        return;
    }

    last_inbound_ = std::chrono::steady_clock::now();

    try {
        decoder_.feed(read_buffer_.data(), bytes_transferred);
        while (auto frame = decoder_.next()) {
            if (!dispatcher_.on_frame(shared_from_this(), *frame)) {
                close();
                return;
            }
        }
    } catch (const FramingError& e) {
        MetricsRegistry::instance().increment_counter("framing_errors_total");
        SecurityLogger::log(SecurityLogger::Level::WARNING,
                           SecurityLogger::EventType::FRAMING_ERROR,
                           remote_addr_,
                           e.what());
        close();
        return;
    }

    do_read();
}

// Thread-safe enqueue; the write itself happens on the strand.
bool RelaySession::send_frame(Frame frame) {
    if (!open_) return false;

    std::shared_ptr<Bytes> data;
    try {
        data = std::make_shared<Bytes>(FrameCodec::encode(frame, config_.max_frame_size));
    } catch (const FramingError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR,
                           SecurityLogger::EventType::FRAMING_ERROR,
                           remote_addr_,
                           std::string("Outbound frame dropped: ") + e.what());
        return false;
    }

    net::post(
        get_executor(),
        [self = shared_from_this(), data]() {
            if (!self->open_) return;
            self->write_queue_.push(data);
            self->do_write();
        });
    return true;
}

// Async write loop
void RelaySession::do_write() {
    if (write_queue_.empty() || is_writing_) {
        return;
    }

    is_writing_ = true;
    auto data = write_queue_.front();
    write_queue_.pop();

    auto self = shared_from_this();
    auto handler = [self, data](beast::error_code ec, std::size_t bytes) {
        self->on_write(ec, bytes);
    };

    if (is_tls_) {
        net::async_write(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
                         net::buffer(*data), handler);
    } else {
        net::async_write(std::get<beast::tcp_stream>(stream_),
                         net::buffer(*data), handler);
    }
    last_outbound_ = std::chrono::steady_clock::now();
}

void RelaySession::on_write(beast::error_code ec, std::size_t) {
    is_writing_ = false;

    if (ec) {
        if (open_) {
            SecurityLogger::log(SecurityLogger::Level::WARNING,
                               SecurityLogger::EventType::CONNECTION_CLOSED,
                               remote_addr_,
                               "Write error: " + ec.message());
        }
        close();
        return;
    }

    do_write();
}

void RelaySession::close() {
    if (!open_.exchange(false)) return;

    net::post(get_executor(), [self = shared_from_this()]() {
        self->do_close();
    });
}

// Runs on the strand. A read still pending completes with an error after this
// and finds the close handler already fired.
void RelaySession::do_close() {
    if (keepalive_timer_) {
        keepalive_timer_->cancel();
    }

    std::queue<std::shared_ptr<Bytes>> empty;
    write_queue_.swap(empty);

    beast::error_code ec;
    if (is_tls_) {
        auto& tls = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
        beast::get_lowest_layer(tls).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(tls).close();
    } else {
        auto& plain = std::get<beast::tcp_stream>(stream_);
        plain.socket().shutdown(tcp::socket::shutdown_both, ec);
        plain.close();
    }

    trigger_close_handler();
}

void RelaySession::trigger_close_handler() {
    if (close_triggered_.exchange(true)) return;

    if (keepalive_timer_) {
        keepalive_timer_->cancel();
    }

    if (started_) {
        dispatcher_.on_close(shared_from_this());
        SecurityLogger::log(SecurityLogger::Level::INFO,
                           SecurityLogger::EventType::CONNECTION_CLOSED,
                           remote_addr_,
                           "Session closed");
    }
}

void RelaySession::start_keepalive() {
    keepalive_timer_ = std::make_shared<net::steady_timer>(get_executor());
    tick_keepalive();
}

// Sends KEEPALIVE on an idle link and drops peers that have gone silent.
void RelaySession::tick_keepalive() {
    if (close_triggered_ || !open_) return;

    auto self = shared_from_this();
    keepalive_timer_->expires_after(std::chrono::seconds(config_.keepalive_interval_sec));
    keepalive_timer_->async_wait([self, this](beast::error_code ec) {
        if (ec || close_triggered_ || !open_) return;

        auto now = std::chrono::steady_clock::now();
        if (now - last_inbound_ >= std::chrono::seconds(config_.connection_timeout_sec)) {
            SecurityLogger::log(SecurityLogger::Level::INFO,
                               SecurityLogger::EventType::CONNECTION_CLOSED,
                               remote_addr_,
                               "Idle timeout");
            MetricsRegistry::instance().increment_counter("idle_timeouts_total");
            close();
            return;
        }

        if (now - last_outbound_ >= std::chrono::seconds(config_.keepalive_interval_sec) && write_queue_.empty()) {
            write_queue_.push(std::make_shared<Bytes>(FrameCodec::encode(make_keepalive())));
            do_write();
        }

        tick_keepalive();
    });
}

}
