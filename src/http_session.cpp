#include "http_session.hpp"
#include "security_logger.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/json.hpp>

namespace json = boost::json;

namespace bhumi {

HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    const RelayServices& services
)
    : stream_(std::move(stream))
    , config_(config)
    , health_handler_(config, services)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

void HttpSession::run() {
    net::dispatch(stream_.get_executor(), [self = shared_from_this()]() {
        self->do_read();
    });
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};

    // Enforce connection timeout to prevent slow-loris attacks
    stream_.expires_after(std::chrono::seconds(30));

    auto self = shared_from_this();
    http::async_read(
        stream_,
        buffer_,
        req_,
        [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec) {
        return;
    }

    handle_request();
}

bool HttpSession::is_admin_allowed() const {
    bool is_local = (remote_addr_ == "127.0.0.1" || remote_addr_ == "::1");
    return is_local || health_handler_.verify_admin_request(req_);
}

void HttpSession::handle_request() {
    auto target = req_.target();
    auto method = req_.method();

    if (method != http::verb::get) {
        send_response(handle_not_found());
        return;
    }

    if (target == "/health") {
        send_response(health_handler_.handle_health(req_.version()));
    } else if (target == "/stats" && is_admin_allowed()) {
        send_response(health_handler_.handle_stats(req_));
    } else if (target == "/metrics" && is_admin_allowed()) {
        send_response(health_handler_.handle_metrics(req_.version()));
    } else {
        if (target == "/stats" || target == "/metrics") {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                               remote_addr_, "Admin endpoint denied");
        }
        send_response(handle_not_found());
    }
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Not Found";

    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::server, "bhumi-relay");
    res.keep_alive(req_.keep_alive());
    res.body() = json::serialize(response);
    res.prepare_payload();

    return res;
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    res.keep_alive(req_.keep_alive());
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    auto self = shared_from_this();
    http::async_write(
        stream_,
        *sp,
        [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SYSTEM,
                           remote_addr_, "HTTP write error: " + ec.message());
        return;
    }

    if (close) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    do_read();
}

}
