#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <string>

#include "server_config.hpp"
#include "handlers/health_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace bhumi {

// Plain HTTP session on the admin port: /health, /stats and /metrics.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        const RelayServices& services
    );

    ~HttpSession() = default;

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;

    const ServerConfig& config_;
    HealthHandler health_handler_;

    std::string remote_addr_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);

    bool is_admin_allowed() const;
    http::response<http::string_body> handle_not_found();
};

}
