#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "gate_config.hpp"
#include "rate_limiter.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/challenge_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powgate {

// One keep-alive HTTP/1.1 connection in front of the protected origin.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        tcp::socket&& socket,
        const GateContext& ctx,
        std::shared_ptr<void> conn_guard
    );

    ~HttpSession() = default;

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const GateContext& ctx_;

    // Handlers
    HealthHandler health_handler_;
    ChallengeHandler challenge_handler_;

    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);

    http::response<http::string_body> handle_cors_preflight();
    http::response<http::string_body> handle_not_found();
    http::response<http::string_body> handle_method_not_allowed();
    http::response<http::string_body> handle_rate_limited(const RateLimitResult& res_info);

    bool is_loopback() const;
    std::string blind_ip(const std::string& ip);

    template<class Body>
    void add_security_headers(http::response<Body>& res);

    template<class Body>
    void add_cors_headers(http::response<Body>& res);
};

}
