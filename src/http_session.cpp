#include "http_session.hpp"
#include "challenge_codec.hpp"
#include "hash_oracle.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/json.hpp>
#include <openssl/sha.h>
#include <ctime>

namespace json = boost::json;

namespace powgate {

HttpSession::HttpSession(
    tcp::socket&& socket,
    const GateContext& ctx,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(socket))
    , ctx_(ctx)
    , health_handler_(ctx.config, ctx.rate_limiter)
    , challenge_handler_(ctx)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Starts the asynchronous session activity
void HttpSession::run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};

    // Enforce read timeout to prevent slow-loris attacks
    stream_.expires_after(std::chrono::seconds(ctx_.config.read_timeout_sec));

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(ctx_.config.max_body_size);

    http::async_read(
        stream_,
        buffer_,
        *parser_,
        [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

// Handles the completion of an asynchronous read operation
void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec) {
        if (ec == http::error::body_limit) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                remote_addr_, "Request body exceeds limit");
        }
        return;
    }

    req_ = parser_->release();

    // Apply Global Token-Bucket Rate Limiting using the blinded IP as the identifier.
    auto limit_res = ctx_.rate_limiter.check("global:" + blind_ip(remote_addr_), ctx_.config.global_rate_limit, 10);
    if (!limit_res.allowed) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                            remote_addr_, "Global rate limit exceeded");
        send_response(handle_rate_limited(limit_res));
        return;
    }

    handle_request();
}

void HttpSession::handle_request() {
    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));
    auto method = req_.method();

    // Handle CORS Preflight
    if (method == http::verb::options) {
        send_response(handle_cors_preflight());
        return;
    }

    if (method != http::verb::get) {
        send_response(handle_method_not_allowed());
        return;
    }

    // --- Routing Table ---
    http::response<http::string_body> res;
    if (path == "/health") {
        res = health_handler_.handle_health(req_.version());
    } else if (path == "/metrics") {
        if (is_loopback() || health_handler_.verify_admin_request(req_)) {
            res = health_handler_.handle_metrics(req_.version());
        } else {
            res = handle_not_found();
        }
    } else if (path == "/pow/challenge") {
        auto limit = ctx_.rate_limiter.check("pow_limit:" + blind_ip(remote_addr_), ctx_.config.pow_rate_limit, 60);
        if (!limit.allowed) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                                remote_addr_, "Challenge rate limit exceeded");
            res = handle_rate_limited(limit);
        } else {
            res = challenge_handler_.handle_challenge(req_, remote_addr_);
        }
    } else {
        res = challenge_handler_.handle_protected(req_, remote_addr_);
    }

    add_cors_headers(res);
    res.keep_alive(req_.keep_alive());
    send_response(std::move(res));
}

bool HttpSession::is_loopback() const {
    return remote_addr_ == "127.0.0.1" || remote_addr_ == "::1";
}

// Blinds an IP address with the gate secret so raw addresses never reach Redis.
std::string HttpSession::blind_ip(const std::string& ip) {
    std::string data = ip + ctx_.config.secret;
    Digest hash;
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return HashOracle::to_hex(hash).substr(0, 32);
}

http::response<http::string_body> HttpSession::handle_cors_preflight() {
    http::response<http::string_body> res{http::status::no_content, req_.version()};
    add_cors_headers(res);
    res.keep_alive(req_.keep_alive());
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Not Found";

    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HttpSession::handle_method_not_allowed() {
    json::object response;
    response["error"] = "Method Not Allowed";

    http::response<http::string_body> res{http::status::method_not_allowed, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::allow, "GET, OPTIONS");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);
    res.keep_alive(req_.keep_alive());

    return res;
}

http::response<http::string_body> HttpSession::handle_rate_limited(const RateLimitResult& res_info) {
    json::object response;
    response["error"] = "Rate limit exceeded";
    response["retry_after"] = res_info.reset_after_sec;
    response["limit"] = res_info.limit;

    http::response<http::string_body> res{http::status::too_many_requests, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::retry_after, std::to_string(res_info.reset_after_sec));

    res.set("X-RateLimit-Limit", std::to_string(res_info.limit));
    res.set("X-RateLimit-Remaining", "0");
    res.set("X-RateLimit-Reset", std::to_string(std::time(nullptr) + res_info.reset_after_sec));

    res.body() = json::serialize(response);
    res.prepare_payload();

    if (res_info.reset_after_sec >= 60) {
        res.keep_alive(false);
    }

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

template<class Body>
void HttpSession::add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "PowGate");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "strict-origin-when-cross-origin");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");
}

template<class Body>
void HttpSession::add_cors_headers(http::response<Body>& res) {
    std::string origin;
    auto origin_it = req_.find(http::field::origin);
    if (origin_it != req_.end()) {
        origin = std::string(origin_it->value());
    }

    for (const auto& allowed : ctx_.config.allowed_origins) {
        if (allowed == "*" || allowed == origin) {
            res.set(http::field::access_control_allow_origin, (allowed == "*" && !origin.empty()) ? origin : allowed);
            res.set(http::field::access_control_allow_credentials, "true");
            break;
        }
    }

    if (!res.count(http::field::access_control_allow_origin) && !origin.empty()) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                            remote_addr_, "Disallowed origin: " + origin);
    }

    std::string methods;
    for (const auto& m : ctx_.config.allowed_methods) {
        if (!methods.empty()) methods += ", ";
        methods += m;
    }
    std::string headers;
    for (const auto& h : ctx_.config.allowed_headers) {
        if (!headers.empty()) headers += ",";
        headers += h;
    }

    res.set(http::field::access_control_allow_methods, methods);
    res.set(http::field::access_control_allow_headers, headers);
    res.set(http::field::access_control_expose_headers,
            std::string(ChallengeCodec::HEADER_CHALLENGE) + "," + ChallengeCodec::HEADER_DIFFICULTY + "," +
            ChallengeCodec::HEADER_TIMESTAMP + "," + ChallengeCodec::HEADER_SIGNATURE);
    res.set(http::field::access_control_max_age, "86400");
    res.set(http::field::vary, "Origin");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
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
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
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
