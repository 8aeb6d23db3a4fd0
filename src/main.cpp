#include <boost/beast/core.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <cstdlib>

#include "gate_config.hpp"
#include "challenge.hpp"
#include "clearance.hpp"
#include "difficulty_policy.hpp"
#include "pow_verifier.hpp"
#include "redis_manager.hpp"
#include "http_session.hpp"
#include "rate_limiter.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powgate {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        const GateContext& ctx
    )
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , ctx_(ctx)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
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
    const GateContext& ctx_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED, "internal", "Accept error: " + ec.message());
        } else {
            auto& metrics = MetricsRegistry::instance();
            auto active = static_cast<size_t>(metrics.get_gauge("powgate_active_connections"));

            if (active >= ctx_.config.max_global_connections) {
                beast::error_code ep_ec;
                auto ep = socket.remote_endpoint(ep_ec);
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                    ep_ec ? "unknown" : ep.address().to_string(), "Global connection limit reached");
                // Socket will be closed when it goes out of scope here
            } else {
                metrics.increment_gauge("powgate_active_connections");
                // Decrement the gauge when the session tree is destroyed
                auto guard = std::shared_ptr<void>(nullptr, [](void*) {
                    MetricsRegistry::instance().decrement_gauge("powgate_active_connections");
                });

                std::make_shared<HttpSession>(std::move(socket), ctx_, guard)->run();
            }
        }

        do_accept();
    }
};

}

int main(int argc, char* argv[]) {
    using powgate::SecurityLogger;
    try {
        powgate::GateConfig config;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --help, -h     Show this help\n"
                          << "Environment:\n"
                          << "  POWGATE_SECRET (required), POWGATE_ADDR, POWGATE_PORT, POWGATE_THREADS,\n"
                          << "  POWGATE_REDIS_URL, POWGATE_DIFFICULTY, POWGATE_MIN_DIFFICULTY,\n"
                          << "  POWGATE_MAX_DIFFICULTY, POWGATE_FRESHNESS_SEC, POWGATE_CLOCK_SKEW_SEC,\n"
                          << "  POWGATE_REQUIRE_SIGNATURE, POWGATE_REPLAY_PROTECTION, POWGATE_POW_LIMIT,\n"
                          << "  POWGATE_GLOBAL_LIMIT, POWGATE_ALLOWED_ORIGINS, POWGATE_ADMIN_TOKEN,\n"
                          << "  POWGATE_CLEARANCE_TTL_SEC, POWGATE_LOG_LEVEL\n";
                return 0;
            } else {
                try {
                    int port = std::stoi(arg);
                    if (port <= 0 || port > 65535) throw std::out_of_range(arg);
                    config.port = static_cast<uint16_t>(port);
                } catch (const std::exception&) {
                    std::cerr << "Invalid port: " << arg << "\n";
                    return 1;
                }
            }
        }

        // --- Environment Variable Overrides ---
        powgate::load_config_from_env(config);
        powgate::validate_config(config);

        SecurityLogger::set_min_level(SecurityLogger::level_from_string(config.log_level));

        if (config.allowed_origins.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal", "No CORS origins configured");
        }

        if (config.secret.empty() || powgate::is_placeholder_secret(config.secret)) {
            std::cerr << "CRITICAL SECURITY ERROR: MISSING OR PLACEHOLDER SECRET\n";
            std::cerr << "Set the 'POWGATE_SECRET' environment variable to a random value!\n";
            return 1;
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        // --- Gate components ---
        powgate::ChallengeIssuer issuer({config.secret, config.max_difficulty});

        powgate::VerifierOptions verifier_options;
        verifier_options.secret = config.secret;
        verifier_options.require_signature = config.require_signature;
        verifier_options.freshness_window_sec = config.freshness_window_sec;
        verifier_options.clock_skew_sec = config.clock_skew_sec;
        verifier_options.min_difficulty = config.min_difficulty;
        verifier_options.max_difficulty = config.max_difficulty;
        powgate::PoWVerifier verifier(verifier_options);

        powgate::DifficultyPolicy policy(config.base_difficulty, config.min_difficulty, config.max_difficulty);
        powgate::Clearance clearance(config.secret, config.clearance_ttl_sec);

        powgate::RedisManager redis(config.redis_url);
        powgate::RateLimiter rate_limiter(redis);

        if (config.replay_protection && !redis.is_connected()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "Replay protection enabled without Redis: every solution will be rejected");
        }

        powgate::GateContext ctx{config, issuer, verifier, policy, clearance, rate_limiter};

        net::io_context ioc{config.thread_count};

        auto listener = std::make_shared<powgate::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            ctx
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Listening on " + config.address + ":" + std::to_string(config.port) +
                            " difficulty=" + std::to_string(config.base_difficulty));

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "Initiating graceful shutdown");
                listener->stop();
                ioc.stop();
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
