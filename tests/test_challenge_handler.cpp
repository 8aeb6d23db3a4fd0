#include <gtest/gtest.h>
#include "handlers/challenge_handler.hpp"
#include "challenge_codec.hpp"
#include "solver_coordinator.hpp"
#include "metrics.hpp"

using namespace powgate;

namespace {

constexpr uint64_t NOW = 1700000000;
const char* const SECRET = "handler-test-secret";

}

// Redis is deliberately unreachable: rate limits fail open and replay
// protection is switched off unless a test turns it on.
class ChallengeHandlerTest : public ::testing::Test {
protected:
    ChallengeHandlerTest()
        : issuer_({SECRET, 15, 16}, [] { return NOW; })
        , verifier_(make_verifier_options(), [] { return NOW; })
        , policy_(2, 0, 15)
        , clearance_(SECRET, 900, [] { return NOW; })
        , redis_("tcp://127.0.0.1:1?connect_timeout=100ms")
        , limiter_(redis_)
        , ctx_{config_, issuer_, verifier_, policy_, clearance_, limiter_}
        , handler_(ctx_)
    {
        config_.secret = SECRET;
        config_.base_difficulty = 2;
        config_.replay_protection = false;
        MetricsRegistry::instance().reset();
    }

    static VerifierOptions make_verifier_options() {
        VerifierOptions options;
        options.secret = SECRET;
        return options;
    }

    static http::request<http::string_body> get(const std::string& target) {
        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "gate.test");
        return req;
    }

    // Fetches a challenge over the handler and solves it.
    std::pair<Challenge, uint64_t> solved_challenge() {
        auto res = handler_.handle_challenge(get("/pow/challenge"), "client");
        auto challenge = ChallengeCodec::challenge_from_json(res.body());
        EXPECT_TRUE(challenge.has_value());

        SolverOptions options;
        options.lanes = 2;
        SolverCoordinator solver(options);
        Solution solution = solver.solve(*challenge, std::chrono::seconds(30));
        return {*challenge, solution.nonce};
    }

    static void attach_solution(http::request<http::string_body>& req, const Challenge& challenge, uint64_t nonce) {
        ChallengeCodec::write_headers(req.base(), challenge);
        req.set(ChallengeCodec::HEADER_NONCE, HashOracle::format_nonce(nonce));
    }

    GateConfig config_;
    ChallengeIssuer issuer_;
    PoWVerifier verifier_;
    DifficultyPolicy policy_;
    Clearance clearance_;
    RedisManager redis_;
    RateLimiter limiter_;
    GateContext ctx_;
    ChallengeHandler handler_;
};

TEST_F(ChallengeHandlerTest, ChallengeEndpointReturnsJsonAndHeaders) {
    auto res = handler_.handle_challenge(get("/pow/challenge"), "client");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_EQ(res[http::field::cache_control], "no-store");

    auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(body.at("difficulty").as_int64(), 2);
    EXPECT_EQ(body.at("issued_at").as_uint64(), NOW);
    EXPECT_EQ(body.at("challenge").as_string().size(), 32u);
    EXPECT_EQ(body.at("signature").as_string().size(), 64u);

    EXPECT_EQ(std::string(res[ChallengeCodec::HEADER_CHALLENGE]), std::string(body.at("challenge").as_string()));
    EXPECT_EQ(res[ChallengeCodec::HEADER_DIFFICULTY], "2");

    auto decoded = ChallengeCodec::decode_token(std::string(body.at("token").as_string()));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->challenge_string, std::string(body.at("challenge").as_string()));
}

TEST_F(ChallengeHandlerTest, UnsolvedRequestGets401WithChallenge) {
    auto res = handler_.handle_protected(get("/"), "client");

    EXPECT_EQ(res.result(), http::status::unauthorized);
    auto body = json::parse(res.body()).as_object();
    EXPECT_TRUE(body.contains("challenge"));
    EXPECT_TRUE(body.contains("error"));
    EXPECT_NE(res.find(ChallengeCodec::HEADER_CHALLENGE), res.end());
}

TEST_F(ChallengeHandlerTest, SolvedRequestPassesWithCookie) {
    auto [challenge, nonce] = solved_challenge();

    auto req = get("/");
    attach_solution(req, challenge, nonce);
    auto res = handler_.handle_protected(req, "client");

    EXPECT_EQ(res.result(), http::status::ok);
    std::string cookie(res[http::field::set_cookie]);
    EXPECT_EQ(cookie.rfind("powgate_clearance=", 0), 0u);

    // The cookie alone now clears the next request.
    auto next = get("/page");
    next.set(http::field::cookie, cookie.substr(0, cookie.find(';')));
    auto cleared = handler_.handle_protected(next, "client");
    EXPECT_EQ(cleared.result(), http::status::ok);
    EXPECT_EQ(cleared.find(http::field::set_cookie), cleared.end());
}

TEST_F(ChallengeHandlerTest, WrongNonceIsForbidden) {
    auto [challenge, nonce] = solved_challenge();

    uint64_t wrong = nonce + 1;
    while (PoWVerifier::check_work(challenge.challenge_string, wrong, challenge.difficulty)) ++wrong;

    auto req = get("/");
    attach_solution(req, challenge, wrong);
    auto res = handler_.handle_protected(req, "client");

    EXPECT_EQ(res.result(), http::status::forbidden);
    EXPECT_EQ(res.body(), ChallengeHandler::FAILURE_MESSAGE);
    EXPECT_EQ(res.find(http::field::set_cookie), res.end());
}

TEST_F(ChallengeHandlerTest, LoweredDifficultyIsForbidden) {
    auto [challenge, nonce] = solved_challenge();

    auto req = get("/");
    attach_solution(req, challenge, nonce);
    req.set(ChallengeCodec::HEADER_DIFFICULTY, "0");
    auto res = handler_.handle_protected(req, "client");

    EXPECT_EQ(res.result(), http::status::forbidden);
}

TEST_F(ChallengeHandlerTest, PartialHeadersAreForbidden) {
    auto req = get("/");
    req.set(ChallengeCodec::HEADER_NONCE, "42");
    auto res = handler_.handle_protected(req, "client");
    EXPECT_EQ(res.result(), http::status::forbidden);
}

TEST_F(ChallengeHandlerTest, ForgedCookieFallsThroughToChallenge) {
    auto req = get("/");
    req.set(http::field::cookie, "powgate_clearance=9999999999.deadbeef");
    auto res = handler_.handle_protected(req, "client");
    EXPECT_EQ(res.result(), http::status::unauthorized);
}

TEST_F(ChallengeHandlerTest, ReplayGuardFailsClosedWithoutRedis) {
    config_.replay_protection = true;
    auto [challenge, nonce] = solved_challenge();

    auto req = get("/");
    attach_solution(req, challenge, nonce);
    auto res = handler_.handle_protected(req, "client");

    EXPECT_EQ(res.result(), http::status::forbidden);
    EXPECT_DOUBLE_EQ(MetricsRegistry::instance().get_counter("powgate_replay_rejected_total"), 1.0);
}

TEST_F(ChallengeHandlerTest, SolutionHeaderDetection) {
    auto req = get("/");
    EXPECT_FALSE(ChallengeHandler::has_solution_headers(req));
    req.set(ChallengeCodec::HEADER_CHALLENGE, "abc");
    EXPECT_TRUE(ChallengeHandler::has_solution_headers(req));
}
