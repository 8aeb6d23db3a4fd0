#include "handlers/challenge_handler.hpp"
#include "challenge_codec.hpp"
#include "security_logger.hpp"

namespace powgate {

namespace {

SecurityLogger::EventType event_for(RejectReason reason) {
    switch (reason) {
        case RejectReason::EXPIRED: return SecurityLogger::EventType::CHALLENGE_EXPIRED;
        case RejectReason::SIGNATURE_INVALID: return SecurityLogger::EventType::SIGNATURE_INVALID;
        case RejectReason::MALFORMED: return SecurityLogger::EventType::MALFORMED_SUBMISSION;
        case RejectReason::DIFFICULTY_NOT_MET:
        default: return SecurityLogger::EventType::POW_FAILURE;
    }
}

}

bool ChallengeHandler::has_solution_headers(const http::request<http::string_body>& req) {
    return req.find(ChallengeCodec::HEADER_CHALLENGE) != req.end() ||
           req.find(ChallengeCodec::HEADER_NONCE) != req.end();
}

http::response<http::string_body> ChallengeHandler::handle_challenge(const http::request<http::string_body>& req, const std::string& remote_addr) {
    return issue_response(http::status::ok, req.version(), remote_addr);
}

http::response<http::string_body> ChallengeHandler::issue_response(http::status status, unsigned version, const std::string& remote_addr) {
    Challenge challenge;
    try {
        challenge = ctx_.issuer.issue(ctx_.policy.required_difficulty());
    } catch (const EntropyUnavailable& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CHALLENGE_ISSUED,
                            remote_addr, e.what());
        return handle_unavailable(version);
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CHALLENGE_ISSUED,
                        remote_addr, "difficulty=" + std::to_string(challenge.difficulty));

    json::object response = ChallengeCodec::to_json(challenge);
    response["token"] = ChallengeCodec::encode_token(challenge);
    if (status == http::status::unauthorized) {
        response["error"] = "Proof of Work required";
    }

    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    ChallengeCodec::write_headers(res.base(), challenge);
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> ChallengeHandler::handle_protected(const http::request<http::string_body>& req, const std::string& remote_addr) {
    auto cookie_it = req.find(http::field::cookie);
    if (cookie_it != req.end() && ctx_.clearance.is_cleared(std::string(cookie_it->value()))) {
        return handle_success(req.version(), "Clearance valid", false);
    }

    if (has_solution_headers(req)) {
        return handle_submission(req, remote_addr);
    }

    return issue_response(http::status::unauthorized, req.version(), remote_addr);
}

http::response<http::string_body> ChallengeHandler::handle_submission(const http::request<http::string_body>& req, const std::string& remote_addr) {
    SolutionSubmission submission = ChallengeCodec::submission_from_headers(req.base());
    VerificationResult result = ctx_.verifier.verify(submission);

    if (!result.is_accepted()) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, event_for(*result.reason()),
                            remote_addr, "Rejected: " + result.label());
        return handle_forbidden(req.version());
    }

    if (ctx_.config.replay_protection) {
        // Keep the record at least as long as the challenge could still verify.
        int ttl = static_cast<int>(ctx_.config.freshness_window_sec + ctx_.config.clock_skew_sec);
        if (!ctx_.rate_limiter.consume_challenge(submission.challenge_string, ttl)) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::REPLAY_ATTEMPT,
                                remote_addr, "Challenge already consumed or replay guard unavailable");
            return handle_forbidden(req.version());
        }
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::POW_ACCEPTED,
                        remote_addr, "difficulty=" + submission.difficulty);
    return handle_success(req.version(), "Proof of Work accepted", true);
}

http::response<http::string_body> ChallengeHandler::handle_success(unsigned version, const std::string& message, bool set_cookie) {
    json::object response;
    response["success"] = true;
    response["message"] = message;

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    if (set_cookie) {
        res.set(http::field::set_cookie, ctx_.clearance.set_cookie_header());
    }
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> ChallengeHandler::handle_forbidden(unsigned version) {
    http::response<http::string_body> res{http::status::forbidden, version};
    res.set(http::field::content_type, "text/plain");
    res.body() = FAILURE_MESSAGE;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> ChallengeHandler::handle_unavailable(unsigned version) {
    json::object response;
    response["error"] = "Challenge issuance unavailable";

    http::response<http::string_body> res{http::status::service_unavailable, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

}
