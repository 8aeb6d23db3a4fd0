#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <boost/beast/http/fields.hpp>
#include <boost/json.hpp>

#include "challenge.hpp"
#include "pow_verifier.hpp"

namespace powgate {

// Wire forms of a challenge and of a submitted solution.
//
// A solution is valid when SHA-256(challenge + ":" + decimal(nonce)) has at
// least `difficulty` leading zero hex digits (nibbles), most significant
// nibble first.
//
// Decoding never throws on client input. Missing or non-canonical fields are
// passed through as text and rejected as Malformed by PoWVerifier.
class ChallengeCodec {
public:
    static constexpr const char* HEADER_CHALLENGE = "X-PowGate-Challenge";
    static constexpr const char* HEADER_DIFFICULTY = "X-PowGate-Difficulty";
    static constexpr const char* HEADER_TIMESTAMP = "X-PowGate-Timestamp";
    static constexpr const char* HEADER_SIGNATURE = "X-PowGate-Signature";
    static constexpr const char* HEADER_NONCE = "X-PowGate-Nonce";

    static constexpr size_t MAX_TOKEN_LENGTH = 1024;
    static constexpr size_t MAX_JSON_LENGTH = 4096;

    // --- Challenge -> client ---

    static void write_headers(boost::beast::http::fields& fields, const Challenge& challenge);
    static boost::json::object to_json(const Challenge& challenge);

    // base64url, unpadded, of "challenge|difficulty|issued_at|signature".
    static std::string encode_token(const Challenge& challenge);

    // Client side: strict parse of what the server handed out.
    static std::optional<Challenge> challenge_from_json(const std::string& body);
    static std::optional<Challenge> decode_token(const std::string& token);

    // --- Solution -> server ---

    static SolutionSubmission submission_from_headers(const boost::beast::http::fields& fields);

    // {"challenge", "nonce", "difficulty", "issued_at", "signature"?}
    // Numbers may arrive as JSON numbers or strings.
    static SolutionSubmission submission_from_json(const std::string& body);

    // "Name: value" lines a client attaches to its retry.
    static std::vector<std::string> solution_header_lines(const Challenge& challenge, uint64_t nonce);

    static std::string base64url_encode(const std::string& input);
    static std::optional<std::string> base64url_decode(const std::string& input);
};

}
