#include "challenge_codec.hpp"
#include "hash_oracle.hpp"
#include "input_validator.hpp"

#include <boost/beast/core/detail/base64.hpp>

namespace powgate {

namespace {

constexpr char TOKEN_SEPARATOR = '|';

std::optional<std::string> header_value(const boost::beast::http::fields& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end()) return std::nullopt;
    return std::string(it->value());
}

// Numbers are accepted as JSON integers or as decimal strings. Anything else
// becomes an empty string, which the verifier rejects as Malformed.
std::string field_text(const boost::json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return "";
    const boost::json::value& v = it->value();
    if (v.is_string()) return std::string(v.as_string());
    if (v.is_uint64()) return HashOracle::format_nonce(v.as_uint64());
    if (v.is_int64() && v.as_int64() >= 0) return HashOracle::format_nonce(static_cast<uint64_t>(v.as_int64()));
    return "";
}

std::optional<std::string> optional_field_text(const boost::json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return std::nullopt;
    return field_text(obj, key);
}

std::optional<boost::json::object> parse_object(const std::string& body) {
    if (!InputValidator::is_within_size_limit(body.size(), ChallengeCodec::MAX_JSON_LENGTH)) {
        return std::nullopt;
    }
    try {
        boost::json::value parsed = InputValidator::safe_parse_json(body);
        if (!parsed.is_object()) return std::nullopt;
        return parsed.as_object();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Strict conversion used on the client side: every field must be canonical.
std::optional<Challenge> to_challenge(const std::string& challenge_string, const std::string& difficulty,
                                      const std::string& issued_at, const std::optional<std::string>& signature) {
    if (!InputValidator::is_valid_challenge(challenge_string)) return std::nullopt;

    auto d = InputValidator::parse_decimal_u64(difficulty);
    auto ts = InputValidator::parse_decimal_u64(issued_at);
    if (!d || !ts || *d > static_cast<uint64_t>(MAX_NIBBLE_DIFFICULTY)) return std::nullopt;

    Challenge challenge;
    challenge.challenge_string = challenge_string;
    challenge.difficulty = static_cast<int>(*d);
    challenge.issued_at = *ts;
    if (signature && !signature->empty()) {
        if (!InputValidator::is_valid_hash(*signature)) return std::nullopt;
        challenge.signature = *signature;
    }
    return challenge;
}

}

std::string ChallengeCodec::base64url_encode(const std::string& input) {
    std::string out;
    out.resize(boost::beast::detail::base64::encoded_size(input.size()));
    out.resize(boost::beast::detail::base64::encode(&out[0], input.data(), input.size()));

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::optional<std::string> ChallengeCodec::base64url_decode(const std::string& input) {
    if (input.empty() || input.size() % 4 == 1) return std::nullopt;

    std::string standard = input;
    for (char& c : standard) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') return std::nullopt;
    }

    std::string out;
    out.resize(boost::beast::detail::base64::decoded_size(standard.size()));
    auto result = boost::beast::detail::base64::decode(&out[0], standard.data(), standard.size());
    if (result.second != standard.size()) {
        return std::nullopt;
    }
    out.resize(result.first);
    return out;
}

void ChallengeCodec::write_headers(boost::beast::http::fields& fields, const Challenge& challenge) {
    fields.set(HEADER_CHALLENGE, challenge.challenge_string);
    fields.set(HEADER_DIFFICULTY, std::to_string(challenge.difficulty));
    fields.set(HEADER_TIMESTAMP, HashOracle::format_nonce(challenge.issued_at));
    if (challenge.signature) {
        fields.set(HEADER_SIGNATURE, *challenge.signature);
    }
}

boost::json::object ChallengeCodec::to_json(const Challenge& challenge) {
    boost::json::object obj;
    obj["challenge"] = challenge.challenge_string;
    obj["difficulty"] = challenge.difficulty;
    obj["issued_at"] = challenge.issued_at;
    if (challenge.signature) {
        obj["signature"] = *challenge.signature;
    }
    return obj;
}

std::string ChallengeCodec::encode_token(const Challenge& challenge) {
    std::string raw = challenge.challenge_string;
    raw += TOKEN_SEPARATOR;
    raw += std::to_string(challenge.difficulty);
    raw += TOKEN_SEPARATOR;
    raw += HashOracle::format_nonce(challenge.issued_at);
    raw += TOKEN_SEPARATOR;
    raw += challenge.signature.value_or("");
    return base64url_encode(raw);
}

std::optional<Challenge> ChallengeCodec::decode_token(const std::string& token) {
    if (token.size() > MAX_TOKEN_LENGTH) return std::nullopt;

    auto raw = base64url_decode(token);
    if (!raw) return std::nullopt;

    // difficulty, issued_at and signature never contain the separator, so the
    // last three separators delimit them and the challenge may contain '|'.
    std::vector<std::string> tail;
    size_t end = raw->size();
    while (tail.size() < 3) {
        if (end == 0) return std::nullopt;
        size_t pos = raw->rfind(TOKEN_SEPARATOR, end - 1);
        if (pos == std::string::npos) return std::nullopt;
        tail.push_back(raw->substr(pos + 1, end - pos - 1));
        end = pos;
    }

    return to_challenge(raw->substr(0, end), tail[2], tail[1], tail[0]);
}

std::optional<Challenge> ChallengeCodec::challenge_from_json(const std::string& body) {
    auto obj = parse_object(body);
    if (!obj) return std::nullopt;

    auto it = obj->find("challenge");
    if (it == obj->end() || !it->value().is_string()) return std::nullopt;

    auto signature = optional_field_text(*obj, "signature");
    return to_challenge(std::string(it->value().as_string()),
                        field_text(*obj, "difficulty"),
                        field_text(*obj, "issued_at"),
                        signature);
}

SolutionSubmission ChallengeCodec::submission_from_headers(const boost::beast::http::fields& fields) {
    SolutionSubmission submission;
    submission.challenge_string = header_value(fields, HEADER_CHALLENGE).value_or("");
    submission.nonce = header_value(fields, HEADER_NONCE).value_or("");
    submission.difficulty = header_value(fields, HEADER_DIFFICULTY).value_or("");
    submission.issued_at = header_value(fields, HEADER_TIMESTAMP).value_or("");
    submission.signature = header_value(fields, HEADER_SIGNATURE);
    return submission;
}

SolutionSubmission ChallengeCodec::submission_from_json(const std::string& body) {
    SolutionSubmission submission;
    auto obj = parse_object(body);
    if (!obj) return submission;

    auto it = obj->find("challenge");
    if (it != obj->end() && it->value().is_string()) {
        submission.challenge_string = std::string(it->value().as_string());
    }
    submission.nonce = field_text(*obj, "nonce");
    submission.difficulty = field_text(*obj, "difficulty");
    submission.issued_at = field_text(*obj, "issued_at");
    submission.signature = optional_field_text(*obj, "signature");
    return submission;
}

std::vector<std::string> ChallengeCodec::solution_header_lines(const Challenge& challenge, uint64_t nonce) {
    std::vector<std::string> lines;
    lines.push_back(std::string(HEADER_CHALLENGE) + ": " + challenge.challenge_string);
    lines.push_back(std::string(HEADER_NONCE) + ": " + HashOracle::format_nonce(nonce));
    lines.push_back(std::string(HEADER_DIFFICULTY) + ": " + std::to_string(challenge.difficulty));
    lines.push_back(std::string(HEADER_TIMESTAMP) + ": " + HashOracle::format_nonce(challenge.issued_at));
    if (challenge.signature) {
        lines.push_back(std::string(HEADER_SIGNATURE) + ": " + *challenge.signature);
    }
    return lines;
}

}
