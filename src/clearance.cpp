#include "clearance.hpp"
#include "hash_oracle.hpp"
#include "input_validator.hpp"

#include <openssl/crypto.h>
#include <stdexcept>

namespace powgate {

Clearance::Clearance(std::string secret, uint64_t ttl_sec, UnixClock clock)
    : signer_(std::move(secret))
    , ttl_sec_(ttl_sec)
    , clock_(std::move(clock))
{
    if (ttl_sec_ == 0) {
        throw std::invalid_argument("clearance TTL must be positive");
    }
}

std::string Clearance::tag_for(uint64_t expiry) const {
    return signer_.mac_hex("clearance|" + HashOracle::format_nonce(expiry));
}

std::string Clearance::issue_token() const {
    uint64_t expiry = clock_() + ttl_sec_;
    return HashOracle::format_nonce(expiry) + "." + tag_for(expiry);
}

std::string Clearance::set_cookie_header() const {
    return std::string(COOKIE_NAME) + "=" + issue_token() +
           "; Max-Age=" + std::to_string(ttl_sec_) +
           "; HttpOnly; Secure; Path=/; SameSite=Lax";
}

bool Clearance::is_valid(const std::string& token) const {
    size_t dot = token.find('.');
    if (dot == std::string::npos) return false;

    auto expiry = InputValidator::parse_decimal_u64(token.substr(0, dot));
    std::string tag = token.substr(dot + 1);
    if (!expiry || !InputValidator::is_valid_hash(tag)) return false;

    std::string expected = tag_for(*expiry);
    if (CRYPTO_memcmp(expected.data(), tag.data(), expected.size()) != 0) {
        return false;
    }
    return clock_() < *expiry;
}

bool Clearance::is_cleared(const std::string& cookie_header) const {
    auto token = find_cookie(cookie_header, COOKIE_NAME);
    return token && is_valid(*token);
}

std::optional<std::string> Clearance::find_cookie(const std::string& cookie_header, const std::string& name) {
    size_t pos = 0;
    while (pos < cookie_header.size()) {
        size_t end = cookie_header.find(';', pos);
        if (end == std::string::npos) end = cookie_header.size();

        std::string pair = cookie_header.substr(pos, end - pos);
        size_t first = pair.find_first_not_of(' ');
        if (first != std::string::npos) {
            pair = pair.substr(first);
            size_t eq = pair.find('=');
            if (eq != std::string::npos && pair.compare(0, eq, name) == 0 && eq == name.size()) {
                std::string value = pair.substr(eq + 1);
                size_t last = value.find_last_not_of(' ');
                return last == std::string::npos ? std::string() : value.substr(0, last + 1);
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

}
