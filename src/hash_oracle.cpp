#include "hash_oracle.hpp"

#include <openssl/sha.h>

namespace powgate {

std::string HashOracle::format_nonce(uint64_t nonce) {
    // Hand-rolled so no stream locale or facet can alter the digits.
    char buf[20];
    size_t len = 0;
    do {
        buf[len++] = static_cast<char>('0' + (nonce % 10));
        nonce /= 10;
    } while (nonce != 0);

    std::string out;
    out.reserve(len);
    while (len > 0) {
        out.push_back(buf[--len]);
    }
    return out;
}

std::string HashOracle::format_preimage(const std::string& challenge, uint64_t nonce) {
    std::string input;
    input.reserve(challenge.size() + 21);
    input += challenge;
    input += SEPARATOR;
    input += format_nonce(nonce);
    return input;
}

Digest HashOracle::digest(const std::string& challenge, uint64_t nonce) {
    std::string input = format_preimage(challenge, nonce);
    Digest out;
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), out.data());
    return out;
}

std::string HashOracle::to_hex(const Digest& digest) {
    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(DIGEST_SIZE * 2);
    for (unsigned char byte : digest) {
        out.push_back(HEX[byte >> 4]);
        out.push_back(HEX[byte & 0x0F]);
    }
    return out;
}

// Count leading hex zeros
int HashOracle::leading_zero_nibbles(const Digest& digest) {
    int zeros = 0;
    for (unsigned char byte : digest) {
        if (byte == 0) {
            zeros += 2;
        } else {
            if ((byte & 0xF0) == 0) zeros += 1;
            break;
        }
    }
    return zeros;
}

}
