#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "hash_oracle.hpp"

namespace powgate {

// Self-contained FIPS 180-4 SHA-256 used by the portable search strategy.
// The state is a plain value: copying a context after absorbing a prefix
// gives a cheap restart point for every nonce.
class Sha256 {
public:
    Sha256() { reset(); }

    void reset();
    void update(const unsigned char* data, size_t len);
    void update(const std::string& data) {
        update(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }
    void finish(unsigned char out[DIGEST_SIZE]);

    static Digest hash(const std::string& data);

private:
    uint32_t h_[8];
    uint64_t bits_;
    unsigned char buf_[64];
    size_t idx_;
};

}
