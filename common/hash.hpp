#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for snapshot digests
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>
#include <algorithm>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 streaming state API
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// 16-byte (128-bit) hash result, stored big-endian for determinism
using Hash128 = std::array<u8, 16>;

inline Hash128 from_xxh128(XXH128_hash_t h) {
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

// Compute xxh3_128 of a memory buffer
inline Hash128 xxh3_128(const void* data, size_t len) {
    return from_xxh128(XXH3_128bits(data, len));
}

// Streaming hasher for xxh3_128
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return from_xxh128(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

// Convert Hash128 to raw bytes (copy to 16-byte array)
inline void to_bytes(const Hash128& h, u8 out[16]) {
    std::copy(h.begin(), h.end(), out);
}

// Build Hash128 from raw bytes
inline Hash128 from_bytes(const u8 in[16]) {
    Hash128 h;
    std::copy(in, in + 16, h.begin());
    return h;
}

// Lower-case hex, 32 characters
inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(32);
    for (u8 b : h) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

} // namespace hash
