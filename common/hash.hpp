#pragma once

// ============================================================
// hash.hpp -- xxHash3 fingerprints for transferred files
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <string>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 API of libxxhash
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// Compute xxh3_64 of a memory buffer
inline u64 xxh3_64(const void* data, size_t len) {
    return (u64)XXH3_64bits(data, len);
}

inline u64 xxh3_64(const std::string& data) {
    return xxh3_64(data.data(), data.size());
}

// 16 lowercase hex digits, the same text xxhsum -H3 prints
inline std::string to_hex(u64 h) {
    static const char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[(size_t)i] = digits[h & 0xF];
        h >>= 4;
    }
    return out;
}

} // namespace hash
