#pragma once

// ============================================================
// hash.hpp -- DATA chunk checksum (truncated XXH3-64)
// ============================================================

#include "platform.hpp"
#include <cstddef>

#include <xxhash.h>

namespace hash {

// Computed over the uncompressed chunk
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

inline bool chunk_matches(const void* data, size_t len, u32 expected) {
    return xxh3_32(data, len) == expected;
}

} // namespace hash
