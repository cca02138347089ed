#pragma once

// ============================================================
// compress.hpp -- zstd wrapper for DATA frame bodies
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <vector>
#include <string>
#include <optional>

#include <zstd.h>

namespace compress {

// Level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

// Chunks smaller than this are never worth a frame flag
static constexpr size_t MIN_COMPRESS_LEN = 512;

// Compress src; nullopt when the result would not be smaller
inline std::optional<std::vector<u8>> shrink(const void* src, size_t src_len) {
    if (src_len < MIN_COMPRESS_LEN) return std::nullopt;
    std::vector<u8> buf(ZSTD_compressBound(src_len));
    size_t sz = ZSTD_compress(buf.data(), buf.size(), src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(sz)) {
        throw IoError(std::string("zstd compress error: ") + ZSTD_getErrorName(sz));
    }
    if (sz >= src_len) return std::nullopt;
    buf.resize(sz);
    return buf;
}

// Inflate a body whose original length is known; anything else is corrupt
inline std::vector<u8> inflate(const void* src, size_t src_len, size_t original_size) {
    std::vector<u8> buf(original_size);
    size_t sz = ZSTD_decompress(buf.data(), original_size, src, src_len);
    if (ZSTD_isError(sz)) {
        throw ProtocolError(std::string("zstd decompress error: ") + ZSTD_getErrorName(sz));
    }
    if (sz != original_size) {
        throw ProtocolError("zstd body inflated to " + std::to_string(sz) +
                            " bytes, expected " + std::to_string(original_size));
    }
    return buf;
}

// Should payload named `path` be offered for compression?
inline bool should_compress(const std::string& path) {
    // Already-compressed formats
    static const char* const no_compress[] = {
        ".gz", ".bz2", ".xz", ".zst", ".lz4", ".br",
        ".zip", ".7z", ".rar", ".tgz",
        ".jpg", ".jpeg", ".png", ".gif", ".webp", ".avif", ".heic",
        ".mp4", ".mkv", ".avi", ".mov", ".webm",
        ".mp3", ".aac", ".ogg", ".flac", ".opus", ".m4a",
        ".pdf",
        nullptr
    };

    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string::npos) return true;

    std::string ext = path.substr(dot_pos);
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }

    for (int i = 0; no_compress[i]; ++i) {
        if (ext == no_compress[i]) return false;
    }
    return true;
}

} // namespace compress
