#pragma once

// ============================================================
// tar_format.hpp -- ustar header layout and numeric fields
// ============================================================

#include "platform.hpp"
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>

namespace tar {

static constexpr size_t BLOCK = 512;

// Field offsets / widths in a ustar header block
static constexpr size_t OFF_NAME     = 0;    static constexpr size_t LEN_NAME     = 100;
static constexpr size_t OFF_MODE     = 100;  static constexpr size_t LEN_MODE     = 8;
static constexpr size_t OFF_UID      = 108;  static constexpr size_t LEN_UID      = 8;
static constexpr size_t OFF_GID      = 116;  static constexpr size_t LEN_GID      = 8;
static constexpr size_t OFF_SIZE     = 124;  static constexpr size_t LEN_SIZE     = 12;
static constexpr size_t OFF_MTIME    = 136;  static constexpr size_t LEN_MTIME    = 12;
static constexpr size_t OFF_CHKSUM   = 148;  static constexpr size_t LEN_CHKSUM   = 8;
static constexpr size_t OFF_TYPE     = 156;
static constexpr size_t OFF_LINKNAME = 157;  static constexpr size_t LEN_LINKNAME = 100;
static constexpr size_t OFF_MAGIC    = 257;  static constexpr size_t LEN_MAGIC    = 6;
static constexpr size_t OFF_VERSION  = 263;
static constexpr size_t OFF_UNAME    = 265;
static constexpr size_t OFF_GNAME    = 297;
static constexpr size_t OFF_PREFIX   = 345;  static constexpr size_t LEN_PREFIX   = 155;

static constexpr char TYPE_FILE      = '0';
static constexpr char TYPE_FILE_OLD  = '\0';
static constexpr char TYPE_HARDLINK  = '1';
static constexpr char TYPE_SYMLINK   = '2';
static constexpr char TYPE_DIR       = '5';
static constexpr char TYPE_PAX       = 'x';
static constexpr char TYPE_PAX_GLOBAL= 'g';
static constexpr char TYPE_GNU_LONG  = 'L';

inline u64 round_up(u64 n) {
    return (n + BLOCK - 1) / BLOCK * BLOCK;
}

// "ustar" followed by NUL (POSIX) or space (old GNU)
inline bool has_magic(const u8* block) {
    return std::memcmp(block + OFF_MAGIC, "ustar", 5) == 0;
}

inline bool is_zero_block(const u8* block) {
    for (size_t i = 0; i < BLOCK; ++i) {
        if (block[i]) return false;
    }
    return true;
}

// Octal with trailing NUL; base-256 when the value does not fit
inline void put_number(u8* field, size_t width, u64 value) {
    u64 limit = 1;
    for (size_t i = 0; i + 1 < width; ++i) limit *= 8;
    if (value < limit) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%0*llo", (int)(width - 1), (unsigned long long)value);
        std::memcpy(field, buf, width - 1);
        field[width - 1] = 0;
        return;
    }
    std::memset(field, 0, width);
    field[0] = 0x80;
    for (size_t i = 0; i < 8 && i < width - 1; ++i) {
        field[width - 1 - i] = (u8)(value >> (8 * i));
    }
}

// Octal (spaces/NUL tolerated) or base-256; nullopt when malformed
inline std::optional<u64> get_number(const u8* field, size_t width) {
    if (field[0] & 0x80) {
        u64 v = 0;
        for (size_t i = 1; i < width; ++i) {
            if (v >> 56) return std::nullopt;
            v = (v << 8) | field[i];
        }
        return v;
    }
    u64 v = 0;
    size_t i = 0;
    while (i < width && field[i] == ' ') ++i;
    bool any = false;
    for (; i < width; ++i) {
        u8 c = field[i];
        if (c == 0 || c == ' ') break;
        if (c < '0' || c > '7') return std::nullopt;
        v = (v << 3) | (u64)(c - '0');
        any = true;
    }
    if (!any) return 0;
    return v;
}

// Sum of all header bytes with the checksum field read as spaces
inline u32 checksum(const u8* block) {
    u32 sum = 0;
    for (size_t i = 0; i < BLOCK; ++i) {
        bool in_field = i >= OFF_CHKSUM && i < OFF_CHKSUM + LEN_CHKSUM;
        sum += in_field ? (u32)' ' : (u32)block[i];
    }
    return sum;
}

inline void seal(u8* block) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%06o", checksum(block));
    std::memcpy(block + OFF_CHKSUM, buf, 6);
    block[OFF_CHKSUM + 6] = 0;
    block[OFF_CHKSUM + 7] = ' ';
}

// NUL-terminated or full-width string field
inline std::string get_string(const u8* field, size_t width) {
    size_t n = 0;
    while (n < width && field[n]) ++n;
    return std::string(reinterpret_cast<const char*>(field), n);
}

} // namespace tar
