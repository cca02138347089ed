#pragma once

// ============================================================
// utils.hpp -- Formatting, parsing and name helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <optional>
#include <utility>

namespace utils {

// Format bytes as human-readable (e.g., "1.2 MiB")
inline std::string format_bytes(u64 bytes) {
    static const char* const units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
    double v = (double)bytes;
    int i = 0;
    while (v >= 1024.0 && i < 4) { v /= 1024.0; ++i; }
    std::ostringstream ss;
    if (i == 0) ss << bytes << " B";
    else        ss << std::fixed << std::setprecision(1) << v << " " << units[i];
    return ss.str();
}

// Format speed as "X.X MiB/s"
inline std::string format_speed(double bytes_per_sec) {
    if (bytes_per_sec < 0) bytes_per_sec = 0;
    return format_bytes((u64)bytes_per_sec) + "/s";
}

// Format duration as "1h 23m", "4m 5s" or "45s"
inline std::string format_duration_s(u64 seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " +
           std::to_string((seconds % 3600) / 60) + "m";
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (std::sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(long port) {
    return port >= 1 && port <= 65535;
}

// Strict unsigned decimal parse; rejects signs, blanks and trailing junk
inline std::optional<u64> parse_u64(const std::string& s) {
    if (s.empty() || s.size() > 20) return std::nullopt;
    u64 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        u64 next = v * 10 + (u64)(c - '0');
        if (next / 10 != v) return std::nullopt;
        v = next;
    }
    return v;
}

// "ip:port" -> (ip, port); nullopt when malformed
inline std::optional<std::pair<std::string, u16>> split_host_port(const std::string& s) {
    auto colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0) return std::nullopt;
    auto port = parse_u64(s.substr(colon + 1));
    if (!port || !validate_port((long)*port)) return std::nullopt;
    return std::make_pair(s.substr(0, colon), (u16)*port);
}

// Split "a, b,,c" into {"a","b","c"}
inline std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    auto push = [&] {
        size_t b = cur.find_first_not_of(" \t");
        size_t e = cur.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(cur.substr(b, e - b + 1));
        cur.clear();
    };
    for (char c : s) {
        if (c == ',') push();
        else cur += c;
    }
    push();
    return out;
}

// Clamp value
template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

// Cut s to at most max_bytes without splitting a UTF-8 sequence
inline std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && ((unsigned char)s[cut] & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

// Glob match with '*', '**', '?', '[...]'. Dotfiles are matched by
// wildcards; '*' and '?' never cross '/'.
bool glob_match(const std::string& pattern, const std::string& text, bool nocase = true);

// True if text matches any of the patterns
bool glob_match_any(const std::vector<std::string>& patterns, const std::string& text);

// Reduce an untrusted name to a safe leaf filename
std::string sanitize_filename(const std::string& name,
                              const std::string& fallback = "file.bin",
                              size_t max_len = 255);

} // namespace utils
