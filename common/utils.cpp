// ============================================================
// utils.cpp -- Glob matching and filename sanitising
// ============================================================

#include "utils.hpp"
#include <cctype>
#include <cstring>

namespace {

inline char fold(char c, bool nocase) {
    return nocase ? (char)std::tolower((unsigned char)c) : c;
}

// Match one character against a bracket class starting at p (just past '[').
// Sets *end to the character after ']'. Returns false for a malformed class
// (no closing bracket), in which case '[' is taken literally by the caller.
bool match_class(const char* p, char c, bool nocase, const char** end, bool* matched) {
    bool negate = false;
    if (*p == '!' || *p == '^') { negate = true; ++p; }
    bool hit = false;
    bool first = true;
    char fc = fold(c, nocase);
    while (*p && (first || *p != ']')) {
        first = false;
        char lo = *p;
        if (lo == '\\' && p[1]) lo = *++p;
        char hi = lo;
        if (p[1] == '-' && p[2] && p[2] != ']') {
            hi = p[2];
            p += 2;
        }
        ++p;
        char flo = fold(lo, nocase), fhi = fold(hi, nocase);
        if ((fc >= flo && fc <= fhi) || (c >= lo && c <= hi)) hit = true;
    }
    if (*p != ']') return false;
    *end = p + 1;
    *matched = (hit != negate) && c != '/';
    return true;
}

bool match_here(const char* p, const char* t, bool nocase) {
    while (*p) {
        if (p[0] == '*' && p[1] == '*') {
            const char* rest = p + 2;
            while (*rest == '*') ++rest;
            bool seg = (*rest == '/');
            if (seg) ++rest;
            if (!*rest) return true;
            // "**/" may swallow zero or more whole segments
            for (const char* s = t; ; ++s) {
                if ((!seg || s == t || s[-1] == '/') && match_here(rest, s, nocase)) return true;
                if (!*s) return false;
            }
        }
        if (*p == '*') {
            while (*p == '*') ++p;
            for (const char* s = t; ; ++s) {
                if (match_here(p, s, nocase)) return true;
                if (!*s || *s == '/') return false;
            }
        }
        if (!*t) return false;
        if (*p == '?') {
            if (*t == '/') return false;
            ++p; ++t;
            continue;
        }
        if (*p == '[') {
            const char* end = nullptr;
            bool matched = false;
            if (match_class(p + 1, *t, nocase, &end, &matched)) {
                if (!matched) return false;
                p = end; ++t;
                continue;
            }
        }
        char pc = *p;
        if (pc == '\\' && p[1]) pc = *++p;
        if (fold(pc, nocase) != fold(*t, nocase)) return false;
        ++p; ++t;
    }
    return *t == '\0';
}

bool is_reserved_device_name(const std::string& s) {
    std::string stem = s.substr(0, s.find('.'));
    for (auto& c : stem) c = (char)std::tolower((unsigned char)c);
    static const char* const fixed[] = { "con", "prn", "aux", "nul" };
    for (const char* f : fixed) if (stem == f) return true;
    if (stem.size() == 4 && (stem.compare(0, 3, "com") == 0 || stem.compare(0, 3, "lpt") == 0)
        && stem[3] >= '1' && stem[3] <= '9') {
        return true;
    }
    return false;
}

} // namespace

bool utils::glob_match(const std::string& pattern, const std::string& text, bool nocase) {
    return match_here(pattern.c_str(), text.c_str(), nocase);
}

bool utils::glob_match_any(const std::vector<std::string>& patterns, const std::string& text) {
    for (const auto& p : patterns) {
        if (glob_match(p, text, true)) return true;
    }
    return false;
}

std::string utils::sanitize_filename(const std::string& name,
                                     const std::string& fallback,
                                     size_t max_len) {
    auto slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

    std::string cleaned;
    cleaned.reserve(base.size());
    for (unsigned char c : base) {
        if (c < 0x20 || std::strchr("<>:\"/\\|?*", (char)c)) cleaned += '_';
        else cleaned += (char)c;
    }

    size_t b = cleaned.find_first_not_of(' ');
    cleaned = b == std::string::npos ? std::string() : cleaned.substr(b);
    while (!cleaned.empty() && (cleaned.back() == ' ' || cleaned.back() == '.')) {
        cleaned.pop_back();
    }

    if (cleaned.empty() || is_reserved_device_name(cleaned)) cleaned = fallback;

    if (cleaned.size() > max_len) {
        auto dot = cleaned.rfind('.');
        size_t ext_len = dot == std::string::npos ? 0 : cleaned.size() - dot;
        if (dot != std::string::npos && dot > 0 && ext_len < max_len) {
            std::string stem = truncate_utf8(cleaned.substr(0, dot), max_len - ext_len);
            if (stem.empty()) stem = "_";
            cleaned = stem + cleaned.substr(dot);
        } else {
            cleaned = truncate_utf8(cleaned, max_len);
        }
    }
    return cleaned;
}
