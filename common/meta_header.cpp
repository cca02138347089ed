// ============================================================
// meta_header.cpp -- Filename header codec
// ============================================================

#include "meta_header.hpp"
#include "utils.hpp"
#include <cstring>

std::vector<u8> meta::encode(const std::string& name) {
    std::string n = utils::truncate_utf8(name, MAX_NAME_LEN);
    std::vector<u8> out;
    out.reserve(MAGIC_LEN + 1 + n.size());
    out.insert(out.end(), MAGIC, MAGIC + MAGIC_LEN);
    out.push_back((u8)n.size());
    out.insert(out.end(), n.begin(), n.end());
    return out;
}

std::optional<meta::Parsed> meta::parse(const u8* data, size_t len) {
    if (len < MAGIC_LEN + 1) return std::nullopt;
    if (std::memcmp(data, MAGIC, MAGIC_LEN) != 0) return std::nullopt;
    size_t name_len = data[MAGIC_LEN];
    if (len < MAGIC_LEN + 1 + name_len) return std::nullopt;

    Parsed p;
    p.name.assign(reinterpret_cast<const char*>(data + MAGIC_LEN + 1), name_len);
    p.header_len = MAGIC_LEN + 1 + name_len;
    return p;
}

bool meta::decidable(const u8* data, size_t len) {
    size_t cmp = len < MAGIC_LEN ? len : MAGIC_LEN;
    if (std::memcmp(data, MAGIC, cmp) != 0) return true;
    if (len < MAGIC_LEN + 1) return false;
    return len >= MAGIC_LEN + 1 + (size_t)data[MAGIC_LEN];
}
