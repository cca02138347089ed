#pragma once

// ============================================================
// meta_header.hpp -- Optional filename header carried in the
//                    first DATA payload
//
//   "SCM1" | u8 name_len | name (UTF-8, <= 255 bytes)
//
// Not part of INIT.total_bytes.
// ============================================================

#include "platform.hpp"
#include <optional>
#include <string>
#include <vector>

namespace meta {

static constexpr u8     MAGIC[4]     = { 'S', 'C', 'M', '1' };
static constexpr size_t MAGIC_LEN    = 4;
static constexpr size_t MAX_NAME_LEN = 255;

// Names longer than 255 bytes are cut on a UTF-8 boundary
std::vector<u8> encode(const std::string& name);

struct Parsed {
    std::string name;
    size_t      header_len = 0;   // bytes to strip from the payload
};

// nullopt when the payload does not start with a complete header
std::optional<Parsed> parse(const u8* data, size_t len);

// True once `len` bytes are enough to tell whether a header is there:
// either the magic mismatches or the whole header is present.
bool decidable(const u8* data, size_t len);

} // namespace meta
