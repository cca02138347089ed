#pragma once

// ============================================================
// crypto.hpp -- OpenSSL helpers: SHA-256, CSPRNG, hex
// ============================================================

#include "platform.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace crypto {

using Digest = std::array<u8, 32>;

// Incremental SHA-256 over an EVP_MD_CTX
class Sha256 {
public:
    Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256& update(const void* data, size_t len);
    Sha256& update(const std::vector<u8>& v) { return update(v.data(), v.size()); }
    Sha256& update(const std::string& s) { return update(s.data(), s.size()); }

    // Length-prefixed (u32 BE) field, so adjacent fields cannot alias
    Sha256& update_field(const void* data, size_t len);
    Sha256& update_field(const std::vector<u8>& v) { return update_field(v.data(), v.size()); }

    Digest finish();

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

Digest sha256(const void* data, size_t len);

// Throws std::runtime_error when the RNG fails
std::vector<u8> random_bytes(size_t n);

// Constant-time compare
bool equal(const void* a, const void* b, size_t len);

std::string to_hex(const void* data, size_t len);

// 16 lowercase hex chars from the CSPRNG
std::string new_session_id();

} // namespace crypto
