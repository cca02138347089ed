// ============================================================
// crypto.cpp -- OpenSSL helpers
// ============================================================

#include "crypto.hpp"
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace {

std::string openssl_error(const char* what) {
    unsigned long code = ERR_get_error();
    char buf[256] = {0};
    if (code) ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(what) + (code ? std::string(": ") + buf : std::string());
}

} // namespace

crypto::Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestInit_ex(sha256) failed"));
    }
}

crypto::Sha256& crypto::Sha256::update(const void* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error(openssl_error("EVP_DigestUpdate failed"));
    }
    return *this;
}

crypto::Sha256& crypto::Sha256::update_field(const void* data, size_t len) {
    u8 prefix[4] = { (u8)(len >> 24), (u8)(len >> 16), (u8)(len >> 8), (u8)len };
    update(prefix, sizeof(prefix));
    return update(data, len);
}

crypto::Digest crypto::Sha256::finish() {
    Digest out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
        throw std::runtime_error(openssl_error("EVP_DigestFinal_ex failed"));
    }
    return out;
}

crypto::Digest crypto::sha256(const void* data, size_t len) {
    Sha256 h;
    h.update(data, len);
    return h.finish();
}

std::vector<u8> crypto::random_bytes(size_t n) {
    std::vector<u8> out(n);
    if (n > 0 && RAND_bytes(out.data(), (int)n) != 1) {
        throw std::runtime_error(openssl_error("RAND_bytes failed"));
    }
    return out;
}

bool crypto::equal(const void* a, const void* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

std::string crypto::to_hex(const void* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    const u8* p = static_cast<const u8*>(data);
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[p[i] >> 4];
        out += digits[p[i] & 0x0F];
    }
    return out;
}

std::string crypto::new_session_id() {
    auto raw = random_bytes(8);
    return to_hex(raw.data(), raw.size());
}
