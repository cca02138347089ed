// ============================================================
// key_provider.cpp -- OpenSSL-backed key generation
// ============================================================

#include "key_provider.hpp"
#include "protocol_io.hpp"
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

PkeyPtr keygen(const char* type) {
    PkeyPtr key(EVP_PKEY_Q_keygen(nullptr, nullptr, type), &EVP_PKEY_free);
    if (!key) throw std::runtime_error(std::string("EVP_PKEY_Q_keygen(") + type + ") failed");
    return key;
}

std::vector<u8> raw_public(EVP_PKEY* key) {
    size_t len = 0;
    if (EVP_PKEY_get_raw_public_key(key, nullptr, &len) != 1) {
        throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
    }
    std::vector<u8> out(len);
    if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1) {
        throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
    }
    out.resize(len);
    return out;
}

std::vector<u8> raw_private(EVP_PKEY* key) {
    size_t len = 0;
    if (EVP_PKEY_get_raw_private_key(key, nullptr, &len) != 1) {
        throw std::runtime_error("EVP_PKEY_get_raw_private_key failed");
    }
    std::vector<u8> out(len);
    if (EVP_PKEY_get_raw_private_key(key, out.data(), &len) != 1) {
        throw std::runtime_error("EVP_PKEY_get_raw_private_key failed");
    }
    out.resize(len);
    return out;
}

} // namespace

std::vector<u8> OpensslKeyProvider::generate_verification_key() {
    auto key = keygen("ED25519");
    return raw_public(key.get());
}

KemKeyPair OpensslKeyProvider::generate_kem_key_pair() {
    auto key = keygen("X25519");
    KemKeyPair pair;
    pair.algorithm   = "X25519";
    pair.public_key  = raw_public(key.get());
    pair.private_key = raw_private(key.get());
    return pair;
}

std::vector<u8> OpensslKeyProvider::serialize_public_key(const KemKeyPair& pair) {
    if (pair.algorithm.size() > 255 || pair.public_key.size() > 0xFFFF) {
        throw std::runtime_error("KEM public key too large to serialise");
    }
    std::vector<u8> out;
    out.reserve(3 + pair.algorithm.size() + pair.public_key.size());
    out.push_back((u8)pair.algorithm.size());
    out.insert(out.end(), pair.algorithm.begin(), pair.algorithm.end());
    proto::put_u16(out, (u16)pair.public_key.size());
    out.insert(out.end(), pair.public_key.begin(), pair.public_key.end());
    return out;
}
