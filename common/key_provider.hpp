#pragma once

// ============================================================
// key_provider.hpp -- Key material for the post-quantum profile
//
// The handshake never picks primitives itself; it asks a provider
// for a verification key (sender) and a KEM key pair (receiver).
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

struct KemKeyPair {
    std::string     algorithm;
    std::vector<u8> public_key;
    std::vector<u8> private_key;
};

class KeyProvider {
public:
    virtual ~KeyProvider() = default;

    // Public half of a fresh signing key, as published in the handshake
    virtual std::vector<u8> generate_verification_key() = 0;

    virtual KemKeyPair generate_kem_key_pair() = 0;

    // Wire form of the public half: [u8 alg_len][alg][u16 key_len][key]
    virtual std::vector<u8> serialize_public_key(const KemKeyPair& pair) = 0;
};

// OpenSSL EVP keys: Ed25519 verification key, X25519 key agreement.
// (The linked OpenSSL has no ML-KEM; inject another provider for it.)
class OpensslKeyProvider : public KeyProvider {
public:
    std::vector<u8> generate_verification_key() override;
    KemKeyPair generate_kem_key_pair() override;
    std::vector<u8> serialize_public_key(const KemKeyPair& pair) override;
};
