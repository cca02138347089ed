#pragma once

// ============================================================
// handshake.hpp -- SAS-confirmed commit/reveal handshake
//
//   sender                               receiver
//   AUTH_COMMIT {ver, profile, H(mA|nA)} ->
//                       <- AUTH_OFFER {ver, profile, nB, mB}
//   AUTH_REVEAL {nA, mA}                 ->
//   both: T = SHA-256(transcript), SAS = 6 digits of T
//   AUTH_CONFIRM {accepted, T}          <->
//
// Direct: m = channel fingerprint; after confirmation each side
// checks the peer's published fingerprint against the live channel.
// PostQuantum: mA = verification key, mB = serialised KEM public key.
// ============================================================

#include "channel.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "inbox.hpp"
#include "key_provider.hpp"
#include <functional>
#include <memory>
#include <string>

enum class HandshakeProfile : u8 {
    Direct      = 1,
    PostQuantum = 2,
};

const char* profile_name(HandshakeProfile p);

// Returns true when the user accepts the displayed SAS. May block.
using ConfirmFn = std::function<bool(const std::string& sas)>;

struct HandshakeResult {
    HandshakeProfile profile = HandshakeProfile::Direct;
    std::string      sas;                // "123 456"
    bool             fingerprint_bound = false;
    std::vector<u8>  peer_material;      // peer's fingerprint or key
};

class HandshakeCoordinator {
public:
    // `channel` is wrapped in a ReplaySafeChannel if it is not one already.
    // `keys` is only consulted for the PostQuantum profile.
    HandshakeCoordinator(std::shared_ptr<Channel> channel,
                         std::string session_id,
                         const TransferConfig& cfg,
                         KeyProvider* keys);
    ~HandshakeCoordinator();

    HandshakeCoordinator(const HandshakeCoordinator&) = delete;
    HandshakeCoordinator& operator=(const HandshakeCoordinator&) = delete;

    HandshakeResult run_sender(HandshakeProfile profile, const ConfirmFn& confirm);

    // Profile is taken from the sender's commit
    HandshakeResult run_receiver(const ConfirmFn& confirm);

    // Fingerprint wire form: [u8 alg_len][alg][bytes...]; empty when absent
    static std::vector<u8> encode_fingerprint(const std::optional<Fingerprint>& fp);
    static std::optional<Fingerprint> decode_fingerprint(const std::vector<u8>& material);

    // 6 decimal digits from the first 4 bytes of the transcript hash
    static std::string sas_from_transcript(const crypto::Digest& t);

private:
    AuthFrame expect(FrameKind kind, int timeout_ms);
    void      send_auth(FrameKind kind, std::vector<u8> payload);

    std::vector<u8> local_material(HandshakeProfile profile, bool sender);
    std::optional<Fingerprint> wait_local_fingerprint();

    crypto::Digest transcript(HandshakeProfile profile,
                              const crypto::Digest& commitment,
                              const std::vector<u8>& nonce_a, const std::vector<u8>& material_a,
                              const std::vector<u8>& nonce_b, const std::vector<u8>& material_b) const;

    HandshakeResult confirm_and_finish(HandshakeProfile profile,
                                       const crypto::Digest& t,
                                       const std::vector<u8>& own_material,
                                       const std::vector<u8>& peer_material,
                                       const ConfirmFn& confirm);

    std::shared_ptr<Channel> channel_;
    std::string              session_id_;
    TransferConfig           cfg_;
    KeyProvider*             keys_;

    std::shared_ptr<Inbox>   inbox_;
    Subscription             msg_sub_;
    Subscription             close_sub_;
};
