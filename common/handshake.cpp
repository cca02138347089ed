// ============================================================
// handshake.cpp -- SAS-confirmed commit/reveal handshake
// ============================================================

#include "handshake.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "protocol_io.hpp"
#include "replay_channel.hpp"
#include <chrono>
#include <cstdio>
#include <thread>

namespace {

constexpr size_t NONCE_LEN  = 32;
constexpr size_t DIGEST_LEN = 32;
constexpr int    FINGERPRINT_POLL_MS = 50;

const char* const COMMIT_LABEL = "sascp/commit/v1";
const char* const SAS_LABEL    = "sascp/sas/v1";

std::string kind_str(FrameKind k) { return frame_kind_name(k); }

AuthError protocol_error(const std::string& msg) {
    return AuthError(AuthFailure::Protocol, "handshake protocol error: " + msg);
}

bool valid_profile(u8 p) {
    return p == (u8)HandshakeProfile::Direct || p == (u8)HandshakeProfile::PostQuantum;
}

crypto::Digest commitment_for(const std::vector<u8>& material, const std::vector<u8>& nonce) {
    crypto::Sha256 h;
    h.update(std::string(COMMIT_LABEL));
    h.update_field(material);
    h.update_field(nonce);
    return h.finish();
}

void put_material(std::vector<u8>& out, const std::vector<u8>& material) {
    proto::put_u16(out, (u16)material.size());
    out.insert(out.end(), material.begin(), material.end());
}

// [u16 len][bytes] exactly filling the rest of the payload
std::vector<u8> take_material(const std::vector<u8>& p, size_t off, const char* what) {
    if (p.size() < off + 2) throw protocol_error(std::string("truncated ") + what);
    size_t len = proto::get_u16(p.data() + off);
    if (p.size() != off + 2 + len) throw protocol_error(std::string("bad material length in ") + what);
    return std::vector<u8>(p.begin() + (long)(off + 2), p.end());
}

} // namespace

const char* profile_name(HandshakeProfile p) {
    switch (p) {
        case HandshakeProfile::Direct:      return "direct";
        case HandshakeProfile::PostQuantum: return "pq";
    }
    return "?";
}

HandshakeCoordinator::HandshakeCoordinator(std::shared_ptr<Channel> channel,
                                           std::string session_id,
                                           const TransferConfig& cfg,
                                           KeyProvider* keys)
    : channel_(ReplaySafeChannel::wrap(std::move(channel), session_id, "handshake"))
    , session_id_(std::move(session_id))
    , cfg_(cfg)
    , keys_(keys)
    , inbox_(std::make_shared<Inbox>())
{
    std::shared_ptr<Inbox> inbox = inbox_;
    std::string sid = session_id_;
    msg_sub_ = channel_->on_message([inbox, sid](const Frame& f) {
        const auto* auth = std::get_if<AuthFrame>(&f);
        if (!auth) return;
        if (!auth->session_id.empty() && auth->session_id != sid) {
            LOG_DEBUG("handshake: ignoring " + kind_str(auth->kind) + " for session " + auth->session_id);
            return;
        }
        inbox->push(*auth);
    });
    close_sub_ = channel_->on_close([inbox] { inbox->close(); });
}

HandshakeCoordinator::~HandshakeCoordinator() {
    msg_sub_.reset();
    close_sub_.reset();
    inbox_->close();
}

void HandshakeCoordinator::send_auth(FrameKind kind, std::vector<u8> payload) {
    AuthFrame f;
    f.kind       = kind;
    f.session_id = session_id_;
    f.payload    = std::move(payload);
    channel_->send(f);
}

AuthFrame HandshakeCoordinator::expect(FrameKind kind, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left < 0) left = 0;

        Frame f;
        switch (inbox_->pop(f, (int)left)) {
            case Inbox::PopResult::Timeout:
                throw AuthError(AuthFailure::Timeout,
                                "handshake timed out waiting for " + kind_str(kind));
            case Inbox::PopResult::Closed: {
                std::string why = channel_->close_reason();
                throw NetworkError("channel closed during handshake" +
                                   (why.empty() ? std::string() : ": " + why));
            }
            case Inbox::PopResult::Ok:
                break;
        }

        AuthFrame auth = std::get<AuthFrame>(std::move(f));
        if (auth.kind == kind) return auth;
        if (auth.kind == FrameKind::AuthConfirm && !auth.payload.empty() && auth.payload[0] == 0) {
            throw AuthError(AuthFailure::PeerRejected, "peer aborted the handshake");
        }
        throw protocol_error("unexpected " + kind_str(auth.kind) + " while waiting for " + kind_str(kind));
    }
}

std::optional<Fingerprint> HandshakeCoordinator::wait_local_fingerprint() {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(cfg_.fingerprint_wait_ms);
    for (;;) {
        auto fp = channel_->local_fingerprint();
        if (fp) return fp;
        if (clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(FINGERPRINT_POLL_MS));
    }
}

std::vector<u8> HandshakeCoordinator::local_material(HandshakeProfile profile, bool sender) {
    std::vector<u8> material;
    if (profile == HandshakeProfile::Direct) {
        material = encode_fingerprint(wait_local_fingerprint());
    } else {
        if (!keys_) throw InvalidInputError("post-quantum handshake needs a key provider");
        material = sender ? keys_->generate_verification_key()
                          : keys_->serialize_public_key(keys_->generate_kem_key_pair());
    }
    if (material.size() > 0xFFFF) {
        throw InvalidInputError("handshake material too large: " + std::to_string(material.size()));
    }
    return material;
}

crypto::Digest HandshakeCoordinator::transcript(HandshakeProfile profile,
                                                const crypto::Digest& commitment,
                                                const std::vector<u8>& nonce_a,
                                                const std::vector<u8>& material_a,
                                                const std::vector<u8>& nonce_b,
                                                const std::vector<u8>& material_b) const {
    crypto::Sha256 h;
    h.update(std::string(SAS_LABEL));
    u8 prof = (u8)profile;
    h.update(&prof, 1);
    h.update_field(session_id_.data(), session_id_.size());
    h.update(commitment.data(), commitment.size());
    h.update_field(nonce_a);
    h.update_field(material_a);
    h.update_field(nonce_b);
    h.update_field(material_b);
    return h.finish();
}

HandshakeResult HandshakeCoordinator::run_sender(HandshakeProfile profile, const ConfirmFn& confirm) {
    LOG_DEBUG("handshake[sender]: profile=" + std::string(profile_name(profile)) +
              " session=" + session_id_);

    std::vector<u8> material_a = local_material(profile, true);
    std::vector<u8> nonce_a    = crypto::random_bytes(NONCE_LEN);
    crypto::Digest commitment  = commitment_for(material_a, nonce_a);

    std::vector<u8> commit;
    commit.push_back(SASCP_HANDSHAKE_VERSION);
    commit.push_back((u8)profile);
    commit.insert(commit.end(), commitment.begin(), commitment.end());
    send_auth(FrameKind::AuthCommit, std::move(commit));

    AuthFrame offer = expect(FrameKind::AuthOffer, cfg_.handshake_timeout_ms);
    const auto& op = offer.payload;
    if (op.size() < 2 + NONCE_LEN + 2) throw protocol_error("truncated AUTH_OFFER");
    if (op[0] != SASCP_HANDSHAKE_VERSION) {
        throw protocol_error("peer speaks handshake version " + std::to_string(op[0]));
    }
    if (op[1] != (u8)profile) throw protocol_error("peer answered with a different profile");
    std::vector<u8> nonce_b(op.begin() + 2, op.begin() + 2 + NONCE_LEN);
    std::vector<u8> material_b = take_material(op, 2 + NONCE_LEN, "AUTH_OFFER");

    std::vector<u8> reveal(nonce_a);
    put_material(reveal, material_a);
    send_auth(FrameKind::AuthReveal, std::move(reveal));

    crypto::Digest t = transcript(profile, commitment, nonce_a, material_a, nonce_b, material_b);
    return confirm_and_finish(profile, t, material_a, material_b, confirm);
}

HandshakeResult HandshakeCoordinator::run_receiver(const ConfirmFn& confirm) {
    AuthFrame commit = expect(FrameKind::AuthCommit, cfg_.handshake_timeout_ms);
    const auto& cp = commit.payload;
    if (cp.size() != 2 + DIGEST_LEN) throw protocol_error("bad AUTH_COMMIT length");
    if (cp[0] != SASCP_HANDSHAKE_VERSION) {
        throw protocol_error("peer speaks handshake version " + std::to_string(cp[0]));
    }
    if (!valid_profile(cp[1])) throw protocol_error("unknown profile " + std::to_string(cp[1]));
    HandshakeProfile profile = (HandshakeProfile)cp[1];
    crypto::Digest commitment{};
    std::copy(cp.begin() + 2, cp.end(), commitment.begin());

    LOG_DEBUG("handshake[receiver]: profile=" + std::string(profile_name(profile)) +
              " session=" + session_id_);

    std::vector<u8> material_b = local_material(profile, false);
    std::vector<u8> nonce_b    = crypto::random_bytes(NONCE_LEN);

    std::vector<u8> offer;
    offer.push_back(SASCP_HANDSHAKE_VERSION);
    offer.push_back((u8)profile);
    offer.insert(offer.end(), nonce_b.begin(), nonce_b.end());
    put_material(offer, material_b);
    send_auth(FrameKind::AuthOffer, std::move(offer));

    AuthFrame reveal = expect(FrameKind::AuthReveal, cfg_.handshake_timeout_ms);
    const auto& rp = reveal.payload;
    if (rp.size() < NONCE_LEN + 2) throw protocol_error("truncated AUTH_REVEAL");
    std::vector<u8> nonce_a(rp.begin(), rp.begin() + NONCE_LEN);
    std::vector<u8> material_a = take_material(rp, NONCE_LEN, "AUTH_REVEAL");

    crypto::Digest expected = commitment_for(material_a, nonce_a);
    if (!crypto::equal(expected.data(), commitment.data(), DIGEST_LEN)) {
        throw protocol_error("reveal does not match commitment");
    }

    crypto::Digest t = transcript(profile, commitment, nonce_a, material_a, nonce_b, material_b);
    return confirm_and_finish(profile, t, material_b, material_a, confirm);
}

HandshakeResult HandshakeCoordinator::confirm_and_finish(HandshakeProfile profile,
                                                         const crypto::Digest& t,
                                                         const std::vector<u8>& own_material,
                                                         const std::vector<u8>& peer_material,
                                                         const ConfirmFn& confirm) {
    HandshakeResult result;
    result.profile       = profile;
    result.sas           = sas_from_transcript(t);
    result.peer_material = peer_material;

    bool accepted = confirm ? confirm(result.sas) : false;

    std::vector<u8> msg;
    msg.push_back(accepted ? 1 : 0);
    msg.insert(msg.end(), t.begin(), t.end());
    send_auth(FrameKind::AuthConfirm, std::move(msg));

    if (!accepted) throw AuthError(AuthFailure::Rejected, "SAS rejected");

    AuthFrame peer = expect(FrameKind::AuthConfirm, cfg_.confirm_timeout_ms);
    if (peer.payload.size() != 1 + DIGEST_LEN) throw protocol_error("bad AUTH_CONFIRM length");
    if (peer.payload[0] == 0) throw AuthError(AuthFailure::PeerRejected, "peer rejected the SAS");
    if (!crypto::equal(peer.payload.data() + 1, t.data(), DIGEST_LEN)) {
        throw protocol_error("transcript mismatch");
    }

    if (profile == HandshakeProfile::Direct) {
        auto published = decode_fingerprint(peer_material);
        auto observed  = channel_->remote_fingerprint();
        if (published && observed) {
            if (*published != *observed) {
                throw AuthError(AuthFailure::FingerprintMismatch,
                                "peer fingerprint does not match the channel (" +
                                published->algorithm + " " +
                                crypto::to_hex(published->bytes.data(), published->bytes.size()) +
                                " vs " +
                                crypto::to_hex(observed->bytes.data(), observed->bytes.size()) + ")");
            }
            result.fingerprint_bound = true;
        } else {
            LOG_WARN(std::string("channel fingerprint unavailable (") +
                     (own_material.empty() ? "local" : "remote") +
                     "); authenticity rests on the SAS comparison alone");
        }
    }

    LOG_INFO("handshake complete (" + std::string(profile_name(profile)) +
             (result.fingerprint_bound ? ", channel bound" : "") + ")");
    return result;
}

std::vector<u8> HandshakeCoordinator::encode_fingerprint(const std::optional<Fingerprint>& fp) {
    std::vector<u8> out;
    if (!fp) return out;
    std::string alg = fp->algorithm.substr(0, 255);
    out.push_back((u8)alg.size());
    out.insert(out.end(), alg.begin(), alg.end());
    out.insert(out.end(), fp->bytes.begin(), fp->bytes.end());
    return out;
}

std::optional<Fingerprint> HandshakeCoordinator::decode_fingerprint(const std::vector<u8>& material) {
    if (material.empty()) return std::nullopt;
    size_t alg_len = material[0];
    if (material.size() < 1 + alg_len) throw protocol_error("malformed fingerprint");
    Fingerprint fp;
    fp.algorithm.assign(material.begin() + 1, material.begin() + 1 + (long)alg_len);
    fp.bytes.assign(material.begin() + 1 + (long)alg_len, material.end());
    return fp;
}

std::string HandshakeCoordinator::sas_from_transcript(const crypto::Digest& t) {
    u32 v = ((u32)t[0] << 24) | ((u32)t[1] << 16) | ((u32)t[2] << 8) | (u32)t[3];
    v %= 1000000u;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%03u %03u", v / 1000u, v % 1000u);
    return buf;
}
