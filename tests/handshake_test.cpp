#include <cassert>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <thread>

#include "../common/crypto.hpp"
#include "../common/errors.hpp"
#include "../common/handshake.hpp"
#include "../common/memory_channel.hpp"
#include "test_support.hpp"

namespace {

Fingerprint Fp(u8 seed) {
  Fingerprint fp;
  fp.algorithm = "sha-256";
  fp.bytes.assign(32, seed);
  return fp;
}

TransferConfig FastConfig() {
  TransferConfig cfg;
  cfg.fingerprint_wait_ms = 300;
  cfg.handshake_timeout_ms = 3000;
  cfg.confirm_timeout_ms = 3000;
  return cfg;
}

struct Outcome {
  std::optional<HandshakeResult> result;
  std::exception_ptr error;
};

std::optional<AuthFailure> AuthReason(const std::exception_ptr& e) {
  if (!e) return std::nullopt;
  try {
    std::rethrow_exception(e);
  } catch (const AuthError& a) {
    return a.reason();
  } catch (const std::exception&) {
  }
  return std::nullopt;
}

// Both coordinators exist before either side sends
void Run(const std::shared_ptr<Channel>& sender_ch, const std::shared_ptr<Channel>& receiver_ch,
         HandshakeProfile profile, KeyProvider* keys,
         const ConfirmFn& sender_confirm, const ConfirmFn& receiver_confirm,
         Outcome& snd, Outcome& rcv, const TransferConfig& cfg = FastConfig()) {
  HandshakeCoordinator hs_a(sender_ch, "sess-1", cfg, keys);
  HandshakeCoordinator hs_b(receiver_ch, "sess-1", cfg, keys);

  std::thread t([&] {
    try {
      snd.result = hs_a.run_sender(profile, sender_confirm);
    } catch (...) {
      snd.error = std::current_exception();
    }
  });
  try {
    rcv.result = hs_b.run_receiver(receiver_confirm);
  } catch (...) {
    rcv.error = std::current_exception();
  }
  t.join();
}

ConfirmFn Accept() {
  return [](const std::string&) { return true; };
}

}  // namespace

int main() {
  test::quiet_logs();

  // SAS format
  {
    crypto::Digest t{};
    t[0] = 0x00; t[1] = 0x01; t[2] = 0xE2; t[3] = 0x40;   // 123456
    assert(HandshakeCoordinator::sas_from_transcript(t) == "123 456");
    t = crypto::Digest{};
    assert(HandshakeCoordinator::sas_from_transcript(t) == "000 000");
  }

  // Session codes are random hex
  {
    std::string sid = crypto::new_session_id();
    assert(sid.size() == 16);
    assert(sid.find_first_not_of("0123456789abcdef") == std::string::npos);
    assert(sid != crypto::new_session_id());
  }

  // Fingerprint encoding
  {
    auto enc = HandshakeCoordinator::encode_fingerprint(Fp(7));
    auto dec = HandshakeCoordinator::decode_fingerprint(enc);
    assert(dec && *dec == Fp(7));
    assert(HandshakeCoordinator::encode_fingerprint(std::nullopt).empty());
    assert(!HandshakeCoordinator::decode_fingerprint({}));
  }

  // Direct, both fingerprints present: same SAS, channel bound
  {
    MemoryChannel::Options oa, ob;
    oa.local_fingerprint = Fp(1);
    ob.local_fingerprint = Fp(2);
    auto [a, b] = MemoryChannel::create_pair(oa, ob);

    std::string sas_a, sas_b;
    Outcome snd, rcv;
    Run(a, b, HandshakeProfile::Direct, nullptr,
        [&](const std::string& s) { sas_a = s; return true; },
        [&](const std::string& s) { sas_b = s; return true; }, snd, rcv);
    assert(!snd.error && !rcv.error);
    assert(sas_a == sas_b && sas_a.size() == 7 && sas_a[3] == ' ');
    assert(snd.result->sas == sas_a);
    assert(snd.result->fingerprint_bound && rcv.result->fingerprint_bound);
    assert(rcv.result->profile == HandshakeProfile::Direct);
    a->close();
  }

  // Fingerprint arriving late is still picked up within the wait
  {
    MemoryChannel::Options oa, ob;
    oa.local_fingerprint = Fp(1);
    ob.local_fingerprint = Fp(2);
    auto [a, b] = MemoryChannel::create_pair(oa, ob);
    a->set_fingerprint_delay_ms(120);
    Outcome snd, rcv;
    Run(a, b, HandshakeProfile::Direct, nullptr, Accept(), Accept(), snd, rcv);
    assert(!snd.error && !rcv.error);
    assert(snd.result->fingerprint_bound);
    a->close();
  }

  // A relay in the middle: the receiver sees a different remote identity
  {
    MemoryChannel::Options oa, ob;
    oa.local_fingerprint = Fp(1);
    ob.local_fingerprint = Fp(2);
    ob.observed_remote = Fp(9);
    auto [a, b] = MemoryChannel::create_pair(oa, ob);
    Outcome snd, rcv;
    Run(a, b, HandshakeProfile::Direct, nullptr, Accept(), Accept(), snd, rcv);
    assert(AuthReason(rcv.error) == AuthFailure::FingerprintMismatch);
    a->close();
  }

  // Receiver rejects the SAS
  {
    auto [a, b] = MemoryChannel::create_pair();
    Outcome snd, rcv;
    Run(a, b, HandshakeProfile::Direct, nullptr, Accept(),
        [](const std::string&) { return false; }, snd, rcv);
    assert(AuthReason(rcv.error) == AuthFailure::Rejected);
    assert(AuthReason(snd.error) == AuthFailure::PeerRejected);
    a->close();
  }

  // Nobody on the other end
  {
    auto [a, b] = MemoryChannel::create_pair();
    TransferConfig cfg = FastConfig();
    cfg.handshake_timeout_ms = 200;
    HandshakeCoordinator hs(b, "sess-1", cfg, nullptr);
    bool timed_out = false;
    try {
      hs.run_receiver(Accept());
    } catch (const AuthError& e) {
      timed_out = e.reason() == AuthFailure::Timeout;
    }
    assert(timed_out);
    a->close();
  }

  // Peer hangs up mid-handshake
  {
    auto [a, b] = MemoryChannel::create_pair();
    HandshakeCoordinator hs(b, "sess-1", FastConfig(), nullptr);
    std::thread closer([&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      a->close();
    });
    bool network = false;
    try {
      hs.run_receiver(Accept());
    } catch (const NetworkError&) {
      network = true;
    }
    closer.join();
    assert(network);
  }

  // No fingerprints at all: SAS-only confirmation still succeeds
  {
    auto [a, b] = MemoryChannel::create_pair();
    TransferConfig cfg = FastConfig();
    cfg.fingerprint_wait_ms = 0;
    Outcome snd, rcv;
    Run(a, b, HandshakeProfile::Direct, nullptr, Accept(), Accept(), snd, rcv, cfg);
    assert(!snd.error && !rcv.error);
    assert(!snd.result->fingerprint_bound && !rcv.result->fingerprint_bound);
    assert(snd.result->sas == rcv.result->sas);
    a->close();
  }

  // Post-quantum profile: key material exchanged, no fingerprint check
  {
    auto [a, b] = MemoryChannel::create_pair();
    OpensslKeyProvider keys;
    Outcome snd, rcv;
    Run(a, b, HandshakeProfile::PostQuantum, &keys, Accept(), Accept(), snd, rcv);
    assert(!snd.error && !rcv.error);
    assert(rcv.result->profile == HandshakeProfile::PostQuantum);
    assert(!snd.result->peer_material.empty());   // receiver's KEM public key
    assert(!rcv.result->peer_material.empty());   // sender's verification key
    assert(!snd.result->fingerprint_bound);
    assert(snd.result->sas == rcv.result->sas);
    a->close();
  }

  // Post-quantum without a key provider is a usage error
  {
    auto [a, b] = MemoryChannel::create_pair();
    HandshakeCoordinator hs(a, "sess-1", FastConfig(), nullptr);
    bool bad_input = false;
    try {
      hs.run_sender(HandshakeProfile::PostQuantum, Accept());
    } catch (const InvalidInputError&) {
      bad_input = true;
    }
    assert(bad_input);
    a->close();
  }

  return 0;
}
