#include <cassert>
#include <chrono>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "../common/errors.hpp"
#include "../common/memory_channel.hpp"
#include "../common/meta_header.hpp"
#include "../common/transfer_engine.hpp"
#include "../receiver/mismatch_policy.hpp"
#include "../receiver/sniffing_sink.hpp"
#include "../sender/archive_packer.hpp"
#include "test_support.hpp"

namespace {

TransferConfig FastConfig() {
  TransferConfig cfg;
  cfg.chunk_size = 4096;
  cfg.fingerprint_wait_ms = 300;
  cfg.handshake_timeout_ms = 5000;
  cfg.confirm_timeout_ms = 5000;
  cfg.idle_timeout_ms = 5000;
  cfg.ack_wait_ms = 3000;
  cfg.peer_close_wait_ms = 500;
  return cfg;
}

Fingerprint Fp(u8 seed) {
  Fingerprint fp;
  fp.algorithm = "sha-256";
  fp.bytes.assign(32, seed);
  return fp;
}

struct Side {
  TransferReport report;
  std::exception_ptr error;
  std::string sas;
};

ConfirmFn Confirm(Side& side, bool answer = true) {
  return [&side, answer](const std::string& sas) {
    side.sas = sas;
    return answer;
  };
}

// Runs one session: receiver engine first, so nothing is lost
void Session(const std::shared_ptr<Channel>& a, const std::shared_ptr<Channel>& b,
             ByteSource& src, u64 total, const std::optional<std::string>& name,
             HandshakeProfile profile, ByteSink& sink, Side& snd, Side& rcv,
             bool receiver_accepts = true) {
  TransferConfig cfg = FastConfig();
  OpensslKeyProvider keys;
  TransferEngine receiver(b, "e2e", Role::Receiver, cfg, &keys);
  TransferEngine sender(a, "e2e", Role::Sender, cfg, &keys);

  std::thread t([&] {
    try {
      rcv.report = receiver.receive(sink, Confirm(rcv, receiver_accepts), nullptr);
    } catch (...) {
      rcv.error = std::current_exception();
    }
  });
  try {
    snd.report = sender.send(src, total, name, profile, Confirm(snd), nullptr);
  } catch (...) {
    snd.error = std::current_exception();
  }
  t.join();
}

bool IsSizeMismatch(const std::exception_ptr& e) {
  if (!e) return false;
  try {
    std::rethrow_exception(e);
  } catch (const SizeMismatchError&) {
    return true;
  } catch (const std::exception&) {
  }
  return false;
}

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

SniffingSink::Options Into(const fs::path& dir) {
  SniffingSink::Options o;
  o.destination = dir.string();
  o.session_id = "e2e";
  return o;
}

}  // namespace

int main() {
  test::quiet_logs();

  // Direct profile, channel-bound, three unequal chunks into a directory
  {
    test::TempDir tmp("e2e-direct");
    MemoryChannel::Options oa, ob;
    oa.local_fingerprint = Fp(1);
    ob.local_fingerprint = Fp(2);
    auto [a, b] = MemoryChannel::create_pair(oa, ob);

    auto payload = test::pattern(2 * 4096 + 100);
    MemorySource src(payload, "photo.raw");
    SniffingSink sink(Into(tmp.path()));
    Side snd, rcv;
    Session(a, b, src, payload.size(), std::string("photo.raw"), HandshakeProfile::Direct, sink,
            snd, rcv);

    assert(!snd.error && !rcv.error);
    assert(snd.sas == rcv.sas && !snd.sas.empty());
    assert(snd.report.handshake.fingerprint_bound);
    assert(rcv.report.handshake.fingerprint_bound);
    assert(snd.report.bytes == payload.size());
    assert(rcv.report.bytes == payload.size());
    assert(test::read_file(tmp / "photo.raw") == payload);
    assert(sink.stats().written == payload.size());
  }

  // Post-quantum profile: name carried in-band and stripped
  {
    test::TempDir tmp("e2e-pq");
    auto [a, b] = MemoryChannel::create_pair();
    auto payload = test::pattern(3 * 4096 + 1);
    MemorySource src(payload);
    SniffingSink sink(Into(tmp.path()));
    Side snd, rcv;
    Session(a, b, src, payload.size(), std::string("secret.db"), HandshakeProfile::PostQuantum,
            sink, snd, rcv);

    assert(!snd.error && !rcv.error);
    assert(rcv.report.handshake.profile == HandshakeProfile::PostQuantum);
    assert(snd.report.bytes == payload.size());
    assert(rcv.report.bytes == payload.size());
    assert(rcv.report.stripped_bytes == meta::encode("secret.db").size());
    assert(test::read_file(tmp / "secret.db") == payload);
  }

  // A directory tree goes through as an archive and is extracted
  {
    test::TempDir tmp("e2e-tree");
    test::write_file(tmp / "album" / "a.jpg", test::pattern(9000, 1));
    test::write_file(tmp / "album" / "sub" / "b.jpg", test::pattern(100, 2));
    ArchivePacker packer({(tmp / "album").string()}, {}, 4096);
    packer.scan();

    auto [a, b] = MemoryChannel::create_pair();
    fs::path dest = tmp / "received";
    fs::create_directories(dest);
    SniffingSink sink(Into(dest));
    Side snd, rcv;
    Session(a, b, packer, packer.total_size(), std::string("album.tar"), HandshakeProfile::Direct,
            sink, snd, rcv);

    assert(!snd.error && !rcv.error);
    assert(sink.decision() == SniffingSink::Decision::Extract);
    assert(test::read_file(dest / "album/a.jpg") == test::pattern(9000, 1));
    assert(test::read_file(dest / "album/sub/b.jpg") == test::pattern(100, 2));
  }

  // Rejected SAS: nothing is written and both sides fail with an auth error
  {
    test::TempDir tmp("e2e-reject");
    auto [a, b] = MemoryChannel::create_pair();
    MemorySource src(test::pattern(100));
    SniffingSink sink(Into(tmp.path()));
    Side snd, rcv;
    Session(a, b, src, 100, std::string("nope.bin"), HandshakeProfile::Direct, sink, snd, rcv,
            false);

    assert(AuthReason(rcv.error) == AuthFailure::Rejected);
    assert(AuthReason(snd.error) == AuthFailure::PeerRejected);
    assert(!sink.stats().started);
    assert(!fs::exists(tmp / "nope.bin"));
  }

  // A source that runs dry before the announced total fails on both sides,
  // and the mismatch override refuses to accept it
  {
    test::TempDir tmp("e2e-short");
    auto [a, b] = MemoryChannel::create_pair();
    InitFinTracker tracker(b, "e2e");
    MemorySource src(test::pattern(6000));
    SniffingSink sink(Into(tmp.path()));
    Side snd, rcv;
    Session(a, b, src, 10000, std::nullopt, HandshakeProfile::Direct, sink, snd, rcv);

    assert(IsSizeMismatch(snd.error));
    assert(IsSizeMismatch(rcv.error));
    assert(tracker.init_seen() && tracker.announced() == 10000);
    assert(tracker.fin_seen() && !tracker.fin_ok());
    assert(sink.stats().written == 6000);

    try {
      std::rethrow_exception(rcv.error);
    } catch (const TransferError& e) {
      assert(exit_code_for(e) != 0);
      assert(!MismatchPolicy(true).should_tolerate(e, sink.stats(), tracker, 0));
    }
  }

  // Cancelling from another thread surfaces as CancelledError
  {
    auto [a, b] = MemoryChannel::create_pair();
    TransferConfig cfg = FastConfig();
    TransferEngine receiver(b, "e2e", Role::Receiver, cfg, nullptr);
    MemorySink sink;
    bool cancelled = false;
    std::thread t([&] {
      try {
        receiver.receive(sink, [](const std::string&) { return true; }, nullptr);
      } catch (const CancelledError&) {
        cancelled = true;
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    receiver.cancel();
    t.join();
    assert(cancelled);
    a->close();
  }

  // A stop that lands before the engine is attached still cancels it
  {
    auto [a, b] = MemoryChannel::create_pair();
    CancelSlot slot;
    slot.cancel();
    TransferEngine receiver(b, "e2e", Role::Receiver, FastConfig(), nullptr);
    auto registration = slot.attach(receiver);
    MemorySink sink;
    bool cancelled = false;
    try {
      receiver.receive(sink, [](const std::string&) { return true; }, nullptr);
    } catch (const CancelledError&) {
      cancelled = true;
    }
    assert(cancelled && slot.cancelled());
    a->close();
  }

  // Once the registration is gone the slot no longer points at the engine
  {
    CancelSlot slot;
    {
      auto [a, b] = MemoryChannel::create_pair();
      TransferEngine sender(a, "e2e", Role::Sender, FastConfig(), nullptr);
      auto registration = slot.attach(sender);
      b->close();
    }
    slot.cancel();
    assert(slot.cancelled());
  }

  return 0;
}
