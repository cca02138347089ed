#include <cassert>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../common/errors.hpp"
#include "../common/memory_channel.hpp"
#include "../common/protocol_io.hpp"
#include "../common/stream_transfer.hpp"
#include "test_support.hpp"

namespace {

TransferConfig FastConfig() {
  TransferConfig cfg;
  cfg.idle_timeout_ms = 3000;
  cfg.ack_wait_ms = 2000;
  cfg.flush_timeout_ms = 3000;
  return cfg;
}

template <class E>
bool Holds(const std::exception_ptr& e) {
  if (!e) return false;
  try {
    std::rethrow_exception(e);
  } catch (const E&) {
    return true;
  } catch (const std::exception&) {
  }
  return false;
}

struct Result {
  u64 bytes = 0;
  std::exception_ptr error;
};

// Receiver subscribes on `b` first, then the sender streams `payload`
// (or `source`, when given) over `a`.
void Transfer(const std::shared_ptr<MemoryChannel>& a, const std::shared_ptr<MemoryChannel>& b,
              ByteSource& source, u64 total, const std::optional<std::string>& name,
              MemorySink& sink, Result& snd, Result& rcv,
              const TransferConfig& cfg = FastConfig()) {
  StreamReceiver receiver(b, "s1", cfg);
  StreamSender sender(a, "s1", cfg);

  std::thread t([&] {
    try {
      rcv.bytes = receiver.receive(sink, nullptr);
    } catch (...) {
      rcv.error = std::current_exception();
    }
  });
  try {
    snd.bytes = sender.send(source, total, name, nullptr);
  } catch (...) {
    snd.error = std::current_exception();
  }
  t.join();
}

}  // namespace

int main() {
  test::quiet_logs();

  // Chunk boundaries
  for (size_t n : {size_t(1), size_t(65535), size_t(65536), size_t(65537),
                   size_t(10 * DEFAULT_CHUNK_SIZE + 37)}) {
    auto [a, b] = MemoryChannel::create_pair();
    auto payload = test::pattern(n, (u32)n);
    MemorySource src(payload, "blob.bin");
    MemorySink sink;
    Result snd, rcv;
    Transfer(a, b, src, n, std::nullopt, sink, snd, rcv);
    assert(!snd.error && !rcv.error);
    assert(snd.bytes == n && rcv.bytes == n);
    assert(sink.data() == payload);
    assert(sink.total() && *sink.total() == n);
    assert(sink.closes() == 1);
    a->close();
  }

  // Name travels ahead of the data and is not counted
  {
    auto [a, b] = MemoryChannel::create_pair();
    auto payload = test::text_bytes("hello, world\n");
    MemorySource src(payload, "ignored.txt");
    MemorySink sink;
    Result snd, rcv;
    Transfer(a, b, src, payload.size(), std::string("greeting.txt"), sink, snd, rcv);
    assert(!snd.error && !rcv.error);
    assert(sink.name() && *sink.name() == "greeting.txt");
    assert(sink.data() == payload);
    assert(rcv.bytes == payload.size());
    assert(*sink.total() == payload.size());
    a->close();
  }

  // Progress reaches the total
  {
    auto [a, b] = MemoryChannel::create_pair();
    TransferConfig cfg = FastConfig();
    cfg.chunk_size = MIN_CHUNK_SIZE;
    auto payload = test::pattern(5 * MIN_CHUNK_SIZE + 3);
    MemorySource src(payload);
    MemorySink sink;
    StreamReceiver receiver(b, "s1", cfg);
    StreamSender sender(a, "s1", cfg);
    u64 last_done = 0, last_total = 0;
    int calls = 0;
    std::thread t([&] { receiver.receive(sink, nullptr); });
    sender.send(src, payload.size(), std::nullopt, [&](u64 done, u64 total) {
      ++calls;
      last_done = done;
      last_total = total;
    });
    t.join();
    assert(calls == 6);
    assert(last_done == payload.size() && last_total == payload.size());
    a->close();
  }

  // Zero bytes cannot be announced
  {
    auto [a, b] = MemoryChannel::create_pair();
    StreamSender sender(a, "s1", FastConfig());
    MemorySource src({});
    bool threw = false;
    try {
      sender.send(src, 0, std::nullopt, nullptr);
    } catch (const InvalidInputError&) {
      threw = true;
    }
    assert(threw);
    a->close();
  }

  // Source shorter than announced: both ends report a size mismatch
  {
    auto [a, b] = MemoryChannel::create_pair();
    MemorySource src(test::pattern(100));
    MemorySink sink;
    Result snd, rcv;
    Transfer(a, b, src, 200, std::nullopt, sink, snd, rcv);
    assert(Holds<SizeMismatchError>(snd.error));
    assert(Holds<SizeMismatchError>(rcv.error));
    assert(sink.closes() == 0);
    a->close();
  }

  // Source longer than announced: sender flags it, receiver sees FIN{ok=false}
  {
    auto [a, b] = MemoryChannel::create_pair();
    MemorySource src(test::pattern(150));
    MemorySink sink;
    Result snd, rcv;
    Transfer(a, b, src, 100, std::nullopt, sink, snd, rcv);
    assert(Holds<SizeMismatchError>(snd.error));
    assert(Holds<SenderFailureError>(rcv.error));
    a->close();
  }

  // FIN{ok=false} with matching counts is still a failure
  {
    auto [a, b] = MemoryChannel::create_pair();
    StreamReceiver receiver(b, "s1", FastConfig());
    MemorySink sink;
    Result rcv;
    std::thread t([&] {
      try {
        rcv.bytes = receiver.receive(sink, nullptr);
      } catch (...) {
        rcv.error = std::current_exception();
      }
    });
    a->send(InitFrame{"s1", 3});
    DataFrame d;
    d.session_id = "s1";
    d.seq = 0;
    d.chunk = {1, 2, 3};
    a->send(d);
    a->send(FinFrame{"s1", false});
    t.join();
    assert(Holds<SenderFailureError>(rcv.error));
    assert(sink.written() == 3);
    a->close();
  }

  // DATA before INIT is held and applied once INIT arrives
  {
    auto [a, b] = MemoryChannel::create_pair();
    StreamReceiver receiver(b, "s1", FastConfig());
    MemorySink sink;
    Result rcv;
    std::thread t([&] {
      try {
        rcv.bytes = receiver.receive(sink, nullptr);
      } catch (...) {
        rcv.error = std::current_exception();
      }
    });
    DataFrame d;
    d.session_id = "s1";
    d.seq = 0;
    d.chunk = {7, 8};
    a->send(d);
    a->send(InitFrame{"s1", 2});
    a->send(FinFrame{"s1", true});
    t.join();
    assert(!rcv.error && rcv.bytes == 2);
    assert(sink.data() == (std::vector<u8>{7, 8}));
    a->close();
  }

  // A lost DATA frame shows up as a sequence gap
  {
    auto [a, b] = MemoryChannel::create_pair();
    a->set_tamper([](std::vector<u8>& wire) {
      auto f = proto::decode_frame(wire);
      const auto* d = f ? std::get_if<DataFrame>(&*f) : nullptr;
      return !(d && d->seq == 1);
    });
    TransferConfig cfg = FastConfig();
    cfg.chunk_size = MIN_CHUNK_SIZE;
    cfg.ack_wait_ms = 200;
    auto payload = test::pattern(4 * MIN_CHUNK_SIZE);
    MemorySource src(payload);
    MemorySink sink;
    Result snd, rcv;
    Transfer(a, b, src, payload.size(), std::nullopt, sink, snd, rcv, cfg);
    assert(Holds<ProtocolError>(rcv.error));
    a->close();
  }

  // Peer hangs up mid-stream
  {
    auto [a, b] = MemoryChannel::create_pair();
    StreamReceiver receiver(b, "s1", FastConfig());
    MemorySink sink;
    Result rcv;
    std::thread t([&] {
      try {
        rcv.bytes = receiver.receive(sink, nullptr);
      } catch (...) {
        rcv.error = std::current_exception();
      }
    });
    a->send(InitFrame{"s1", 10});
    DataFrame d;
    d.session_id = "s1";
    d.chunk = {1, 2, 3};
    a->send(d);
    a->close();
    t.join();
    assert(Holds<ConnectionClosedEarlyError>(rcv.error));
  }

  // Frames for another session are ignored
  {
    auto [a, b] = MemoryChannel::create_pair();
    StreamReceiver receiver(b, "s1", FastConfig());
    MemorySink sink;
    Result rcv;
    std::thread t([&] {
      try {
        rcv.bytes = receiver.receive(sink, nullptr);
      } catch (...) {
        rcv.error = std::current_exception();
      }
    });
    a->send(InitFrame{"other", 99});
    a->send(InitFrame{"s1", 1});
    DataFrame d;
    d.session_id = "s1";
    d.chunk = {42};
    a->send(d);
    a->send(FinFrame{"s1", true});
    t.join();
    assert(!rcv.error && rcv.bytes == 1);
    assert(*sink.total() == 1);
    a->close();
  }

  return 0;
}
