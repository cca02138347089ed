#include <algorithm>
#include <cassert>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "../common/errors.hpp"
#include "../common/memory_channel.hpp"
#include "../common/meta_header.hpp"
#include "../common/pq_transfer.hpp"
#include "../common/replay_channel.hpp"
#include "test_support.hpp"

namespace {

// Swallows the source on send and replays canned bytes on receive
class RecordingBulk : public BulkTransfer {
 public:
  u64 send_file(const std::shared_ptr<Channel>&, const std::string& session_id,
                ByteSource& source, u64 total_bytes, const ProgressFn& on_progress) override {
    session = session_id;
    announced = total_bytes;
    u8 buf[7];
    for (size_t n; (n = source.read(buf, sizeof(buf))) > 0;) {
      seen.insert(seen.end(), buf, buf + n);
      if (on_progress) on_progress(seen.size(), total_bytes);
    }
    return seen.size();
  }

  u64 recv_file(const std::shared_ptr<Channel>&, const std::string&, ByteSink& sink,
                const ProgressFn& on_progress) override {
    SinkInfo si;
    si.total_bytes = canned.size();
    sink.info(si);
    // One byte at a time so the header straddles writes
    for (size_t i = 0; i < canned.size(); ++i) {
      sink.write(&canned[i], 1);
      if (on_progress) on_progress(i + 1, canned.size());
    }
    sink.close();
    return canned.size();
  }

  std::string session;
  u64 announced = 0;
  std::vector<u8> seen;
  std::vector<u8> canned;
};

}  // namespace

int main() {
  test::quiet_logs();

  // Sender side: header goes first and is counted by the mover only
  {
    RecordingBulk bulk;
    PqTransfer pq(bulk);
    auto payload = test::pattern(300);
    MemorySource src(payload);
    u64 shown_done = 0, shown_total = 0;
    u64 n = pq.send(nullptr, "s1", src, payload.size(), std::string("notes.md"),
                    [&](u64 done, u64 total) {
                      shown_done = done;
                      shown_total = total;
                    });
    auto hdr = meta::encode("notes.md");
    assert(n == payload.size());
    assert(bulk.session == "s1");
    assert(bulk.announced == payload.size() + hdr.size());
    assert(bulk.seen.size() == payload.size() + hdr.size());
    assert(std::equal(hdr.begin(), hdr.end(), bulk.seen.begin()));
    assert(std::equal(payload.begin(), payload.end(), bulk.seen.begin() + (long)hdr.size()));
    assert(shown_done == payload.size() && shown_total == payload.size());
  }

  // No name: nothing is prepended
  {
    RecordingBulk bulk;
    PqTransfer pq(bulk);
    auto payload = test::pattern(10);
    MemorySource src(payload);
    assert(pq.send(nullptr, "s1", src, 10, std::nullopt, nullptr) == 10);
    assert(bulk.seen == payload);
  }

  // Receiver side: header split across writes is still removed
  {
    RecordingBulk bulk;
    auto payload = test::text_bytes("the quick brown fox");
    bulk.canned = meta::encode("fox.txt");
    const u64 hdr = bulk.canned.size();
    bulk.canned.insert(bulk.canned.end(), payload.begin(), payload.end());

    PqTransfer pq(bulk);
    MemorySink sink;
    u64 n = pq.receive(nullptr, "s1", sink, nullptr);
    assert(n == payload.size());
    assert(pq.stripped_bytes() == hdr);
    assert(sink.data() == payload);
    assert(sink.name() && *sink.name() == "fox.txt");
    assert(sink.total() && *sink.total() == payload.size());
    assert(sink.closes() == 1);
  }

  // Stripping sink: payload without a header passes untouched
  {
    MemorySink inner;
    MetaStrippingSink s(inner);
    SinkInfo si;
    si.total_bytes = 4;
    s.info(si);
    std::vector<u8> raw = {'P', 'K', 3, 4};
    s.write(raw.data(), 1);
    s.write(raw.data() + 1, 3);
    s.close();
    assert(s.stripped_bytes() == 0);
    assert(inner.data() == raw);
    assert(*inner.total() == 4);
    assert(!inner.name());
  }

  // Stripping sink: stream shorter than a header is flushed on close
  {
    MemorySink inner;
    MetaStrippingSink s(inner);
    std::vector<u8> raw = {'S', 'C'};
    s.write(raw.data(), raw.size());
    assert(inner.written() == 0);
    s.close();
    assert(inner.data() == raw);
  }

  // Full PQ data path over a channel pair with the framed mover
  {
    auto [a, b] = MemoryChannel::create_pair();
    TransferConfig cfg;
    cfg.idle_timeout_ms = 3000;
    cfg.ack_wait_ms = 2000;
    cfg.chunk_size = MIN_CHUNK_SIZE;
    auto view = ReplaySafeChannel::wrap(b, "s1", "stream", ReplayPolicy::stream(1024));

    FramedBulkTransfer send_bulk(cfg), recv_bulk(cfg);
    PqTransfer sender(send_bulk), receiver(recv_bulk);
    auto payload = test::pattern(3 * MIN_CHUNK_SIZE + 11);
    MemorySource src(payload);
    MemorySink sink;

    std::exception_ptr rerr;
    u64 got = 0;
    std::thread t([&] {
      try {
        got = receiver.receive(view, "s1", sink, nullptr);
      } catch (...) {
        rerr = std::current_exception();
      }
    });
    u64 sent = sender.send(a, "s1", src, payload.size(), std::string("pq.bin"), nullptr);
    t.join();

    assert(!rerr);
    assert(sent == payload.size() && got == payload.size());
    assert(receiver.stripped_bytes() == meta::encode("pq.bin").size());
    assert(sink.data() == payload);
    assert(*sink.name() == "pq.bin");
    assert(*sink.total() == payload.size());
    a->close();
  }

  return 0;
}
