#include <cassert>
#include <string>
#include <vector>

#include "../common/errors.hpp"
#include "../common/protocol_io.hpp"
#include "test_support.hpp"

static bool DecodeThrowsProtocol(const std::vector<u8>& wire) {
  try {
    proto::decode_frame(wire);
  } catch (const ProtocolError&) {
    return true;
  }
  return false;
}

int main() {
  // Header is 8 bytes big-endian
  {
    FrameHeader h{0x0102, 0x0304, 0x05060708};
    u8 buf[8];
    proto::encode_header(h, buf);
    const u8 expect[8] = {1, 2, 3, 4, 5, 6, 7, 8};
    assert(std::memcmp(buf, expect, 8) == 0);
    FrameHeader back = proto::decode_header(buf);
    assert(back.msg_type == 0x0102 && back.flags == 0x0304 && back.payload_len == 0x05060708);
  }

  // INIT: [u8 sid_len][sid][u64 total]
  {
    auto wire = proto::encode_frame(InitFrame{"abc", 0x0102030405060708ull});
    assert(wire.size() == 8 + 1 + 3 + 8);
    assert(wire[0] == 0x00 && wire[1] == 0x01);
    assert(wire[8] == 3 && wire[9] == 'a');
    assert(wire[12] == 0x01 && wire[19] == 0x08);
    auto f = proto::decode_frame(wire);
    assert(f && frame_kind(*f) == FrameKind::Init);
    assert(std::get<InitFrame>(*f).session_id == "abc");
    assert(std::get<InitFrame>(*f).total_bytes == 0x0102030405060708ull);
  }

  // DATA, plain
  {
    DataFrame d;
    d.session_id = "s1";
    d.seq = 7;
    d.chunk = test::pattern(1000);
    auto wire = proto::encode_frame(d);
    assert(proto::decode_header(wire.data()).flags == 0);
    auto f = proto::decode_frame(wire);
    assert(f && std::get<DataFrame>(*f).seq == 7);
    assert(std::get<DataFrame>(*f).chunk == d.chunk);
    assert(!std::get<DataFrame>(*f).compress);

    // Flipped body byte fails the checksum
    auto bad = wire;
    bad.back() ^= 0x01;
    assert(DecodeThrowsProtocol(bad));

    // Body shorter than raw_len
    auto cut = wire;
    cut.pop_back();
    FrameHeader h = proto::decode_header(cut.data());
    h.payload_len -= 1;
    proto::encode_header(h, cut.data());
    assert(DecodeThrowsProtocol(cut));
  }

  // DATA, compressible body goes out as zstd and comes back identical
  {
    DataFrame d;
    d.session_id = "s1";
    d.seq = 1;
    d.chunk.assign(64 * 1024, 'z');
    d.compress = true;
    auto wire = proto::encode_frame(d);
    assert(proto::decode_header(wire.data()).flags & FF_COMPRESSED);
    assert(wire.size() < d.chunk.size());
    auto f = proto::decode_frame(wire);
    assert(f && std::get<DataFrame>(*f).chunk == d.chunk);

    // Random bytes do not shrink, so the flag stays off
    DataFrame r = d;
    r.chunk = test::pattern(4096, 99);
    auto rwire = proto::encode_frame(r);
    assert((proto::decode_header(rwire.data()).flags & FF_COMPRESSED) == 0);
  }

  // FIN and AUTH
  {
    auto f = proto::decode_frame(proto::encode_frame(FinFrame{"x", true}));
    assert(f && std::get<FinFrame>(*f).ok);
    f = proto::decode_frame(proto::encode_frame(FinFrame{"x", false}));
    assert(f && !std::get<FinFrame>(*f).ok);

    AuthFrame a;
    a.kind = FrameKind::AuthReveal;
    a.session_id = "sess";
    a.payload = {9, 8, 7};
    f = proto::decode_frame(proto::encode_frame(a));
    assert(f && frame_kind(*f) == FrameKind::AuthReveal);
    assert(std::get<AuthFrame>(*f).payload == a.payload);
  }

  // Unknown message type is skipped, not fatal
  {
    auto wire = proto::encode_frame(FinFrame{"x", true});
    FrameHeader h = proto::decode_header(wire.data());
    h.msg_type = 0x7777;
    proto::encode_header(h, wire.data());
    assert(!proto::decode_frame(wire));
  }

  // Malformed payloads
  {
    auto wire = proto::encode_frame(InitFrame{"abc", 5});
    wire.resize(wire.size() - 3);
    FrameHeader h = proto::decode_header(wire.data());
    h.payload_len -= 3;
    proto::encode_header(h, wire.data());
    assert(DecodeThrowsProtocol(wire));

    std::vector<u8> tiny = {0, 1, 0};
    assert(DecodeThrowsProtocol(tiny));
  }

  // Session id longer than 255 bytes cannot be encoded
  {
    bool threw = false;
    try {
      proto::encode_frame(InitFrame{std::string(256, 's'), 1});
    } catch (const InvalidInputError&) {
      threw = true;
    }
    assert(threw);
  }

  return 0;
}
