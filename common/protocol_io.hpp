#pragma once

// ============================================================
// protocol_io.hpp -- Byte-order helpers and the frame codec
//
// encode_frame/decode_frame are the only place wire bytes turn
// into Frame values and back; channels call nothing else.
// ============================================================

#include "protocol.hpp"
#include "frame.hpp"
#include <vector>
#include <optional>

#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u32 hton32(u32 v) { return htobe32(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Encode individual struct fields (in-place, host->network) ----

inline void encode_data_hdr(DataHdr& d) {
    d.seq      = hton64(d.seq);
    d.raw_len  = hton32(d.raw_len);
    d.xxh3_32  = hton32(d.xxh3_32);
    d.reserved = hton32(d.reserved);
}

inline void decode_data_hdr(DataHdr& d) {
    d.seq      = ntoh64(d.seq);
    d.raw_len  = ntoh32(d.raw_len);
    d.xxh3_32  = ntoh32(d.xxh3_32);
    d.reserved = ntoh32(d.reserved);
}

// ---- Big-endian scalar append/read for variable-length bodies ----

inline void put_u16(std::vector<u8>& out, u16 v) {
    out.push_back((u8)(v >> 8));
    out.push_back((u8)v);
}

inline u16 get_u16(const u8* p) {
    return (u16)(((u16)p[0] << 8) | p[1]);
}

// ---- Frame codec ----

// Header + payload, ready for the wire. DATA frames with compress=true
// carry a zstd body when that is smaller. Throws InvalidInputError for a
// session id longer than MAX_SESSION_LEN.
std::vector<u8> encode_frame(const Frame& frame);

// Decode one frame. nullopt for an unknown msg_type (ignored by callers);
// ProtocolError for a malformed payload or a checksum mismatch.
std::optional<Frame> decode_frame(const FrameHeader& hdr, const u8* payload, size_t len);

// Convenience: buffer holding header + payload exactly
std::optional<Frame> decode_frame(const std::vector<u8>& wire);

} // namespace proto
