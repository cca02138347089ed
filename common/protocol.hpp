#pragma once

// protocol.hpp -- Wire protocol definitions for sascp

#include "platform.hpp"
#include <cstring>

static constexpr u8  SASCP_HANDSHAKE_VERSION = 1;

// Largest frame payload accepted off the wire
static constexpr u32 MAX_PAYLOAD_LEN   = 16u * 1024u * 1024u;
static constexpr u32 MAX_SESSION_LEN   = 255u;

// ---- Message Types (all prefixed MT_) ----
enum class MsgType : u16 {
    MT_INIT = 0x0001,
    MT_DATA = 0x0002,
    MT_FIN  = 0x0003,

    // Commit-then-reveal SAS handshake
    MT_AUTH_COMMIT  = 0x0010,
    MT_AUTH_OFFER   = 0x0011,
    MT_AUTH_REVEAL  = 0x0012,
    MT_AUTH_CONFIRM = 0x0013,
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Header flags ----
enum FrameFlags : u16 {
    FF_COMPRESSED = 0x0001,  // DATA body is zstd; DataHdr.raw_len is the inflated size
};

// ============================================================
// Packed structures (wire format, big-endian)
//
// Every payload starts with [u8 session_len][session bytes],
// followed by the per-type body below.
// ============================================================
#pragma pack(push, 1)

// InitBody: 8 bytes
struct InitBody {
    u64 total_bytes;
};
static_assert(sizeof(InitBody) == 8, "InitBody size mismatch");

// DataHdr: 20 bytes + body
struct DataHdr {
    u64 seq;
    u32 raw_len;   // chunk length before compression
    u32 xxh3_32;   // checksum of the raw chunk
    u32 reserved;
};
static_assert(sizeof(DataHdr) == 20, "DataHdr size mismatch");

// FinBody: 4 bytes
struct FinBody {
    u8 ok;
    u8 pad[3];
};
static_assert(sizeof(FinBody) == 4, "FinBody size mismatch");

#pragma pack(pop)
