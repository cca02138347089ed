#pragma once

// ============================================================
// config.hpp -- Transfer tunables
//
// Built by main() from defaults, then SASCP_* environment, then
// CLI flags; passed by value into everything below.
// ============================================================

#include "platform.hpp"
#include <string>

static constexpr u32 DEFAULT_CHUNK_SIZE = 64u * 1024u;
static constexpr u32 MIN_CHUNK_SIZE     = 1024u;
static constexpr u32 MAX_CHUNK_SIZE     = 4u * 1024u * 1024u;

struct TransferConfig {
    u32  chunk_size            = DEFAULT_CHUNK_SIZE;
    bool compress              = true;    // zstd per chunk when it pays off

    int  fingerprint_wait_ms   = 2500;    // poll for local channel fingerprint
    int  handshake_timeout_ms  = 30000;   // commit / offer / reveal
    int  confirm_timeout_ms    = 120000;  // counterpart's SAS confirmation
    int  idle_timeout_ms       = 30000;   // no frame from peer mid-stream
    int  ack_wait_ms           = 5000;    // sender waits for receiver FIN-ack
    int  flush_timeout_ms      = 15000;
    int  peer_close_wait_ms    = 1500;

    size_t early_frame_limit   = 1024;    // stream frames held before a consumer attaches
    size_t write_queue_limit   = 64;      // chunks queued ahead of the sink writer

    bool tolerate_count_mismatch = true;
};

namespace config {

// Apply SASCP_CHUNK_KB, SASCP_HANDSHAKE_TIMEOUT_MS, SASCP_CONFIRM_TIMEOUT_MS,
// SASCP_IDLE_TIMEOUT_MS. Malformed values throw InvalidInputError.
void apply_env_overrides(TransferConfig& cfg);

// SASCP_DEBUG=1 -> true
bool debug_requested();

// Throws InvalidInputError when a value is out of range
void validate(const TransferConfig& cfg);

} // namespace config
