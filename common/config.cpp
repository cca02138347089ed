// ============================================================
// config.cpp -- Environment overrides and validation
// ============================================================

#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cstdlib>

namespace {

bool env_u64(const char* name, u64& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    auto parsed = utils::parse_u64(v);
    if (!parsed) {
        throw InvalidInputError(std::string(name) + ": expected a non-negative integer, got '" + v + "'");
    }
    out = *parsed;
    return true;
}

int to_ms(const char* name, u64 v) {
    if (v == 0 || v > 24ull * 3600 * 1000) {
        throw InvalidInputError(std::string(name) + ": out of range");
    }
    return (int)v;
}

} // namespace

void config::apply_env_overrides(TransferConfig& cfg) {
    u64 v = 0;
    if (env_u64("SASCP_CHUNK_KB", v)) {
        cfg.chunk_size = (u32)utils::clamp<u64>(v, 1, MAX_CHUNK_SIZE / 1024) * 1024u;
    }
    if (env_u64("SASCP_HANDSHAKE_TIMEOUT_MS", v)) cfg.handshake_timeout_ms = to_ms("SASCP_HANDSHAKE_TIMEOUT_MS", v);
    if (env_u64("SASCP_CONFIRM_TIMEOUT_MS", v))   cfg.confirm_timeout_ms   = to_ms("SASCP_CONFIRM_TIMEOUT_MS", v);
    if (env_u64("SASCP_IDLE_TIMEOUT_MS", v))      cfg.idle_timeout_ms      = to_ms("SASCP_IDLE_TIMEOUT_MS", v);
}

bool config::debug_requested() {
    const char* v = std::getenv("SASCP_DEBUG");
    return v && *v && std::string(v) != "0";
}

void config::validate(const TransferConfig& cfg) {
    if (cfg.chunk_size < MIN_CHUNK_SIZE || cfg.chunk_size > MAX_CHUNK_SIZE) {
        throw InvalidInputError("chunk size must be between " + std::to_string(MIN_CHUNK_SIZE / 1024) +
                                " and " + std::to_string(MAX_CHUNK_SIZE / 1024) + " KiB");
    }
    if (cfg.handshake_timeout_ms <= 0 || cfg.confirm_timeout_ms <= 0 ||
        cfg.idle_timeout_ms <= 0 || cfg.flush_timeout_ms <= 0) {
        throw InvalidInputError("timeouts must be positive");
    }
    if (cfg.early_frame_limit == 0 || cfg.write_queue_limit == 0) {
        throw InvalidInputError("queue limits must be positive");
    }
}
