#pragma once

// ============================================================
// frame.hpp -- In-memory frame model shared by every channel
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <variant>

enum class FrameKind : u8 {
    Init,
    Data,
    Fin,
    AuthCommit,
    AuthOffer,
    AuthReveal,
    AuthConfirm,
};

struct InitFrame {
    std::string session_id;
    u64         total_bytes = 0;
};

struct DataFrame {
    std::string     session_id;
    u64             seq = 0;
    std::vector<u8> chunk;
    bool            compress = false;  // sender-side hint; never set on decode
};

struct FinFrame {
    std::string session_id;
    bool        ok = false;
};

struct AuthFrame {
    FrameKind       kind = FrameKind::AuthCommit;
    std::string     session_id;
    std::vector<u8> payload;
};

using Frame = std::variant<InitFrame, DataFrame, FinFrame, AuthFrame>;

inline FrameKind frame_kind(const Frame& f) {
    switch (f.index()) {
        case 0:  return FrameKind::Init;
        case 1:  return FrameKind::Data;
        case 2:  return FrameKind::Fin;
        default: return std::get<AuthFrame>(f).kind;
    }
}

inline const std::string& frame_session(const Frame& f) {
    return std::visit([](const auto& v) -> const std::string& { return v.session_id; }, f);
}

inline bool is_stream_kind(FrameKind k) {
    return k == FrameKind::Init || k == FrameKind::Data || k == FrameKind::Fin;
}

inline const char* frame_kind_name(FrameKind k) {
    switch (k) {
        case FrameKind::Init:        return "INIT";
        case FrameKind::Data:        return "DATA";
        case FrameKind::Fin:         return "FIN";
        case FrameKind::AuthCommit:  return "AUTH_COMMIT";
        case FrameKind::AuthOffer:   return "AUTH_OFFER";
        case FrameKind::AuthReveal:  return "AUTH_REVEAL";
        case FrameKind::AuthConfirm: return "AUTH_CONFIRM";
    }
    return "?";
}
