// ============================================================
// protocol_io.cpp -- Frame <-> wire bytes
// ============================================================

#include "protocol_io.hpp"
#include "compress.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include <string>

namespace {

MsgType msg_type_for(const Frame& f) {
    switch (frame_kind(f)) {
        case FrameKind::Init:        return MsgType::MT_INIT;
        case FrameKind::Data:        return MsgType::MT_DATA;
        case FrameKind::Fin:         return MsgType::MT_FIN;
        case FrameKind::AuthCommit:  return MsgType::MT_AUTH_COMMIT;
        case FrameKind::AuthOffer:   return MsgType::MT_AUTH_OFFER;
        case FrameKind::AuthReveal:  return MsgType::MT_AUTH_REVEAL;
        case FrameKind::AuthConfirm: return MsgType::MT_AUTH_CONFIRM;
    }
    throw ProtocolError("unknown frame kind");
}

void put_session(std::vector<u8>& out, const std::string& sid) {
    if (sid.size() > MAX_SESSION_LEN) {
        throw InvalidInputError("session id longer than " + std::to_string(MAX_SESSION_LEN) + " bytes");
    }
    out.push_back((u8)sid.size());
    out.insert(out.end(), sid.begin(), sid.end());
}

// Reserve 8 bytes for the header; patched in finish()
std::vector<u8> start(size_t body_hint) {
    std::vector<u8> out;
    out.reserve(8 + 1 + MAX_SESSION_LEN + body_hint);
    out.resize(8);
    return out;
}

std::vector<u8> finish(std::vector<u8> out, MsgType type, u16 flags) {
    size_t payload_len = out.size() - 8;
    if (payload_len > MAX_PAYLOAD_LEN) {
        throw InvalidInputError("frame payload too large: " + std::to_string(payload_len));
    }
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = (u32)payload_len;
    proto::encode_header(hdr, out.data());
    return out;
}

struct Reader {
    const u8* p;
    size_t    left;
    const char* what;

    void need(size_t n) const {
        if (left < n) {
            throw ProtocolError(std::string("truncated ") + what + " frame");
        }
    }
    void take(void* dst, size_t n) {
        need(n);
        std::memcpy(dst, p, n);
        p += n; left -= n;
    }
    std::string session() {
        u8 len = 0;
        take(&len, 1);
        need(len);
        std::string s(reinterpret_cast<const char*>(p), len);
        p += len; left -= len;
        return s;
    }
};

} // namespace

std::vector<u8> proto::encode_frame(const Frame& frame) {
    MsgType type = msg_type_for(frame);

    if (auto* init = std::get_if<InitFrame>(&frame)) {
        auto out = start(sizeof(InitBody));
        put_session(out, init->session_id);
        u64 total = hton64(init->total_bytes);
        const u8* tp = reinterpret_cast<const u8*>(&total);
        out.insert(out.end(), tp, tp + sizeof(total));
        return finish(std::move(out), type, 0);
    }

    if (auto* data = std::get_if<DataFrame>(&frame)) {
        if (data->chunk.size() > MAX_PAYLOAD_LEN) {
            throw InvalidInputError("DATA chunk too large: " + std::to_string(data->chunk.size()));
        }
        DataHdr dh{};
        dh.seq     = data->seq;
        dh.raw_len = (u32)data->chunk.size();
        dh.xxh3_32 = hash::xxh3_32(data->chunk.data(), data->chunk.size());

        std::optional<std::vector<u8>> packed;
        if (data->compress) packed = compress::shrink(data->chunk.data(), data->chunk.size());
        const std::vector<u8>& body = packed ? *packed : data->chunk;

        auto out = start(sizeof(DataHdr) + body.size());
        put_session(out, data->session_id);
        encode_data_hdr(dh);
        const u8* hp = reinterpret_cast<const u8*>(&dh);
        out.insert(out.end(), hp, hp + sizeof(dh));
        out.insert(out.end(), body.begin(), body.end());
        return finish(std::move(out), type, packed ? FF_COMPRESSED : 0);
    }

    if (auto* fin = std::get_if<FinFrame>(&frame)) {
        auto out = start(sizeof(FinBody));
        put_session(out, fin->session_id);
        FinBody fb{};
        fb.ok = fin->ok ? 1 : 0;
        const u8* fp = reinterpret_cast<const u8*>(&fb);
        out.insert(out.end(), fp, fp + sizeof(fb));
        return finish(std::move(out), type, 0);
    }

    const auto& auth = std::get<AuthFrame>(frame);
    auto out = start(auth.payload.size());
    put_session(out, auth.session_id);
    out.insert(out.end(), auth.payload.begin(), auth.payload.end());
    return finish(std::move(out), type, 0);
}

std::optional<Frame> proto::decode_frame(const FrameHeader& hdr, const u8* payload, size_t len) {
    if (len != hdr.payload_len) {
        throw ProtocolError("payload length " + std::to_string(len) +
                            " does not match header (" + std::to_string(hdr.payload_len) + ")");
    }

    switch (static_cast<MsgType>(hdr.msg_type)) {
        case MsgType::MT_INIT: {
            Reader r{payload, len, "INIT"};
            InitFrame f;
            f.session_id = r.session();
            u64 total = 0;
            r.take(&total, sizeof(total));
            f.total_bytes = ntoh64(total);
            return Frame(std::move(f));
        }
        case MsgType::MT_DATA: {
            Reader r{payload, len, "DATA"};
            DataFrame f;
            f.session_id = r.session();
            DataHdr dh{};
            r.take(&dh, sizeof(dh));
            decode_data_hdr(dh);
            f.seq = dh.seq;
            if (hdr.flags & FF_COMPRESSED) {
                if (dh.raw_len > MAX_PAYLOAD_LEN) {
                    throw ProtocolError("DATA raw length too large: " + std::to_string(dh.raw_len));
                }
                f.chunk = compress::inflate(r.p, r.left, dh.raw_len);
            } else {
                if (r.left != dh.raw_len) {
                    throw ProtocolError("DATA length mismatch at seq " + std::to_string(dh.seq));
                }
                f.chunk.assign(r.p, r.p + r.left);
            }
            if (!hash::chunk_matches(f.chunk.data(), f.chunk.size(), dh.xxh3_32)) {
                throw ProtocolError("DATA checksum mismatch at seq " + std::to_string(dh.seq));
            }
            return Frame(std::move(f));
        }
        case MsgType::MT_FIN: {
            Reader r{payload, len, "FIN"};
            FinFrame f;
            f.session_id = r.session();
            FinBody fb{};
            r.take(&fb, sizeof(fb));
            f.ok = fb.ok != 0;
            return Frame(std::move(f));
        }
        case MsgType::MT_AUTH_COMMIT:
        case MsgType::MT_AUTH_OFFER:
        case MsgType::MT_AUTH_REVEAL:
        case MsgType::MT_AUTH_CONFIRM: {
            Reader r{payload, len, "AUTH"};
            AuthFrame f;
            switch (static_cast<MsgType>(hdr.msg_type)) {
                case MsgType::MT_AUTH_COMMIT: f.kind = FrameKind::AuthCommit; break;
                case MsgType::MT_AUTH_OFFER:  f.kind = FrameKind::AuthOffer;  break;
                case MsgType::MT_AUTH_REVEAL: f.kind = FrameKind::AuthReveal; break;
                default:                      f.kind = FrameKind::AuthConfirm; break;
            }
            f.session_id = r.session();
            f.payload.assign(r.p, r.p + r.left);
            return Frame(std::move(f));
        }
    }
    return std::nullopt;
}

std::optional<Frame> proto::decode_frame(const std::vector<u8>& wire) {
    if (wire.size() < 8) throw ProtocolError("frame shorter than header");
    FrameHeader hdr = decode_header(wire.data());
    if (hdr.payload_len > MAX_PAYLOAD_LEN) {
        throw ProtocolError("payload too large: " + std::to_string(hdr.payload_len));
    }
    return decode_frame(hdr, wire.data() + 8, wire.size() - 8);
}
