// ============================================================
// pq_transfer.cpp -- Post-quantum mode transfer
// ============================================================

#include "pq_transfer.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "meta_header.hpp"
#include <cstring>

// ---- FramedBulkTransfer ----

u64 FramedBulkTransfer::send_file(const std::shared_ptr<Channel>& channel,
                                  const std::string& session_id,
                                  ByteSource& source, u64 total_bytes,
                                  const ProgressFn& on_progress) {
    StreamSender sender(channel, session_id, cfg_);
    return sender.send(source, total_bytes, std::nullopt, on_progress);
}

u64 FramedBulkTransfer::recv_file(const std::shared_ptr<Channel>& channel,
                                  const std::string& session_id,
                                  ByteSink& sink, const ProgressFn& on_progress) {
    StreamReceiver receiver(channel, session_id, cfg_, false);
    return receiver.receive(sink, on_progress);
}

// ---- PrefixedSource ----

size_t PrefixedSource::read(u8* buf, size_t cap) {
    if (pos_ < prefix_.size()) {
        size_t n = std::min(cap, prefix_.size() - pos_);
        std::memcpy(buf, prefix_.data() + pos_, n);
        pos_ += n;
        return n;
    }
    return inner_.read(buf, cap);
}

std::optional<u64> PrefixedSource::size() const {
    auto inner = inner_.size();
    if (!inner) return std::nullopt;
    return *inner + prefix_.size();
}

// ---- MetaStrippingSink ----

void MetaStrippingSink::info(const SinkInfo& info) {
    if (info.name) {
        SinkInfo n;
        n.name = info.name;
        inner_.info(n);
    }
    if (!info.total_bytes) return;
    if (!decided_) {
        pending_total_ = info.total_bytes;
        return;
    }
    SinkInfo t;
    t.total_bytes = *info.total_bytes >= stripped_ ? *info.total_bytes - stripped_ : 0;
    inner_.info(t);
}

void MetaStrippingSink::decide() {
    decided_ = true;
    if (auto m = meta::parse(head_.data(), head_.size())) {
        stripped_ = m->header_len;
        SinkInfo n;
        n.name = m->name;
        inner_.info(n);
        head_.erase(head_.begin(), head_.begin() + (long)m->header_len);
    }
    if (pending_total_) {
        SinkInfo t;
        t.total_bytes = *pending_total_ >= stripped_ ? *pending_total_ - stripped_ : 0;
        inner_.info(t);
        pending_total_.reset();
    }
    if (!head_.empty()) inner_.write(head_.data(), head_.size());
    head_.clear();
    head_.shrink_to_fit();
}

void MetaStrippingSink::write(const u8* data, size_t len) {
    if (decided_) {
        inner_.write(data, len);
        return;
    }
    head_.insert(head_.end(), data, data + len);
    if (meta::decidable(head_.data(), head_.size())) decide();
}

void MetaStrippingSink::close() {
    if (!decided_) decide();
    inner_.close();
}

// ---- PqTransfer ----

u64 PqTransfer::send(const std::shared_ptr<Channel>& channel, const std::string& session_id,
                     ByteSource& source, u64 total_bytes,
                     const std::optional<std::string>& meta_name,
                     const ProgressFn& progress) {
    std::vector<u8> header;
    if (meta_name) header = meta::encode(*meta_name);
    const u64 hdr = header.size();

    PrefixedSource framed(std::move(header), source);
    ProgressFn adjusted = [&](u64 done, u64) {
        if (progress) progress(done > hdr ? done - hdr : 0, total_bytes);
    };

    // The mover streams the header too, so it must be told about it
    u64 moved = bulk_.send_file(channel, session_id, framed, total_bytes + hdr, adjusted);
    return moved > hdr ? moved - hdr : 0;
}

u64 PqTransfer::receive(const std::shared_ptr<Channel>& channel, const std::string& session_id,
                        ByteSink& sink, const ProgressFn& progress) {
    MetaStrippingSink stripping(sink);
    ProgressFn adjusted = [&](u64 done, u64 total) {
        u64 hdr = stripping.stripped_bytes();
        if (progress) progress(done > hdr ? done - hdr : 0, total > hdr ? total - hdr : 0);
    };

    try {
        u64 moved = bulk_.recv_file(channel, session_id, stripping, adjusted);
        stripped_ = stripping.stripped_bytes();
        u64 payload = moved - std::min(moved, stripped_.load());
        LOG_DEBUG("pq receive: " + std::to_string(payload) + " payload bytes, " +
                  std::to_string(stripped_.load()) + " header bytes stripped");
        return payload;
    } catch (const TransferError&) {
        stripped_ = stripping.stripped_bytes();
        throw;
    }
}
