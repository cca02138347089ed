// ============================================================
// stream_transfer.cpp -- INIT / DATA / FIN streaming
// ============================================================

#include "stream_transfer.hpp"
#include "compress.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "meta_header.hpp"
#include "utils.hpp"
#include <algorithm>

// ============================================================
// SerialWriter
// ============================================================

SerialWriter::SerialWriter(ByteSink& sink, size_t queue_limit)
    : sink_(sink)
    , limit_(queue_limit > 0 ? queue_limit : 1)
{
    thread_ = std::thread([this] { run(); });
}

SerialWriter::~SerialWriter() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_ = true;
        tasks_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void SerialWriter::rethrow_locked() {
    if (error_) std::rethrow_exception(error_);
}

void SerialWriter::push(Task t) {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this] { return error_ || stop_ || tasks_.size() < limit_; });
    rethrow_locked();
    tasks_.push_back(std::move(t));
    cv_.notify_all();
}

void SerialWriter::info(SinkInfo info) {
    Task t;
    t.type = Task::Info;
    t.info = std::move(info);
    push(std::move(t));
}

void SerialWriter::write(std::vector<u8> chunk) {
    Task t;
    t.type = Task::Write;
    t.data = std::move(chunk);
    push(std::move(t));
}

void SerialWriter::close_sink() {
    Task t;
    t.type = Task::Close;
    push(std::move(t));
}

void SerialWriter::drain() {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this] { return error_ || (tasks_.empty() && !busy_); });
    rethrow_locked();
}

void SerialWriter::run() {
    for (;;) {
        Task t;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) return;
            t = std::move(tasks_.front());
            tasks_.pop_front();
            busy_ = true;
        }
        cv_.notify_all();

        try {
            switch (t.type) {
                case Task::Info:
                    sink_.info(t.info);
                    break;
                case Task::Write:
                    sink_.write(t.data.data(), t.data.size());
                    written_ += t.data.size();
                    break;
                case Task::Close:
                    sink_.close();
                    break;
            }
        } catch (...) {
            // Handed to the protocol thread on its next push()/drain()
            std::lock_guard<std::mutex> lk(mutex_);
            error_ = std::current_exception();
            tasks_.clear();
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            busy_ = false;
        }
        cv_.notify_all();
    }
}

// ============================================================
// StreamSender
// ============================================================

StreamSender::StreamSender(std::shared_ptr<Channel> channel, std::string session_id,
                           const TransferConfig& cfg)
    : channel_(std::move(channel))
    , session_id_(std::move(session_id))
    , cfg_(cfg)
    , acks_(std::make_shared<Inbox>())
{
    std::shared_ptr<Inbox> acks = acks_;
    std::string sid = session_id_;
    msg_sub_ = channel_->on_message([acks, sid](const Frame& f) {
        const auto* fin = std::get_if<FinFrame>(&f);
        if (fin && (fin->session_id.empty() || fin->session_id == sid)) acks->push(*fin);
    });
    close_sub_ = channel_->on_close([acks] { acks->close(); });
}

StreamSender::~StreamSender() {
    msg_sub_.reset();
    close_sub_.reset();
    acks_->close();
}

void StreamSender::abort_stream() {
    try {
        channel_->send(FinFrame{session_id_, false});
        channel_->flush(cfg_.flush_timeout_ms);
    } catch (const TransferError& e) {
        LOG_DEBUG(std::string("could not deliver FIN{ok=false}: ") + e.what());
    }
}

u64 StreamSender::send(ByteSource& src, u64 total_bytes,
                       const std::optional<std::string>& meta_name,
                       const ProgressFn& progress) {
    if (total_bytes == 0) {
        throw InvalidInputError("nothing to send: total size must be positive");
    }

    channel_->send(InitFrame{session_id_, total_bytes});

    u64 seq = 0;
    if (meta_name) {
        DataFrame hdr;
        hdr.session_id = session_id_;
        hdr.seq        = seq++;
        hdr.chunk      = meta::encode(*meta_name);
        channel_->send(hdr);
    }

    bool use_zstd = cfg_.compress && compress::should_compress(meta_name ? *meta_name : src.name());
    std::vector<u8> buf(cfg_.chunk_size);
    u64 sent = 0;
    bool overlong = false;

    auto read_some = [&](u8* dst, size_t cap) -> size_t {
        try {
            return src.read(dst, cap);
        } catch (const TransferError&) {
            abort_stream();
            throw;
        } catch (const std::exception& e) {
            abort_stream();
            throw IoError("read failed on " + src.name() + ": " + e.what());
        }
    };

    while (sent < total_bytes) {
        size_t want = (size_t)std::min<u64>(buf.size(), total_bytes - sent);
        size_t n = read_some(buf.data(), want);
        if (n == 0) break;

        DataFrame d;
        d.session_id = session_id_;
        d.seq        = seq++;
        d.chunk.assign(buf.begin(), buf.begin() + (long)n);
        d.compress   = use_zstd;
        channel_->send(d);

        sent += n;
        if (progress) progress(sent, total_bytes);
    }

    if (sent == total_bytes) {
        u8 extra;
        overlong = read_some(&extra, 1) > 0;
    }

    bool ok = (sent == total_bytes) && !overlong;
    channel_->send(FinFrame{session_id_, ok});
    if (!channel_->flush(cfg_.flush_timeout_ms)) {
        LOG_WARN("outbound queue not drained within " + std::to_string(cfg_.flush_timeout_ms) + " ms");
    }

    if (!ok) {
        if (overlong) {
            LOG_ERROR(src.name() + " holds more than the announced " +
                      std::to_string(total_bytes) + " bytes");
            throw SizeMismatchError(total_bytes, sent + 1);
        }
        throw SizeMismatchError(total_bytes, sent);
    }

    LOG_DEBUG("sent " + std::to_string(sent) + " bytes in " + std::to_string(seq) + " DATA frames");
    wait_ack();
    return sent;
}

void StreamSender::wait_ack() {
    Frame f;
    switch (acks_->pop(f, cfg_.ack_wait_ms)) {
        case Inbox::PopResult::Ok:
            if (std::get<FinFrame>(f).ok) LOG_DEBUG("receiver acknowledged FIN");
            else                          LOG_WARN("receiver answered FIN with ok=false");
            break;
        case Inbox::PopResult::Timeout:
            LOG_WARN("no FIN ack from receiver within " + std::to_string(cfg_.ack_wait_ms) + " ms");
            break;
        case Inbox::PopResult::Closed:
            LOG_DEBUG("channel closed before FIN ack");
            break;
    }
}

// ============================================================
// StreamReceiver
// ============================================================

StreamReceiver::StreamReceiver(std::shared_ptr<Channel> channel, std::string session_id,
                               const TransferConfig& cfg, bool strip_meta)
    : channel_(std::move(channel))
    , session_id_(std::move(session_id))
    , cfg_(cfg)
    , strip_meta_(strip_meta)
    // Replayed frames are pushed on this thread, so the limit must
    // cover everything the stream view may have held.
    , inbox_(std::make_shared<Inbox>(std::max<size_t>(256, cfg.early_frame_limit)))
    , meta_pending_(strip_meta)
{
    std::shared_ptr<Inbox> inbox = inbox_;
    std::string sid = session_id_;
    msg_sub_ = channel_->on_message([inbox, sid](const Frame& f) {
        if (!is_stream_kind(frame_kind(f))) return;
        const std::string& fsid = frame_session(f);
        if (!fsid.empty() && fsid != sid) return;
        inbox->push(f);
    });
    close_sub_ = channel_->on_close([inbox] { inbox->close(); });
}

StreamReceiver::~StreamReceiver() {
    msg_sub_.reset();
    close_sub_.reset();
    inbox_->close();
}

void StreamReceiver::send_ack() {
    try {
        channel_->send(FinFrame{session_id_, true});
        channel_->flush(cfg_.flush_timeout_ms);
    } catch (const TransferError& e) {
        LOG_WARN(std::string("could not acknowledge FIN: ") + e.what());
    }
}

void StreamReceiver::handle_data(DataFrame& d, SerialWriter& writer, const ProgressFn& progress) {
    if (d.seq != next_seq_) {
        throw ProtocolError("out-of-order DATA: expected seq " + std::to_string(next_seq_) +
                            ", got " + std::to_string(d.seq));
    }
    ++next_seq_;

    std::vector<u8> payload = std::move(d.chunk);
    if (meta_pending_) {
        meta_pending_ = false;
        if (auto m = meta::parse(payload.data(), payload.size())) {
            LOG_DEBUG("meta header: name=\"" + m->name + "\"");
            SinkInfo si;
            si.name = m->name;
            writer.info(std::move(si));
            payload.erase(payload.begin(), payload.begin() + (long)m->header_len);
        }
    }
    if (payload.empty()) return;

    if (enqueued_ + payload.size() > announced_) {
        throw SizeMismatchError(announced_, enqueued_ + payload.size());
    }
    enqueued_ += payload.size();
    writer.write(std::move(payload));
    if (progress) progress(enqueued_, announced_);
}

u64 StreamReceiver::receive(ByteSink& sink, const ProgressFn& progress) {
    SerialWriter writer(sink, cfg_.write_queue_limit);
    std::deque<DataFrame> early;

    for (;;) {
        Frame f;
        switch (inbox_->pop(f, cfg_.idle_timeout_ms)) {
            case Inbox::PopResult::Timeout:
                throw NetworkError("no data from sender for " +
                                   std::to_string(cfg_.idle_timeout_ms) + " ms");

            case Inbox::PopResult::Closed: {
                writer.drain();
                std::string why = channel_->close_reason();
                if (!why.empty()) throw ProtocolError("channel failed: " + why);
                u64 written = writer.written();
                if (init_seen_ && written == announced_) {
                    LOG_WARN("channel closed before FIN, but all " +
                             std::to_string(written) + " bytes arrived");
                    writer.close_sink();
                    writer.drain();
                    return written;
                }
                throw ConnectionClosedEarlyError(announced_, written);
            }

            case Inbox::PopResult::Ok:
                break;
        }

        if (auto* init = std::get_if<InitFrame>(&f)) {
            if (init_seen_) throw ProtocolError("duplicate INIT");
            init_seen_ = true;
            announced_ = init->total_bytes;
            LOG_DEBUG("INIT: " + std::to_string(announced_) + " bytes announced");
            SinkInfo si;
            si.total_bytes = announced_;
            writer.info(std::move(si));
            while (!early.empty()) {
                handle_data(early.front(), writer, progress);
                early.pop_front();
            }
        } else if (auto* data = std::get_if<DataFrame>(&f)) {
            if (!init_seen_) {
                if (early.size() >= cfg_.early_frame_limit) {
                    throw ProtocolError("too many DATA frames before INIT");
                }
                early.push_back(std::move(*data));
                continue;
            }
            handle_data(*data, writer, progress);
        } else if (auto* fin = std::get_if<FinFrame>(&f)) {
            if (!init_seen_) throw ProtocolError("FIN before INIT");
            writer.drain();
            u64 written = writer.written();
            if (written != announced_) throw SizeMismatchError(announced_, written);
            if (!fin->ok) throw SenderFailureError();
            writer.close_sink();
            writer.drain();
            send_ack();
            return written;
        }
    }
}
