// ============================================================
// tcp_channel.cpp -- Threaded TCP transport
// ============================================================

#include "tcp_channel.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "protocol_io.hpp"
#include "write_buffer.hpp"

TcpChannel::TcpChannel(TcpSocket sock, std::string label, size_t send_queue_limit)
    : sock_(std::move(sock))
    , label_(std::move(label))
    , send_limit_(send_queue_limit > 0 ? send_queue_limit : DEFAULT_SEND_QUEUE)
{
    peer_ = sock_.remote_endpoint();
}

TcpChannel::~TcpChannel() {
    close();
    for (std::thread* t : { &reader_, &writer_ }) {
        if (!t->joinable()) continue;
        if (t->get_id() == std::this_thread::get_id()) t->detach();
        else t->join();
    }
    sock_.close();
}

void TcpChannel::start() {
    if (started_.exchange(true)) return;
    writer_ = std::thread([this] { writer_loop(); });
    reader_ = std::thread([this] { reader_loop(); });
}

void TcpChannel::send(const Frame& frame) {
    if (closed_.load()) throw NetworkError(label_ + ": send on closed channel");
    std::vector<u8> wire = proto::encode_frame(frame);

    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this] { return writer_exit_ || outq_.size() < send_limit_; });
    if (writer_exit_) throw NetworkError(label_ + ": send on closed channel");
    outq_.push_back(std::move(wire));
    cv_.notify_all();
}

bool TcpChannel::flush(int timeout_ms) {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                 [this] { return writer_exit_ || (outq_.empty() && !writing_); });
    return outq_.empty() && !writing_;
}

void TcpChannel::close() {
    if (closed_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        writer_exit_ = true;
    }
    cv_.notify_all();
    sock_.shutdown_both();
    if (!started_.load()) dispatch_close();
}

void TcpChannel::fail(const std::string& reason) {
    set_close_reason(reason);
    closed_.store(true);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        writer_exit_ = true;
    }
    cv_.notify_all();
    sock_.shutdown_both();
}

void TcpChannel::writer_loop() {
    TcpWriteBuffer wbuf(sock_);
    std::deque<std::vector<u8>> batch;
    try {
        for (;;) {
            {
                std::unique_lock<std::mutex> lk(mutex_);
                writing_ = false;
                cv_.notify_all();
                cv_.wait(lk, [this] { return writer_exit_ || !outq_.empty(); });
                if (outq_.empty()) break;
                batch.swap(outq_);
                writing_ = true;
            }
            cv_.notify_all();  // wake senders blocked on a full queue
            for (auto& wire : batch) wbuf.append(wire);
            batch.clear();
            wbuf.flush();
        }
    } catch (const NetworkError& e) {
        if (!closed_.load()) {
            LOG_ERROR(label_ + ": write failed: " + e.what());
            fail(e.what());
        } else {
            LOG_DEBUG(label_ + ": write after close: " + e.what());
        }
    }
    std::lock_guard<std::mutex> lk(mutex_);
    writing_ = false;
    writer_exit_ = true;
    cv_.notify_all();
}

// One length-prefixed frame; false on EOF at a frame boundary
bool TcpChannel::read_wire_frame(FrameHeader& hdr, std::vector<u8>& payload) {
    u8 head[sizeof(FrameHeader)];
    if (!sock_.read_exact(head, sizeof(head))) return false;
    hdr = proto::decode_header(head);
    if (hdr.payload_len > MAX_PAYLOAD_LEN) {
        throw ProtocolError("frame payload of " + std::to_string(hdr.payload_len) + " bytes");
    }
    payload.resize(hdr.payload_len);
    if (hdr.payload_len > 0 && !sock_.read_exact(payload.data(), payload.size())) {
        throw NetworkError("connection closed mid-frame");
    }
    return true;
}

void TcpChannel::reader_loop() {
    std::string reason;
    FrameHeader hdr{};
    std::vector<u8> payload;
    try {
        while (read_wire_frame(hdr, payload)) {
            auto frame = proto::decode_frame(hdr, payload.data(), payload.size());
            if (!frame) {
                LOG_DEBUG(label_ + ": ignoring frame type " + std::to_string(hdr.msg_type));
                continue;
            }
            dispatch_message(*frame);
        }
        LOG_DEBUG(label_ + ": peer " + peer_ + " closed the connection");
    } catch (const ProtocolError& e) {
        reason = e.what();
        LOG_ERROR(label_ + ": dropping connection: " + reason);
    } catch (const NetworkError& e) {
        if (!closed_.load()) {
            reason = e.what();
            LOG_WARN(label_ + ": " + reason);
        }
    } catch (const std::exception& e) {
        reason = std::string("frame handler failed: ") + e.what();
        LOG_ERROR(label_ + ": " + reason);
    }
    if (!reason.empty()) fail(reason);
    closed_.store(true);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        writer_exit_ = true;
    }
    cv_.notify_all();
    dispatch_close(reason);
}
