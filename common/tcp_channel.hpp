#pragma once

// ============================================================
// tcp_channel.hpp -- Channel over one TCP connection
//
// Reader thread: read_wire_frame -> decode -> dispatch.
// Writer thread: bounded queue -> TcpWriteBuffer -> socket.
// Plain TCP has no channel-binding identity, so both fingerprints
// are empty and the Direct handshake runs SAS-only.
// ============================================================

#include "channel.hpp"
#include "protocol.hpp"
#include "socket.hpp"
#include <condition_variable>
#include <deque>
#include <thread>

class TcpChannel : public ChannelBase {
public:
    static constexpr size_t DEFAULT_SEND_QUEUE = 64;

    TcpChannel(TcpSocket sock, std::string label, size_t send_queue_limit = DEFAULT_SEND_QUEUE);
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    // Spawn reader/writer threads; call once handlers that must not
    // miss the first frame are attached
    void start();

    // Blocks while the send queue is full
    void send(const Frame& frame) override;
    bool flush(int timeout_ms) override;
    void close() override;
    bool is_open() const override { return !closed_.load(); }

    std::optional<Fingerprint> local_fingerprint() const override  { return std::nullopt; }
    std::optional<Fingerprint> remote_fingerprint() const override { return std::nullopt; }
    std::string label() const override { return label_; }

    const std::string& peer() const { return peer_; }

private:
    bool read_wire_frame(FrameHeader& hdr, std::vector<u8>& payload);
    void reader_loop();
    void writer_loop();
    void fail(const std::string& reason);

    TcpSocket         sock_;
    std::string       label_;
    std::string       peer_;
    size_t            send_limit_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> started_{false};

    std::mutex                  mutex_;
    std::condition_variable     cv_;
    std::deque<std::vector<u8>> outq_;
    bool                        writing_{false};
    bool                        writer_exit_{false};

    std::thread reader_;
    std::thread writer_;
};
